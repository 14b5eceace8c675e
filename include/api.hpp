#pragma once
#include "config.hpp"
#include "storage.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

// Adds all endpoints to `svr` using the given store. `store` must outlive `svr`.
void configure_routes(httplib::Server& svr, IUserStore& store, const ServiceConfig& cfg = {});

// JSON shape of a user as returned by the API.
nlohmann::json user_to_json(const User& u);
