#pragma once
#include <string>

struct ServiceConfig
{
    std::string host       = "0.0.0.0";
    int         port       = 5000;
    std::string version    = "dev";
    bool        access_log = true;
};

// Parses a TCP port in 1..65535. Throws std::invalid_argument otherwise.
int parse_port(const std::string& value);

// Reads HOST, PORT, APP_VERSION and ACCESS_LOG, falling back to the defaults above.
// Implemented in src/config.cpp
ServiceConfig load_config_from_env();
