#include "api.hpp"

#include "storage.hpp"

#include <ctime>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using nlohmann::json;

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::int64_t now_epoch()
{
    return std::time(nullptr);
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static void json_response(httplib::Response& res, const json& j, int status = 200)
{
    res.status = status;
    res.set_content(j.dump(), "application/json");
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static void error_response(httplib::Response& res, int status, const std::string& kind,
                           const std::string& message) // NOLINT(bugprone-easily-swappable-parameters)
{
    json_response(res, { { "error", kind }, { "message", message } }, status);
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static void not_found(httplib::Response& res)
{
    error_response(res, 404, "NotFound", "User not found");
}

// Id from the first capture group of a /users/(\d+) route; nullopt if it overflows.
// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::optional<std::int64_t> path_id(const httplib::Request& req)
{
    if (req.matches.size() < 2)
        return std::nullopt;
    try
    {
        return std::stoll(req.matches[1].str());
    }
    catch (const std::out_of_range&)
    {
        return std::nullopt;
    }
}

// Missing or null counts as empty so it fails the same presence check.
// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::string string_field(const json& body, const char* key)
{
    auto it = body.find(key);
    if (it == body.end() || it->is_null())
        return {};
    if (!it->is_string())
        throw ValidationError(std::string("'") + key + "' must be a string.");
    return it->get<std::string>();
}

// Request line for the access log
// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static void record_log(IUserStore& store, const httplib::Request& req, const httplib::Response& res, bool echo)
{
    ApiLogRecord r;
    r.ts        = now_epoch();
    r.method    = req.method;
    r.path      = req.path;
    r.status    = res.status;
    r.client_ip = req.remote_addr.empty() ? std::string("unknown") : req.remote_addr;
    store.append_log(r);

    if (echo)
        std::cout << "[userdesk] " << r.client_ip << " \"" << r.method << ' ' << r.path << "\" " << r.status
                  << '\n';
}

// `limit` query value for GET /logs; nullopt unless it is a run of digits.
// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::optional<std::size_t> parse_limit(const std::string& v)
{
    if (v.empty() || v.size() > 9 || v.find_first_not_of("0123456789") != std::string::npos)
        return std::nullopt;
    return static_cast<std::size_t>(std::stoul(v));
}

nlohmann::json user_to_json(const User& u)
{
    return { { "id", u.id }, { "name", u.name }, { "email", u.email }, { "created_at", u.created_at } };
}

void configure_routes(httplib::Server& svr, IUserStore& store, const ServiceConfig& cfg)
{
    // Service info
    svr.Get("/",
            [version = cfg.version](const httplib::Request&, httplib::Response& res)
            {
                json_response(res, { { "service", "userdesk" },
                                     { "version", version },
                                     { "docs", { { "health", "/health" }, { "users", "/users" } } } });
            });

    // Health
    svr.Get("/health",
            [](const httplib::Request&, httplib::Response& res)
            { json_response(res, { { "status", "ok" }, { "time_utc", utc_now_iso() } }); });

    // List
    svr.Get("/users",
            [&store](const httplib::Request&, httplib::Response& res)
            {
                json arr = json::array();
                for (const auto& u : store.list())
                    arr.push_back(user_to_json(u));
                json_response(res, arr);
            });

    // Create
    svr.Post("/users",
             [&store](const httplib::Request& req, httplib::Response& res)
             {
                 json body;
                 try
                 {
                     body = json::parse(req.body);
                 }
                 catch (const json::exception&)
                 {
                     error_response(res, 400, "BadRequest", "Malformed JSON body.");
                     return;
                 }
                 if (!body.is_object())
                 {
                     error_response(res, 400, "BadRequest", "Expected a JSON object.");
                     return;
                 }

                 try
                 {
                     const auto user = store.create(string_field(body, "name"), string_field(body, "email"));
                     json_response(res, user_to_json(user), 201);
                 }
                 catch (const ValidationError& e)
                 {
                     error_response(res, 400, "ValidationError", e.what());
                 }
             });

    // Get one
    svr.Get(R"(/users/(\d+))",
            [&store](const httplib::Request& req, httplib::Response& res)
            {
                const auto id = path_id(req);
                if (!id)
                {
                    not_found(res);
                    return;
                }
                const auto user = store.get(*id);
                if (!user)
                {
                    not_found(res);
                    return;
                }
                json_response(res, user_to_json(*user));
            });

    // Delete
    svr.Delete(R"(/users/(\d+))",
               [&store](const httplib::Request& req, httplib::Response& res)
               {
                   const auto id = path_id(req);
                   if (!id || !store.remove(*id))
                   {
                       not_found(res);
                       return;
                   }
                   json_response(res, { { "deleted", *id } });
               });

    // Access log
    svr.Get("/logs",
            [&store](const httplib::Request& req, httplib::Response& res)
            {
                std::size_t limit = 100;
                if (req.has_param("limit"))
                {
                    const auto parsed = parse_limit(req.get_param_value("limit"));
                    if (!parsed)
                    {
                        error_response(res, 400, "BadRequest", "'limit' must be a non-negative integer.");
                        return;
                    }
                    limit = *parsed;
                }
                json arr = json::array();
                for (const auto& l : store.get_logs(limit))
                    arr.push_back({ { "ts", l.ts },
                                    { "method", l.method },
                                    { "path", l.path },
                                    { "status", l.status },
                                    { "client_ip", l.client_ip } });
                json_response(res, arr);
            });

    svr.Delete("/logs",
               [&store](const httplib::Request&, httplib::Response& res)
               {
                   store.clear_logs();
                   json_response(res, { { "status", "ok" } });
               });

    // Unmatched routes and transport-level errors get a JSON body too
    svr.set_error_handler(
        [](const httplib::Request&, httplib::Response& res)
        {
            if (!res.body.empty())
                return httplib::Server::HandlerResponse::Unhandled;
            if (res.status == 404)
                error_response(res, 404, "NotFound", "Route not found");
            else
                error_response(res, res.status, "BadRequest", "Request could not be processed");
            return httplib::Server::HandlerResponse::Handled;
        });

    svr.set_exception_handler(
        [](const httplib::Request&, httplib::Response& res, const std::exception_ptr& ep)
        {
            std::string what = "unknown exception";
            try
            {
                std::rethrow_exception(ep);
            }
            catch (const std::exception& e)
            {
                what = e.what();
            }
            catch (...) // NOLINT(bugprone-empty-catch)
            {
                // non-std exception: keep the generic message
            }
            std::cerr << "[userdesk] unhandled exception: " << what << '\n';
            error_response(res, 500, "InternalError", "Internal server error");
        });

    svr.set_logger([&store, echo = cfg.access_log](const httplib::Request& req, const httplib::Response& res)
                   { record_log(store, req, res, echo); });
}
