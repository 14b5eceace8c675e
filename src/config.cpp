#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

int parse_port(const std::string& value)
{
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; }))
        throw std::invalid_argument("PORT must be a number, got '" + value + "'");

    // more than five digits cannot be a port; also keeps stol in range
    if (value.size() > 5)
        throw std::invalid_argument("PORT out of range: " + value);

    const long port = std::stol(value);
    if (port < 1 || port > 65535)
        throw std::invalid_argument("PORT out of range: " + value);
    return static_cast<int>(port);
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static bool is_falsy(std::string v)
{
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    return v == "0" || v == "false" || v == "off" || v == "no";
}

ServiceConfig load_config_from_env()
{
    ServiceConfig cfg;

    if (const char* host = std::getenv("HOST"); host != nullptr && *host != '\0')
        cfg.host = host;
    if (const char* port = std::getenv("PORT"); port != nullptr)
        cfg.port = parse_port(port);
    if (const char* version = std::getenv("APP_VERSION"); version != nullptr && *version != '\0')
        cfg.version = version;
    if (const char* access = std::getenv("ACCESS_LOG"); access != nullptr)
        cfg.access_log = !is_falsy(access);

    return cfg;
}
