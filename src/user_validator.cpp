#include "storage.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::string trim(const std::string& s)
{
    const char* ws    = " \t\r\n\f\v";
    const auto  first = s.find_first_not_of(ws);
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

// Implement the constructor declared in include/storage.hpp.
UserDraft::UserDraft(const std::string& name_, const std::string& email_)
    : name(trim(name_)), email(trim(email_))
{
    if (name.empty() || email.empty())
        throw ValidationError("Provide valid 'name' and 'email'.");
}

std::string utc_now_iso()
{
    using clock      = std::chrono::system_clock;
    const auto now   = clock::now();
    const auto secs  = std::chrono::time_point_cast<std::chrono::seconds>(now);
    const auto micro = std::chrono::duration_cast<std::chrono::microseconds>(now - secs).count();

    const std::time_t t = clock::to_time_t(secs);
    std::tm           tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micro
        << "+00:00";
    return oss.str();
}
