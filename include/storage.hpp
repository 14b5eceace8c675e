#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Raised when a create request lacks a required field.
struct ValidationError : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct User
{
    std::int64_t id = 0;
    std::string  name;
    std::string  email;
    std::string  created_at; // UTC, ISO-8601
};

// Checked input for a new user. Implemented in src/user_validator.cpp
struct UserDraft
{
    std::string name;
    std::string email;
    // Trims both fields and throws ValidationError if either ends up empty.
    UserDraft(const std::string& name_, const std::string& email_); // NOLINT(bugprone-easily-swappable-parameters)
};

// Current UTC time as "YYYY-MM-DDTHH:MM:SS.ffffff+00:00". Implemented in src/user_validator.cpp
std::string utc_now_iso();

struct ApiLogRecord
{
    std::int64_t ts = 0; // epoch seconds
    std::string  method;
    std::string  path;
    int          status = 0;
    std::string  client_ip;
};

struct IUserStore
{
    virtual ~IUserStore() = default;

    virtual User                create(const std::string& name, const std::string& email) = 0;
    virtual std::optional<User> get(std::int64_t id) const                                = 0;
    virtual std::vector<User>   list() const                                              = 0;
    virtual bool                remove(std::int64_t id)                                   = 0;

    // Access log, served by GET/DELETE /logs
    virtual void                      append_log(const ApiLogRecord& rec)     = 0;
    virtual std::vector<ApiLogRecord> get_logs(std::size_t limit = 100) const = 0;
    virtual void                      clear_logs()                            = 0;
};

class InMemoryUserStore : public IUserStore
{
  public:
    static constexpr std::size_t kMaxLogRecords = 1000;

    User create(const std::string& name, const std::string& email) override
    {
        // validate before taking an id so a rejected create never consumes one
        UserDraft const draft(name, email);

        std::scoped_lock lk(mu_);
        User             u;
        u.id         = next_id_++;
        u.name       = draft.name;
        u.email      = draft.email;
        u.created_at = utc_now_iso();
        users_.emplace(u.id, u);
        return u;
    }

    std::optional<User> get(std::int64_t id) const override
    {
        std::scoped_lock lk(mu_);
        auto             it = users_.find(id);
        if (it == users_.end())
            return std::nullopt;
        return it->second;
    }

    // ids only grow, so key order is insertion order
    std::vector<User> list() const override
    {
        std::scoped_lock  lk(mu_);
        std::vector<User> out;
        out.reserve(users_.size());
        for (const auto& [_, u] : users_)
            out.push_back(u);
        return out;
    }

    bool remove(std::int64_t id) override
    {
        std::scoped_lock lk(mu_);
        return users_.erase(id) > 0;
    }

    void append_log(const ApiLogRecord& rec) override
    {
        std::scoped_lock lk(mu_);
        logs_.push_back(rec);
        if (logs_.size() > kMaxLogRecords)
            logs_.pop_front();
    }

    std::vector<ApiLogRecord> get_logs(std::size_t limit = 100) const override
    {
        std::scoped_lock lk(mu_);
        if (logs_.empty())
            return {};
        auto start = logs_.size() > limit ? logs_.size() - limit : 0;
        return std::vector<ApiLogRecord>(logs_.begin() + static_cast<std::ptrdiff_t>(start), logs_.end());
    }

    void clear_logs() override
    {
        std::scoped_lock lk(mu_);
        logs_.clear();
    }

  private:
    mutable std::mutex           mu_;
    std::int64_t                 next_id_ = 1;
    std::map<std::int64_t, User> users_;
    std::deque<ApiLogRecord>     logs_;
};
