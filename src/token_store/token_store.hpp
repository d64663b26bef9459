#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <variant>

#include <sqlite3.h>

#include "../errors/upload_error.hpp"

#define TOKENS_TABLE_NAME "tokens"

struct cached_token_t {
    std::string host_id;
    // token string or serialized cookie + session id bundle
    std::string value;
    // unix time, seconds
    std::int64_t issued_at = 0;
    // seconds, 0 means never expires
    std::int64_t ttl = 0;
    std::map<std::string, std::string> extra;
};

typedef std::variant<cached_token_t, upload_error_t> token_result_t;

// returns current unix time in seconds
typedef std::function<std::int64_t()> token_clock_t;

std::int64_t system_clock_seconds();

bool token_is_fresh(const cached_token_t &token, std::int64_t now, std::int64_t safety_margin_seconds);

// Persisted per-host authentication cache. Writes go to sqlite under one
// writer lock and then swap the in-memory shadow entry, readers only touch
// the shadow. A token is never edited in place, readers holding an old
// shared_ptr keep a consistent value.
class TokenStore {
  public:
    TokenStore(std::shared_ptr<sqlite3> db_, token_clock_t clock_ = system_clock_seconds);

    // nullptr if there is no token for the host
    std::shared_ptr<const cached_token_t> get(const std::string &host_id) const;

    // atomic replace of the host row
    void put(const cached_token_t &token);

    // true if the token exists and ttl is 0 or now < issued_at + ttl - margin
    bool is_fresh(const std::string &host_id, std::int64_t safety_margin_seconds) const;

    void invalidate(const std::string &host_id);

    // invalidates only if the stored value is still stale_value, so a token
    // refreshed by a concurrent task is not thrown away
    void invalidate_if_matches(const std::string &host_id, const std::string &stale_value);

    // Returns the fresh token, or runs login once for all concurrent callers
    // that find the token stale. Successful login results are stored.
    token_result_t get_or_refresh(const std::string &host_id, std::int64_t safety_margin_seconds, const std::function<token_result_t()> &login);

    std::int64_t now() const;

  private:
    std::shared_ptr<sqlite3> db;
    token_clock_t clock;

    mutable std::shared_mutex shadow_mutex;
    std::unordered_map<std::string, std::shared_ptr<const cached_token_t>> shadow;

    std::mutex write_mutex;

    std::mutex flight_mutex;
    std::unordered_map<std::string, std::shared_future<token_result_t>> in_flight;
};
