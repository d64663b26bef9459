#include <chrono>
#include <cstdio>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../db/sqlite.hpp"

#include "./token_store.hpp"

std::int64_t system_clock_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

bool token_is_fresh(const cached_token_t &token, std::int64_t now, std::int64_t safety_margin_seconds) {
    if (token.ttl == 0) {
        return true;
    }
    return now < token.issued_at + token.ttl - safety_margin_seconds;
}

static std::string column_string(sqlite3_stmt *stmt, int column) {
    const auto ptr = sqlite3_column_text(stmt, column);
    if (ptr == nullptr) {
        return "";
    }
    return std::string(reinterpret_cast<const char *>(ptr));
}

static std::map<std::string, std::string> parse_extra(const std::string &extra) {
    std::map<std::string, std::string> ret;
    if (extra.empty()) {
        return ret;
    }
    try {
        const auto data = nlohmann::json::parse(extra);
        for (const auto &item : data.items()) {
            if (item.value().is_string()) {
                ret[item.key()] = item.value().get<std::string>();
            }
        }
    } catch (const nlohmann::json::parse_error &e) {
        fprintf(stderr, "[tokens] Ignoring malformed extra data: %s\n", e.what());
    }
    return ret;
}

static std::unordered_map<std::string, std::shared_ptr<const cached_token_t>> load_tokens(std::shared_ptr<sqlite3> db) {
    const auto select_query = std::string("SELECT host_id, value, issued_at, ttl, extra FROM ") + TOKENS_TABLE_NAME + ";";
    sqlite3_stmt *stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db.get(), select_query.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare select statement: " + std::string(sqlite3_errmsg(db.get())));
    }
    std::unordered_map<std::string, std::shared_ptr<const cached_token_t>> ret;
    while (true) {
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            const auto error = std::string(sqlite3_errmsg(db.get()));
            sqlite3_finalize(stmt);
            throw std::runtime_error("Failed to step: " + error);
        }
        auto token = std::make_shared<cached_token_t>();
        token->host_id = column_string(stmt, 0);
        token->value = column_string(stmt, 1);
        token->issued_at = sqlite3_column_int64(stmt, 2);
        token->ttl = sqlite3_column_int64(stmt, 3);
        token->extra = parse_extra(column_string(stmt, 4));
        ret[token->host_id] = token;
    }
    sqlite3_finalize(stmt);
    return ret;
}

TokenStore::TokenStore(std::shared_ptr<sqlite3> db_, token_clock_t clock_) : db {db_}, clock {clock_} {
    const auto create_table_query = std::string("CREATE TABLE IF NOT EXISTS ") + TOKENS_TABLE_NAME + " (host_id TEXT PRIMARY KEY, value TEXT NOT NULL, issued_at INTEGER NOT NULL, ttl INTEGER NOT NULL, extra TEXT);";
    db_exec(db.get(), create_table_query, "create table");
    shadow = load_tokens(db);
}

std::int64_t TokenStore::now() const {
    return clock();
}

std::shared_ptr<const cached_token_t> TokenStore::get(const std::string &host_id) const {
    std::shared_lock<std::shared_mutex> lock { shadow_mutex };
    const auto it = shadow.find(host_id);
    if (it == shadow.end()) {
        return nullptr;
    }
    return it->second;
}

void TokenStore::put(const cached_token_t &token) {
    std::lock_guard<std::mutex> write_lock { write_mutex };

    const auto insert_query = std::string("INSERT OR REPLACE INTO ") + TOKENS_TABLE_NAME + " (host_id, value, issued_at, ttl, extra) VALUES (?, ?, ?, ?, ?);";
    sqlite3_stmt *stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db.get(), insert_query.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare insert statement: " + std::string(sqlite3_errmsg(db.get())));
    }
    const auto extra = nlohmann::json(token.extra).dump();
    sqlite3_bind_text(stmt, 1, token.host_id.c_str(), token.host_id.size(), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, token.value.c_str(), token.value.size(), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, token.issued_at);
    sqlite3_bind_int64(stmt, 4, token.ttl);
    sqlite3_bind_text(stmt, 5, extra.c_str(), extra.size(), SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        const auto error = std::string(sqlite3_errmsg(db.get()));
        sqlite3_finalize(stmt);
        throw std::runtime_error("Failed to step: " + error);
    }
    sqlite3_finalize(stmt);

    auto replacement = std::make_shared<const cached_token_t>(token);
    std::unique_lock<std::shared_mutex> lock { shadow_mutex };
    shadow[token.host_id] = replacement;
}

bool TokenStore::is_fresh(const std::string &host_id, std::int64_t safety_margin_seconds) const {
    const auto token = get(host_id);
    if (!token) {
        return false;
    }
    return token_is_fresh(*token, now(), safety_margin_seconds);
}

static void delete_token(sqlite3 *db, const std::string &host_id) {
    const auto delete_query = std::string("DELETE FROM ") + TOKENS_TABLE_NAME + " WHERE host_id=?;";
    sqlite3_stmt *stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, delete_query.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare delete statement: " + std::string(sqlite3_errmsg(db)));
    }
    sqlite3_bind_text(stmt, 1, host_id.c_str(), host_id.size(), SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        const auto error = std::string(sqlite3_errmsg(db));
        sqlite3_finalize(stmt);
        throw std::runtime_error("Failed to step: " + error);
    }
    sqlite3_finalize(stmt);
}

void TokenStore::invalidate(const std::string &host_id) {
    std::lock_guard<std::mutex> write_lock { write_mutex };
    delete_token(db.get(), host_id);
    std::unique_lock<std::shared_mutex> lock { shadow_mutex };
    shadow.erase(host_id);
}

void TokenStore::invalidate_if_matches(const std::string &host_id, const std::string &stale_value) {
    std::lock_guard<std::mutex> write_lock { write_mutex };
    {
        std::shared_lock<std::shared_mutex> lock { shadow_mutex };
        const auto it = shadow.find(host_id);
        if (it == shadow.end() || it->second->value != stale_value) {
            return;
        }
    }
    delete_token(db.get(), host_id);
    std::unique_lock<std::shared_mutex> lock { shadow_mutex };
    shadow.erase(host_id);
}

token_result_t TokenStore::get_or_refresh(const std::string &host_id, std::int64_t safety_margin_seconds, const std::function<token_result_t()> &login) {
    std::promise<token_result_t> promise;
    {
        std::unique_lock<std::mutex> lock { flight_mutex };
        const auto token = get(host_id);
        if (token && token_is_fresh(*token, now(), safety_margin_seconds)) {
            return *token;
        }
        const auto it = in_flight.find(host_id);
        if (it != in_flight.end()) {
            // somebody is already logging in, wait for the same result
            auto pending = it->second;
            lock.unlock();
            return pending.get();
        }
        in_flight[host_id] = promise.get_future().share();
    }

    try {
        const auto result = login();
        if (std::holds_alternative<cached_token_t>(result)) {
            put(std::get<cached_token_t>(result));
        }
        {
            std::lock_guard<std::mutex> lock { flight_mutex };
            in_flight.erase(host_id);
        }
        promise.set_value(result);
        return result;
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock { flight_mutex };
            in_flight.erase(host_id);
        }
        promise.set_exception(std::current_exception());
        throw;
    }
}
