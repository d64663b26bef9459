#pragma once

#include <memory>
#include <string>
#include <variant>

#include <sqlite3.h>

// wait this long for a lock held by another process before failing a statement
#define DB_BUSY_TIMEOUT_MS 5000

// opens (and creates, with parent directories) a database file, ":memory:" is allowed
std::variant<std::shared_ptr<sqlite3>, std::string> db_open(const std::string &path);

// runs a statement without results, throws std::runtime_error on failure
void db_exec(sqlite3 *db, const std::string &query, const std::string &what);
