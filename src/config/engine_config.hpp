#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#define CONFIG_PARALLELISM_DEFAULT 4
#define CONFIG_GLOBAL_CONNECTIONS_DEFAULT 3
#define CONFIG_MAX_RETRIES_DEFAULT 3
#define CONFIG_SAFETY_MARGIN_DEFAULT 60
#define CONFIG_BACKOFF_INITIAL_DEFAULT 2
#define CONFIG_BACKOFF_MAX_DEFAULT 60
#define CONFIG_LOGIN_RETRIES_DEFAULT 3
#define CONFIG_LOGIN_RETRY_DELAY_DEFAULT 2
#define CONFIG_LOGIN_RETRY_MAX_DELAY_DEFAULT 30
#define CONFIG_TOKEN_STORE_DEFAULT "tokens.sqlite"
#define CONFIG_FILE_PREFIX_DEFAULT "hostup"

struct host_config_t {
    bool enabled = true;
    // api key or "username:password"
    std::string credential;
    std::optional<unsigned int> max_connections;
};

struct engine_config_t {
    unsigned int parallelism = CONFIG_PARALLELISM_DEFAULT;
    unsigned int global_connections = CONFIG_GLOBAL_CONNECTIONS_DEFAULT;
    unsigned int max_retries = CONFIG_MAX_RETRIES_DEFAULT;
    std::int64_t token_safety_margin = CONFIG_SAFETY_MARGIN_DEFAULT;
    // seconds between full retry passes
    unsigned int backoff_initial = CONFIG_BACKOFF_INITIAL_DEFAULT;
    unsigned int backoff_max = CONFIG_BACKOFF_MAX_DEFAULT;
    // transport retries inside a single login
    unsigned int login_retries = CONFIG_LOGIN_RETRIES_DEFAULT;
    unsigned int login_retry_delay = CONFIG_LOGIN_RETRY_DELAY_DEFAULT;
    unsigned int login_retry_max_delay = CONFIG_LOGIN_RETRY_MAX_DELAY_DEFAULT;
    std::filesystem::path token_store_path = CONFIG_TOKEN_STORE_DEFAULT;
    std::filesystem::path builtin_hosts_dir;
    std::filesystem::path user_hosts_dir;
    // "<prefix>_<digits>_" is stripped from file names before upload
    std::string file_prefix = CONFIG_FILE_PREFIX_DEFAULT;
    std::map<std::string, host_config_t> hosts;
};

// relative paths are resolved against base_dir
std::variant<engine_config_t, std::string> parse_engine_config(const nlohmann::json &data, const std::filesystem::path &base_dir);

std::variant<engine_config_t, std::string> load_engine_config(const std::filesystem::path &path);

// ids of hosts with enabled = true, ordered by id
std::vector<std::string> enabled_host_ids(const engine_config_t &config);
