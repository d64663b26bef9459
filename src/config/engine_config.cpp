#include <fstream>
#include <stdexcept>

#include "./engine_config.hpp"

static unsigned int positive(const nlohmann::json &data, const char *name, unsigned int fallback) {
    const auto it = data.find(name);
    if (it == data.end() || it->is_null()) {
        return fallback;
    }
    const auto value = it->get<long long>();
    if (value <= 0) {
        throw std::runtime_error(std::string("\"") + name + "\" must be positive");
    }
    return static_cast<unsigned int>(value);
}

static unsigned int non_negative(const nlohmann::json &data, const char *name, unsigned int fallback) {
    const auto it = data.find(name);
    if (it == data.end() || it->is_null()) {
        return fallback;
    }
    const auto value = it->get<long long>();
    if (value < 0) {
        throw std::runtime_error(std::string("\"") + name + "\" must not be negative");
    }
    return static_cast<unsigned int>(value);
}

static std::filesystem::path path_value(const nlohmann::json &data, const char *name, const std::filesystem::path &fallback, const std::filesystem::path &base_dir) {
    const auto it = data.find(name);
    if (it == data.end() || it->is_null()) {
        return fallback;
    }
    const std::filesystem::path path = it->get<std::string>();
    if (path.empty() || path.is_absolute() || base_dir.empty()) {
        return path;
    }
    return (base_dir / path).lexically_normal();
}

std::variant<engine_config_t, std::string> parse_engine_config(const nlohmann::json &data, const std::filesystem::path &base_dir) {
    if (!data.is_object()) {
        return std::string("configuration must be a JSON object");
    }
    engine_config_t config;
    try {
        config.parallelism = positive(data, "parallelism", CONFIG_PARALLELISM_DEFAULT);
        config.global_connections = positive(data, "global_connections", CONFIG_GLOBAL_CONNECTIONS_DEFAULT);
        config.max_retries = non_negative(data, "max_retries", CONFIG_MAX_RETRIES_DEFAULT);
        config.token_safety_margin = non_negative(data, "token_safety_margin", CONFIG_SAFETY_MARGIN_DEFAULT);
        config.backoff_initial = non_negative(data, "backoff_initial", CONFIG_BACKOFF_INITIAL_DEFAULT);
        config.backoff_max = non_negative(data, "backoff_max", CONFIG_BACKOFF_MAX_DEFAULT);
        config.login_retries = positive(data, "login_retries", CONFIG_LOGIN_RETRIES_DEFAULT);
        config.login_retry_delay = non_negative(data, "login_retry_delay", CONFIG_LOGIN_RETRY_DELAY_DEFAULT);
        config.login_retry_max_delay = non_negative(data, "login_retry_max_delay", CONFIG_LOGIN_RETRY_MAX_DELAY_DEFAULT);
        config.token_store_path = path_value(data, "token_store", CONFIG_TOKEN_STORE_DEFAULT, base_dir);
        config.builtin_hosts_dir = path_value(data, "builtin_hosts_dir", "", base_dir);
        config.user_hosts_dir = path_value(data, "user_hosts_dir", "", base_dir);
        config.file_prefix = data.value("file_prefix", std::string(CONFIG_FILE_PREFIX_DEFAULT));

        const auto hosts = data.find("hosts");
        if (hosts != data.end() && hosts->is_object()) {
            for (const auto &item : hosts->items()) {
                host_config_t host;
                host.enabled = item.value().value("enabled", true);
                host.credential = item.value().value("credential", std::string());
                const auto max_connections = item.value().find("max_connections");
                if (max_connections != item.value().end() && !max_connections->is_null()) {
                    host.max_connections = positive(item.value(), "max_connections", 1);
                }
                config.hosts[item.key()] = host;
            }
        }
    } catch (const nlohmann::json::exception &e) {
        return std::string("malformed configuration: ") + e.what();
    } catch (const std::runtime_error &e) {
        return std::string(e.what());
    }
    return config;
}

std::variant<engine_config_t, std::string> load_engine_config(const std::filesystem::path &path) {
    std::ifstream stream(path);
    if (!stream) {
        return std::string("Can not open configuration \"") + path.string() + "\"";
    }
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(stream);
    } catch (const nlohmann::json::parse_error &e) {
        return std::string("Could not parse configuration \"") + path.string() + "\": " + e.what();
    }
    return parse_engine_config(data, path.parent_path());
}

std::vector<std::string> enabled_host_ids(const engine_config_t &config) {
    std::vector<std::string> ret;
    for (const auto &h : config.hosts) {
        if (h.second.enabled) {
            ret.push_back(h.first);
        }
    }
    return ret;
}
