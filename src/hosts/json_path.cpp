#include "./json_path.hpp"

std::variant<json_path_t, std::string> parse_json_path(const nlohmann::json &path) {
    if (!path.is_array()) {
        return std::string("JSON path must be an array");
    }
    json_path_t ret;
    for (const auto &key : path) {
        if (key.is_string()) {
            ret.push_back(key.get<std::string>());
            continue;
        }
        if (key.is_number_unsigned() || (key.is_number_integer() && key.get<long long>() >= 0)) {
            ret.push_back(key.get<std::size_t>());
            continue;
        }
        return std::string("JSON path elements must be strings or non-negative integers");
    }
    return ret;
}

const nlohmann::json *extract_json_path(const nlohmann::json &data, const json_path_t &path) {
    if (path.empty()) {
        return nullptr;
    }
    const nlohmann::json *current = &data;
    for (const auto &key : path) {
        if (std::holds_alternative<std::string>(key)) {
            const auto &name = std::get<std::string>(key);
            if (!current->is_object()) {
                return nullptr;
            }
            const auto it = current->find(name);
            if (it == current->end()) {
                return nullptr;
            }
            current = &(*it);
        } else {
            const auto index = std::get<std::size_t>(key);
            if (!current->is_array() || index >= current->size()) {
                return nullptr;
            }
            current = &(*current)[index];
        }
        if (current->is_null()) {
            return nullptr;
        }
    }
    return current;
}

std::optional<std::string> extract_json_string(const nlohmann::json &data, const json_path_t &path) {
    const auto value = extract_json_path(data, path);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_string()) {
        const auto s = value->get<std::string>();
        if (s.empty()) {
            return std::nullopt;
        }
        return s;
    }
    if (value->is_number_integer()) {
        return std::to_string(value->get<long long>());
    }
    if (value->is_number()) {
        return value->dump();
    }
    if (value->is_boolean()) {
        return value->get<bool>() ? std::string("true") : std::string("false");
    }
    return std::nullopt;
}

std::optional<long long> extract_json_integer(const nlohmann::json &data, const json_path_t &path) {
    const auto value = extract_json_path(data, path);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_number_integer()) {
        return value->get<long long>();
    }
    if (value->is_string()) {
        try {
            return std::stoll(value->get<std::string>());
        } catch (const std::exception &) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::string json_path_to_string(const json_path_t &path) {
    std::string ret;
    for (const auto &key : path) {
        if (std::holds_alternative<std::string>(key)) {
            ret += "." + std::get<std::string>(key);
        } else {
            ret += "[" + std::to_string(std::get<std::size_t>(key)) + "]";
        }
    }
    return ret;
}

static bool status_ok(const nlohmann::json &status) {
    if (status.is_number_integer()) {
        return status.get<long long>() == 200;
    }
    if (status.is_string()) {
        const auto s = status.get<std::string>();
        return s == "200" || s == "success" || s == "ok";
    }
    if (status.is_boolean()) {
        return status.get<bool>();
    }
    return true;
}

std::optional<std::string> json_api_status_error(const nlohmann::json &data) {
    if (!data.is_object()) {
        return std::nullopt;
    }
    const auto it = data.find("status");
    if (it == data.end() || status_ok(*it)) {
        return std::nullopt;
    }
    for (const auto &path : std::vector<json_path_t> { {"response", "details"}, {"response", "msg"}, {"details"}, {"error"}, {"message"} }) {
        const auto details = extract_json_string(data, path);
        if (details.has_value()) {
            return details.value();
        }
    }
    return std::string("status ") + it->dump();
}
