#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

// object key or array index
typedef std::variant<std::string, std::size_t> json_path_key_t;
typedef std::vector<json_path_key_t> json_path_t;

// path is a JSON array like ["response", "upload", 0, "url"]
std::variant<json_path_t, std::string> parse_json_path(const nlohmann::json &path);

// nullptr if any step of the path is missing
const nlohmann::json *extract_json_path(const nlohmann::json &data, const json_path_t &path);

// strings as is, numbers and booleans converted, null/object/array -> nullopt
std::optional<std::string> extract_json_string(const nlohmann::json &data, const json_path_t &path);

std::optional<long long> extract_json_integer(const nlohmann::json &data, const json_path_t &path);

std::string json_path_to_string(const json_path_t &path);

// Hosts report API level failures with HTTP 200 and a "status" field.
// Returns the failure details when "status" is present and is neither 200
// nor "success".
std::optional<std::string> json_api_status_error(const nlohmann::json &data);
