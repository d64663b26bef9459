#include <regex>
#include <stdexcept>

#include "./host_descriptor.hpp"

auth_kind_t get_auth_kind(const host_descriptor_t &host) {
    return static_cast<auth_kind_t>(host.auth.index());
}

const char *auth_kind_name(auth_kind_t kind) {
    switch (kind) {
        case auth_kind_t::none:
            return "none";
        case auth_kind_t::api_key:
            return "api_key";
        case auth_kind_t::token_login:
            return "token_login";
        case auth_kind_t::session_login:
            return "session";
    }
    return "unknown";
}

// parse errors inside the helpers are reported through this exception and
// converted to the returned error string at the top level
class DescriptorError : public std::runtime_error {
  public:
    DescriptorError(const std::string &message) : std::runtime_error(message) {}
};

static const nlohmann::json &section(const nlohmann::json &data, const char *name) {
    static const nlohmann::json empty = nlohmann::json::object();
    const auto it = data.find(name);
    if (it == data.end() || it->is_null()) {
        return empty;
    }
    if (!it->is_object()) {
        throw DescriptorError(std::string("\"") + name + "\" must be an object");
    }
    return *it;
}

static json_path_t path_field(const nlohmann::json &data, const char *name) {
    const auto it = data.find(name);
    if (it == data.end() || it->is_null()) {
        return {};
    }
    const auto parsed = parse_json_path(*it);
    if (std::holds_alternative<std::string>(parsed)) {
        throw DescriptorError(std::string("\"") + name + "\": " + std::get<std::string>(parsed));
    }
    return std::get<json_path_t>(parsed);
}

static std::string string_field(const nlohmann::json &data, const char *name, const std::string &fallback = "") {
    const auto it = data.find(name);
    if (it == data.end() || it->is_null()) {
        return fallback;
    }
    return it->get<std::string>();
}

static std::optional<long long> optional_integer(const nlohmann::json &data, const char *name) {
    const auto it = data.find(name);
    if (it == data.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<long long>();
}

static long long non_negative(const nlohmann::json &data, const char *name, long long fallback) {
    const auto value = optional_integer(data, name);
    if (!value.has_value()) {
        return fallback;
    }
    if (value.value() < 0) {
        throw DescriptorError(std::string("\"") + name + "\" must not be negative");
    }
    return value.value();
}

static form_fields_t form_field_map(const nlohmann::json &data, const char *name) {
    form_fields_t ret;
    const auto it = data.find(name);
    if (it == data.end() || it->is_null()) {
        return ret;
    }
    for (const auto &item : it->items()) {
        ret.emplace_back(item.key(), item.value().is_string() ? item.value().get<std::string>() : item.value().dump());
    }
    return ret;
}

static std::map<std::string, std::string> login_field_map(const nlohmann::json &auth) {
    std::map<std::string, std::string> ret;
    for (const auto &f : form_field_map(auth, "login_fields")) {
        ret[f.first] = f.second;
    }
    return ret;
}

static void check_regex(const std::string &pattern, const char *name) {
    if (pattern.empty()) {
        return;
    }
    try {
        std::regex compiled(pattern);
    } catch (const std::regex_error &e) {
        throw DescriptorError(std::string("\"") + name + "\" is not a valid regex: " + e.what());
    }
}

static auth_scheme_t parse_auth(const nlohmann::json &data, const nlohmann::json &auth) {
    const auto auth_type = string_field(data, "auth_type", "");
    const auto requires_auth = data.value("requires_auth", !auth_type.empty());
    if (!requires_auth || auth_type.empty() || auth_type == "none") {
        return no_auth_t {};
    }
    if (auth_type == "api_key" || auth_type == "bearer") {
        return api_key_auth_t {};
    }
    if (auth_type == "token_login") {
        token_login_auth_t ret;
        ret.login_url = string_field(auth, "login_url");
        ret.login_method = string_field(auth, "login_method", "GET");
        ret.login_fields = login_field_map(auth);
        ret.token_path = path_field(auth, "token_path");
        ret.ttl_path = path_field(auth, "token_ttl_path");
        if (ret.login_url.empty()) {
            throw DescriptorError("token_login host requires \"auth.login_url\"");
        }
        if (ret.token_path.empty()) {
            throw DescriptorError("token_login host requires \"auth.token_path\"");
        }
        return ret;
    }
    if (auth_type == "session") {
        session_login_auth_t ret;
        ret.login_url = string_field(auth, "login_url");
        ret.login_fields = login_field_map(auth);
        ret.session_cookie_name = string_field(auth, "session_cookie_name");
        ret.session_id_regex = string_field(auth, "session_id_regex");
        ret.upload_page_url = string_field(auth, "upload_page_url");
        ret.captcha_regex = string_field(auth, "captcha_regex");
        ret.captcha_field = string_field(auth, "captcha_field", "code");
        ret.captcha_transform = string_field(auth, "captcha_transform");
        if (ret.login_url.empty()) {
            throw DescriptorError("session host requires \"auth.login_url\"");
        }
        if (ret.session_cookie_name.empty() && ret.session_id_regex.empty()) {
            throw DescriptorError("session host requires \"auth.session_cookie_name\" or \"auth.session_id_regex\"");
        }
        if (!ret.session_id_regex.empty() && ret.upload_page_url.empty()) {
            throw DescriptorError("\"auth.session_id_regex\" requires \"auth.upload_page_url\"");
        }
        if (!ret.captcha_transform.empty() && ret.captcha_transform != "reverse" && ret.captcha_transform != "move_3rd_to_front") {
            throw DescriptorError("unknown captcha transform \"" + ret.captcha_transform + "\"");
        }
        check_regex(ret.session_id_regex, "auth.session_id_regex");
        check_regex(ret.captcha_regex, "auth.captcha_regex");
        return ret;
    }
    throw DescriptorError("unknown auth_type \"" + auth_type + "\"");
}

static multi_step_t parse_multi_step(const nlohmann::json &multistep) {
    multi_step_t ret;
    ret.init_url = string_field(multistep, "init_url");
    ret.init_method = string_field(multistep, "init_method", "GET");
    ret.init_body_json = multistep.value("init_body_json", false);
    ret.init_params = multistep.value("init_params", std::vector<std::string> {});
    ret.upload_url_path = path_field(multistep, "upload_url_path");
    ret.upload_id_path = path_field(multistep, "upload_id_path");
    ret.state_path = path_field(multistep, "state_path");
    ret.dedupe_state = optional_integer(multistep, "dedupe_state");
    ret.dedupe_url_path = path_field(multistep, "dedupe_url_path");
    ret.file_field_path = path_field(multistep, "file_field_path");
    ret.form_data_path = path_field(multistep, "form_data_path");
    ret.require_hash = multistep.value("require_hash", false);
    for (const auto &p : ret.init_params) {
        if (p != "token" && p != "name" && p != "size" && p != "hash") {
            throw DescriptorError("unknown init param \"" + p + "\"");
        }
    }
    if (ret.upload_url_path.empty()) {
        throw DescriptorError("multistep host requires \"multistep.upload_url_path\"");
    }
    return ret;
}

static protocol_shape_t parse_protocol(const nlohmann::json &multistep) {
    if (string_field(multistep, "init_url").empty()) {
        return single_step_t {};
    }
    auto steps = parse_multi_step(multistep);
    const auto poll_url = string_field(multistep, "poll_url");
    if (poll_url.empty()) {
        return steps;
    }
    multi_step_polling_t ret;
    ret.steps = steps;
    ret.poll_url = poll_url;
    ret.poll_delay_seconds = multistep.value("poll_delay", HOST_POLL_DELAY_DEFAULT);
    if (ret.poll_delay_seconds < 0) {
        throw DescriptorError("\"multistep.poll_delay\" must not be negative");
    }
    ret.poll_attempts = static_cast<unsigned int>(non_negative(multistep, "poll_retries", HOST_POLL_ATTEMPTS_DEFAULT));
    if (ret.poll_attempts == 0) {
        throw DescriptorError("\"multistep.poll_retries\" must be positive");
    }
    ret.done_state = optional_integer(multistep, "done_state");
    const auto alternates = multistep.find("alternate_link_paths");
    if (alternates != multistep.end() && alternates->is_array()) {
        for (const auto &p : *alternates) {
            const auto parsed = parse_json_path(p);
            if (std::holds_alternative<std::string>(parsed)) {
                throw DescriptorError("\"multistep.alternate_link_paths\": " + std::get<std::string>(parsed));
            }
            ret.alternate_link_paths.push_back(std::get<json_path_t>(parsed));
        }
    }
    return ret;
}

static response_rules_t parse_response_rules(const nlohmann::json &response) {
    response_rules_t ret;
    const auto type = string_field(response, "type", "json");
    if (type == "json") {
        ret.type = response_type_t::json;
    } else if (type == "text") {
        ret.type = response_type_t::text;
    } else if (type == "regex") {
        ret.type = response_type_t::regex;
    } else {
        throw DescriptorError("unknown response type \"" + type + "\"");
    }
    ret.link_path = path_field(response, "link_path");
    ret.link_prefix = string_field(response, "link_prefix");
    ret.link_suffix = string_field(response, "link_suffix");
    ret.link_regex = string_field(response, "link_regex");
    ret.file_id_path = path_field(response, "file_id_path");
    check_regex(ret.link_regex, "response.link_regex");
    if (ret.type == response_type_t::regex && ret.link_regex.empty()) {
        throw DescriptorError("regex response requires \"response.link_regex\"");
    }
    return ret;
}

static user_info_endpoint_t parse_user_info(const nlohmann::json &info) {
    user_info_endpoint_t ret;
    ret.url = string_field(info, "url");
    ret.method = string_field(info, "method", "GET");
    ret.body_json = info.value("body_json", false);
    ret.storage_total_path = path_field(info, "storage_total_path");
    ret.storage_used_path = path_field(info, "storage_used_path");
    ret.storage_left_path = path_field(info, "storage_left_path");
    ret.premium_path = path_field(info, "premium_path");
    ret.storage_regex = string_field(info, "storage_regex");
    if (ret.url.empty()) {
        throw DescriptorError("\"user_info.url\" is required");
    }
    if (ret.method != "GET" && ret.method != "POST") {
        throw DescriptorError("\"user_info.method\" must be GET or POST");
    }
    check_regex(ret.storage_regex, "user_info.storage_regex");
    return ret;
}

static delete_endpoint_t parse_delete(const nlohmann::json &remove) {
    delete_endpoint_t ret;
    ret.url = string_field(remove, "url");
    ret.method = string_field(remove, "method", "GET");
    ret.body_json = remove.value("body_json", false);
    ret.params = remove.value("params", std::vector<std::string> {});
    if (ret.url.empty()) {
        throw DescriptorError("\"delete.url\" is required");
    }
    if (ret.method != "GET" && ret.method != "POST" && ret.method != "DELETE") {
        throw DescriptorError("\"delete.method\" must be GET, POST or DELETE");
    }
    for (const auto &p : ret.params) {
        if (p != "del_code" && p != "file_id" && p != "sess_id") {
            throw DescriptorError("unknown delete param \"" + p + "\"");
        }
    }
    return ret;
}

static host_descriptor_t parse_descriptor(const nlohmann::json &data, const std::string &fallback_id) {
    if (!data.is_object()) {
        throw DescriptorError("host descriptor must be a JSON object");
    }
    const auto &upload = section(data, "upload");
    const auto &response = section(data, "response");
    const auto &auth = section(data, "auth");
    const auto &multistep = section(data, "multistep");

    host_descriptor_t host;
    host.id = string_field(data, "id", fallback_id);
    host.display_name = string_field(data, "name");
    if (host.id.empty()) {
        throw DescriptorError("missing \"id\"");
    }
    if (host.display_name.empty()) {
        throw DescriptorError("missing \"name\"");
    }
    host.auth = parse_auth(data, auth);
    host.protocol = parse_protocol(multistep);

    host.max_file_size = static_cast<std::uint64_t>(non_negative(data, "max_file_size_mb", 0)) * 1024 * 1024;
    host.max_connections_per_host = static_cast<unsigned int>(non_negative(data, "max_connections", HOST_MAX_CONNECTIONS_DEFAULT));
    host.max_connections_global_hint = static_cast<unsigned int>(non_negative(data, "max_connections_global_hint", HOST_GLOBAL_CONNECTIONS_HINT_DEFAULT));
    if (host.max_connections_per_host == 0) {
        throw DescriptorError("\"max_connections\" must be positive");
    }

    host.upload_endpoint = string_field(upload, "endpoint");
    host.upload_method = string_field(upload, "method", "POST");
    host.file_field = string_field(upload, "file_field", "file");
    host.extra_fields = form_field_map(upload, "extra_fields");
    host.get_server_url = string_field(upload, "get_server");
    host.server_response_path = path_field(upload, "server_response_path");
    host.server_session_id_path = path_field(upload, "server_session_id_path");
    host.bearer_header = string_field(data, "auth_header", string_field(data, "auth_type") == "bearer" ? "bearer" : "") == "bearer";
    host.inactivity_timeout = static_cast<long>(non_negative(upload, "inactivity_timeout", HOST_INACTIVITY_TIMEOUT_DEFAULT));
    host.upload_timeout = static_cast<long>(non_negative(upload, "upload_timeout", 0));
    if (host.upload_method != "POST" && host.upload_method != "PUT") {
        throw DescriptorError("\"upload.method\" must be POST or PUT");
    }
    if (std::holds_alternative<single_step_t>(host.protocol) && host.upload_endpoint.empty()) {
        throw DescriptorError("missing \"upload.endpoint\"");
    }

    host.response = parse_response_rules(response);

    if (std::holds_alternative<session_login_auth_t>(host.auth)) {
        host.token_ttl = non_negative(auth, "session_token_ttl", 0);
    } else {
        host.token_ttl = non_negative(auth, "token_ttl", 0);
    }
    host.stale_token_patterns = auth.value("stale_token_patterns", std::vector<std::string> {});
    for (const auto &p : host.stale_token_patterns) {
        check_regex(p, "auth.stale_token_patterns");
    }
    host.check_body_on_success = auth.value("check_body_on_success", false);

    const auto gallery_it = data.find("gallery");
    if (gallery_it != data.end() && gallery_it->is_object()) {
        gallery_support_t gallery;
        gallery.create_fields = form_field_map(*gallery_it, "create_fields");
        gallery.id_field = string_field(*gallery_it, "id_field", "gallery_id");
        gallery.id_path = path_field(*gallery_it, "id_path");
        if (gallery.id_path.empty()) {
            throw DescriptorError("\"gallery.id_path\" is required");
        }
        host.gallery = gallery;
    }
    if (data.contains("user_info") && !data.at("user_info").is_null()) {
        host.user_info = parse_user_info(section(data, "user_info"));
    }
    if (data.contains("delete") && !data.at("delete").is_null()) {
        host.delete_file = parse_delete(section(data, "delete"));
    }
    return host;
}

std::variant<host_descriptor_t, std::string> parse_host_descriptor(const nlohmann::json &data, const std::string &fallback_id) {
    try {
        return parse_descriptor(data, fallback_id);
    } catch (const DescriptorError &e) {
        return std::string(e.what());
    } catch (const nlohmann::json::exception &e) {
        return std::string("malformed field: ") + e.what();
    }
}
