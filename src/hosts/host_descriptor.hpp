#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "./json_path.hpp"

#define HOST_MAX_CONNECTIONS_DEFAULT 2
#define HOST_GLOBAL_CONNECTIONS_HINT_DEFAULT 3
#define HOST_INACTIVITY_TIMEOUT_DEFAULT 300
#define HOST_POLL_DELAY_DEFAULT 1.0
#define HOST_POLL_ATTEMPTS_DEFAULT 10

enum class auth_kind_t {
    none = 0,
    api_key = 1,
    token_login = 2,
    session_login = 3
};

enum class response_type_t {
    json = 0,
    text = 1,
    regex = 2
};

typedef std::vector<std::pair<std::string, std::string>> form_fields_t;

// anonymous host, no credential needed
struct no_auth_t {};

// static key, sent as {token} placeholder and optionally as bearer header
struct api_key_auth_t {};

// credential -> temporary token
struct token_login_auth_t {
    std::string login_url;
    std::string login_method = "GET";
    // values may contain {username} and {password}
    std::map<std::string, std::string> login_fields;
    json_path_t token_path;
    // optional, falls back to host token_ttl
    json_path_t ttl_path;
};

// credential -> session cookies + session id scraped from markup
struct session_login_auth_t {
    std::string login_url;
    std::map<std::string, std::string> login_fields;
    // session id is taken either from this cookie...
    std::string session_cookie_name;
    // ...or from group 1 of this regex applied to the upload page
    std::string session_id_regex;
    std::string upload_page_url;
    // region of the login page holding the positional captcha
    std::string captcha_regex;
    std::string captcha_field = "code";
    // "", "reverse" or "move_3rd_to_front"
    std::string captcha_transform;
};

typedef std::variant<no_auth_t, api_key_auth_t, token_login_auth_t, session_login_auth_t> auth_scheme_t;

struct response_rules_t {
    response_type_t type = response_type_t::json;
    json_path_t link_path;
    std::string link_prefix;
    std::string link_suffix;
    std::string link_regex;
    json_path_t file_id_path;
};

// one multipart request carries the file
struct single_step_t {};

// init -> transfer -> finalize
struct multi_step_t {
    std::string init_url;
    std::string init_method = "GET";
    bool init_body_json = false;
    // any of "token", "name", "size", "hash"
    std::vector<std::string> init_params;
    json_path_t upload_url_path;
    json_path_t upload_id_path;
    json_path_t state_path;
    // state value reported by init when the file already exists on the host
    std::optional<long long> dedupe_state;
    json_path_t dedupe_url_path;
    json_path_t file_field_path;
    json_path_t form_data_path;
    bool require_hash = false;
};

// init -> transfer -> poll until completion
struct multi_step_polling_t {
    multi_step_t steps;
    std::string poll_url;
    double poll_delay_seconds = HOST_POLL_DELAY_DEFAULT;
    unsigned int poll_attempts = HOST_POLL_ATTEMPTS_DEFAULT;
    std::optional<long long> done_state;
    std::vector<json_path_t> alternate_link_paths;
};

typedef std::variant<single_step_t, multi_step_t, multi_step_polling_t> protocol_shape_t;

// host can create a destination container with the first upload
struct gallery_support_t {
    form_fields_t create_fields;
    std::string id_field = "gallery_id";
    json_path_t id_path;
};

// account endpoint reporting storage quota and premium status
struct user_info_endpoint_t {
    // may contain {token}
    std::string url;
    std::string method = "GET";
    // POST {"access_token": token} instead of a plain request
    bool body_json = false;
    json_path_t storage_total_path;
    json_path_t storage_used_path;
    json_path_t storage_left_path;
    json_path_t premium_path;
    // markup pages: group 1 is used and group 2 total storage, in GB
    std::string storage_regex;
};

struct delete_endpoint_t {
    // may contain {file_id} and {token}
    std::string url;
    // GET, POST or DELETE
    std::string method = "GET";
    // POST {"ids": [file_id], "access_token": token}
    bool body_json = false;
    // POST form fields, any of "del_code", "file_id", "sess_id"
    std::vector<std::string> params;
};

struct host_descriptor_t {
    std::string id;
    std::string display_name;
    auth_scheme_t auth;
    protocol_shape_t protocol;

    // bytes, 0 means unlimited
    std::uint64_t max_file_size = 0;
    unsigned int max_connections_global_hint = HOST_GLOBAL_CONNECTIONS_HINT_DEFAULT;
    unsigned int max_connections_per_host = HOST_MAX_CONNECTIONS_DEFAULT;

    std::string upload_endpoint;
    std::string upload_method = "POST";
    std::string file_field = "file";
    form_fields_t extra_fields;
    std::string get_server_url;
    json_path_t server_response_path;
    json_path_t server_session_id_path;
    bool bearer_header = false;

    response_rules_t response;

    // seconds, 0 means the token never expires
    std::int64_t token_ttl = 0;
    std::vector<std::string> stale_token_patterns;
    bool check_body_on_success = false;

    long inactivity_timeout = HOST_INACTIVITY_TIMEOUT_DEFAULT;
    // 0 means unlimited
    long upload_timeout = 0;

    std::optional<gallery_support_t> gallery;
    std::optional<user_info_endpoint_t> user_info;
    std::optional<delete_endpoint_t> delete_file;
};

auth_kind_t get_auth_kind(const host_descriptor_t &host);

const char *auth_kind_name(auth_kind_t kind);

// validates and converts one host JSON document, fallback_id is used when
// the document has no "id" field
std::variant<host_descriptor_t, std::string> parse_host_descriptor(const nlohmann::json &data, const std::string &fallback_id);
