#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <regex>

#include <nlohmann/json.hpp>

#include "./host_account.hpp"

#define BYTES_PER_GB (1024.0 * 1024.0 * 1024.0)

HostAccount::HostAccount(const HostRegistry &registry_, AuthenticationProvider &auth_, HttpClient &http_) :
    registry {registry_},
    auth {auth_},
    http {http_} {}

std::string url_origin(const std::string &url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return "";
    }
    const auto host_end = url.find_first_of("/?#", scheme_end + 3);
    auto ret = url.substr(0, host_end);
    std::transform(ret.begin(), ret.end(), ret.begin(), [](unsigned char c) { return std::tolower(c); });
    return ret;
}

static upload_error_t account_error(const host_descriptor_t &host, error_kind_t kind, const std::string &message, const http_response_t *response = nullptr) {
    auto error = make_error(kind, message);
    error.host_id = host.id;
    if (response != nullptr) {
        error.http_status = response->status;
        error.response_body = response->body.substr(0, ERROR_BODY_MAX_LENGTH);
    }
    return error;
}

static upload_error_t unknown_host(const std::string &host_id) {
    auto error = make_error(error_kind_t::validation, "unknown host");
    error.host_id = host_id;
    return error;
}

std::variant<http_response_t, upload_error_t> HostAccount::perform(const host_descriptor_t &host, const auth_context_t &ctx, http_request_t request) {
    apply_auth(host, ctx, request);
    const auto performed = http.perform(request);
    if (std::holds_alternative<http_transport_error_t>(performed)) {
        const auto &transport = std::get<http_transport_error_t>(performed);
        return account_error(host, transport.timed_out ? error_kind_t::timeout : error_kind_t::network, transport.message);
    }
    return std::get<http_response_t>(performed);
}

std::optional<upload_error_t> HostAccount::rejected_auth(const host_descriptor_t &host, const http_response_t &response) {
    const bool success = response.status >= 200 && response.status < 300;
    if (success && !host.check_body_on_success) {
        return std::nullopt;
    }
    if (!auth.looks_like_stale_auth(host.id, response.body, response.status)) {
        return std::nullopt;
    }
    return account_error(host, error_kind_t::authentication, "host rejected the authentication", &response);
}

static std::optional<bool> premium_flag(const nlohmann::json &data, const json_path_t &path) {
    const auto value = extract_json_path(data, path);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_boolean()) {
        return value->get<bool>();
    }
    if (value->is_number()) {
        return value->get<double>() != 0;
    }
    if (value->is_string()) {
        const auto text = value->get<std::string>();
        return !text.empty() && text != "0" && text != "false";
    }
    return std::nullopt;
}

account_result_t HostAccount::fetch_user_info(const host_descriptor_t &host, const user_info_endpoint_t &endpoint, const auth_context_t &ctx) {
    http_request_t request;
    request.method = endpoint.method;
    request.url = expand_template(endpoint.url, url_encode_values({ {"token", ctx.token} }));
    if (endpoint.body_json) {
        request.method = "POST";
        request.headers.push_back("Content-Type: application/json");
        nlohmann::json body;
        body["access_token"] = ctx.token;
        request.body = body.dump();
    }
    const auto performed = perform(host, ctx, request);
    if (std::holds_alternative<upload_error_t>(performed)) {
        return std::get<upload_error_t>(performed);
    }
    const auto &response = std::get<http_response_t>(performed);
    if (response.status == 401 || response.status == 403) {
        return account_error(host, error_kind_t::authentication, "user info access denied", &response);
    }
    const auto rejected = rejected_auth(host, response);
    if (rejected.has_value()) {
        return rejected.value();
    }
    if (response.status != 200) {
        auto error = make_http_error(response.status, "user info request failed", response.body);
        error.host_id = host.id;
        return error;
    }

    account_info_t info;
    if (!endpoint.storage_regex.empty()) {
        std::smatch match;
        const std::regex storage(endpoint.storage_regex);
        if (!std::regex_search(response.body, match, storage) || match.size() < 3) {
            fprintf(stderr, "[account:%s] Storage pattern did not match the account page\n", host.id.c_str());
            return info;
        }
        const auto used_gb = std::strtod(match[1].str().c_str(), nullptr);
        const auto total_gb = std::strtod(match[2].str().c_str(), nullptr);
        info.storage_used = static_cast<std::int64_t>(used_gb * BYTES_PER_GB);
        info.storage_total = static_cast<std::int64_t>(total_gb * BYTES_PER_GB);
        info.storage_left = info.storage_total.value() - info.storage_used.value();
        return info;
    }

    const auto data = nlohmann::json::parse(response.body, nullptr, false);
    if (data.is_discarded()) {
        return account_error(host, error_kind_t::server, "user info response is not JSON", &response);
    }
    const auto details = json_api_status_error(data);
    if (details.has_value()) {
        return account_error(host, error_kind_t::server, "host reported failure: " + details.value(), &response);
    }
    if (!endpoint.storage_total_path.empty()) {
        info.storage_total = extract_json_integer(data, endpoint.storage_total_path);
    }
    if (!endpoint.storage_used_path.empty()) {
        info.storage_used = extract_json_integer(data, endpoint.storage_used_path);
    }
    if (!endpoint.storage_left_path.empty()) {
        info.storage_left = extract_json_integer(data, endpoint.storage_left_path);
    }
    if (!info.storage_total.has_value() && info.storage_left.has_value() && info.storage_used.has_value()) {
        info.storage_total = info.storage_left.value() + info.storage_used.value();
    }
    if (!endpoint.premium_path.empty()) {
        info.premium = premium_flag(data, endpoint.premium_path);
    }
    return info;
}

account_result_t HostAccount::get_user_info(const std::string &host_id, const credential_t &credential) {
    const auto host = registry.get(host_id);
    if (!host.has_value()) {
        return unknown_host(host_id);
    }
    if (!host->user_info.has_value()) {
        return account_error(host.value(), error_kind_t::validation, "host does not report account details");
    }
    fprintf(stdout, "[account:%s] Requesting account details\n", host_id.c_str());
    for (unsigned int attempt = 1; ; attempt++) {
        const auto authenticated = auth.ensure_authenticated(host_id, credential);
        if (std::holds_alternative<upload_error_t>(authenticated)) {
            return std::get<upload_error_t>(authenticated);
        }
        const auto &ctx = std::get<auth_context_t>(authenticated);
        auto result = fetch_user_info(host.value(), host->user_info.value(), ctx);
        if (attempt < ACCOUNT_AUTH_ATTEMPTS && std::holds_alternative<upload_error_t>(result) && std::get<upload_error_t>(result).kind == error_kind_t::authentication) {
            fprintf(stderr, "[account:%s] Authentication rejected, logging in again\n", host_id.c_str());
            auth.invalidate(host_id, ctx);
            continue;
        }
        return result;
    }
}

credential_check_t HostAccount::test_credentials(const std::string &host_id, const credential_t &credential) {
    credential_check_t ret;
    const auto host = registry.get(host_id);
    if (!host.has_value()) {
        ret.message = "unknown host";
        return ret;
    }
    if (get_auth_kind(host.value()) == auth_kind_t::none) {
        ret.success = true;
        ret.message = "no authentication required";
        return ret;
    }
    const auto authenticated = auth.ensure_authenticated(host_id, credential);
    if (std::holds_alternative<upload_error_t>(authenticated)) {
        ret.message = "credential validation failed: " + std::get<upload_error_t>(authenticated).message;
        return ret;
    }
    if (!host->user_info.has_value()) {
        ret.success = true;
        ret.message = "authenticated, host has no endpoint to verify with";
        return ret;
    }
    const auto info = get_user_info(host_id, credential);
    if (std::holds_alternative<upload_error_t>(info)) {
        ret.message = "credential validation failed: " + std::get<upload_error_t>(info).message;
        return ret;
    }
    ret.success = true;
    ret.message = "credentials are valid";
    ret.info = std::get<account_info_t>(info);
    return ret;
}

std::optional<upload_error_t> HostAccount::send_delete(const host_descriptor_t &host, const delete_endpoint_t &endpoint, const auth_context_t &ctx, const std::string &file_id) {
    http_request_t request;
    request.url = endpoint.url;
    request.method = endpoint.method;
    if (endpoint.body_json) {
        request.method = "POST";
        request.headers.push_back("Content-Type: application/json");
        nlohmann::json body;
        body["ids"] = nlohmann::json::array({ file_id });
        body["access_token"] = ctx.token;
        request.body = body.dump();
    } else if (endpoint.method == "POST" && !endpoint.params.empty()) {
        for (const auto &p : endpoint.params) {
            if (p == "sess_id") {
                request.form.emplace_back(p, ctx.session_id.empty() ? ctx.token : ctx.session_id);
            } else {
                request.form.emplace_back(p, file_id);
            }
        }
    } else {
        request.url = expand_template(endpoint.url, url_encode_values({ {"file_id", file_id}, {"token", ctx.token} }));
    }

    const auto performed = perform(host, ctx, request);
    if (std::holds_alternative<upload_error_t>(performed)) {
        return std::get<upload_error_t>(performed);
    }
    const auto &response = std::get<http_response_t>(performed);
    if (!response.effective_url.empty() && url_origin(response.effective_url) != url_origin(request.url)) {
        return account_error(host, error_kind_t::client, "delete redirected to another origin: " + url_origin(response.effective_url), &response);
    }
    const auto rejected = rejected_auth(host, response);
    if (rejected.has_value()) {
        return rejected;
    }
    if (response.status < 200 || response.status >= 300) {
        auto error = make_http_error(response.status, "delete of " + file_id + " failed", response.body);
        error.host_id = host.id;
        return error;
    }
    return std::nullopt;
}

std::optional<upload_error_t> HostAccount::delete_file(const std::string &host_id, const credential_t &credential, const std::string &file_id) {
    const auto host = registry.get(host_id);
    if (!host.has_value()) {
        return unknown_host(host_id);
    }
    if (!host->delete_file.has_value()) {
        return account_error(host.value(), error_kind_t::validation, "host does not support file deletion");
    }
    if (file_id.empty()) {
        return account_error(host.value(), error_kind_t::validation, "file id is empty");
    }
    fprintf(stdout, "[account:%s] Deleting %s\n", host_id.c_str(), file_id.c_str());
    for (unsigned int attempt = 1; ; attempt++) {
        const auto authenticated = auth.ensure_authenticated(host_id, credential);
        if (std::holds_alternative<upload_error_t>(authenticated)) {
            return std::get<upload_error_t>(authenticated);
        }
        const auto &ctx = std::get<auth_context_t>(authenticated);
        auto error = send_delete(host.value(), host->delete_file.value(), ctx, file_id);
        if (attempt < ACCOUNT_AUTH_ATTEMPTS && error.has_value() && error->kind == error_kind_t::authentication) {
            fprintf(stderr, "[account:%s] Authentication rejected, logging in again\n", host_id.c_str());
            auth.invalidate(host_id, ctx);
            continue;
        }
        if (!error.has_value()) {
            fprintf(stdout, "[account:%s] Deleted %s\n", host_id.c_str(), file_id.c_str());
        }
        return error;
    }
}
