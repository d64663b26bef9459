#include <chrono>
#include <cstdio>
#include <regex>

#include <backoffxx/backoffxx.h>
#include <nlohmann/json.hpp>

#include "./captcha.hpp"
#include "./auth_provider.hpp"

credential_t credential_t::from_string(const std::string &value) {
    credential_t ret;
    ret.api_key = value;
    const auto separator = value.find(':');
    if (separator != std::string::npos) {
        ret.username = value.substr(0, separator);
        ret.password = value.substr(separator + 1);
    }
    return ret;
}

bool credential_t::empty() const {
    return api_key.empty() && username.empty() && password.empty();
}

void apply_auth(const host_descriptor_t &host, const auth_context_t &auth, http_request_t &request) {
    if (host.bearer_header && !auth.token.empty()) {
        request.headers.push_back("Authorization: Bearer " + auth.token);
    }
    for (const auto &c : auth.cookies) {
        request.cookies.emplace(c.first, c.second);
    }
}

AuthenticationProvider::AuthenticationProvider(const HostRegistry &registry_, TokenStore &tokens_, HttpClient &http_, auth_settings_t settings_) :
    registry {registry_},
    tokens {tokens_},
    http {http_},
    settings {settings_} {}

static upload_error_t auth_error(const host_descriptor_t &host, const std::string &message, long http_status = 0, const std::string &body = "") {
    auto error = make_error(error_kind_t::authentication, message);
    error.host_id = host.id;
    error.http_status = http_status;
    error.response_body = body.substr(0, ERROR_BODY_MAX_LENGTH);
    return error;
}

std::optional<upload_error_t> AuthenticationProvider::validate_credential(const std::string &host_id, const credential_t &credential) const {
    const auto host = registry.get(host_id);
    if (!host.has_value()) {
        auto error = make_error(error_kind_t::validation, "unknown host");
        error.host_id = host_id;
        return error;
    }
    const auto kind = get_auth_kind(host.value());
    std::string problem;
    if (kind == auth_kind_t::api_key && credential.api_key.empty()) {
        problem = "API key is not set";
    } else if ((kind == auth_kind_t::token_login || kind == auth_kind_t::session_login) && (credential.username.empty() || credential.password.empty())) {
        problem = "username and password are required";
    }
    if (problem.empty()) {
        return std::nullopt;
    }
    auto error = make_error(error_kind_t::validation, problem);
    error.host_id = host_id;
    return error;
}

static auth_context_t context_from_token(auth_kind_t kind, const cached_token_t &token) {
    auth_context_t ctx;
    ctx.kind = kind;
    ctx.extra = token.extra;
    ctx.cache_value = token.value;
    if (kind != auth_kind_t::session_login) {
        ctx.token = token.value;
        return ctx;
    }
    const auto bundle = nlohmann::json::parse(token.value, nullptr, false);
    if (bundle.is_discarded() || !bundle.is_object()) {
        return ctx;
    }
    const auto cookies = bundle.find("cookies");
    if (cookies != bundle.end() && cookies->is_object()) {
        for (const auto &c : cookies->items()) {
            if (c.value().is_string()) {
                ctx.cookies[c.key()] = c.value().get<std::string>();
            }
        }
    }
    ctx.session_id = bundle.value("session_id", "");
    return ctx;
}

auth_result_t AuthenticationProvider::ensure_authenticated(const std::string &host_id, const credential_t &credential) {
    const auto maybe_host = registry.get(host_id);
    if (!maybe_host.has_value()) {
        auto error = make_error(error_kind_t::validation, "unknown host");
        error.host_id = host_id;
        return error;
    }
    const auto &host = maybe_host.value();
    const auto kind = get_auth_kind(host);

    if (kind == auth_kind_t::none) {
        return auth_context_t {};
    }

    const auto invalid = validate_credential(host_id, credential);
    if (invalid.has_value()) {
        return invalid.value();
    }

    if (kind == auth_kind_t::api_key) {
        auth_context_t ctx;
        ctx.kind = kind;
        ctx.token = credential.api_key;
        return ctx;
    }

    const auto result = tokens.get_or_refresh(host_id, settings.safety_margin_seconds, [&]() -> token_result_t {
        if (kind == auth_kind_t::token_login) {
            return token_login(host, std::get<token_login_auth_t>(host.auth), credential);
        }
        return session_login(host, std::get<session_login_auth_t>(host.auth), credential);
    });
    if (std::holds_alternative<upload_error_t>(result)) {
        return std::get<upload_error_t>(result);
    }
    return context_from_token(kind, std::get<cached_token_t>(result));
}

bool AuthenticationProvider::looks_like_stale_auth(const std::string &host_id, const std::string &body, long http_status) const {
    if (http_status == 401 || http_status == 403) {
        return true;
    }
    const auto host = registry.get(host_id);
    if (!host.has_value()) {
        return false;
    }
    const bool success_status = http_status >= 200 && http_status < 300;
    if (success_status && !host->check_body_on_success) {
        return false;
    }
    for (const auto &pattern : host->stale_token_patterns) {
        // patterns are validated when descriptors are loaded
        const std::regex stale_regex(pattern, std::regex::icase);
        if (std::regex_search(body, stale_regex)) {
            return true;
        }
    }
    return false;
}

void AuthenticationProvider::invalidate(const std::string &host_id, const auth_context_t &stale) {
    if (stale.cache_value.empty()) {
        return;
    }
    fprintf(stdout, "[auth:%s] Dropping stale authentication\n", host_id.c_str());
    tokens.invalidate_if_matches(host_id, stale.cache_value);
}

void AuthenticationProvider::invalidate(const std::string &host_id) {
    tokens.invalidate(host_id);
}

std::variant<http_response_t, upload_error_t> AuthenticationProvider::perform_login_request(const host_descriptor_t &host, const http_request_t &request) {
    std::optional<upload_error_t> error;
    http_response_t response;
    const auto result = backoffxx::attempt(backoffxx::make_exponential(std::chrono::seconds(settings.login_retry_delay_seconds), settings.login_retries, std::chrono::seconds(settings.login_retry_max_delay_seconds)), [&] {
        const auto performed = http.perform(request);
        if (std::holds_alternative<http_transport_error_t>(performed)) {
            const auto &transport = std::get<http_transport_error_t>(performed);
            fprintf(stderr, "[auth:%s] Login request failed: %s\n", host.id.c_str(), transport.message.c_str());
            error = make_error(transport.timed_out ? error_kind_t::timeout : error_kind_t::network, "login request failed: " + transport.message);
            return backoffxx::attempt_rc::failure;
        }
        response = std::get<http_response_t>(performed);
        // throttling or server trouble - make retry
        if (response.status == 429 || response.status >= 500) {
            fprintf(stderr, "[auth:%s] Login request returned HTTP %ld\n", host.id.c_str(), response.status);
            error = make_http_error(response.status, "login request failed", response.body);
            return backoffxx::attempt_rc::failure;
        }
        error.reset();
        return backoffxx::attempt_rc::success;
    });

    if (!result.ok()) {
        auto ret = error.value_or(make_error(error_kind_t::network, "login request failed: retry limit reached"));
        ret.host_id = host.id;
        return ret;
    }
    return response;
}

static std::map<std::string, std::string> credential_values(const credential_t &credential) {
    return {
        {"username", credential.username},
        {"password", credential.password}
    };
}

token_result_t AuthenticationProvider::token_login(const host_descriptor_t &host, const token_login_auth_t &scheme, const credential_t &credential) {
    fprintf(stdout, "[auth:%s] Logging in\n", host.id.c_str());
    const auto values = credential_values(credential);

    std::vector<std::pair<std::string, std::string>> fields;
    for (const auto &f : scheme.login_fields) {
        fields.emplace_back(f.first, expand_template(f.second, values));
    }

    http_request_t request;
    request.method = scheme.login_method;
    request.url = expand_template(scheme.login_url, url_encode_values(values));
    if (scheme.login_method == "GET") {
        request.url = append_query(request.url, fields);
    } else {
        request.form = fields;
    }

    const auto performed = perform_login_request(host, request);
    if (std::holds_alternative<upload_error_t>(performed)) {
        return std::get<upload_error_t>(performed);
    }
    const auto &response = std::get<http_response_t>(performed);
    if (response.status < 200 || response.status >= 300) {
        fprintf(stderr, "[auth:%s] Login rejected with HTTP %ld\n", host.id.c_str(), response.status);
        return auth_error(host, "login rejected", response.status, response.body);
    }

    const auto data = nlohmann::json::parse(response.body, nullptr, false);
    if (data.is_discarded()) {
        return auth_error(host, "login response is not JSON", response.status, response.body);
    }
    const auto api_error = json_api_status_error(data);
    if (api_error.has_value()) {
        fprintf(stderr, "[auth:%s] Login rejected: %s\n", host.id.c_str(), api_error.value().c_str());
        return auth_error(host, "login rejected: " + api_error.value(), response.status, response.body);
    }
    const auto token = extract_json_string(data, scheme.token_path);
    if (!token.has_value()) {
        return auth_error(host, "no token at " + json_path_to_string(scheme.token_path) + " in login response", response.status, response.body);
    }

    cached_token_t ret;
    ret.host_id = host.id;
    ret.value = token.value();
    ret.issued_at = tokens.now();
    ret.ttl = host.token_ttl;
    const auto ttl = extract_json_integer(data, scheme.ttl_path);
    if (ttl.has_value() && ttl.value() >= 0) {
        ret.ttl = ttl.value();
    }
    fprintf(stdout, "[auth:%s] Logged in, token valid for %lld seconds\n", host.id.c_str(), static_cast<long long>(ret.ttl));
    return ret;
}

static void merge_cookies(std::map<std::string, std::string> &jar, const std::map<std::string, std::string> &cookies) {
    for (const auto &c : cookies) {
        jar[c.first] = c.second;
    }
}

token_result_t AuthenticationProvider::session_login(const host_descriptor_t &host, const session_login_auth_t &scheme, const credential_t &credential) {
    fprintf(stdout, "[auth:%s] Opening login page\n", host.id.c_str());
    std::map<std::string, std::string> jar;

    http_request_t page_request;
    page_request.url = scheme.login_url;
    auto performed = perform_login_request(host, page_request);
    if (std::holds_alternative<upload_error_t>(performed)) {
        return std::get<upload_error_t>(performed);
    }
    const auto page = std::get<http_response_t>(performed);
    if (page.status < 200 || page.status >= 300) {
        return auth_error(host, "login page is not available", page.status, page.body);
    }
    merge_cookies(jar, page.cookies);

    const auto hidden = extract_hidden_fields(page.body);
    auto form = hidden;
    if (!scheme.captcha_regex.empty()) {
        std::smatch match;
        const std::regex captcha_regex(scheme.captcha_regex, std::regex::icase);
        if (!std::regex_search(page.body, match, captcha_regex)) {
            return auth_error(host, "captcha not found on login page");
        }
        const auto area = match.size() > 1 && match[1].matched ? match[1].str() : match[0].str();
        const auto code = solve_positional_captcha(area, scheme.captcha_transform);
        if (!code.has_value()) {
            return auth_error(host, "captcha could not be solved");
        }
        form[scheme.captcha_field] = code.value();
    }
    const auto values = credential_values(credential);
    for (const auto &f : scheme.login_fields) {
        form[f.first] = expand_template(f.second, values);
    }

    http_request_t login_request;
    login_request.method = "POST";
    login_request.url = scheme.login_url;
    login_request.cookies = jar;
    login_request.follow_redirects = false;
    for (const auto &f : form) {
        login_request.form.emplace_back(f.first, f.second);
    }
    performed = perform_login_request(host, login_request);
    if (std::holds_alternative<upload_error_t>(performed)) {
        return std::get<upload_error_t>(performed);
    }
    const auto login = std::get<http_response_t>(performed);
    if (login.status != 200 && login.status != 302 && login.status != 303) {
        fprintf(stderr, "[auth:%s] Login rejected with HTTP %ld\n", host.id.c_str(), login.status);
        return auth_error(host, "login rejected", login.status, login.body);
    }
    merge_cookies(jar, login.cookies);

    std::string session_id;
    if (!scheme.session_cookie_name.empty()) {
        const auto it = jar.find(scheme.session_cookie_name);
        if (it == jar.end() || it->second.empty()) {
            return auth_error(host, "no \"" + scheme.session_cookie_name + "\" cookie after login", login.status, login.body);
        }
        session_id = it->second;
    }
    if (!scheme.session_id_regex.empty()) {
        http_request_t upload_page_request;
        upload_page_request.url = scheme.upload_page_url;
        upload_page_request.cookies = jar;
        performed = perform_login_request(host, upload_page_request);
        if (std::holds_alternative<upload_error_t>(performed)) {
            return std::get<upload_error_t>(performed);
        }
        const auto upload_page = std::get<http_response_t>(performed);
        if (upload_page.status < 200 || upload_page.status >= 300) {
            return auth_error(host, "upload page is not available", upload_page.status, upload_page.body);
        }
        merge_cookies(jar, upload_page.cookies);
        std::smatch match;
        const std::regex session_regex(scheme.session_id_regex);
        if (!std::regex_search(upload_page.body, match, session_regex) || match.size() < 2 || match[1].str().empty()) {
            return auth_error(host, "session id not found on upload page", upload_page.status, upload_page.body);
        }
        session_id = match[1].str();
    }

    nlohmann::json bundle;
    bundle["cookies"] = jar;
    bundle["session_id"] = session_id;

    cached_token_t ret;
    ret.host_id = host.id;
    ret.value = bundle.dump();
    ret.issued_at = tokens.now();
    ret.ttl = host.token_ttl;
    // csrf and other hidden values of the login form
    ret.extra = hidden;
    fprintf(stdout, "[auth:%s] Session established\n", host.id.c_str());
    return ret;
}
