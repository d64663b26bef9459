#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

#include "../errors/upload_error.hpp"
#include "../hosts/host_registry.hpp"
#include "../http/http_client.hpp"
#include "../token_store/token_store.hpp"

#define AUTH_SAFETY_MARGIN_DEFAULT 60
#define AUTH_LOGIN_RETRIES_DEFAULT 3
#define AUTH_LOGIN_RETRY_DELAY_DEFAULT 2
#define AUTH_LOGIN_RETRY_MAX_DELAY_DEFAULT 30

// Resolved by the caller, never persisted here.
struct credential_t {
    std::string api_key;
    std::string username;
    std::string password;

    // "user:password" fills username and password, anything else is a key
    static credential_t from_string(const std::string &value);

    bool empty() const;
};

// Everything an upload protocol needs to talk to an authenticated host.
struct auth_context_t {
    auth_kind_t kind = auth_kind_t::none;
    // api key or login token
    std::string token;
    std::map<std::string, std::string> cookies;
    std::string session_id;
    std::map<std::string, std::string> extra;
    // raw cached value, used to invalidate exactly this token later
    std::string cache_value;
};

typedef std::variant<auth_context_t, upload_error_t> auth_result_t;

// adds the bearer header and session cookies of the context
void apply_auth(const host_descriptor_t &host, const auth_context_t &auth, http_request_t &request);

struct auth_settings_t {
    std::int64_t safety_margin_seconds = AUTH_SAFETY_MARGIN_DEFAULT;
    // transport retries of one login HTTP call
    unsigned int login_retries = AUTH_LOGIN_RETRIES_DEFAULT;
    unsigned int login_retry_delay_seconds = AUTH_LOGIN_RETRY_DELAY_DEFAULT;
    unsigned int login_retry_max_delay_seconds = AUTH_LOGIN_RETRY_MAX_DELAY_DEFAULT;
};

class AuthenticationProvider {
  public:
    AuthenticationProvider(const HostRegistry &registry_, TokenStore &tokens_, HttpClient &http_, auth_settings_t settings_ = auth_settings_t());

    // Checks the credential shape without network calls. Run once when a
    // host is enabled for an upload.
    std::optional<upload_error_t> validate_credential(const std::string &host_id, const credential_t &credential) const;

    // Returns cached authentication when it is fresh, logs in otherwise.
    // Concurrent callers for the same host share one login.
    auth_result_t ensure_authenticated(const std::string &host_id, const credential_t &credential);

    // true for 401/403 or when the body matches one of the host stale
    // authentication patterns
    bool looks_like_stale_auth(const std::string &host_id, const std::string &body, long http_status) const;

    // drops the cached token if it is still the one the context was built from
    void invalidate(const std::string &host_id, const auth_context_t &stale);

    void invalidate(const std::string &host_id);

  private:
    token_result_t token_login(const host_descriptor_t &host, const token_login_auth_t &scheme, const credential_t &credential);
    token_result_t session_login(const host_descriptor_t &host, const session_login_auth_t &scheme, const credential_t &credential);

    // performs the request, retrying transport failures and 429/5xx with backoff
    std::variant<http_response_t, upload_error_t> perform_login_request(const host_descriptor_t &host, const http_request_t &request);

    const HostRegistry &registry;
    TokenStore &tokens;
    HttpClient &http;
    auth_settings_t settings;
};
