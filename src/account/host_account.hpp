#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "../auth/auth_provider.hpp"
#include "../errors/upload_error.hpp"
#include "../hosts/host_registry.hpp"
#include "../http/http_client.hpp"

// a rejected authentication is retried once with a new login
#define ACCOUNT_AUTH_ATTEMPTS 2

// fields the host does not report stay empty
struct account_info_t {
    // bytes
    std::optional<std::int64_t> storage_total;
    std::optional<std::int64_t> storage_used;
    std::optional<std::int64_t> storage_left;
    std::optional<bool> premium;
};

typedef std::variant<account_info_t, upload_error_t> account_result_t;

struct credential_check_t {
    bool success = false;
    std::string message;
    std::optional<account_info_t> info;
};

// Account level calls outside of uploads: quota lookup, credential check
// and removal of uploaded files.
class HostAccount {
  public:
    HostAccount(const HostRegistry &registry_, AuthenticationProvider &auth_, HttpClient &http_);

    // validation error if the host has no user info endpoint
    account_result_t get_user_info(const std::string &host_id, const credential_t &credential);

    // never throws for host failures, the outcome is in the result
    credential_check_t test_credentials(const std::string &host_id, const credential_t &credential);

    // file_id is the id the host returned for the upload
    std::optional<upload_error_t> delete_file(const std::string &host_id, const credential_t &credential, const std::string &file_id);

  private:
    account_result_t fetch_user_info(const host_descriptor_t &host, const user_info_endpoint_t &endpoint, const auth_context_t &ctx);
    std::optional<upload_error_t> send_delete(const host_descriptor_t &host, const delete_endpoint_t &endpoint, const auth_context_t &ctx, const std::string &file_id);

    std::variant<http_response_t, upload_error_t> perform(const host_descriptor_t &host, const auth_context_t &ctx, http_request_t request);

    // authentication error when the response shows rejected credentials
    std::optional<upload_error_t> rejected_auth(const host_descriptor_t &host, const http_response_t &response);

    const HostRegistry &registry;
    AuthenticationProvider &auth;
    HttpClient &http;
};

// scheme://host[:port] of an URL, lower case
std::string url_origin(const std::string &url);
