#include "./upload_error.hpp"

upload_error_t make_error(error_kind_t kind, const std::string &message) {
    upload_error_t error;
    error.kind = kind;
    error.message = message;
    return error;
}

upload_error_t make_http_error(long http_status, const std::string &message, const std::string &body) {
    auto error = make_error(classify_http_status(http_status), message);
    error.http_status = http_status;
    error.response_body = body.substr(0, ERROR_BODY_MAX_LENGTH);
    return error;
}

error_kind_t classify_http_status(long http_status) {
    if (http_status == 401 || http_status == 403) {
        return error_kind_t::authentication;
    }
    // throttling is retried the same way as server side failures
    if (http_status == 429 || http_status >= 500) {
        return error_kind_t::server;
    }
    if (http_status >= 400) {
        return error_kind_t::client;
    }
    // unexpected 1xx/2xx/3xx status for the step
    return error_kind_t::server;
}

const char *error_kind_name(error_kind_t kind) {
    switch (kind) {
        case error_kind_t::validation:
            return "ValidationError";
        case error_kind_t::authentication:
            return "AuthenticationError";
        case error_kind_t::network:
            return "NetworkError";
        case error_kind_t::server:
            return "ServerError";
        case error_kind_t::client:
            return "ClientError";
        case error_kind_t::timeout:
            return "TimeoutError";
        case error_kind_t::cancelled:
            return "CancelledError";
    }
    return "UnknownError";
}

std::string describe_error(const upload_error_t &error) {
    std::string ret = error_kind_name(error.kind);
    if (!error.host_id.empty()) {
        ret += " [" + error.host_id + "]";
    }
    if (!error.file_name.empty()) {
        ret += " " + error.file_name;
    }
    if (error.http_status != 0) {
        ret += " (HTTP " + std::to_string(error.http_status) + ")";
    }
    if (error.attempt != 0) {
        ret += " attempt " + std::to_string(error.attempt);
    }
    ret += ": " + error.message;
    return ret;
}
