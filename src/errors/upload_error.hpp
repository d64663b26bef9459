#pragma once

#include <string>

enum class error_kind_t {
    validation = 0,
    authentication = 1,
    network = 2,
    server = 3,
    client = 4,
    timeout = 5,
    cancelled = 6
};

// response bodies are kept only for stale auth detection and messages
#define ERROR_BODY_MAX_LENGTH 512

struct upload_error_t {
    error_kind_t kind;
    std::string message;
    std::string host_id;
    std::string file_name;
    // 0 if the error did not come from an HTTP response
    long http_status = 0;
    unsigned int attempt = 0;
    std::string response_body;
};

upload_error_t make_error(error_kind_t kind, const std::string &message);

upload_error_t make_http_error(long http_status, const std::string &message, const std::string &body);

// maps an HTTP status of a failed response to the error taxonomy
error_kind_t classify_http_status(long http_status);

const char *error_kind_name(error_kind_t kind);

// one line message with host, file, status and attempt context
std::string describe_error(const upload_error_t &error);
