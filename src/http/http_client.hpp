#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

struct http_file_part_t {
    std::string field;
    std::filesystem::path path;
    // name sent to the host, may differ from the local file name
    std::string file_name;
};

// called with bytes sent so far and total bytes, return false to abort
typedef std::function<bool(std::uint64_t, std::uint64_t)> http_progress_t;

struct http_request_t {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;
    std::map<std::string, std::string> cookies;
    // url-encoded body, or multipart fields when file is set
    std::vector<std::pair<std::string, std::string>> form;
    std::optional<http_file_part_t> file;
    // send file as raw request body instead of multipart
    bool put_file = false;
    // raw body, used when form is empty and no file is sent
    std::string body;
    long timeout_seconds = 30;
    // abort if transfer is slower than 1KB/s for this many seconds, 0 disables
    long low_speed_time_seconds = 0;
    bool follow_redirects = true;
    http_progress_t on_progress;
};

struct http_response_t {
    long status = 0;
    std::string body;
    std::map<std::string, std::string> cookies;
    std::string effective_url;
};

struct http_transport_error_t {
    std::string message;
    // progress callback requested abort
    bool aborted = false;
    bool timed_out = false;
};

typedef std::variant<http_response_t, http_transport_error_t> http_result_t;

class HttpClient {
  public:
    virtual ~HttpClient() = default;

    virtual http_result_t perform(const http_request_t &request) = 0;
};

// percent-encoding of a single query or form value
std::string url_encode(const std::string &value);

std::string encode_form(const std::vector<std::pair<std::string, std::string>> &fields);

// appends ?a=b&c=d or &a=b to url
std::string append_query(const std::string &url, const std::vector<std::pair<std::string, std::string>> &params);

// same map with every value percent-encoded, for URL templates
std::map<std::string, std::string> url_encode_values(const std::map<std::string, std::string> &values);

// replaces every {name} placeholder found in values
std::string expand_template(std::string subject, const std::map<std::string, std::string> &values);

// parses "Set-Cookie: name=value; Path=/" header lines into the jar
void parse_set_cookie(const std::string &header_line, std::map<std::string, std::string> &jar);

std::string cookie_header_value(const std::map<std::string, std::string> &cookies);
