#pragma once

#include <string>

#include "../http/http_client.hpp"

// progress callbacks are forwarded at most this often, plus once on completion
#define CURL_PROGRESS_INTERVAL_MS 100
#define CURL_LOW_SPEED_LIMIT_BYTES 1024

#define CURL_USER_AGENT "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36"

// libcurl implementation of the HTTP seam. One easy handle per request,
// so a single instance can be shared by all upload workers.
class CurlHttpClient : public HttpClient {
  public:
    CurlHttpClient();

    http_result_t perform(const http_request_t &request) override;
};
