#include <chrono>
#include <cstdio>
#include <memory>
#include <mutex>

#include <curl/curl.h>

#include "./curl.hpp"

struct curl_progress_context_t {
    const http_progress_t *on_progress;
    std::chrono::steady_clock::time_point last_call;
    curl_off_t last_reported;
};

static size_t write_buffer_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto& mem = *static_cast<std::string*>(userp);
    mem.append(static_cast<char*>(contents), realsize);
    return realsize;
}

static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    size_t realsize = size * nitems;
    auto& jar = *static_cast<std::map<std::string, std::string>*>(userp);
    parse_set_cookie(std::string(buffer, realsize), jar);
    return realsize;
}

static int xferinfo_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t ultotal, curl_off_t ulnow) {
    auto& ctx = *static_cast<curl_progress_context_t*>(clientp);
    const auto now = std::chrono::steady_clock::now();
    const auto finished = ultotal > 0 && ulnow == ultotal && ulnow != ctx.last_reported;
    if (!finished && now - ctx.last_call < std::chrono::milliseconds(CURL_PROGRESS_INTERVAL_MS)) {
        return 0;
    }
    ctx.last_call = now;
    ctx.last_reported = ulnow;
    const auto keep_going = (*ctx.on_progress)(static_cast<std::uint64_t>(ulnow), static_cast<std::uint64_t>(ultotal));
    return keep_going ? 0 : 1;
}

static std::once_flag curl_init_flag;

CurlHttpClient::CurlHttpClient() {
    std::call_once(curl_init_flag, [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

http_result_t CurlHttpClient::perform(const http_request_t &request) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        return http_transport_error_t { "Cannot start Curl" };
    }

    http_response_t response;
    std::string url = request.url;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &write_buffer_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.cookies);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, CURL_USER_AGENT);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, request.timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (request.low_speed_time_seconds > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, static_cast<long>(CURL_LOW_SPEED_LIMIT_BYTES));
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, request.low_speed_time_seconds);
    }

    struct curl_slist *headers = nullptr;
    for (const auto &h : request.headers) {
        headers = curl_slist_append(headers, h.c_str());
    }
    std::unique_ptr<struct curl_slist, decltype(&curl_slist_free_all)> headers_guard(headers, curl_slist_free_all);

    const auto cookie_str = cookie_header_value(request.cookies);
    if (!cookie_str.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_COOKIE, cookie_str.c_str());
    }

    std::unique_ptr<curl_mime, decltype(&curl_mime_free)> mime(nullptr, curl_mime_free);
    std::unique_ptr<FILE, decltype(&fclose)> upload_file(nullptr, fclose);
    std::string form_body;

    if (request.file.has_value() && request.put_file) {
        const auto &part = request.file.value();
        upload_file.reset(fopen(part.path.string().c_str(), "rb"));
        if (!upload_file) {
            return http_transport_error_t { "Cannot open file " + part.path.string() };
        }
        std::error_code ec;
        const auto file_size = std::filesystem::file_size(part.path, ec);
        if (ec) {
            return http_transport_error_t { ec.message() };
        }
        curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_READDATA, upload_file.get());
        curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(file_size));
    } else if (request.file.has_value()) {
        const auto &part = request.file.value();
        mime.reset(curl_mime_init(curl.get()));
        auto file_part = curl_mime_addpart(mime.get());
        curl_mime_name(file_part, part.field.c_str());
        if (curl_mime_filedata(file_part, part.path.string().c_str()) != CURLE_OK) {
            return http_transport_error_t { "Cannot read file " + part.path.string() };
        }
        curl_mime_filename(file_part, part.file_name.c_str());
        for (const auto &f : request.form) {
            auto field = curl_mime_addpart(mime.get());
            curl_mime_name(field, f.first.c_str());
            curl_mime_data(field, f.second.c_str(), CURL_ZERO_TERMINATED);
        }
        curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    } else if (!request.form.empty()) {
        form_body = encode_form(request.form);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, form_body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(form_body.size()));
    } else if (!request.body.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }
    if (request.method != "GET" && request.method != "POST" && !request.put_file) {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    } else if (request.method == "GET" && request.form.empty() && !request.file.has_value()) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    }
    if (headers != nullptr) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
    }

    curl_progress_context_t progress_ctx { &request.on_progress, std::chrono::steady_clock::now(), -1 };
    if (request.on_progress) {
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &xferinfo_callback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &progress_ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    const auto res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        http_transport_error_t error { std::string("Curl error: ") + curl_easy_strerror(res) };
        error.aborted = res == CURLE_ABORTED_BY_CALLBACK;
        error.timed_out = res == CURLE_OPERATION_TIMEDOUT;
        return error;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    char *effective_url = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective_url);
    if (effective_url != nullptr) {
        response.effective_url = effective_url;
    }
    return response;
}
