#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>

#include "../auth/auth_provider.hpp"
#include "../bandwidth/bandwidth_counter.hpp"
#include "../errors/upload_error.hpp"
#include "../hosts/host_descriptor.hpp"
#include "../http/http_client.hpp"
#include "../task/task_state.hpp"

struct upload_request_t {
    std::filesystem::path file_path;
    // name sent to the host
    std::string file_name;
    std::uint64_t file_size = 0;
    // destination container that already exists on the host
    std::optional<std::string> gallery_id;
    // this upload creates the container
    bool create_gallery = false;
};

struct upload_success_t {
    std::string download_url;
    std::string host_file_id;
    std::uint64_t bytes_uploaded = 0;
    // host already had the file, nothing was transferred
    bool deduplicated = false;
    std::optional<std::string> gallery_id;
};

typedef std::variant<upload_success_t, upload_error_t> protocol_result_t;

typedef std::function<void(task_state_t)> state_callback_t;

// sleeps for the given time unless cancel is raised, returns false if cancelled
typedef std::function<bool(std::chrono::milliseconds, const std::atomic<bool> &)> poll_sleep_t;

bool sleep_unless_cancelled(std::chrono::milliseconds duration, const std::atomic<bool> &cancel);

// Runs the network calls of one upload attempt of one file to one host.
// The shape of the exchange comes from the host descriptor.
class UploadProtocol {
  public:
    UploadProtocol(HttpClient &http_, poll_sleep_t sleep_ = sleep_unless_cancelled);

    protocol_result_t run(
        const host_descriptor_t &host,
        const auth_context_t &auth,
        const upload_request_t &request,
        TransferProgress &progress,
        const std::atomic<bool> &cancel,
        const state_callback_t &on_state
    );

  private:
    struct init_result_t {
        std::string upload_url;
        std::string upload_id;
        std::string file_field;
        form_fields_t form_data;
        std::optional<upload_success_t> deduplicated;
    };

    protocol_result_t run_single_step(const host_descriptor_t &host, const auth_context_t &auth, const upload_request_t &request, TransferProgress &progress, const std::atomic<bool> &cancel, const state_callback_t &on_state);
    protocol_result_t run_multi_step(const host_descriptor_t &host, const multi_step_t &steps, const auth_context_t &auth, const upload_request_t &request, TransferProgress &progress, const std::atomic<bool> &cancel, const state_callback_t &on_state);
    protocol_result_t run_multi_step_polling(const host_descriptor_t &host, const multi_step_polling_t &shape, const auth_context_t &auth, const upload_request_t &request, TransferProgress &progress, const std::atomic<bool> &cancel, const state_callback_t &on_state);

    std::variant<init_result_t, upload_error_t> init(const host_descriptor_t &host, const multi_step_t &steps, const auth_context_t &auth, const upload_request_t &request, std::map<std::string, std::string> &values, const std::atomic<bool> &cancel);

    // sends the file, returns the host response to the transfer request
    std::variant<http_response_t, upload_error_t> transfer(const host_descriptor_t &host, const auth_context_t &auth, const upload_request_t &request, const std::string &url, const std::string &file_field, const form_fields_t &fields, TransferProgress &progress, const std::atomic<bool> &cancel);

    protocol_result_t poll(const host_descriptor_t &host, const multi_step_polling_t &shape, const auth_context_t &auth, const upload_request_t &request, const std::map<std::string, std::string> &values, const std::atomic<bool> &cancel);

    // every request goes through here, so cancellation stops any further call
    std::variant<http_response_t, upload_error_t> send(const host_descriptor_t &host, http_request_t request, const auth_context_t &auth, const std::atomic<bool> &cancel);

    HttpClient &http;
    poll_sleep_t sleep;
};

// applies the host response rules to a successful upload response
protocol_result_t parse_upload_response(const host_descriptor_t &host, const upload_request_t &request, const http_response_t &response);
