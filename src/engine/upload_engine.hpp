#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "../auth/auth_provider.hpp"
#include "../bandwidth/bandwidth_counter.hpp"
#include "../config/engine_config.hpp"
#include "../governor/connection_governor.hpp"
#include "../hosts/host_registry.hpp"
#include "../http/http_client.hpp"
#include "../protocol/upload_protocol.hpp"
#include "../token_store/token_store.hpp"
#include "./gallery_report.hpp"
#include "./task_queue.hpp"

struct gallery_upload_request_t {
    std::vector<std::filesystem::path> files;
    // every enabled host of the configuration when empty
    std::vector<std::string> enabled_hosts;
    // local file names uploaded by an earlier run
    std::set<std::string> already_uploaded;
    // host id -> container created by an earlier run
    std::map<std::string, std::string> existing_gallery_ids;
    // local file name -> size found by the caller's pre-scan
    std::map<std::string, image_dimensions_t> dimensions;
};

// Callbacks run on upload worker threads (progress) or on the thread that
// called start_gallery_upload (everything else).
struct upload_callbacks_t {
    std::function<void(const std::string &file_name, const std::string &host_id, std::uint64_t bytes, std::uint64_t total)> on_progress;
    std::function<void(const upload_result_t &result)> on_file_complete;
    std::function<void(unsigned int completed, unsigned int total, unsigned int percent, const std::string &file_name)> on_gallery_progress;
};

struct EngineTaskEventTerminate {};

struct EngineTaskEventRun {
    size_t task_index;
};

typedef std::variant<EngineTaskEventTerminate, EngineTaskEventRun> EngineTaskEvent;

struct EngineTaskOutcome {
    size_t task_index;
    protocol_result_t result;
};

// authentication settings taken from the engine configuration
auth_settings_t make_auth_settings(const engine_config_t &config);

class UploadEngine {
  public:
    UploadEngine(
        const engine_config_t &config_,
        const HostRegistry &registry_,
        TokenStore &tokens_,
        HttpClient &http_,
        poll_sleep_t sleep_ = sleep_unless_cancelled
    );

    // Blocks until every file is uploaded, failed or cancelled. A failure to
    // create the destination container aborts the whole gallery.
    gallery_upload_report_t start_gallery_upload(const gallery_upload_request_t &request, const upload_callbacks_t &callbacks, const std::atomic<bool> &cancel);

    BandwidthCounter &get_bandwidth();

  private:
    struct upload_task_t {
        std::filesystem::path file_path;
        std::string file_name;
        std::string upload_name;
        std::uint64_t file_size = 0;
        std::string host_id;
        bool create_gallery = false;
        std::optional<std::string> gallery_id;
        // attempts made so far, reactive refresh included
        unsigned int attempt = 0;
        bool refresh_used = false;
        std::chrono::steady_clock::time_point started;
    };

    struct gallery_run_t {
        const upload_callbacks_t &callbacks;
        const std::atomic<bool> &cancel;
        std::vector<upload_task_t> tasks;
        gallery_upload_report_t report;
        unsigned int progress_total = 0;
        unsigned int progress_completed = 0;
    };

    // runs the tasks with retry passes until each one has a terminal result
    void run_tasks(gallery_run_t &run, const std::vector<size_t> &indices);

    // one pass over the pool, calls on_outcome on this thread for every task
    void run_pass(gallery_run_t &run, const std::vector<size_t> &indices, const std::function<void(size_t, const protocol_result_t &)> &on_outcome);

    // one task on a worker thread: slots, authentication, protocol and
    // the single reactive refresh
    protocol_result_t execute_task(upload_task_t &task, const upload_callbacks_t &callbacks, const std::atomic<bool> &cancel, unsigned int worker);

    void finish_task(gallery_run_t &run, size_t index, const protocol_result_t &result, bool retries_exhausted);

    // empty credential for hosts without configuration
    const credential_t &credential_for(const std::string &host_id) const;

    engine_config_t config;
    const HostRegistry &registry;
    std::map<std::string, credential_t> credentials;

    AuthenticationProvider auth;
    UploadProtocol protocol;
    ConnectionGovernor governor;
    BandwidthCounter bandwidth;
    poll_sleep_t sleep;
};
