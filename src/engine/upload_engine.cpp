#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <thread>

#include "../path/path_utils.hpp"
#include "../retry/retry_policy.hpp"
#include "./upload_engine.hpp"

auth_settings_t make_auth_settings(const engine_config_t &config) {
    auth_settings_t settings;
    settings.safety_margin_seconds = config.token_safety_margin;
    settings.login_retries = config.login_retries;
    settings.login_retry_delay_seconds = config.login_retry_delay;
    settings.login_retry_max_delay_seconds = config.login_retry_max_delay;
    return settings;
}

UploadEngine::UploadEngine(
    const engine_config_t &config_,
    const HostRegistry &registry_,
    TokenStore &tokens_,
    HttpClient &http_,
    poll_sleep_t sleep_
) :
    config {config_},
    registry {registry_},
    auth {registry_, tokens_, http_, make_auth_settings(config_)},
    protocol {http_, sleep_},
    governor {config_.global_connections},
    sleep {sleep_} {
    for (const auto &host : registry.list()) {
        auto limit = host.max_connections_per_host;
        const auto it = config.hosts.find(host.id);
        if (it != config.hosts.end()) {
            credentials[host.id] = credential_t::from_string(it->second.credential);
            if (it->second.max_connections.has_value()) {
                limit = it->second.max_connections.value();
            }
        }
        governor.set_host_limit(host.id, limit);
    }
}

BandwidthCounter &UploadEngine::get_bandwidth() {
    return bandwidth;
}

const credential_t &UploadEngine::credential_for(const std::string &host_id) const {
    static const credential_t missing;
    const auto it = credentials.find(host_id);
    return it == credentials.end() ? missing : it->second;
}

static upload_error_t task_error(error_kind_t kind, const std::string &message, const std::string &host_id, const std::string &file_name) {
    auto error = make_error(kind, message);
    error.host_id = host_id;
    error.file_name = file_name;
    return error;
}

protocol_result_t UploadEngine::execute_task(upload_task_t &task, const upload_callbacks_t &callbacks, const std::atomic<bool> &cancel, unsigned int worker) {
    if (task.attempt == 0) {
        task.started = std::chrono::steady_clock::now();
    }
    // queued tasks are dropped without any network call once cancel is seen
    if (cancel.load()) {
        return task_error(error_kind_t::cancelled, "upload cancelled", task.host_id, task.file_name);
    }
    const auto host = registry.get(task.host_id);
    if (!host.has_value()) {
        return task_error(error_kind_t::validation, "unknown host", task.host_id, task.file_name);
    }

    const auto slot = governor.acquire(task.host_id, cancel);
    if (!slot) {
        return task_error(error_kind_t::cancelled, "upload cancelled", task.host_id, task.file_name);
    }

    while (true) {
        task.attempt++;
        fprintf(stdout, "[Task %u] Uploading %s to %s (attempt %u)\n", worker + 1, task.file_name.c_str(), task.host_id.c_str(), task.attempt);

        TaskStateTrack state;
        const auto on_state = [&](task_state_t next) {
            if (!state.advance(next)) {
                fprintf(stderr, "[Task %u] Ignoring state change %s -> %s\n", worker + 1, task_state_name(state.get()), task_state_name(next));
            }
        };
        // each attempt counts its bytes from zero
        TransferProgress progress(bandwidth, [&](std::uint64_t bytes, std::uint64_t total) {
            if (callbacks.on_progress) {
                callbacks.on_progress(task.file_name, task.host_id, bytes, total);
            }
        });

        on_state(task_state_t::authenticating);
        if (cancel.load()) {
            on_state(task_state_t::cancelled);
            return task_error(error_kind_t::cancelled, "upload cancelled", task.host_id, task.file_name);
        }
        if (host->max_file_size != 0 && task.file_size > host->max_file_size) {
            on_state(task_state_t::failed);
            return task_error(error_kind_t::validation, "file is larger than the host limit of " + std::to_string(host->max_file_size) + " bytes", task.host_id, task.file_name);
        }

        protocol_result_t result;
        auth_context_t context;
        const auto authenticated = auth.ensure_authenticated(task.host_id, credential_for(task.host_id));
        if (std::holds_alternative<upload_error_t>(authenticated)) {
            result = std::get<upload_error_t>(authenticated);
        } else {
            context = std::get<auth_context_t>(authenticated);
            upload_request_t request;
            request.file_path = task.file_path;
            request.file_name = task.upload_name;
            request.file_size = task.file_size;
            request.gallery_id = task.gallery_id;
            request.create_gallery = task.create_gallery;
            result = protocol.run(host.value(), context, request, progress, cancel, on_state);
        }

        if (std::holds_alternative<upload_success_t>(result)) {
            on_state(task_state_t::completed);
            fprintf(stdout, "[Task %u] Uploaded %s to %s\n", worker + 1, task.file_name.c_str(), task.host_id.c_str());
            return result;
        }

        auto error = std::get<upload_error_t>(result);
        error.host_id = task.host_id;
        error.file_name = task.file_name;
        error.attempt = task.attempt;
        if (error.kind == error_kind_t::cancelled || cancel.load()) {
            on_state(task_state_t::cancelled);
            error.kind = error_kind_t::cancelled;
            return error;
        }

        const bool stale = error.kind == error_kind_t::authentication || auth.looks_like_stale_auth(task.host_id, error.response_body, error.http_status);
        if (stale) {
            error.kind = error_kind_t::authentication;
        }
        if (stale && !task.refresh_used) {
            task.refresh_used = true;
            fprintf(stderr, "[Task %u] Authentication for %s looks stale, logging in again: %s\n", worker + 1, task.host_id.c_str(), error.message.c_str());
            auth.invalidate(task.host_id, context);
            continue;
        }
        fprintf(stderr, "[Task %u] %s\n", worker + 1, describe_error(error).c_str());
        return error;
    }
}

static void upload_worker(
    TaskQueue<EngineTaskEvent> &message_queue,
    TaskQueue<EngineTaskOutcome> &outcome_queue,
    const std::function<protocol_result_t(size_t, unsigned int)> &execute,
    unsigned int worker
) {
    while (true) {
        const auto event = message_queue.pop_front_waiting();
        if (std::holds_alternative<EngineTaskEventTerminate>(event)) {
            break;
        }
        const auto index = std::get<EngineTaskEventRun>(event).task_index;
        outcome_queue.push_back(EngineTaskOutcome { index, execute(index, worker) });
    }
}

void UploadEngine::run_pass(gallery_run_t &run, const std::vector<size_t> &indices, const std::function<void(size_t, const protocol_result_t &)> &on_outcome) {
    TaskQueue<EngineTaskEvent> message_queue;
    TaskQueue<EngineTaskOutcome> outcome_queue;
    const auto execute = [&](size_t index, unsigned int worker) -> protocol_result_t {
        auto &task = run.tasks[index];
        try {
            return execute_task(task, run.callbacks, run.cancel, worker);
        } catch (const std::exception &e) {
            // token store or callback failures fail the task, not the worker
            fprintf(stderr, "[Task %u] Upload task failed: %s\n", worker + 1, e.what());
            return task_error(error_kind_t::client, e.what(), task.host_id, task.file_name);
        }
    };

    const auto thread_count = std::min<size_t>(std::max(config.parallelism, 1u), indices.size());
    std::vector<std::thread> workers;
    for (unsigned int i = 0; i < thread_count; i++) {
        // use lambda to MSVC workaround
        std::thread worker([&, i]() {
            upload_worker(message_queue, outcome_queue, execute, i);
        });
        workers.push_back(std::move(worker));
    }
    for (const auto index : indices) {
        message_queue.push_back(EngineTaskEventRun { index });
    }
    message_queue.push_back_copies(EngineTaskEventTerminate {}, workers.size());
    for (size_t i = 0; i < indices.size(); i++) {
        const auto outcome = outcome_queue.pop_front_waiting();
        on_outcome(outcome.task_index, outcome.result);
    }
    for (auto &w : workers) {
        w.join();
    }
}

void UploadEngine::finish_task(gallery_run_t &run, size_t index, const protocol_result_t &result, bool retries_exhausted) {
    const auto &task = run.tasks[index];
    upload_result_t ret;
    ret.file_name = task.file_name;
    ret.host_id = task.host_id;
    ret.attempts = task.attempt;
    if (task.attempt > 0) {
        ret.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - task.started).count();
    }
    if (std::holds_alternative<upload_success_t>(result)) {
        const auto &success = std::get<upload_success_t>(result);
        ret.state = task_state_t::completed;
        ret.download_url = success.download_url;
        ret.host_file_id = success.host_file_id;
        ret.bytes_uploaded = success.bytes_uploaded;
        ret.deduplicated = success.deduplicated;
        if (success.gallery_id.has_value()) {
            run.report.hosts[task.host_id].gallery_id = success.gallery_id;
        }
    } else {
        const auto &error = std::get<upload_error_t>(result);
        ret.state = error.kind == error_kind_t::cancelled ? task_state_t::cancelled : task_state_t::failed;
        ret.error = error;
        ret.retries_exhausted = retries_exhausted;
    }
    report_add_result(run.report, ret);

    if (run.callbacks.on_file_complete) {
        run.callbacks.on_file_complete(ret);
    }
    run.progress_completed++;
    if (run.callbacks.on_gallery_progress && run.progress_total > 0) {
        const auto percent = run.progress_completed * 100 / run.progress_total;
        run.callbacks.on_gallery_progress(run.progress_completed, run.progress_total, percent, task.file_name);
    }
}

void UploadEngine::run_tasks(gallery_run_t &run, const std::vector<size_t> &indices) {
    std::vector<size_t> pending = indices;
    unsigned int pass = 1;
    bool backoff = false;
    while (!pending.empty()) {
        if (pass > 1) {
            if (run.cancel.load()) {
                for (const auto index : pending) {
                    const auto &task = run.tasks[index];
                    finish_task(run, index, task_error(error_kind_t::cancelled, "upload cancelled", task.host_id, task.file_name), false);
                }
                return;
            }
            const auto delay = backoff
                ? retry_backoff_delay(pass - 1, std::chrono::seconds(config.backoff_initial), std::chrono::seconds(config.backoff_max))
                : std::chrono::milliseconds(0);
            fprintf(stdout, "[engine] Retry pass %u for %zu uploads\n", pass - 1, pending.size());
            // a cancel during the wait is picked up by the workers
            sleep(delay, run.cancel);
        }

        std::vector<size_t> retry;
        backoff = false;
        run_pass(run, pending, [&](size_t index, const protocol_result_t &result) {
            if (std::holds_alternative<upload_success_t>(result)) {
                finish_task(run, index, result, false);
                return;
            }
            auto &task = run.tasks[index];
            const auto &error = std::get<upload_error_t>(result);
            const auto decision = retry_decide(error, pass, config.max_retries, task.refresh_used);
            if (decision == retry_decision_t::fail) {
                const bool retryable = error.kind == error_kind_t::network || error.kind == error_kind_t::server || error.kind == error_kind_t::timeout;
                finish_task(run, index, result, retryable);
                return;
            }
            fprintf(stdout, "[engine] %s: %s\n", describe_error(error).c_str(), retry_decision_name(decision));
            if (decision == retry_decision_t::retry_with_refresh) {
                task.refresh_used = true;
                auth.invalidate(task.host_id);
            }
            if (decision == retry_decision_t::retry_with_backoff) {
                backoff = true;
            }
            retry.push_back(index);
        });
        pending = retry;
        pass++;
    }
}

gallery_upload_report_t UploadEngine::start_gallery_upload(const gallery_upload_request_t &request, const upload_callbacks_t &callbacks, const std::atomic<bool> &cancel) {
    const auto started = std::chrono::steady_clock::now();
    const auto bytes_before = bandwidth.total();

    gallery_run_t run { callbacks, cancel, {}, {}, 0, 0 };
    auto &report = run.report;

    auto files = request.files;
    natural_sort(files);
    report.total_files = static_cast<unsigned int>(files.size());
    report.dimensions = compute_dimension_stats(request.dimensions);

    const auto host_ids = request.enabled_hosts.empty() ? enabled_host_ids(config) : request.enabled_hosts;
    run.progress_total = report.total_files * static_cast<unsigned int>(host_ids.size());

    std::vector<std::filesystem::path> pending_files;
    for (const auto &f : files) {
        if (request.already_uploaded.count(f.filename().string()) != 0) {
            report.skipped++;
            continue;
        }
        pending_files.push_back(f);
    }
    run.progress_completed = report.skipped * static_cast<unsigned int>(host_ids.size());
    fprintf(stdout, "[engine] Uploading %zu of %u files to %zu hosts\n", pending_files.size(), report.total_files, host_ids.size());

    // host checks run once per gallery, not per task
    std::map<std::string, host_descriptor_t> hosts;
    for (const auto &host : registry.list_enabled(host_ids)) {
        hosts[host.id] = host;
    }
    std::map<std::string, upload_error_t> host_errors;
    for (const auto &id : host_ids) {
        report.hosts[id];
        const auto configured = config.hosts.find(id);
        std::optional<upload_error_t> invalid;
        if (hosts.count(id) == 0) {
            invalid = task_error(error_kind_t::validation, "unknown host", id, "");
        } else if (configured == config.hosts.end() || !configured->second.enabled) {
            invalid = task_error(error_kind_t::validation, "host is disabled", id, "");
        } else {
            invalid = auth.validate_credential(id, credential_for(id));
        }
        if (invalid.has_value()) {
            fprintf(stderr, "[engine] Host %s can not be used: %s\n", id.c_str(), invalid->message.c_str());
            host_errors[id] = invalid.value();
            continue;
        }
        const auto existing = request.existing_gallery_ids.find(id);
        if (existing != request.existing_gallery_ids.end()) {
            report.hosts[id].gallery_id = existing->second;
        }
    }

    std::vector<size_t> regular;
    std::map<std::string, size_t> gallery_creation;
    for (const auto &file : pending_files) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(file, ec);
        for (const auto &id : host_ids) {
            upload_task_t task;
            task.file_path = file;
            task.file_name = file.filename().string();
            task.upload_name = clean_upload_name(task.file_name, config.file_prefix);
            task.file_size = ec ? 0 : size;
            task.host_id = id;
            run.tasks.push_back(task);
            const auto index = run.tasks.size() - 1;

            const auto host_error = host_errors.find(id);
            if (host_error != host_errors.end()) {
                auto error = host_error->second;
                error.file_name = task.file_name;
                finish_task(run, index, error, false);
                continue;
            }
            if (ec) {
                finish_task(run, index, task_error(error_kind_t::validation, "can not read file: " + ec.message(), id, task.file_name), false);
                continue;
            }
            if (hosts.at(id).gallery.has_value() && !report.hosts[id].gallery_id.has_value() && gallery_creation.count(id) == 0) {
                run.tasks[index].create_gallery = true;
                gallery_creation[id] = index;
                continue;
            }
            regular.push_back(index);
        }
    }

    // the container must exist before any other file is sent to the host
    std::vector<size_t> not_started;
    for (const auto &creation : gallery_creation) {
        const auto &id = creation.first;
        if (report.aborted || cancel.load()) {
            not_started.push_back(creation.second);
            continue;
        }
        if (std::holds_alternative<session_login_auth_t>(hosts.at(id).auth)) {
            // never append to a container of an earlier session
            auth.invalidate(id);
        }
        fprintf(stdout, "[engine] Creating gallery on %s with %s\n", id.c_str(), run.tasks[creation.second].file_name.c_str());
        run_tasks(run, { creation.second });

        const auto &result = report.hosts[id].results.back();
        if (result.state == task_state_t::cancelled) {
            continue;
        }
        if (result.state != task_state_t::completed || !report.hosts[id].gallery_id.has_value()) {
            report.aborted = true;
            report.abort_reason = result.error.has_value() ? describe_error(result.error.value()) : std::string("host returned no gallery id");
            fprintf(stderr, "[engine] Gallery creation on %s failed, aborting: %s\n", id.c_str(), report.abort_reason.c_str());
            continue;
        }
        fprintf(stdout, "[engine] Gallery %s created on %s\n", report.hosts[id].gallery_id.value().c_str(), id.c_str());
    }
    not_started.insert(not_started.end(), regular.begin(), regular.end());

    // every task ends up in the report, even the ones that never ran
    std::vector<size_t> to_run;
    for (const auto index : not_started) {
        auto &task = run.tasks[index];
        task.gallery_id = report.hosts[task.host_id].gallery_id;
        if (report.aborted) {
            finish_task(run, index, task_error(error_kind_t::validation, "gallery aborted: " + report.abort_reason, task.host_id, task.file_name), false);
            continue;
        }
        if (cancel.load()) {
            finish_task(run, index, task_error(error_kind_t::cancelled, "upload cancelled", task.host_id, task.file_name), false);
            continue;
        }
        to_run.push_back(index);
    }
    run_tasks(run, to_run);

    report.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    report.total_bytes = bandwidth.total() - bytes_before;
    if (report.elapsed_seconds > 0) {
        report.average_throughput = report.total_bytes / report.elapsed_seconds;
    }
    fprintf(stdout, "[engine] Gallery finished: %u uploaded, %u failed, %u skipped, %u cancelled\n", report.succeeded, report.failed, report.skipped, report.cancelled);
    return report;
}
