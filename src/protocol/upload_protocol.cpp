#include <algorithm>
#include <cstdio>
#include <regex>
#include <thread>

#include <nlohmann/json.hpp>

#include "./file_hash.hpp"
#include "./upload_protocol.hpp"

// cancel flag is looked at this often while waiting between polls
#define POLL_SLEEP_STEP_MS 50

bool sleep_unless_cancelled(std::chrono::milliseconds duration, const std::atomic<bool> &cancel) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!cancel.load()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(POLL_SLEEP_STEP_MS)));
    }
    return false;
}

UploadProtocol::UploadProtocol(HttpClient &http_, poll_sleep_t sleep_) : http {http_}, sleep {sleep_} {}

static upload_error_t protocol_error(const host_descriptor_t &host, error_kind_t kind, const std::string &message) {
    auto error = make_error(kind, message);
    error.host_id = host.id;
    return error;
}

static upload_error_t cancelled_error(const host_descriptor_t &host) {
    return protocol_error(host, error_kind_t::cancelled, "upload cancelled");
}

// API level failure inside a 2xx response
static upload_error_t api_error(const host_descriptor_t &host, const nlohmann::json &data, const std::string &details, const http_response_t &response) {
    auto kind = error_kind_t::server;
    const auto status = data.find("status");
    if (status != data.end() && status->is_number_integer() && status->get<long long>() >= 400) {
        kind = classify_http_status(static_cast<long>(status->get<long long>()));
    }
    auto error = protocol_error(host, kind, "host reported failure: " + details);
    error.http_status = response.status;
    error.response_body = response.body.substr(0, ERROR_BODY_MAX_LENGTH);
    return error;
}

static std::map<std::string, std::string> base_values(const auth_context_t &auth, const upload_request_t &request) {
    return {
        {"token", auth.token},
        {"session_id", auth.session_id},
        {"filename", request.file_name},
        {"size", std::to_string(request.file_size)}
    };
}

static form_fields_t expand_fields(const form_fields_t &fields, const std::map<std::string, std::string> &values) {
    form_fields_t ret;
    for (const auto &f : fields) {
        ret.emplace_back(f.first, expand_template(f.second, values));
    }
    return ret;
}

static void add_gallery_fields(const host_descriptor_t &host, const upload_request_t &request, const std::map<std::string, std::string> &values, form_fields_t &fields) {
    if (!host.gallery.has_value()) {
        return;
    }
    if (request.create_gallery) {
        for (const auto &f : expand_fields(host.gallery->create_fields, values)) {
            fields.push_back(f);
        }
        return;
    }
    if (request.gallery_id.has_value()) {
        fields.emplace_back(host.gallery->id_field, request.gallery_id.value());
    }
}

std::variant<http_response_t, upload_error_t> UploadProtocol::send(const host_descriptor_t &host, http_request_t request, const auth_context_t &auth, const std::atomic<bool> &cancel) {
    if (cancel.load()) {
        return cancelled_error(host);
    }
    apply_auth(host, auth, request);
    const auto performed = http.perform(request);
    if (std::holds_alternative<http_transport_error_t>(performed)) {
        const auto &transport = std::get<http_transport_error_t>(performed);
        if (transport.aborted && cancel.load()) {
            return cancelled_error(host);
        }
        if (transport.timed_out) {
            return protocol_error(host, error_kind_t::timeout, transport.message);
        }
        return protocol_error(host, error_kind_t::network, transport.message);
    }
    const auto &response = std::get<http_response_t>(performed);
    if (response.status < 200 || response.status >= 300) {
        auto error = make_http_error(response.status, request.method + " " + request.url + " failed", response.body);
        error.host_id = host.id;
        return error;
    }
    return response;
}

static std::variant<nlohmann::json, upload_error_t> parse_json_response(const host_descriptor_t &host, const http_response_t &response, const char *what) {
    auto data = nlohmann::json::parse(response.body, nullptr, false);
    if (data.is_discarded()) {
        auto error = protocol_error(host, error_kind_t::server, std::string(what) + " response is not JSON");
        error.http_status = response.status;
        error.response_body = response.body.substr(0, ERROR_BODY_MAX_LENGTH);
        return error;
    }
    const auto details = json_api_status_error(data);
    if (details.has_value()) {
        return api_error(host, data, details.value(), response);
    }
    return data;
}

protocol_result_t parse_upload_response(const host_descriptor_t &host, const upload_request_t &request, const http_response_t &response) {
    const auto &rules = host.response;
    upload_success_t ret;
    ret.bytes_uploaded = request.file_size;

    std::optional<std::string> link;
    std::optional<nlohmann::json> data;
    if (rules.type == response_type_t::json || (request.create_gallery && host.gallery.has_value())) {
        auto parsed = parse_json_response(host, response, "upload");
        if (std::holds_alternative<upload_error_t>(parsed)) {
            return std::get<upload_error_t>(parsed);
        }
        data = std::move(std::get<nlohmann::json>(parsed));
    }

    if (rules.type == response_type_t::json) {
        link = extract_json_string(data.value(), rules.link_path);
        if (!rules.file_id_path.empty()) {
            ret.host_file_id = extract_json_string(data.value(), rules.file_id_path).value_or("");
        }
    } else if (rules.type == response_type_t::text) {
        const auto begin = response.body.find_first_not_of(" \t\r\n");
        if (begin != std::string::npos) {
            const auto end = response.body.find_last_not_of(" \t\r\n");
            link = response.body.substr(begin, end - begin + 1);
        }
    } else {
        std::smatch match;
        const std::regex link_regex(rules.link_regex);
        if (std::regex_search(response.body, match, link_regex)) {
            link = match.size() > 1 && match[1].matched ? match[1].str() : match[0].str();
        }
    }

    if (!link.has_value() || link.value().empty()) {
        auto error = protocol_error(host, error_kind_t::server, "no download link in upload response");
        error.http_status = response.status;
        error.response_body = response.body.substr(0, ERROR_BODY_MAX_LENGTH);
        return error;
    }
    ret.download_url = rules.link_prefix + link.value() + rules.link_suffix;

    if (request.create_gallery && host.gallery.has_value()) {
        const auto gallery_id = extract_json_string(data.value(), host.gallery->id_path);
        if (!gallery_id.has_value()) {
            auto error = protocol_error(host, error_kind_t::server, "no gallery id in upload response");
            error.http_status = response.status;
            error.response_body = response.body.substr(0, ERROR_BODY_MAX_LENGTH);
            return error;
        }
        ret.gallery_id = gallery_id;
    } else {
        ret.gallery_id = request.gallery_id;
    }
    return ret;
}

std::variant<http_response_t, upload_error_t> UploadProtocol::transfer(const host_descriptor_t &host, const auth_context_t &auth, const upload_request_t &request, const std::string &url, const std::string &file_field, const form_fields_t &fields, TransferProgress &progress, const std::atomic<bool> &cancel) {
    http_request_t r;
    r.method = host.upload_method;
    r.url = url;
    r.form = fields;
    r.file = http_file_part_t { file_field, request.file_path, request.file_name };
    r.put_file = host.upload_method == "PUT";
    r.timeout_seconds = host.upload_timeout;
    r.low_speed_time_seconds = host.inactivity_timeout;
    // transport totals include multipart overhead, the sink gets file bytes
    const auto file_size = request.file_size;
    r.on_progress = [&progress, &cancel, file_size](std::uint64_t sent, std::uint64_t) {
        if (cancel.load()) {
            return false;
        }
        progress.report(std::min(sent, file_size), file_size);
        return !cancel.load();
    };
    const auto result = send(host, r, auth, cancel);
    if (std::holds_alternative<http_response_t>(result)) {
        // the last progress event may be skipped by the transport
        progress.report(request.file_size, request.file_size);
    }
    return result;
}

std::variant<UploadProtocol::init_result_t, upload_error_t> UploadProtocol::init(const host_descriptor_t &host, const multi_step_t &steps, const auth_context_t &auth, const upload_request_t &request, std::map<std::string, std::string> &values, const std::atomic<bool> &cancel) {
    const bool needs_hash = steps.require_hash || std::find(steps.init_params.begin(), steps.init_params.end(), "hash") != steps.init_params.end();
    if (needs_hash) {
        const auto hash = file_md5(request.file_path);
        if (!hash.has_value()) {
            return protocol_error(host, error_kind_t::validation, "can not read \"" + request.file_path.string() + "\"");
        }
        values["hash"] = hash.value();
    }

    const std::map<std::string, std::string> param_values = {
        {"token", values["token"]},
        {"name", values["filename"]},
        {"size", values["size"]},
        {"hash", values["hash"]}
    };
    form_fields_t params;
    for (const auto &p : steps.init_params) {
        params.emplace_back(p, param_values.at(p));
    }

    http_request_t r;
    r.method = steps.init_method;
    r.url = expand_template(steps.init_url, url_encode_values(values));
    if (steps.init_method == "GET") {
        r.url = append_query(r.url, params);
    } else if (steps.init_body_json) {
        nlohmann::json body = nlohmann::json::object();
        for (const auto &p : params) {
            body[p.first] = p.second;
        }
        r.body = body.dump();
        r.headers.push_back("Content-Type: application/json");
    } else {
        r.form = params;
    }

    const auto sent = send(host, r, auth, cancel);
    if (std::holds_alternative<upload_error_t>(sent)) {
        return std::get<upload_error_t>(sent);
    }
    const auto &response = std::get<http_response_t>(sent);
    const auto parsed = parse_json_response(host, response, "init");
    if (std::holds_alternative<upload_error_t>(parsed)) {
        return std::get<upload_error_t>(parsed);
    }
    const auto &data = std::get<nlohmann::json>(parsed);

    init_result_t ret;
    const auto state = extract_json_integer(data, steps.state_path);
    if (steps.dedupe_state.has_value() && state.has_value() && state.value() == steps.dedupe_state.value()) {
        const auto url = extract_json_string(data, steps.dedupe_url_path);
        if (!url.has_value()) {
            return protocol_error(host, error_kind_t::server, "host reported a stored copy without a link");
        }
        upload_success_t existing;
        existing.download_url = host.response.link_prefix + url.value() + host.response.link_suffix;
        existing.host_file_id = extract_json_string(data, host.response.file_id_path).value_or("");
        existing.bytes_uploaded = 0;
        existing.deduplicated = true;
        existing.gallery_id = request.gallery_id;
        ret.deduplicated = existing;
        return ret;
    }

    const auto upload_url = extract_json_string(data, steps.upload_url_path);
    if (!upload_url.has_value()) {
        auto error = protocol_error(host, error_kind_t::server, "no upload URL at " + json_path_to_string(steps.upload_url_path) + " in init response");
        error.response_body = response.body.substr(0, ERROR_BODY_MAX_LENGTH);
        return error;
    }
    ret.upload_url = upload_url.value();
    ret.upload_id = extract_json_string(data, steps.upload_id_path).value_or("");
    ret.file_field = extract_json_string(data, steps.file_field_path).value_or(host.file_field);
    const auto form_data = extract_json_path(data, steps.form_data_path);
    if (form_data != nullptr && form_data->is_object()) {
        for (const auto &item : form_data->items()) {
            ret.form_data.emplace_back(item.key(), item.value().is_string() ? item.value().get<std::string>() : item.value().dump());
        }
    }
    values["upload_id"] = ret.upload_id;
    return ret;
}

protocol_result_t UploadProtocol::run_single_step(const host_descriptor_t &host, const auth_context_t &auth, const upload_request_t &request, TransferProgress &progress, const std::atomic<bool> &cancel, const state_callback_t &on_state) {
    auto values = base_values(auth, request);

    if (!host.get_server_url.empty()) {
        on_state(task_state_t::initializing);
        http_request_t r;
        r.url = expand_template(host.get_server_url, url_encode_values(values));
        const auto sent = send(host, r, auth, cancel);
        if (std::holds_alternative<upload_error_t>(sent)) {
            return std::get<upload_error_t>(sent);
        }
        const auto parsed = parse_json_response(host, std::get<http_response_t>(sent), "server selection");
        if (std::holds_alternative<upload_error_t>(parsed)) {
            return std::get<upload_error_t>(parsed);
        }
        const auto &data = std::get<nlohmann::json>(parsed);
        const auto server = extract_json_string(data, host.server_response_path);
        if (!server.has_value()) {
            return protocol_error(host, error_kind_t::server, "no upload server at " + json_path_to_string(host.server_response_path));
        }
        values["server"] = server.value();
        // some hosts hand out a single-use session id together with the server
        if (!host.server_session_id_path.empty()) {
            const auto session_id = extract_json_string(data, host.server_session_id_path);
            if (!session_id.has_value()) {
                return protocol_error(host, error_kind_t::server, "no session id at " + json_path_to_string(host.server_session_id_path));
            }
            values["session_id"] = session_id.value();
        }
    }

    auto fields = expand_fields(host.extra_fields, values);
    add_gallery_fields(host, request, values, fields);

    on_state(task_state_t::transferring);
    const auto url = expand_template(host.upload_endpoint, url_encode_values(values));
    const auto sent = transfer(host, auth, request, url, host.file_field, fields, progress, cancel);
    if (std::holds_alternative<upload_error_t>(sent)) {
        return std::get<upload_error_t>(sent);
    }
    return parse_upload_response(host, request, std::get<http_response_t>(sent));
}

protocol_result_t UploadProtocol::run_multi_step(const host_descriptor_t &host, const multi_step_t &steps, const auth_context_t &auth, const upload_request_t &request, TransferProgress &progress, const std::atomic<bool> &cancel, const state_callback_t &on_state) {
    auto values = base_values(auth, request);

    on_state(task_state_t::initializing);
    const auto initialized = init(host, steps, auth, request, values, cancel);
    if (std::holds_alternative<upload_error_t>(initialized)) {
        return std::get<upload_error_t>(initialized);
    }
    const auto &started = std::get<init_result_t>(initialized);
    if (started.deduplicated.has_value()) {
        fprintf(stdout, "[upload:%s] %s is already stored on the host\n", host.id.c_str(), request.file_name.c_str());
        return started.deduplicated.value();
    }

    auto fields = expand_fields(host.extra_fields, values);
    fields.insert(fields.end(), started.form_data.begin(), started.form_data.end());
    add_gallery_fields(host, request, values, fields);

    on_state(task_state_t::transferring);
    const auto sent = transfer(host, auth, request, started.upload_url, started.file_field, fields, progress, cancel);
    if (std::holds_alternative<upload_error_t>(sent)) {
        return std::get<upload_error_t>(sent);
    }
    return parse_upload_response(host, request, std::get<http_response_t>(sent));
}

protocol_result_t UploadProtocol::run_multi_step_polling(const host_descriptor_t &host, const multi_step_polling_t &shape, const auth_context_t &auth, const upload_request_t &request, TransferProgress &progress, const std::atomic<bool> &cancel, const state_callback_t &on_state) {
    auto values = base_values(auth, request);

    on_state(task_state_t::initializing);
    const auto initialized = init(host, shape.steps, auth, request, values, cancel);
    if (std::holds_alternative<upload_error_t>(initialized)) {
        return std::get<upload_error_t>(initialized);
    }
    const auto &started = std::get<init_result_t>(initialized);
    if (started.deduplicated.has_value()) {
        fprintf(stdout, "[upload:%s] %s is already stored on the host\n", host.id.c_str(), request.file_name.c_str());
        return started.deduplicated.value();
    }
    if (started.upload_id.empty()) {
        return protocol_error(host, error_kind_t::server, "no upload id in init response");
    }

    auto fields = expand_fields(host.extra_fields, values);
    fields.insert(fields.end(), started.form_data.begin(), started.form_data.end());
    add_gallery_fields(host, request, values, fields);

    on_state(task_state_t::transferring);
    const auto sent = transfer(host, auth, request, started.upload_url, started.file_field, fields, progress, cancel);
    if (std::holds_alternative<upload_error_t>(sent)) {
        return std::get<upload_error_t>(sent);
    }

    on_state(task_state_t::polling);
    return poll(host, shape, auth, request, values, cancel);
}

protocol_result_t UploadProtocol::poll(const host_descriptor_t &host, const multi_step_polling_t &shape, const auth_context_t &auth, const upload_request_t &request, const std::map<std::string, std::string> &values, const std::atomic<bool> &cancel) {
    const auto delay = std::chrono::milliseconds(static_cast<long long>(shape.poll_delay_seconds * 1000));
    const auto url = expand_template(shape.poll_url, url_encode_values(values));
    std::vector<json_path_t> link_paths { host.response.link_path };
    link_paths.insert(link_paths.end(), shape.alternate_link_paths.begin(), shape.alternate_link_paths.end());

    for (unsigned int i = 0; i < shape.poll_attempts; i++) {
        if (!sleep(delay, cancel)) {
            return cancelled_error(host);
        }
        http_request_t r;
        r.url = url;
        const auto sent = send(host, r, auth, cancel);
        if (std::holds_alternative<upload_error_t>(sent)) {
            return std::get<upload_error_t>(sent);
        }
        const auto parsed = parse_json_response(host, std::get<http_response_t>(sent), "poll");
        if (std::holds_alternative<upload_error_t>(parsed)) {
            return std::get<upload_error_t>(parsed);
        }
        const auto &data = std::get<nlohmann::json>(parsed);

        const auto state = extract_json_integer(data, shape.steps.state_path);
        const bool done = !shape.done_state.has_value() || (state.has_value() && state.value() == shape.done_state.value());
        std::optional<std::string> link;
        for (const auto &path : link_paths) {
            link = extract_json_string(data, path);
            if (link.has_value()) {
                break;
            }
        }
        if (done && link.has_value()) {
            upload_success_t ret;
            ret.download_url = host.response.link_prefix + link.value() + host.response.link_suffix;
            ret.host_file_id = extract_json_string(data, host.response.file_id_path).value_or("");
            ret.bytes_uploaded = request.file_size;
            ret.gallery_id = request.gallery_id;
            return ret;
        }
        if (shape.done_state.has_value() && done) {
            return protocol_error(host, error_kind_t::server, "upload finished without a download link");
        }
        fprintf(stdout, "[upload:%s] %s is still processing (%u/%u)\n", host.id.c_str(), request.file_name.c_str(), i + 1, shape.poll_attempts);
    }
    return protocol_error(host, error_kind_t::timeout, "upload was not finished after " + std::to_string(shape.poll_attempts) + " status checks");
}

protocol_result_t UploadProtocol::run(
    const host_descriptor_t &host,
    const auth_context_t &auth,
    const upload_request_t &request,
    TransferProgress &progress,
    const std::atomic<bool> &cancel,
    const state_callback_t &on_state
) {
    if (std::holds_alternative<multi_step_polling_t>(host.protocol)) {
        return run_multi_step_polling(host, std::get<multi_step_polling_t>(host.protocol), auth, request, progress, cancel, on_state);
    }
    if (std::holds_alternative<multi_step_t>(host.protocol)) {
        return run_multi_step(host, std::get<multi_step_t>(host.protocol), auth, request, progress, cancel, on_state);
    }
    return run_single_step(host, auth, request, progress, cancel, on_state);
}
