#include <algorithm>

#include <gtest/gtest.h>

#include "../src/protocol/upload_protocol.hpp"
#include "fake_http_client.hpp"
#include "test_utils.hpp"

static bool no_sleep(std::chrono::milliseconds, const std::atomic<bool> &cancel) {
    return !cancel.load();
}

static host_descriptor_t descriptor(const nlohmann::json &data) {
    const auto parsed = parse_host_descriptor(data, "");
    if (std::holds_alternative<std::string>(parsed)) {
        ADD_FAILURE() << std::get<std::string>(parsed);
        return host_descriptor_t {};
    }
    return std::get<host_descriptor_t>(parsed);
}

static nlohmann::json single_step_host() {
    return {
        {"id", "imx"},
        {"name", "IMX"},
        {"auth_type", "api_key"},
        {"upload", {
            {"endpoint", "https://imx.test/upload.php"},
            {"file_field", "image"},
            {"extra_fields", {{"api_key", "{token}"}, {"title", "{filename}"}}}
        }},
        {"response", {
            {"link_path", nlohmann::json::array({ "data", "image_url" })},
            {"file_id_path", nlohmann::json::array({ "data", "image_id" })}
        }},
        {"gallery", {
            {"create_fields", {{"create_gallery", "1"}, {"gallery_name", "{filename}"}}},
            {"id_field", "gallery_id"},
            {"id_path", nlohmann::json::array({ "data", "gallery_id" })}
        }}
    };
}

static nlohmann::json polling_host() {
    return {
        {"id", "rapid"},
        {"name", "Rapid"},
        {"auth_type", "token_login"},
        {"response", {
            {"link_path", nlohmann::json::array({ "response", "upload", "file", "url" })},
            {"file_id_path", nlohmann::json::array({ "response", "upload", "file", "file_id" })}
        }},
        {"auth", {
            {"login_url", "https://rapid.test/login"},
            {"token_path", nlohmann::json::array({ "response", "token" })}
        }},
        {"multistep", {
            {"init_url", "https://rapid.test/file/upload"},
            {"init_params", nlohmann::json::array({ "token", "name", "size", "hash" })},
            {"upload_url_path", nlohmann::json::array({ "response", "upload", "url" })},
            {"upload_id_path", nlohmann::json::array({ "response", "upload", "upload_id" })},
            {"state_path", nlohmann::json::array({ "response", "upload", "state" })},
            {"dedupe_state", 2},
            {"dedupe_url_path", nlohmann::json::array({ "response", "upload", "file", "url" })},
            {"poll_url", "https://rapid.test/file/upload_info?token={token}&upload_id={upload_id}"},
            {"poll_retries", 3},
            {"done_state", 2}
        }}
    };
}

class UploadProtocolTest : public ::testing::Test {
  protected:
    void SetUp() override {
        dir = make_tmp_dir("upload_protocol");
        file = dir / "photo 1.jpg";
        write_file(file, "abc");
        request.file_path = file;
        request.file_name = "photo 1.jpg";
        request.file_size = 3;
        auth.kind = auth_kind_t::api_key;
        auth.token = "tok";
    }

    protocol_result_t run(const host_descriptor_t &host) {
        TransferProgress progress(counter, nullptr);
        UploadProtocol protocol(http, no_sleep);
        return protocol.run(host, auth, request, progress, cancel, [this](task_state_t state) {
            states.push_back(state);
        });
    }

    std::filesystem::path dir;
    std::filesystem::path file;
    upload_request_t request;
    auth_context_t auth;
    FakeHttpClient http;
    BandwidthCounter counter;
    std::atomic<bool> cancel {false};
    std::vector<task_state_t> states;
};

TEST_F(UploadProtocolTest, single_step) {
    http.set_handler([](const http_request_t &r) -> http_result_t {
        EXPECT_EQ(r.method, "POST");
        EXPECT_EQ(r.url, "https://imx.test/upload.php");
        EXPECT_EQ(r.file->field, "image");
        EXPECT_EQ(r.file->file_name, "photo 1.jpg");
        EXPECT_EQ(form_value(r, "api_key"), "tok");
        EXPECT_EQ(form_value(r, "title"), "photo 1.jpg");
        EXPECT_EQ(form_value(r, "gallery_id"), "");
        return json_response(200, {{"status", 200}, {"data", {{"image_url", "https://imx.test/i/abc"}, {"image_id", "abc"}}}});
    });
    const auto result = run(descriptor(single_step_host()));
    ASSERT_TRUE(std::holds_alternative<upload_success_t>(result)) << describe_error(std::get<upload_error_t>(result));
    const auto &success = std::get<upload_success_t>(result);
    EXPECT_EQ(success.download_url, "https://imx.test/i/abc");
    EXPECT_EQ(success.host_file_id, "abc");
    EXPECT_EQ(success.bytes_uploaded, 3);
    EXPECT_FALSE(success.deduplicated);
    EXPECT_EQ(counter.total(), 3);
    EXPECT_EQ(states, std::vector<task_state_t>({ task_state_t::transferring }));
}

TEST_F(UploadProtocolTest, gallery_creation_and_reuse) {
    const auto host = descriptor(single_step_host());
    http.set_handler([](const http_request_t &r) -> http_result_t {
        EXPECT_EQ(form_value(r, "create_gallery"), "1");
        EXPECT_EQ(form_value(r, "gallery_name"), "photo 1.jpg");
        return json_response(200, {{"data", {{"image_url", "https://imx.test/i/1"}, {"gallery_id", "g77"}}}});
    });
    request.create_gallery = true;
    auto result = run(host);
    ASSERT_TRUE(std::holds_alternative<upload_success_t>(result));
    EXPECT_EQ(std::get<upload_success_t>(result).gallery_id, "g77");

    http.set_handler([](const http_request_t &r) -> http_result_t {
        EXPECT_EQ(form_value(r, "gallery_id"), "g77");
        EXPECT_EQ(form_value(r, "create_gallery"), "");
        return json_response(200, {{"data", {{"image_url", "https://imx.test/i/2"}}}});
    });
    request.create_gallery = false;
    request.gallery_id = "g77";
    result = run(host);
    ASSERT_TRUE(std::holds_alternative<upload_success_t>(result));
    EXPECT_EQ(std::get<upload_success_t>(result).gallery_id, "g77");
}

TEST_F(UploadProtocolTest, gallery_creation_without_id_fails) {
    http.set_handler([](const http_request_t &) -> http_result_t {
        return json_response(200, {{"data", {{"image_url", "https://imx.test/i/1"}}}});
    });
    request.create_gallery = true;
    const auto result = run(descriptor(single_step_host()));
    ASSERT_TRUE(std::holds_alternative<upload_error_t>(result));
    EXPECT_EQ(std::get<upload_error_t>(result).kind, error_kind_t::server);
}

TEST_F(UploadProtocolTest, error_mapping) {
    const auto host = descriptor(single_step_host());
    const std::vector<std::pair<http_result_t, error_kind_t>> cases = {
        { text_response(500, "oops"), error_kind_t::server },
        { text_response(429, "slow down"), error_kind_t::server },
        { text_response(401, ""), error_kind_t::authentication },
        { text_response(413, "too large"), error_kind_t::client },
        { transport_error("Connection reset"), error_kind_t::network },
        { json_response(200, {{"status", 403}, {"details", "invalid api key"}}), error_kind_t::authentication },
        { json_response(200, {{"status", "error"}, {"message", "quota"}}), error_kind_t::server },
        { json_response(200, {{"data", {}}}), error_kind_t::server },
        { text_response(200, "<html>maintenance</html>"), error_kind_t::server }
    };
    for (const auto &c : cases) {
        const auto response = c.first;
        http.set_handler([response](const http_request_t &) { return response; });
        const auto result = run(host);
        ASSERT_TRUE(std::holds_alternative<upload_error_t>(result));
        EXPECT_EQ(std::get<upload_error_t>(result).kind, c.second) << describe_error(std::get<upload_error_t>(result));
        EXPECT_EQ(std::get<upload_error_t>(result).host_id, "imx");
    }
}

TEST_F(UploadProtocolTest, timeout_is_reported) {
    http.set_handler([](const http_request_t &) -> http_result_t {
        auto error = transport_error("Operation too slow");
        error.timed_out = true;
        return error;
    });
    const auto result = run(descriptor(single_step_host()));
    ASSERT_TRUE(std::holds_alternative<upload_error_t>(result));
    EXPECT_EQ(std::get<upload_error_t>(result).kind, error_kind_t::timeout);
}

TEST_F(UploadProtocolTest, cancelled_before_start) {
    cancel.store(true);
    const auto result = run(descriptor(single_step_host()));
    ASSERT_TRUE(std::holds_alternative<upload_error_t>(result));
    EXPECT_EQ(std::get<upload_error_t>(result).kind, error_kind_t::cancelled);
    EXPECT_TRUE(http.get_requests().empty());
}

TEST_F(UploadProtocolTest, cancelled_during_transfer) {
    http.set_handler([](const http_request_t &) -> http_result_t {
        return json_response(200, {{"data", {{"image_url", "https://imx.test/i/1"}}}});
    });
    TransferProgress progress(counter, [this](std::uint64_t, std::uint64_t) {
        cancel.store(true);
    });
    UploadProtocol protocol(http, no_sleep);
    const auto result = protocol.run(descriptor(single_step_host()), auth, request, progress, cancel, [](task_state_t) {});
    ASSERT_TRUE(std::holds_alternative<upload_error_t>(result));
    EXPECT_EQ(std::get<upload_error_t>(result).kind, error_kind_t::cancelled);
}

TEST_F(UploadProtocolTest, progress_reports_file_bytes) {
    http.set_handler([](const http_request_t &) -> http_result_t {
        return json_response(200, {{"data", {{"image_url", "https://imx.test/i/1"}}}});
    });
    std::vector<std::pair<std::uint64_t, std::uint64_t>> reported;
    TransferProgress progress(counter, [&reported](std::uint64_t bytes, std::uint64_t total) {
        reported.emplace_back(bytes, total);
    });
    UploadProtocol protocol(http, no_sleep);
    const auto result = protocol.run(descriptor(single_step_host()), auth, request, progress, cancel, [](task_state_t) {});
    ASSERT_TRUE(std::holds_alternative<upload_success_t>(result));
    ASSERT_FALSE(reported.empty());
    for (const auto &r : reported) {
        EXPECT_LE(r.first, 3);
        EXPECT_EQ(r.second, 3);
    }
    EXPECT_EQ(reported.back().first, 3);
    // multipart framing is not counted as sent bytes
    EXPECT_EQ(counter.total(), 3);
}

TEST_F(UploadProtocolTest, server_selection) {
    const auto host = descriptor({
        {"id", "gofile"},
        {"name", "GoFile"},
        {"auth_type", "bearer"},
        {"upload", {
            {"get_server", "https://api.gofile.test/servers"},
            {"server_response_path", nlohmann::json::array({ "data", "servers", 0, "name" })},
            {"endpoint", "https://{server}.gofile.test/contents/uploadfile"}
        }},
        {"response", {{"link_path", nlohmann::json::array({ "data", "downloadPage" })}}}
    });
    http.set_handler([](const http_request_t &r) -> http_result_t {
        EXPECT_NE(std::find(r.headers.begin(), r.headers.end(), "Authorization: Bearer tok"), r.headers.end());
        if (r.url == "https://api.gofile.test/servers") {
            return json_response(200, {{"status", "ok"}, {"data", {{"servers", nlohmann::json::array({ nlohmann::json {{"name", "store4"}} })}}}});
        }
        EXPECT_EQ(r.url, "https://store4.gofile.test/contents/uploadfile");
        return json_response(200, {{"status", "ok"}, {"data", {{"downloadPage", "https://gofile.test/d/x"}}}});
    });
    const auto result = run(host);
    ASSERT_TRUE(std::holds_alternative<upload_success_t>(result));
    EXPECT_EQ(std::get<upload_success_t>(result).download_url, "https://gofile.test/d/x");
    EXPECT_EQ(states, std::vector<task_state_t>({ task_state_t::initializing, task_state_t::transferring }));
}

TEST_F(UploadProtocolTest, text_and_regex_responses) {
    auto text_host = descriptor({
        {"id", "t"},
        {"name", "T"},
        {"upload", {{"endpoint", "https://t.test/up"}}},
        {"response", {{"type", "text"}, {"link_prefix", "https://t.test/"}}}
    });
    http.set_handler([](const http_request_t &) { return text_response(200, "  abc123\n"); });
    auto result = run(text_host);
    ASSERT_TRUE(std::holds_alternative<upload_success_t>(result));
    EXPECT_EQ(std::get<upload_success_t>(result).download_url, "https://t.test/abc123");

    auto regex_host = descriptor({
        {"id", "r"},
        {"name", "R"},
        {"upload", {{"endpoint", "https://r.test/up"}}},
        {"response", {{"type", "regex"}, {"link_regex", "href=\"(https://r\\.test/f/[^\"]+)\""}}}
    });
    http.set_handler([](const http_request_t &) { return text_response(200, "<a href=\"https://r.test/f/42\">done</a>"); });
    result = run(regex_host);
    ASSERT_TRUE(std::holds_alternative<upload_success_t>(result));
    EXPECT_EQ(std::get<upload_success_t>(result).download_url, "https://r.test/f/42");

    http.set_handler([](const http_request_t &) { return text_response(200, "<p>error</p>"); });
    result = run(regex_host);
    ASSERT_TRUE(std::holds_alternative<upload_error_t>(result));
}

TEST_F(UploadProtocolTest, polling_upload) {
    int polls = 0;
    http.set_handler([&polls](const http_request_t &r) -> http_result_t {
        if (r.url.find("https://rapid.test/file/upload?") == 0) {
            EXPECT_NE(r.url.find("name=photo%201.jpg"), std::string::npos);
            EXPECT_NE(r.url.find("size=3"), std::string::npos);
            EXPECT_NE(r.url.find("hash=900150983cd24fb0d6963f7d28e17f72"), std::string::npos);
            return json_response(200, {{"status", 200}, {"response", {{"upload", {{"url", "https://up.rapid.test/u/1"}, {"upload_id", "u1"}, {"state", 0}}}}}});
        }
        if (r.url == "https://up.rapid.test/u/1") {
            EXPECT_TRUE(r.file.has_value());
            return json_response(200, {{"status", 200}});
        }
        EXPECT_EQ(r.url, "https://rapid.test/file/upload_info?token=tok&upload_id=u1");
        polls++;
        if (polls < 2) {
            return json_response(200, {{"status", 200}, {"response", {{"upload", {{"state", 1}}}}}});
        }
        return json_response(200, {{"status", 200}, {"response", {{"upload", {{"state", 2}, {"file", {{"url", "https://rapid.test/file/f1"}, {"file_id", "f1"}}}}}}}});
    });
    const auto result = run(descriptor(polling_host()));
    ASSERT_TRUE(std::holds_alternative<upload_success_t>(result)) << describe_error(std::get<upload_error_t>(result));
    EXPECT_EQ(std::get<upload_success_t>(result).download_url, "https://rapid.test/file/f1");
    EXPECT_EQ(std::get<upload_success_t>(result).host_file_id, "f1");
    EXPECT_EQ(polls, 2);
    EXPECT_EQ(states, std::vector<task_state_t>({ task_state_t::initializing, task_state_t::transferring, task_state_t::polling }));
}

TEST_F(UploadProtocolTest, polling_budget_is_a_timeout) {
    http.set_handler([](const http_request_t &r) -> http_result_t {
        if (r.url.find("upload_info") != std::string::npos) {
            return json_response(200, {{"response", {{"upload", {{"state", 1}}}}}});
        }
        if (r.file.has_value()) {
            return json_response(200, {});
        }
        return json_response(200, {{"response", {{"upload", {{"url", "https://up.rapid.test/u/1"}, {"upload_id", "u1"}, {"state", 0}}}}}});
    });
    const auto result = run(descriptor(polling_host()));
    ASSERT_TRUE(std::holds_alternative<upload_error_t>(result));
    EXPECT_EQ(std::get<upload_error_t>(result).kind, error_kind_t::timeout);
    EXPECT_EQ(http.count("upload_info"), 3);
}

TEST_F(UploadProtocolTest, deduplicated_upload_skips_transfer) {
    http.set_handler([](const http_request_t &) -> http_result_t {
        return json_response(200, {{"response", {{"upload", {{"state", 2}, {"file", {{"url", "https://rapid.test/file/old"}, {"file_id", "old"}}}}}}}});
    });
    const auto result = run(descriptor(polling_host()));
    ASSERT_TRUE(std::holds_alternative<upload_success_t>(result));
    const auto &success = std::get<upload_success_t>(result);
    EXPECT_TRUE(success.deduplicated);
    EXPECT_EQ(success.bytes_uploaded, 0);
    EXPECT_EQ(success.download_url, "https://rapid.test/file/old");
    EXPECT_EQ(http.get_requests().size(), 1);
    EXPECT_EQ(counter.total(), 0);
    EXPECT_EQ(states, std::vector<task_state_t>({ task_state_t::initializing }));
}

TEST_F(UploadProtocolTest, missing_file_for_hash) {
    request.file_path = dir / "gone.jpg";
    const auto result = run(descriptor(polling_host()));
    ASSERT_TRUE(std::holds_alternative<upload_error_t>(result));
    EXPECT_EQ(std::get<upload_error_t>(result).kind, error_kind_t::validation);
    EXPECT_TRUE(http.get_requests().empty());
}

TEST(upload_protocol_test, sleep_unless_cancelled) {
    std::atomic<bool> cancel {false};
    EXPECT_TRUE(sleep_unless_cancelled(std::chrono::milliseconds(10), cancel));
    cancel.store(true);
    EXPECT_FALSE(sleep_unless_cancelled(std::chrono::milliseconds(10000), cancel));
}
