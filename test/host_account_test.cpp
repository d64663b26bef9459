#include <gtest/gtest.h>

#include "../src/account/host_account.hpp"
#include "../src/db/sqlite.hpp"
#include "fake_http_client.hpp"
#include "test_utils.hpp"

static nlohmann::json key_host() {
    return {
        {"id", "k2s"},
        {"name", "K2S"},
        {"auth_type", "api_key"},
        {"upload", {{"endpoint", "https://k2s.test/upload"}}},
        {"response", {{"link_path", {"url"}}}},
        {"user_info", {
            {"url", "https://k2s.test/account?token={token}"},
            {"storage_left_path", {"left"}},
            {"storage_used_path", {"used"}},
            {"premium_path", {"premium"}}
        }},
        {"delete", {
            {"url", "https://k2s.test/files/{file_id}?token={token}"},
            {"method", "DELETE"}
        }}
    };
}

static nlohmann::json login_host() {
    return {
        {"id", "rapid"},
        {"name", "Rapid"},
        {"auth_type", "token_login"},
        {"upload", {{"endpoint", "https://rapid.test/upload"}}},
        {"response", {{"link_path", {"url"}}}},
        {"auth", {
            {"login_url", "https://rapid.test/login"},
            {"login_fields", {{"login", "{username}"}, {"password", "{password}"}}},
            {"token_path", {"token"}},
            {"stale_token_patterns", {"token is expired"}},
            {"check_body_on_success", true}
        }},
        {"user_info", {
            {"url", "https://rapid.test/account"},
            {"method", "POST"},
            {"body_json", true},
            {"storage_total_path", nlohmann::json::array({ "account", "total" })},
            {"storage_left_path", nlohmann::json::array({ "account", "left" })}
        }},
        {"delete", {
            {"url", "https://rapid.test/delete"},
            {"method", "POST"},
            {"params", nlohmann::json::array({ "del_code", "sess_id" })}
        }}
    };
}

static nlohmann::json anonymous_host() {
    return {
        {"id", "anon"},
        {"name", "Anon"},
        {"upload", {{"endpoint", "https://anon.test/upload"}}},
        {"response", {{"type", "text"}}}
    };
}

class HostAccountTest : public ::testing::Test {
  protected:
    void SetUp() override {
        db = std::get<std::shared_ptr<sqlite3>>(db_open(":memory:"));
        tokens = std::make_unique<TokenStore>(db);
        auth_settings_t settings;
        settings.login_retries = 1;
        settings.login_retry_delay_seconds = 0;
        settings.login_retry_max_delay_seconds = 0;
        registry = make_registry({ key_host(), login_host(), anonymous_host() });
        auth = std::make_unique<AuthenticationProvider>(registry, *tokens, http, settings);
        account = std::make_unique<HostAccount>(registry, *auth, http);
    }

    std::shared_ptr<sqlite3> db;
    std::unique_ptr<TokenStore> tokens;
    HostRegistry registry;
    FakeHttpClient http;
    std::unique_ptr<AuthenticationProvider> auth;
    std::unique_ptr<HostAccount> account;
};

TEST_F(HostAccountTest, user_info_from_json) {
    http.set_handler([](const http_request_t &r) -> http_result_t {
        EXPECT_EQ(r.method, "GET");
        EXPECT_EQ(r.url, "https://k2s.test/account?token=secret");
        return json_response(200, {{"status", "success"}, {"left", 100}, {"used", "50"}, {"premium", 1}});
    });

    const auto result = account->get_user_info("k2s", credential_t::from_string("secret"));
    ASSERT_TRUE(std::holds_alternative<account_info_t>(result));
    const auto &info = std::get<account_info_t>(result);
    EXPECT_EQ(info.storage_left, 100);
    EXPECT_EQ(info.storage_used, 50);
    // total is derived when the host only reports left and used
    EXPECT_EQ(info.storage_total, 150);
    EXPECT_EQ(info.premium, true);
}

TEST_F(HostAccountTest, user_info_api_failure) {
    http.set_handler([](const http_request_t &) -> http_result_t {
        return json_response(200, {{"status", "error"}, {"message", "account locked"}});
    });

    const auto result = account->get_user_info("k2s", credential_t::from_string("secret"));
    ASSERT_TRUE(std::holds_alternative<upload_error_t>(result));
    EXPECT_EQ(std::get<upload_error_t>(result).kind, error_kind_t::server);
    EXPECT_NE(std::get<upload_error_t>(result).message.find("account locked"), std::string::npos);
}

TEST_F(HostAccountTest, user_info_from_markup) {
    auto host = key_host();
    host["user_info"] = {
        {"url", "https://k2s.test/account"},
        {"storage_regex", "([0-9.]+) of ([0-9.]+) GB"}
    };
    const auto markup_registry = make_registry({ host });
    AuthenticationProvider markup_auth(markup_registry, *tokens, http);
    HostAccount markup_account(markup_registry, markup_auth, http);
    http.set_handler([](const http_request_t &) -> http_result_t {
        return text_response(200, "<div>Used <b>1.5 of 10 GB</b></div>");
    });

    const auto result = markup_account.get_user_info("k2s", credential_t::from_string("secret"));
    ASSERT_TRUE(std::holds_alternative<account_info_t>(result));
    const auto &info = std::get<account_info_t>(result);
    EXPECT_EQ(info.storage_used, 1610612736);
    EXPECT_EQ(info.storage_total, 10737418240);
    EXPECT_EQ(info.storage_left, 9126805504);
    EXPECT_FALSE(info.premium.has_value());
}

TEST_F(HostAccountTest, rejected_token_is_refreshed_once) {
    int logins = 0;
    http.set_handler([&logins](const http_request_t &r) -> http_result_t {
        if (r.url.find("/login") != std::string::npos) {
            logins++;
            return json_response(200, {{"token", "tok-" + std::to_string(logins)}});
        }
        EXPECT_EQ(r.method, "POST");
        const auto body = nlohmann::json::parse(r.body);
        if (body.at("access_token") == "tok-1") {
            return text_response(401, "");
        }
        return json_response(200, {{"account", {{"total", 1000}, {"left", 400}}}});
    });

    const auto result = account->get_user_info("rapid", credential_t::from_string("user:pass"));
    ASSERT_TRUE(std::holds_alternative<account_info_t>(result));
    EXPECT_EQ(std::get<account_info_t>(result).storage_total, 1000);
    EXPECT_EQ(std::get<account_info_t>(result).storage_left, 400);
    EXPECT_EQ(logins, 2);
    EXPECT_EQ(tokens->get("rapid")->value, "tok-2");
}

TEST_F(HostAccountTest, repeated_rejection_is_authentication_error) {
    http.set_handler([](const http_request_t &r) -> http_result_t {
        if (r.url.find("/login") != std::string::npos) {
            return json_response(200, {{"token", "tok"}});
        }
        return text_response(403, "forbidden");
    });

    const auto result = account->get_user_info("rapid", credential_t::from_string("user:pass"));
    ASSERT_TRUE(std::holds_alternative<upload_error_t>(result));
    EXPECT_EQ(std::get<upload_error_t>(result).kind, error_kind_t::authentication);
    EXPECT_EQ(http.count("/account"), 2);
    EXPECT_EQ(http.count("/login"), 2);
}

TEST_F(HostAccountTest, user_info_not_supported) {
    const auto result = account->get_user_info("anon", credential_t {});
    ASSERT_TRUE(std::holds_alternative<upload_error_t>(result));
    EXPECT_EQ(std::get<upload_error_t>(result).kind, error_kind_t::validation);
    EXPECT_TRUE(http.get_requests().empty());
}

TEST_F(HostAccountTest, credentials_of_anonymous_host) {
    const auto check = account->test_credentials("anon", credential_t {});
    EXPECT_TRUE(check.success);
    EXPECT_EQ(check.message, "no authentication required");
    EXPECT_TRUE(http.get_requests().empty());
}

TEST_F(HostAccountTest, credentials_checked_with_account_details) {
    http.set_handler([](const http_request_t &) -> http_result_t {
        return json_response(200, {{"left", 7}, {"used", 3}});
    });

    const auto check = account->test_credentials("k2s", credential_t::from_string("secret"));
    EXPECT_TRUE(check.success);
    ASSERT_TRUE(check.info.has_value());
    EXPECT_EQ(check.info->storage_total, 10);

    const auto missing = account->test_credentials("k2s", credential_t {});
    EXPECT_FALSE(missing.success);
    EXPECT_NE(missing.message.find("API key"), std::string::npos);
    EXPECT_EQ(http.get_requests().size(), 1);
}

TEST_F(HostAccountTest, rejected_credentials) {
    http.set_handler([](const http_request_t &r) -> http_result_t {
        if (r.url.find("/login") != std::string::npos) {
            return text_response(403, "wrong password");
        }
        return text_response(404, "");
    });

    const auto check = account->test_credentials("rapid", credential_t::from_string("user:bad"));
    EXPECT_FALSE(check.success);
    EXPECT_EQ(check.message.find("credential validation failed"), 0);
    EXPECT_EQ(http.count("/account"), 0);
}

TEST_F(HostAccountTest, delete_with_url_template) {
    http.set_handler([](const http_request_t &) -> http_result_t {
        return text_response(204, "");
    });

    const auto error = account->delete_file("k2s", credential_t::from_string("secret"), "a b");
    EXPECT_FALSE(error.has_value());
    const auto requests = http.get_requests();
    ASSERT_EQ(requests.size(), 1);
    EXPECT_EQ(requests[0].method, "DELETE");
    EXPECT_EQ(requests[0].url, "https://k2s.test/files/a%20b?token=secret");
}

TEST_F(HostAccountTest, delete_with_json_body) {
    auto host = key_host();
    host["delete"] = {{"url", "https://k2s.test/api/deleteFiles"}, {"body_json", true}};
    const auto json_registry = make_registry({ host });
    AuthenticationProvider json_auth(json_registry, *tokens, http);
    HostAccount json_account(json_registry, json_auth, http);
    http.set_handler([](const http_request_t &r) -> http_result_t {
        EXPECT_EQ(r.method, "POST");
        EXPECT_EQ(r.url, "https://k2s.test/api/deleteFiles");
        const auto body = nlohmann::json::parse(r.body);
        EXPECT_EQ(body.at("ids"), nlohmann::json::array({ "f1" }));
        EXPECT_EQ(body.at("access_token"), "secret");
        return json_response(200, {{"status", "success"}});
    });

    EXPECT_FALSE(json_account.delete_file("k2s", credential_t::from_string("secret"), "f1").has_value());
    EXPECT_EQ(http.get_requests().size(), 1);
}

TEST_F(HostAccountTest, delete_with_form_params) {
    http.set_handler([](const http_request_t &r) -> http_result_t {
        if (r.url.find("/login") != std::string::npos) {
            return json_response(200, {{"token", "tok"}});
        }
        EXPECT_EQ(r.method, "POST");
        EXPECT_EQ(form_value(r, "del_code"), "f9");
        EXPECT_EQ(form_value(r, "sess_id"), "tok");
        return text_response(200, "deleted");
    });

    EXPECT_FALSE(account->delete_file("rapid", credential_t::from_string("user:pass"), "f9").has_value());
    EXPECT_EQ(http.count("/delete"), 1);
}

TEST_F(HostAccountTest, stale_body_on_delete_logs_in_again) {
    int logins = 0;
    http.set_handler([&logins](const http_request_t &r) -> http_result_t {
        if (r.url.find("/login") != std::string::npos) {
            logins++;
            return json_response(200, {{"token", "tok-" + std::to_string(logins)}});
        }
        if (form_value(r, "sess_id") == "tok-1") {
            return text_response(200, "token is expired");
        }
        return text_response(200, "deleted");
    });

    EXPECT_FALSE(account->delete_file("rapid", credential_t::from_string("user:pass"), "f9").has_value());
    EXPECT_EQ(logins, 2);
    EXPECT_EQ(http.count("/delete"), 2);
}

TEST_F(HostAccountTest, delete_redirected_to_other_origin) {
    http.set_handler([](const http_request_t &r) -> http_result_t {
        auto response = text_response(200, "");
        response.effective_url = "https://Other.test/landing?from=" + r.url;
        return response;
    });

    const auto error = account->delete_file("k2s", credential_t::from_string("secret"), "f1");
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, error_kind_t::client);
}

TEST_F(HostAccountTest, delete_same_origin_redirect_is_accepted) {
    http.set_handler([](const http_request_t &) -> http_result_t {
        auto response = text_response(200, "");
        response.effective_url = "https://K2S.test/files";
        return response;
    });

    EXPECT_FALSE(account->delete_file("k2s", credential_t::from_string("secret"), "f1").has_value());
}

TEST_F(HostAccountTest, delete_failure_status) {
    http.set_handler([](const http_request_t &) -> http_result_t {
        return text_response(404, "no such file");
    });

    const auto error = account->delete_file("k2s", credential_t::from_string("secret"), "f1");
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, error_kind_t::client);
    EXPECT_EQ(error->http_status, 404);
    EXPECT_EQ(http.get_requests().size(), 1);
}

TEST_F(HostAccountTest, delete_not_supported) {
    const auto error = account->delete_file("anon", credential_t {}, "f1");
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, error_kind_t::validation);
    EXPECT_TRUE(http.get_requests().empty());
}

TEST(host_account_test, origin_of_url) {
    EXPECT_EQ(url_origin("https://Host.test:8443/a/b?c#d"), "https://host.test:8443");
    EXPECT_EQ(url_origin("http://host.test?x=1"), "http://host.test");
    EXPECT_EQ(url_origin("not a url"), "");
}

TEST(host_account_test, account_sections_are_validated) {
    auto host = key_host();
    host["delete"]["params"] = nlohmann::json::array({ "del_code", "password" });
    const auto bad_param = parse_host_descriptor(host, "");
    ASSERT_TRUE(std::holds_alternative<std::string>(bad_param));
    EXPECT_NE(std::get<std::string>(bad_param).find("password"), std::string::npos);

    host = key_host();
    host["user_info"]["storage_regex"] = "([0-9";
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_host_descriptor(host, "")));

    host = key_host();
    host["delete"]["method"] = "PATCH";
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_host_descriptor(host, "")));

    const auto parsed = parse_host_descriptor(key_host(), "");
    ASSERT_TRUE(std::holds_alternative<host_descriptor_t>(parsed));
    EXPECT_EQ(std::get<host_descriptor_t>(parsed).delete_file->method, "DELETE");
    EXPECT_EQ(std::get<host_descriptor_t>(parsed).user_info->storage_left_path.size(), 1);
}
