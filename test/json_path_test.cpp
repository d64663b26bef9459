#include <gtest/gtest.h>

#include "../src/hosts/json_path.hpp"

static json_path_t path(const nlohmann::json &p) {
    return std::get<json_path_t>(parse_json_path(p));
}

TEST(json_path_test, parse) {
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_json_path("data.url")));
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_json_path(nlohmann::json::array({ "data", -1 }))));
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_json_path(nlohmann::json::array({ "data", nullptr }))));
    const auto parsed = path(nlohmann::json::array({ "data", 0, "url" }));
    ASSERT_EQ(parsed.size(), 3);
    EXPECT_EQ(json_path_to_string(parsed), ".data[0].url");
}

TEST(json_path_test, extract) {
    const auto data = nlohmann::json::parse(R"({"data": {"files": [{"url": "https://a.test/1", "size": 12}], "id": 77, "empty": "", "none": null}})");

    EXPECT_EQ(extract_json_string(data, path(nlohmann::json::array({ "data", "files", 0, "url" }))), "https://a.test/1");
    EXPECT_EQ(extract_json_string(data, path(nlohmann::json::array({ "data", "id" }))), "77");
    EXPECT_EQ(extract_json_integer(data, path(nlohmann::json::array({ "data", "files", 0, "size" }))), 12);

    EXPECT_FALSE(extract_json_string(data, path(nlohmann::json::array({ "data", "files", 1, "url" }))).has_value());
    EXPECT_FALSE(extract_json_string(data, path(nlohmann::json::array({ "data", "empty" }))).has_value());
    EXPECT_FALSE(extract_json_string(data, path(nlohmann::json::array({ "data", "none" }))).has_value());
    EXPECT_FALSE(extract_json_string(data, path(nlohmann::json::array({ "data", "files" }))).has_value());
    EXPECT_FALSE(extract_json_string(data, path(nlohmann::json::array({ "data", "id", "deeper" }))).has_value());
    EXPECT_EQ(extract_json_path(data, {}), nullptr);
}

TEST(json_path_test, string_integers) {
    const auto data = nlohmann::json::parse(R"({"ttl": "3600", "bad": "soon"})");
    EXPECT_EQ(extract_json_integer(data, path(nlohmann::json::array({ "ttl" }))), 3600);
    EXPECT_FALSE(extract_json_integer(data, path(nlohmann::json::array({ "bad" }))).has_value());
}

TEST(json_path_test, api_status) {
    EXPECT_FALSE(json_api_status_error(nlohmann::json::parse(R"({"status": 200, "response": {}})")).has_value());
    EXPECT_FALSE(json_api_status_error(nlohmann::json::parse(R"({"status": "ok"})")).has_value());
    EXPECT_FALSE(json_api_status_error(nlohmann::json::parse(R"({"status": "success"})")).has_value());
    EXPECT_FALSE(json_api_status_error(nlohmann::json::parse(R"({"data": {}})")).has_value());
    EXPECT_FALSE(json_api_status_error(nlohmann::json::parse(R"([1, 2])")).has_value());

    EXPECT_EQ(json_api_status_error(nlohmann::json::parse(R"({"status": 401, "details": "Bad login"})")), "Bad login");
    EXPECT_EQ(json_api_status_error(nlohmann::json::parse(R"({"status": "error", "response": {"msg": "quota"}})")), "quota");
    EXPECT_EQ(json_api_status_error(nlohmann::json::parse(R"({"status": false})")), "status false");
}
