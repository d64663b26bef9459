#include <gtest/gtest.h>

#include "../src/config/engine_config.hpp"
#include "test_utils.hpp"

TEST(engine_config_test, defaults) {
    const auto parsed = parse_engine_config(nlohmann::json::object(), "");
    ASSERT_TRUE(std::holds_alternative<engine_config_t>(parsed));
    const auto &config = std::get<engine_config_t>(parsed);
    EXPECT_EQ(config.parallelism, CONFIG_PARALLELISM_DEFAULT);
    EXPECT_EQ(config.global_connections, CONFIG_GLOBAL_CONNECTIONS_DEFAULT);
    EXPECT_EQ(config.max_retries, CONFIG_MAX_RETRIES_DEFAULT);
    EXPECT_EQ(config.token_safety_margin, CONFIG_SAFETY_MARGIN_DEFAULT);
    EXPECT_EQ(config.token_store_path.string(), CONFIG_TOKEN_STORE_DEFAULT);
    EXPECT_EQ(config.file_prefix, CONFIG_FILE_PREFIX_DEFAULT);
    EXPECT_TRUE(config.hosts.empty());
    EXPECT_TRUE(enabled_host_ids(config).empty());
}

TEST(engine_config_test, load_from_file) {
    const auto dir = make_tmp_dir("engine_config");
    write_file(dir / "hostup.json", R"({
        "parallelism": 8,
        "max_retries": 0,
        "token_store": "state/tokens.sqlite",
        "user_hosts_dir": "/etc/hostup/hosts",
        "hosts": {
            "imx": {"credential": "key-1", "max_connections": 1},
            "rapidgator": {"credential": "me:secret"},
            "filedot": {"enabled": false, "credential": "me:secret"}
        }
    })");

    const auto loaded = load_engine_config(dir / "hostup.json");
    ASSERT_TRUE(std::holds_alternative<engine_config_t>(loaded)) << std::get<std::string>(loaded);
    const auto &config = std::get<engine_config_t>(loaded);
    EXPECT_EQ(config.parallelism, 8);
    EXPECT_EQ(config.max_retries, 0);
    EXPECT_EQ(config.token_store_path.string(), (dir / "state/tokens.sqlite").lexically_normal().string());
    EXPECT_EQ(config.user_hosts_dir.string(), "/etc/hostup/hosts");
    EXPECT_EQ(config.hosts.at("imx").max_connections, 1u);
    EXPECT_FALSE(config.hosts.at("rapidgator").max_connections.has_value());
    EXPECT_EQ(enabled_host_ids(config), std::vector<std::string>({ "imx", "rapidgator" }));
}

TEST(engine_config_test, invalid_values) {
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_engine_config(nlohmann::json::array(), "")));
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_engine_config({{"parallelism", 0}}, "")));
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_engine_config({{"max_retries", -1}}, "")));
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_engine_config({{"parallelism", "many"}}, "")));
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_engine_config({{"hosts", {{"imx", {{"max_connections", 0}}}}}}, "")));
}

TEST(engine_config_test, missing_or_broken_file) {
    EXPECT_TRUE(std::holds_alternative<std::string>(load_engine_config(get_asset("no-such-config.json"))));
    const auto dir = make_tmp_dir("engine_config_broken");
    write_file(dir / "hostup.json", "{\"parallelism\": ");
    EXPECT_TRUE(std::holds_alternative<std::string>(load_engine_config(dir / "hostup.json")));
}
