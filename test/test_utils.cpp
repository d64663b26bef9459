#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "./test_utils.hpp"

std::string get_asset(std::string file) {
    return (std::filesystem::path(SOURCE_DIR) / std::filesystem::path("test/assets") / std::filesystem::path(file)).string();
}

std::string get_tmp_dir() {
    return std::string("./tmp-") + APP_NAME;
}

std::filesystem::path make_tmp_dir(const std::string &name) {
    const auto dir = std::filesystem::path(get_tmp_dir()) / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

void write_file(const std::filesystem::path &path, const std::string &content) {
    std::ofstream stream(path, std::ios::binary);
    stream << content;
}

HostRegistry make_registry(const std::vector<nlohmann::json> &descriptors) {
    HostRegistry registry;
    for (const auto &d : descriptors) {
        registry.add_builtin(d, "test");
    }
    for (const auto &e : registry.get_errors()) {
        ADD_FAILURE() << e.source << ": " << e.error;
    }
    return registry;
}
