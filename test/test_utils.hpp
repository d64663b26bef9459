#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "../src/hosts/host_registry.hpp"

#define STRING(x) #x
#define XSTRING(x) STRING(x)

#define APP_NAME XSTRING(CMAKE_PROJECT_NAME)
#define SOURCE_DIR XSTRING(CMAKE_SOURCE_DIR)

std::string get_asset(std::string file);

std::string get_tmp_dir();

// empty directory under the tmp dir, removed first if it exists
std::filesystem::path make_tmp_dir(const std::string &name);

void write_file(const std::filesystem::path &path, const std::string &content);

// registry with the given descriptors, fails the test if any is rejected
HostRegistry make_registry(const std::vector<nlohmann::json> &descriptors);
