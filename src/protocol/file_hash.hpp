#pragma once

#include <filesystem>
#include <optional>
#include <string>

// lowercase hex MD5 of the file contents, nullopt if the file can not be read
std::optional<std::string> file_md5(const std::filesystem::path &path);
