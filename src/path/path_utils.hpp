#pragma once

#include <filesystem>
#include <string>
#include <vector>

// Explorer-style order: digit runs compare as numbers, the rest compares
// case-insensitively, so "img2" goes before "img10".
// Returns negative, zero or positive like strcmp.
int natural_compare(const std::string &a, const std::string &b);

// sorts by file name with natural_compare, ties keep the full path order
void natural_sort(std::vector<std::filesystem::path> &files);

// strips the "<prefix>_<digits>_" marker added to local copies
std::string clean_upload_name(const std::string &file_name, const std::string &prefix);

// .jpg .jpeg .png .gif .webp files directly inside dir, natural sorted
std::vector<std::filesystem::path> list_gallery_files(const std::filesystem::path &dir);
