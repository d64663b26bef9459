#include <algorithm>
#include <cctype>

#include "./path_utils.hpp"

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

static int compare_digit_runs(const std::string &a, const std::string &b) {
    const auto a_start = std::min(a.find_first_not_of('0'), a.size());
    const auto b_start = std::min(b.find_first_not_of('0'), b.size());
    const auto a_len = a.size() - a_start;
    const auto b_len = b.size() - b_start;
    if (a_len != b_len) {
        return a_len < b_len ? -1 : 1;
    }
    const auto c = a.compare(a_start, a_len, b, b_start, b_len);
    if (c != 0) {
        return c < 0 ? -1 : 1;
    }
    // "01" after "1"
    if (a.size() != b.size()) {
        return a.size() < b.size() ? -1 : 1;
    }
    return 0;
}

static int compare_text_runs(const std::string &a, const std::string &b) {
    const auto n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; i++) {
        const auto ca = std::tolower(static_cast<unsigned char>(a[i]));
        const auto cb = std::tolower(static_cast<unsigned char>(b[i]));
        if (ca != cb) {
            return ca < cb ? -1 : 1;
        }
    }
    if (a.size() != b.size()) {
        return a.size() < b.size() ? -1 : 1;
    }
    return 0;
}

static std::string next_run(const std::string &s, size_t &pos) {
    const auto start = pos;
    const bool digits = is_digit(s[pos]);
    while (pos < s.size() && is_digit(s[pos]) == digits) {
        pos++;
    }
    return s.substr(start, pos - start);
}

int natural_compare(const std::string &a, const std::string &b) {
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size()) {
        const bool a_digits = is_digit(a[i]);
        const bool b_digits = is_digit(b[j]);
        if (a_digits != b_digits) {
            // digits go before letters
            return a_digits ? -1 : 1;
        }
        const auto run_a = next_run(a, i);
        const auto run_b = next_run(b, j);
        const auto c = a_digits ? compare_digit_runs(run_a, run_b) : compare_text_runs(run_a, run_b);
        if (c != 0) {
            return c;
        }
    }
    if (i < a.size()) {
        return 1;
    }
    if (j < b.size()) {
        return -1;
    }
    return 0;
}

void natural_sort(std::vector<std::filesystem::path> &files) {
    std::stable_sort(files.begin(), files.end(), [](const std::filesystem::path &a, const std::filesystem::path &b) {
        const auto c = natural_compare(a.filename().string(), b.filename().string());
        if (c != 0) {
            return c < 0;
        }
        return a.string() < b.string();
    });
}

std::string clean_upload_name(const std::string &file_name, const std::string &prefix) {
    if (prefix.empty()) {
        return file_name;
    }
    const auto marker = prefix + "_";
    if (file_name.compare(0, marker.size(), marker) != 0) {
        return file_name;
    }
    auto pos = marker.size();
    const auto digits_start = pos;
    while (pos < file_name.size() && is_digit(file_name[pos])) {
        pos++;
    }
    if (pos == digits_start || pos >= file_name.size() || file_name[pos] != '_' || pos + 1 == file_name.size()) {
        return file_name;
    }
    return file_name.substr(pos + 1);
}

std::vector<std::filesystem::path> list_gallery_files(const std::filesystem::path &dir) {
    static const std::vector<std::string> extensions = { ".jpg", ".jpeg", ".png", ".gif", ".webp" };
    std::vector<std::filesystem::path> ret;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return ret;
    }
    for (const auto &entry : std::filesystem::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        auto ext = entry.path().extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (std::find(extensions.begin(), extensions.end(), ext) != extensions.end()) {
            ret.push_back(entry.path());
        }
    }
    natural_sort(ret);
    return ret;
}
