#include <algorithm>
#include <cstdio>
#include <fstream>

#include "./host_registry.hpp"

static std::vector<std::filesystem::path> list_json_files(const std::filesystem::path &dir) {
    std::vector<std::filesystem::path> ret;
    std::error_code ec;
    if (dir.empty() || !std::filesystem::is_directory(dir, ec)) {
        return ret;
    }
    for (const auto &entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            ret.push_back(entry.path());
        }
    }
    std::sort(ret.begin(), ret.end());
    return ret;
}

static std::optional<nlohmann::json> read_json_file(const std::filesystem::path &path, std::vector<host_load_error_t> &errors) {
    std::ifstream stream(path);
    if (!stream) {
        errors.push_back(host_load_error_t { path.string(), "cannot open file" });
        fprintf(stderr, "[hosts] Cannot open host descriptor \"%s\"\n", path.string().c_str());
        return std::nullopt;
    }
    try {
        nlohmann::json document = nlohmann::json::parse(stream);
        if (!document.is_object()) {
            errors.push_back(host_load_error_t { path.string(), "not a JSON object" });
            fprintf(stderr, "[hosts] Host descriptor \"%s\" is not a JSON object\n", path.string().c_str());
            return std::nullopt;
        }
        if (!document.contains("id")) {
            document["id"] = path.stem().string();
        }
        return document;
    } catch (const nlohmann::json::parse_error &e) {
        errors.push_back(host_load_error_t { path.string(), e.what() });
        fprintf(stderr, "[hosts] Could not parse host descriptor \"%s\": %s\n", path.string().c_str(), e.what());
        return std::nullopt;
    }
}

HostRegistry HostRegistry::load(const std::filesystem::path &builtin_dir, const std::filesystem::path &user_dir) {
    HostRegistry registry;
    for (const auto &file : list_json_files(builtin_dir)) {
        const auto document = read_json_file(file, registry.errors);
        if (document.has_value()) {
            registry.add_builtin(document.value(), file.string());
        }
    }
    for (const auto &file : list_json_files(user_dir)) {
        const auto document = read_json_file(file, registry.errors);
        if (document.has_value()) {
            registry.add_override(document.value(), file.string());
        }
    }
    fprintf(stdout, "[hosts] Loaded %zu host descriptors (%zu rejected)\n", registry.hosts.size(), registry.errors.size());
    return registry;
}

static std::string document_id(const nlohmann::json &document) {
    const auto it = document.find("id");
    if (it == document.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

void HostRegistry::add_builtin(const nlohmann::json &document, const std::string &source) {
    const auto host_id = document_id(document);
    if (host_id.empty()) {
        errors.push_back(host_load_error_t { source, "missing \"id\"" });
        fprintf(stderr, "[hosts] Rejected host descriptor from %s: missing \"id\"\n", source.c_str());
        return;
    }
    documents[host_id] = document;
    rebuild(host_id, source);
}

void HostRegistry::add_override(const nlohmann::json &document, const std::string &source) {
    const auto host_id = document_id(document);
    if (host_id.empty()) {
        errors.push_back(host_load_error_t { source, "missing \"id\"" });
        fprintf(stderr, "[hosts] Rejected host override from %s: missing \"id\"\n", source.c_str());
        return;
    }
    auto it = documents.find(host_id);
    if (it == documents.end()) {
        documents[host_id] = document;
    } else {
        it->second.merge_patch(document);
    }
    rebuild(host_id, source);
}

void HostRegistry::rebuild(const std::string &host_id, const std::string &source) {
    const auto parsed = parse_host_descriptor(documents.at(host_id), host_id);
    if (std::holds_alternative<std::string>(parsed)) {
        const auto &error = std::get<std::string>(parsed);
        errors.push_back(host_load_error_t { source, error });
        fprintf(stderr, "[hosts] Rejected host \"%s\" from %s: %s\n", host_id.c_str(), source.c_str(), error.c_str());
        hosts.erase(host_id);
        return;
    }
    hosts[host_id] = std::get<host_descriptor_t>(parsed);
}

std::optional<host_descriptor_t> HostRegistry::get(const std::string &host_id) const {
    const auto it = hosts.find(host_id);
    if (it == hosts.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<host_descriptor_t> HostRegistry::list() const {
    std::vector<host_descriptor_t> ret;
    for (const auto &h : hosts) {
        ret.push_back(h.second);
    }
    return ret;
}

std::vector<host_descriptor_t> HostRegistry::list_enabled(const std::vector<std::string> &enabled_ids) const {
    std::vector<host_descriptor_t> ret;
    for (const auto &h : hosts) {
        if (std::find(enabled_ids.begin(), enabled_ids.end(), h.first) != enabled_ids.end()) {
            ret.push_back(h.second);
        }
    }
    return ret;
}

const std::vector<host_load_error_t> &HostRegistry::get_errors() const {
    return errors;
}
