#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "./host_descriptor.hpp"

struct host_load_error_t {
    std::string source;
    std::string error;
};

// Immutable after loading, so it is shared between upload workers without locking.
class HostRegistry {
  public:
    HostRegistry() = default;

    // loads every *.json in builtin_dir, then applies *.json from user_dir as
    // merge patches on top of built-ins with the same id (or adds new hosts).
    // Missing directories are ignored.
    static HostRegistry load(const std::filesystem::path &builtin_dir, const std::filesystem::path &user_dir);

    // raw documents are kept so overrides can be merged before validation
    void add_builtin(const nlohmann::json &document, const std::string &source);
    void add_override(const nlohmann::json &document, const std::string &source);

    std::optional<host_descriptor_t> get(const std::string &host_id) const;

    // all valid descriptors, ordered by id
    std::vector<host_descriptor_t> list() const;

    // descriptors whose id is in enabled_ids
    std::vector<host_descriptor_t> list_enabled(const std::vector<std::string> &enabled_ids) const;

    // entries rejected at load time
    const std::vector<host_load_error_t> &get_errors() const;

  private:
    void rebuild(const std::string &host_id, const std::string &source);

    std::map<std::string, nlohmann::json> documents;
    std::map<std::string, host_descriptor_t> hosts;
    std::vector<host_load_error_t> errors;
};
