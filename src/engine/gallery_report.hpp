#pragma once

#include <cstdint>
#include <cstdio>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../errors/upload_error.hpp"
#include "../task/task_state.hpp"

struct image_dimensions_t {
    unsigned int width = 0;
    unsigned int height = 0;
};

struct dimension_stats_t {
    unsigned int count = 0;
    double average_width = 0;
    double average_height = 0;
    unsigned int min_width = 0;
    unsigned int min_height = 0;
    unsigned int max_width = 0;
    unsigned int max_height = 0;
};

// terminal value of one (file, host) task
struct upload_result_t {
    std::string file_name;
    std::string host_id;
    // completed, failed or cancelled
    task_state_t state = task_state_t::queued;
    std::string download_url;
    std::string host_file_id;
    std::uint64_t bytes_uploaded = 0;
    double elapsed_seconds = 0;
    bool deduplicated = false;
    unsigned int attempts = 0;
    std::optional<upload_error_t> error;
    bool retries_exhausted = false;
};

struct failed_file_t {
    std::string file_name;
    std::string host_id;
    std::string message;
};

struct host_report_t {
    std::vector<upload_result_t> results;
    std::optional<std::string> gallery_id;
    unsigned int succeeded = 0;
    unsigned int failed = 0;
    unsigned int cancelled = 0;
};

struct gallery_upload_report_t {
    std::map<std::string, host_report_t> hosts;
    // every file of the gallery, already uploaded ones included
    unsigned int total_files = 0;
    unsigned int succeeded = 0;
    unsigned int failed = 0;
    unsigned int skipped = 0;
    unsigned int cancelled = 0;
    std::uint64_t total_bytes = 0;
    double elapsed_seconds = 0;
    // bytes per second
    double average_throughput = 0;
    std::optional<dimension_stats_t> dimensions;
    std::vector<failed_file_t> failed_files;
    // the destination container could not be created
    bool aborted = false;
    std::string abort_reason;
};

void report_add_result(gallery_upload_report_t &report, const upload_result_t &result);

// nullopt when no dimensions are known
std::optional<dimension_stats_t> compute_dimension_stats(const std::map<std::string, image_dimensions_t> &dimensions);

void print_report(FILE *stream, const gallery_upload_report_t &report);
