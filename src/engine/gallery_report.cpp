#include <algorithm>

#include "./gallery_report.hpp"

void report_add_result(gallery_upload_report_t &report, const upload_result_t &result) {
    auto &host = report.hosts[result.host_id];
    host.results.push_back(result);
    switch (result.state) {
        case task_state_t::completed:
            host.succeeded++;
            report.succeeded++;
            break;
        case task_state_t::cancelled:
            host.cancelled++;
            report.cancelled++;
            break;
        default:
            host.failed++;
            report.failed++;
            report.failed_files.push_back(failed_file_t {
                result.file_name,
                result.host_id,
                result.error.has_value() ? describe_error(result.error.value()) : std::string("unknown error")
            });
            break;
    }
}

std::optional<dimension_stats_t> compute_dimension_stats(const std::map<std::string, image_dimensions_t> &dimensions) {
    dimension_stats_t stats;
    double width_sum = 0;
    double height_sum = 0;
    for (const auto &d : dimensions) {
        const auto &size = d.second;
        if (size.width == 0 || size.height == 0) {
            continue;
        }
        if (stats.count == 0) {
            stats.min_width = size.width;
            stats.min_height = size.height;
        }
        stats.min_width = std::min(stats.min_width, size.width);
        stats.min_height = std::min(stats.min_height, size.height);
        stats.max_width = std::max(stats.max_width, size.width);
        stats.max_height = std::max(stats.max_height, size.height);
        width_sum += size.width;
        height_sum += size.height;
        stats.count++;
    }
    if (stats.count == 0) {
        return std::nullopt;
    }
    stats.average_width = width_sum / stats.count;
    stats.average_height = height_sum / stats.count;
    return stats;
}

void print_report(FILE *stream, const gallery_upload_report_t &report) {
    fprintf(stream, "Files: %u, uploaded: %u, failed: %u, skipped: %u, cancelled: %u\n",
        report.total_files, report.succeeded, report.failed, report.skipped, report.cancelled);
    fprintf(stream, "Sent %llu bytes in %.1f s (%.1f KB/s)\n",
        static_cast<unsigned long long>(report.total_bytes), report.elapsed_seconds, report.average_throughput / 1024.0);
    if (report.dimensions.has_value()) {
        const auto &d = report.dimensions.value();
        fprintf(stream, "Images: %u, average %.0fx%.0f, min %ux%u, max %ux%u\n",
            d.count, d.average_width, d.average_height, d.min_width, d.min_height, d.max_width, d.max_height);
    }
    for (const auto &h : report.hosts) {
        fprintf(stream, "[%s]%s%s\n", h.first.c_str(), h.second.gallery_id.has_value() ? " gallery " : "", h.second.gallery_id.value_or("").c_str());
        for (const auto &r : h.second.results) {
            if (r.state == task_state_t::completed) {
                fprintf(stream, "  %s -> %s\n", r.file_name.c_str(), r.download_url.c_str());
            }
        }
    }
    for (const auto &f : report.failed_files) {
        fprintf(stream, "Failed: %s\n", f.message.c_str());
    }
    if (report.aborted) {
        fprintf(stream, "Gallery upload aborted: %s\n", report.abort_reason.c_str());
    }
}
