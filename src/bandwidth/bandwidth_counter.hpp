#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

// Bytes sent by all concurrent transfers of one engine.
class BandwidthCounter {
  public:
    BandwidthCounter();

    void add(std::uint64_t bytes);
    std::uint64_t total() const;

    // bytes per second since the previous call (or construction)
    double sample_rate();

  private:
    std::atomic<std::uint64_t> bytes;

    std::mutex sample_mutex;
    std::uint64_t last_sample_bytes;
    std::chrono::steady_clock::time_point last_sample_time;
};

// called with bytes sent so far and file size
typedef std::function<void(std::uint64_t, std::uint64_t)> transfer_progress_callback_t;

// Converts running totals reported by one transfer attempt into deltas for
// the shared counter. Repeated or lower totals add nothing. A retry attempt
// uses a new instance.
class TransferProgress {
  public:
    TransferProgress(BandwidthCounter &counter_, transfer_progress_callback_t on_progress_);

    void report(std::uint64_t bytes_total, std::uint64_t file_size);

    std::uint64_t transferred() const;

  private:
    BandwidthCounter &counter;
    transfer_progress_callback_t on_progress;
    std::uint64_t bytes_so_far;
};
