#include "./bandwidth_counter.hpp"

BandwidthCounter::BandwidthCounter() :
    bytes {0},
    last_sample_bytes {0},
    last_sample_time {std::chrono::steady_clock::now()} {}

void BandwidthCounter::add(std::uint64_t delta) {
    bytes.fetch_add(delta, std::memory_order_relaxed);
}

std::uint64_t BandwidthCounter::total() const {
    return bytes.load(std::memory_order_relaxed);
}

double BandwidthCounter::sample_rate() {
    std::lock_guard<std::mutex> lock { sample_mutex };
    const auto now = std::chrono::steady_clock::now();
    const auto current = total();
    const auto seconds = std::chrono::duration<double>(now - last_sample_time).count();
    const auto delta = current - last_sample_bytes;
    last_sample_bytes = current;
    last_sample_time = now;
    if (seconds <= 0) {
        return 0;
    }
    return static_cast<double>(delta) / seconds;
}

TransferProgress::TransferProgress(BandwidthCounter &counter_, transfer_progress_callback_t on_progress_) :
    counter {counter_},
    on_progress {on_progress_},
    bytes_so_far {0} {}

void TransferProgress::report(std::uint64_t bytes_total, std::uint64_t file_size) {
    if (bytes_total <= bytes_so_far) {
        return;
    }
    counter.add(bytes_total - bytes_so_far);
    bytes_so_far = bytes_total;
    if (on_progress) {
        on_progress(bytes_total, file_size);
    }
}

std::uint64_t TransferProgress::transferred() const {
    return bytes_so_far;
}
