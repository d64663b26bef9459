#include "./connection_governor.hpp"

SlotPool::SlotPool(unsigned int size_) : free_slots {size_ == 0 ? 1 : size_} {}

bool SlotPool::acquire(const std::atomic<bool> &cancel) {
    std::unique_lock<std::mutex> lock { mutex };
    while (free_slots == 0) {
        if (cancel.load()) {
            return false;
        }
        condition.wait_for(lock, std::chrono::milliseconds(GOVERNOR_CANCEL_CHECK_MS));
    }
    if (cancel.load()) {
        return false;
    }
    free_slots--;
    return true;
}

void SlotPool::release() {
    std::unique_lock<std::mutex> lock { mutex };
    free_slots++;
    lock.unlock();
    condition.notify_one();
}

unsigned int SlotPool::available() const {
    std::lock_guard<std::mutex> lock { mutex };
    return free_slots;
}

ConnectionSlot::ConnectionSlot(SlotPool &global_, SlotPool &host_) : global {global_}, host {host_} {}

ConnectionSlot::~ConnectionSlot() {
    host.release();
    global.release();
}

ConnectionGovernor::ConnectionGovernor(unsigned int global_max) : global_pool {global_max} {}

void ConnectionGovernor::set_host_limit(const std::string &host_id, unsigned int max_connections) {
    std::lock_guard<std::mutex> lock { hosts_mutex };
    host_pools[host_id] = std::make_unique<SlotPool>(max_connections);
}

SlotPool &ConnectionGovernor::host_pool(const std::string &host_id) {
    std::lock_guard<std::mutex> lock { hosts_mutex };
    auto &pool = host_pools[host_id];
    if (!pool) {
        pool = std::make_unique<SlotPool>(GOVERNOR_HOST_CONNECTIONS_DEFAULT);
    }
    return *pool;
}

std::unique_ptr<ConnectionSlot> ConnectionGovernor::acquire(const std::string &host_id, const std::atomic<bool> &cancel) {
    auto &host = host_pool(host_id);
    if (!global_pool.acquire(cancel)) {
        return nullptr;
    }
    if (!host.acquire(cancel)) {
        global_pool.release();
        return nullptr;
    }
    return std::make_unique<ConnectionSlot>(global_pool, host);
}

unsigned int ConnectionGovernor::global_available() const {
    return global_pool.available();
}

unsigned int ConnectionGovernor::host_available(const std::string &host_id) {
    return host_pool(host_id).available();
}
