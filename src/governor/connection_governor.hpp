#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#define GOVERNOR_GLOBAL_CONNECTIONS_DEFAULT 3
#define GOVERNOR_HOST_CONNECTIONS_DEFAULT 2
// waiting workers look at the cancel flag this often
#define GOVERNOR_CANCEL_CHECK_MS 100

class SlotPool {
  public:
    explicit SlotPool(unsigned int size_);

    // false if cancel was raised before a slot became free
    bool acquire(const std::atomic<bool> &cancel);
    void release();

    unsigned int available() const;

  private:
    mutable std::mutex mutex;
    std::condition_variable condition;
    unsigned int free_slots;
};

// Holds one global and one host slot until destroyed.
class ConnectionSlot {
  public:
    ConnectionSlot(SlotPool &global_, SlotPool &host_);
    ~ConnectionSlot();

    ConnectionSlot(const ConnectionSlot &) = delete;
    ConnectionSlot &operator=(const ConnectionSlot &) = delete;

  private:
    SlotPool &global;
    SlotPool &host;
};

class ConnectionGovernor {
  public:
    explicit ConnectionGovernor(unsigned int global_max = GOVERNOR_GLOBAL_CONNECTIONS_DEFAULT);

    // per-host ceiling, must be set before the first acquire for the host
    void set_host_limit(const std::string &host_id, unsigned int max_connections);

    // Blocks until both the global and the host slot are free, global first.
    // nullptr if cancel was raised while waiting.
    std::unique_ptr<ConnectionSlot> acquire(const std::string &host_id, const std::atomic<bool> &cancel);

    unsigned int global_available() const;
    unsigned int host_available(const std::string &host_id);

  private:
    SlotPool &host_pool(const std::string &host_id);

    SlotPool global_pool;
    std::mutex hosts_mutex;
    std::map<std::string, std::unique_ptr<SlotPool>> host_pools;
};
