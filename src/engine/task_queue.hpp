#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>

// Blocking FIFO between the engine thread and upload workers.
template<class T>
class TaskQueue {
  public:
    T pop_front_waiting() {
        // unique_lock can be unlocked, lock_guard can not
        std::unique_lock<std::mutex> lock{ mutex };
        condition.wait(lock, [this]() { return !items.empty(); });
        auto t = std::move(items.front());
        items.pop_front();
        return t;
    }

    void push_back(T t) {
        std::unique_lock<std::mutex> lock{ mutex };
        items.push_back(std::move(t));
        lock.unlock();
        condition.notify_one();
    }

    // count copies of t, e.g. one stop event per worker
    void push_back_copies(const T &t, size_t count) {
        std::unique_lock<std::mutex> lock{ mutex };
        for (size_t i = 0; i < count; i++) {
            items.push_back(t);
        }
        lock.unlock();
        condition.notify_all();
    }

  private:
    std::deque<T> items;
    std::mutex mutex;
    std::condition_variable condition;
};
