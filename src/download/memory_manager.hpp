#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>

namespace piecemeal {

// Shared byte budget for chunk buffers. Requests block until enough memory is
// returned; high priority requests are served before low priority ones.
class MemoryManager {
public:
    explicit MemoryManager(uint64_t capacity);

    // Blocks until `bytes` can be granted. Returns false immediately if the
    // request can never fit or the manager was stopped.
    bool request(uint64_t bytes, bool high_priority = false);
    bool try_request(uint64_t bytes);
    // Throws std::logic_error when more is returned than is outstanding.
    void release(uint64_t bytes);
    // Wakes all blocked requests and makes them fail.
    void stop();

    uint64_t capacity() const { return capacity_; }
    uint64_t available() const;
    uint64_t outstanding() const;

private:
    struct Waiter {
        uint64_t bytes;
        bool high_priority;
    };

    bool front_of_queue(const Waiter* w) const;

    const uint64_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    uint64_t available_;
    bool stopped_{false};
    std::deque<Waiter*> waiters_;
};

} // namespace piecemeal
