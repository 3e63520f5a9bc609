#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "destination.hpp"
#include "errors.hpp"

namespace piecemeal {

// Single-fire broadcast event. Any number of threads may wait on it; callbacks
// registered after it fired run immediately.
class CompletionSignal {
public:
    // Returns true only for the call that actually fired the signal.
    bool fire();
    bool fired() const;
    void wait() const;
    bool wait_for(std::chrono::milliseconds timeout) const;
    void subscribe(std::function<void()> cb);
private:
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    bool fired_{false};
    std::vector<std::function<void()>> callbacks_;
};

// Tracks completion of every chunk belonging to one requested download.
class Download {
public:
    using clock = std::chrono::system_clock;

    Download(std::string name, std::shared_ptr<DownloadDestination> destination,
             uint64_t offset, uint64_t length, int chunks);

    // Called once by each chunk that recovered and wrote its data.
    void report_chunk_success(uint64_t bytes_written);
    // Marks the download failed. Only the first failure is recorded.
    void fail(const Status& err);

    void wait() const { done_.wait(); }
    bool wait_for(std::chrono::milliseconds timeout) const { return done_.wait_for(timeout); }
    void on_complete(std::function<void()> cb) { done_.subscribe(std::move(cb)); }

    bool complete() const { return done_.fired(); }
    bool failed() const;
    Status error() const;
    int chunks_remaining() const;
    uint64_t bytes_received() const { return bytes_received_.load(); }

    const std::string& name() const { return name_; }
    uint64_t offset() const { return offset_; }
    uint64_t length() const { return length_; }
    clock::time_point start_time() const { return start_time_; }
    clock::time_point end_time() const;

private:
    // Closes the destination and fires the signal; requires mtx_.
    void finish_locked(std::unique_lock<std::mutex>& lk);

    const std::string name_;
    const std::shared_ptr<DownloadDestination> destination_;
    const uint64_t offset_;
    const uint64_t length_;
    const clock::time_point start_time_;

    mutable std::mutex mtx_;
    int chunks_remaining_;
    bool finished_{false};
    Status err_;
    clock::time_point end_time_{};
    std::atomic<uint64_t> bytes_received_{0};
    CompletionSignal done_;
};

} // namespace piecemeal
