#pragma once
#include <asio.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "download.hpp"
#include "file_layout.hpp"
#include "memory_manager.hpp"
#include "worker.hpp"

namespace piecemeal {

struct DownloaderConfig {
    int threads{4};
    uint64_t memory_budget{256ull << 20};
    // Zero disables latency-driven standby escalation. A host fetch blocks
    // the io thread it runs on, so the escalation timer needs a second
    // thread; start() runs at least two when this is set.
    std::chrono::milliseconds latency_target{0};
    int overdrive{0};
};

struct DownloadRequest {
    uint64_t offset{0};
    uint64_t length{0};
    std::shared_ptr<DownloadDestination> destination;
    uint64_t priority{0};
    bool high_priority{false};
};

class Downloader {
public:
    explicit Downloader(const DownloaderConfig& cfg);
    ~Downloader();
    Downloader(const Downloader&) = delete;
    Downloader& operator=(const Downloader&) = delete;

    void add_host(std::shared_ptr<PieceHost> host);
    void start();
    // Waits for queued work to drain, then joins the threads.
    void stop();

    // Schedules every chunk of the request, blocking while the memory budget
    // is exhausted. `out` is set whenever a Download object was created, even
    // if scheduling later failed (it is then already failed).
    Status download(const FileLayout& file, const DownloadRequest& req,
                    std::shared_ptr<Download>& out);

    MemoryManager& memory() { return memory_; }
    size_t thread_count() const { return threads_.size(); }
    std::vector<std::shared_ptr<Worker>> workers() const;

private:
    uint64_t chunk_memory(const FileLayout& file) const;

    DownloaderConfig cfg_;
    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    std::vector<std::thread> threads_;
    MemoryManager memory_;

    mutable std::mutex mtx_;
    std::vector<std::shared_ptr<Worker>> workers_;
};

} // namespace piecemeal
