#pragma once
#include <asio.hpp>
#include <atomic>
#include <memory>
#include "host.hpp"

namespace piecemeal {

class UnfinishedChunk;

// Fetches this host's piece of each chunk it is handed. Work runs on the
// downloader's io_context threads.
class Worker : public std::enable_shared_from_this<Worker> {
public:
    Worker(asio::io_context& io, std::shared_ptr<PieceHost> host);

    const HostId& host_id() const { return host_->id(); }
    void queue_chunk(std::shared_ptr<UnfinishedChunk> chunk);

    size_t pieces_fetched() const { return fetched_.load(); }
    size_t fetch_failures() const { return failures_.load(); }

private:
    void process(std::shared_ptr<UnfinishedChunk> chunk);
    void fetch(std::shared_ptr<UnfinishedChunk> chunk, uint64_t piece_index);

    asio::io_context& io_;
    std::shared_ptr<PieceHost> host_;
    std::atomic<size_t> fetched_{0};
    std::atomic<size_t> failures_{0};
};

} // namespace piecemeal
