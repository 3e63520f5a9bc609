#include "worker.hpp"
#include "logging.hpp"
#include "unfinished_chunk.hpp"

namespace piecemeal {

Worker::Worker(asio::io_context &io, std::shared_ptr<PieceHost> host)
    : io_(io), host_(std::move(host)) {}

void Worker::queue_chunk(std::shared_ptr<UnfinishedChunk> chunk) {
  auto self = shared_from_this();
  asio::post(io_, [self, chunk]() { self->process(chunk); });
}

void Worker::process(std::shared_ptr<UnfinishedChunk> chunk) {
  ClaimResult claim = chunk->claim_piece(host_->id(), shared_from_this());
  switch (claim.kind) {
  case ClaimResult::Skip:
    chunk->mark_worker_done(false);
    return;
  case ClaimResult::Standby:
    Logger::instance().log(LogLevel::TRACE, "worker %s standing by on chunk %llu",
                           host_->id().c_str(),
                           (unsigned long long)chunk->index());
    return;
  case ClaimResult::Fetch:
    fetch(chunk, claim.piece_index);
    return;
  }
}

void Worker::fetch(std::shared_ptr<UnfinishedChunk> chunk,
                   uint64_t piece_index) {
  const ChunkDescriptor &desc = chunk->descriptor();
  const PieceInfo &info = desc.piece_lookup.at(host_->id());

  // A fetch running past the latency target pulls in a standby worker.
  auto timer = std::make_shared<asio::steady_timer>(io_);
  if (desc.latency_target.count() > 0) {
    timer->expires_after(desc.latency_target);
    HostId id = host_->id();
    timer->async_wait([chunk, timer, id](std::error_code ec) {
      if (ec)
        return;
      if (auto standby = chunk->escalate()) {
        Logger::instance().log(LogLevel::DEBUG,
                               "chunk %llu: %s is slow, activating %s",
                               (unsigned long long)chunk->index(), id.c_str(),
                               standby->host_id().c_str());
        standby->queue_chunk(chunk);
      }
    });
  }

  std::vector<uint8_t> data;
  bool ok = host_->fetch(info.content_hash, data);
  timer->cancel();
  if (ok && hash_bytes(data) != info.content_hash) {
    Logger::instance().log(LogLevel::WARN,
                           "chunk %llu: piece %llu from %s failed hash check",
                           (unsigned long long)chunk->index(),
                           (unsigned long long)piece_index,
                           host_->id().c_str());
    ok = false;
  }

  if (ok) {
    fetched_.fetch_add(1);
    chunk->record_piece(host_->id(), std::move(data));
    chunk->mark_worker_done(true);
    return;
  }

  failures_.fetch_add(1);
  Logger::instance().log(LogLevel::DEBUG,
                         "chunk %llu: fetching piece %llu from %s failed",
                         (unsigned long long)chunk->index(),
                         (unsigned long long)piece_index, host_->id().c_str());
  chunk->unclaim_piece(host_->id());
  chunk->mark_worker_done(false);
  if (auto standby = chunk->next_standby())
    standby->queue_chunk(chunk);
}

} // namespace piecemeal
