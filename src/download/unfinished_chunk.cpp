#include "unfinished_chunk.hpp"
#include "destination.hpp"
#include "download.hpp"
#include "logging.hpp"
#include "memory_manager.hpp"
#include <stdexcept>
#include <string>

namespace piecemeal {

static void wipe_pieces(PieceSet &pieces) {
  for (auto &p : pieces) {
    if (p) {
      secure_wipe(*p);
      p.reset();
    }
  }
}

UnfinishedChunk::UnfinishedChunk(ChunkDescriptor desc,
                                 std::weak_ptr<Download> download,
                                 MemoryManager &memory,
                                 uint64_t memory_allocated, int workers)
    : desc_(std::move(desc)), download_(std::move(download)), memory_(memory) {
  if (!desc_.erasure_code || !desc_.cipher || !desc_.destination)
    throw std::invalid_argument("chunk requires erasure coder, cipher and "
                                "destination");
  const int n = desc_.erasure_code->num_pieces();
  for (const auto &kv : desc_.piece_lookup) {
    if (kv.second.piece_index >= (uint64_t)n)
      throw std::invalid_argument("piece index " +
                                  std::to_string(kv.second.piece_index) +
                                  " out of range for host " + kv.first);
  }
  state_.piece_data.assign(n, std::nullopt);
  state_.piece_claimed.assign(n, false);
  state_.workers_remaining = workers;
  state_.memory_allocated = memory_allocated;
}

int UnfinishedChunk::fetch_limit_locked() const {
  return desc_.erasure_code->min_pieces() + desc_.overdrive +
         state_.escalations;
}

RecordResult UnfinishedChunk::record_piece(const HostId &host,
                                           std::vector<uint8_t> data) {
  PieceSet pieces;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = desc_.piece_lookup.find(host);
    if (it == desc_.piece_lookup.end()) {
      Logger::instance().log(LogLevel::WARN,
                             "chunk %llu: host %s holds no piece, dropping %zu "
                             "bytes",
                             (unsigned long long)desc_.chunk_index,
                             host.c_str(), data.size());
      return RecordResult::Rejected;
    }
    const uint64_t idx = it->second.piece_index;
    const int min = desc_.erasure_code->min_pieces();
    if (state_.failed || state_.recovery_complete ||
        state_.pieces_completed >= min || state_.piece_data[idx]) {
      Logger::instance().log(LogLevel::TRACE,
                             "chunk %llu: discarding piece %llu from %s",
                             (unsigned long long)desc_.chunk_index,
                             (unsigned long long)idx, host.c_str());
      return RecordResult::Discarded;
    }
    if (!state_.piece_claimed[idx])
      state_.pieces_registered++;
    state_.piece_claimed[idx] = false;
    state_.piece_data[idx] = std::move(data);
    state_.pieces_completed++;
    Logger::instance().log(LogLevel::DEBUG,
                           "chunk %llu: piece %llu from %s (%d/%d)",
                           (unsigned long long)desc_.chunk_index,
                           (unsigned long long)idx, host.c_str(),
                           state_.pieces_completed, min);
    if (state_.pieces_completed < min)
      return RecordResult::Stored;

    // Threshold reached: this call owns the recovery. The pieces leave the
    // guarded state so that decrypt and decode run without the lock.
    pieces.swap(state_.piece_data);
    state_.piece_data.assign(pieces.size(), std::nullopt);
    state_.recovering = true;
  }
  Status st = recover_logical_data(std::move(pieces));
  return st.ok() ? RecordResult::Recovered : RecordResult::RecoveryFailed;
}

Status UnfinishedChunk::recover_logical_data(PieceSet pieces) {
  for (size_t i = 0; i < pieces.size(); i++) {
    if (!pieces[i])
      continue;
    if (!desc_.cipher->decrypt(desc_.chunk_index, i, *pieces[i])) {
      wipe_pieces(pieces);
      return end_recovery(Status(Errc::decrypt_failed,
                                 "unable to decrypt piece " +
                                     std::to_string(i)));
    }
  }
  if (failed()) {
    wipe_pieces(pieces);
    return end_recovery(Status());
  }

  std::vector<uint8_t> logical;
  Status st =
      desc_.erasure_code->recover(pieces, desc_.chunk_size, logical);
  wipe_pieces(pieces);
  if (!st.ok()) {
    secure_wipe(logical);
    return end_recovery(st.with_context("unable to recover chunk"));
  }
  // The download closes the destination when a chunk fails.
  if (failed()) {
    secure_wipe(logical);
    return end_recovery(Status());
  }

  std::error_code ec = desc_.destination->write_at(
      logical.data() + desc_.fetch_offset, (size_t)desc_.fetch_length,
      desc_.write_offset);
  secure_wipe(logical);
  if (ec)
    return end_recovery(
        Status(Errc::write_failed, ec.message())
            .with_context("unable to write to download destination"));

  st = end_recovery(Status());
  if (!st.ok())
    return st;
  Logger::instance().log(LogLevel::DEBUG,
                         "chunk %llu recovered, wrote %llu bytes at %lld",
                         (unsigned long long)desc_.chunk_index,
                         (unsigned long long)desc_.fetch_length,
                         (long long)desc_.write_offset);

  if (auto d = download_.lock())
    d->report_chunk_success(desc_.fetch_length);
  return Status();
}

bool UnfinishedChunk::failed() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return state_.failed;
}

Status UnfinishedChunk::end_recovery(const Status &err) {
  bool first = false;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    state_.recovering = false;
    if (state_.failed) {
      // failed while the pipeline held the buffers; its release was deferred
      cleanup_locked();
      return state_.err;
    }
    if (err.ok()) {
      state_.recovery_complete = true;
      cleanup_locked();
      return err;
    }
    first = fail_locked(err);
  }
  if (first)
    report_failure(err);
  return err;
}

void UnfinishedChunk::cleanup_locked() {
  for (const auto &p : state_.piece_data) {
    if (p) {
      Logger::instance().log(LogLevel::ERROR,
                             "chunk %llu: piece buffers retained at cleanup",
                             (unsigned long long)desc_.chunk_index);
      throw std::logic_error("chunk cleanup with piece buffers retained");
    }
  }
  if (!state_.recovery_complete) {
    Logger::instance().log(LogLevel::ERROR,
                           "chunk %llu: cleanup before recovery complete",
                           (unsigned long long)desc_.chunk_index);
    throw std::logic_error("chunk cleanup before recovery complete");
  }
  if (state_.memory_allocated > 0) {
    memory_.release(state_.memory_allocated);
    state_.memory_allocated = 0;
  }
}

bool UnfinishedChunk::fail_locked(const Status &err) {
  if (state_.recovery_complete)
    return false;
  state_.failed = true;
  state_.recovery_complete = true;
  state_.err = err;
  wipe_pieces(state_.piece_data);
  state_.piece_claimed.assign(state_.piece_claimed.size(), false);
  state_.workers_standby.clear();
  if (!state_.recovering)
    cleanup_locked();
  Logger::instance().log(LogLevel::WARN, "chunk %llu failed: %s",
                         (unsigned long long)desc_.chunk_index,
                         err.message().c_str());
  return true;
}

void UnfinishedChunk::report_failure(const Status &err) {
  auto d = download_.lock();
  if (!d) {
    Logger::instance().log(LogLevel::DEBUG,
                           "chunk %llu failed after its download was released",
                           (unsigned long long)desc_.chunk_index);
    return;
  }
  d->fail(err.with_context("chunk " + std::to_string(desc_.chunk_index) +
                           " failed"));
}

void UnfinishedChunk::fail(const Status &err) {
  bool first;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    first = fail_locked(err);
  }
  if (first)
    report_failure(err);
}

void UnfinishedChunk::mark_worker_done(bool success) {
  Status err;
  bool first = false;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (state_.workers_remaining > 0)
      state_.workers_remaining--;
    const int min = desc_.erasure_code->min_pieces();
    if (!state_.recovery_complete &&
        state_.pieces_completed + state_.workers_remaining < min) {
      err = Status(Errc::insufficient_pieces,
                   std::to_string(state_.pieces_completed) + " of " +
                       std::to_string(min) +
                       " pieces retrieved and no workers remain");
      first = fail_locked(err);
    }
  }
  if (!success)
    Logger::instance().log(LogLevel::TRACE, "chunk %llu: worker gave up",
                           (unsigned long long)desc_.chunk_index);
  if (first)
    report_failure(err);
}

ClaimResult UnfinishedChunk::claim_piece(const HostId &host,
                                         const std::shared_ptr<Worker> &worker) {
  std::lock_guard<std::mutex> lk(mtx_);
  ClaimResult res;
  auto it = desc_.piece_lookup.find(host);
  if (it == desc_.piece_lookup.end())
    return res;
  if (state_.failed || state_.recovery_complete ||
      state_.pieces_completed >= desc_.erasure_code->min_pieces())
    return res;
  const uint64_t idx = it->second.piece_index;
  if (state_.piece_data[idx] || state_.piece_claimed[idx])
    return res;
  if (state_.pieces_registered >= fetch_limit_locked()) {
    if (worker)
      state_.workers_standby.push_back(worker);
    res.kind = ClaimResult::Standby;
    return res;
  }
  state_.piece_claimed[idx] = true;
  state_.pieces_registered++;
  res.kind = ClaimResult::Fetch;
  res.piece_index = idx;
  return res;
}

void UnfinishedChunk::unclaim_piece(const HostId &host) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = desc_.piece_lookup.find(host);
  if (it == desc_.piece_lookup.end())
    return;
  const uint64_t idx = it->second.piece_index;
  if (state_.piece_claimed[idx]) {
    state_.piece_claimed[idx] = false;
    state_.pieces_registered--;
  }
}

std::shared_ptr<Worker> UnfinishedChunk::next_standby() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (state_.recovery_complete || state_.workers_standby.empty() ||
      state_.pieces_registered >= fetch_limit_locked())
    return nullptr;
  auto w = state_.workers_standby.front();
  state_.workers_standby.pop_front();
  return w;
}

std::shared_ptr<Worker> UnfinishedChunk::escalate() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (state_.recovery_complete || state_.workers_standby.empty())
    return nullptr;
  state_.escalations++;
  auto w = state_.workers_standby.front();
  state_.workers_standby.pop_front();
  Logger::instance().log(LogLevel::DEBUG,
                         "chunk %llu: escalating, fetch limit now %d",
                         (unsigned long long)desc_.chunk_index,
                         fetch_limit_locked());
  return w;
}

ChunkStatus UnfinishedChunk::status() const {
  std::lock_guard<std::mutex> lk(mtx_);
  ChunkStatus s;
  s.failed = state_.failed;
  s.recovery_complete = state_.recovery_complete;
  s.pieces_completed = state_.pieces_completed;
  s.pieces_registered = state_.pieces_registered;
  s.workers_remaining = state_.workers_remaining;
  for (const auto &p : state_.piece_data)
    if (p)
      s.pieces_retained++;
  s.workers_standby = state_.workers_standby.size();
  s.memory_allocated = state_.memory_allocated;
  return s;
}

Status UnfinishedChunk::last_error() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return state_.err;
}

} // namespace piecemeal
