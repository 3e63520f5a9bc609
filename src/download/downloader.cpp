#include "downloader.hpp"
#include "logging.hpp"
#include "unfinished_chunk.hpp"
#include <algorithm>
#include <stdexcept>

namespace piecemeal {

Downloader::Downloader(const DownloaderConfig &cfg)
    : cfg_(cfg), work_(asio::make_work_guard(io_)),
      memory_(cfg.memory_budget) {
  crypto_init();
}

Downloader::~Downloader() { stop(); }

void Downloader::add_host(std::shared_ptr<PieceHost> host) {
  auto w = std::make_shared<Worker>(io_, std::move(host));
  std::lock_guard<std::mutex> lk(mtx_);
  workers_.push_back(std::move(w));
}

std::vector<std::shared_ptr<Worker>> Downloader::workers() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return workers_;
}

void Downloader::start() {
  if (!threads_.empty())
    return;
  int n = std::max(1, cfg_.threads);
  if (cfg_.latency_target.count() > 0 && n < 2) {
    Logger::instance().log(LogLevel::WARN,
                           "latency target needs a second io thread, running 2");
    n = 2;
  }
  threads_.reserve(n);
  for (int i = 0; i < n; i++)
    threads_.emplace_back([this]() { io_.run(); });
  Logger::instance().log(LogLevel::INFO, "downloader started: %d threads, %zu "
                         "workers, %llu bytes of memory",
                         n, workers().size(),
                         (unsigned long long)cfg_.memory_budget);
}

void Downloader::stop() {
  work_.reset();
  for (auto &t : threads_)
    t.join();
  threads_.clear();
}

uint64_t Downloader::chunk_memory(const FileLayout &file) const {
  const int k = file.erasure_code->min_pieces();
  const int fetched =
      std::min(file.erasure_code->num_pieces(), k + cfg_.overdrive);
  return (uint64_t)fetched * (file.piece_size + file.cipher->overhead()) +
         file.chunk_size();
}

Status Downloader::download(const FileLayout &file, const DownloadRequest &req,
                            std::shared_ptr<Download> &out) {
  if (!file.erasure_code || !file.cipher || !req.destination)
    return Status(Errc::invalid_request,
                  "download needs an erasure coder, a cipher and a destination");
  if (file.piece_size == 0)
    return Status(Errc::invalid_request, "layout of " + file.name +
                                             " has a zero piece size");
  const uint64_t cs = file.chunk_size();
  if (file.chunks.size() < (file.size + cs - 1) / cs)
    return Status(Errc::invalid_request,
                  "layout of " + file.name + " lists " +
                      std::to_string(file.chunks.size()) + " chunks for " +
                      std::to_string(file.size) + " bytes");
  if (req.offset > file.size || req.length > file.size - req.offset)
    return Status(Errc::invalid_request,
                  "range [" + std::to_string(req.offset) + ", +" +
                      std::to_string(req.length) + ") exceeds file size " +
                      std::to_string(file.size));

  auto slices = plan_download(file, req.offset, req.length);
  auto workers = this->workers();
  if (!slices.empty() && workers.empty())
    return Status(Errc::invalid_request, "no hosts to download from");

  auto d = std::make_shared<Download>(file.name, req.destination, req.offset,
                                      req.length, (int)slices.size());
  out = d;
  Logger::instance().log(LogLevel::INFO,
                         "download %s: offset %llu length %llu, %zu chunks",
                         file.name.c_str(), (unsigned long long)req.offset,
                         (unsigned long long)req.length, slices.size());

  const uint64_t mem = chunk_memory(file);
  for (const auto &s : slices) {
    if (d->complete()) {
      Logger::instance().log(LogLevel::DEBUG,
                             "download %s ended early, not scheduling chunk "
                             "%llu",
                             file.name.c_str(),
                             (unsigned long long)s.chunk_index);
      break;
    }
    if (!memory_.request(mem, req.high_priority)) {
      Status err(Errc::insufficient_memory,
                 "unable to reserve " + std::to_string(mem) +
                     " bytes for chunk " + std::to_string(s.chunk_index));
      d->fail(err);
      return err;
    }

    ChunkDescriptor desc;
    desc.destination = req.destination;
    desc.erasure_code = file.erasure_code;
    desc.cipher = file.cipher;
    desc.chunk_index = s.chunk_index;
    desc.chunk_size = file.chunk_size();
    desc.fetch_offset = s.fetch_offset;
    desc.fetch_length = s.fetch_length;
    desc.piece_size = file.piece_size;
    desc.write_offset = s.write_offset;
    desc.piece_lookup = file.chunks[s.chunk_index];
    desc.latency_target = cfg_.latency_target;
    desc.overdrive = cfg_.overdrive;
    desc.priority = req.priority;
    desc.needs_memory = false;

    std::shared_ptr<UnfinishedChunk> chunk;
    try {
      chunk = std::make_shared<UnfinishedChunk>(std::move(desc), d, memory_,
                                                mem, (int)workers.size());
    } catch (const std::invalid_argument &e) {
      memory_.release(mem);
      Status err(Errc::invalid_request, e.what());
      d->fail(err.with_context("bad layout for chunk " +
                               std::to_string(s.chunk_index)));
      return err;
    }
    for (auto &w : workers)
      w->queue_chunk(chunk);
  }
  return Status();
}

} // namespace piecemeal
