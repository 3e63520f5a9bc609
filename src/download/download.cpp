#include "download.hpp"
#include "logging.hpp"

namespace piecemeal {

bool CompletionSignal::fire() {
  std::vector<std::function<void()>> cbs;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (fired_)
      return false;
    fired_ = true;
    cbs.swap(callbacks_);
  }
  cv_.notify_all();
  for (auto &cb : cbs)
    cb();
  return true;
}

bool CompletionSignal::fired() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return fired_;
}

void CompletionSignal::wait() const {
  std::unique_lock<std::mutex> lk(mtx_);
  cv_.wait(lk, [this] { return fired_; });
}

bool CompletionSignal::wait_for(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(mtx_);
  return cv_.wait_for(lk, timeout, [this] { return fired_; });
}

void CompletionSignal::subscribe(std::function<void()> cb) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!fired_) {
      callbacks_.push_back(std::move(cb));
      return;
    }
  }
  cb();
}

Download::Download(std::string name,
                   std::shared_ptr<DownloadDestination> destination,
                   uint64_t offset, uint64_t length, int chunks)
    : name_(std::move(name)), destination_(std::move(destination)),
      offset_(offset), length_(length), start_time_(clock::now()),
      chunks_remaining_(chunks) {
  // Empty downloads have no chunk to report in and complete right away.
  if (chunks_remaining_ == 0) {
    std::unique_lock<std::mutex> lk(mtx_);
    finish_locked(lk);
  }
}

void Download::finish_locked(std::unique_lock<std::mutex> &lk) {
  finished_ = true;
  end_time_ = clock::now();
  if (destination_) {
    std::error_code ec = destination_->close();
    if (ec) {
      Logger::instance().log(LogLevel::WARN,
                             "download %s: closing %s destination failed: %s",
                             name_.c_str(), destination_->type(),
                             ec.message().c_str());
      if (err_.ok())
        err_ = Status(Errc::close_failed, ec.message())
                   .with_context("unable to close download destination");
    }
  }
  lk.unlock();
  done_.fire();
}

void Download::report_chunk_success(uint64_t bytes_written) {
  std::unique_lock<std::mutex> lk(mtx_);
  if (chunks_remaining_ <= 0) {
    Logger::instance().log(LogLevel::ERROR,
                           "download %s: chunk reported success with no chunks "
                           "remaining",
                           name_.c_str());
    return;
  }
  chunks_remaining_--;
  bytes_received_.fetch_add(bytes_written);
  if (chunks_remaining_ != 0 || finished_)
    return;

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                     clock::now() - start_time_)
                     .count();
  Logger::instance().log(LogLevel::INFO,
                         "download %s complete: %llu bytes in %lld ms",
                         name_.c_str(),
                         (unsigned long long)bytes_received_.load(),
                         (long long)elapsed);
  finish_locked(lk);
}

void Download::fail(const Status &err) {
  std::unique_lock<std::mutex> lk(mtx_);
  if (finished_) {
    if (err_.ok())
      Logger::instance().log(LogLevel::DEBUG,
                             "download %s already complete, ignoring: %s",
                             name_.c_str(), err.message().c_str());
    else
      Logger::instance().log(LogLevel::DEBUG,
                             "download %s already failed, ignoring: %s",
                             name_.c_str(), err.message().c_str());
    return;
  }
  Logger::instance().log(LogLevel::WARN, "download %s failed: %s",
                         name_.c_str(), err.message().c_str());
  err_ = err.ok() ? Status(Errc::invalid_request, "download failed") : err;
  finish_locked(lk);
}

bool Download::failed() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return !err_.ok();
}

Status Download::error() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return err_;
}

int Download::chunks_remaining() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return chunks_remaining_;
}

Download::clock::time_point Download::end_time() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return end_time_;
}

} // namespace piecemeal
