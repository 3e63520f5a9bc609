#include "memory_manager.hpp"
#include "logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace piecemeal {

MemoryManager::MemoryManager(uint64_t capacity)
    : capacity_(capacity), available_(capacity) {}

bool MemoryManager::front_of_queue(const Waiter *w) const {
  return !waiters_.empty() && waiters_.front() == w;
}

bool MemoryManager::request(uint64_t bytes, bool high_priority) {
  std::unique_lock<std::mutex> lk(mtx_);
  if (stopped_)
    return false;
  if (bytes > capacity_) {
    Logger::instance().log(LogLevel::WARN,
                           "memory request of %llu bytes exceeds capacity %llu",
                           (unsigned long long)bytes,
                           (unsigned long long)capacity_);
    return false;
  }
  Waiter w{bytes, high_priority};
  if (high_priority) {
    auto it = std::find_if(waiters_.begin(), waiters_.end(),
                           [](const Waiter *o) { return !o->high_priority; });
    waiters_.insert(it, &w);
  } else {
    waiters_.push_back(&w);
  }
  cv_.wait(lk, [&] {
    return stopped_ || (front_of_queue(&w) && available_ >= bytes);
  });
  waiters_.erase(std::find(waiters_.begin(), waiters_.end(), &w));
  // the next waiter in line may already fit
  cv_.notify_all();
  if (stopped_)
    return false;
  available_ -= bytes;
  return true;
}

bool MemoryManager::try_request(uint64_t bytes) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (stopped_ || !waiters_.empty() || available_ < bytes)
    return false;
  available_ -= bytes;
  return true;
}

void MemoryManager::release(uint64_t bytes) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (bytes > capacity_ - available_) {
      Logger::instance().log(LogLevel::ERROR,
                             "memory release of %llu bytes but only %llu "
                             "outstanding",
                             (unsigned long long)bytes,
                             (unsigned long long)(capacity_ - available_));
      throw std::logic_error("memory manager: release exceeds outstanding");
    }
    available_ += bytes;
  }
  cv_.notify_all();
}

void MemoryManager::stop() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    stopped_ = true;
  }
  cv_.notify_all();
}

uint64_t MemoryManager::available() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return available_;
}

uint64_t MemoryManager::outstanding() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return capacity_ - available_;
}

} // namespace piecemeal
