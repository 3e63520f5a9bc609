#include "host.hpp"
#include <thread>

namespace piecemeal {

Hash MemoryHost::store(const std::vector<uint8_t> &piece) {
  Hash root = hash_bytes(piece);
  std::lock_guard<std::mutex> lk(mtx_);
  pieces_[root] = piece;
  return root;
}

bool MemoryHost::fetch(const Hash &root, std::vector<uint8_t> &out) {
  fetches_.fetch_add(1);
  long long latency = latency_ms_.load();
  if (latency > 0)
    std::this_thread::sleep_for(std::chrono::milliseconds(latency));
  if (offline_.load())
    return false;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = pieces_.find(root);
    if (it == pieces_.end())
      return false;
    out = it->second;
  }
  if (corrupt_.load() && !out.empty())
    out[out.size() / 2] ^= 0x5a;
  return true;
}

size_t MemoryHost::piece_count() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return pieces_.size();
}

} // namespace piecemeal
