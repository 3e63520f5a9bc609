#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <vector>
#include "piece_map.hpp"

namespace piecemeal {

// A remote host storing pieces addressed by the hash of their stored bytes.
class PieceHost {
public:
    virtual ~PieceHost() = default;
    virtual const HostId& id() const = 0;
    virtual Hash store(const std::vector<uint8_t>& piece) = 0;
    // May block for the duration of the transfer.
    virtual bool fetch(const Hash& root, std::vector<uint8_t>& out) = 0;
};

// In-process host. Faults can be injected to exercise the download path.
class MemoryHost : public PieceHost {
public:
    explicit MemoryHost(HostId id) : id_(std::move(id)) {}

    const HostId& id() const override { return id_; }
    Hash store(const std::vector<uint8_t>& piece) override;
    bool fetch(const Hash& root, std::vector<uint8_t>& out) override;

    void set_offline(bool offline) { offline_ = offline; }
    // Flips a byte of every piece served.
    void set_corrupt(bool corrupt) { corrupt_ = corrupt; }
    void set_latency(std::chrono::milliseconds latency) { latency_ms_ = latency.count(); }

    size_t fetch_count() const { return fetches_.load(); }
    size_t piece_count() const;

private:
    const HostId id_;
    mutable std::mutex mtx_;
    std::map<Hash, std::vector<uint8_t>> pieces_;
    std::atomic<bool> offline_{false};
    std::atomic<bool> corrupt_{false};
    std::atomic<long long> latency_ms_{0};
    std::atomic<size_t> fetches_{0};
};

} // namespace piecemeal
