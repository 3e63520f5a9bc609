#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>
#include "crypto.hpp"
#include "erasure.hpp"
#include "errors.hpp"
#include "piece_map.hpp"

namespace piecemeal {

class DownloadDestination;
class Download;
class MemoryManager;
class Worker;

// Everything a worker needs to fetch and recover one chunk. Fixed when the
// chunk is created and read by all workers without locking.
struct ChunkDescriptor {
    std::shared_ptr<DownloadDestination> destination;
    std::shared_ptr<const ErasureCoder> erasure_code;
    std::shared_ptr<const PieceCipher> cipher;

    uint64_t chunk_index{0};
    uint64_t chunk_size{0};
    uint64_t fetch_offset{0};  // within the logical chunk
    uint64_t fetch_length{0};
    uint64_t piece_size{0};
    int64_t write_offset{0};   // within the destination
    PieceLookup piece_lookup;

    std::chrono::milliseconds latency_target{0};
    int overdrive{0};
    uint64_t priority{0};
    bool needs_memory{false};
};

enum class RecordResult {
    Stored,          // kept, threshold not reached yet
    Recovered,       // completed the piece set; chunk recovered and written
    RecoveryFailed,  // completed the piece set but recovery failed
    Discarded,       // chunk already failed or has enough pieces
    Rejected         // host holds no piece of this chunk
};

struct ClaimResult {
    enum Kind { Fetch, Standby, Skip };
    Kind kind{Skip};
    uint64_t piece_index{0};
};

struct ChunkStatus {
    bool failed{false};
    bool recovery_complete{false};
    int pieces_completed{0};
    int pieces_registered{0};
    int workers_remaining{0};
    size_t pieces_retained{0};
    size_t workers_standby{0};
    uint64_t memory_allocated{0};
};

class UnfinishedChunk {
public:
    // `memory_allocated` bytes must already be granted by `memory`. The
    // download is not owned; it outlives the chunk until the chunk reports.
    UnfinishedChunk(ChunkDescriptor desc, std::weak_ptr<Download> download,
                    MemoryManager& memory, uint64_t memory_allocated,
                    int workers);

    const ChunkDescriptor& descriptor() const { return desc_; }
    uint64_t index() const { return desc_.chunk_index; }

    RecordResult record_piece(const HostId& host, std::vector<uint8_t> data);
    void mark_worker_done(bool success);
    void fail(const Status& err);

    ClaimResult claim_piece(const HostId& host, const std::shared_ptr<Worker>& worker);
    void unclaim_piece(const HostId& host);
    std::shared_ptr<Worker> next_standby();
    std::shared_ptr<Worker> escalate();

    ChunkStatus status() const;
    Status last_error() const;

private:
    struct State {
        bool failed{false};
        PieceSet piece_data;
        std::vector<bool> piece_claimed;
        int pieces_completed{0};
        int pieces_registered{0};
        int workers_remaining{0};
        int escalations{0};
        bool recovery_complete{false};
        // piece buffers are out with the recovery pipeline
        bool recovering{false};
        std::deque<std::shared_ptr<Worker>> workers_standby;
        uint64_t memory_allocated{0};
        Status err;
    };

    Status recover_logical_data(PieceSet pieces);
    // Leaves the pipeline once its buffers are wiped: completes the chunk, or
    // fails it with `err`. Returns the chunk's error if it failed meanwhile.
    Status end_recovery(const Status& err);
    bool failed() const;
    // Both require mtx_. fail_locked returns true for the call that failed
    // the chunk; the caller then reports to the download without the lock.
    bool fail_locked(const Status& err);
    void cleanup_locked();
    void report_failure(const Status& err);
    int fetch_limit_locked() const;

    const ChunkDescriptor desc_;
    const std::weak_ptr<Download> download_;
    MemoryManager& memory_;

    mutable std::mutex mtx_;
    State state_;
};

} // namespace piecemeal
