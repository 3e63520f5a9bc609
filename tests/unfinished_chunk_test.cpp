#include "download.hpp"
#include "memory_manager.hpp"
#include "test_support.hpp"
#include "unfinished_chunk.hpp"
#include "worker.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <functional>
#include <thread>

using namespace piecemeal;
using namespace piecemeal::test;

namespace {

constexpr uint64_t kMemory = 1000;
constexpr uint64_t kChunkMemory = 100;

// Runs `hook` inside recovery, standing in for a worker that fails the chunk
// concurrently.
class HookedCoder : public ReedSolomonCoder {
public:
    HookedCoder() : ReedSolomonCoder(4, 2) {}
    Status recover(const PieceSet& pieces, uint64_t size,
                   std::vector<uint8_t>& out) const override {
        if (hook)
            hook();
        return ReedSolomonCoder::recover(pieces, size, out);
    }
    std::function<void()> hook;
};

class HookedCipher : public SodiumPieceCipher {
public:
    bool decrypt(uint64_t chunk_index, uint64_t piece_index,
                 std::vector<uint8_t>& inout) const override {
        if (hook)
            hook();
        return SodiumPieceCipher::decrypt(chunk_index, piece_index, inout);
    }
    std::function<void()> hook;
};

class UnfinishedChunkTest : public testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto_init());
        coder = std::make_shared<ReedSolomonCoder>(4, 2);
        auto c = std::make_shared<SodiumPieceCipher>();
        c->set_key(test_key());
        cipher = c;
        data = pattern(40, 7);
        sealed = seal_chunk(*coder, *cipher, 3, data);
    }

    std::shared_ptr<UnfinishedChunk> make_chunk(uint64_t fetch_offset, uint64_t fetch_length,
                                                int64_t write_offset, int workers,
                                                int overdrive = 0) {
        download = std::make_shared<Download>("test", dest, 0, fetch_length, 1);
        EXPECT_TRUE(memory.request(kChunkMemory));
        ChunkDescriptor desc;
        desc.destination = dest;
        desc.erasure_code = coder;
        desc.cipher = cipher;
        desc.chunk_index = 3;
        desc.chunk_size = 40;
        desc.fetch_offset = fetch_offset;
        desc.fetch_length = fetch_length;
        desc.piece_size = 10;
        desc.write_offset = write_offset;
        desc.piece_lookup = sealed.lookup;
        desc.overdrive = overdrive;
        return std::make_shared<UnfinishedChunk>(desc, download, memory, kChunkMemory, workers);
    }

    RecordResult feed(UnfinishedChunk& chunk, size_t piece) {
        return chunk.record_piece(host_name(piece), sealed.pieces[piece]);
    }

    std::shared_ptr<ReedSolomonCoder> coder;
    std::shared_ptr<const PieceCipher> cipher;
    std::vector<uint8_t> data;
    SealedChunk sealed;
    MemoryManager memory{kMemory};
    std::shared_ptr<RecordingDestination> dest = std::make_shared<RecordingDestination>();
    std::shared_ptr<Download> download;
};

TEST_F(UnfinishedChunkTest, WritesRequestedRangeOnceThresholdIsMet)
{
    auto chunk = make_chunk(10, 20, 5, 6);
    EXPECT_EQ(memory.available(), kMemory - kChunkMemory);

    EXPECT_EQ(feed(*chunk, 0), RecordResult::Stored);
    EXPECT_EQ(feed(*chunk, 1), RecordResult::Stored);
    EXPECT_EQ(feed(*chunk, 2), RecordResult::Stored);
    EXPECT_TRUE(dest->writes().empty());
    EXPECT_EQ(chunk->status().pieces_retained, 3u);

    EXPECT_EQ(feed(*chunk, 3), RecordResult::Recovered);

    auto writes = dest->writes();
    ASSERT_EQ(writes.size(), 1u);
    EXPECT_EQ(writes[0].offset, 5);
    EXPECT_EQ(writes[0].bytes, std::vector<uint8_t>(data.begin() + 10, data.begin() + 30));

    ChunkStatus st = chunk->status();
    EXPECT_TRUE(st.recovery_complete);
    EXPECT_FALSE(st.failed);
    EXPECT_EQ(st.pieces_retained, 0u);
    EXPECT_EQ(st.memory_allocated, 0u);
    EXPECT_EQ(memory.available(), kMemory);

    EXPECT_TRUE(download->complete());
    EXPECT_FALSE(download->failed());
    EXPECT_EQ(download->bytes_received(), 20u);
    EXPECT_EQ(dest->closes.load(), 1);
}

TEST_F(UnfinishedChunkTest, RecoversFromParityPieces)
{
    auto chunk = make_chunk(0, 40, 0, 6);
    EXPECT_EQ(feed(*chunk, 5), RecordResult::Stored);
    EXPECT_EQ(feed(*chunk, 1), RecordResult::Stored);
    EXPECT_EQ(feed(*chunk, 4), RecordResult::Stored);
    EXPECT_EQ(feed(*chunk, 3), RecordResult::Recovered);

    auto writes = dest->writes();
    ASSERT_EQ(writes.size(), 1u);
    EXPECT_EQ(writes[0].bytes, data);
}

TEST_F(UnfinishedChunkTest, PiecesAfterThresholdAreDiscarded)
{
    auto chunk = make_chunk(0, 40, 0, 6);
    for (size_t i = 0; i < 4; i++)
        feed(*chunk, i);
    EXPECT_EQ(feed(*chunk, 4), RecordResult::Discarded);
    EXPECT_EQ(dest->writes().size(), 1u);
    EXPECT_EQ(chunk->status().pieces_retained, 0u);
}

TEST_F(UnfinishedChunkTest, FailsWhenWorkersRunOutBeforeThreshold)
{
    auto chunk = make_chunk(0, 40, 0, 3);
    feed(*chunk, 0);
    feed(*chunk, 1);
    feed(*chunk, 2);

    chunk->mark_worker_done(true);
    chunk->mark_worker_done(true);
    EXPECT_FALSE(chunk->status().failed);
    EXPECT_EQ(chunk->status().workers_remaining, 1);

    chunk->mark_worker_done(true);
    ChunkStatus st = chunk->status();
    EXPECT_EQ(st.workers_remaining, 0);
    EXPECT_TRUE(st.failed);
    EXPECT_TRUE(st.recovery_complete);
    EXPECT_EQ(st.pieces_retained, 0u);
    EXPECT_EQ(st.memory_allocated, 0u);
    EXPECT_EQ(memory.available(), kMemory);
    EXPECT_EQ(chunk->last_error().code(), make_error_code(Errc::insufficient_pieces));

    EXPECT_TRUE(download->failed());
    EXPECT_EQ(download->error().code(), make_error_code(Errc::insufficient_pieces));
    EXPECT_TRUE(dest->writes().empty());
    EXPECT_EQ(dest->closes.load(), 1);
}

TEST_F(UnfinishedChunkTest, DecryptFailureFailsChunkWithoutWriting)
{
    sealed.pieces[2][sealed.pieces[2].size() / 2] ^= 0xff;
    auto chunk = make_chunk(0, 40, 0, 6);
    EXPECT_EQ(feed(*chunk, 0), RecordResult::Stored);
    EXPECT_EQ(feed(*chunk, 1), RecordResult::Stored);
    EXPECT_EQ(feed(*chunk, 2), RecordResult::Stored);
    EXPECT_EQ(feed(*chunk, 3), RecordResult::RecoveryFailed);

    EXPECT_TRUE(dest->writes().empty());
    ChunkStatus st = chunk->status();
    EXPECT_TRUE(st.failed);
    EXPECT_EQ(st.pieces_retained, 0u);
    EXPECT_EQ(memory.available(), kMemory);
    EXPECT_EQ(chunk->last_error().code(), make_error_code(Errc::decrypt_failed));
    EXPECT_EQ(download->error().code(), make_error_code(Errc::decrypt_failed));
    EXPECT_NE(download->error().message().find("chunk 3 failed"), std::string::npos);
}

TEST_F(UnfinishedChunkTest, WriteFailureFailsChunk)
{
    dest->fail_writes = true;
    auto chunk = make_chunk(0, 40, 0, 6);
    for (size_t i = 0; i < 3; i++)
        feed(*chunk, i);
    EXPECT_EQ(feed(*chunk, 3), RecordResult::RecoveryFailed);

    Status err = chunk->last_error();
    EXPECT_EQ(err.code(), make_error_code(Errc::write_failed));
    EXPECT_NE(err.message().find("unable to write to download destination"), std::string::npos);
    EXPECT_EQ(memory.available(), kMemory);
    EXPECT_TRUE(download->failed());
    EXPECT_EQ(dest->closes.load(), 1);
}

TEST_F(UnfinishedChunkTest, DecodeFailureCarriesContext)
{
    download = std::make_shared<Download>("test", dest, 0, 10, 1);
    ASSERT_TRUE(memory.request(kChunkMemory));
    ChunkDescriptor desc;
    desc.destination = dest;
    desc.erasure_code = coder;
    desc.cipher = cipher;
    desc.chunk_index = 3;
    desc.chunk_size = 100; // more than four 10 byte pieces can hold
    desc.fetch_length = 10;
    desc.piece_size = 10;
    desc.piece_lookup = sealed.lookup;
    auto chunk = std::make_shared<UnfinishedChunk>(desc, download, memory, kChunkMemory, 6);

    for (size_t i = 0; i < 3; i++)
        feed(*chunk, i);
    EXPECT_EQ(feed(*chunk, 3), RecordResult::RecoveryFailed);

    Status err = chunk->last_error();
    EXPECT_EQ(err.code(), make_error_code(Errc::recovery_failed));
    EXPECT_EQ(err.message().rfind("unable to recover chunk", 0), 0u);
    EXPECT_TRUE(dest->writes().empty());
    EXPECT_EQ(memory.available(), kMemory);
}

TEST_F(UnfinishedChunkTest, FailIsIdempotent)
{
    auto chunk = make_chunk(0, 40, 0, 6);
    feed(*chunk, 0);
    feed(*chunk, 1);

    chunk->fail(Status(Errc::write_failed, "first"));
    EXPECT_EQ(chunk->status().pieces_retained, 0u);
    EXPECT_EQ(memory.available(), kMemory);

    EXPECT_NO_THROW(chunk->fail(Status(Errc::decrypt_failed, "second")));
    EXPECT_EQ(memory.available(), kMemory);
    EXPECT_EQ(chunk->last_error().message(), "first");
    EXPECT_EQ(download->error().code(), make_error_code(Errc::write_failed));
    EXPECT_EQ(dest->closes.load(), 1);

    EXPECT_EQ(feed(*chunk, 2), RecordResult::Discarded);
    EXPECT_EQ(chunk->status().pieces_retained, 0u);
}

TEST_F(UnfinishedChunkTest, FailDuringDecodeSkipsWrite)
{
    auto hooked = std::make_shared<HookedCoder>();
    coder = hooked;
    auto chunk = make_chunk(0, 40, 0, 6);
    uint64_t available_in_decode = 0;
    hooked->hook = [&]() {
        chunk->fail(Status(Errc::insufficient_pieces, "hosts lost"));
        available_in_decode = memory.available();
    };

    for (size_t i = 0; i < 3; i++)
        EXPECT_EQ(feed(*chunk, i), RecordResult::Stored);
    EXPECT_EQ(feed(*chunk, 3), RecordResult::RecoveryFailed);

    // memory stays reserved while decode still holds the buffers
    EXPECT_EQ(available_in_decode, kMemory - kChunkMemory);
    EXPECT_EQ(memory.available(), kMemory);
    EXPECT_TRUE(dest->writes().empty());
    EXPECT_EQ(dest->closes.load(), 1);

    ChunkStatus st = chunk->status();
    EXPECT_TRUE(st.failed);
    EXPECT_EQ(st.pieces_retained, 0u);
    EXPECT_EQ(st.memory_allocated, 0u);
    EXPECT_EQ(chunk->last_error().code(), make_error_code(Errc::insufficient_pieces));
    EXPECT_EQ(download->error().code(), make_error_code(Errc::insufficient_pieces));
    EXPECT_EQ(download->bytes_received(), 0u);
}

TEST_F(UnfinishedChunkTest, FailDuringDecryptSkipsDecode)
{
    auto hooked_coder = std::make_shared<HookedCoder>();
    int decodes = 0;
    hooked_coder->hook = [&]() { decodes++; };
    coder = hooked_coder;
    auto hooked_cipher = std::make_shared<HookedCipher>();
    hooked_cipher->set_key(test_key());
    cipher = hooked_cipher;
    auto chunk = make_chunk(0, 40, 0, 6);
    hooked_cipher->hook = [&]() { chunk->fail(Status(Errc::write_failed, "disk gone")); };

    for (size_t i = 0; i < 3; i++)
        feed(*chunk, i);
    EXPECT_EQ(feed(*chunk, 3), RecordResult::RecoveryFailed);

    EXPECT_EQ(decodes, 0);
    EXPECT_TRUE(dest->writes().empty());
    EXPECT_EQ(memory.available(), kMemory);
    EXPECT_EQ(chunk->last_error().message(), "disk gone");
    EXPECT_EQ(dest->closes.load(), 1);
}

TEST_F(UnfinishedChunkTest, FailAfterRecoveryIsIgnored)
{
    auto chunk = make_chunk(0, 40, 0, 6);
    for (size_t i = 0; i < 4; i++)
        feed(*chunk, i);
    chunk->fail(Status(Errc::write_failed, "late"));
    EXPECT_FALSE(chunk->status().failed);
    EXPECT_FALSE(download->failed());
    EXPECT_EQ(memory.available(), kMemory);
}

TEST_F(UnfinishedChunkTest, RecoveryRunsOnceUnderConcurrentArrivals)
{
    for (int round = 0; round < 50; round++) {
        dest = std::make_shared<RecordingDestination>();
        auto chunk = make_chunk(0, 40, 0, 6);

        std::atomic<bool> go{false};
        std::atomic<int> recovered{0};
        std::vector<std::thread> threads;
        for (size_t i = 0; i < sealed.pieces.size(); i++) {
            threads.emplace_back([&, i]() {
                while (!go.load())
                    std::this_thread::yield();
                if (feed(*chunk, i) == RecordResult::Recovered)
                    recovered++;
            });
        }
        go = true;
        for (auto& t : threads)
            t.join();

        EXPECT_EQ(recovered.load(), 1);
        ASSERT_EQ(dest->writes().size(), 1u);
        EXPECT_EQ(dest->writes()[0].bytes, data);
        ChunkStatus st = chunk->status();
        EXPECT_LE(st.pieces_completed, st.pieces_registered);
        EXPECT_EQ(st.pieces_retained, 0u);
        EXPECT_EQ(memory.available(), kMemory);
    }
}

TEST_F(UnfinishedChunkTest, UnknownHostIsRejected)
{
    auto chunk = make_chunk(0, 40, 0, 6);
    EXPECT_EQ(chunk->record_piece("stranger", sealed.pieces[0]), RecordResult::Rejected);
    EXPECT_EQ(chunk->status().pieces_completed, 0);
}

TEST_F(UnfinishedChunkTest, RejectsLookupOutsideErasureLayout)
{
    ChunkDescriptor desc;
    desc.destination = dest;
    desc.erasure_code = coder;
    desc.cipher = cipher;
    desc.chunk_size = 40;
    desc.piece_lookup["host-x"] = PieceInfo{6, Hash{}};
    EXPECT_THROW(UnfinishedChunk(desc, download, memory, 0, 1), std::invalid_argument);
}

TEST_F(UnfinishedChunkTest, ClaimsRespectOverdriveAndStandbyQueue)
{
    asio::io_context io;
    auto standby = std::make_shared<Worker>(io, std::make_shared<MemoryHost>(host_name(4)));
    auto chunk = make_chunk(0, 40, 0, 6, 0);

    for (size_t i = 0; i < 4; i++) {
        ClaimResult c = chunk->claim_piece(host_name(i), nullptr);
        EXPECT_EQ(c.kind, ClaimResult::Fetch);
        EXPECT_EQ(c.piece_index, i);
    }
    EXPECT_EQ(chunk->claim_piece(host_name(0), nullptr).kind, ClaimResult::Skip);
    EXPECT_EQ(chunk->claim_piece("stranger", nullptr).kind, ClaimResult::Skip);
    EXPECT_EQ(chunk->claim_piece(host_name(4), standby).kind, ClaimResult::Standby);
    EXPECT_EQ(chunk->status().workers_standby, 1u);
    EXPECT_EQ(chunk->status().pieces_registered, 4);

    // all fetch slots are taken
    EXPECT_EQ(chunk->next_standby(), nullptr);

    chunk->unclaim_piece(host_name(0));
    chunk->mark_worker_done(false);
    EXPECT_EQ(chunk->status().pieces_registered, 3);
    EXPECT_EQ(chunk->next_standby(), standby);
    EXPECT_EQ(chunk->status().workers_standby, 0u);
    EXPECT_EQ(chunk->claim_piece(host_name(4), standby).kind, ClaimResult::Fetch);
}

TEST_F(UnfinishedChunkTest, EscalationGrantsExtraFetchSlot)
{
    asio::io_context io;
    auto standby = std::make_shared<Worker>(io, std::make_shared<MemoryHost>(host_name(5)));
    auto chunk = make_chunk(0, 40, 0, 6, 1);

    for (size_t i = 0; i < 5; i++)
        EXPECT_EQ(chunk->claim_piece(host_name(i), nullptr).kind, ClaimResult::Fetch);
    EXPECT_EQ(chunk->claim_piece(host_name(5), standby).kind, ClaimResult::Standby);

    EXPECT_EQ(chunk->escalate(), standby);
    EXPECT_EQ(chunk->escalate(), nullptr);
    EXPECT_EQ(chunk->claim_piece(host_name(5), standby).kind, ClaimResult::Fetch);
    EXPECT_EQ(chunk->status().pieces_registered, 6);
}

TEST_F(UnfinishedChunkTest, FailureReleasesStandbyWorkers)
{
    asio::io_context io;
    auto standby = std::make_shared<Worker>(io, std::make_shared<MemoryHost>(host_name(4)));
    auto chunk = make_chunk(0, 40, 0, 6);
    for (size_t i = 0; i < 4; i++)
        chunk->claim_piece(host_name(i), nullptr);
    chunk->claim_piece(host_name(4), standby);

    chunk->fail(Status(Errc::insufficient_pieces, "gone"));
    EXPECT_EQ(chunk->status().workers_standby, 0u);
    EXPECT_EQ(chunk->next_standby(), nullptr);
    EXPECT_EQ(chunk->claim_piece(host_name(5), nullptr).kind, ClaimResult::Skip);
}

} // namespace
