#include "download.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

using namespace piecemeal;
using piecemeal::test::RecordingDestination;

namespace {

TEST(CompletionSignalTest, FiresOnce)
{
    CompletionSignal sig;
    int calls = 0;
    sig.subscribe([&]() { calls++; });
    EXPECT_FALSE(sig.fired());
    EXPECT_FALSE(sig.wait_for(std::chrono::milliseconds(1)));

    EXPECT_TRUE(sig.fire());
    EXPECT_FALSE(sig.fire());
    EXPECT_TRUE(sig.fired());
    EXPECT_EQ(calls, 1);

    // late subscribers run immediately
    sig.subscribe([&]() { calls++; });
    EXPECT_EQ(calls, 2);
    EXPECT_TRUE(sig.wait_for(std::chrono::milliseconds(0)));
}

TEST(DownloadTest, CompletesAfterLastChunk)
{
    auto dest = std::make_shared<RecordingDestination>();
    Download d("file", dest, 0, 30, 3);
    std::atomic<int> fired{0};
    d.on_complete([&]() { fired++; });

    d.report_chunk_success(10);
    d.report_chunk_success(10);
    EXPECT_FALSE(d.complete());
    EXPECT_EQ(d.chunks_remaining(), 1);
    EXPECT_EQ(dest->closes.load(), 0);

    d.report_chunk_success(10);
    EXPECT_TRUE(d.complete());
    EXPECT_FALSE(d.failed());
    EXPECT_EQ(fired.load(), 1);
    EXPECT_EQ(dest->closes.load(), 1);
    EXPECT_EQ(d.bytes_received(), 30u);
    EXPECT_GE(d.end_time(), d.start_time());

    // a stray report past zero changes nothing
    d.report_chunk_success(10);
    EXPECT_EQ(d.chunks_remaining(), 0);
    EXPECT_EQ(d.bytes_received(), 30u);
    EXPECT_EQ(fired.load(), 1);
}

TEST(DownloadTest, FirstFailureWins)
{
    auto dest = std::make_shared<RecordingDestination>();
    Download d("file", dest, 0, 30, 3);
    std::atomic<int> fired{0};
    d.on_complete([&]() { fired++; });

    d.report_chunk_success(10);
    d.fail(Status(Errc::decrypt_failed, "first"));
    d.fail(Status(Errc::write_failed, "second"));
    d.report_chunk_success(10);

    EXPECT_TRUE(d.complete());
    EXPECT_TRUE(d.failed());
    EXPECT_EQ(d.error().code(), make_error_code(Errc::decrypt_failed));
    EXPECT_EQ(d.error().message(), "first");
    EXPECT_EQ(fired.load(), 1);
    EXPECT_EQ(dest->closes.load(), 1);
}

TEST(DownloadTest, FailureAfterSuccessIsIgnored)
{
    auto dest = std::make_shared<RecordingDestination>();
    Download d("file", dest, 0, 10, 1);
    d.report_chunk_success(10);
    d.fail(Status(Errc::write_failed, "late"));
    EXPECT_FALSE(d.failed());
    EXPECT_EQ(dest->closes.load(), 1);
}

TEST(DownloadTest, CloseErrorFailsDownload)
{
    auto dest = std::make_shared<RecordingDestination>();
    dest->fail_close = true;
    Download d("file", dest, 0, 10, 1);
    d.report_chunk_success(10);
    EXPECT_TRUE(d.complete());
    EXPECT_TRUE(d.failed());
    EXPECT_EQ(d.error().code(), make_error_code(Errc::close_failed));
    EXPECT_EQ(d.error().message().rfind("unable to close download destination", 0), 0u);
}

TEST(DownloadTest, CloseErrorDoesNotMaskEarlierFailure)
{
    auto dest = std::make_shared<RecordingDestination>();
    dest->fail_close = true;
    Download d("file", dest, 0, 10, 1);
    d.fail(Status(Errc::insufficient_pieces, "no pieces"));
    EXPECT_EQ(d.error().code(), make_error_code(Errc::insufficient_pieces));
}

TEST(DownloadTest, EmptyDownloadCompletesImmediately)
{
    auto dest = std::make_shared<RecordingDestination>();
    Download d("file", dest, 0, 0, 0);
    EXPECT_TRUE(d.complete());
    EXPECT_FALSE(d.failed());
    EXPECT_EQ(dest->closes.load(), 1);
    bool called = false;
    d.on_complete([&]() { called = true; });
    EXPECT_TRUE(called);
}

TEST(DownloadTest, WaitersWakeOnCompletion)
{
    auto dest = std::make_shared<RecordingDestination>();
    Download d("file", dest, 0, 20, 2);

    std::vector<std::thread> waiters;
    std::atomic<int> woke{0};
    for (int i = 0; i < 3; i++) {
        waiters.emplace_back([&]() {
            d.wait();
            woke++;
        });
    }
    d.report_chunk_success(10);
    std::thread reporter([&]() { d.report_chunk_success(10); });
    reporter.join();
    for (auto& t : waiters)
        t.join();
    EXPECT_EQ(woke.load(), 3);
    EXPECT_TRUE(d.wait_for(std::chrono::milliseconds(0)));
}

} // namespace
