// SnapshotWriter timing: urgent writes go out promptly, progress-only
// changes are coalesced.

#include <gtest/gtest.h>

#include "core/downloader/SnapshotWriter.hpp"
#include "support/TestDoubles.hpp"

namespace reelq::test {
namespace {

using namespace std::chrono_literals;

Partitions onePending() {
    Partitions partitions;
    partitions.queued.push_back(makeRecord("A"));
    return partitions;
}

TEST(SnapshotWriterTest, FlushNowWritesSynchronously) {
    MemoryDownloadStore store;
    SnapshotWriter writer(store, 1000ms);
    writer.setProvider(onePending);

    EXPECT_TRUE(writer.flushNow());
    EXPECT_EQ(store.saveCount(), 1u);
    EXPECT_EQ(writer.writeCount(), 1u);
    EXPECT_EQ(idsOf(store.saved().queued), (std::vector<std::string>{"A"}));
}

TEST(SnapshotWriterTest, FlushWithoutProviderFails) {
    MemoryDownloadStore store;
    SnapshotWriter writer(store, 1000ms);

    EXPECT_FALSE(writer.flushNow());
    EXPECT_EQ(store.saveCount(), 0u);
}

TEST(SnapshotWriterTest, RequestWriteIsNotDelayed) {
    MemoryDownloadStore store;
    SnapshotWriter writer(store, 10s);
    writer.setProvider(onePending);
    writer.start();

    ASSERT_TRUE(writer.flushNow());
    writer.requestWrite();

    EXPECT_TRUE(waitUntil([&] { return store.saveCount() >= 2; }, 1000ms));
    writer.stop();
}

TEST(SnapshotWriterTest, DirtyMarksAreCoalesced) {
    MemoryDownloadStore store;
    SnapshotWriter writer(store, 200ms);
    writer.setProvider(onePending);
    writer.start();

    ASSERT_TRUE(writer.flushNow());

    for (int i = 0; i < 100; ++i) {
        writer.markDirty();
        std::this_thread::sleep_for(1ms);
    }
    std::this_thread::sleep_for(450ms);
    writer.stop();

    // One flushNow plus at most a write per interval
    size_t writes = store.saveCount();
    EXPECT_GE(writes, 2u);
    EXPECT_LE(writes, 5u);
}

TEST(SnapshotWriterTest, DirtyWriteWaitsForInterval) {
    MemoryDownloadStore store;
    SnapshotWriter writer(store, 10s);
    writer.setProvider(onePending);
    writer.start();

    ASSERT_TRUE(writer.flushNow());
    writer.markDirty();

    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(store.saveCount(), 1u);

    writer.stop();
}

TEST(SnapshotWriterTest, StopWritesOutstandingChanges) {
    MemoryDownloadStore store;
    SnapshotWriter writer(store, 10s);
    writer.setProvider(onePending);
    writer.start();

    ASSERT_TRUE(writer.flushNow());
    writer.markDirty();
    writer.stop();

    EXPECT_EQ(store.saveCount(), 2u);
    EXPECT_FALSE(writer.isRunning());
}

TEST(SnapshotWriterTest, StopWithNothingOutstandingDoesNotWrite) {
    MemoryDownloadStore store;
    SnapshotWriter writer(store, 10s);
    writer.setProvider(onePending);
    writer.start();
    writer.stop();

    EXPECT_EQ(store.saveCount(), 0u);
}

} // namespace
} // namespace reelq::test
