// Restore tests: orphaned transfers, missing artifacts, duplicates and
// round-trips through the JSON store.

#include <gtest/gtest.h>

#include "core/downloader/JsonDownloadStore.hpp"
#include "support/TestDoubles.hpp"

namespace reelq::test {
namespace {

DownloadRecord withState(DownloadRecord record, DownloadState state,
                         PauseReason reason = PauseReason::None) {
    record.state = state;
    record.pauseReason = reason;
    return record;
}

class RestoreTest : public ::testing::Test {
protected:
    std::unique_ptr<DownloadQueueManager> makeQueue(size_t maxConcurrent,
                                                    std::shared_ptr<DownloadStore> backing) {
        QueueSettings settings;
        settings.maxConcurrent = maxConcurrent;
        return std::make_unique<DownloadQueueManager>(settings, downloader, std::move(backing), resolver);
    }

    std::shared_ptr<RecordingDownloader> downloader = std::make_shared<RecordingDownloader>();
    std::shared_ptr<MemoryDownloadStore> store = std::make_shared<MemoryDownloadStore>();
    std::shared_ptr<ScriptedResolver> resolver = std::make_shared<ScriptedResolver>();
};

// -----------------------------------------------------------------------------
// Orphans, evictions and duplicates
// -----------------------------------------------------------------------------

TEST_F(RestoreTest, NormalizesLoadedPartitions) {
    TempDir dir("restore_normalize");
    auto artifact = dir.touch("D.mp4");

    auto completedPresent = withState(makeRecord("D"), DownloadState::Completed);
    completedPresent.localArtifactPath = artifact;
    completedPresent.progress = 1.0;

    auto completedMissing = withState(makeRecord("E"), DownloadState::Completed);
    completedMissing.localArtifactPath = (dir.path() / "gone.mp4").string();

    auto orphan = withState(makeRecord("A"), DownloadState::Downloading);
    orphan.progress = 0.42;

    LoadResult loaded;
    loaded.partitions.active = {orphan, withState(makeRecord("B"), DownloadState::Paused)};
    loaded.partitions.queued = {withState(makeRecord("C"), DownloadState::Pending)};
    loaded.partitions.completed = {completedPresent, completedMissing};
    loaded.partitions.failed = {withState(makeRecord("F"), DownloadState::Failed),
                                withState(makeRecord("A"), DownloadState::Failed)};
    store->setLoadResult(loaded);

    auto queue = makeQueue(3, store);
    auto summary = queue->restore();

    EXPECT_EQ(summary.restored, 5u);
    EXPECT_EQ(summary.interrupted, 1u);
    EXPECT_EQ(summary.evictedMissingArtifacts, 1u);
    EXPECT_EQ(summary.duplicates, 1u);
    EXPECT_TRUE(summary.degradedPartitions.empty());

    auto a = queue->find("A");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->state, DownloadState::Paused);
    EXPECT_EQ(a->pauseReason, PauseReason::Interrupted);
    EXPECT_DOUBLE_EQ(a->progress, 0.42);

    EXPECT_EQ(queue->find("B")->pauseReason, PauseReason::User);
    EXPECT_EQ(stateOf(*queue, "C"), DownloadState::Pending);
    EXPECT_EQ(stateOf(*queue, "D"), DownloadState::Completed);
    EXPECT_FALSE(queue->find("E").has_value());
    EXPECT_EQ(queue->getFailedCount(), 1u);

    // Nothing restarts on its own
    EXPECT_TRUE(downloader->starts().empty());
    EXPECT_EQ(queue->getDownloadingCount(), 0u);
}

TEST_F(RestoreTest, CompletionCaughtBetweenPartitionFilesKeepsCompletedCopy) {
    TempDir dir("restore_completed_dup");
    auto t0 = Clock::now() - std::chrono::minutes(10);

    auto running = withState(makeRecord("A"), DownloadState::Downloading);
    running.updatedAt = t0;
    running.progress = 0.9;

    auto finished = withState(makeRecord("A"), DownloadState::Completed);
    finished.updatedAt = t0 + std::chrono::minutes(1);
    finished.localArtifactPath = dir.touch("A.mp4");
    finished.progress = 1.0;

    LoadResult loaded;
    loaded.partitions.active = {running};
    loaded.partitions.completed = {finished};
    store->setLoadResult(loaded);

    auto queue = makeQueue(1, store);
    auto summary = queue->restore();

    EXPECT_EQ(summary.duplicates, 1u);
    EXPECT_EQ(summary.interrupted, 0u);
    EXPECT_EQ(stateOf(*queue, "A"), DownloadState::Completed);
    EXPECT_EQ(queue->getActiveCount(), 0u);
    EXPECT_EQ(queue->getCompletedCount(), 1u);
}

TEST_F(RestoreTest, PromotionCaughtBetweenPartitionFilesKeepsActiveCopy) {
    auto t0 = Clock::now() - std::chrono::minutes(10);

    auto waiting = withState(makeRecord("A"), DownloadState::Pending);
    waiting.updatedAt = t0;
    auto promoted = withState(makeRecord("A"), DownloadState::Downloading);
    promoted.updatedAt = t0 + std::chrono::seconds(5);

    LoadResult loaded;
    loaded.partitions.active = {promoted};
    loaded.partitions.queued = {waiting, withState(makeRecord("B"), DownloadState::Pending)};
    store->setLoadResult(loaded);

    auto queue = makeQueue(1, store);
    auto summary = queue->restore();

    EXPECT_EQ(summary.duplicates, 1u);
    EXPECT_EQ(queue->find("A")->pauseReason, PauseReason::Interrupted);
    EXPECT_EQ(idsOf(queue->snapshot().queued), (std::vector<std::string>{"B"}));
}

TEST_F(RestoreTest, ResumePendingReattachesInterruptedOnly) {
    LoadResult loaded;
    loaded.partitions.active = {withState(makeRecord("A"), DownloadState::Downloading),
                                withState(makeRecord("B"), DownloadState::Paused, PauseReason::User)};
    loaded.partitions.queued = {withState(makeRecord("C"), DownloadState::Pending)};
    store->setLoadResult(loaded);

    auto queue = makeQueue(3, store);
    queue->restore();
    queue->resumePending();

    EXPECT_EQ(stateOf(*queue, "A"), DownloadState::Downloading);
    EXPECT_EQ(stateOf(*queue, "B"), DownloadState::Paused);
    EXPECT_EQ(stateOf(*queue, "C"), DownloadState::Downloading);
    EXPECT_EQ(downloader->startedIds(), (std::vector<std::string>{"A", "C"}));
    EXPECT_TRUE(downloader->resumed().empty());
}

TEST_F(RestoreTest, ExplicitResumeStartsFreshTransfer) {
    LoadResult loaded;
    loaded.partitions.active = {withState(makeRecord("A"), DownloadState::Paused, PauseReason::User)};
    store->setLoadResult(loaded);

    auto queue = makeQueue(1, store);
    queue->restore();

    EXPECT_TRUE(queue->resume("A"));
    EXPECT_EQ(downloader->startedIds(), (std::vector<std::string>{"A"}));
    EXPECT_TRUE(downloader->resumed().empty());

    downloader->complete("A", TransferResult::succeeded("/tmp/a"));
    EXPECT_EQ(stateOf(*queue, "A"), DownloadState::Completed);
}

TEST_F(RestoreTest, DegradedPartitionsAreReported) {
    LoadResult loaded;
    loaded.partitions.failed = {withState(makeRecord("F"), DownloadState::Failed)};
    loaded.degradedPartitions = {kQueuedPartition};
    store->setLoadResult(loaded);

    auto queue = makeQueue(1, store);
    auto summary = queue->restore();

    EXPECT_EQ(summary.degradedPartitions, (std::vector<std::string>{"queued"}));
    EXPECT_EQ(summary.restored, 1u);
    EXPECT_EQ(queue->getFailedCount(), 1u);
}

// -----------------------------------------------------------------------------
// Round-trip through JsonDownloadStore
// -----------------------------------------------------------------------------

TEST_F(RestoreTest, RoundTripThroughJsonStore) {
    TempDir dir("restore_roundtrip");
    auto jsonStore = std::make_shared<JsonDownloadStore>(dir.path() / "state");
    auto artifact = dir.touch("done.mp4");

    {
        auto queue = makeQueue(2, jsonStore);
        queue->enqueue(makeRecord("A"));
        queue->enqueue(makeRecord("B"));
        queue->enqueue(makeRecord("C"));
        queue->enqueue(makeRecord("D"));
        queue->enqueue(makeRecord("E"));

        downloader->progress("A", 0.4);
        downloader->complete("B", TransferResult::succeeded(artifact));
        downloader->complete("C", TransferResult::failed("HTTP 500"));
        queue->pause("D");

        ASSERT_TRUE(queue->flush());
    }

    auto restoredDownloader = std::make_shared<RecordingDownloader>();
    QueueSettings settings;
    settings.maxConcurrent = 2;
    DownloadQueueManager restored(settings, restoredDownloader, jsonStore, resolver);
    auto summary = restored.restore();

    EXPECT_EQ(summary.restored, 5u);
    EXPECT_TRUE(summary.degradedPartitions.empty());

    auto partitions = restored.snapshot();
    EXPECT_EQ(idsOf(partitions.active), (std::vector<std::string>{"A", "D"}));
    EXPECT_EQ(idsOf(partitions.queued), (std::vector<std::string>{"E"}));
    EXPECT_EQ(idsOf(partitions.completed), (std::vector<std::string>{"B"}));
    EXPECT_EQ(idsOf(partitions.failed), (std::vector<std::string>{"C"}));

    auto a = restored.find("A");
    EXPECT_DOUBLE_EQ(a->progress, 0.4);
    EXPECT_EQ(a->pauseReason, PauseReason::Interrupted);
    EXPECT_EQ(restored.find("D")->pauseReason, PauseReason::User);
    EXPECT_DOUBLE_EQ(restored.find("B")->progress, 1.0);
    EXPECT_EQ(restored.find("B")->localArtifactPath, std::optional<std::string>(artifact));
    EXPECT_EQ(restored.find("C")->error, "HTTP 500");
}

TEST_F(RestoreTest, CompletedWithoutArtifactIsEvictedAfterRoundTrip) {
    TempDir dir("restore_evict");
    auto jsonStore = std::make_shared<JsonDownloadStore>(dir.path());
    auto artifact = dir.touch("A.mp4");

    {
        auto queue = makeQueue(1, jsonStore);
        queue->enqueue(makeRecord("A"));
        downloader->complete("A", TransferResult::succeeded(artifact));
        ASSERT_TRUE(queue->flush());
    }

    std::filesystem::remove(artifact);

    auto queue = makeQueue(1, jsonStore);
    auto summary = queue->restore();

    EXPECT_EQ(summary.evictedMissingArtifacts, 1u);
    EXPECT_EQ(queue->getCompletedCount(), 0u);
}

} // namespace
} // namespace reelq::test
