#pragma once

/**
 * DownloadQueueManager.hpp
 *
 * Download queue coordinator: owns the four partitions, enforces the
 * concurrency limit and drives the Downloader.
 */

#include "DownloadRecord.hpp"
#include "Downloader.hpp"
#include "DownloadStore.hpp"
#include "SnapshotWriter.hpp"
#include "SourceResolver.hpp"
#include "../ThreadPool.hpp"

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace reelq::core::downloader {

/**
 * Coordinator settings, filled from Config by the composition root
 */
struct QueueSettings {
    size_t maxConcurrent{3};
    bool deleteArtifacts{true};
    std::chrono::milliseconds flushInterval{1000};
};

/**
 * Change notification. record is empty when the download was removed.
 */
struct DownloadEvent {
    std::string id;
    std::optional<DownloadRecord> record;
};

using DownloadChangedCallback = std::function<void(const DownloadEvent& event)>;

/**
 * What restore() found on disk
 */
struct RestoreSummary {
    size_t restored{0};
    size_t evictedMissingArtifacts{0};
    size_t interrupted{0};
    size_t duplicates{0};
    std::vector<std::string> degradedPartitions;
};

/**
 * DownloadQueueManager - queue coordinator
 *
 * Every mutation runs under a single mutex. Calls into the Downloader,
 * artifact removal and change notifications are queued while the lock is
 * held and delivered in order after it is released, so collaborators may
 * call back into the manager from inside those calls. Source resolution
 * runs on a worker of its own and never on the caller's thread.
 *
 * Control operations never throw for expected conditions. They return
 * true if state changed and false for a no-op.
 *
 * Transfer callbacks hold a pointer to the manager: call shutdown(), then
 * stop the Downloader, then destroy the manager.
 */
class DownloadQueueManager {
public:
    // In-flight progress never reaches 1.0; that value is reserved for Completed
    static constexpr double kMaxInFlightProgress = 0.999;

    DownloadQueueManager(QueueSettings settings,
                         std::shared_ptr<Downloader> downloader,
                         std::shared_ptr<DownloadStore> store,
                         std::shared_ptr<SourceResolver> resolver = nullptr);
    ~DownloadQueueManager();

    DownloadQueueManager(const DownloadQueueManager&) = delete;
    DownloadQueueManager& operator=(const DownloadQueueManager&) = delete;

    /**
     * Start background persistence
     */
    void initialize();

    /**
     * Detach live transfers, write the final state and stop background
     * persistence. Later transfer callbacks are ignored.
     */
    void shutdown();

    /**
     * Build a fresh Pending record with a generated id
     */
    static DownloadRecord createRecord(const ContentRef& content,
                                       const std::string& quality,
                                       std::optional<StreamSource> source = std::nullopt);

    /**
     * Load persisted partitions, replacing in-memory state.
     * Call once at startup, before any other operation.
     */
    RestoreSummary restore();

    /**
     * Add a download. Admitted directly if a slot is free, otherwise
     * appended to the pending queue.
     * @param record New record (an empty id is replaced by a generated one)
     * @param source Stream source; overrides record.source when given
     * @return false if the id already exists in any partition
     */
    bool enqueue(DownloadRecord record, std::optional<StreamSource> source = std::nullopt);

    /**
     * User pause of an active download. The record keeps its slot.
     */
    bool pause(const std::string& id);

    /**
     * Resume a paused active download
     */
    bool resume(const std::string& id);

    /**
     * Remove an active or pending download. A freed slot is refilled
     * from the pending queue.
     */
    bool cancel(const std::string& id);

    /**
     * Remove a completed or failed download, and its artifact when
     * deleteArtifacts is set.
     */
    bool deleteDownload(const std::string& id);

    /**
     * Re-admit a failed download
     * @param source Fresh stream source; the stored one is kept if empty
     */
    bool retry(const std::string& id, std::optional<StreamSource> source = std::nullopt);

    /**
     * Progress report for an active download. Unknown ids are ignored.
     */
    void reportProgress(const std::string& id, double fraction);

    /**
     * Terminal report for an active download. Unknown ids are ignored.
     */
    void reportCompletion(const std::string& id, const TransferResult& result);

    /**
     * Pause every downloading record on behalf of the network policy.
     * Until resumePending() lifts the restriction, records given a slot
     * are parked as policy pauses instead of starting.
     * @return Number of records paused
     */
    size_t pauseAllForCellularRestriction();

    /**
     * Lift the network restriction, re-attach interrupted records, resume
     * policy-paused ones and fill free slots from the pending queue.
     * User pauses are left alone.
     */
    void resumePending();

    bool isTransferRestricted() const;

    /**
     * Change the concurrency limit. Raising it fills the new slots;
     * lowering it never stops running transfers.
     */
    void setMaxConcurrent(size_t maxConcurrent);
    size_t getMaxConcurrent() const;

    /**
     * Register change listener. Called outside the lock, in mutation order.
     */
    void setOnChanged(DownloadChangedCallback callback);

    /**
     * Write current state synchronously
     * @return true if every partition was written
     */
    bool flush();

    Partitions snapshot() const;
    std::optional<DownloadRecord> find(const std::string& id) const;

    size_t getActiveCount() const;
    size_t getPendingCount() const;
    size_t getDownloadingCount() const;
    size_t getCompletedCount() const;
    size_t getFailedCount() const;

private:
    enum class CommandType {
        Start,
        Pause,
        Resume,
        Cancel,
        Transfer,
        DeleteArtifact,
        Notify
    };

    struct Command {
        CommandType type;
        std::string id;
        uint64_t token{0};
        std::optional<DownloadRecord> record;
        std::string path;
    };

    // Partition helpers, m_mutex held
    bool containsLocked(const std::string& id) const;
    static std::vector<DownloadRecord>::iterator findIn(std::vector<DownloadRecord>& partition,
                                                        const std::string& id);
    size_t downloadingCountLocked() const;

    void admitLocked(DownloadRecord record);
    void occupySlotLocked(DownloadRecord record, const char* how);
    void promoteLocked();
    void scheduleStartLocked(const DownloadRecord& record);
    void applyProgressLocked(DownloadRecord& record, double fraction);
    void finishLocked(std::vector<DownloadRecord>::iterator it, const TransferResult& result);
    void notifyLocked(const DownloadRecord& record);
    void notifyRemovedLocked(const std::string& id);
    bool isLiveLocked(const std::string& id, uint64_t token) const;

    // Outbox, called without m_mutex
    void dispatch();
    void execute(Command& command);
    void executeStart(Command& command);
    void resolveAndStart(const std::string& id, uint64_t token, const DownloadRecord& record);
    void startTransfer(const std::string& id, uint64_t token, const DownloadRecord& record);

    // Transfer callbacks bound to one start()
    void onTransferProgress(const std::string& id, uint64_t token, double fraction);
    void onTransferComplete(const std::string& id, uint64_t token, const TransferResult& result);

private:
    std::shared_ptr<Downloader> m_downloader;
    std::shared_ptr<DownloadStore> m_store;
    std::shared_ptr<SourceResolver> m_resolver;
    std::unique_ptr<SnapshotWriter> m_writer;

    mutable std::mutex m_mutex;
    Partitions m_partitions;
    size_t m_maxConcurrent;
    bool m_deleteArtifacts;
    bool m_transfersRestricted{false};

    // id -> token of the transfer currently backing it
    std::unordered_map<std::string, uint64_t> m_liveTransfers;
    uint64_t m_nextToken{0};

    std::deque<Command> m_outbox;
    bool m_dispatching{false};
    DownloadChangedCallback m_onChanged;

    bool m_initialized{false};

    // Declared last so it is joined before the state its tasks touch
    std::unique_ptr<ThreadPool> m_resolvePool;
};

} // namespace reelq::core::downloader
