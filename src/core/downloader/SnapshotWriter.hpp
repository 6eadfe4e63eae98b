#pragma once

/**
 * SnapshotWriter.hpp
 *
 * Background writer that persists the coordinator's partitions.
 * Structural changes are written right away; progress-only changes are
 * coalesced so at most one write happens per flush interval.
 */

#include "DownloadStore.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace reelq::core::downloader {

class SnapshotWriter {
public:
    using SnapshotProvider = std::function<Partitions()>;

    SnapshotWriter(DownloadStore& store, std::chrono::milliseconds flushInterval);
    ~SnapshotWriter();

    SnapshotWriter(const SnapshotWriter&) = delete;
    SnapshotWriter& operator=(const SnapshotWriter&) = delete;

    /**
     * Source of the state to write. Must be set before start().
     */
    void setProvider(SnapshotProvider provider);

    /**
     * Start the writer thread
     */
    void start();

    /**
     * Stop the writer thread, writing once more if anything is outstanding
     */
    void stop();

    /**
     * Ask for a write as soon as possible
     */
    void requestWrite();

    /**
     * Note that state changed; written within one flush interval
     */
    void markDirty();

    /**
     * Write the current state on the calling thread
     * @return true if every partition was written
     */
    bool flushNow();

    bool isRunning() const { return m_running.load(); }

    /**
     * Number of completed save() calls
     */
    size_t writeCount() const { return m_writeCount.load(); }

private:
    void writerLoop();
    bool writeSnapshot();

private:
    DownloadStore& m_store;
    std::chrono::milliseconds m_flushInterval;
    SnapshotProvider m_provider;

    std::mutex m_mutex;
    std::condition_variable m_condition;
    bool m_urgent{false};
    bool m_dirty{false};
    bool m_stopping{false};
    std::chrono::steady_clock::time_point m_lastWrite{};

    // Held across snapshot + save so writes land in order
    std::mutex m_writeMutex;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<size_t> m_writeCount{0};
};

} // namespace reelq::core::downloader
