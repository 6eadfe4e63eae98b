/**
 * SnapshotWriter.cpp
 */

#include "SnapshotWriter.hpp"
#include "../Logger.hpp"

namespace reelq::core::downloader {

SnapshotWriter::SnapshotWriter(DownloadStore& store, std::chrono::milliseconds flushInterval)
    : m_store(store)
    , m_flushInterval(flushInterval) {
}

SnapshotWriter::~SnapshotWriter() {
    stop();
}

void SnapshotWriter::setProvider(SnapshotProvider provider) {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    m_provider = std::move(provider);
}

void SnapshotWriter::start() {
    if (m_running) return;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = false;
    }
    m_running = true;
    m_thread = std::thread(&SnapshotWriter::writerLoop, this);
}

void SnapshotWriter::stop() {
    if (!m_running) return;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_condition.notify_all();

    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_running = false;
}

void SnapshotWriter::requestWrite() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_urgent = true;
        m_dirty = true;
    }
    m_condition.notify_one();
}

void SnapshotWriter::markDirty() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_dirty) {
            return;
        }
        m_dirty = true;
    }
    m_condition.notify_one();
}

bool SnapshotWriter::flushNow() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_urgent = false;
        m_dirty = false;
        m_lastWrite = std::chrono::steady_clock::now();
    }
    return writeSnapshot();
}

void SnapshotWriter::writerLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);

    while (true) {
        m_condition.wait(lock, [this] {
            return m_stopping || m_dirty;
        });
        if (m_stopping) break;

        if (!m_urgent) {
            // Coalesce progress-only changes into one write per interval
            auto deadline = m_lastWrite + m_flushInterval;
            m_condition.wait_until(lock, deadline, [this] {
                return m_stopping || m_urgent;
            });
            if (m_stopping) break;
        }

        m_urgent = false;
        m_dirty = false;
        lock.unlock();

        writeSnapshot();

        lock.lock();
        m_lastWrite = std::chrono::steady_clock::now();
    }

    bool outstanding = m_dirty;
    m_dirty = false;
    m_urgent = false;
    lock.unlock();

    if (outstanding) {
        writeSnapshot();
    }
}

bool SnapshotWriter::writeSnapshot() {
    std::lock_guard<std::mutex> lock(m_writeMutex);

    if (!m_provider) {
        return false;
    }

    try {
        SaveResult result = m_store.save(m_provider());
        ++m_writeCount;
        return result.ok();
    } catch (const std::exception& e) {
        LOG_ERROR("Download state write failed: {}", e.what());
        return false;
    }
}

} // namespace reelq::core::downloader
