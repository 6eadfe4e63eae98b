#pragma once

/**
 * HttpDownloader.hpp
 *
 * Downloader backed by cpr, one transfer per worker thread.
 */

#include "Downloader.hpp"
#include "../ThreadPool.hpp"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace reelq::core::downloader {

/**
 * HttpDownloader - plain HTTP(S) transfer of the stream URL
 *
 * Features:
 * - Transfers run on a fixed ThreadPool
 * - Pause parks the worker inside the progress callback
 * - Cancel aborts at the next progress tick and removes the partial file
 * - Artifacts land in <directory>/<id>.<ext>
 */
class HttpDownloader : public Downloader {
public:
    /**
     * @param directory Artifact directory
     * @param workers Worker threads, normally the concurrency limit
     * @param timeoutMs Connect timeout; a paused transfer is never timed out
     */
    HttpDownloader(std::filesystem::path directory, size_t workers, int timeoutMs);
    ~HttpDownloader() override;

    HttpDownloader(const HttpDownloader&) = delete;
    HttpDownloader& operator=(const HttpDownloader&) = delete;

    void start(const std::string& id,
               const StreamSource& source,
               const std::string& quality,
               TransferProgressCallback onProgress,
               TransferCompleteCallback onComplete) override;

    void pause(const std::string& id) override;
    void resume(const std::string& id) override;
    void cancel(const std::string& id) override;

    /**
     * Cancel every transfer and join the workers. Idempotent.
     */
    void shutdown();

    /**
     * Final location of an artifact
     */
    std::filesystem::path artifactPath(const std::string& id, StreamType type) const;

    size_t getActiveTransfers() const;

    /**
     * Move a finished part file to its final name. On failure the part
     * file is removed and a failed result returned.
     */
    static TransferResult finishArtifact(const std::filesystem::path& partPath,
                                         const std::filesystem::path& finalPath);

private:
    struct Transfer {
        uint64_t serial{0};
        std::atomic<bool> cancelled{false};
        std::atomic<bool> paused{false};
        std::mutex mutex;
        std::condition_variable condition;
    };

    void runTransfer(const std::string& id,
                     const StreamSource& source,
                     const std::shared_ptr<Transfer>& transfer,
                     const TransferProgressCallback& onProgress,
                     const TransferCompleteCallback& onComplete);

    TransferResult executeTransfer(const std::string& id,
                                   const StreamSource& source,
                                   Transfer& transfer,
                                   const TransferProgressCallback& onProgress);

    std::shared_ptr<Transfer> findTransfer(const std::string& id) const;
    void releaseTransfer(const std::string& id, const std::shared_ptr<Transfer>& transfer);

    static void wake(Transfer& transfer);

private:
    std::filesystem::path m_directory;
    int m_timeoutMs;

    std::unique_ptr<ThreadPool> m_pool;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<Transfer>> m_transfers;
    uint64_t m_nextSerial{0};
    std::atomic<bool> m_running{true};
};

} // namespace reelq::core::downloader
