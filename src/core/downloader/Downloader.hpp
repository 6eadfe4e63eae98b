#pragma once

/**
 * Downloader.hpp
 *
 * Transfer engine seen by the queue coordinator.
 */

#include "DownloadRecord.hpp"

#include <functional>
#include <string>

namespace reelq::core::downloader {

/**
 * Final outcome of one transfer
 */
struct TransferResult {
    bool success{false};
    std::string localPath;
    std::string error;

    static TransferResult succeeded(std::string path) {
        return TransferResult{true, std::move(path), ""};
    }

    static TransferResult failed(std::string reason) {
        return TransferResult{false, "", std::move(reason)};
    }
};

/**
 * Progress callback, fraction in [0, 1]
 */
using TransferProgressCallback = std::function<void(double fraction)>;

/**
 * Completion callback, called exactly once per start()
 */
using TransferCompleteCallback = std::function<void(const TransferResult& result)>;

/**
 * Downloader - performs the byte transfer for one download id
 *
 * Callbacks may arrive on any thread. After onComplete no further
 * callback is delivered for that start(). pause/resume/cancel are
 * advisory and must not block.
 */
class Downloader {
public:
    virtual ~Downloader() = default;

    virtual void start(const std::string& id,
                       const StreamSource& source,
                       const std::string& quality,
                       TransferProgressCallback onProgress,
                       TransferCompleteCallback onComplete) = 0;

    virtual void pause(const std::string& id) = 0;
    virtual void resume(const std::string& id) = 0;
    virtual void cancel(const std::string& id) = 0;
};

} // namespace reelq::core::downloader
