#pragma once

/**
 * DownloadStore.hpp
 *
 * Durable storage for the four download partitions.
 */

#include "DownloadRecord.hpp"

#include <string>
#include <vector>

namespace reelq::core::downloader {

// Stable partition keys
inline constexpr const char* kActivePartition = "active";
inline constexpr const char* kQueuedPartition = "queued";
inline constexpr const char* kCompletedPartition = "completed";
inline constexpr const char* kFailedPartition = "failed";

/**
 * Outcome of a save; partitions listed here kept their previous content
 */
struct SaveResult {
    std::vector<std::string> failedPartitions;

    bool ok() const { return failedPartitions.empty(); }
};

/**
 * Outcome of a load. A missing partition is simply empty; degraded
 * partitions were unreadable or corrupt and came back empty too.
 */
struct LoadResult {
    Partitions partitions;
    std::vector<std::string> degradedPartitions;
};

class DownloadStore {
public:
    virtual ~DownloadStore() = default;

    /**
     * Write every partition independently. Never throws.
     */
    virtual SaveResult save(const Partitions& partitions) = 0;

    /**
     * Read every partition independently. Never throws.
     */
    virtual LoadResult load() = 0;
};

} // namespace reelq::core::downloader
