#pragma once

/**
 * JsonDownloadStore.hpp
 *
 * File-backed DownloadStore: one JSON array per partition.
 */

#include "DownloadStore.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace reelq::core::downloader {

/**
 * JsonDownloadStore - <dir>/active.json, queued.json, completed.json, failed.json
 *
 * Each file is written to "<name>.json.tmp" and renamed into place, so a
 * crash mid-write leaves the previous partition intact.
 */
class JsonDownloadStore : public DownloadStore {
public:
    explicit JsonDownloadStore(std::filesystem::path directory);

    SaveResult save(const Partitions& partitions) override;
    LoadResult load() override;

    const std::filesystem::path& directory() const { return m_directory; }

    std::filesystem::path partitionPath(const std::string& key) const;

private:
    bool savePartition(const std::string& key, const std::vector<DownloadRecord>& records);

    /**
     * @return false if the file exists but could not be parsed
     */
    bool loadPartition(const std::string& key, std::vector<DownloadRecord>& out);

private:
    std::filesystem::path m_directory;
    std::mutex m_ioMutex;
};

} // namespace reelq::core::downloader
