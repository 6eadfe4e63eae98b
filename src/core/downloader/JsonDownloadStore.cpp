/**
 * JsonDownloadStore.cpp
 */

#include "JsonDownloadStore.hpp"
#include "../Logger.hpp"

#include <nlohmann/json.hpp>
#include <fstream>

namespace reelq::core::downloader {

using json = nlohmann::json;

JsonDownloadStore::JsonDownloadStore(std::filesystem::path directory)
    : m_directory(std::move(directory)) {
}

std::filesystem::path JsonDownloadStore::partitionPath(const std::string& key) const {
    return m_directory / (key + ".json");
}

SaveResult JsonDownloadStore::save(const Partitions& partitions) {
    std::lock_guard<std::mutex> lock(m_ioMutex);

    SaveResult result;

    // Destinations before sources: a crash between two files after a
    // completion, failure or promotion leaves a duplicate, which restore
    // resolves, instead of losing the record. A retry moves failed -> active
    // against this order and can still be lost in that window.
    const std::pair<const char*, const std::vector<DownloadRecord>*> entries[] = {
        {kCompletedPartition, &partitions.completed},
        {kFailedPartition, &partitions.failed},
        {kActivePartition, &partitions.active},
        {kQueuedPartition, &partitions.queued}
    };

    for (const auto& [key, records] : entries) {
        if (!savePartition(key, *records)) {
            result.failedPartitions.emplace_back(key);
        }
    }

    if (!result.ok()) {
        LOG_ERROR("Failed to persist {} download partition(s)", result.failedPartitions.size());
    }
    return result;
}

LoadResult JsonDownloadStore::load() {
    std::lock_guard<std::mutex> lock(m_ioMutex);

    LoadResult result;

    const std::pair<const char*, std::vector<DownloadRecord>*> entries[] = {
        {kActivePartition, &result.partitions.active},
        {kQueuedPartition, &result.partitions.queued},
        {kCompletedPartition, &result.partitions.completed},
        {kFailedPartition, &result.partitions.failed}
    };

    for (const auto& [key, records] : entries) {
        if (!loadPartition(key, *records)) {
            records->clear();
            result.degradedPartitions.emplace_back(key);
        }
    }

    LOG_DEBUG("Loaded {} download record(s) from {}", result.partitions.totalSize(), m_directory.string());
    return result;
}

bool JsonDownloadStore::savePartition(const std::string& key, const std::vector<DownloadRecord>& records) {
    auto path = partitionPath(key);
    auto tmpPath = path;
    tmpPath += ".tmp";

    try {
        std::filesystem::create_directories(m_directory);

        json array = json::array();
        for (const auto& record : records) {
            array.push_back(record.toJson());
        }

        {
            std::ofstream file(tmpPath, std::ios::trunc);
            if (!file.is_open()) {
                LOG_ERROR("Cannot open {} for writing", tmpPath.string());
                return false;
            }
            file << array.dump(2);
            file.flush();
            if (!file) {
                LOG_ERROR("Write failed for partition '{}'", key);
                return false;
            }
        }

        std::filesystem::rename(tmpPath, path);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save partition '{}': {}", key, e.what());
        std::error_code ec;
        std::filesystem::remove(tmpPath, ec);
        return false;
    }
}

bool JsonDownloadStore::loadPartition(const std::string& key, std::vector<DownloadRecord>& out) {
    auto path = partitionPath(key);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return true;
    }

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            LOG_ERROR("Cannot open partition '{}' at {}", key, path.string());
            return false;
        }

        json array = json::parse(file);
        if (!array.is_array()) {
            LOG_ERROR("Partition '{}' is not a JSON array, starting empty", key);
            return false;
        }

        for (const auto& item : array) {
            if (!item.is_object()) {
                LOG_WARN("Skipping malformed entry in partition '{}'", key);
                continue;
            }
            auto record = DownloadRecord::fromJson(item);
            if (record.id.empty()) {
                LOG_WARN("Skipping entry without id in partition '{}'", key);
                continue;
            }
            out.push_back(std::move(record));
        }
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Partition '{}' is corrupt ({}), starting empty", key, e.what());
        return false;
    }
}

} // namespace reelq::core::downloader
