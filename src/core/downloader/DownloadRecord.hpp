#pragma once

/**
 * DownloadRecord.hpp
 *
 * A single tracked download and the stream source it is fetched from.
 */

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace reelq::core::downloader {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * Download status
 */
enum class DownloadState {
    Pending,
    Downloading,
    Paused,
    Completed,
    Failed
};

/**
 * Why a record sits in Paused. Only non-user pauses are resumed
 * automatically.
 */
enum class PauseReason {
    None,
    User,
    CellularPolicy,
    Interrupted     // restored from a crash while Downloading
};

enum class StreamType {
    Direct,
    M3U8,
    Dash,
    HLS
};

const char* toString(DownloadState state);
const char* toString(PauseReason reason);
const char* toString(StreamType type);

DownloadState downloadStateFromString(const std::string& value);
PauseReason pauseReasonFromString(const std::string& value);
StreamType streamTypeFromString(const std::string& value);

/**
 * Resolved stream link a transfer is started from
 */
struct StreamSource {
    std::string url;
    std::string server;
    StreamType type{StreamType::Direct};
    bool requiresReferer{false};
    std::map<std::string, std::string> headers;

    // Temporary links stop working after this point
    std::optional<TimePoint> expiresAt;

    bool isExpired(TimePoint now = Clock::now()) const {
        return expiresAt.has_value() && now >= *expiresAt;
    }

    nlohmann::json toJson() const;
    static StreamSource fromJson(const nlohmann::json& j);
};

/**
 * Content metadata, owned by the catalog and copied in by value
 */
struct ContentRef {
    std::string contentId;
    std::string title;
    std::string posterUrl;
    std::optional<int> season;
    std::optional<int> episode;

    nlohmann::json toJson() const;
    static ContentRef fromJson(const nlohmann::json& j);
};

/**
 * DownloadRecord - one entry in exactly one partition
 */
struct DownloadRecord {
    std::string id;
    ContentRef content;
    DownloadState state{DownloadState::Pending};
    PauseReason pauseReason{PauseReason::None};
    double progress{0.0};
    std::string quality;

    // Set only once Completed
    std::optional<std::string> localArtifactPath;

    // Last failure description, empty unless Failed
    std::string error;

    std::optional<StreamSource> source;

    TimePoint createdAt{};
    TimePoint updatedAt{};
    std::optional<TimePoint> completedAt;

    bool isPaused() const { return state == DownloadState::Paused; }

    nlohmann::json toJson() const;
    static DownloadRecord fromJson(const nlohmann::json& j);
};

/**
 * The four disjoint partitions, each in insertion order
 */
struct Partitions {
    std::vector<DownloadRecord> active;
    std::vector<DownloadRecord> queued;
    std::vector<DownloadRecord> completed;
    std::vector<DownloadRecord> failed;

    size_t totalSize() const {
        return active.size() + queued.size() + completed.size() + failed.size();
    }
};

} // namespace reelq::core::downloader
