/**
 * DownloadRecord.cpp
 *
 * JSON encoding for download records. Unknown keys are ignored and
 * missing keys fall back to defaults.
 */

#include "DownloadRecord.hpp"

namespace reelq::core::downloader {

namespace {

int64_t toMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

TimePoint fromMillis(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::milliseconds(ms)));
}

std::optional<TimePoint> optionalTime(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_number_integer()) {
        return fromMillis(j[key].get<int64_t>());
    }
    return std::nullopt;
}

std::optional<int> optionalInt(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_number_integer()) {
        return j[key].get<int>();
    }
    return std::nullopt;
}

} // namespace

const char* toString(DownloadState state) {
    switch (state) {
        case DownloadState::Pending:     return "pending";
        case DownloadState::Downloading: return "downloading";
        case DownloadState::Paused:      return "paused";
        case DownloadState::Completed:   return "completed";
        case DownloadState::Failed:      return "failed";
    }
    return "pending";
}

const char* toString(PauseReason reason) {
    switch (reason) {
        case PauseReason::None:           return "none";
        case PauseReason::User:           return "user";
        case PauseReason::CellularPolicy: return "cellular";
        case PauseReason::Interrupted:    return "interrupted";
    }
    return "none";
}

const char* toString(StreamType type) {
    switch (type) {
        case StreamType::Direct: return "direct";
        case StreamType::M3U8:   return "m3u8";
        case StreamType::Dash:   return "dash";
        case StreamType::HLS:    return "hls";
    }
    return "direct";
}

DownloadState downloadStateFromString(const std::string& value) {
    if (value == "downloading") return DownloadState::Downloading;
    if (value == "paused") return DownloadState::Paused;
    if (value == "completed") return DownloadState::Completed;
    if (value == "failed") return DownloadState::Failed;
    return DownloadState::Pending;
}

PauseReason pauseReasonFromString(const std::string& value) {
    if (value == "user") return PauseReason::User;
    if (value == "cellular") return PauseReason::CellularPolicy;
    if (value == "interrupted") return PauseReason::Interrupted;
    return PauseReason::None;
}

StreamType streamTypeFromString(const std::string& value) {
    if (value == "m3u8") return StreamType::M3U8;
    if (value == "dash") return StreamType::Dash;
    if (value == "hls") return StreamType::HLS;
    return StreamType::Direct;
}

nlohmann::json StreamSource::toJson() const {
    nlohmann::json j = {
        {"url", url},
        {"server", server},
        {"type", toString(type)},
        {"requiresReferer", requiresReferer},
        {"headers", headers}
    };
    if (expiresAt) {
        j["expiresAt"] = toMillis(*expiresAt);
    }
    return j;
}

StreamSource StreamSource::fromJson(const nlohmann::json& j) {
    StreamSource source;
    source.url = j.value("url", "");
    source.server = j.value("server", "");
    source.type = streamTypeFromString(j.value("type", "direct"));
    source.requiresReferer = j.value("requiresReferer", false);
    source.headers = j.value("headers", std::map<std::string, std::string>{});
    source.expiresAt = optionalTime(j, "expiresAt");
    return source;
}

nlohmann::json ContentRef::toJson() const {
    nlohmann::json j = {
        {"contentId", contentId},
        {"title", title},
        {"posterUrl", posterUrl}
    };
    if (season) j["season"] = *season;
    if (episode) j["episode"] = *episode;
    return j;
}

ContentRef ContentRef::fromJson(const nlohmann::json& j) {
    ContentRef content;
    content.contentId = j.value("contentId", "");
    content.title = j.value("title", "");
    content.posterUrl = j.value("posterUrl", "");
    content.season = optionalInt(j, "season");
    content.episode = optionalInt(j, "episode");
    return content;
}

nlohmann::json DownloadRecord::toJson() const {
    nlohmann::json j = {
        {"id", id},
        {"content", content.toJson()},
        {"state", toString(state)},
        {"pauseReason", toString(pauseReason)},
        {"progress", progress},
        {"quality", quality},
        {"error", error},
        {"createdAt", toMillis(createdAt)},
        {"updatedAt", toMillis(updatedAt)}
    };
    if (localArtifactPath) j["localArtifactPath"] = *localArtifactPath;
    if (source) j["source"] = source->toJson();
    if (completedAt) j["completedAt"] = toMillis(*completedAt);
    return j;
}

DownloadRecord DownloadRecord::fromJson(const nlohmann::json& j) {
    DownloadRecord record;
    record.id = j.value("id", "");
    if (j.contains("content") && j["content"].is_object()) {
        record.content = ContentRef::fromJson(j["content"]);
    }
    record.state = downloadStateFromString(j.value("state", "pending"));
    record.pauseReason = pauseReasonFromString(j.value("pauseReason", "none"));
    record.progress = j.value("progress", 0.0);
    record.quality = j.value("quality", "");
    record.error = j.value("error", "");

    if (j.contains("localArtifactPath") && j["localArtifactPath"].is_string()) {
        record.localArtifactPath = j["localArtifactPath"].get<std::string>();
    }
    if (j.contains("source") && j["source"].is_object()) {
        record.source = StreamSource::fromJson(j["source"]);
    }

    record.createdAt = fromMillis(j.value("createdAt", int64_t{0}));
    record.updatedAt = fromMillis(j.value("updatedAt", int64_t{0}));
    record.completedAt = optionalTime(j, "completedAt");
    return record;
}

} // namespace reelq::core::downloader
