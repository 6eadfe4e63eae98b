/**
 * HttpSourceResolver.cpp
 */

#include "HttpSourceResolver.hpp"
#include "../Logger.hpp"

#include <cpr/cpr.h>

namespace reelq::core::downloader {

HttpSourceResolver::HttpSourceResolver(int headTimeoutMs)
    : m_headTimeoutMs(headTimeoutMs) {
}

std::optional<StreamSource> HttpSourceResolver::resolve(const DownloadRecord& record) {
    if (!record.source || record.source->url.empty()) {
        LOG_WARN("No stored source to re-resolve for {}", record.id);
        return std::nullopt;
    }

    StreamSource source = *record.source;

    cpr::Header header;
    for (const auto& [key, value] : source.headers) {
        header[key] = value;
    }

    cpr::Response response = cpr::Head(
        cpr::Url{source.url},
        header,
        cpr::Timeout{m_headTimeoutMs}
    );

    if (response.error) {
        LOG_WARN("Source check for {} failed: {}", record.id, response.error.message);
        return std::nullopt;
    }

    if (response.status_code < 200 || response.status_code >= 400) {
        LOG_WARN("Source for {} no longer available (HTTP {})", record.id, response.status_code);
        return std::nullopt;
    }

    source.expiresAt.reset();
    LOG_DEBUG("Source for {} revalidated", record.id);
    return source;
}

} // namespace reelq::core::downloader
