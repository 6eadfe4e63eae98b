#pragma once

/**
 * HttpSourceResolver.hpp
 *
 * Re-validates a record's stored stream link with an HTTP HEAD request.
 */

#include "SourceResolver.hpp"

namespace reelq::core::downloader {

/**
 * HttpSourceResolver
 *
 * Scraping a fresh link is the catalog's job; this resolver can only tell
 * whether the stored link still answers. A 2xx/3xx reply revalidates it
 * and drops its expiry, anything else reports the source as unavailable.
 */
class HttpSourceResolver : public SourceResolver {
public:
    explicit HttpSourceResolver(int headTimeoutMs);

    std::optional<StreamSource> resolve(const DownloadRecord& record) override;

private:
    int m_headTimeoutMs;
};

} // namespace reelq::core::downloader
