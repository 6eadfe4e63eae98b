#pragma once

/**
 * SourceResolver.hpp
 *
 * Re-resolves the stream link of a record whose stored source is
 * missing or expired, before the record is started.
 */

#include "DownloadRecord.hpp"

#include <optional>

namespace reelq::core::downloader {

class SourceResolver {
public:
    virtual ~SourceResolver() = default;

    /**
     * @param record Record about to be started
     * @return Usable source, or nullopt if none can be obtained
     */
    virtual std::optional<StreamSource> resolve(const DownloadRecord& record) = 0;
};

} // namespace reelq::core::downloader
