/**
 * HttpDownloader.cpp
 */

#include "HttpDownloader.hpp"
#include "../Logger.hpp"

#include <cpr/cpr.h>
#include <algorithm>
#include <fstream>

namespace reelq::core::downloader {

namespace {

// Minimum progress step reported back to the coordinator
constexpr double kProgressStep = 0.005;

const char* extensionFor(StreamType type) {
    switch (type) {
        case StreamType::M3U8:
        case StreamType::HLS:
            return ".m3u8";
        case StreamType::Dash:
            return ".mpd";
        case StreamType::Direct:
        default:
            return ".mp4";
    }
}

} // namespace

HttpDownloader::HttpDownloader(std::filesystem::path directory, size_t workers, int timeoutMs)
    : m_directory(std::move(directory))
    , m_timeoutMs(timeoutMs)
    , m_pool(std::make_unique<ThreadPool>(std::max<size_t>(workers, 1))) {
}

HttpDownloader::~HttpDownloader() {
    shutdown();
}

void HttpDownloader::shutdown() {
    if (!m_running.exchange(false)) return;

    LOG_INFO("Shutting down HttpDownloader");

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [id, transfer] : m_transfers) {
            transfer->cancelled = true;
            wake(*transfer);
        }
    }

    m_pool->shutdown();
}

void HttpDownloader::start(const std::string& id,
                           const StreamSource& source,
                           const std::string& quality,
                           TransferProgressCallback onProgress,
                           TransferCompleteCallback onComplete) {
    if (!m_running) {
        onComplete(TransferResult::failed("downloader stopped"));
        return;
    }

    auto transfer = std::make_shared<Transfer>();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        transfer->serial = ++m_nextSerial;

        // A cancelled transfer for the same id may still be winding down
        auto existing = m_transfers.find(id);
        if (existing != m_transfers.end()) {
            existing->second->cancelled = true;
            wake(*existing->second);
        }
        m_transfers[id] = transfer;
    }

    LOG_DEBUG("Queued transfer {} ({}, quality '{}')", id, toString(source.type), quality);

    auto posted = m_pool->post([this, id, source, transfer, onProgress, onComplete]() {
        runTransfer(id, source, transfer, onProgress, onComplete);
    });
    if (!posted) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_transfers.find(id);
            if (it != m_transfers.end() && it->second == transfer) {
                m_transfers.erase(it);
            }
        }
        onComplete(TransferResult::failed("downloader stopped"));
    }
}

void HttpDownloader::pause(const std::string& id) {
    if (auto transfer = findTransfer(id)) {
        transfer->paused = true;
    }
}

void HttpDownloader::resume(const std::string& id) {
    if (auto transfer = findTransfer(id)) {
        transfer->paused = false;
        wake(*transfer);
    }
}

void HttpDownloader::cancel(const std::string& id) {
    if (auto transfer = findTransfer(id)) {
        transfer->cancelled = true;
        wake(*transfer);
    }
}

std::filesystem::path HttpDownloader::artifactPath(const std::string& id, StreamType type) const {
    return m_directory / (id + extensionFor(type));
}

size_t HttpDownloader::getActiveTransfers() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_transfers.size();
}

void HttpDownloader::runTransfer(const std::string& id,
                                 const StreamSource& source,
                                 const std::shared_ptr<Transfer>& transfer,
                                 const TransferProgressCallback& onProgress,
                                 const TransferCompleteCallback& onComplete) {
    TransferResult result;
    try {
        result = executeTransfer(id, source, *transfer, onProgress);
    } catch (const std::exception& e) {
        result = TransferResult::failed(e.what());
    }

    releaseTransfer(id, transfer);

    if (!result.success) {
        LOG_WARN("Transfer {} failed: {}", id, result.error);
    }
    onComplete(result);
}

TransferResult HttpDownloader::executeTransfer(const std::string& id,
                                               const StreamSource& source,
                                               Transfer& transfer,
                                               const TransferProgressCallback& onProgress) {
    if (transfer.cancelled) {
        return TransferResult::failed("cancelled");
    }

    std::filesystem::create_directories(m_directory);

    auto finalPath = artifactPath(id, source.type);
    auto partPath = m_directory / (id + "." + std::to_string(transfer.serial) + ".part");

    cpr::Header header;
    for (const auto& [key, value] : source.headers) {
        header[key] = value;
    }

    double lastReported = -1.0;
    cpr::Response response;
    {
        std::ofstream file(partPath, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return TransferResult::failed("Failed to open output file");
        }

        response = cpr::Download(
            file,
            cpr::Url{source.url},
            header,
            cpr::ConnectTimeout{m_timeoutMs},
            cpr::ProgressCallback([&](cpr::cpr_off_t downloadTotal, cpr::cpr_off_t downloadNow,
                                      cpr::cpr_off_t /*uploadTotal*/, cpr::cpr_off_t /*uploadNow*/,
                                      intptr_t /*userdata*/) -> bool {
                if (transfer.paused && !transfer.cancelled) {
                    std::unique_lock<std::mutex> lock(transfer.mutex);
                    transfer.condition.wait(lock, [&transfer] {
                        return !transfer.paused || transfer.cancelled;
                    });
                }
                if (transfer.cancelled) {
                    return false; // Abort transfer
                }

                if (downloadTotal > 0 && onProgress) {
                    double fraction = static_cast<double>(downloadNow) /
                                      static_cast<double>(downloadTotal);
                    if (fraction - lastReported >= kProgressStep) {
                        lastReported = fraction;
                        onProgress(fraction);
                    }
                }
                return true;
            })
        );
    }

    std::error_code ec;
    if (transfer.cancelled) {
        std::filesystem::remove(partPath, ec);
        return TransferResult::failed("cancelled");
    }

    if (response.error) {
        std::filesystem::remove(partPath, ec);
        return TransferResult::failed(response.error.message);
    }

    if (response.status_code < 200 || response.status_code >= 300) {
        std::filesystem::remove(partPath, ec);
        return TransferResult::failed("HTTP " + std::to_string(response.status_code));
    }

    return finishArtifact(partPath, finalPath);
}

TransferResult HttpDownloader::finishArtifact(const std::filesystem::path& partPath,
                                              const std::filesystem::path& finalPath) {
    std::error_code ec;
    std::filesystem::rename(partPath, finalPath, ec);
    if (ec) {
        std::error_code removeError;
        std::filesystem::remove(partPath, removeError);
        LOG_ERROR("Could not move {} into place: {}", finalPath.string(), ec.message());
        return TransferResult::failed("Failed to store artifact: " + ec.message());
    }

    LOG_DEBUG("Downloaded: {}", finalPath.string());
    return TransferResult::succeeded(finalPath.string());
}

std::shared_ptr<HttpDownloader::Transfer> HttpDownloader::findTransfer(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_transfers.find(id);
    return it != m_transfers.end() ? it->second : nullptr;
}

void HttpDownloader::releaseTransfer(const std::string& id, const std::shared_ptr<Transfer>& transfer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_transfers.find(id);
    if (it != m_transfers.end() && it->second == transfer) {
        m_transfers.erase(it);
    }
}

void HttpDownloader::wake(Transfer& transfer) {
    {
        std::lock_guard<std::mutex> lock(transfer.mutex);
    }
    transfer.condition.notify_all();
}

} // namespace reelq::core::downloader
