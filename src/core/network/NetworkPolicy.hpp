#pragma once

/**
 * NetworkPolicy.hpp
 *
 * Translates network changes and the cellular preference into
 * pause/resume calls on the download queue.
 */

#include <mutex>

namespace reelq::core::downloader { class DownloadQueueManager; }

namespace reelq::core::network {

enum class NetworkType {
    None,
    Wifi,
    Ethernet,
    Cellular
};

const char* toString(NetworkType type);

class NetworkPolicy {
public:
    NetworkPolicy(downloader::DownloadQueueManager& queue, bool allowCellular);

    /**
     * Report the current network. Entering a restricted cellular network
     * pauses transfers; reaching an allowed one resumes them.
     */
    void setNetworkType(NetworkType type);

    /**
     * Change the cellular preference. Allowing cellular while on cellular
     * resumes transfers; forbidding it pauses them.
     */
    void setAllowCellular(bool allow);

    /**
     * App came back to the foreground
     */
    void onForeground();

    bool isTransferAllowed() const;
    NetworkType getNetworkType() const;
    bool getAllowCellular() const;

private:
    static bool allowedLocked(NetworkType type, bool allowCellular);

private:
    downloader::DownloadQueueManager& m_queue;

    mutable std::mutex m_mutex;
    NetworkType m_type{NetworkType::Wifi};
    bool m_allowCellular;
};

} // namespace reelq::core::network
