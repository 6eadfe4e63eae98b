/**
 * NetworkPolicy.cpp
 */

#include "NetworkPolicy.hpp"
#include "../Logger.hpp"
#include "../downloader/DownloadQueueManager.hpp"

namespace reelq::core::network {

const char* toString(NetworkType type) {
    switch (type) {
        case NetworkType::None:     return "none";
        case NetworkType::Wifi:     return "wifi";
        case NetworkType::Ethernet: return "ethernet";
        case NetworkType::Cellular: return "cellular";
    }
    return "none";
}

NetworkPolicy::NetworkPolicy(downloader::DownloadQueueManager& queue, bool allowCellular)
    : m_queue(queue)
    , m_allowCellular(allowCellular) {
}

void NetworkPolicy::setNetworkType(NetworkType type) {
    bool wasAllowed;
    bool nowAllowed;
    bool restrictedCellular;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (type == m_type) return;

        wasAllowed = allowedLocked(m_type, m_allowCellular);
        m_type = type;
        nowAllowed = allowedLocked(m_type, m_allowCellular);
        restrictedCellular = type == NetworkType::Cellular && !m_allowCellular;
    }

    LOG_INFO("Network changed to {}", toString(type));

    // Losing the network entirely is left to the transfers themselves
    if (restrictedCellular) {
        m_queue.pauseAllForCellularRestriction();
    } else if (nowAllowed && !wasAllowed) {
        m_queue.resumePending();
    }
}

void NetworkPolicy::setAllowCellular(bool allow) {
    bool onCellular;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (allow == m_allowCellular) return;
        m_allowCellular = allow;
        onCellular = m_type == NetworkType::Cellular;
    }

    LOG_INFO("Cellular downloads {}", allow ? "allowed" : "disallowed");

    if (!onCellular) return;

    if (allow) {
        m_queue.resumePending();
    } else {
        m_queue.pauseAllForCellularRestriction();
    }
}

void NetworkPolicy::onForeground() {
    if (isTransferAllowed()) {
        m_queue.resumePending();
    }
}

bool NetworkPolicy::isTransferAllowed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return allowedLocked(m_type, m_allowCellular);
}

NetworkType NetworkPolicy::getNetworkType() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_type;
}

bool NetworkPolicy::getAllowCellular() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_allowCellular;
}

bool NetworkPolicy::allowedLocked(NetworkType type, bool allowCellular) {
    switch (type) {
        case NetworkType::Wifi:
        case NetworkType::Ethernet:
            return true;
        case NetworkType::Cellular:
            return allowCellular;
        case NetworkType::None:
        default:
            return false;
    }
}

} // namespace reelq::core::network
