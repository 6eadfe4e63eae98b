#pragma once

/**
 * Application.hpp
 *
 * Composition root: builds the download service from configuration and
 * owns every collaborator for the lifetime of the process.
 */

#include <atomic>
#include <memory>
#include <string>

namespace reelq::core::downloader {
class DownloadQueueManager;
class HttpDownloader;
class JsonDownloadStore;
class HttpSourceResolver;
}
namespace reelq::core::network { class NetworkPolicy; }

namespace reelq::core {

/**
 * Application state enum
 */
enum class AppState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Error
};

// Emitted on the EventBus after every download change
inline constexpr const char* kDownloadUpdatedEvent = "download.updated";

class Application {
public:
    Application();
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * Create directories, restore persisted downloads, start persistence
     * @return true if initialization successful
     */
    bool initialize();

    /**
     * Write the final state, then stop transfers. Idempotent.
     */
    void shutdown();

    AppState getState() const { return m_state.load(); }

    downloader::DownloadQueueManager& getDownloadQueue() { return *m_queue; }
    network::NetworkPolicy& getNetworkPolicy() { return *m_networkPolicy; }

    static std::string getVersion() { return "1.0.0"; }

private:
    std::atomic<AppState> m_state{AppState::Uninitialized};

    std::shared_ptr<downloader::JsonDownloadStore> m_store;
    std::shared_ptr<downloader::HttpDownloader> m_downloader;
    std::shared_ptr<downloader::HttpSourceResolver> m_resolver;
    std::unique_ptr<downloader::DownloadQueueManager> m_queue;
    std::unique_ptr<network::NetworkPolicy> m_networkPolicy;
};

} // namespace reelq::core
