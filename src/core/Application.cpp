/**
 * Application.cpp
 */

#include "Application.hpp"
#include "Config.hpp"
#include "EventBus.hpp"
#include "Logger.hpp"
#include "downloader/DownloadQueueManager.hpp"
#include "downloader/HttpDownloader.hpp"
#include "downloader/HttpSourceResolver.hpp"
#include "downloader/JsonDownloadStore.hpp"
#include "network/NetworkPolicy.hpp"

#include <filesystem>

namespace reelq::core {

namespace {

json toEventPayload(const downloader::DownloadEvent& event) {
    if (!event.record) {
        return {{"id", event.id}, {"removed", true}};
    }

    const auto& record = *event.record;
    json payload = {
        {"id", record.id},
        {"title", record.content.title},
        {"state", downloader::toString(record.state)},
        {"progress", record.progress},
        {"removed", false}
    };
    if (record.state == downloader::DownloadState::Paused) {
        payload["pauseReason"] = downloader::toString(record.pauseReason);
    }
    if (!record.error.empty()) {
        payload["error"] = record.error;
    }
    if (record.localArtifactPath) {
        payload["path"] = *record.localArtifactPath;
    }
    return payload;
}

} // namespace

Application::Application() = default;

Application::~Application() {
    shutdown();
}

bool Application::initialize() {
    if (m_state != AppState::Uninitialized) {
        return m_state == AppState::Ready;
    }
    m_state = AppState::Initializing;

    auto& config = Config::instance();

    int maxConcurrent = config.get<int>("downloads.maxConcurrent", 3);
    if (maxConcurrent < 1) {
        LOG_WARN("downloads.maxConcurrent must be positive (got {}), using 1", maxConcurrent);
        maxConcurrent = 1;
    }

    std::filesystem::path downloadsDir = config.get<std::string>("downloads.directory", "downloads");
    std::filesystem::path stateDir = config.get<std::string>("persistence.directory", "state");

    try {
        std::filesystem::create_directories(downloadsDir);
        std::filesystem::create_directories(stateDir);
    } catch (const std::exception& e) {
        LOG_CRITICAL("Failed to create data directories: {}", e.what());
        m_state = AppState::Error;
        return false;
    }

    downloader::QueueSettings settings;
    settings.maxConcurrent = static_cast<size_t>(maxConcurrent);
    settings.deleteArtifacts = config.get<bool>("downloads.deleteArtifacts", true);
    settings.flushInterval = std::chrono::milliseconds(
        config.get<int>("persistence.flushIntervalMs", 1000));

    m_store = std::make_shared<downloader::JsonDownloadStore>(stateDir);
    m_downloader = std::make_shared<downloader::HttpDownloader>(
        downloadsDir, settings.maxConcurrent, config.get<int>("downloads.timeout", 30000));
    m_resolver = std::make_shared<downloader::HttpSourceResolver>(
        config.get<int>("network.headTimeout", 5000));

    m_queue = std::make_unique<downloader::DownloadQueueManager>(
        settings, m_downloader, m_store, m_resolver);
    m_queue->setOnChanged([](const downloader::DownloadEvent& event) {
        EventBus::instance().emit(kDownloadUpdatedEvent, toEventPayload(event));
    });

    m_networkPolicy = std::make_unique<network::NetworkPolicy>(
        *m_queue, config.get<bool>("network.allowCellular", false));

    auto summary = m_queue->restore();
    if (!summary.degradedPartitions.empty()) {
        LOG_WARN("{} download partition(s) were unreadable and start empty",
                 summary.degradedPartitions.size());
    }
    m_queue->initialize();

    m_state = AppState::Ready;
    LOG_INFO("reelq {} ready (state: {}, downloads: {})",
             getVersion(), stateDir.string(), downloadsDir.string());
    return true;
}

void Application::shutdown() {
    AppState expected = AppState::Ready;
    if (!m_state.compare_exchange_strong(expected, AppState::ShuttingDown)) {
        return;
    }

    LOG_INFO("Shutting down");

    // Detach the queue first so cancelled transfers are not recorded as failures
    if (m_queue) {
        m_queue->shutdown();
    }
    if (m_downloader) {
        m_downloader->shutdown();
    }

    m_state = AppState::Uninitialized;
}

} // namespace reelq::core
