/**
 * reelq - offline download queue service
 *
 * Main entry point. Loads configuration, starts the download service and
 * runs a line-oriented command console on stdin.
 */

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "core/Application.hpp"
#include "core/Config.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "core/downloader/DownloadQueueManager.hpp"
#include "core/network/NetworkPolicy.hpp"
#include "utils/PathUtils.hpp"

namespace fs = std::filesystem;

using reelq::core::downloader::DownloadQueueManager;
using reelq::core::downloader::DownloadRecord;
using reelq::core::network::NetworkType;

namespace {

std::atomic<bool> g_stopRequested{false};

void signalHandler(int) {
    g_stopRequested = true;
}

/**
 * Install SIGINT/SIGTERM handlers. A signal interrupts the blocking read
 * on stdin so the console loop can exit and shut down cleanly.
 */
void setupSignalHandlers() {
#ifdef _WIN32
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGBREAK, signalHandler);
#else
    struct sigaction action {};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0; // no SA_RESTART
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
#endif
}

/**
 * Load configuration, creating a default file on first run
 */
bool loadConfiguration(const fs::path& configPath) {
    auto& config = reelq::core::Config::instance();

    try {
        if (fs::exists(configPath)) {
            if (!config.load(configPath.string())) {
                LOG_ERROR("Configuration file {} is invalid", configPath.string());
                return false;
            }
            LOG_INFO("Configuration loaded from {}", configPath.string());
        } else {
            config.setDefaults();
            if (config.save(configPath.string())) {
                LOG_INFO("Default configuration created at {}", configPath.string());
            } else {
                LOG_WARN("Could not write default configuration to {}", configPath.string());
            }
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load configuration: {}", e.what());
        return false;
    }
}

std::optional<NetworkType> parseNetworkType(const std::string& name) {
    if (name == "wifi") return NetworkType::Wifi;
    if (name == "cellular") return NetworkType::Cellular;
    if (name == "ethernet") return NetworkType::Ethernet;
    if (name == "none") return NetworkType::None;
    return std::nullopt;
}

void printHelp() {
    std::cout << "Commands:\n"
              << "  add <contentId> <title> <url> [quality]\n"
              << "  pause|resume|cancel|delete|retry <id>\n"
              << "  list\n"
              << "  network wifi|cellular|ethernet|none\n"
              << "  cellular allow|deny\n"
              << "  foreground\n"
              << "  limit <k>\n"
              << "  quit\n";
}

void printPartition(const char* name, const std::vector<DownloadRecord>& records) {
    std::cout << name << " (" << records.size() << ")\n";
    for (const auto& record : records) {
        std::cout << "  " << record.id << "  "
                  << std::left << std::setw(12) << reelq::core::downloader::toString(record.state)
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(6) << record.progress * 100.0 << "%  "
                  << record.content.title;
        if (record.state == reelq::core::downloader::DownloadState::Paused) {
            std::cout << " [" << reelq::core::downloader::toString(record.pauseReason) << "]";
        }
        if (!record.error.empty()) {
            std::cout << " (" << record.error << ")";
        }
        std::cout << "\n";
    }
}

void printList(const DownloadQueueManager& queue) {
    auto partitions = queue.snapshot();
    printPartition("active", partitions.active);
    printPartition("queued", partitions.queued);
    printPartition("completed", partitions.completed);
    printPartition("failed", partitions.failed);
}

void report(bool changed, const std::string& command, const std::string& id) {
    if (!changed) {
        std::cout << command << ": nothing to do for " << id << "\n";
    }
}

/**
 * Execute one console line
 * @return false when the console should exit
 */
bool runCommand(reelq::core::Application& app, const std::string& line) {
    std::istringstream input(line);
    std::string command;
    if (!(input >> command)) {
        return true;
    }

    auto& queue = app.getDownloadQueue();
    auto& policy = app.getNetworkPolicy();

    if (command == "quit" || command == "exit") {
        return false;
    }
    if (command == "help") {
        printHelp();
        return true;
    }
    if (command == "list") {
        printList(queue);
        return true;
    }
    if (command == "foreground") {
        policy.onForeground();
        return true;
    }

    if (command == "add") {
        std::string contentId, title, url, quality;
        if (!(input >> std::quoted(contentId) >> std::quoted(title) >> url)) {
            std::cout << "usage: add <contentId> <title> <url> [quality]\n";
            return true;
        }
        if (!(input >> quality)) {
            quality = "auto";
        }

        reelq::core::downloader::ContentRef content;
        content.contentId = contentId;
        content.title = title;

        reelq::core::downloader::StreamSource source;
        source.url = url;

        auto record = DownloadQueueManager::createRecord(content, quality, source);
        std::string id = record.id;
        if (queue.enqueue(std::move(record))) {
            std::cout << "added " << id << "\n";
        } else {
            std::cout << "add: download already exists\n";
        }
        return true;
    }

    if (command == "network") {
        std::string name;
        input >> name;
        auto type = parseNetworkType(name);
        if (!type) {
            std::cout << "usage: network wifi|cellular|ethernet|none\n";
            return true;
        }
        policy.setNetworkType(*type);
        return true;
    }

    if (command == "cellular") {
        std::string mode;
        input >> mode;
        if (mode != "allow" && mode != "deny") {
            std::cout << "usage: cellular allow|deny\n";
            return true;
        }
        bool allow = mode == "allow";
        policy.setAllowCellular(allow);
        reelq::core::Config::instance().set("network.allowCellular", allow);
        if (!reelq::core::Config::instance().save()) {
            LOG_WARN("Cellular preference changed but configuration was not saved");
        }
        return true;
    }

    if (command == "limit") {
        long limit = 0;
        if (!(input >> limit) || limit < 1) {
            std::cout << "usage: limit <k>, k >= 1\n";
            return true;
        }
        queue.setMaxConcurrent(static_cast<size_t>(limit));
        return true;
    }

    std::string id;
    if (!(input >> id)) {
        std::cout << "unknown command, type 'help'\n";
        return true;
    }

    if (command == "pause") {
        report(queue.pause(id), command, id);
    } else if (command == "resume") {
        report(queue.resume(id), command, id);
    } else if (command == "cancel") {
        report(queue.cancel(id), command, id);
    } else if (command == "delete") {
        report(queue.deleteDownload(id), command, id);
    } else if (command == "retry") {
        report(queue.retry(id), command, id);
    } else {
        std::cout << "unknown command, type 'help'\n";
    }
    return true;
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    bool debugMode = false;
    fs::path configPath = reelq::utils::PathUtils::getConfigPath();

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--debug" || arg == "-d") {
            debugMode = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "reelq - offline download queue\n"
                      << "\nUsage: " << argv[0] << " [options]\n"
                      << "\nOptions:\n"
                      << "  -c, --config <path>  Configuration file\n"
                      << "  -d, --debug          Enable debug logging\n"
                      << "  -h, --help           Show this help message\n"
                      << "  -v, --version        Show version information\n"
                      << std::endl;
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "reelq v" << reelq::core::Application::getVersion() << std::endl;
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        }
    }

    // Console logging until the configuration names a log directory
    reelq::core::LogSettings logSettings;
    logSettings.level = debugMode ? reelq::core::LogLevel::Debug : reelq::core::LogLevel::Info;
    reelq::core::Logger::instance().configure(logSettings);

    if (!loadConfiguration(configPath)) {
        LOG_CRITICAL("Failed to load configuration");
        return 1;
    }

    auto& config = reelq::core::Config::instance();
    if (!debugMode) {
        logSettings.level = reelq::core::Logger::parseLevel(config.get<std::string>("logging.level", "info"));
    }
    logSettings.directory = config.get<std::string>("logging.directory", "");
    reelq::core::Logger::instance().configure(logSettings);

    for (const auto& problem : config.validate()) {
        LOG_WARN("Configuration: {}", problem);
    }

    LOG_INFO("reelq v{} starting...", reelq::core::Application::getVersion());

    setupSignalHandlers();

    try {
        reelq::core::Application app;

        if (!app.initialize()) {
            LOG_CRITICAL("Failed to initialize application");
            return 1;
        }

        reelq::core::ScopedSubscription updates(
            reelq::core::EventBus::instance(), reelq::core::kDownloadUpdatedEvent, [](const reelq::core::json& event) {
                if (event.value("removed", false)) {
                    std::cout << "* " << event.value("id", "") << " removed\n";
                    return;
                }
                std::cout << "* " << event.value("id", "") << " "
                          << event.value("state", "") << " "
                          << std::fixed << std::setprecision(1)
                          << event.value("progress", 0.0) * 100.0 << "% "
                          << event.value("title", "");
                if (event.contains("error")) {
                    std::cout << " (" << event["error"].get<std::string>() << ")";
                }
                std::cout << std::endl;
            });

        std::cout << "reelq ready, type 'help' for commands" << std::endl;

        std::string line;
        while (!g_stopRequested && std::getline(std::cin, line)) {
            if (!runCommand(app, line)) {
                break;
            }
        }

        if (g_stopRequested) {
            LOG_INFO("Received stop signal, shutting down gracefully...");
        }

        updates.reset();
        app.shutdown();

        LOG_INFO("reelq shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        LOG_CRITICAL("Unhandled exception: {}", e.what());
        return 1;
    }
}
