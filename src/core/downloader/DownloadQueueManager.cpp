/**
 * DownloadQueueManager.cpp
 *
 * Implementation of the download queue coordinator.
 */

#include "DownloadQueueManager.hpp"
#include "../Logger.hpp"
#include "../../utils/PathUtils.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <random>
#include <unordered_set>

namespace reelq::core::downloader {

namespace {

// Source resolutions allowed in flight at once
constexpr size_t kResolveWorkers = 2;

std::string generateDownloadId() {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    const char* hex = "0123456789abcdef";
    std::string id;
    id.reserve(32);

    for (int i = 0; i < 32; ++i) {
        id += hex[dis(gen)];
    }

    return id;
}

} // namespace

DownloadQueueManager::DownloadQueueManager(QueueSettings settings,
                                           std::shared_ptr<Downloader> downloader,
                                           std::shared_ptr<DownloadStore> store,
                                           std::shared_ptr<SourceResolver> resolver)
    : m_downloader(std::move(downloader))
    , m_store(std::move(store))
    , m_resolver(std::move(resolver))
    , m_writer(std::make_unique<SnapshotWriter>(*m_store, settings.flushInterval))
    , m_maxConcurrent(std::max<size_t>(settings.maxConcurrent, 1))
    , m_deleteArtifacts(settings.deleteArtifacts)
    , m_resolvePool(std::make_unique<ThreadPool>(kResolveWorkers)) {
    m_writer->setProvider([this] { return snapshot(); });
}

DownloadQueueManager::~DownloadQueueManager() {
    shutdown();
    m_resolvePool->shutdown();
}

void DownloadQueueManager::initialize() {
    if (m_initialized) return;

    m_writer->start();
    m_initialized = true;

    LOG_INFO("DownloadQueueManager initialized (max concurrent: {})", getMaxConcurrent());
}

void DownloadQueueManager::shutdown() {
    if (!m_initialized) return;

    LOG_INFO("Shutting down DownloadQueueManager");

    {
        // Detach running transfers; their records stay Downloading on disk
        // and come back as interrupted on the next restore
        std::lock_guard<std::mutex> lock(m_mutex);
        m_liveTransfers.clear();
    }

    m_writer->stop();
    if (!m_writer->flushNow()) {
        LOG_ERROR("Final download state write was incomplete");
    }
    m_initialized = false;
}

DownloadRecord DownloadQueueManager::createRecord(const ContentRef& content,
                                                  const std::string& quality,
                                                  std::optional<StreamSource> source) {
    DownloadRecord record;
    record.id = generateDownloadId();
    record.content = content;
    record.quality = quality;
    record.source = std::move(source);
    record.createdAt = Clock::now();
    record.updatedAt = record.createdAt;
    return record;
}

RestoreSummary DownloadQueueManager::restore() {
    RestoreSummary summary;

    LoadResult loaded = m_store->load();
    summary.degradedPartitions = loaded.degradedPartitions;
    for (const auto& key : loaded.degradedPartitions) {
        LOG_WARN("Partition '{}' could not be restored, starting it empty", key);
    }

    std::vector<DownloadRecord> completedPresent;
    for (auto& record : loaded.partitions.completed) {
        if (!utils::PathUtils::isExistingFile(record.localArtifactPath.value_or(""))) {
            LOG_WARN("Artifact for completed download {} ({}) is missing, evicting",
                     record.id, record.content.title);
            ++summary.evictedMissingArtifacts;
            continue;
        }
        completedPresent.push_back(std::move(record));
    }

    // A save interrupted between partition files can leave one id in two
    // partitions. The copy touched last wins; ties keep the earlier partition.
    enum Source { FromActive, FromQueued, FromCompleted, FromFailed };
    std::unordered_map<std::string, std::pair<Source, TimePoint>> newest;
    auto consider = [&newest](const std::vector<DownloadRecord>& records, Source from) {
        for (const auto& record : records) {
            auto [it, inserted] = newest.try_emplace(record.id, from, record.updatedAt);
            if (!inserted && record.updatedAt > it->second.second) {
                it->second = {from, record.updatedAt};
            }
        }
    };
    consider(loaded.partitions.active, FromActive);
    consider(loaded.partitions.queued, FromQueued);
    consider(completedPresent, FromCompleted);
    consider(loaded.partitions.failed, FromFailed);

    Partitions restored;
    std::unordered_set<std::string> seen;

    auto accept = [&](const DownloadRecord& record, Source from, const char* partition) {
        if (newest.at(record.id).first != from || !seen.insert(record.id).second) {
            LOG_WARN("Dropping duplicate download {} found in '{}'", record.id, partition);
            ++summary.duplicates;
            return false;
        }
        return true;
    };

    for (auto& record : loaded.partitions.active) {
        if (!accept(record, FromActive, kActivePartition)) continue;

        // No live transfer survives a restart
        if (record.state != DownloadState::Paused) {
            record.state = DownloadState::Paused;
            record.pauseReason = PauseReason::Interrupted;
            ++summary.interrupted;
        } else if (record.pauseReason == PauseReason::None) {
            record.pauseReason = PauseReason::User;
        }
        record.progress = std::clamp(record.progress, 0.0, kMaxInFlightProgress);
        restored.active.push_back(std::move(record));
    }

    for (auto& record : loaded.partitions.queued) {
        if (!accept(record, FromQueued, kQueuedPartition)) continue;
        record.state = DownloadState::Pending;
        record.pauseReason = PauseReason::None;
        restored.queued.push_back(std::move(record));
    }

    for (auto& record : completedPresent) {
        if (!accept(record, FromCompleted, kCompletedPartition)) continue;
        record.state = DownloadState::Completed;
        record.progress = 1.0;
        restored.completed.push_back(std::move(record));
    }

    for (auto& record : loaded.partitions.failed) {
        if (!accept(record, FromFailed, kFailedPartition)) continue;
        record.state = DownloadState::Failed;
        record.progress = std::clamp(record.progress, 0.0, kMaxInFlightProgress);
        restored.failed.push_back(std::move(record));
    }

    summary.restored = restored.totalSize();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_partitions = std::move(restored);
        m_liveTransfers.clear();
    }
    m_writer->requestWrite();

    LOG_INFO("Restored {} download(s): {} interrupted, {} evicted, {} duplicate(s) dropped",
             summary.restored, summary.interrupted,
             summary.evictedMissingArtifacts, summary.duplicates);
    return summary;
}

bool DownloadQueueManager::enqueue(DownloadRecord record, std::optional<StreamSource> source) {
    if (record.id.empty()) {
        record.id = generateDownloadId();
    }
    if (source) {
        record.source = std::move(source);
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (containsLocked(record.id)) {
            LOG_WARN("Download already exists: {}", record.id);
            return false;
        }

        admitLocked(std::move(record));
    }

    m_writer->requestWrite();
    dispatch();
    return true;
}

bool DownloadQueueManager::pause(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = findIn(m_partitions.active, id);
        if (it == m_partitions.active.end()) {
            LOG_DEBUG("Pause ignored, {} is not active", id);
            return false;
        }

        if (it->state == DownloadState::Paused) {
            // An explicit user pause outranks a policy pause
            if (it->pauseReason == PauseReason::User) {
                return false;
            }
            it->pauseReason = PauseReason::User;
            it->updatedAt = Clock::now();
            notifyLocked(*it);
        } else {
            it->state = DownloadState::Paused;
            it->pauseReason = PauseReason::User;
            it->updatedAt = Clock::now();

            if (m_liveTransfers.count(id)) {
                m_outbox.push_back(Command{CommandType::Pause, id});
            }
            notifyLocked(*it);
            LOG_DEBUG("Download paused: {}", it->content.title);
        }
    }

    m_writer->requestWrite();
    dispatch();
    return true;
}

bool DownloadQueueManager::resume(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = findIn(m_partitions.active, id);
        if (it == m_partitions.active.end() || it->state != DownloadState::Paused) {
            LOG_DEBUG("Resume ignored, {} is not a paused active download", id);
            return false;
        }

        if (m_transfersRestricted) {
            if (it->pauseReason == PauseReason::CellularPolicy) {
                return false;
            }
            // Hand the record to the policy so it starts once transfers are allowed
            it->pauseReason = PauseReason::CellularPolicy;
            it->updatedAt = Clock::now();
            notifyLocked(*it);
            LOG_INFO("{} will resume when the network allows transfers", it->content.title);
        } else if (downloadingCountLocked() >= m_maxConcurrent) {
            LOG_WARN("Cannot resume {}, all {} transfer slots are busy", id, m_maxConcurrent);
            return false;
        } else {
            it->state = DownloadState::Downloading;
            it->pauseReason = PauseReason::None;
            it->updatedAt = Clock::now();

            if (m_liveTransfers.count(id)) {
                m_outbox.push_back(Command{CommandType::Resume, id});
            } else {
                // Nothing to resume after a restart, start a new transfer
                scheduleStartLocked(*it);
            }
            notifyLocked(*it);
            LOG_DEBUG("Download resumed: {}", it->content.title);
        }
    }

    m_writer->requestWrite();
    dispatch();
    return true;
}

bool DownloadQueueManager::cancel(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = findIn(m_partitions.active, id);
        if (it != m_partitions.active.end()) {
            LOG_DEBUG("Download cancelled: {}", it->content.title);
            m_partitions.active.erase(it);

            if (m_liveTransfers.erase(id) > 0) {
                m_outbox.push_back(Command{CommandType::Cancel, id});
            }
            notifyRemovedLocked(id);
            promoteLocked();
        } else {
            auto queued = findIn(m_partitions.queued, id);
            if (queued == m_partitions.queued.end()) {
                LOG_DEBUG("Cancel ignored, {} is not active or queued", id);
                return false;
            }

            LOG_DEBUG("Queued download cancelled: {}", queued->content.title);
            m_partitions.queued.erase(queued);
            notifyRemovedLocked(id);
        }
    }

    m_writer->requestWrite();
    dispatch();
    return true;
}

bool DownloadQueueManager::deleteDownload(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto* partition = &m_partitions.completed;
        auto it = findIn(*partition, id);
        if (it == partition->end()) {
            partition = &m_partitions.failed;
            it = findIn(*partition, id);
        }
        if (it == partition->end()) {
            LOG_DEBUG("Delete ignored, {} is not completed or failed", id);
            return false;
        }

        if (m_deleteArtifacts && it->localArtifactPath && !it->localArtifactPath->empty()) {
            Command command{CommandType::DeleteArtifact, id};
            command.path = *it->localArtifactPath;
            m_outbox.push_back(std::move(command));
        }

        LOG_DEBUG("Download deleted: {}", it->content.title);
        partition->erase(it);
        notifyRemovedLocked(id);
    }

    m_writer->requestWrite();
    dispatch();
    return true;
}

bool DownloadQueueManager::retry(const std::string& id, std::optional<StreamSource> source) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = findIn(m_partitions.failed, id);
        if (it == m_partitions.failed.end()) {
            LOG_DEBUG("Retry ignored, {} has not failed", id);
            return false;
        }

        DownloadRecord record = std::move(*it);
        m_partitions.failed.erase(it);

        if (source) {
            record.source = std::move(source);
        }

        LOG_INFO("Retrying download: {}", record.content.title);
        admitLocked(std::move(record));
    }

    m_writer->requestWrite();
    dispatch();
    return true;
}

void DownloadQueueManager::reportProgress(const std::string& id, double fraction) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = findIn(m_partitions.active, id);
        if (it == m_partitions.active.end()) {
            LOG_TRACE("Progress for untracked download {} ignored", id);
            return;
        }
        applyProgressLocked(*it, fraction);
    }

    m_writer->markDirty();
    dispatch();
}

void DownloadQueueManager::reportCompletion(const std::string& id, const TransferResult& result) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = findIn(m_partitions.active, id);
        if (it == m_partitions.active.end()) {
            LOG_DEBUG("Completion for untracked download {} ignored", id);
            return;
        }

        m_liveTransfers.erase(id);
        finishLocked(it, result);
    }

    m_writer->requestWrite();
    dispatch();
}

size_t DownloadQueueManager::pauseAllForCellularRestriction() {
    size_t paused = 0;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_transfersRestricted = true;

        auto now = Clock::now();
        for (auto& record : m_partitions.active) {
            if (record.state != DownloadState::Downloading) continue;

            record.state = DownloadState::Paused;
            record.pauseReason = PauseReason::CellularPolicy;
            record.updatedAt = now;

            if (m_liveTransfers.count(record.id)) {
                m_outbox.push_back(Command{CommandType::Pause, record.id});
            }
            notifyLocked(record);
            ++paused;
        }
    }

    if (paused == 0) {
        return 0;
    }

    LOG_INFO("Downloads paused on cellular network ({})", paused);
    m_writer->requestWrite();
    dispatch();
    return paused;
}

void DownloadQueueManager::resumePending() {
    size_t resumed = 0;
    size_t promoted = 0;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_transfersRestricted = false;

        size_t downloading = downloadingCountLocked();
        auto now = Clock::now();

        for (auto& record : m_partitions.active) {
            if (downloading >= m_maxConcurrent) break;
            if (record.state != DownloadState::Paused) continue;
            if (record.pauseReason != PauseReason::CellularPolicy &&
                record.pauseReason != PauseReason::Interrupted) continue;

            record.state = DownloadState::Downloading;
            record.pauseReason = PauseReason::None;
            record.updatedAt = now;

            if (m_liveTransfers.count(record.id)) {
                m_outbox.push_back(Command{CommandType::Resume, record.id});
            } else {
                scheduleStartLocked(record);
            }
            notifyLocked(record);
            ++downloading;
            ++resumed;
        }

        size_t before = m_partitions.queued.size();
        promoteLocked();
        promoted = before - m_partitions.queued.size();
    }

    LOG_DEBUG("Resumed pending downloads ({} resumed, {} started from queue)", resumed, promoted);

    if (resumed > 0 || promoted > 0) {
        m_writer->requestWrite();
    }
    dispatch();
}

void DownloadQueueManager::setMaxConcurrent(size_t maxConcurrent) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_maxConcurrent = std::max<size_t>(maxConcurrent, 1);
        promoteLocked();
    }

    LOG_INFO("Maximum concurrent downloads set to {}", getMaxConcurrent());
    m_writer->requestWrite();
    dispatch();
}

bool DownloadQueueManager::isTransferRestricted() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_transfersRestricted;
}

size_t DownloadQueueManager::getMaxConcurrent() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_maxConcurrent;
}

void DownloadQueueManager::setOnChanged(DownloadChangedCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_onChanged = std::move(callback);
}

bool DownloadQueueManager::flush() {
    return m_writer->flushNow();
}

Partitions DownloadQueueManager::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_partitions;
}

std::optional<DownloadRecord> DownloadQueueManager::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    for (const auto* partition : {&m_partitions.active, &m_partitions.queued,
                                  &m_partitions.completed, &m_partitions.failed}) {
        for (const auto& record : *partition) {
            if (record.id == id) {
                return record;
            }
        }
    }
    return std::nullopt;
}

size_t DownloadQueueManager::getActiveCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_partitions.active.size();
}

size_t DownloadQueueManager::getPendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_partitions.queued.size();
}

size_t DownloadQueueManager::getDownloadingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return downloadingCountLocked();
}

size_t DownloadQueueManager::getCompletedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_partitions.completed.size();
}

size_t DownloadQueueManager::getFailedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_partitions.failed.size();
}

// -- Partition helpers --

bool DownloadQueueManager::containsLocked(const std::string& id) const {
    for (const auto* partition : {&m_partitions.active, &m_partitions.queued,
                                  &m_partitions.completed, &m_partitions.failed}) {
        auto found = std::find_if(partition->begin(), partition->end(),
            [&id](const DownloadRecord& record) { return record.id == id; });
        if (found != partition->end()) {
            return true;
        }
    }
    return false;
}

std::vector<DownloadRecord>::iterator DownloadQueueManager::findIn(
    std::vector<DownloadRecord>& partition, const std::string& id) {
    return std::find_if(partition.begin(), partition.end(),
        [&id](const DownloadRecord& record) { return record.id == id; });
}

size_t DownloadQueueManager::downloadingCountLocked() const {
    return static_cast<size_t>(std::count_if(
        m_partitions.active.begin(), m_partitions.active.end(),
        [](const DownloadRecord& record) { return record.state == DownloadState::Downloading; }));
}

void DownloadQueueManager::admitLocked(DownloadRecord record) {
    auto now = Clock::now();
    if (record.createdAt == TimePoint{}) {
        record.createdAt = now;
    }
    record.updatedAt = now;
    record.progress = 0.0;
    record.pauseReason = PauseReason::None;
    record.error.clear();
    record.localArtifactPath.reset();
    record.completedAt.reset();

    if (m_partitions.active.size() < m_maxConcurrent) {
        occupySlotLocked(std::move(record), "Download started");
    } else {
        record.state = DownloadState::Pending;
        m_partitions.queued.push_back(std::move(record));

        const auto& queued = m_partitions.queued.back();
        notifyLocked(queued);
        LOG_DEBUG("Download queued: {}", queued.content.title);
    }
}

void DownloadQueueManager::promoteLocked() {
    while (m_partitions.active.size() < m_maxConcurrent && !m_partitions.queued.empty()) {
        DownloadRecord record = std::move(m_partitions.queued.front());
        m_partitions.queued.erase(m_partitions.queued.begin());

        record.updatedAt = Clock::now();
        occupySlotLocked(std::move(record), "Download started from queue");
    }
}

void DownloadQueueManager::occupySlotLocked(DownloadRecord record, const char* how) {
    if (m_transfersRestricted) {
        // Holds the slot without a transfer until resumePending()
        record.state = DownloadState::Paused;
        record.pauseReason = PauseReason::CellularPolicy;
        m_partitions.active.push_back(std::move(record));

        const auto& parked = m_partitions.active.back();
        notifyLocked(parked);
        LOG_INFO("Download waiting for an allowed network: {}", parked.content.title);
        return;
    }

    record.state = DownloadState::Downloading;
    record.pauseReason = PauseReason::None;
    m_partitions.active.push_back(std::move(record));

    const auto& started = m_partitions.active.back();
    scheduleStartLocked(started);
    notifyLocked(started);
    LOG_INFO("{}: {}", how, started.content.title);
}

void DownloadQueueManager::scheduleStartLocked(const DownloadRecord& record) {
    uint64_t token = ++m_nextToken;
    m_liveTransfers[record.id] = token;

    Command command{CommandType::Start, record.id, token};
    command.record = record;
    m_outbox.push_back(std::move(command));
}

void DownloadQueueManager::applyProgressLocked(DownloadRecord& record, double fraction) {
    if (std::isnan(fraction)) {
        return;
    }
    record.progress = std::clamp(fraction, 0.0, kMaxInFlightProgress);
    record.updatedAt = Clock::now();
    notifyLocked(record);
}

void DownloadQueueManager::finishLocked(std::vector<DownloadRecord>::iterator it,
                                        const TransferResult& result) {
    DownloadRecord record = std::move(*it);
    m_partitions.active.erase(it);

    auto now = Clock::now();
    record.updatedAt = now;
    record.pauseReason = PauseReason::None;

    if (result.success) {
        record.state = DownloadState::Completed;
        record.progress = 1.0;
        record.completedAt = now;
        record.localArtifactPath = result.localPath;
        record.error.clear();

        LOG_INFO("Download completed: {}", record.content.title);
        m_partitions.completed.push_back(std::move(record));
        notifyLocked(m_partitions.completed.back());
    } else {
        record.state = DownloadState::Failed;
        record.error = result.error.empty() ? "transfer failed" : result.error;

        LOG_WARN("Download failed: {} ({})", record.content.title, record.error);
        m_partitions.failed.push_back(std::move(record));
        notifyLocked(m_partitions.failed.back());
    }

    promoteLocked();
}

void DownloadQueueManager::notifyLocked(const DownloadRecord& record) {
    Command command{CommandType::Notify, record.id};
    command.record = record;
    m_outbox.push_back(std::move(command));
}

void DownloadQueueManager::notifyRemovedLocked(const std::string& id) {
    m_outbox.push_back(Command{CommandType::Notify, id});
}

bool DownloadQueueManager::isLiveLocked(const std::string& id, uint64_t token) const {
    auto it = m_liveTransfers.find(id);
    return it != m_liveTransfers.end() && it->second == token;
}

// -- Outbox --

void DownloadQueueManager::dispatch() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_dispatching) {
            // The thread already draining will pick our commands up
            return;
        }
        m_dispatching = true;
    }

    // Releases the drainer role if a collaborator throws something that is
    // not a std::exception
    struct DrainGuard {
        DownloadQueueManager& owner;
        bool armed{true};
        ~DrainGuard() {
            if (armed) {
                std::lock_guard<std::mutex> lock(owner.m_mutex);
                owner.m_dispatching = false;
            }
        }
    } guard{*this};

    while (true) {
        Command command;
        DownloadChangedCallback listener;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_outbox.empty()) {
                m_dispatching = false;
                guard.armed = false;
                return;
            }
            command = std::move(m_outbox.front());
            m_outbox.pop_front();
            if (command.type == CommandType::Notify) {
                listener = m_onChanged;
            }
        }

        if (command.type == CommandType::Notify) {
            if (!listener) continue;
            try {
                listener(DownloadEvent{command.id, command.record});
            } catch (const std::exception& e) {
                LOG_ERROR("Download change listener threw: {}", e.what());
            }
            continue;
        }

        execute(command);
    }
}

void DownloadQueueManager::execute(Command& command) {
    try {
        switch (command.type) {
            case CommandType::Start:
                executeStart(command);
                break;
            case CommandType::Transfer:
                startTransfer(command.id, command.token, *command.record);
                break;
            case CommandType::Pause:
                m_downloader->pause(command.id);
                break;
            case CommandType::Resume:
                m_downloader->resume(command.id);
                break;
            case CommandType::Cancel:
                m_downloader->cancel(command.id);
                break;
            case CommandType::DeleteArtifact: {
                std::error_code ec;
                if (!std::filesystem::remove(command.path, ec) && ec) {
                    LOG_ERROR("Failed to delete artifact {}: {}", command.path, ec.message());
                }
                break;
            }
            case CommandType::Notify:
                break;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Downloader call for {} failed: {}", command.id, e.what());
        if (command.type == CommandType::Start || command.type == CommandType::Transfer) {
            onTransferComplete(command.id, command.token, TransferResult::failed(e.what()));
        }
    }
}

void DownloadQueueManager::executeStart(Command& command) {
    const std::string id = command.id;
    const uint64_t token = command.token;
    const DownloadRecord& record = *command.record;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!isLiveLocked(id, token)) {
            // Cancelled before the transfer was handed out
            return;
        }
    }

    if (record.source && !record.source->isExpired() && !record.source->url.empty()) {
        startTransfer(id, token, record);
        return;
    }

    if (!m_resolver) {
        LOG_WARN("No usable stream source for {}", record.content.title);
        onTransferComplete(id, token, TransferResult::failed("stream source unavailable"));
        return;
    }

    bool posted = m_resolvePool->post([this, id, token, record]() {
        resolveAndStart(id, token, record);
    });
    if (!posted) {
        onTransferComplete(id, token, TransferResult::failed("stream source unavailable"));
    }
}

void DownloadQueueManager::resolveAndStart(const std::string& id, uint64_t token,
                                           const DownloadRecord& record) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!isLiveLocked(id, token)) {
            return;
        }
    }

    std::optional<StreamSource> resolved;
    try {
        resolved = m_resolver->resolve(record);
    } catch (const std::exception& e) {
        LOG_WARN("Source resolution for {} threw: {}", id, e.what());
    }

    if (!resolved || resolved->url.empty()) {
        LOG_WARN("No usable stream source for {}", record.content.title);
        onTransferComplete(id, token, TransferResult::failed("stream source unavailable"));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!isLiveLocked(id, token)) {
            return;
        }

        auto it = findIn(m_partitions.active, id);
        if (it == m_partitions.active.end()) {
            return;
        }
        it->source = *resolved;
        it->updatedAt = Clock::now();

        if (it->state == DownloadState::Downloading) {
            // Back through the outbox so later pause/cancel commands follow the start
            Command command{CommandType::Transfer, id, token};
            command.record = *it;
            m_outbox.push_back(std::move(command));
        } else {
            // Paused while resolving; resume starts a new transfer with this source
            m_liveTransfers.erase(id);
        }
    }

    m_writer->requestWrite();
    dispatch();
}

void DownloadQueueManager::startTransfer(const std::string& id, uint64_t token,
                                         const DownloadRecord& record) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!isLiveLocked(id, token)) {
            return;
        }
    }

    m_downloader->start(
        id, *record.source, record.quality,
        [this, id, token](double fraction) {
            onTransferProgress(id, token, fraction);
        },
        [this, id, token](const TransferResult& result) {
            onTransferComplete(id, token, result);
        });
}

void DownloadQueueManager::onTransferProgress(const std::string& id, uint64_t token, double fraction) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!isLiveLocked(id, token)) {
            return;
        }

        auto it = findIn(m_partitions.active, id);
        if (it == m_partitions.active.end()) {
            return;
        }
        applyProgressLocked(*it, fraction);
    }

    m_writer->markDirty();
    dispatch();
}

void DownloadQueueManager::onTransferComplete(const std::string& id, uint64_t token,
                                              const TransferResult& result) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!isLiveLocked(id, token)) {
            LOG_TRACE("Stale completion for {} ignored", id);
            return;
        }
        m_liveTransfers.erase(id);

        auto it = findIn(m_partitions.active, id);
        if (it == m_partitions.active.end()) {
            return;
        }
        finishLocked(it, result);
    }

    m_writer->requestWrite();
    dispatch();
}

} // namespace reelq::core::downloader
