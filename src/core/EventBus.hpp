#pragma once

/**
 * EventBus.hpp
 *
 * Topic-based publish/subscribe carrying JSON payloads from the download
 * service to its front ends (console, future IPC).
 */

#include "Logger.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace reelq::core {

using json = nlohmann::json;
using EventHandler = std::function<void(const json&)>;
using SubscriptionId = uint64_t;

/**
 * EventBus
 *
 * Handlers of a topic run in subscription order on the emitting thread,
 * outside the bus lock, so a handler may subscribe or unsubscribe.
 * A handler that throws is logged and skipped.
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * Process-wide bus used by the application
     */
    static EventBus& instance() {
        static EventBus bus;
        return bus;
    }

    SubscriptionId subscribe(const std::string& topic, EventHandler handler) {
        std::lock_guard<std::mutex> lock(m_mutex);
        SubscriptionId id = ++m_lastId;
        m_handlers[id] = Entry{topic, std::move(handler)};
        return id;
    }

    /**
     * @return false if the id is unknown or already removed
     */
    bool unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_handlers.erase(id) > 0;
    }

    /**
     * Deliver a payload to every handler of the topic
     * @return Number of handlers that returned normally
     */
    size_t emit(const std::string& topic, const json& payload = json::object()) {
        std::vector<std::pair<SubscriptionId, EventHandler>> targets;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (const auto& [id, entry] : m_handlers) {
                if (entry.topic == topic) {
                    targets.emplace_back(id, entry.handler);
                }
            }
        }

        size_t delivered = 0;
        for (const auto& [id, handler] : targets) {
            try {
                handler(payload);
                ++delivered;
            } catch (const std::exception& e) {
                LOG_ERROR("Subscriber {} of '{}' threw: {}", id, topic, e.what());
            }
        }
        return delivered;
    }

    size_t subscriberCount(const std::string& topic) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t count = 0;
        for (const auto& entry : m_handlers) {
            if (entry.second.topic == topic) {
                ++count;
            }
        }
        return count;
    }

private:
    struct Entry {
        std::string topic;
        EventHandler handler;
    };

    mutable std::mutex m_mutex;
    // Ids grow monotonically, so map order is subscription order
    std::map<SubscriptionId, Entry> m_handlers;
    SubscriptionId m_lastId{0};
};

/**
 * Unsubscribes when it goes out of scope
 */
class ScopedSubscription {
public:
    ScopedSubscription(EventBus& bus, const std::string& topic, EventHandler handler)
        : m_bus(&bus), m_id(bus.subscribe(topic, std::move(handler))) {}

    ~ScopedSubscription() {
        reset();
    }

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

    ScopedSubscription(ScopedSubscription&& other) noexcept
        : m_bus(other.m_bus), m_id(other.m_id) {
        other.m_bus = nullptr;
    }

    void reset() {
        if (m_bus) {
            m_bus->unsubscribe(m_id);
            m_bus = nullptr;
        }
    }

    SubscriptionId id() const { return m_id; }

private:
    EventBus* m_bus;
    SubscriptionId m_id;
};

} // namespace reelq::core
