#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include "../utils/PathUtils.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>
#include <vector>

namespace reelq::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Values are addressed with dot notation ("downloads.maxConcurrent").
 * Only the composition root reads it; services receive plain settings.
 */
class Config {
public:
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Load configuration from file, merged over the defaults
     * @param path Path to config file
     * @return true if loaded successfully
     */
    bool load(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            if (!std::filesystem::exists(path)) {
                return false;
            }

            std::ifstream file(path);
            if (!file.is_open()) {
                return false;
            }

            json loaded = json::parse(file);
            if (!loaded.is_object()) {
                return false;
            }
            m_config.merge_patch(loaded);
            m_configPath = path;
            return true;

        } catch (const std::exception&) {
            return false;
        }
    }

    /**
     * Save configuration to file
     * @param path Path to config file (uses loaded path if empty)
     * @return true if saved successfully
     */
    bool save(const std::string& path = "") {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::string savePath = path.empty() ? m_configPath : path;
        if (savePath.empty()) {
            return false;
        }

        try {
            auto parent = std::filesystem::path(savePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }

            std::ofstream file(savePath);
            if (!file.is_open()) {
                return false;
            }

            file << m_config.dump(4);
            m_configPath = savePath;
            return static_cast<bool>(file);

        } catch (const std::exception&) {
            return false;
        }
    }

    /**
     * Reset to default configuration values
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto base = utils::PathUtils::getDataPath();

        m_config = {
            {"version", "1.0.0"},
            {"downloads", {
                {"maxConcurrent", 3},
                {"directory", (base / "downloads").string()},
                {"deleteArtifacts", true},
                {"timeout", 30000}
            }},
            {"persistence", {
                {"directory", (base / "state").string()},
                {"flushIntervalMs", 1000}
            }},
            {"network", {
                {"allowCellular", false},
                {"headTimeout", 5000}
            }},
            {"logging", {
                {"level", "info"},
                {"directory", (base / "logs").string()}
            }}
        };
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "downloads.maxConcurrent")
     * @param defaultValue Default value if key not found or mistyped
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Fall through to default
        }

        return defaultValue;
    }

    /**
     * Set configuration value with dot notation
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            m_config[toJsonPointer(key)] = value;
        } catch (const json::exception&) {
            // Invalid key path, value dropped
        }
    }

    /**
     * Check the values the service depends on
     * @return One message per problem; empty when the configuration is usable
     */
    std::vector<std::string> validate() const {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::vector<std::string> problems;
        auto requirePositive = [&](const char* key) {
            auto ptr = toJsonPointer(key);
            if (!m_config.contains(ptr)) {
                return;
            }
            const auto& value = m_config.at(ptr);
            if (!value.is_number_integer() || value.get<long long>() < 1) {
                problems.push_back(std::string(key) + " must be a positive integer");
            }
        };
        auto requireType = [&](const char* key, json::value_t type, const char* name) {
            auto ptr = toJsonPointer(key);
            if (m_config.contains(ptr) && m_config.at(ptr).type() != type) {
                problems.push_back(std::string(key) + " must be a " + name);
            }
        };

        requirePositive("downloads.maxConcurrent");
        requirePositive("downloads.timeout");
        requirePositive("persistence.flushIntervalMs");
        requirePositive("network.headTimeout");
        requireType("downloads.directory", json::value_t::string, "string");
        requireType("persistence.directory", json::value_t::string, "string");
        requireType("downloads.deleteArtifacts", json::value_t::boolean, "boolean");
        requireType("network.allowCellular", json::value_t::boolean, "boolean");
        requireType("logging.level", json::value_t::string, "string");

        return problems;
    }

private:
    Config() {
        setDefaults();
    }

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            pointer += (c == '.') ? '/' : c;
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
};

} // namespace reelq::core
