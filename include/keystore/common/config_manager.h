/**
 * @file config_manager.h
 * @brief Keystore configuration from environment variables
 *
 * Features:
 * - Environment variable access with defaults
 * - Typed retrieval (string, integer, boolean)
 * - Runtime overrides with set()/unset()
 * - Thread-safe singleton
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace keystore::common {

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    /// Override, else environment variable
    std::optional<std::string> lookup(const std::string& key) const;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Override, else environment variable, else the default
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value
     *
     * Unparseable values log a warning and yield the default.
     */
    int64_t getInt(const std::string& key, int64_t defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value (true/false, 1/0, yes/no, on/off)
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Check if an override or environment variable is set, even to ""
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set configuration value
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove an override (the environment still applies)
     */
    void unset(const std::string& key);

    /**
     * @brief Load recognized keys from the environment
     */
    void loadFromEnvironment();

    /// @name Recognized Configuration Keys

    // Decoding
    static constexpr const char* MAC_POLICY = "KEYSTORE_MAC_POLICY";
    static constexpr const char* KEY_FORMAT = "KEYSTORE_KEY_FORMAT";
    static constexpr const char* MAX_ITERATIONS = "KEYSTORE_MAX_ITERATIONS";
    static constexpr const char* WORKER_THREADS = "KEYSTORE_WORKER_THREADS";

    // Decoding and encoding
    static constexpr const char* VALIDATE_PAYLOADS = "KEYSTORE_VALIDATE_PAYLOADS";

    // Encoding
    static constexpr const char* ENCODE_ITERATIONS = "KEYSTORE_ENCODE_ITERATIONS";
    static constexpr const char* MAC_ITERATIONS = "KEYSTORE_MAC_ITERATIONS";

    // Logging
    static constexpr const char* LOG_LEVEL = "KEYSTORE_LOG_LEVEL";
};

} // namespace keystore::common
