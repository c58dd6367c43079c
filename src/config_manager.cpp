/**
 * @file config_manager.cpp
 * @brief KEYSTORE_* configuration lookup
 */

#include "keystore/common/config_manager.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace keystore::common {

std::unique_ptr<ConfigManager> ConfigManager::instance_ = nullptr;
std::once_flag ConfigManager::initFlag_;

ConfigManager::ConfigManager() {
    loadFromEnvironment();
}

ConfigManager& ConfigManager::getInstance() {
    std::call_once(initFlag_, []() {
        instance_.reset(new ConfigManager());
    });
    return *instance_;
}

std::optional<std::string> ConfigManager::lookup(const std::string& key) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = config_.find(key);
        if (it != config_.end()) {
            return it->second;
        }
    }
    if (const char* env = std::getenv(key.c_str())) {
        return std::string(env);
    }
    return std::nullopt;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    return lookup(key).value_or(defaultValue);
}

int64_t ConfigManager::getInt(const std::string& key, int64_t defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    // Iteration counts and thread counts: the whole value must be a number
    try {
        size_t used = 0;
        long long parsed = std::stoll(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return static_cast<int64_t>(parsed);
    } catch (const std::exception& e) {
        spdlog::warn("{}: '{}' is not an integer ({}), using {}", key, value, e.what(),
                     defaultValue);
        return defaultValue;
    }
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    static const std::map<std::string, bool> WORDS = {
        {"true", true},   {"1", true},  {"yes", true}, {"on", true},
        {"false", false}, {"0", false}, {"no", false}, {"off", false},
    };

    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    std::string word = value;
    std::transform(word.begin(), word.end(), word.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = WORDS.find(word);
    if (it == WORDS.end()) {
        spdlog::warn("{}: '{}' is not a boolean, using {}", key, value, defaultValue);
        return defaultValue;
    }
    return it->second;
}

bool ConfigManager::has(const std::string& key) const {
    return lookup(key).has_value();
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_[key] = value;
    spdlog::debug("Config override: {} = {}", key, value);
}

void ConfigManager::unset(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.erase(key);
}

void ConfigManager::loadFromEnvironment() {
    static const char* const KEYS[] = {
        MAC_POLICY, KEY_FORMAT, MAX_ITERATIONS, WORKER_THREADS, VALIDATE_PAYLOADS,
        ENCODE_ITERATIONS, MAC_ITERATIONS, LOG_LEVEL
    };

    size_t found = 0;
    for (const char* key : KEYS) {
        if (const char* env = std::getenv(key)) {
            set(key, env);
            ++found;
        }
    }
    spdlog::debug("Configuration: {} KEYSTORE_* variable(s) set", found);
}

} // namespace keystore::common
