/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace PongEngine {

class JsonValue;

/**
 * @brief Category/key settings store with JSON persistence
 *
 * Holds the tunables of the physics core (ball, paddle, edges, loop
 * categories) and anything else the front end wants to persist.
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/pong_settings.json");
 *   float rate = settings.get<float>("ball", "acceleration_rate", 0.05f);
 *   auto config = PhysicsConfig::fromSettings(settings);
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Loads settings from a JSON file, merging into current values
     * @return false if the file is unreadable or its root is not an object
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Same as loadFromFile() for an in-memory JSON document
     */
    bool loadFromString(const std::string& json);

    /**
     * @brief Writes all settings as a JSON object of category objects
     */
    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Typed read with default
     *
     * A float read of an int setting converts ("4" in a file is a valid
     * float). Any other type mismatch returns defaultValue.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    template<typename T>
    void set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    void clearAll();

    std::vector<std::string> getCategories() const;

    const std::string& getLastError() const { return m_lastError; }

private:
    using CategorySettings = std::map<std::string, SettingValue>;
    std::map<std::string, CategorySettings> m_settings;
    mutable std::shared_mutex m_settingsMutex;
    std::string m_lastError;

    bool loadFromRoot(const JsonValue& root, const std::string& source);

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

// Template implementations must be in header for linking

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return defaultValue;
    }
    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return defaultValue;
    }

    const SettingValue& value = keyIt->second;
    if constexpr (std::is_same_v<T, float>) {
        if (const int* asInt = std::get_if<int>(&value)) {
            return static_cast<float>(*asInt);
        }
    }
    if (const T* typed = std::get_if<T>(&value)) {
        return *typed;
    }
    return defaultValue;
}

template<typename T>
void SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    static_assert(std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_convertible_v<T, std::string>,
                  "SettingsManager stores int, float, bool or string values");

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> || std::is_same_v<T, bool>) {
        m_settings[category][key] = value;
    } else {
        m_settings[category][key] = std::string(value);
    }
}

} // namespace PongEngine

#endif // SETTINGS_MANAGER_HPP
