/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>
#include <format>
#include <fstream>

namespace PongEngine {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        m_lastError = std::format("Failed to load settings from {}: {}", filepath, reader.getLastError());
        SETTINGS_ERROR(m_lastError);
        return false;
    }
    return loadFromRoot(reader.getRoot(), filepath);
}

bool SettingsManager::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        m_lastError = std::format("Failed to parse settings: {}", reader.getLastError());
        SETTINGS_ERROR(m_lastError);
        return false;
    }
    return loadFromRoot(reader.getRoot(), "<memory>");
}

bool SettingsManager::loadFromRoot(const JsonValue& root, const std::string& source) {
    const JsonObject* rootObj = root.tryAsObject();
    if (rootObj == nullptr) {
        m_lastError = "Settings root is not a JSON object: " + source;
        SETTINGS_ERROR(m_lastError);
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    size_t loaded = 0;

    for (const auto& [categoryName, categoryValue] : *rootObj) {
        const JsonObject* categoryObj = categoryValue.tryAsObject();
        if (categoryObj == nullptr) {
            SETTINGS_WARNING(std::format("Category '{}' is not an object, skipping", categoryName));
            continue;
        }

        for (const auto& [key, value] : *categoryObj) {
            SettingValue settingValue;
            if (value.isBool()) {
                settingValue = value.asBool();
            } else if (value.isNumber()) {
                double number = value.asNumber();
                if (std::floor(number) == number && std::abs(number) < 2147483647.0) {
                    settingValue = static_cast<int>(number);
                } else {
                    settingValue = static_cast<float>(number);
                }
            } else if (value.isString()) {
                settingValue = value.asString();
            } else {
                SETTINGS_WARNING(std::format("Unsupported value type for '{}.{}', skipping", categoryName, key));
                continue;
            }
            m_settings[categoryName][key] = std::move(settingValue);
            ++loaded;
        }
    }

    m_lastError.clear();
    SETTINGS_INFO(std::format("Loaded {} settings from {}", loaded, source));
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    JsonObject root;
    {
        std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
        for (const auto& [categoryName, categorySettings] : m_settings) {
            JsonObject category;
            for (const auto& [key, value] : categorySettings) {
                category[key] = std::visit([](const auto& arg) { return JsonValue(arg); }, value);
            }
            root[categoryName] = JsonValue(std::move(category));
        }
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file for writing: " + filepath);
        return false;
    }
    file << JsonValue(std::move(root)).toString() << '\n';
    if (!file.good()) {
        SETTINGS_ERROR("Failed to write settings file: " + filepath);
        return false;
    }

    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    auto categoryIt = m_settings.find(category);
    return categoryIt != m_settings.end() && categoryIt->second.count(key) > 0;
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }
    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [name, _] : m_settings) {
        categories.push_back(name);
    }
    return categories;
}

} // namespace PongEngine
