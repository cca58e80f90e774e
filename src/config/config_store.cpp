#include "config/config_store.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <regex>
#include <stdexcept>

namespace snapkeep {

using json = nlohmann::json;

bool ConfigStore::load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::debug("Config file " + path + " does not exist, starting with an empty configuration");
        data_ = json::object();
        return false;
    }

    std::ifstream configFile(path);
    if (!configFile.is_open()) {
        throw std::runtime_error("Failed to open config " + path);
    }

    try {
        json parsed;
        configFile >> parsed;
        if (!parsed.is_object()) {
            throw std::runtime_error("Failed to parse config " + path + ": top level value is not an object");
        }
        data_ = std::move(parsed);
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse config " + path + ": " + std::string(e.what()));
    }

    return true;
}

bool ConfigStore::save(const std::string& path) const {
    try {
        std::filesystem::path configDir = std::filesystem::path(path).parent_path();
        if (!configDir.empty() && !std::filesystem::exists(configDir)) {
            std::filesystem::create_directories(configDir);
        }

        // Write next to the target and rename so a crash never leaves half a file.
        std::string tmpPath = path + ".tmp";
        {
            std::ofstream out(tmpPath, std::ios::trunc);
            if (!out.is_open()) {
                Logger::error("Failed to write config " + tmpPath);
                return false;
            }
            out << data_.dump(4) << "\n";
            if (!out) {
                Logger::error("Failed to write config " + tmpPath);
                return false;
            }
        }
        std::filesystem::rename(tmpPath, path);
        return true;
    } catch (const std::exception& e) {
        Logger::error("Failed to save config " + path + ": " + e.what());
        return false;
    }
}

const json* ConfigStore::find(const std::string& key) const {
    auto it = data_.find(key);
    if (it == data_.end() || it->is_null()) {
        return nullptr;
    }
    return &(*it);
}

bool ConfigStore::hasKey(const std::string& key) const {
    return find(key) != nullptr;
}

int ConfigStore::intValue(const std::string& key, int defaultValue) const {
    const json* value = find(key);
    if (!value) {
        return defaultValue;
    }

    if (value->is_number_integer()) {
        return value->get<int>();
    }
    if (value->is_number()) {
        return static_cast<int>(value->get<double>());
    }
    if (value->is_boolean()) {
        return value->get<bool>() ? 1 : 0;
    }
    if (value->is_string()) {
        try {
            size_t pos = 0;
            const std::string& text = value->get_ref<const std::string&>();
            int result = std::stoi(text, &pos);
            if (pos == text.size()) {
                return result;
            }
        } catch (const std::exception&) {
            // falls through to the warning below
        }
    }

    Logger::warning("Config value of " + key + " is not an integer: " + value->dump());
    return defaultValue;
}

std::string ConfigStore::strValue(const std::string& key, const std::string& defaultValue) const {
    const json* value = find(key);
    if (!value) {
        return defaultValue;
    }

    if (value->is_string()) {
        return value->get<std::string>();
    }
    if (value->is_boolean()) {
        return value->get<bool>() ? "true" : "false";
    }
    if (value->is_number()) {
        return value->dump();
    }

    Logger::warning("Config value of " + key + " is not a string: " + value->dump());
    return defaultValue;
}

bool ConfigStore::boolValue(const std::string& key, bool defaultValue) const {
    const json* value = find(key);
    if (!value) {
        return defaultValue;
    }

    if (value->is_boolean()) {
        return value->get<bool>();
    }
    if (value->is_number()) {
        return value->get<double>() != 0;
    }
    if (value->is_string()) {
        std::string text = value->get<std::string>();
        std::transform(text.begin(), text.end(), text.begin(), ::tolower);
        if (text == "true" || text == "1" || text == "yes") {
            return true;
        }
        if (text == "false" || text == "0" || text == "no") {
            return false;
        }
    }

    Logger::warning("Config value of " + key + " is not a boolean: " + value->dump());
    return defaultValue;
}

json ConfigStore::listValue(const std::string& key) const {
    const json* value = find(key);
    if (!value || !value->is_array()) {
        return json::array();
    }
    return *value;
}

void ConfigStore::setIntValue(const std::string& key, int value) {
    data_[key] = value;
}

void ConfigStore::setStrValue(const std::string& key, const std::string& value) {
    data_[key] = value;
}

void ConfigStore::setBoolValue(const std::string& key, bool value) {
    data_[key] = value;
}

void ConfigStore::setListValue(const std::string& key, const json& values) {
    data_[key] = values;
}

bool ConfigStore::removeKey(const std::string& key) {
    return data_.erase(key) > 0;
}

std::vector<std::string> ConfigStore::keys() const {
    std::vector<std::string> result;
    for (auto it = data_.begin(); it != data_.end(); ++it) {
        result.push_back(it.key());
    }
    return result;
}

std::string ConfigStore::profileKey(const std::string& profileId, const std::string& key) {
    return "profile" + profileId + "." + key;
}

bool ConfigStore::hasProfileKey(const std::string& key, const std::string& profileId) const {
    return hasKey(profileKey(profileId, key));
}

int ConfigStore::profileIntValue(const std::string& key, int defaultValue, const std::string& profileId) const {
    return intValue(profileKey(profileId, key), defaultValue);
}

std::string ConfigStore::profileStrValue(const std::string& key, const std::string& defaultValue,
                                         const std::string& profileId) const {
    return strValue(profileKey(profileId, key), defaultValue);
}

bool ConfigStore::profileBoolValue(const std::string& key, bool defaultValue, const std::string& profileId) const {
    return boolValue(profileKey(profileId, key), defaultValue);
}

json ConfigStore::profileListValue(const std::string& key, const std::string& profileId) const {
    return listValue(profileKey(profileId, key));
}

void ConfigStore::setProfileIntValue(const std::string& key, int value, const std::string& profileId) {
    setIntValue(profileKey(profileId, key), value);
}

void ConfigStore::setProfileStrValue(const std::string& key, const std::string& value,
                                     const std::string& profileId) {
    setStrValue(profileKey(profileId, key), value);
}

void ConfigStore::setProfileBoolValue(const std::string& key, bool value, const std::string& profileId) {
    setBoolValue(profileKey(profileId, key), value);
}

void ConfigStore::setProfileListValue(const std::string& key, const json& values,
                                      const std::string& profileId) {
    setListValue(profileKey(profileId, key), values);
}

bool ConfigStore::removeProfileKey(const std::string& key, const std::string& profileId) {
    return removeKey(profileKey(profileId, key));
}

bool ConfigStore::remapKey(const std::string& oldKey, const std::string& newKey) {
    auto it = data_.find(oldKey);
    if (it == data_.end()) {
        return false;
    }
    json value = *it;
    data_.erase(it);
    data_[newKey] = std::move(value);
    return true;
}

bool ConfigStore::remapProfileKey(const std::string& oldKey, const std::string& newKey,
                                  const std::string& profileId) {
    return remapKey(profileKey(profileId, oldKey), profileKey(profileId, newKey));
}

int ConfigStore::remapKeyRegex(const std::string& pattern, const std::string& replacement) {
    std::regex re(pattern);
    int count = 0;
    for (const auto& key : keys()) {
        if (!std::regex_search(key, re)) {
            continue;
        }
        std::string newKey = std::regex_replace(key, re, replacement);
        if (newKey != key && remapKey(key, newKey)) {
            ++count;
        }
    }
    return count;
}

int ConfigStore::removeKeysStartingWith(const std::string& prefix) {
    int count = 0;
    for (const auto& key : keys()) {
        if (key.compare(0, prefix.size(), prefix) == 0) {
            data_.erase(key);
            ++count;
        }
    }
    return count;
}

std::vector<std::string> ConfigStore::profiles() const {
    std::vector<std::string> result;
    const json* value = find("profiles");

    if (value && value->is_array()) {
        for (const auto& item : *value) {
            if (item.is_string()) {
                result.push_back(item.get<std::string>());
            } else if (item.is_number_integer()) {
                result.push_back(std::to_string(item.get<int>()));
            }
        }
    } else if (value && value->is_string()) {
        // legacy "1:2:3" spelling
        std::string text = value->get<std::string>();
        size_t start = 0;
        while (start <= text.size()) {
            size_t end = text.find(':', start);
            if (end == std::string::npos) {
                end = text.size();
            }
            if (end > start) {
                result.push_back(text.substr(start, end - start));
            }
            start = end + 1;
        }
    }

    if (result.empty()) {
        result.push_back("1");
    }
    return result;
}

std::string ConfigStore::profileName(const std::string& profileId) const {
    std::string fallback = profileId == "1" ? "Main profile" : "Profile " + profileId;
    return profileStrValue("name", fallback, profileId);
}

std::string ConfigStore::addProfile(const std::string& name) {
    auto ids = profiles();
    int next = 1;
    for (const auto& id : ids) {
        try {
            next = std::max(next, std::stoi(id) + 1);
        } catch (const std::exception&) {
            Logger::warning("Ignoring non-numeric profile id " + id);
        }
    }

    std::string profileId = std::to_string(next);
    json list = json::array();
    for (const auto& id : ids) {
        list.push_back(id);
    }
    list.push_back(profileId);
    data_["profiles"] = list;
    setProfileStrValue("name", name, profileId);
    return profileId;
}

} // namespace snapkeep
