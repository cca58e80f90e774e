#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace snapkeep {

// Flat key/value configuration persisted as one JSON object.
//
// Keys are dotted names ("config.version", "global.use_flock"). Settings of a
// profile live under "profile<id>.<key>"; the list of profile ids is stored
// under "profiles". Values may be JSON numbers, booleans, strings or arrays;
// the typed getters also accept the string spelling of a number or boolean,
// which is what a hand-edited file usually contains.
class ConfigStore {
public:
    ConfigStore() = default;

    // Returns false if the file does not exist (the store is left empty).
    // Throws std::runtime_error if the file exists but cannot be parsed.
    bool load(const std::string& path);
    bool save(const std::string& path) const;

    // Global keys
    bool hasKey(const std::string& key) const;
    int intValue(const std::string& key, int defaultValue = 0) const;
    std::string strValue(const std::string& key, const std::string& defaultValue = "") const;
    bool boolValue(const std::string& key, bool defaultValue = false) const;
    nlohmann::json listValue(const std::string& key) const;

    void setIntValue(const std::string& key, int value);
    void setStrValue(const std::string& key, const std::string& value);
    void setBoolValue(const std::string& key, bool value);
    void setListValue(const std::string& key, const nlohmann::json& values);
    bool removeKey(const std::string& key);
    std::vector<std::string> keys() const;

    // Profile keys
    static std::string profileKey(const std::string& profileId, const std::string& key);
    bool hasProfileKey(const std::string& key, const std::string& profileId) const;
    int profileIntValue(const std::string& key, int defaultValue, const std::string& profileId) const;
    std::string profileStrValue(const std::string& key, const std::string& defaultValue,
                                const std::string& profileId) const;
    bool profileBoolValue(const std::string& key, bool defaultValue, const std::string& profileId) const;
    nlohmann::json profileListValue(const std::string& key, const std::string& profileId) const;

    void setProfileIntValue(const std::string& key, int value, const std::string& profileId);
    void setProfileStrValue(const std::string& key, const std::string& value, const std::string& profileId);
    void setProfileBoolValue(const std::string& key, bool value, const std::string& profileId);
    void setProfileListValue(const std::string& key, const nlohmann::json& values,
                             const std::string& profileId);
    bool removeProfileKey(const std::string& key, const std::string& profileId);

    // Bulk restructuring used by schema migrations
    bool remapKey(const std::string& oldKey, const std::string& newKey);
    bool remapProfileKey(const std::string& oldKey, const std::string& newKey, const std::string& profileId);
    int remapKeyRegex(const std::string& pattern, const std::string& replacement);
    int removeKeysStartingWith(const std::string& prefix);

    // Profiles
    std::vector<std::string> profiles() const;
    std::string profileName(const std::string& profileId) const;
    std::string addProfile(const std::string& name);

    const nlohmann::json& data() const { return data_; }

private:
    const nlohmann::json* find(const std::string& key) const;

    nlohmann::json data_ = nlohmann::json::object();
};

} // namespace snapkeep
