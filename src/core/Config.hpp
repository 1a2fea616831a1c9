#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace deaddrop {

class Config {
public:
    /// Load configuration from a JSON file. Returns false if the file
    /// cannot be read or parsed; missing keys fall back to defaults.
    bool loadFromFile(const std::string& path);

    /// Load configuration from a JSON string (useful for testing).
    bool loadFromString(const std::string& jsonStr);

    /// Merge another JSON file on top of the current configuration.
    /// Keys in the overlay win; keys absent from it are kept.  The current
    /// config is unchanged when the overlay cannot be read or parsed.
    bool mergeFromFile(const std::string& path);

    // --- Getters (dot-notation key paths, e.g. "fill.tiered.min") ---

    std::string getString(const std::string& key, const std::string& defaultVal = "") const;
    int         getInt(const std::string& key, int defaultVal = 0) const;
    bool        getBool(const std::string& key, bool defaultVal = false) const;

    /// Raw JSON node at a key path, or nullptr if absent.
    const nlohmann::json* find(const std::string& key) const { return resolve(key); }

    bool hasKey(const std::string& key) const;

    const nlohmann::json& raw() const { return m_data; }

private:
    const nlohmann::json* resolve(const std::string& key) const;

    static void mergeJson(nlohmann::json& base, const nlohmann::json& overlay);

    nlohmann::json m_data = nlohmann::json::object();
};

} // namespace deaddrop
