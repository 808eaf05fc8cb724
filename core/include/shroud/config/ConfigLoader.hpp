#pragma once
// =============================================================================
// ConfigLoader.hpp - INI File Parser for Shroud Configuration
// =============================================================================
// [section] headers, key = value pairs, '#' or ';' comments
// =============================================================================

#include <cstdint>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace shroud {

class ConfigLoader {
public:
    // Tries `path`, then the parent directories. Returns false when no file
    // could be opened.
    bool load(const std::string& path = "config.ini");

    bool loadFromString(const std::string& text);

    std::string get(
        const std::string& section,
        const std::string& key,
        const std::string& defaultVal = ""
    ) const;

    int64_t getInt(
        const std::string& section,
        const std::string& key,
        int64_t defaultVal = 0
    ) const;

    bool getBool(
        const std::string& section,
        const std::string& key,
        bool defaultVal = false
    ) const;

    // Comma separated list, whitespace trimmed, empty items dropped.
    std::vector<std::string> getList(
        const std::string& section,
        const std::string& key
    ) const;

    bool has(const std::string& section, const std::string& key) const;

    const std::string& getConfigPath() const { return configPath_; }

    void dump() const;

private:
    bool parse(std::istream& in);

    std::unordered_map<std::string, std::string> values_;
    std::string configPath_;
};

} // namespace shroud
