#include "shroud/config/ConfigLoader.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace shroud {

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool ConfigLoader::load(const std::string& path) {
    std::vector<std::string> paths = {
        path,
        "../" + path,
        "../../" + path
    };

    for (const auto& p : paths) {
        std::ifstream file(p);
        if (file.is_open()) {
            configPath_ = p;
            return parse(file);
        }
    }

    std::cerr << "[ConfigLoader] ERROR: " << path << " not found!\n";
    std::cerr << "[ConfigLoader] Searched paths:\n";
    for (const auto& p : paths) {
        std::cerr << "  - " << p << "\n";
    }
    return false;
}

bool ConfigLoader::loadFromString(const std::string& text) {
    std::istringstream in(text);
    configPath_ = "<string>";
    return parse(in);
}

std::string ConfigLoader::get(
    const std::string& section,
    const std::string& key,
    const std::string& defaultVal
) const {
    auto it = values_.find(section + "." + key);
    if (it != values_.end()) {
        return it->second;
    }
    return defaultVal;
}

int64_t ConfigLoader::getInt(
    const std::string& section,
    const std::string& key,
    int64_t defaultVal
) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    try {
        return std::stoll(val);
    } catch (const std::exception&) {
        std::cerr << "[ConfigLoader] WARN: " << section << "." << key
                  << " is not an integer (" << val << "), using default\n";
        return defaultVal;
    }
}

bool ConfigLoader::getBool(
    const std::string& section,
    const std::string& key,
    bool defaultVal
) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    return (val == "true" || val == "1" || val == "yes" || val == "on");
}

std::vector<std::string> ConfigLoader::getList(
    const std::string& section,
    const std::string& key
) const {
    std::vector<std::string> out;
    std::stringstream ss(get(section, key));
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

bool ConfigLoader::has(
    const std::string& section,
    const std::string& key
) const {
    return values_.count(section + "." + key) > 0;
}

void ConfigLoader::dump() const {
    std::cout << "[ConfigLoader] Loaded from: " << configPath_ << "\n";
    std::cout << "[ConfigLoader] Values:\n";
    for (const auto& kv : values_) {
        std::cout << "  " << kv.first << " = " << kv.second << "\n";
    }
}

bool ConfigLoader::parse(std::istream& in) {
    std::string line;
    std::string currentSection;

    while (std::getline(in, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        // Section header
        if (line[0] == '[') {
            size_t closePos = line.find(']');
            if (closePos != std::string::npos) {
                currentSection = trim(line.substr(1, closePos - 1));
            }
            continue;
        }

        // Key = Value
        size_t eqPos = line.find('=');
        if (eqPos != std::string::npos) {
            std::string key = trim(line.substr(0, eqPos));
            std::string value = trim(line.substr(eqPos + 1));
            values_[currentSection + "." + key] = value;
        }
    }

    return !values_.empty();
}

} // namespace shroud
