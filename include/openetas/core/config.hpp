#pragma once

#include <string>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <stdexcept>

namespace openetas {

/**
 * Config - INI-style configuration ([section] key = value)
 *
 * Keys are stored as "section.key". Values that fail to parse fall back
 * to the supplied default with a message on std::cerr.
 */
class Config {
public:
    Config() = default;

    bool loadFromFile(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            std::cerr << "Config: cannot open " << filename << std::endl;
            return false;
        }
        std::stringstream ss;
        ss << file.rdbuf();
        loadFromString(ss.str());
        return true;
    }

    void loadFromString(const std::string& text) {
        std::istringstream in(text);
        std::string line;
        std::string section;
        while (std::getline(in, line)) {
            // Inline comments
            auto hash = line.find_first_of("#;");
            if (hash != std::string::npos) line.erase(hash);

            line.erase(0, line.find_first_not_of(" \t\r\n"));
            line.erase(line.find_last_not_of(" \t\r\n") + 1);
            if (line.empty()) continue;

            if (line[0] == '[' && line.back() == ']') {
                section = line.substr(1, line.size() - 2);
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) continue;

            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);
            key.erase(key.find_last_not_of(" \t") + 1);
            value.erase(0, value.find_first_not_of(" \t"));

            values_[section.empty() ? key : section + "." + key] = value;
        }
    }

    bool saveToFile(const std::string& filename) const {
        std::ofstream file(filename);
        if (!file.is_open()) return false;

        std::string current_section;
        for (const auto& [key, value] : values_) {
            auto pos = key.find('.');
            std::string section = pos != std::string::npos ? key.substr(0, pos) : "";
            std::string name = pos != std::string::npos ? key.substr(pos + 1) : key;

            if (section != current_section) {
                if (!current_section.empty()) file << "\n";
                if (!section.empty()) file << "[" << section << "]\n";
                current_section = section;
            }
            file << name << " = " << value << "\n";
        }
        return true;
    }

    // Getters
    std::string getString(const std::string& key, const std::string& default_val = "") const {
        auto it = values_.find(key);
        return it != values_.end() ? it->second : default_val;
    }

    int getInt(const std::string& key, int default_val = 0) const {
        auto it = values_.find(key);
        if (it == values_.end()) return default_val;
        try {
            return std::stoi(it->second);
        } catch (const std::exception&) {
            reportInvalid(key, it->second);
            return default_val;
        }
    }

    double getDouble(const std::string& key, double default_val = 0.0) const {
        auto it = values_.find(key);
        if (it == values_.end()) return default_val;
        try {
            return std::stod(it->second);
        } catch (const std::exception&) {
            reportInvalid(key, it->second);
            return default_val;
        }
    }

    bool getBool(const std::string& key, bool default_val = false) const {
        auto it = values_.find(key);
        if (it == values_.end()) return default_val;
        std::string v = it->second;
        std::transform(v.begin(), v.end(), v.begin(), ::tolower);
        return v == "true" || v == "yes" || v == "1" || v == "on";
    }

    std::vector<std::string> getStringList(const std::string& key) const {
        std::vector<std::string> result;
        auto it = values_.find(key);
        if (it != values_.end()) {
            std::stringstream ss(it->second);
            std::string item;
            while (std::getline(ss, item, ',')) {
                item.erase(0, item.find_first_not_of(" \t"));
                item.erase(item.find_last_not_of(" \t") + 1);
                if (!item.empty()) result.push_back(item);
            }
        }
        return result;
    }

    // Setters
    void set(const std::string& key, const std::string& value) {
        values_[key] = value;
    }

    void set(const std::string& key, const char* value) {
        values_[key] = value;
    }

    void set(const std::string& key, int value) {
        values_[key] = std::to_string(value);
    }

    void set(const std::string& key, double value) {
        std::ostringstream oss;
        oss.precision(17);
        oss << value;
        values_[key] = oss.str();
    }

    void set(const std::string& key, bool value) {
        values_[key] = value ? "true" : "false";
    }

    bool has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    const std::map<std::string, std::string>& all() const { return values_; }

private:
    std::map<std::string, std::string> values_;

    static void reportInvalid(const std::string& key, const std::string& value) {
        std::cerr << "Config: invalid value '" << value << "' for " << key
                  << ", using default" << std::endl;
    }
};

} // namespace openetas
