//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// config/config_file.hpp
//
// INI-style configuration parser (key = value, optional [section] headers)
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace pgmux {

// Keys under a [section] header are stored as "section.key", matching the
// dotted paths used by YamlConfig
class ConfigFile {
public:
    bool Load(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            error_ = "Cannot open config file: " + path;
            return false;
        }
        return Parse(file);
    }

    bool Parse(std::istream& input) {
        std::string line;
        std::string section;
        int line_num = 0;
        while (std::getline(input, line)) {
            line_num++;
            line.erase(0, line.find_first_not_of(" \t\r"));
            line.erase(line.find_last_not_of(" \t\r") + 1);
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            if (line[0] == '[') {
                if (line.back() != ']' || line.size() < 3) {
                    error_ = "Invalid section header at line " + std::to_string(line_num);
                    return false;
                }
                section = line.substr(1, line.size() - 2);
                continue;
            }

            auto eq_pos = line.find('=');
            if (eq_pos == std::string::npos) {
                error_ = "Invalid syntax at line " + std::to_string(line_num);
                return false;
            }

            std::string key = line.substr(0, eq_pos);
            std::string value = line.substr(eq_pos + 1);

            key.erase(key.find_last_not_of(" \t") + 1);
            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t") + 1);
            if (key.empty()) {
                error_ = "Missing key at line " + std::to_string(line_num);
                return false;
            }

            if (value.size() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }

            values_[section.empty() ? key : section + "." + key] = value;
        }

        return true;
    }

    std::string GetString(const std::string& key, const std::string& default_val = "") const {
        auto it = values_.find(key);
        return it != values_.end() ? it->second : default_val;
    }

    int GetInt(const std::string& key, int default_val = 0) const {
        return static_cast<int>(GetInt64(key, default_val));
    }

    int64_t GetInt64(const std::string& key, int64_t default_val = 0) const {
        auto it = values_.find(key);
        if (it == values_.end()) return default_val;
        try {
            return std::stoll(it->second);
        } catch (const std::invalid_argument&) {
            return default_val;
        } catch (const std::out_of_range&) {
            return default_val;
        }
    }

    bool GetBool(const std::string& key, bool default_val = false) const {
        auto it = values_.find(key);
        if (it == values_.end()) return default_val;
        std::string val = it->second;
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return val == "true" || val == "yes" || val == "1" || val == "on";
    }

    bool Has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    // All keys below "prefix." with the prefix stripped
    std::unordered_map<std::string, std::string> GetSection(const std::string& prefix) const {
        std::unordered_map<std::string, std::string> out;
        std::string dotted = prefix + ".";
        for (const auto& kv : values_) {
            if (kv.first.compare(0, dotted.size(), dotted) == 0) {
                out[kv.first.substr(dotted.size())] = kv.second;
            }
        }
        return out;
    }

    const std::string& GetError() const { return error_; }

private:
    std::unordered_map<std::string, std::string> values_;
    std::string error_;
};

} // namespace pgmux
