//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// config/yaml_config.hpp
//
// YAML configuration file parser
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <unordered_map>
#include <yaml-cpp/yaml.h>

namespace pgmux {

class YamlConfig {
public:
    bool Load(const std::string& path) {
        try {
            root_ = YAML::LoadFile(path);
            return true;
        } catch (const YAML::BadFile&) {
            error_ = "Cannot open config file: " + path;
            return false;
        } catch (const YAML::Exception& e) {
            error_ = "YAML parse error: " + std::string(e.what());
            return false;
        }
    }

    bool LoadString(const std::string& text) {
        try {
            root_ = YAML::Load(text);
            return true;
        } catch (const YAML::Exception& e) {
            error_ = "YAML parse error: " + std::string(e.what());
            return false;
        }
    }

    template<typename T>
    T Get(const std::string& path, const T& default_val) const {
        try {
            YAML::Node node = GetNode(path);
            if (node && !node.IsNull()) {
                return node.as<T>();
            }
        } catch (const YAML::Exception&) {
            // Wrong type: fall through to default
        }
        return default_val;
    }

    std::string GetString(const std::string& path, const std::string& default_val = "") const {
        return Get<std::string>(path, default_val);
    }

    int GetInt(const std::string& path, int default_val = 0) const {
        return Get<int>(path, default_val);
    }

    int64_t GetInt64(const std::string& path, int64_t default_val = 0) const {
        return Get<int64_t>(path, default_val);
    }

    bool GetBool(const std::string& path, bool default_val = false) const {
        return Get<bool>(path, default_val);
    }

    // Scalar entries of a mapping node, e.g. "credentials"
    std::unordered_map<std::string, std::string> GetStringMap(const std::string& path) const {
        std::unordered_map<std::string, std::string> out;
        YAML::Node node = GetNode(path);
        if (!node || !node.IsMap()) {
            return out;
        }
        for (const auto& entry : node) {
            if (entry.second.IsScalar()) {
                out[entry.first.as<std::string>()] = entry.second.as<std::string>();
            }
        }
        return out;
    }

    bool Has(const std::string& path) const {
        YAML::Node node = GetNode(path);
        return node && !node.IsNull();
    }

    const std::string& GetError() const { return error_; }

private:
    // Get node by dot-separated path (e.g., "backend.port")
    YAML::Node GetNode(const std::string& path) const {
        YAML::Node current;
        current.reset(root_);

        size_t start = 0;
        size_t end;

        while ((end = path.find('.', start)) != std::string::npos) {
            std::string key = path.substr(start, end - start);
            if (!current.IsMap() || !current[key]) {
                return YAML::Node();
            }
            current.reset(current[key]);
            start = end + 1;
        }

        if (!current.IsMap()) {
            return YAML::Node();
        }
        return current[path.substr(start)];
    }

    YAML::Node root_;
    std::string error_;
};

} // namespace pgmux
