#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    // scalars keep the text as written so "0755" or "1.0" reach the option parser intact
    out = node.Scalar();
    return true;
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

static bool store_yaml_value(const std::string& key, const YAML::Node& node,
                             std::map<std::string, std::string>& opts, std::string& error) {
    std::string s;
    if (!to_string_value(node, s)) {
        error = "Unsupported value for '" + key + "'";
        return false;
    }
    opts["--" + key] = s;
    return true;
}

bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar()) {
                error = "Non-scalar key in configuration";
                return false;
            }
            const std::string key_name = it->first.as<std::string>();
            const YAML::Node& node = it->second;
            if (!node.IsMap()) {
                if (!store_yaml_value(key_name, node, opts, error))
                    return false;
                continue;
            }
            for (auto sub = node.begin(); sub != node.end(); ++sub) {
                if (!sub->first.IsScalar()) {
                    error = "Non-scalar key in section '" + key_name + "'";
                    return false;
                }
                if (!store_yaml_value(sub->first.as<std::string>(), sub->second, opts, error))
                    return false;
            }
        }
        return true;
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        auto store = [&](const std::string& key, const nlohmann::json& v) {
            std::string s;
            if (!to_string_value(v, s)) {
                error = "Unsupported value for '" + key + "'";
                return false;
            }
            opts["--" + key] = s;
            return true;
        };
        for (auto it = root.begin(); it != root.end(); ++it) {
            const auto& val = it.value();
            if (!val.is_object()) {
                if (!store(it.key(), val))
                    return false;
                continue;
            }
            for (auto sub = val.begin(); sub != val.end(); ++sub) {
                if (!store(sub.key(), sub.value()))
                    return false;
            }
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    }
}
