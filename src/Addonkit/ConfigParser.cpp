// =================================================================
// src/Addonkit/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration parser.

#include "Addonkit/ConfigParser.hpp"
#include "Addonkit/Errors.hpp"
#include "Addonkit/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace Addonkit {

// Flattens nested maps into "parent.child" keys. Sequences are ignored.
static void flatten(const YAML::Node& node, const std::string& prefix,
                    std::map<std::string, std::string>& out) {
    for (const auto& item : node) {
        std::string key = prefix.empty() ? item.first.as<std::string>()
                                         : prefix + "." + item.first.as<std::string>();
        const YAML::Node& value = item.second;
        if (value.IsMap()) {
            flatten(value, key, out);
        } else if (value.IsScalar()) {
            out[key] = value.as<std::string>();
        } else if (value.IsNull()) {
            out[key] = "";
        }
    }
}

ConfigParser::ConfigParser(const std::string& config_path) {
    std::ifstream config_file(config_path);
    if (!config_file.is_open()) {
        // No configuration file means defaults everywhere.
        return;
    }

    std::stringstream buffer;
    buffer << config_file.rdbuf();
    load(buffer.str(), config_path);
}

ConfigParser ConfigParser::fromString(const std::string& yaml_text) {
    ConfigParser parser;
    parser.load(yaml_text, "<string>");
    return parser;
}

void ConfigParser::load(const std::string& yaml_text, const std::string& origin) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid configuration in " + origin + ": " + e.what());
    }

    if (root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw ConfigurationError("Configuration in " + origin + " must be a mapping");
    }

    flatten(root, "", m_config_values);
    LOG_DEBUG("Config", "Loaded " + std::to_string(m_config_values.size()) + " values from " + origin);
}

std::string ConfigParser::getStringValue(const std::string& key) const {
    auto it = m_config_values.find(key);
    if (it != m_config_values.end()) {
        return it->second;
    }
    return "";
}

bool ConfigParser::hasValue(const std::string& key) const {
    return m_config_values.count(key) > 0;
}

Settings Settings::fromConfig(const ConfigParser& config) {
    Settings settings;

    std::string dist_url = config.getStringValue("dist_url");
    if (!dist_url.empty()) {
        while (!dist_url.empty() && dist_url.back() == '/') {
            dist_url.pop_back();
        }
        if (dist_url.rfind("http://", 0) != 0 && dist_url.rfind("https://", 0) != 0) {
            throw ConfigurationError("dist_url must start with http:// or https://, got '" + dist_url + "'");
        }
        settings.dist_url = dist_url;
    }

    std::string napi_version = config.getStringValue("napi_version");
    if (!napi_version.empty()) {
        try {
            size_t consumed = 0;
            settings.napi_version = std::stoi(napi_version, &consumed);
            if (consumed != napi_version.size() || settings.napi_version < 1) {
                throw ConfigurationError("napi_version must be a positive integer, got '" + napi_version + "'");
            }
        } catch (const std::logic_error&) {
            throw ConfigurationError("napi_version must be a positive integer, got '" + napi_version + "'");
        }
    }

    std::string node_executable = config.getStringValue("node");
    if (!node_executable.empty()) {
        settings.node_executable = node_executable;
    }

    std::string log_level = config.getStringValue("log_level");
    if (!log_level.empty()) {
        LogLevel parsed;
        if (!Logger::parseLevel(log_level, parsed)) {
            throw ConfigurationError("Unknown log_level '" + log_level + "'");
        }
        settings.log_level = log_level;
    }

    settings.log_file = config.getStringValue("log_file");
    return settings;
}

} // namespace Addonkit
