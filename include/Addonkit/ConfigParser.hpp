// =================================================================
// include/Addonkit/ConfigParser.hpp
// =================================================================
// Defines the parser for the optional addonkit.yml file and the
// Settings it produces.

#pragma once

#include <map>
#include <string>

namespace Addonkit {

/// File name looked up in the working directory when --config is not given.
constexpr const char* kDefaultConfigFile = "addonkit.yml";

class ConfigParser {
public:
    /**
     * @brief Constructs an empty parser (every key unset).
     */
    ConfigParser() = default;

    /**
     * @brief Constructs the parser and loads the configuration file.
     * @param config_path The path to the YAML file. A missing file is not an
     *        error; a file that is not valid YAML throws ConfigurationError.
     */
    explicit ConfigParser(const std::string& config_path);

    /**
     * @brief Loads configuration from YAML text.
     */
    static ConfigParser fromString(const std::string& yaml_text);

    /**
     * @brief Retrieves a string value for a given key.
     * @param key The configuration key; nested maps use dotted keys
     *        (e.g., "logging.level").
     * @return The corresponding value, or an empty string if not found.
     */
    std::string getStringValue(const std::string& key) const;

    bool hasValue(const std::string& key) const;

private:
    void load(const std::string& yaml_text, const std::string& origin);

    std::map<std::string, std::string> m_config_values;
};

/**
 * @brief Effective settings for one invocation
 */
struct Settings {
    std::string dist_url = "https://nodejs.org/dist";
    int napi_version = 5;
    std::string node_executable = "node";
    std::string log_level = "info";
    std::string log_file;

    /**
     * @brief Builds settings from parsed configuration, keeping defaults for
     *        unset keys. Throws ConfigurationError on invalid values.
     */
    static Settings fromConfig(const ConfigParser& config);
};

} // namespace Addonkit
