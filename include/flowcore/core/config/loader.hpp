#pragma once
#include <flowcore/core/config/app_config.hpp>
#include <string>

class ConfigLoader {
public:
    /**
     * @brief Load and validate a YAML configuration file.
     * @throws std::runtime_error on a missing file, a missing required field,
     *         a field of the wrong type or an out-of-range value
     */
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);

    /// Same rules, from an in-memory YAML document
    static AppConfig::AppConfiguration loadFromString(const std::string& yaml);
};
