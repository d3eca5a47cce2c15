#pragma once
#include <pumpevents/core/config/app_config.hpp>
#include <string>

// Overrides decoder.timezone when set
constexpr const char* TIMEZONE_ENV_VAR = "PUMPEVENTS_TIMEZONE";

class ConfigLoader {
public:
    /**
     * @throws std::runtime_error on a missing file, missing required field,
     *         wrong field type or invalid value
     */
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
};
