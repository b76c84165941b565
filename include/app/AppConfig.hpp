#pragma once
#include "model/Errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <utility>

// Application settings: JSON file first, environment on top.
//
//   {
//     "root": "Dashboard",
//     "root_state": {"title": "Teacup"},
//     "fps": 60,
//     "log_level": "info",
//     "log_file": "teacup.log",
//     "hot_reloading": true,
//     "headless": false
//   }
//
// Environment: TEACUP_ENV (else APP_ENV), TEACUP_LOG_LEVEL, TEACUP_FPS.
struct AppConfig {
    std::string         env      = "production";
    std::string         root;                 // component type name
    nlohmann::json      rootState = nlohmann::json::object();
    int                 fps      = 60;
    std::string         logLevel = "info";
    std::string         logFile  = "teacup.log";
    std::optional<bool> hotReloading;         // unset = follow env
    bool                headless = false;

    // Explicit setting wins; otherwise on in development only
    bool hotReloadingEnabled() const {
        return hotReloading.value_or(env == "development");
    }

    std::chrono::milliseconds refreshInterval() const {
        // Never 0: above 1000 fps the loop would spin
        return std::chrono::milliseconds(std::max(1, 1000 / (fps > 0 ? fps : 60)));
    }

    static AppConfig fromJson(const nlohmann::json& j);

    // Throws ConfigError if the file is missing or not valid JSON
    static AppConfig load(const std::string& path);

    void applyEnvironment();
};

std::string getEnv(const std::string& key, const std::string& defaultVal = "");

// One `.env` line as (name, value). Blank lines, comments, lines without
// '=' and malformed names give nullopt. Accepts an `export ` prefix and
// single or double quotes; unquoted values end at " #".
std::optional<std::pair<std::string, std::string>>
parseDotEnvLine(const std::string& line);

// Sets every variable from `path` that is not already set and returns how
// many were applied. A missing file applies nothing.
int loadDotEnv(const std::string& path);
