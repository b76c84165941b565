#pragma once
#include "AppConfig.hpp"
#include <spdlog/spdlog.h>
#include <string>

// "debug", "warn", "error"; anything else is info
spdlog::level::level_enum parseLogLevel(const std::string& name);

// Install the default "teacup" logger: rotating file sink always, colour
// stdout sink only when the terminal is not owned by the interactive UI.
void setupLogging(const AppConfig& config, bool interactive);
