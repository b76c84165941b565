#include "app/Logging.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <vector>

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    if (name == "debug") return spdlog::level::debug;
    if (name == "warn")  return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    return spdlog::level::info;
}

void setupLogging(const AppConfig& config, bool interactive) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        config.logFile, 1048576 * 5, 3));  // 5MB, 3 files

    // The interactive UI owns stdout
    if (!interactive)
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    auto logger = std::make_shared<spdlog::logger>(
        "teacup", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(parseLogLevel(config.logLevel));
}
