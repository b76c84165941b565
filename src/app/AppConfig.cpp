#include "app/AppConfig.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

AppConfig AppConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object())
        throw ConfigError("config must be a JSON object");

    AppConfig c;
    try {
        c.env       = j.value("env", c.env);
        c.root      = j.value("root", c.root);
        c.rootState = j.value("root_state", c.rootState);
        c.fps       = j.value("fps", c.fps);
        c.logLevel  = j.value("log_level", c.logLevel);
        c.logFile   = j.value("log_file", c.logFile);
        c.headless  = j.value("headless", c.headless);
        if (j.contains("hot_reloading") && !j["hot_reloading"].is_null())
            c.hotReloading = j["hot_reloading"].get<bool>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }

    if (!c.rootState.is_object())
        throw ConfigError("root_state must be a JSON object");
    if (c.fps <= 0)
        throw ConfigError("fps must be positive, got " + std::to_string(c.fps));
    return c;
}

AppConfig AppConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open())
        throw ConfigError("Cannot open config file: " + path);

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Cannot parse config file " + path + ": " + e.what());
    }
    return fromJson(j);
}

void AppConfig::applyEnvironment() {
    std::string e = getEnv("TEACUP_ENV", getEnv("APP_ENV"));
    if (!e.empty()) env = e;

    std::string level = getEnv("TEACUP_LOG_LEVEL");
    if (!level.empty()) logLevel = level;

    std::string fpsVal = getEnv("TEACUP_FPS");
    if (!fpsVal.empty()) {
        try {
            int parsed = std::stoi(fpsVal);
            if (parsed <= 0) throw std::out_of_range("fps");
            fps = parsed;
        } catch (const std::exception&) {
            throw ConfigError("TEACUP_FPS must be a positive integer, got '" +
                              fpsVal + "'");
        }
    }
}

std::string getEnv(const std::string& key, const std::string& defaultVal) {
    if (const char* val = std::getenv(key.c_str()))
        return val;
    return defaultVal;
}

namespace {

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

bool validEnvName(const std::string& name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0])))
        return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

}

std::optional<std::pair<std::string, std::string>>
parseDotEnvLine(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') return std::nullopt;

    const std::string exportPrefix = "export ";
    if (line.compare(0, exportPrefix.size(), exportPrefix) == 0)
        line = trim(line.substr(exportPrefix.size()));

    auto eq = line.find('=');
    if (eq == std::string::npos) return std::nullopt;

    std::string name  = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));
    if (!validEnvName(name)) return std::nullopt;

    char quote = value.empty() ? '\0' : value.front();
    if ((quote == '"' || quote == '\'') && value.size() >= 2 &&
        value.back() == quote) {
        value = value.substr(1, value.size() - 2);
    } else {
        // Unquoted: " #" starts a comment
        auto hash = value.find(" #");
        if (hash != std::string::npos) value = trim(value.substr(0, hash));
    }
    return std::make_pair(name, value);
}

int loadDotEnv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return 0;

    int applied = 0;
    std::string line;
    while (std::getline(file, line)) {
        auto entry = parseDotEnvLine(line);
        if (!entry || std::getenv(entry->first.c_str())) continue;
        setenv(entry->first.c_str(), entry->second.c_str(), 0);
        applied++;
    }
    return applied;
}
