#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <utility>

namespace devmonitor::infra {

namespace {

// rotating_file_sink_mt rejects larger backup counts.
constexpr int64_t kMaxLogFiles = 200000;

/**
 * Reads an unsigned size key as a signed number so negative values do not
 * wrap, keeping @p fallback when the value is outside [minValue, maxValue].
 */
size_t readSize(const nlohmann::json& section, const char* key, size_t fallback, int64_t minValue,
                int64_t maxValue) {
    if (!section.contains(key)) {
        return fallback;
    }

    auto value = section.at(key).get<int64_t>();
    if (value < minValue || value > maxValue) {
        spdlog::warn("Invalid logging.{} {}, using {}", key, value, fallback);
        return fallback;
    }
    return static_cast<size_t>(value);
}

} // namespace

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;

        AppConfig parsed = fromJson(j, config_);
        sanitize(parsed);
        config_ = std::move(parsed);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    j["monitoring"]["check_interval_seconds"] = config_.checkIntervalSeconds;
    j["monitoring"]["auto_check_enabled"] = config_.autoCheckEnabled;
    j["monitoring"]["default_timeout_seconds"] = config_.defaultTimeoutSeconds;
    j["monitoring"]["max_concurrency"] = config_.maxConcurrency;

    j["logging"]["level"] = config_.logLevel;
    j["logging"]["max_file_size_bytes"] = config_.logMaxFileSizeBytes;
    j["logging"]["max_files"] = config_.logMaxFiles;

    j["storage"]["devices_file"] = config_.devicesFile;

    return j;
}

AppConfig ConfigManager::fromJson(const nlohmann::json& j, AppConfig base) {
    const AppConfig defaults;

    if (j.contains("monitoring")) {
        const auto& m = j["monitoring"];
        base.checkIntervalSeconds = m.value("check_interval_seconds", defaults.checkIntervalSeconds);
        base.autoCheckEnabled = m.value("auto_check_enabled", defaults.autoCheckEnabled);
        base.defaultTimeoutSeconds = m.value("default_timeout_seconds", defaults.defaultTimeoutSeconds);
        base.maxConcurrency = m.value("max_concurrency", defaults.maxConcurrency);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        base.logLevel = l.value("level", defaults.logLevel);
        base.logMaxFileSizeBytes = readSize(l, "max_file_size_bytes", defaults.logMaxFileSizeBytes, 1,
                                            std::numeric_limits<int64_t>::max());
        base.logMaxFiles = readSize(l, "max_files", defaults.logMaxFiles, 1, kMaxLogFiles);
    }

    if (j.contains("storage")) {
        base.devicesFile = j["storage"].value("devices_file", defaults.devicesFile);
    }

    return base;
}

void ConfigManager::sanitize(AppConfig& config) {
    const AppConfig defaults;

    if (config.checkIntervalSeconds < 1) {
        spdlog::warn("Invalid check interval {}s, using {}s", config.checkIntervalSeconds,
                     defaults.checkIntervalSeconds);
        config.checkIntervalSeconds = defaults.checkIntervalSeconds;
    }
    if (config.defaultTimeoutSeconds < 1 || config.defaultTimeoutSeconds > 300) {
        spdlog::warn("Invalid default timeout {}s, using {}s", config.defaultTimeoutSeconds,
                     defaults.defaultTimeoutSeconds);
        config.defaultTimeoutSeconds = defaults.defaultTimeoutSeconds;
    }
    if (config.maxConcurrency < 1) {
        spdlog::warn("Invalid max concurrency {}, using {}", config.maxConcurrency,
                     defaults.maxConcurrency);
        config.maxConcurrency = defaults.maxConcurrency;
    }
    if (spdlog::level::from_str(config.logLevel) == spdlog::level::off && config.logLevel != "off") {
        spdlog::warn("Unknown log level '{}', using '{}'", config.logLevel, defaults.logLevel);
        config.logLevel = defaults.logLevel;
    }
    if (config.logMaxFileSizeBytes == 0) {
        spdlog::warn("Invalid log file size 0, using {}", defaults.logMaxFileSizeBytes);
        config.logMaxFileSizeBytes = defaults.logMaxFileSizeBytes;
    }
    if (config.logMaxFiles < 1 || config.logMaxFiles > static_cast<size_t>(kMaxLogFiles)) {
        spdlog::warn("Invalid log file count {}, using {}", config.logMaxFiles, defaults.logMaxFiles);
        config.logMaxFiles = defaults.logMaxFiles;
    }
    if (config.devicesFile.empty()) {
        config.devicesFile = defaults.devicesFile;
    }
}

std::filesystem::path ConfigManager::devicesPath() const {
    std::filesystem::path path(config_.devicesFile);
    if (path.is_absolute()) {
        return path;
    }
    return configDir_ / path;
}

std::filesystem::path ConfigManager::logPath() const {
    return configDir_ / "devmonitor.log";
}

std::filesystem::path ConfigManager::defaultConfigDir() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return std::filesystem::current_path() / ".dev_monitor";
    }
    return std::filesystem::path(home) / ".dev_monitor";
}

} // namespace devmonitor::infra
