#pragma once

#include <cstddef>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace devmonitor::infra {

/**
 * @brief Application configuration settings.
 *
 * Read once at startup and handed to the components that need it; nothing
 * re-reads the file at runtime.
 */
struct AppConfig {
    // Monitoring
    int checkIntervalSeconds{300};  ///< Period of automatic check cycles.
    bool autoCheckEnabled{true};    ///< Start the scheduler at launch.
    int defaultTimeoutSeconds{5};   ///< Check timeout when a command omits it.
    int maxConcurrency{32};         ///< Upper bound on simultaneous checks.

    // Logging
    std::string logLevel{"info"};                  ///< spdlog level name.
    size_t logMaxFileSizeBytes{10 * 1024 * 1024};  ///< Rotation threshold.
    size_t logMaxFiles{5};                         ///< Rotated backups kept.

    // Storage
    std::string devicesFile{"devices.json"}; ///< Relative to the config directory unless absolute.
};

/**
 * @brief Manages application configuration persistence.
 *
 * Loads and saves config.json in the application directory. Values outside
 * their valid range are replaced by defaults with a warning.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager, creating the directory if needed.
     * @param configDir Path to the application directory.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk.
     *
     * A missing file is created with default values.
     * @return True if loaded (or created) successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    std::filesystem::path configDir() const { return configDir_; }
    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Resolves the devices file against the config directory.
     */
    std::filesystem::path devicesPath() const;

    /**
     * @brief Returns the path of the rotating log file.
     */
    std::filesystem::path logPath() const;

    /**
     * @brief Returns $HOME/.dev_monitor, or ./.dev_monitor when HOME is unset.
     */
    static std::filesystem::path defaultConfigDir();

private:
    nlohmann::json toJson() const;

    /**
     * @brief Parses every section into a copy of @p base.
     *
     * Throws on a badly typed key, leaving nothing half-applied.
     */
    static AppConfig fromJson(const nlohmann::json& j, AppConfig base);

    /// Replaces out-of-range values with defaults, warning for each.
    static void sanitize(AppConfig& config);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace devmonitor::infra
