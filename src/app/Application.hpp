#pragma once

#include "controllers/MonitorController.hpp"
#include "core/bus/EventBus.hpp"
#include "core/registry/DeviceRegistry.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/StatusChecker.hpp"
#include "infrastructure/scheduling/CheckScheduler.hpp"
#include "infrastructure/storage/JsonDeviceStore.hpp"

#include <filesystem>
#include <memory>

namespace devmonitor::app {

/**
 * @brief Command line options.
 */
struct Options {
    std::filesystem::path configDir; ///< Empty means ConfigManager::defaultConfigDir().
    bool debug{false};               ///< Force debug logging.
    bool headless{false};            ///< No console; run until SIGINT/SIGTERM.
};

/**
 * @brief Composition root: builds, starts and tears down every component.
 *
 * Members are declared in dependency order so destruction runs in reverse:
 * the scheduler is stopped (waiting for an in-flight cycle) before the
 * controller, registry and bus go away.
 */
class Application {
public:
    explicit Application(const Options& options);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Runs until the user quits (console) or a termination signal arrives (headless).
     * @return Process exit code.
     */
    int run();

    infra::ConfigManager& config() { return *config_; }
    core::EventBus& bus() { return *bus_; }
    core::DeviceRegistry& registry() { return *registry_; }
    controllers::MonitorController& controller() { return *controller_; }
    infra::CheckScheduler& scheduler() { return *scheduler_; }

private:
    void initializeLogging();
    void initializeComponents();
    void startScheduler();
    void waitForSignal();
    void shutdown();

    Options options_;
    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::AsioContext> asioContext_;
    std::unique_ptr<core::EventBus> bus_;
    std::shared_ptr<infra::JsonDeviceStore> store_;
    std::unique_ptr<core::DeviceRegistry> registry_;
    std::unique_ptr<infra::StatusChecker> checker_;
    std::unique_ptr<controllers::MonitorController> controller_;
    std::unique_ptr<infra::CheckScheduler> scheduler_;
    bool shutDown_{false};
};

} // namespace devmonitor::app
