#include "app/Application.hpp"

#include "core/bus/Topics.hpp"
#include "ui/ConsoleView.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>

namespace devmonitor::app {

Application::Application(const Options& options) : options_(options) {
    auto configDir =
        options_.configDir.empty() ? infra::ConfigManager::defaultConfigDir() : options_.configDir;
    config_ = std::make_unique<infra::ConfigManager>(configDir);
    config_->load();

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    shutdown();
}

void Application::initializeLogging() {
    const auto& cfg = config_->config();
    auto level = options_.debug ? spdlog::level::debug : spdlog::level::from_str(cfg.logLevel);
    auto logPath = config_->logPath();

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(options_.headless ? level : spdlog::level::warn);

    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        logPath.string(), cfg.logMaxFileSizeBytes, cfg.logMaxFiles);
    fileSink->set_level(level);

    auto logger =
        std::make_shared<spdlog::logger>("devmonitor", spdlog::sinks_init_list{consoleSink, fileSink});
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);

    spdlog::info("DevMonitor starting...");
    spdlog::info("Log file: {}", logPath.string());
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();

    asioContext_ = std::make_unique<infra::AsioContext>(2);
    asioContext_->start();

    bus_ = std::make_unique<core::EventBus>();

    store_ = std::make_shared<infra::JsonDeviceStore>(config_->devicesPath());
    registry_ = std::make_unique<core::DeviceRegistry>(store_, *bus_);
    registry_->load();

    checker_ = std::make_unique<infra::StatusChecker>(*asioContext_,
                                                       static_cast<size_t>(cfg.maxConcurrency));
    controller_ = std::make_unique<controllers::MonitorController>(*bus_, *registry_, *checker_);

    // Scheduled cycles take the same path as a manual "check" command.
    scheduler_ = std::make_unique<infra::CheckScheduler>(
        *asioContext_, [this]() { bus_->publish(core::topics::CHECK_ALL_DEVICES); });

    spdlog::info("Application components initialized");
}

void Application::startScheduler() {
    const auto& cfg = config_->config();
    if (!cfg.autoCheckEnabled) {
        spdlog::info("Automatic checks disabled");
        return;
    }
    scheduler_->start(std::chrono::seconds(cfg.checkIntervalSeconds));
}

int Application::run() {
    startScheduler();

    if (options_.headless) {
        waitForSignal();
    } else {
        ui::ConsoleView console(*bus_, std::cout, config_->config().defaultTimeoutSeconds);
        console.run(std::cin);
    }

    shutdown();
    return 0;
}

void Application::waitForSignal() {
    spdlog::info("Running headless, press Ctrl+C to stop");
    asioContext_->waitForTerminationSignal();
    spdlog::info("Shutting down on signal");
}

void Application::shutdown() {
    if (shutDown_) {
        return;
    }
    shutDown_ = true;

    spdlog::info("Application shutting down...");

    // Waits for a running cycle; each check is bounded by its timeout.
    scheduler_.reset();

    if (asioContext_) {
        asioContext_->stop();
    }

    spdlog::info("DevMonitor stopped ({} devices)", registry_ ? registry_->size() : 0);
    spdlog::default_logger()->flush();
}

} // namespace devmonitor::app
