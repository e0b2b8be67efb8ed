#include <catch2/catch_test_macros.hpp>

#include "controllers/MonitorController.hpp"
#include "core/bus/EventBus.hpp"
#include "core/bus/Topics.hpp"
#include "core/registry/DeviceRegistry.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/StatusChecker.hpp"
#include "infrastructure/storage/JsonDeviceStore.hpp"

#include <asio.hpp>
#include <chrono>
#include <filesystem>
#include <memory>

using namespace devmonitor::core;
using namespace devmonitor::infra;
using namespace devmonitor::controllers;

namespace {

class IntegrationTestDir {
public:
    IntegrationTestDir()
        : dir_(std::filesystem::temp_directory_path() / "devmonitor_workflow_integration_test") {
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    ~IntegrationTestDir() { std::filesystem::remove_all(dir_); }

    std::filesystem::path devicesFile() const { return dir_ / "devices.json"; }

private:
    std::filesystem::path dir_;
};

/**
 * One running engine: event loop, store, bus, registry, checker and controller.
 */
struct Engine {
    explicit Engine(const std::filesystem::path& devicesFile)
        : store(std::make_shared<JsonDeviceStore>(devicesFile)),
          registry(store, bus),
          checker(context, 8),
          controller(bus, registry, checker) {
        context.start();
        registry.load();
    }

    AsioContext context;
    std::shared_ptr<JsonDeviceStore> store;
    EventBus bus;
    DeviceRegistry registry;
    StatusChecker checker;
    MonitorController controller;
};

DeviceSpec makeSpec(const std::string& name, const std::string& host, int port) {
    DeviceSpec spec;
    spec.name = name;
    spec.host = host;
    spec.port = port;
    spec.timeoutSeconds = 1;
    return spec;
}

} // namespace

// =============================================================================
// Device Check Workflow Integration Tests
// =============================================================================

TEST_CASE("Device check workflow - add, check and persist", "[Integration][Workflow]") {
    IntegrationTestDir testDir;

    asio::io_context io;
    asio::ip::tcp::acceptor listener(io,
                                     asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    int openPort = listener.local_endpoint().port();

    std::string onlineId;
    std::string offlineId;

    {
        Engine engine(testDir.devicesFile());

        std::vector<Device> added;
        std::vector<CheckResult> checked;
        engine.bus.subscribe(topics::DEVICE_ADDED, [&](const Event& e) {
            added.push_back(std::any_cast<Device>(e.payload));
        });
        engine.bus.subscribe(topics::DEVICES_CHECKED, [&](const Event& e) {
            checked = std::any_cast<std::vector<CheckResult>>(e.payload);
        });

        engine.bus.publish(topics::ADD_DEVICE, makeSpec("local-service", "127.0.0.1", openPort));
        engine.bus.publish(topics::ADD_DEVICE, makeSpec("discard", "127.0.0.1", 9));

        REQUIRE(added.size() == 2);
        onlineId = added[0].id;
        offlineId = added[1].id;
        REQUIRE(added[0].status == DeviceStatus::Unknown);

        engine.bus.publish(topics::CHECK_ALL_DEVICES);

        REQUIRE(checked.size() == 2);
        REQUIRE(engine.registry.find(onlineId)->status == DeviceStatus::Online);
        REQUIRE(engine.registry.find(offlineId)->status == DeviceStatus::Offline);
        REQUIRE(engine.registry.find(offlineId)->lastCheckedAt.has_value());
    }

    SECTION("State survives a restart") {
        Engine restarted(testDir.devicesFile());

        REQUIRE(restarted.registry.size() == 2);
        REQUIRE(restarted.registry.find(onlineId)->status == DeviceStatus::Online);
        REQUIRE(restarted.registry.find(offlineId)->status == DeviceStatus::Offline);
        REQUIRE(restarted.registry.find(offlineId)->lastCheckedAt.has_value());
    }

    SECTION("Removing and disabling after a restart is persisted") {
        {
            Engine restarted(testDir.devicesFile());
            restarted.bus.publish(topics::REMOVE_DEVICE, onlineId);
            restarted.bus.publish(topics::DISABLE_DEVICE, offlineId);
        }

        Engine again(testDir.devicesFile());
        REQUIRE(again.registry.size() == 1);
        REQUIRE_FALSE(again.registry.find(offlineId)->enabled);

        std::vector<CheckResult> checked{CheckResult{}};
        again.bus.subscribe(topics::DEVICES_CHECKED, [&](const Event& e) {
            checked = std::any_cast<std::vector<CheckResult>>(e.payload);
        });
        again.bus.publish(topics::CHECK_ALL_DEVICES);
        REQUIRE(checked.empty());
    }
}

TEST_CASE("Device check workflow - closed port goes Offline", "[Integration][Workflow]") {
    IntegrationTestDir testDir;
    Engine engine(testDir.devicesFile());

    std::vector<CheckResult> checked;
    engine.bus.subscribe(topics::DEVICES_CHECKED, [&](const Event& e) {
        checked = std::any_cast<std::vector<CheckResult>>(e.payload);
    });

    engine.bus.publish(topics::ADD_DEVICE, makeSpec("r1", "127.0.0.1", 9));
    auto devices = engine.registry.getAll();
    REQUIRE(devices.size() == 1);
    auto r1 = devices[0];

    engine.bus.publish(topics::CHECK_ALL_DEVICES);

    REQUIRE(checked.size() == 1);
    REQUIRE(checked[0].deviceId == r1.id);
    REQUIRE_FALSE(checked[0].reachable);
    REQUIRE(checked[0].duration <= std::chrono::milliseconds(1500));
    REQUIRE(engine.registry.find(r1.id)->status == DeviceStatus::Offline);
}

TEST_CASE("Device check workflow - command errors reach subscribers", "[Integration][Workflow]") {
    IntegrationTestDir testDir;
    Engine engine(testDir.devicesFile());

    std::vector<ErrorEvent> errors;
    engine.bus.subscribe(topics::errorTopic(topics::ADD_DEVICE), [&](const Event& e) {
        errors.push_back(std::any_cast<ErrorEvent>(e.payload));
    });

    engine.bus.publish(topics::ADD_DEVICE, makeSpec("router", "192.168.1.1", 80));
    engine.bus.publish(topics::ADD_DEVICE, makeSpec("router", "192.168.1.1", 80));
    engine.bus.publish(topics::ADD_DEVICE, makeSpec("bad name", "192.168.1.2", 80));

    REQUIRE(errors.size() == 2);
    REQUIRE(errors[0].kind == ErrorKind::DuplicateDevice);
    REQUIRE(errors[1].kind == ErrorKind::Validation);
    REQUIRE(engine.registry.size() == 1);
}
