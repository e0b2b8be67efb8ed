#include <catch2/catch_test_macros.hpp>

#include "core/bus/Topics.hpp"
#include "core/types/CheckResult.hpp"
#include "core/types/Device.hpp"
#include "ui/ConsoleView.hpp"

#include <sstream>

using namespace devmonitor::core;
using namespace devmonitor::ui;

namespace {

bool contains(const std::string& text, const std::string& fragment) {
    return text.find(fragment) != std::string::npos;
}

class CommandRecorder {
public:
    explicit CommandRecorder(EventBus& bus) {
        for (const char* topic : {topics::ADD_DEVICE, topics::REMOVE_DEVICE, topics::ENABLE_DEVICE,
                                  topics::DISABLE_DEVICE, topics::CHECK_ALL_DEVICES,
                                  topics::GET_DEVICES}) {
            bus.subscribe(topic, [this](const Event& e) { commands.push_back(e); });
        }
    }

    std::vector<Event> commands;
};

} // namespace

TEST_CASE("ConsoleView command parsing", "[ConsoleView]") {
    EventBus bus;
    CommandRecorder recorder(bus);
    std::ostringstream out;
    ConsoleView view(bus, out, 7);

    SECTION("add publishes a DeviceSpec") {
        REQUIRE(view.handleLine("add router 192.168.1.1 8080 3"));

        REQUIRE(recorder.commands.size() == 1);
        REQUIRE(recorder.commands[0].topic == topics::ADD_DEVICE);
        auto spec = std::any_cast<DeviceSpec>(recorder.commands[0].payload);
        REQUIRE(spec.name == "router");
        REQUIRE(spec.host == "192.168.1.1");
        REQUIRE(spec.port == 8080);
        REQUIRE(spec.timeoutSeconds == 3);
    }

    SECTION("add without timeout uses the configured default") {
        view.handleLine("add router 192.168.1.1 80");

        auto spec = std::any_cast<DeviceSpec>(recorder.commands.at(0).payload);
        REQUIRE(spec.timeoutSeconds == 7);
    }

    SECTION("add with a non-numeric port prints usage") {
        view.handleLine("add router 192.168.1.1 http");

        REQUIRE(recorder.commands.empty());
        REQUIRE(contains(out.str(), "usage: add"));
    }

    SECTION("Id commands publish the id") {
        view.handleLine("remove abc");
        view.handleLine("enable abc");
        view.handleLine("disable abc");

        REQUIRE(recorder.commands.size() == 3);
        REQUIRE(recorder.commands[0].topic == topics::REMOVE_DEVICE);
        REQUIRE(recorder.commands[1].topic == topics::ENABLE_DEVICE);
        REQUIRE(recorder.commands[2].topic == topics::DISABLE_DEVICE);
        REQUIRE(std::any_cast<std::string>(recorder.commands[2].payload) == "abc");
    }

    SECTION("Id commands without an id print usage") {
        view.handleLine("remove");

        REQUIRE(recorder.commands.empty());
        REQUIRE(contains(out.str(), "usage: remove <id>"));
    }

    SECTION("check and list") {
        view.handleLine("check");
        view.handleLine("list");

        REQUIRE(recorder.commands.size() == 2);
        REQUIRE(recorder.commands[0].topic == topics::CHECK_ALL_DEVICES);
        REQUIRE(recorder.commands[1].topic == topics::GET_DEVICES);
    }

    SECTION("quit ends the session, blank lines do not") {
        REQUIRE(view.handleLine(""));
        REQUIRE(view.handleLine("   "));
        REQUIRE_FALSE(view.handleLine("quit"));
        REQUIRE_FALSE(view.handleLine("exit"));
    }

    SECTION("Unknown commands are reported") {
        REQUIRE(view.handleLine("frobnicate"));
        REQUIRE(contains(out.str(), "Unknown command: frobnicate"));
    }

    SECTION("run stops at quit") {
        std::istringstream in("list\nquit\ncheck\n");
        view.run(in);

        REQUIRE(recorder.commands.size() == 1);
        REQUIRE(contains(out.str(), "Commands:"));
    }
}

TEST_CASE("ConsoleView rendering", "[ConsoleView]") {
    EventBus bus;
    std::ostringstream out;
    ConsoleView view(bus, out, 5);

    Device device;
    device.id = "0123456789abcdef";
    device.name = "router";
    device.host = "192.168.1.1";
    device.port = 80;

    SECTION("Added devices") {
        bus.publish(topics::DEVICE_ADDED, device);

        REQUIRE(contains(out.str(), "Added:"));
        REQUIRE(contains(out.str(), "192.168.1.1:80"));
        REQUIRE(contains(out.str(), "last checked: never"));
    }

    SECTION("Device list") {
        bus.publish(topics::DEVICES_LISTED, std::vector<Device>{device, device});
        REQUIRE(contains(out.str(), "2 device(s)"));
    }

    SECTION("Check results") {
        CheckResult result;
        result.deviceId = device.id;
        result.error = "Connection refused";
        bus.publish(topics::DEVICES_CHECKED, std::vector<CheckResult>{result});

        REQUIRE(contains(out.str(), "Checked 1 device(s)"));
        REQUIRE(contains(out.str(), "Offline"));
        REQUIRE(contains(out.str(), "Connection refused"));
    }

    SECTION("Command errors") {
        bus.publish(topics::errorTopic(topics::ADD_DEVICE),
                    ErrorEvent{ErrorKind::DuplicateDevice, "already monitored"});

        REQUIRE(contains(out.str(), "add_device_error: DuplicateDeviceError: already monitored"));
    }

    SECTION("Handler errors") {
        bus.publish(topics::HANDLER_ERROR, HandlerErrorEvent{"devices_checked", "boom"});
        REQUIRE(contains(out.str(), "Subscriber for 'devices_checked' failed: boom"));
    }
}
