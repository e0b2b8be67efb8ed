#include <catch2/catch_test_macros.hpp>

#include "core/Errors.hpp"
#include "core/types/CheckResult.hpp"
#include "core/types/Device.hpp"
#include "core/types/Timestamp.hpp"

using namespace devmonitor::core;

TEST_CASE("Device defaults", "[Device]") {
    Device device;

    REQUIRE(device.id.empty());
    REQUIRE(device.port == 80);
    REQUIRE(device.timeoutSeconds == 5);
    REQUIRE(device.enabled);
    REQUIRE(device.status == DeviceStatus::Unknown);
    REQUIRE_FALSE(device.lastCheckedAt.has_value());
    REQUIRE(device.timeout() == std::chrono::seconds(5));
}

TEST_CASE("Device status conversion", "[Device]") {
    SECTION("Status to string") {
        Device device;

        device.status = DeviceStatus::Unknown;
        REQUIRE(device.statusToString() == "Unknown");

        device.status = DeviceStatus::Online;
        REQUIRE(device.statusToString() == "Online");

        device.status = DeviceStatus::Offline;
        REQUIRE(device.statusToString() == "Offline");
    }

    SECTION("String to status") {
        REQUIRE(Device::statusFromString("Unknown") == DeviceStatus::Unknown);
        REQUIRE(Device::statusFromString("Online") == DeviceStatus::Online);
        REQUIRE(Device::statusFromString("Offline") == DeviceStatus::Offline);
        REQUIRE(Device::statusFromString("invalid") == DeviceStatus::Unknown);
    }
}

TEST_CASE("Device endpoint formatting", "[Device]") {
    Device device;
    device.port = 8080;

    device.host = "192.168.1.10";
    REQUIRE(device.endpoint() == "192.168.1.10:8080");

    device.host = "::1";
    REQUIRE(device.endpoint() == "[::1]:8080");
}

TEST_CASE("Device equality", "[Device]") {
    Device device1;
    device1.id = "abc";
    device1.name = "router";
    device1.host = "10.0.0.1";

    Device device2 = device1;
    REQUIRE(device1 == device2);

    device2.status = DeviceStatus::Online;
    REQUIRE_FALSE(device1 == device2);
}

TEST_CASE("CheckResult duration", "[CheckResult]") {
    CheckResult result;
    REQUIRE(result.durationSeconds() == 0.0);

    result.duration = std::chrono::milliseconds(1500);
    REQUIRE(result.durationSeconds() == 1.5);
}

TEST_CASE("Timestamp formatting", "[Timestamp]") {
    SECTION("Epoch formats as ISO 8601 UTC") {
        auto epoch = std::chrono::system_clock::time_point{};
        REQUIRE(formatTimestamp(epoch) == "1970-01-01T00:00:00Z");
    }

    SECTION("Parse returns the formatted second") {
        auto tp = std::chrono::system_clock::time_point{} + std::chrono::seconds(1700000000);
        auto parsed = parseTimestamp(formatTimestamp(tp));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == tp);
    }

    SECTION("Garbage does not parse") {
        REQUIRE_FALSE(parseTimestamp("yesterday").has_value());
    }
}

TEST_CASE("Error kinds", "[Errors]") {
    REQUIRE(errorKindToString(ErrorKind::Validation) == "ValidationError");
    REQUIRE(errorKindToString(ErrorKind::DuplicateDevice) == "DuplicateDeviceError");
    REQUIRE(errorKindToString(ErrorKind::NotFound) == "NotFoundError");
    REQUIRE(errorKindToString(ErrorKind::Persistence) == "PersistenceError");

    NotFoundError error("missing");
    REQUIRE(error.kind() == ErrorKind::NotFound);
    REQUIRE(std::string(error.what()) == "missing");
}
