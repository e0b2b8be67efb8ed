#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/StatusChecker.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <set>
#include <thread>

using namespace devmonitor::core;
using namespace devmonitor::infra;
using namespace std::chrono_literals;

namespace {

/**
 * Listening socket on 127.0.0.1 with a kernel-assigned port. Connections
 * complete through the backlog without an explicit accept.
 */
class LocalListener {
public:
    LocalListener()
        : acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {}

    int port() const { return acceptor_.local_endpoint().port(); }

private:
    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
};

// Binds then releases a port so nothing is listening on it.
int closedPort() {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io,
                                     asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    int port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

Device createTestDevice(const std::string& id, int port, int timeoutSeconds = 1) {
    Device device;
    device.id = id;
    device.name = "dev-" + id;
    device.host = "127.0.0.1";
    device.port = port;
    device.timeoutSeconds = timeoutSeconds;
    return device;
}

/**
 * Replaces the network check with a short sleep and records how many checks
 * were running at the same time.
 */
class ConcurrencyRecorder : public StatusChecker {
public:
    ConcurrencyRecorder(AsioContext& context, size_t maxConcurrency)
        : StatusChecker(context, maxConcurrency) {}

    CheckResult checkOne(const Device& device) override {
        int running = ++active_;
        int seen = peak_.load();
        while (running > seen && !peak_.compare_exchange_weak(seen, running)) {
        }
        std::this_thread::sleep_for(50ms);
        --active_;

        CheckResult result;
        result.deviceId = device.id;
        result.reachable = true;
        return result;
    }

    int peak() const { return peak_.load(); }

private:
    std::atomic<int> active_{0};
    std::atomic<int> peak_{0};
};

} // namespace

TEST_CASE("StatusChecker single check", "[StatusChecker]") {
    AsioContext context;
    context.start();
    StatusChecker checker(context);

    SECTION("Listening port is reachable") {
        LocalListener listener;
        auto result = checker.checkOne(createTestDevice("up", listener.port()));

        REQUIRE(result.deviceId == "up");
        REQUIRE(result.reachable);
        REQUIRE_FALSE(result.error.has_value());
        REQUIRE(result.checkedAt.time_since_epoch().count() > 0);
    }

    SECTION("Closed port is unreachable within the timeout") {
        auto started = std::chrono::steady_clock::now();
        auto result = checker.checkOne(createTestDevice("down", closedPort()));
        auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE_FALSE(result.reachable);
        REQUIRE(result.error.has_value());
        REQUIRE_FALSE(result.error->empty());
        REQUIRE(elapsed < std::chrono::seconds(2));
    }

    SECTION("Unresolvable host is reported, not thrown") {
        Device device = createTestDevice("dns", 80);
        device.host = "no-such-host.invalid";

        CheckResult result;
        REQUIRE_NOTHROW(result = checker.checkOne(device));
        REQUIRE_FALSE(result.reachable);
        REQUIRE(result.error.has_value());
    }

    SECTION("Check never outlives its timeout") {
        // TEST-NET-1 is not routed; the check either fails fast or times out.
        Device device = createTestDevice("blackhole", 80);
        device.host = "192.0.2.1";

        auto started = std::chrono::steady_clock::now();
        auto result = checker.checkOne(device);
        auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE_FALSE(result.reachable);
        REQUIRE(elapsed < std::chrono::milliseconds(2500));
    }

    SECTION("Name resolution does not extend the timeout") {
        // Either answered quickly or stuck in the system resolver; both end by the deadline.
        Device device = createTestDevice("slow-dns", 80);
        device.host = "devmonitor-unknown-host.example.com";

        auto started = std::chrono::steady_clock::now();
        auto result = checker.checkOne(device);
        auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE_FALSE(result.reachable);
        REQUIRE(result.error.has_value());
        REQUIRE(elapsed < std::chrono::milliseconds(1750));
    }

    SECTION("Loop stays usable after a timed out check") {
        Device blackhole = createTestDevice("blackhole", 80);
        blackhole.host = "192.0.2.1";
        REQUIRE_FALSE(checker.checkOne(blackhole).reachable);

        LocalListener listener;
        REQUIRE(checker.checkOne(createTestDevice("up", listener.port())).reachable);
    }
}

TEST_CASE("StatusChecker without a running loop", "[StatusChecker]") {
    AsioContext idle;
    StatusChecker checker(idle);
    LocalListener listener;

    auto started = std::chrono::steady_clock::now();
    auto result = checker.checkOne(createTestDevice("idle", listener.port()));
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE_FALSE(result.reachable);
    REQUIRE(result.error == "Connection timed out after 1s");
    REQUIRE(elapsed < std::chrono::milliseconds(2000));
}

TEST_CASE("StatusChecker batch check", "[StatusChecker]") {
    AsioContext context;
    context.start();
    LocalListener listener;
    int downPort = closedPort();

    SECTION("One result per enabled device") {
        StatusChecker checker(context, 4);
        std::vector<Device> devices;
        for (int i = 0; i < 10; ++i) {
            devices.push_back(createTestDevice("d" + std::to_string(i),
                                               i % 2 == 0 ? listener.port() : downPort));
        }

        auto results = checker.checkAll(devices);

        REQUIRE(results.size() == 10);
        std::set<std::string> ids;
        for (const auto& result : results) {
            ids.insert(result.deviceId);
            int index = std::stoi(result.deviceId.substr(1));
            REQUIRE(result.reachable == (index % 2 == 0));
        }
        REQUIRE(ids.size() == 10);
    }

    SECTION("Disabled devices produce no result") {
        StatusChecker checker(context);
        auto enabled = createTestDevice("on", listener.port());
        auto disabled = createTestDevice("off", listener.port());
        disabled.enabled = false;

        auto results = checker.checkAll({enabled, disabled});

        REQUIRE(results.size() == 1);
        REQUIRE(results[0].deviceId == "on");
    }

    SECTION("Empty input yields no results") {
        StatusChecker checker(context);
        REQUIRE(checker.checkAll({}).empty());
    }

    SECTION("Concurrency limit is at least one") {
        StatusChecker checker(context, 0);
        REQUIRE(checker.maxConcurrency() == 1);
        REQUIRE(checker.checkAll({createTestDevice("x", listener.port())}).size() == 1);
    }
}

TEST_CASE("StatusChecker concurrency limit", "[StatusChecker]") {
    AsioContext context;
    context.start();

    SECTION("No more than the limit run at once") {
        ConcurrencyRecorder checker(context, 3);
        std::vector<Device> devices;
        for (int i = 0; i < 12; ++i) {
            devices.push_back(createTestDevice("c" + std::to_string(i), 80));
        }

        auto results = checker.checkAll(devices);

        REQUIRE(results.size() == 12);
        REQUIRE(checker.peak() <= 3);
        REQUIRE(checker.peak() >= 2);
    }

    SECTION("Fewer devices than the limit run together") {
        ConcurrencyRecorder checker(context, 32);
        std::vector<Device> devices;
        for (int i = 0; i < 4; ++i) {
            devices.push_back(createTestDevice("c" + std::to_string(i), 80));
        }

        REQUIRE(checker.checkAll(devices).size() == 4);
        REQUIRE(checker.peak() <= 4);
    }
}
