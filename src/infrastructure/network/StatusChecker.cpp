#include "infrastructure/network/StatusChecker.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <iterator>
#include <memory>
#include <mutex>

namespace devmonitor::infra {

namespace {

// Backstop for a loop that is stopped or too busy to fire the deadline timer.
constexpr std::chrono::milliseconds kDeadlineGrace{250};

/**
 * One connection attempt. Every handler runs on the strand, and each of them
 * holds a reference, so the state outlives a caller that gave up waiting.
 */
struct ConnectAttempt {
    explicit ConnectAttempt(asio::io_context& io)
        : strand(asio::make_strand(io)), resolver(strand), socket(strand), deadline(strand) {}

    /// Delivers the first outcome; later ones are dropped.
    bool settle(const asio::error_code& ec) {
        if (settled) {
            return false;
        }
        settled = true;
        outcome.set_value(ec);
        return true;
    }

    asio::strand<asio::io_context::executor_type> strand;
    asio::ip::tcp::resolver resolver;
    asio::ip::tcp::socket socket;
    asio::steady_timer deadline;
    std::promise<asio::error_code> outcome;
    bool settled{false};
};

void closeSocket(asio::ip::tcp::socket& socket) {
    asio::error_code ignored;
    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
}

} // namespace

StatusChecker::StatusChecker(AsioContext& context, size_t maxConcurrency)
    : context_(context), maxConcurrency_(maxConcurrency > 0 ? maxConcurrency : 1) {
    spdlog::debug("StatusChecker initialized (max concurrency {})", maxConcurrency_);
}

core::CheckResult StatusChecker::checkOne(const core::Device& device) {
    core::CheckResult result;
    result.deviceId = device.id;
    auto started = std::chrono::steady_clock::now();
    auto timeout = device.timeout();
    std::string timeoutMessage =
        "Connection timed out after " + std::to_string(device.timeoutSeconds) + "s";

    try {
        auto attempt = std::make_shared<ConnectAttempt>(context_.getContext());
        auto outcome = attempt->outcome.get_future();

        asio::post(attempt->strand, [attempt, host = device.host,
                                     service = std::to_string(device.port), timeout]() {
            attempt->deadline.expires_after(timeout);
            attempt->deadline.async_wait([attempt](const asio::error_code& ec) {
                if (ec == asio::error::operation_aborted) {
                    return;
                }
                if (attempt->settle(asio::error::timed_out)) {
                    attempt->resolver.cancel();
                    closeSocket(attempt->socket);
                }
            });

            attempt->resolver.async_resolve(
                host, service,
                [attempt](const asio::error_code& ec,
                          asio::ip::tcp::resolver::results_type endpoints) {
                    if (attempt->settled) {
                        return;
                    }
                    if (ec) {
                        attempt->settle(ec);
                        attempt->deadline.cancel();
                        return;
                    }
                    asio::async_connect(attempt->socket, endpoints,
                                        [attempt](const asio::error_code& connectEc,
                                                  const asio::ip::tcp::endpoint&) {
                                            if (attempt->settle(connectEc)) {
                                                attempt->deadline.cancel();
                                            }
                                            closeSocket(attempt->socket);
                                        });
                });
        });

        if (outcome.wait_for(timeout + kDeadlineGrace) != std::future_status::ready) {
            result.reachable = false;
            result.error = timeoutMessage;
        } else if (auto ec = outcome.get(); ec == asio::error::timed_out) {
            result.reachable = false;
            result.error = timeoutMessage;
        } else if (ec) {
            result.reachable = false;
            result.error = ec.message();
        } else {
            result.reachable = true;
        }
    } catch (const std::exception& e) {
        result.reachable = false;
        result.error = e.what();
    }

    result.checkedAt = std::chrono::system_clock::now();
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (result.reachable) {
        spdlog::debug("Device {} ({}) is online ({} ms)", device.name, device.endpoint(),
                      result.duration.count());
    } else {
        spdlog::debug("Device {} ({}) is offline: {}", device.name, device.endpoint(),
                      result.error.value_or("unknown error"));
    }
    return result;
}

std::vector<core::CheckResult> StatusChecker::checkAll(const std::vector<core::Device>& devices) {
    std::vector<core::Device> enabled;
    std::copy_if(devices.begin(), devices.end(), std::back_inserter(enabled),
                 [](const core::Device& d) { return d.enabled; });

    std::vector<core::CheckResult> results;
    if (enabled.empty()) {
        spdlog::debug("No enabled devices to check");
        return results;
    }

    spdlog::info("Checking status of {} enabled devices", enabled.size());

    results.reserve(enabled.size());
    std::mutex resultsMutex;
    asio::thread_pool pool(std::min(maxConcurrency_, enabled.size()));

    for (const auto& device : enabled) {
        asio::post(pool, [this, device, &results, &resultsMutex]() {
            auto result = checkOne(device);
            std::lock_guard lock(resultsMutex);
            results.push_back(std::move(result));
        });
    }

    pool.join();

    auto online = std::count_if(results.begin(), results.end(),
                                [](const core::CheckResult& r) { return r.reachable; });
    spdlog::info("Status check complete: {}/{} devices online", online, results.size());
    return results;
}

} // namespace devmonitor::infra
