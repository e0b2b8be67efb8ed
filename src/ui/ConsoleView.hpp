#pragma once

#include "core/bus/EventBus.hpp"

#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

namespace devmonitor::ui {

/**
 * @brief Line-oriented console front end.
 *
 * Turns typed commands into bus commands and renders outcome and error events.
 * It only talks to the EventBus; the engine has no knowledge of it.
 *
 * Commands: add <name> <host> <port> [timeout], remove <id>, enable <id>,
 * disable <id>, check, list, help, quit.
 */
class ConsoleView {
public:
    /**
     * @param bus Bus to publish commands on and to render events from.
     * @param out Stream receiving rendered output (may be written from the scheduler thread).
     * @param defaultTimeoutSeconds Timeout used when "add" omits one.
     */
    ConsoleView(core::EventBus& bus, std::ostream& out, int defaultTimeoutSeconds);
    ~ConsoleView();

    ConsoleView(const ConsoleView&) = delete;
    ConsoleView& operator=(const ConsoleView&) = delete;

    /**
     * @brief Reads commands until "quit" or end of input.
     */
    void run(std::istream& in);

    /**
     * @brief Executes a single command line.
     * @return False if the line asks to quit.
     */
    bool handleLine(const std::string& line);

private:
    void render(const core::Event& event);
    void printHelp();

    core::EventBus& bus_;
    std::ostream& out_;
    int defaultTimeoutSeconds_;
    std::mutex outMutex_;
    std::vector<core::EventBus::SubscriptionId> subscriptions_;
};

} // namespace devmonitor::ui
