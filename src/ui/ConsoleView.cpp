#include "ui/ConsoleView.hpp"

#include "core/bus/Topics.hpp"
#include "core/types/CheckResult.hpp"
#include "core/types/Device.hpp"
#include "core/types/Timestamp.hpp"

#include <spdlog/fmt/fmt.h>

#include <istream>
#include <ostream>
#include <sstream>

namespace devmonitor::ui {

namespace {

const char* COMMAND_TOPICS[] = {
    core::topics::ADD_DEVICE,     core::topics::REMOVE_DEVICE,     core::topics::ENABLE_DEVICE,
    core::topics::DISABLE_DEVICE, core::topics::CHECK_ALL_DEVICES, core::topics::GET_DEVICES,
};

std::string describe(const core::Device& device) {
    std::string lastChecked =
        device.lastCheckedAt ? core::formatTimestamp(*device.lastCheckedAt) : "never";
    return fmt::format("{}  {:<20} {:<28} {:<8} {:<8} last checked: {}", device.id, device.name,
                       device.endpoint(), device.statusToString(),
                       device.enabled ? "enabled" : "disabled", lastChecked);
}

} // namespace

ConsoleView::ConsoleView(core::EventBus& bus, std::ostream& out, int defaultTimeoutSeconds)
    : bus_(bus), out_(out), defaultTimeoutSeconds_(defaultTimeoutSeconds) {
    auto renderer = [this](const core::Event& e) { render(e); };

    for (const char* topic :
         {core::topics::DEVICE_ADDED, core::topics::DEVICE_REMOVED, core::topics::DEVICE_UPDATED,
          core::topics::DEVICES_CHECKED, core::topics::DEVICES_LISTED, core::topics::HANDLER_ERROR}) {
        subscriptions_.push_back(bus_.subscribe(topic, renderer));
    }
    for (const char* command : COMMAND_TOPICS) {
        subscriptions_.push_back(bus_.subscribe(core::topics::errorTopic(command), renderer));
    }
}

ConsoleView::~ConsoleView() {
    for (auto id : subscriptions_) {
        bus_.unsubscribe(id);
    }
}

void ConsoleView::run(std::istream& in) {
    printHelp();

    std::string line;
    while (std::getline(in, line)) {
        if (!handleLine(line)) {
            break;
        }
    }
}

bool ConsoleView::handleLine(const std::string& line) {
    std::istringstream iss(line);
    std::string command;
    if (!(iss >> command)) {
        return true;
    }

    if (command == "quit" || command == "exit") {
        return false;
    }

    if (command == "help") {
        printHelp();
    } else if (command == "add") {
        core::DeviceSpec spec;
        std::string port;
        std::string timeout;
        iss >> spec.name >> spec.host >> port >> timeout;
        try {
            spec.port = std::stoi(port);
            spec.timeoutSeconds = timeout.empty() ? defaultTimeoutSeconds_ : std::stoi(timeout);
        } catch (const std::exception&) {
            std::lock_guard lock(outMutex_);
            out_ << "usage: add <name> <host> <port> [timeout]" << std::endl;
            return true;
        }
        bus_.publish(core::topics::ADD_DEVICE, spec);
    } else if (command == "remove" || command == "enable" || command == "disable") {
        std::string id;
        if (!(iss >> id)) {
            std::lock_guard lock(outMutex_);
            out_ << "usage: " << command << " <id>" << std::endl;
            return true;
        }
        const char* topic = command == "remove"   ? core::topics::REMOVE_DEVICE
                            : command == "enable" ? core::topics::ENABLE_DEVICE
                                                  : core::topics::DISABLE_DEVICE;
        bus_.publish(topic, id);
    } else if (command == "check") {
        bus_.publish(core::topics::CHECK_ALL_DEVICES);
    } else if (command == "list") {
        bus_.publish(core::topics::GET_DEVICES);
    } else {
        std::lock_guard lock(outMutex_);
        out_ << "Unknown command: " << command << " (type 'help')" << std::endl;
    }
    return true;
}

void ConsoleView::render(const core::Event& event) {
    std::ostringstream text;

    if (event.topic == core::topics::DEVICE_ADDED) {
        text << "Added:   " << describe(std::any_cast<const core::Device&>(event.payload));
    } else if (event.topic == core::topics::DEVICE_UPDATED) {
        text << "Updated: " << describe(std::any_cast<const core::Device&>(event.payload));
    } else if (event.topic == core::topics::DEVICE_REMOVED) {
        text << "Removed: " << std::any_cast<const std::string&>(event.payload);
    } else if (event.topic == core::topics::DEVICES_LISTED) {
        const auto& devices = std::any_cast<const std::vector<core::Device>&>(event.payload);
        text << devices.size() << " device(s)";
        for (const auto& device : devices) {
            text << "\n  " << describe(device);
        }
    } else if (event.topic == core::topics::DEVICES_CHECKED) {
        const auto& results = std::any_cast<const std::vector<core::CheckResult>&>(event.payload);
        text << "Checked " << results.size() << " device(s) at " << core::formatTimestamp(event.publishedAt);
        for (const auto& result : results) {
            text << "\n  " << result.deviceId << "  "
                 << (result.reachable ? "Online " : "Offline") << "  "
                 << fmt::format("{:.3f}s", result.durationSeconds());
            if (result.error) {
                text << "  " << *result.error;
            }
        }
    } else if (event.topic == core::topics::HANDLER_ERROR) {
        const auto& error = std::any_cast<const core::HandlerErrorEvent&>(event.payload);
        text << "Subscriber for '" << error.topic << "' failed: " << error.message;
    } else {
        const auto& error = std::any_cast<const core::ErrorEvent&>(event.payload);
        text << event.topic << ": " << core::errorKindToString(error.kind) << ": " << error.message;
    }

    std::lock_guard lock(outMutex_);
    out_ << text.str() << std::endl;
}

void ConsoleView::printHelp() {
    std::lock_guard lock(outMutex_);
    out_ << "Commands:\n"
         << "  add <name> <host> <port> [timeout]\n"
         << "  remove <id> | enable <id> | disable <id>\n"
         << "  check | list | help | quit" << std::endl;
}

} // namespace devmonitor::ui
