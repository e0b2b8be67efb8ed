#include "app/Application.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <string>

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config-dir DIR] [--debug] [--headless]\n"
              << "  --config-dir DIR  Application directory (default: ~/.dev_monitor)\n"
              << "  --debug           Enable debug logging\n"
              << "  --headless        Run without the console, stop on SIGINT/SIGTERM\n";
}

} // namespace

int main(int argc, char* argv[]) {
    devmonitor::app::Options options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--debug") {
            options.debug = true;
        } else if (arg == "--headless") {
            options.headless = true;
        } else if (arg == "--config-dir" && i + 1 < argc) {
            options.configDir = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    try {
        devmonitor::app::Application app(options);
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
