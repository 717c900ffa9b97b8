#include "bearalarm/application.hpp"
#include "bearalarm/errors.hpp"
#include "bearalarm/logging.hpp"
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

// Global pointer for signal handler
bearalarm::Application* g_app = nullptr;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_app) {
            g_app->stop();
        }
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] [config_file]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  config_file          Path to YAML configuration file (default: config/bearalarm.yaml)\n";
    std::cout << "  -d, --delay MINUTES  Wait before the first check (overrides monitoring.startup_delay_minutes)\n";
    std::cout << "  --history HOURS      Print stored readings and statistics, then exit\n";
    std::cout << "  --once               Run a single check, then exit\n";
    std::cout << "  --debug              Enable debug logging\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "\n";
    std::cout << "While running, type: snooze [minutes], unsnooze, status, quit\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << "\n";
    std::cout << "  " << program_name << " --delay 30 config/night.yaml\n";
    std::cout << "  " << program_name << " --history 24\n";
    std::cout << "\n";
}

static bool parse_non_negative(const std::string& text, int& out) {
    try {
        size_t used = 0;
        out = std::stoi(text, &used);
        return used == text.size() && out >= 0;
    } catch (const std::logic_error&) {
        return false;
    }
}

int main(int argc, char* argv[]) {
    // Parse command-line arguments
    std::string config_path = "config/bearalarm.yaml";
    bearalarm::ApplicationOptions options;
    int history_hours = -1;
    bool once = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-d" || arg == "--delay") {
            int minutes = 0;
            if (i + 1 >= argc || !parse_non_negative(argv[i + 1], minutes)) {
                std::cerr << arg << " expects a non-negative number of minutes\n";
                return 1;
            }
            options.startup_delay_minutes = minutes;
            ++i;
        } else if (arg == "--history") {
            if (i + 1 >= argc || !parse_non_negative(argv[i + 1], history_hours) || history_hours == 0) {
                std::cerr << "--history expects a positive number of hours\n";
                return 1;
            }
            ++i;
        } else if (arg == "--once") {
            once = true;
        } else if (arg == "--debug") {
            options.debug = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            config_path = arg;
        }
    }

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto app = std::make_unique<bearalarm::Application>(config_path, options);
    g_app = app.get();

    if (!app->initialize()) {
        std::cerr << "Failed to initialize Bear Alarm\n";
        return 1;
    }

    try {
        if (history_hours > 0) {
            app->print_history(history_hours, std::cout);
            return 0;
        }
        if (once) {
            return app->run_once() ? 0 : 2;
        }

        // Run monitoring until Ctrl+C or "quit"
        app->run();
    } catch (const bearalarm::Error& e) {
        bearalarm::Logger::error("Failed to start monitoring: ", e.what());
        g_app = nullptr;
        return 1;
    }

    g_app = nullptr;
    std::cout << "Bear Alarm stopped.\n";
    return 0;
}
