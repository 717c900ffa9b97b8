#include "bearalarm/application.hpp"
#include "bearalarm/errors.hpp"
#include "bearalarm/logging.hpp"
#include "bearalarm/schedule.hpp"
#include <chrono>
#include <deque>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace bearalarm {

struct CommandQueue {
    std::mutex mutex;
    std::deque<std::string> lines;

    void push(std::string line) {
        std::lock_guard<std::mutex> lock(mutex);
        lines.push_back(std::move(line));
    }

    std::optional<std::string> pop() {
        std::lock_guard<std::mutex> lock(mutex);
        if (lines.empty()) {
            return std::nullopt;
        }
        std::string line = std::move(lines.front());
        lines.pop_front();
        return line;
    }
};

static std::string unit_label(const std::string& units) {
    return units == "mgdl" ? "mg/dL" : "mmol/L";
}

static bool same_alert_settings(const AlertConfig& a, const AlertConfig& b) {
    return a.enabled == b.enabled &&
           a.beep == b.beep &&
           a.player_command == b.player_command &&
           a.low_alert_sound == b.low_alert_sound &&
           a.high_alert_sound == b.high_alert_sound &&
           a.log_to_file == b.log_to_file &&
           a.log_path == b.log_path;
}

static int schedule_index(const BearAlarmConfig& config, TimePoint now) {
    const ScheduleConfig* schedule = active_schedule(config.schedules, now);
    return schedule ? static_cast<int>(schedule - config.schedules.data()) : -1;
}

Application::Application(const std::string& config_path, const ApplicationOptions& options)
    : config_path_(config_path)
    , options_(options)
    , config_manager_(config_path)
    , commands_(std::make_shared<CommandQueue>())
{
}

Application::~Application() {
    auto session = current_session();
    if (session) {
        session->stop();
    }
}

bool Application::initialize() {
    // Load configuration
    if (!config_manager_.load()) {
        Logger::error("Failed to load configuration: ", config_manager_.load_error());
        return false;
    }

    // Validate configuration
    std::string validation_error;
    if (!config_manager_.validate_config(validation_error)) {
        Logger::error("Configuration validation failed: ", validation_error);
        return false;
    }

    const auto& config = config_manager_.get_config();
    DebugLogger::set_enabled(options_.debug || config.debug);

    try {
        store_ = std::make_shared<ReadingStore>(config.storage.journal_path);
    } catch (const PersistenceError& e) {
        Logger::error("Failed to open reading store: ", e.what());
        return false;
    }

    if (config.storage.retention_days > 0) {
        auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(24 * config.storage.retention_days);
        try {
            store_->prune_before(cutoff);
        } catch (const PersistenceError& e) {
            Logger::warn("Failed to prune old readings: ", e.what());
        }
    }

    Logger::info("Configuration loaded from ", config_path_, ", ", store_->size(), " stored readings");
    return true;
}

BearAlarmConfig Application::config_snapshot() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_manager_.get_config();
}

std::shared_ptr<MonitorLoop> Application::create_session() {
    const BearAlarmConfig config = config_snapshot();
    DebugLogger::set_enabled(options_.debug || config.debug);

    MonitorOptions monitor_options = MonitorOptions::from_config(config);
    if (first_session_ && options_.startup_delay_minutes) {
        monitor_options.startup_delay_minutes = *options_.startup_delay_minutes;
    }
    if (!first_session_) {
        monitor_options.startup_delay_minutes = 0;
    }

    if (config.storage.journal_path != store_->journal_path()) {
        Logger::warn("storage.journal_path changes take effect after a restart");
    }

    int schedule = schedule_index(config, std::chrono::system_clock::now());
    ThresholdConfig thresholds = apply_schedule(config.thresholds,
                                                schedule < 0 ? nullptr : &config.schedules[schedule]);

    std::shared_ptr<AlertSink> sink = sink_;
    if (!sink || !same_alert_settings(sink_settings_, config.alerts)) {
        sink = create_alert_sink(config.alerts);
    }

    std::shared_ptr<DataSource> source = create_data_source(config.source);
    auto session = std::make_shared<MonitorLoop>(thresholds, monitor_options, source, store_, sink);

    if (schedule >= 0) {
        Logger::info("Schedule '", config.schedules[schedule].name, "' is active");
    }
    first_session_ = false;
    active_schedule_ = schedule;
    sink_ = sink;
    sink_settings_ = config.alerts;
    return session;
}

void Application::restart_session(const std::string& reason) {
    Logger::info(reason, ", restarting monitoring session");

    std::shared_ptr<MonitorLoop> session;
    try {
        session = create_session();
    } catch (const Error& e) {
        Logger::error("Cannot start new session, keeping the current one: ", e.what());
        return;
    }

    // The alert and any snooze carry over to the new session
    auto previous = current_session();
    if (previous) {
        previous->stop();
        session->restore_alert_state(previous->alert_state());
    }
    replace_session(session);
    session->start();
}

bool Application::schedule_changed() const {
    return schedule_index(config_snapshot(), std::chrono::system_clock::now()) != active_schedule_;
}

std::shared_ptr<MonitorLoop> Application::current_session() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_;
}

void Application::replace_session(std::shared_ptr<MonitorLoop> session) {
    std::shared_ptr<MonitorLoop> previous;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        previous = std::move(session_);
        session_ = std::move(session);
    }
    if (previous) {
        previous->stop();
    }
}

void Application::run(bool read_stdin_commands) {
    if (!store_) {
        Logger::error("Application not initialized. Call initialize() first.");
        return;
    }

    running_ = true;
    replace_session(create_session());
    current_session()->start();

    if (read_stdin_commands) {
        Logger::info("Commands: snooze [minutes], unsnooze, status, quit");
        auto queue = commands_;
        std::thread([queue]() {
            std::string line;
            while (std::getline(std::cin, line)) {
                queue->push(line);
            }
        }).detach();
    }

    auto last_reload_check = std::chrono::steady_clock::now();
    while (running_) {
        while (auto line = commands_->pop()) {
            if (!handle_command(*line, std::cout)) {
                running_ = false;
                break;
            }
        }
        if (!running_) {
            break;
        }

        // Hot-reload configuration and follow schedule boundaries between sessions
        auto now = std::chrono::steady_clock::now();
        if (now - last_reload_check >= std::chrono::seconds(2)) {
            last_reload_check = now;
            bool reloaded = false;
            {
                std::lock_guard<std::mutex> lock(config_mutex_);
                reloaded = config_manager_.check_and_reload();
            }
            if (reloaded) {
                restart_session("Configuration changed");
            } else if (schedule_changed()) {
                restart_session("Threshold schedule changed");
            }
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    replace_session(nullptr);
}

bool Application::run_once() {
    if (!store_) {
        Logger::error("Application not initialized. Call initialize() first.");
        return false;
    }

    auto session = create_session();
    replace_session(session);
    return session->run_cycle() == CycleOutcome::Evaluated;
}

void Application::stop() {
    running_ = false;
}

void Application::submit_command(const std::string& line) {
    commands_->push(line);
}

std::optional<ThresholdConfig> Application::active_thresholds() const {
    auto session = current_session();
    if (!session) {
        return std::nullopt;
    }
    return session->config();
}

bool Application::handle_command(const std::string& line, std::ostream& out) {
    std::istringstream iss(line);
    std::string command;
    iss >> command;

    if (command.empty()) {
        return true;
    }
    if (command == "quit" || command == "exit") {
        return false;
    }
    if (command == "help") {
        out << "Commands: snooze [minutes], unsnooze, status, quit\n";
        return true;
    }

    auto session = current_session();
    if (!session) {
        out << "Monitor is not running\n";
        return true;
    }

    if (command == "snooze") {
        int minutes = config_snapshot().alerts.default_snooze_minutes;
        std::string arg;
        if (iss >> arg) {
            try {
                minutes = std::stoi(arg);
            } catch (const std::logic_error&) {
                minutes = 0;
            }
        }
        if (minutes <= 0) {
            out << "Snooze needs a positive number of minutes\n";
            return true;
        }
        TimePoint until = session->snooze(std::chrono::minutes(minutes));
        out << "Alerts snoozed for " << minutes << " minute(s), until " << format_timestamp(until) << "\n";
    } else if (command == "unsnooze") {
        out << (session->cancel_snooze() ? "Snooze cancelled\n" : "No active snooze\n");
    } else if (command == "status") {
        print_status(out);
    } else {
        out << "Unknown command '" << command << "'. Type 'help' for a list.\n";
    }
    return true;
}

void Application::print_status(std::ostream& out) const {
    auto session = current_session();
    if (!session) {
        out << "Monitor is not running\n";
        return;
    }

    const std::string units = unit_label(config_snapshot().units);
    const TimePoint now = std::chrono::system_clock::now();
    AlertState state = session->alert_state();
    MonitorStats stats = session->stats();

    out << std::fixed << std::setprecision(1);
    if (auto reading = session->last_reading()) {
        out << "Last reading: " << reading->value << " " << units << " " << trend_arrow(reading->trend)
            << " at " << format_timestamp(reading->timestamp) << "\n";
    } else {
        out << "Last reading: none yet\n";
    }

    out << "Alert: " << condition_name(state.condition);
    if (state.is_alerting()) {
        out << " for " << state.active_for(now).count() / 60 << " min";
    }
    out << "\n";
    if (state.is_snoozed(now)) {
        out << "Snoozed until " << format_timestamp(*state.snoozed_until) << "\n";
    }

    out << "Cycles: " << stats.cycles
        << ", stored: " << stats.readings_stored
        << ", duplicates: " << stats.duplicates_skipped
        << ", fetch errors: " << stats.fetch_failures
        << ", storage errors: " << stats.persistence_failures
        << ", sink errors: " << stats.sink_failures << "\n";
    if (!stats.last_error.empty()) {
        out << "Last error: " << stats.last_error << "\n";
    }
}

void Application::print_history(int hours, std::ostream& out) const {
    if (!store_) {
        out << "No reading store\n";
        return;
    }

    const BearAlarmConfig config = config_snapshot();
    const std::string units = unit_label(config.units);
    TimePoint since = std::chrono::system_clock::now() - std::chrono::hours(hours);

    out << std::fixed << std::setprecision(1);
    for (const auto& r : store_->query(since)) {
        out << format_timestamp(r.timestamp) << "  " << std::setw(5) << r.value << " " << units
            << " " << trend_arrow(r.trend) << "  " << condition_name(classify(r, config.thresholds)) << "\n";
    }

    ReadingStats stats = store_->stats(since, config.thresholds);
    if (stats.count == 0) {
        out << "No readings in the last " << hours << " hour(s)\n";
        return;
    }
    out << "Readings: " << stats.count
        << "  min " << stats.min << "  max " << stats.max << "  avg " << stats.average
        << "  time in range " << stats.time_in_range_percent << "%\n";
}

} // namespace bearalarm
