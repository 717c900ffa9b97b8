#pragma once

#include "bearalarm/alert_sink.hpp"
#include "bearalarm/config_manager.hpp"
#include "bearalarm/monitor_loop.hpp"
#include "bearalarm/reading_store.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace bearalarm {

struct CommandQueue;

struct ApplicationOptions {
    std::optional<int> startup_delay_minutes;    // Overrides monitoring.startup_delay_minutes
    bool debug = false;
};

// Owns the configuration, the reading store and one monitoring session at a
// time. A config file change or a schedule boundary ends the current session
// and starts a new one that inherits its alert state and snooze.
class Application {
public:
    Application(const std::string& config_path, const ApplicationOptions& options = {});
    ~Application();

    // Load/validate configuration and open the reading store
    bool initialize();

    // Run sessions until stop() or a "quit" command
    void run(bool read_stdin_commands = true);

    // Single poll cycle, for scripted checks
    bool run_once();

    // Print stored readings and statistics for the last `hours`
    void print_history(int hours, std::ostream& out) const;

    void stop();
    bool is_running() const { return running_; }

    // Queue a command for the run() loop, as if typed on stdin
    void submit_command(const std::string& line);

    // "snooze [minutes]", "unsnooze", "status", "quit"; returns false on "quit"
    bool handle_command(const std::string& line, std::ostream& out);

    void print_status(std::ostream& out) const;

    // Thresholds of the current session, after any schedule override
    std::optional<ThresholdConfig> active_thresholds() const;

private:
    BearAlarmConfig config_snapshot() const;
    std::shared_ptr<MonitorLoop> create_session();
    void restart_session(const std::string& reason);
    bool schedule_changed() const;
    std::shared_ptr<MonitorLoop> current_session() const;
    void replace_session(std::shared_ptr<MonitorLoop> session);

    std::string config_path_;
    ApplicationOptions options_;
    ConfigManager config_manager_;
    mutable std::mutex config_mutex_;
    std::shared_ptr<ReadingStore> store_;

    // Reused across sessions while the alert settings stay the same
    std::shared_ptr<AlertSink> sink_;
    AlertConfig sink_settings_;

    // Index into config.schedules, -1 for the default thresholds
    int active_schedule_ = -1;

    mutable std::mutex session_mutex_;
    std::shared_ptr<MonitorLoop> session_;
    bool first_session_ = true;

    // Lines typed on stdin, filled by a detached reader thread
    std::shared_ptr<CommandQueue> commands_;

    std::atomic<bool> running_{false};
};

} // namespace bearalarm
