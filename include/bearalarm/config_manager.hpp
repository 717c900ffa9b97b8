#pragma once

#include <typiconf/typiconf.hpp>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace bearalarm {

// Thresholds and cadence of one monitoring session
struct ThresholdConfig {
    double low_threshold = 3.9;
    double high_threshold = 10.0;
    int poll_interval_seconds = 300;
    int alert_interval_seconds = 300;

    bool validate() const {
        return low_threshold > 0.0 &&
               low_threshold < high_threshold &&
               poll_interval_seconds > 0 &&
               alert_interval_seconds > 0;
    }

    TYPICONF_DEFINE_FIELDS(ThresholdConfig,
        TYPICONF_FIELD(low_threshold),
        TYPICONF_FIELD(high_threshold),
        TYPICONF_FIELD(poll_interval_seconds),
        TYPICONF_FIELD(alert_interval_seconds)
    )
};

struct MonitoringConfig {
    int startup_delay_minutes = 0;
    int fetch_timeout_seconds = 10;
    int max_consecutive_errors = 5;

    TYPICONF_DEFINE_FIELDS(MonitoringConfig,
        TYPICONF_FIELD(startup_delay_minutes),
        TYPICONF_FIELD(fetch_timeout_seconds),
        TYPICONF_FIELD(max_consecutive_errors)
    )
};

struct AlertConfig {
    bool enabled = true;
    bool beep = true;
    std::string player_command;              // e.g. "paplay"; empty disables playback
    std::string low_alert_sound = "sounds/low.wav";
    std::string high_alert_sound = "sounds/high.wav";
    int default_snooze_minutes = 15;
    bool log_to_file = true;
    std::string log_path = "./bearalarm.log";

    TYPICONF_DEFINE_FIELDS(AlertConfig,
        TYPICONF_FIELD(enabled),
        TYPICONF_FIELD(beep),
        TYPICONF_FIELD(player_command),
        TYPICONF_FIELD(low_alert_sound),
        TYPICONF_FIELD(high_alert_sound),
        TYPICONF_FIELD(default_snooze_minutes),
        TYPICONF_FIELD(log_to_file),
        TYPICONF_FIELD(log_path)
    )
};

struct SourceConfig {
    std::string type = "file";               // "file" or "command"
    std::string path = "./latest_reading.csv";
    std::string command;

    TYPICONF_DEFINE_FIELDS(SourceConfig,
        TYPICONF_FIELD(type),
        TYPICONF_FIELD(path),
        TYPICONF_FIELD(command)
    )
};

struct StorageConfig {
    std::string journal_path = "./readings.csv";   // Empty keeps history in memory only
    int retention_days = 90;                        // 0 keeps everything

    TYPICONF_DEFINE_FIELDS(StorageConfig,
        TYPICONF_FIELD(journal_path),
        TYPICONF_FIELD(retention_days)
    )
};

// Replaces the default thresholds during a daily window on the listed days
struct ScheduleConfig {
    std::string name;
    bool enabled = true;
    int priority = 1;                        // Higher wins when windows overlap
    std::string start_time = "09:00";        // HH:MM local time
    std::string end_time = "17:00";          // Before start_time: window spans midnight
    std::vector<int> days = {0, 1, 2, 3, 4}; // 0 = Monday
    std::optional<double> low_threshold;     // Unset keeps the default
    std::optional<double> high_threshold;

    TYPICONF_DEFINE_FIELDS(ScheduleConfig,
        TYPICONF_FIELD(name),
        TYPICONF_FIELD(enabled),
        TYPICONF_FIELD(priority),
        TYPICONF_FIELD(start_time),
        TYPICONF_FIELD(end_time),
        TYPICONF_FIELD(days),
        TYPICONF_FIELD(low_threshold),
        TYPICONF_FIELD(high_threshold)
    )
};

struct BearAlarmConfig {
    std::string version = "1.0";
    std::string units = "mmol";              // "mmol" or "mgdl"
    bool debug = false;
    ThresholdConfig thresholds;
    MonitoringConfig monitoring;
    AlertConfig alerts;
    SourceConfig source;
    StorageConfig storage;
    std::vector<ScheduleConfig> schedules;

    bool validate() const;

    TYPICONF_DEFINE_FIELDS(BearAlarmConfig,
        TYPICONF_FIELD(version),
        TYPICONF_FIELD(units),
        TYPICONF_FIELD(debug),
        TYPICONF_FIELD(thresholds),
        TYPICONF_FIELD(monitoring),
        TYPICONF_FIELD(alerts),
        TYPICONF_FIELD(source),
        TYPICONF_FIELD(storage),
        TYPICONF_FIELD(schedules)
    )
};

class ConfigManager {
public:
    explicit ConfigManager(const std::string& config_path);

    // Load configuration
    bool load();

    // Reload if file changed (hot-reload). Only returns true for a file that loads and validates.
    bool check_and_reload();

    // Access configuration
    const BearAlarmConfig& get_config() const { return config_; }
    const std::string& path() const { return config_path_; }

    // Validation
    bool validate_config(std::string& error_msg) const;

    // Why the last load() failed
    const std::string& load_error() const { return load_error_; }

private:
    bool parse_file(BearAlarmConfig& out);

    std::string config_path_;
    BearAlarmConfig config_;
    std::filesystem::file_time_type last_modified_;
    std::string load_error_;
};

} // namespace bearalarm
