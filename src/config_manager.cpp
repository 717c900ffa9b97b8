#include "bearalarm/config_manager.hpp"
#include "bearalarm/logging.hpp"
#include "bearalarm/schedule.hpp"
#include <cctype>
#include <fstream>
#include <stdexcept>

// Minimal YAML reader for the bearalarm config format: top-level scalars, one
// level of sections and the "schedules" list. Field declarations in the header
// carry the typiconf schema.
namespace bearalarm {

bool BearAlarmConfig::validate() const {
    if (!thresholds.validate()) {
        return false;
    }
    if (units != "mmol" && units != "mgdl") {
        return false;
    }
    if (monitoring.startup_delay_minutes < 0 ||
        monitoring.fetch_timeout_seconds <= 0 ||
        monitoring.max_consecutive_errors <= 0) {
        return false;
    }
    if (alerts.default_snooze_minutes <= 0 || storage.retention_days < 0) {
        return false;
    }
    std::string schedule_error;
    for (const auto& schedule : schedules) {
        if (!validate_schedule(schedule, thresholds, schedule_error)) {
            return false;
        }
    }
    if (source.type == "file") {
        return !source.path.empty();
    }
    if (source.type == "command") {
        return !source.command.empty();
    }
    return false;
}

ConfigManager::ConfigManager(const std::string& config_path)
    : config_path_(config_path)
    , last_modified_{}
{
}

// Helper function to trim whitespace
static std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

// Strip a trailing "# comment" that is not inside quotes
static std::string strip_comment(const std::string& value) {
    bool quoted = false;
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '"') {
            quoted = !quoted;
        } else if (value[i] == '#' && !quoted) {
            return trim(value.substr(0, i));
        }
    }
    return value;
}

static double parse_double(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        double result = std::stod(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw std::runtime_error("'" + key + "' expects a number, got '" + value + "'");
    }
}

static int parse_int(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        int result = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw std::runtime_error("'" + key + "' expects an integer, got '" + value + "'");
    }
}

// "[0, 1, 2]" or "0,1,2"
static std::vector<int> parse_int_list(const std::string& key, const std::string& value) {
    std::string list = value;
    if (!list.empty() && list.front() == '[' && list.back() == ']') {
        list = list.substr(1, list.size() - 2);
    }

    std::vector<int> result;
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        std::string item = trim(list.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (!item.empty()) {
            result.push_back(parse_int(key, item));
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return result;
}

static bool parse_bool(const std::string& key, const std::string& value) {
    std::string lower = value;
    for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "true" || lower == "yes" || lower == "1") return true;
    if (lower == "false" || lower == "no" || lower == "0") return false;
    throw std::runtime_error("'" + key + "' expects true/false, got '" + value + "'");
}

bool ConfigManager::parse_file(BearAlarmConfig& out) {
    std::ifstream file(config_path_);
    if (!file.is_open()) {
        load_error_ = "Failed to open config file: " + config_path_;
        return false;
    }

    out = BearAlarmConfig{};

    std::string raw;
    std::string current_section;
    int line_number = 0;

    try {
        while (std::getline(file, raw)) {
            ++line_number;
            std::string line = trim(raw);

            // Skip comments and empty lines
            if (line.empty() || line[0] == '#') {
                continue;
            }

            size_t indent = raw.find_first_not_of(" \t");

            // "- name: Sleep" opens a new schedule entry
            if (current_section == "schedules" && indent > 0 && line[0] == '-') {
                out.schedules.emplace_back();
                line = trim(line.substr(1));
                if (line.empty()) {
                    continue;
                }
            }

            size_t colon_pos = line.find(':');
            if (colon_pos == std::string::npos) {
                throw std::runtime_error("expected 'key: value'");
            }

            std::string key = trim(line.substr(0, colon_pos));
            std::string value = strip_comment(trim(line.substr(colon_pos + 1)));

            // Section headers (no indent, no value)
            if (indent == 0 && value.empty()) {
                current_section = key;
                continue;
            }
            if (indent == 0) {
                current_section.clear();
            }

            // Remove quotes from string values
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.length() - 2);
            }

            DebugLogger::log("config ", current_section.empty() ? "" : current_section + ".", key, " = ", value);

            // Top-level keys
            if (current_section.empty()) {
                if (key == "version") out.version = value;
                else if (key == "units") out.units = value;
                else if (key == "debug") out.debug = parse_bool(key, value);
                else Logger::warn("Unknown config key '", key, "' ignored");
            }
            else if (current_section == "thresholds") {
                if (key == "low_threshold") out.thresholds.low_threshold = parse_double(key, value);
                else if (key == "high_threshold") out.thresholds.high_threshold = parse_double(key, value);
                else if (key == "poll_interval_seconds") out.thresholds.poll_interval_seconds = parse_int(key, value);
                else if (key == "alert_interval_seconds") out.thresholds.alert_interval_seconds = parse_int(key, value);
                else Logger::warn("Unknown config key 'thresholds.", key, "' ignored");
            }
            else if (current_section == "monitoring") {
                if (key == "startup_delay_minutes") out.monitoring.startup_delay_minutes = parse_int(key, value);
                else if (key == "fetch_timeout_seconds") out.monitoring.fetch_timeout_seconds = parse_int(key, value);
                else if (key == "max_consecutive_errors") out.monitoring.max_consecutive_errors = parse_int(key, value);
                else Logger::warn("Unknown config key 'monitoring.", key, "' ignored");
            }
            else if (current_section == "alerts") {
                if (key == "enabled") out.alerts.enabled = parse_bool(key, value);
                else if (key == "beep") out.alerts.beep = parse_bool(key, value);
                else if (key == "player_command") out.alerts.player_command = value;
                else if (key == "low_alert_sound") out.alerts.low_alert_sound = value;
                else if (key == "high_alert_sound") out.alerts.high_alert_sound = value;
                else if (key == "default_snooze_minutes") out.alerts.default_snooze_minutes = parse_int(key, value);
                else if (key == "log_to_file") out.alerts.log_to_file = parse_bool(key, value);
                else if (key == "log_path") out.alerts.log_path = value;
                else Logger::warn("Unknown config key 'alerts.", key, "' ignored");
            }
            else if (current_section == "source") {
                if (key == "type") out.source.type = value;
                else if (key == "path") out.source.path = value;
                else if (key == "command") out.source.command = value;
                else Logger::warn("Unknown config key 'source.", key, "' ignored");
            }
            else if (current_section == "schedules") {
                if (out.schedules.empty()) {
                    throw std::runtime_error("schedule settings must follow a '- name:' list item");
                }
                ScheduleConfig& schedule = out.schedules.back();
                if (key == "name") schedule.name = value;
                else if (key == "enabled") schedule.enabled = parse_bool(key, value);
                else if (key == "priority") schedule.priority = parse_int(key, value);
                else if (key == "start_time") schedule.start_time = value;
                else if (key == "end_time") schedule.end_time = value;
                else if (key == "days") schedule.days = parse_int_list(key, value);
                else if (key == "low_threshold") schedule.low_threshold = parse_double(key, value);
                else if (key == "high_threshold") schedule.high_threshold = parse_double(key, value);
                else Logger::warn("Unknown config key 'schedules.", key, "' ignored");
            }
            else if (current_section == "storage") {
                if (key == "journal_path") out.storage.journal_path = value;
                else if (key == "retention_days") out.storage.retention_days = parse_int(key, value);
                else Logger::warn("Unknown config key 'storage.", key, "' ignored");
            }
            else {
                Logger::warn("Unknown config section '", current_section, "' ignored");
            }
        }
    } catch (const std::runtime_error& e) {
        load_error_ = config_path_ + ":" + std::to_string(line_number) + ": " + e.what();
        return false;
    }

    return true;
}

bool ConfigManager::load() {
    load_error_.clear();

    // Store file modification time
    std::error_code ec;
    auto modified = std::filesystem::last_write_time(config_path_, ec);
    if (ec) {
        load_error_ = "Failed to read config file " + config_path_ + ": " + ec.message();
        return false;
    }

    BearAlarmConfig parsed;
    if (!parse_file(parsed)) {
        return false;
    }

    config_ = parsed;
    last_modified_ = modified;
    return true;
}

bool ConfigManager::check_and_reload() {
    std::error_code ec;
    auto current_time = std::filesystem::last_write_time(config_path_, ec);
    if (ec) {
        DebugLogger::log("Error checking config modification: ", ec.message());
        return false;
    }
    if (current_time == last_modified_) {
        return false;
    }

    // Remember the timestamp either way so a bad edit is reported once
    last_modified_ = current_time;

    BearAlarmConfig previous = config_;
    BearAlarmConfig parsed;
    if (!parse_file(parsed)) {
        Logger::warn("Config change ignored: ", load_error_);
        return false;
    }

    config_ = parsed;
    std::string error;
    if (!validate_config(error)) {
        Logger::warn("Config change ignored: ", error);
        config_ = previous;
        return false;
    }
    return true;
}

bool ConfigManager::validate_config(std::string& error_msg) const {
    const auto& t = config_.thresholds;
    if (t.low_threshold <= 0.0) {
        error_msg = "thresholds.low_threshold must be positive";
        return false;
    }
    if (t.low_threshold >= t.high_threshold) {
        error_msg = "thresholds invalid: low_threshold must be less than high_threshold";
        return false;
    }
    if (t.poll_interval_seconds <= 0 || t.alert_interval_seconds <= 0) {
        error_msg = "thresholds invalid: poll and alert intervals must be positive";
        return false;
    }
    if (config_.units != "mmol" && config_.units != "mgdl") {
        error_msg = "units must be 'mmol' or 'mgdl'";
        return false;
    }
    if (config_.monitoring.startup_delay_minutes < 0) {
        error_msg = "monitoring.startup_delay_minutes cannot be negative";
        return false;
    }
    if (config_.monitoring.fetch_timeout_seconds <= 0) {
        error_msg = "monitoring.fetch_timeout_seconds must be positive";
        return false;
    }
    if (config_.monitoring.max_consecutive_errors <= 0) {
        error_msg = "monitoring.max_consecutive_errors must be positive";
        return false;
    }
    if (config_.alerts.default_snooze_minutes <= 0) {
        error_msg = "alerts.default_snooze_minutes must be positive";
        return false;
    }
    if (config_.storage.retention_days < 0) {
        error_msg = "storage.retention_days cannot be negative";
        return false;
    }
    if (config_.source.type == "file" && config_.source.path.empty()) {
        error_msg = "source.path is required for a file source";
        return false;
    }
    if (config_.source.type == "command" && config_.source.command.empty()) {
        error_msg = "source.command is required for a command source";
        return false;
    }
    if (config_.source.type != "file" && config_.source.type != "command") {
        error_msg = "source.type must be 'file' or 'command'";
        return false;
    }
    for (const auto& schedule : config_.schedules) {
        if (!validate_schedule(schedule, t, error_msg)) {
            return false;
        }
    }

    if (!config_.validate()) {
        error_msg = "Configuration validation failed";
        return false;
    }
    return true;
}

} // namespace bearalarm
