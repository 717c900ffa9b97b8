#include "bearalarm/schedule.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>

namespace bearalarm {

std::optional<int> parse_time_of_day(const std::string& text) {
    size_t colon = text.find(':');
    if (colon == std::string::npos || colon == 0 || colon > 2 || text.size() - colon != 3) {
        return std::nullopt;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (i != colon && !std::isdigit(static_cast<unsigned char>(text[i]))) {
            return std::nullopt;
        }
    }

    int hours = std::stoi(text.substr(0, colon));
    int minutes = std::stoi(text.substr(colon + 1));
    if (hours > 23 || minutes > 59) {
        return std::nullopt;
    }
    return hours * 60 + minutes;
}

bool schedule_covers(const ScheduleConfig& schedule, int weekday, int minute_of_day) {
    if (!schedule.enabled) {
        return false;
    }
    if (std::find(schedule.days.begin(), schedule.days.end(), weekday) == schedule.days.end()) {
        return false;
    }

    auto start = parse_time_of_day(schedule.start_time);
    auto end = parse_time_of_day(schedule.end_time);
    if (!start || !end) {
        return false;
    }

    if (*start <= *end) {
        return *start <= minute_of_day && minute_of_day <= *end;
    }
    // Overnight, e.g. 23:00 - 07:00
    return minute_of_day >= *start || minute_of_day <= *end;
}

const ScheduleConfig* active_schedule(const std::vector<ScheduleConfig>& schedules,
                                      int weekday, int minute_of_day) {
    const ScheduleConfig* best = nullptr;
    for (const auto& schedule : schedules) {
        if (!schedule_covers(schedule, weekday, minute_of_day)) {
            continue;
        }
        if (!best || schedule.priority > best->priority) {
            best = &schedule;
        }
    }
    return best;
}

const ScheduleConfig* active_schedule(const std::vector<ScheduleConfig>& schedules, TimePoint now) {
    if (schedules.empty()) {
        return nullptr;
    }

    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
#ifdef _WIN32
    localtime_s(&tm, &time_t);
#else
    localtime_r(&time_t, &tm);
#endif

    // tm_wday counts from Sunday
    int weekday = (tm.tm_wday + 6) % 7;
    return active_schedule(schedules, weekday, tm.tm_hour * 60 + tm.tm_min);
}

ThresholdConfig apply_schedule(const ThresholdConfig& defaults, const ScheduleConfig* schedule) {
    ThresholdConfig effective = defaults;
    if (schedule) {
        if (schedule->low_threshold) effective.low_threshold = *schedule->low_threshold;
        if (schedule->high_threshold) effective.high_threshold = *schedule->high_threshold;
    }
    return effective;
}

bool validate_schedule(const ScheduleConfig& schedule, const ThresholdConfig& defaults,
                       std::string& error_msg) {
    const std::string label = "schedule '" + schedule.name + "'";

    if (schedule.name.empty()) {
        error_msg = "every schedule needs a name";
        return false;
    }
    if (schedule.priority < 1) {
        error_msg = label + ": priority must be at least 1";
        return false;
    }
    if (!parse_time_of_day(schedule.start_time) || !parse_time_of_day(schedule.end_time)) {
        error_msg = label + ": start_time and end_time must be HH:MM";
        return false;
    }
    if (schedule.days.empty()) {
        error_msg = label + ": days cannot be empty";
        return false;
    }
    for (int day : schedule.days) {
        if (day < 0 || day > 6) {
            error_msg = label + ": days must be between 0 (Monday) and 6 (Sunday)";
            return false;
        }
    }

    ThresholdConfig effective = apply_schedule(defaults, &schedule);
    if (effective.low_threshold <= 0.0 || effective.low_threshold >= effective.high_threshold) {
        error_msg = label + ": low_threshold must be positive and less than high_threshold";
        return false;
    }
    return true;
}

} // namespace bearalarm
