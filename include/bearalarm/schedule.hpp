#pragma once

#include "bearalarm/clock.hpp"
#include "bearalarm/config_manager.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bearalarm {

// Minutes since midnight for "HH:MM"; nullopt if malformed
std::optional<int> parse_time_of_day(const std::string& text);

// Both ends of the window are inclusive. A window whose end is before its start
// runs overnight and is matched against the current day only.
bool schedule_covers(const ScheduleConfig& schedule, int weekday, int minute_of_day);

// Highest-priority enabled schedule covering the moment, nullptr if none.
// weekday is 0 for Monday. The first listed schedule wins a priority tie.
const ScheduleConfig* active_schedule(const std::vector<ScheduleConfig>& schedules,
                                      int weekday, int minute_of_day);
const ScheduleConfig* active_schedule(const std::vector<ScheduleConfig>& schedules, TimePoint now);

// Thresholds in force under `schedule` (nullptr keeps the defaults)
ThresholdConfig apply_schedule(const ThresholdConfig& defaults, const ScheduleConfig* schedule);

bool validate_schedule(const ScheduleConfig& schedule, const ThresholdConfig& defaults,
                       std::string& error_msg);

} // namespace bearalarm
