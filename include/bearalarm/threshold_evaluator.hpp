#pragma once

#include "bearalarm/config_manager.hpp"
#include "bearalarm/data_source.hpp"
#include <string>

namespace bearalarm {

enum class AlertCondition {
    Normal,
    Low,
    High
};

// Boundaries belong to the alert: value <= low is Low, value >= high is High.
// Trend is not considered.
AlertCondition classify(const Reading& reading, const ThresholdConfig& config);
AlertCondition classify(double value, const ThresholdConfig& config);

std::string condition_name(AlertCondition condition);

} // namespace bearalarm
