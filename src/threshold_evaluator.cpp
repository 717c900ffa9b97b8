#include "bearalarm/threshold_evaluator.hpp"

namespace bearalarm {

AlertCondition classify(double value, const ThresholdConfig& config) {
    if (value <= config.low_threshold) {
        return AlertCondition::Low;
    } else if (value >= config.high_threshold) {
        return AlertCondition::High;
    }
    return AlertCondition::Normal;
}

AlertCondition classify(const Reading& reading, const ThresholdConfig& config) {
    return classify(reading.value, config);
}

std::string condition_name(AlertCondition condition) {
    switch (condition) {
        case AlertCondition::Low:  return "LOW";
        case AlertCondition::High: return "HIGH";
        default:                   return "NORMAL";
    }
}

} // namespace bearalarm
