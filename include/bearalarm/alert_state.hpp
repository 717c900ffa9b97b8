#pragma once

#include "bearalarm/clock.hpp"
#include "bearalarm/config_manager.hpp"
#include "bearalarm/threshold_evaluator.hpp"
#include <mutex>
#include <optional>

namespace bearalarm {

struct AlertState {
    AlertCondition condition = AlertCondition::Normal;
    std::optional<TimePoint> active_since;
    std::optional<TimePoint> last_fired_at;
    std::optional<TimePoint> snoozed_until;

    bool is_alerting() const { return condition != AlertCondition::Normal; }
    bool is_snoozed(TimePoint now) const { return snoozed_until && *snoozed_until > now; }

    // How long the current alert has been active; zero when Normal
    Seconds active_for(TimePoint now) const;
};

enum class SinkCall {
    None,
    Play,
    Stop
};

// What the sink must do after a transition
struct AlertDecision {
    SinkCall call = SinkCall::None;
    AlertCondition condition = AlertCondition::Normal;

    bool emits() const { return call != SinkCall::None; }
};

// Applies one classification to the state. At most one sink call results.
AlertDecision transition(AlertState& state, AlertCondition next, TimePoint now,
                         const ThresholdConfig& config);

// Serializes transitions with snooze requests coming from other threads
class AlertStateMachine {
public:
    explicit AlertStateMachine(const ThresholdConfig& config);

    AlertDecision transition(AlertCondition next, TimePoint now);

    // Suppress repeat emissions until now + duration. Throws std::invalid_argument
    // for a non-positive duration.
    TimePoint snooze(Seconds duration, TimePoint now);

    // Returns true if a snooze was active
    bool cancel_snooze(TimePoint now);

    AlertState snapshot() const;

    // Replace the state, e.g. to carry an alert into a restarted session
    void restore(const AlertState& state);

private:
    ThresholdConfig config_;
    AlertState state_;
    mutable std::mutex mutex_;
};

} // namespace bearalarm
