#include "bearalarm/alert_state.hpp"
#include <stdexcept>

namespace bearalarm {

Seconds AlertState::active_for(TimePoint now) const {
    if (!is_alerting() || !active_since || now < *active_since) {
        return Seconds(0);
    }
    return std::chrono::duration_cast<Seconds>(now - *active_since);
}

AlertDecision transition(AlertState& state, AlertCondition next, TimePoint now,
                         const ThresholdConfig& config) {
    AlertDecision decision;
    decision.condition = next;

    if (next == AlertCondition::Normal) {
        if (state.condition == AlertCondition::Normal) {
            return decision;
        }
        state = AlertState{};
        decision.call = SinkCall::Stop;
        return decision;
    }

    // Onset, or a change of polarity. Always audible. Only a polarity change
    // drops the snooze; one taken while Normal still covers the repeats.
    if (state.condition != next) {
        if (state.condition != AlertCondition::Normal) {
            state.snoozed_until.reset();
        }
        state.condition = next;
        state.active_since = now;
        state.last_fired_at = now;
        decision.call = SinkCall::Play;
        return decision;
    }

    // Same condition held: repeat once the interval has elapsed, unless snoozed
    if (state.is_snoozed(now)) {
        return decision;
    }
    const Seconds interval(config.alert_interval_seconds);
    if (!state.last_fired_at || now - *state.last_fired_at >= interval) {
        state.last_fired_at = now;
        decision.call = SinkCall::Play;
    }
    return decision;
}

AlertStateMachine::AlertStateMachine(const ThresholdConfig& config)
    : config_(config)
{
}

AlertDecision AlertStateMachine::transition(AlertCondition next, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return bearalarm::transition(state_, next, now, config_);
}

TimePoint AlertStateMachine::snooze(Seconds duration, TimePoint now) {
    if (duration.count() <= 0) {
        throw std::invalid_argument("snooze duration must be positive");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    state_.snoozed_until = now + duration;
    return *state_.snoozed_until;
}

bool AlertStateMachine::cancel_snooze(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool was_active = state_.is_snoozed(now);
    state_.snoozed_until.reset();
    return was_active;
}

AlertState AlertStateMachine::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void AlertStateMachine::restore(const AlertState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
}

} // namespace bearalarm
