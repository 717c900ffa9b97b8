#include <catch2/catch_test_macros.hpp>
#include "bearalarm/alert_state.hpp"
#include "test_support.hpp"
#include <stdexcept>

using bearalarm::AlertCondition;
using bearalarm::AlertState;
using bearalarm::SinkCall;
using std::chrono::seconds;
using test_support::base_time;

namespace {

bearalarm::ThresholdConfig five_minute_repeat() {
    bearalarm::ThresholdConfig config;
    config.low_threshold = 3.9;
    config.high_threshold = 10.0;
    config.poll_interval_seconds = 60;
    config.alert_interval_seconds = 300;
    return config;
}

} // namespace

TEST_CASE("Normal readings never emit", "[alert_state]") {
    AlertState state;
    auto config = five_minute_repeat();

    for (int i = 0; i < 10; ++i) {
        auto decision = bearalarm::transition(state, AlertCondition::Normal, base_time() + seconds(60 * i), config);
        REQUIRE_FALSE(decision.emits());
    }
    REQUIRE(state.condition == AlertCondition::Normal);
    REQUIRE_FALSE(state.active_since);
}

TEST_CASE("Onset plays immediately and records timestamps", "[alert_state]") {
    AlertState state;
    auto config = five_minute_repeat();
    auto now = base_time();

    auto decision = bearalarm::transition(state, AlertCondition::Low, now, config);
    REQUIRE(decision.call == SinkCall::Play);
    REQUIRE(decision.condition == AlertCondition::Low);
    REQUIRE(state.condition == AlertCondition::Low);
    REQUIRE(state.active_since == now);
    REQUIRE(state.last_fired_at == now);
}

TEST_CASE("Held condition repeats only after the alert interval", "[alert_state]") {
    AlertState state;
    auto config = five_minute_repeat();
    auto start = base_time();

    REQUIRE(bearalarm::transition(state, AlertCondition::Low, start, config).call == SinkCall::Play);

    SECTION("Cycles inside the interval are silent") {
        for (int i = 1; i < 5; ++i) {
            auto decision = bearalarm::transition(state, AlertCondition::Low, start + seconds(60 * i), config);
            REQUIRE_FALSE(decision.emits());
        }
        REQUIRE(state.last_fired_at == start);
    }

    SECTION("Exactly one more play once the interval has elapsed") {
        auto decision = bearalarm::transition(state, AlertCondition::Low, start + seconds(300), config);
        REQUIRE(decision.call == SinkCall::Play);
        REQUIRE(state.last_fired_at == start + seconds(300));
        REQUIRE(state.active_since == start);

        decision = bearalarm::transition(state, AlertCondition::Low, start + seconds(360), config);
        REQUIRE_FALSE(decision.emits());
    }
}

TEST_CASE("Snooze suppresses repeats until it expires", "[alert_state]") {
    auto config = five_minute_repeat();
    bearalarm::AlertStateMachine machine(config);
    auto start = base_time();

    REQUIRE(machine.transition(AlertCondition::Low, start).call == SinkCall::Play);
    auto until = machine.snooze(seconds(900), start + seconds(30));
    REQUIRE(until == start + seconds(930));

    // Alert interval elapses several times inside the snooze window
    for (int t = 300; t < 930; t += 300) {
        REQUIRE_FALSE(machine.transition(AlertCondition::Low, start + seconds(t)).emits());
    }

    auto state = machine.snapshot();
    REQUIRE(state.condition == AlertCondition::Low);
    REQUIRE(state.active_since == start);
    REQUIRE(state.active_for(start + seconds(900)) == seconds(900));

    // First qualifying cycle after the snooze ends
    auto decision = machine.transition(AlertCondition::Low, start + seconds(930));
    REQUIRE(decision.call == SinkCall::Play);
    REQUIRE(decision.condition == AlertCondition::Low);
}

TEST_CASE("Polarity change overrides an active snooze", "[alert_state]") {
    bearalarm::AlertStateMachine machine(five_minute_repeat());
    auto start = base_time();

    machine.transition(AlertCondition::Low, start);
    machine.snooze(seconds(3600), start);

    auto decision = machine.transition(AlertCondition::High, start + seconds(60));
    REQUIRE(decision.call == SinkCall::Play);
    REQUIRE(decision.condition == AlertCondition::High);

    auto state = machine.snapshot();
    REQUIRE(state.condition == AlertCondition::High);
    REQUIRE(state.active_since == start + seconds(60));
    REQUIRE(state.last_fired_at == start + seconds(60));
    REQUIRE_FALSE(state.is_snoozed(start + seconds(60)));
}

TEST_CASE("Returning to normal stops once and clears the state", "[alert_state]") {
    bearalarm::AlertStateMachine machine(five_minute_repeat());
    auto start = base_time();

    machine.transition(AlertCondition::High, start);
    machine.snooze(seconds(900), start);

    auto decision = machine.transition(AlertCondition::Normal, start + seconds(120));
    REQUIRE(decision.call == SinkCall::Stop);

    auto state = machine.snapshot();
    REQUIRE(state.condition == AlertCondition::Normal);
    REQUIRE_FALSE(state.active_since);
    REQUIRE_FALSE(state.last_fired_at);
    REQUIRE_FALSE(state.snoozed_until);

    REQUIRE_FALSE(machine.transition(AlertCondition::Normal, start + seconds(180)).emits());
}

TEST_CASE("Snooze never changes the condition", "[alert_state]") {
    bearalarm::AlertStateMachine machine(five_minute_repeat());
    auto start = base_time();

    machine.snooze(seconds(600), start);
    REQUIRE(machine.snapshot().condition == AlertCondition::Normal);

    // Onset is audible even while snoozed
    REQUIRE(machine.transition(AlertCondition::Low, start + seconds(60)).call == SinkCall::Play);

    REQUIRE_THROWS_AS(machine.snooze(seconds(0), start), std::invalid_argument);
}

TEST_CASE("Snooze taken while Normal still silences repeats after onset", "[alert_state]") {
    bearalarm::AlertStateMachine machine(five_minute_repeat());
    auto start = base_time();

    machine.snooze(seconds(1800), start);
    REQUIRE(machine.transition(AlertCondition::Low, start + seconds(60)).call == SinkCall::Play);
    REQUIRE(machine.snapshot().snoozed_until == start + seconds(1800));

    // Alert interval elapsed, snooze still active
    REQUIRE_FALSE(machine.transition(AlertCondition::Low, start + seconds(360)).emits());
    REQUIRE_FALSE(machine.transition(AlertCondition::Low, start + seconds(1500)).emits());

    REQUIRE(machine.transition(AlertCondition::Low, start + seconds(1800)).call == SinkCall::Play);
}

TEST_CASE("restore seeds a machine with an earlier state", "[alert_state]") {
    bearalarm::AlertStateMachine previous(five_minute_repeat());
    auto start = base_time();
    previous.transition(AlertCondition::High, start);
    previous.snooze(seconds(3600), start + seconds(10));

    bearalarm::AlertStateMachine next(five_minute_repeat());
    next.restore(previous.snapshot());

    auto state = next.snapshot();
    REQUIRE(state.condition == AlertCondition::High);
    REQUIRE(state.active_since == start);
    REQUIRE(state.snoozed_until == start + seconds(3610));

    // Held condition, still snoozed: no fresh onset
    REQUIRE_FALSE(next.transition(AlertCondition::High, start + seconds(600)).emits());
}

TEST_CASE("cancel_snooze re-enables repeats", "[alert_state]") {
    bearalarm::AlertStateMachine machine(five_minute_repeat());
    auto start = base_time();

    machine.transition(AlertCondition::Low, start);
    machine.snooze(seconds(900), start);
    REQUIRE(machine.cancel_snooze(start + seconds(100)));
    REQUIRE_FALSE(machine.cancel_snooze(start + seconds(100)));

    REQUIRE(machine.transition(AlertCondition::Low, start + seconds(300)).call == SinkCall::Play);
}
