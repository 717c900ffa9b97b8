#include <catch2/catch_test_macros.hpp>
#include "bearalarm/alert_sink.hpp"
#include "bearalarm/errors.hpp"
#include "test_support.hpp"
#include <fstream>
#include <sstream>

using bearalarm::AlertCondition;
using test_support::RecordingSink;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bearalarm::AlertConfig quiet_config() {
    bearalarm::AlertConfig config;
    config.beep = false;
    config.player_command.clear();
    config.log_to_file = false;
    return config;
}

} // namespace

TEST_CASE("CompositeSink forwards to every child", "[sink]") {
    auto first = std::make_shared<RecordingSink>();
    auto second = std::make_shared<RecordingSink>();
    bearalarm::CompositeSink composite({first, second});

    composite.play(AlertCondition::High);
    composite.stop();

    REQUIRE(first->play_count() == 1);
    REQUIRE(second->play_count() == 1);
    REQUIRE(first->stop_count() == 1);
    REQUIRE(second->calls()[0].condition == AlertCondition::High);
}

TEST_CASE("CompositeSink attempts all children before reporting failure", "[sink]") {
    auto failing = std::make_shared<RecordingSink>();
    auto healthy = std::make_shared<RecordingSink>();
    failing->set_failing(true);

    bearalarm::CompositeSink composite;
    composite.add(failing);
    composite.add(healthy);
    composite.add(nullptr);
    REQUIRE(composite.size() == 2);

    REQUIRE_THROWS_AS(composite.play(AlertCondition::Low), bearalarm::SinkError);
    REQUIRE(healthy->play_count() == 1);
}

TEST_CASE("LogFileSink appends alert and resolution lines", "[sink]") {
    test_support::TempPath path("alerts.log");
    {
        bearalarm::LogFileSink sink(path.str());
        REQUIRE(sink.is_open());
        sink.play(AlertCondition::Low);
        sink.stop();
    }
    {
        bearalarm::LogFileSink sink(path.str());
        sink.play(AlertCondition::High);
    }

    std::string content = read_file(path.str());
    REQUIRE(content.find("ALERT - LOW glucose alert") != std::string::npos);
    REQUIRE(content.find("RESOLVED - glucose back in range") != std::string::npos);
    REQUIRE(content.find("ALERT - HIGH glucose alert") != std::string::npos);
}

TEST_CASE("AudioSink without a player tolerates repeated calls", "[sink]") {
    bearalarm::AudioSink sink(quiet_config());

    REQUIRE_NOTHROW(sink.play(AlertCondition::Low));
    REQUIRE_NOTHROW(sink.play(AlertCondition::Low));
    REQUIRE_NOTHROW(sink.stop());
    REQUIRE_NOTHROW(sink.stop());
    REQUIRE_FALSE(sink.is_playing());
}

#ifndef _WIN32
TEST_CASE("AudioSink runs the player and stops it", "[sink]") {
    test_support::TempPath sound("low.wav");
    std::ofstream(sound.str()) << "RIFF";

    auto config = quiet_config();
    config.player_command = "tail -f";
    config.low_alert_sound = sound.str();

    bearalarm::AudioSink sink(config);
    sink.play(AlertCondition::Low);
    REQUIRE(sink.is_playing());

    // Same condition while playing leaves the player alone
    sink.play(AlertCondition::Low);
    REQUIRE(sink.is_playing());

    sink.stop();
    REQUIRE_FALSE(sink.is_playing());
}

TEST_CASE("AudioSink passes sound paths with shell characters intact", "[sink]") {
    test_support::TempPath sound("it's $(low) alarm.wav");
    std::ofstream(sound.str()) << "RIFF";

    auto config = quiet_config();
    config.player_command = "tail -f";
    config.low_alert_sound = sound.str();

    bearalarm::AudioSink sink(config);
    sink.play(AlertCondition::Low);

    // tail only keeps running if it opened the file under its exact name
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    REQUIRE(sink.is_playing());
    sink.stop();
}

TEST_CASE("AudioSink reports a missing sound file", "[sink]") {
    auto config = quiet_config();
    config.player_command = "true";
    config.high_alert_sound = "/nonexistent/high.wav";

    bearalarm::AudioSink sink(config);
    REQUIRE_THROWS_AS(sink.play(AlertCondition::High), bearalarm::SinkError);
}
#endif

TEST_CASE("create_alert_sink honours the alert settings", "[sink]") {
    auto config = quiet_config();

    config.enabled = false;
    REQUIRE(dynamic_cast<bearalarm::NoOpSink*>(bearalarm::create_alert_sink(config).get()));

    config.enabled = true;
    auto audio_only = bearalarm::create_alert_sink(config);
    auto* composite = dynamic_cast<bearalarm::CompositeSink*>(audio_only.get());
    REQUIRE(composite);
    REQUIRE(composite->size() == 1);

    test_support::TempPath log("factory.log");
    config.log_to_file = true;
    config.log_path = log.str();
    auto with_log = bearalarm::create_alert_sink(config);
    REQUIRE(dynamic_cast<bearalarm::CompositeSink*>(with_log.get())->size() == 2);
}
