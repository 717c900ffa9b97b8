#pragma once

#include "bearalarm/config_manager.hpp"
#include "bearalarm/threshold_evaluator.hpp"
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace bearalarm {

// Makes an alert perceptible. Implementations must tolerate repeated play()
// for the same condition and stop() while already silent. Failures throw SinkError.
class AlertSink {
public:
    virtual ~AlertSink() = default;

    virtual void play(AlertCondition condition) = 0;
    virtual void stop() = 0;
};

class NoOpSink : public AlertSink {
public:
    void play(AlertCondition) override {}
    void stop() override {}
};

// Forwards to every child; all children are attempted before a failure is rethrown
class CompositeSink : public AlertSink {
public:
    CompositeSink() = default;
    explicit CompositeSink(std::vector<std::shared_ptr<AlertSink>> sinks);

    void add(std::shared_ptr<AlertSink> sink);
    size_t size() const { return sinks_.size(); }

    void play(AlertCondition condition) override;
    void stop() override;

private:
    std::vector<std::shared_ptr<AlertSink>> sinks_;
};

// Terminal bell plus an optional external player process per alert
class AudioSink : public AlertSink {
public:
    explicit AudioSink(const AlertConfig& config);
    ~AudioSink() override;

    AudioSink(const AudioSink&) = delete;
    AudioSink& operator=(const AudioSink&) = delete;

    void play(AlertCondition condition) override;
    void stop() override;

    bool is_playing();

private:
    void ring_bell();
    void start_player(const std::string& sound_path);
    void terminate_player();
    const std::string& sound_for(AlertCondition condition) const;

    AlertConfig config_;
    AlertCondition playing_ = AlertCondition::Normal;
    long player_pid_ = -1;
};

// Appends alert and resolution lines to the alert log file
class LogFileSink : public AlertSink {
public:
    explicit LogFileSink(const std::string& log_path);
    ~LogFileSink() override;

    void play(AlertCondition condition) override;
    void stop() override;

    bool is_open() const { return log_file_.is_open(); }

private:
    void write_line(const std::string& level, const std::string& message);

    std::string log_path_;
    std::ofstream log_file_;
};

// Factory function
std::unique_ptr<AlertSink> create_alert_sink(const AlertConfig& config);

} // namespace bearalarm
