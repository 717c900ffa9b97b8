#include "bearalarm/alert_sink.hpp"
#include "bearalarm/errors.hpp"
#include "bearalarm/logging.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <csignal>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace bearalarm {

CompositeSink::CompositeSink(std::vector<std::shared_ptr<AlertSink>> sinks)
    : sinks_(std::move(sinks))
{
}

void CompositeSink::add(std::shared_ptr<AlertSink> sink) {
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void CompositeSink::play(AlertCondition condition) {
    std::string failures;
    for (auto& sink : sinks_) {
        try {
            sink->play(condition);
        } catch (const SinkError& e) {
            if (!failures.empty()) failures += "; ";
            failures += e.what();
        }
    }
    if (!failures.empty()) {
        throw SinkError(failures);
    }
}

void CompositeSink::stop() {
    std::string failures;
    for (auto& sink : sinks_) {
        try {
            sink->stop();
        } catch (const SinkError& e) {
            if (!failures.empty()) failures += "; ";
            failures += e.what();
        }
    }
    if (!failures.empty()) {
        throw SinkError(failures);
    }
}

AudioSink::AudioSink(const AlertConfig& config)
    : config_(config)
{
}

AudioSink::~AudioSink() {
    terminate_player();
}

const std::string& AudioSink::sound_for(AlertCondition condition) const {
    return condition == AlertCondition::Low ? config_.low_alert_sound : config_.high_alert_sound;
}

void AudioSink::ring_bell() {
#ifdef _WIN32
    ::Beep(750, 300);
#else
    // Unix terminal bell
    std::cout << "\a" << std::flush;
#endif
}

bool AudioSink::is_playing() {
#ifndef _WIN32
    if (player_pid_ > 0) {
        int status = 0;
        pid_t result = ::waitpid(static_cast<pid_t>(player_pid_), &status, WNOHANG);
        if (result == static_cast<pid_t>(player_pid_) || result == -1) {
            player_pid_ = -1;
        }
    }
#endif
    return player_pid_ > 0;
}

// "paplay --volume 65536" -> {"paplay", "--volume", "65536"}
static std::vector<std::string> split_command(const std::string& command) {
    std::vector<std::string> words;
    std::istringstream iss(command);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

void AudioSink::start_player(const std::string& sound_path) {
#ifdef _WIN32
    (void)sound_path;
    throw SinkError("external player is not supported on this platform");
#else
    // The sound path is passed as its own argument, never through a shell
    std::vector<std::string> words = split_command(config_.player_command);
    words.push_back(sound_path);
    std::vector<char*> argv;
    for (auto& word : words) {
        argv.push_back(&word[0]);
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw SinkError(std::string("failed to start player: ") + std::strerror(errno));
    }
    if (pid == 0) {
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }
    player_pid_ = pid;
    DebugLogger::log("player started (pid ", pid, "): ", config_.player_command, " ", sound_path);
#endif
}

void AudioSink::terminate_player() {
#ifndef _WIN32
    if (player_pid_ > 0) {
        ::kill(static_cast<pid_t>(player_pid_), SIGTERM);
        int status = 0;
        ::waitpid(static_cast<pid_t>(player_pid_), &status, 0);
        DebugLogger::log("player stopped (pid ", player_pid_, ")");
    }
#endif
    player_pid_ = -1;
}

void AudioSink::play(AlertCondition condition) {
    if (condition == AlertCondition::Normal) {
        stop();
        return;
    }

    if (config_.beep) {
        ring_bell();
    }
    if (split_command(config_.player_command).empty()) {
        playing_ = condition;
        return;
    }

    // Same alert still sounding
    if (playing_ == condition && is_playing()) {
        return;
    }

    const std::string& sound = sound_for(condition);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(sound, ec)) {
        throw SinkError("alert sound file not found: " + sound);
    }

    terminate_player();
    start_player(sound);
    playing_ = condition;
}

void AudioSink::stop() {
    terminate_player();
    playing_ = AlertCondition::Normal;
}

LogFileSink::LogFileSink(const std::string& log_path)
    : log_path_(log_path)
{
    log_file_.open(log_path_, std::ios::app);
    if (!log_file_.is_open()) {
        Logger::warn("Failed to open alert log file: ", log_path_);
    }
}

LogFileSink::~LogFileSink() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void LogFileSink::write_line(const std::string& level, const std::string& message) {
    if (!log_file_.is_open()) {
        return;
    }

    log_file_ << "[" << log_timestamp() << "] " << level << " - " << message << "\n";
    log_file_.flush();
    if (!log_file_) {
        log_file_.clear();
        throw SinkError("failed to write alert log " + log_path_);
    }
}

void LogFileSink::play(AlertCondition condition) {
    write_line("ALERT", condition_name(condition) + " glucose alert");
}

void LogFileSink::stop() {
    write_line("RESOLVED", "glucose back in range, alert silenced");
}

std::unique_ptr<AlertSink> create_alert_sink(const AlertConfig& config) {
    if (!config.enabled) {
        return std::make_unique<NoOpSink>();
    }

    auto composite = std::make_unique<CompositeSink>();
    composite->add(std::make_shared<AudioSink>(config));
    if (config.log_to_file) {
        composite->add(std::make_shared<LogFileSink>(config.log_path));
    }
    return composite;
}

} // namespace bearalarm
