#pragma once

#include "bearalarm/alert_sink.hpp"
#include "bearalarm/clock.hpp"
#include "bearalarm/data_source.hpp"
#include "bearalarm/errors.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace test_support {

using bearalarm::AlertCondition;
using bearalarm::Reading;
using bearalarm::TimePoint;

// 2024-01-01 00:00:00 UTC
inline TimePoint base_time() {
    return TimePoint(std::chrono::seconds(1704067200));
}

inline Reading make_reading(double value, TimePoint timestamp,
                            bearalarm::Trend trend = bearalarm::Trend::Steady) {
    Reading r;
    r.value = value;
    r.timestamp = timestamp;
    r.trend = trend;
    return r;
}

class ManualClock : public bearalarm::Clock {
public:
    explicit ManualClock(TimePoint start = base_time()) : now_(start) {}

    TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::seconds by) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += by;
    }

    void set(TimePoint tp) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = tp;
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

// Returns queued readings/errors in order; an empty queue is a fetch error.
// A value is stamped with the clock's current time when no timestamp is given.
// Runs `hook` from now() once armed, then disarms
class HookedClock : public ManualClock {
public:
    void arm(std::function<void()> hook) {
        std::lock_guard<std::mutex> lock(hook_mutex_);
        hook_ = std::move(hook);
    }

    TimePoint now() const override {
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(hook_mutex_);
            hook.swap(hook_);
        }
        if (hook) {
            hook();
        }
        return ManualClock::now();
    }

private:
    mutable std::mutex hook_mutex_;
    mutable std::function<void()> hook_;
};

class ScriptedSource : public bearalarm::DataSource {
public:
    explicit ScriptedSource(std::shared_ptr<ManualClock> clock) : clock_(std::move(clock)) {}

    void push_value(double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        steps_.push_back(Step{value, std::nullopt, std::string(), false});
    }

    void push_reading(const Reading& reading) {
        std::lock_guard<std::mutex> lock(mutex_);
        steps_.push_back(Step{reading.value, reading.timestamp, std::string(), false});
    }

    // The fetch itself takes `duration` of clock time
    void push_slow_value(double value, std::chrono::seconds duration) {
        std::lock_guard<std::mutex> lock(mutex_);
        steps_.push_back(Step{value, std::nullopt, std::string(), false, duration});
    }

    void push_error(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        steps_.push_back(Step{0.0, std::nullopt, message, false});
    }

    // Next fetch blocks until release_hang()
    void push_hang() {
        std::lock_guard<std::mutex> lock(mutex_);
        steps_.push_back(Step{0.0, std::nullopt, std::string(), true});
    }

    void release_hang() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

    int fetch_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fetches_;
    }

    Reading fetch_latest() override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++fetches_;
        if (steps_.empty()) {
            throw bearalarm::FetchError("no scripted reading");
        }
        Step step = steps_.front();
        steps_.pop_front();

        if (step.hang) {
            cv_.wait(lock, [this]() { return released_; });
            throw bearalarm::FetchError("released hung fetch");
        }
        if (!step.error.empty()) {
            throw bearalarm::FetchError(step.error);
        }
        lock.unlock();
        if (step.duration.count() > 0) {
            clock_->advance(step.duration);
        }
        return make_reading(step.value, step.timestamp ? *step.timestamp : clock_->now());
    }

    std::string describe() const override { return "scripted source"; }

private:
    struct Step {
        double value;
        std::optional<TimePoint> timestamp;
        std::string error;
        bool hang;
        std::chrono::seconds duration{0};
    };

    std::shared_ptr<ManualClock> clock_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Step> steps_;
    int fetches_ = 0;
    bool released_ = false;
};

struct SinkCall {
    enum Kind { Play, Stop } kind;
    AlertCondition condition;
};

class RecordingSink : public bearalarm::AlertSink {
public:
    void play(AlertCondition condition) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(SinkCall{SinkCall::Play, condition});
        if (fail_) {
            throw bearalarm::SinkError("audio device unavailable");
        }
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(SinkCall{SinkCall::Stop, AlertCondition::Normal});
        if (fail_) {
            throw bearalarm::SinkError("audio device unavailable");
        }
    }

    void set_failing(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_ = fail;
    }

    std::vector<SinkCall> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t play_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& c : calls_) {
            if (c.kind == SinkCall::Play) ++n;
        }
        return n;
    }

    size_t stop_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& c : calls_) {
            if (c.kind == SinkCall::Stop) ++n;
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<SinkCall> calls_;
    bool fail_ = false;
};

// Polls `done` for up to `timeout` of real time
template<typename Predicate>
bool eventually(Predicate done, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (done()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return done();
}

// Unique scratch path under the system temp directory, removed on destruction
class TempPath {
public:
    explicit TempPath(const std::string& name)
        : path_(std::filesystem::temp_directory_path() /
                ("bearalarm_test_" + unique_suffix() + "_" + name))
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ~TempPath() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        std::filesystem::remove_all(path_.string() + ".tmp", ec);
    }

    std::string str() const { return path_.string(); }

private:
    // ctest may run test cases in parallel processes
    static std::string unique_suffix() {
        static std::mt19937_64 rng{std::random_device{}()};
        return std::to_string(rng());
    }

    std::filesystem::path path_;
};

} // namespace test_support
