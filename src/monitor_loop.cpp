#include "bearalarm/monitor_loop.hpp"
#include "bearalarm/errors.hpp"
#include "bearalarm/logging.hpp"
#include "bearalarm/threshold_evaluator.hpp"
#include <algorithm>
#include <exception>
#include <future>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace bearalarm {

namespace {

// Longest uninterrupted wait; the clock is re-read after each slice
constexpr std::chrono::milliseconds kWaitSlice(250);

// Hung fetch workers tolerated before cycles fail without starting another
constexpr int kMaxAbandonedFetches = 3;

enum AttemptState { Pending = 0, Finished = 1, Abandoned = 2 };

struct FetchAttempt {
    std::promise<Reading> promise;
    std::atomic<int> state{Pending};
};

std::string format_value(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value;
    return oss.str();
}

} // namespace

MonitorOptions MonitorOptions::from_config(const BearAlarmConfig& config) {
    MonitorOptions options;
    options.startup_delay_minutes = config.monitoring.startup_delay_minutes;
    options.fetch_timeout_seconds = config.monitoring.fetch_timeout_seconds;
    options.max_consecutive_errors = config.monitoring.max_consecutive_errors;
    options.units = config.units;
    return options;
}

TimePoint next_tick_after(TimePoint previous, Seconds interval, TimePoint now) {
    auto missed = (now - previous) / interval;
    if (missed < 1) {
        missed = 1;
    }
    return previous + missed * interval;
}

MonitorLoop::MonitorLoop(const ThresholdConfig& config,
                         const MonitorOptions& options,
                         std::shared_ptr<DataSource> source,
                         std::shared_ptr<ReadingStore> store,
                         std::shared_ptr<AlertSink> sink,
                         std::shared_ptr<Clock> clock)
    : config_(config)
    , options_(options)
    , source_(std::move(source))
    , store_(std::move(store))
    , sink_(std::move(sink))
    , clock_(std::move(clock))
    , state_machine_(config)
    , abandoned_fetches_(std::make_shared<std::atomic<int>>(0))
{
    if (!config_.validate()) {
        throw ConfigError("invalid thresholds: need 0 < low_threshold < high_threshold "
                          "and positive poll/alert intervals");
    }
    if (options_.startup_delay_minutes < 0 ||
        options_.fetch_timeout_seconds <= 0 ||
        options_.max_consecutive_errors <= 0) {
        throw ConfigError("invalid monitoring options");
    }
    if (!source_ || !store_ || !sink_ || !clock_) {
        throw ConfigError("monitor requires a data source, reading store, alert sink and clock");
    }
}

MonitorLoop::~MonitorLoop() {
    stop();
}

void MonitorLoop::start() {
    if (thread_.joinable() || running_) {
        throw std::logic_error("monitor loop already started");
    }
    stop_requested_ = false;
    running_ = true;
    thread_ = std::thread([this]() { loop(); });
}

void MonitorLoop::run() {
    if (running_.exchange(true)) {
        throw std::logic_error("monitor loop already running");
    }
    stop_requested_ = false;
    loop();
}

void MonitorLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_ = true;
    }
    wake_cv_.notify_all();

    // Waits out a sink call already in progress
    { std::lock_guard<std::mutex> lock(dispatch_mutex_); }

    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void MonitorLoop::loop() {
    Logger::info("Monitoring ", source_->describe(), " - low ", format_value(config_.low_threshold),
                 " ", unit_label(), ", high ", format_value(config_.high_threshold), " ", unit_label(),
                 ", poll every ", config_.poll_interval_seconds, "s, repeat alerts every ",
                 config_.alert_interval_seconds, "s");

    if (options_.startup_delay_minutes > 0) {
        TimePoint start_at = clock_->now() + std::chrono::minutes(options_.startup_delay_minutes);
        Logger::info("Waiting ", options_.startup_delay_minutes, " minute(s) before the first check (",
                     format_timestamp(start_at), ")");
        if (!wait_until(start_at)) {
            running_ = false;
            Logger::info("Monitoring stopped");
            return;
        }
    }

    const Seconds interval(config_.poll_interval_seconds);
    TimePoint tick = clock_->now();

    while (!stop_requested_) {
        run_cycle();
        if (stop_requested_) {
            break;
        }

        tick = next_tick_after(tick, interval, clock_->now());
        DebugLogger::log("Next poll at ", format_timestamp(tick));
        if (!wait_until(tick)) {
            break;
        }

        // A late wake-up stands for the latest grid point already passed
        tick += ((clock_->now() - tick) / interval) * interval;
    }

    running_ = false;
    Logger::info("Monitoring stopped");
}

bool MonitorLoop::wait_until(TimePoint deadline) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    while (!stop_requested_) {
        TimePoint now = clock_->now();
        if (now >= deadline) {
            return true;
        }
        auto slice = std::min<std::chrono::system_clock::duration>(deadline - now, kWaitSlice);
        wake_cv_.wait_for(lock, slice, [this]() { return stop_requested_.load(); });
    }
    return false;
}

std::optional<Reading> MonitorLoop::fetch_with_timeout() {
    if (abandoned_fetches_->load() >= kMaxAbandonedFetches) {
        throw FetchError("data source unresponsive: " + std::to_string(abandoned_fetches_->load()) +
                         " earlier fetches have not returned");
    }

    auto attempt = std::make_shared<FetchAttempt>();
    auto result = attempt->promise.get_future();
    auto source = source_;
    auto abandoned = abandoned_fetches_;

    try {
        std::thread([attempt, source, abandoned]() {
            try {
                attempt->promise.set_value(source->fetch_latest());
            } catch (...) {
                attempt->promise.set_exception(std::current_exception());
            }
            int expected = Pending;
            if (!attempt->state.compare_exchange_strong(expected, Finished)) {
                abandoned->fetch_sub(1);
            }
        }).detach();
    } catch (const std::system_error& e) {
        throw FetchError(std::string("cannot start fetch worker: ") + e.what());
    }

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::seconds(options_.fetch_timeout_seconds);
    while (true) {
        auto remaining = deadline - std::chrono::steady_clock::now();
        bool expired = remaining <= std::chrono::steady_clock::duration::zero();
        bool stopping = stop_requested_.load();

        if (expired || stopping) {
            abandoned_fetches_->fetch_add(1);
            int expected = Pending;
            if (attempt->state.compare_exchange_strong(expected, Abandoned)) {
                if (stopping) {
                    return std::nullopt;
                }
                throw FetchError("fetch timed out after " + std::to_string(options_.fetch_timeout_seconds) + "s");
            }
            // Worker finished between the check and the hand-off; use its result
            abandoned_fetches_->fetch_sub(1);
            break;
        }

        auto slice = std::min<std::chrono::steady_clock::duration>(remaining, kWaitSlice);
        if (result.wait_for(slice) == std::future_status::ready) {
            break;
        }
    }

    // Rethrows whatever the source threw
    return result.get();
}

void MonitorLoop::record_fetch_failure(const std::string& message) {
    uint64_t consecutive = 0;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.fetch_failures;
        consecutive = ++stats_.consecutive_fetch_failures;
        stats_.last_error = message;
    }

    Logger::error("Error getting glucose reading (", consecutive, "/", options_.max_consecutive_errors,
                  "): ", message);
    if (consecutive == static_cast<uint64_t>(options_.max_consecutive_errors)) {
        Logger::error("Failed to get a glucose reading ", consecutive,
                      " times in a row. Check the connection and credentials of ", source_->describe());
    }
}

CycleOutcome MonitorLoop::run_cycle() {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.cycles;
    }

    std::optional<Reading> reading;
    try {
        reading = fetch_with_timeout();
    } catch (const std::exception& e) {
        record_fetch_failure(e.what());
        return CycleOutcome::FetchFailed;
    }
    if (!reading) {
        return CycleOutcome::Stopped;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.consecutive_fetch_failures = 0;
        last_reading_ = reading;
    }

    // Storage problems never block alerting
    try {
        AppendResult appended = store_->append(*reading);
        std::lock_guard<std::mutex> lock(stats_mutex_);
        if (appended == AppendResult::Appended) {
            ++stats_.readings_stored;
        } else {
            ++stats_.duplicates_skipped;
        }
    } catch (const PersistenceError& e) {
        Logger::error("Reading not persisted: ", e.what());
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.persistence_failures;
        stats_.last_error = e.what();
    }

    AlertCondition condition = classify(*reading, config_);
    Logger::info("Glucose: ", format_value(reading->value), " ", unit_label(), " ",
                 trend_arrow(reading->trend), " (", condition_name(condition), ", read at ",
                 format_timestamp(reading->timestamp), ")");

    TimePoint now = clock_->now();

    // The transition and its sink call happen entirely before or after a stop()
    std::lock_guard<std::mutex> dispatch_lock(dispatch_mutex_);
    if (stop_requested_) {
        DebugLogger::log("Stop requested, ", condition_name(condition), " reading not evaluated");
        return CycleOutcome::Stopped;
    }

    dispatch(state_machine_.transition(condition, now));
    return CycleOutcome::Evaluated;
}

// Caller holds dispatch_mutex_
void MonitorLoop::dispatch(const AlertDecision& decision) {
    if (!decision.emits()) {
        return;
    }

    try {
        if (decision.call == SinkCall::Play) {
            Logger::warn(condition_name(decision.condition), " GLUCOSE ALERT (threshold ",
                         format_value(decision.condition == AlertCondition::Low
                                          ? config_.low_threshold : config_.high_threshold),
                         " ", unit_label(), ")");
            sink_->play(decision.condition);
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++stats_.plays;
        } else {
            Logger::info("Glucose returned to normal range, alert cleared");
            sink_->stop();
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++stats_.stops;
        }
    } catch (const std::exception& e) {
        Logger::error("Alert sink failed: ", e.what());
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.sink_failures;
        stats_.last_error = e.what();
    }
}

TimePoint MonitorLoop::snooze(Seconds duration) {
    TimePoint until = state_machine_.snooze(duration, clock_->now());
    Logger::info("Alerts snoozed until ", format_timestamp(until));
    return until;
}

bool MonitorLoop::cancel_snooze() {
    bool cancelled = state_machine_.cancel_snooze(clock_->now());
    if (cancelled) {
        Logger::info("Snooze cancelled");
    }
    return cancelled;
}

void MonitorLoop::restore_alert_state(const AlertState& state) {
    state_machine_.restore(state);
}

AlertState MonitorLoop::alert_state() const {
    return state_machine_.snapshot();
}

MonitorStats MonitorLoop::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

std::optional<Reading> MonitorLoop::last_reading() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return last_reading_;
}

std::string MonitorLoop::unit_label() const {
    return options_.units == "mgdl" ? "mg/dL" : "mmol/L";
}

} // namespace bearalarm
