#pragma once

#include "bearalarm/alert_sink.hpp"
#include "bearalarm/alert_state.hpp"
#include "bearalarm/clock.hpp"
#include "bearalarm/config_manager.hpp"
#include "bearalarm/data_source.hpp"
#include "bearalarm/reading_store.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace bearalarm {

struct MonitorOptions {
    int startup_delay_minutes = 0;
    int fetch_timeout_seconds = 10;
    int max_consecutive_errors = 5;
    std::string units = "mmol";

    static MonitorOptions from_config(const BearAlarmConfig& config);
};

struct MonitorStats {
    uint64_t cycles = 0;
    uint64_t readings_stored = 0;
    uint64_t duplicates_skipped = 0;
    uint64_t fetch_failures = 0;
    uint64_t consecutive_fetch_failures = 0;
    uint64_t persistence_failures = 0;
    uint64_t sink_failures = 0;
    uint64_t plays = 0;
    uint64_t stops = 0;
    std::string last_error;
};

enum class CycleOutcome {
    Evaluated,
    FetchFailed,
    Stopped
};

// Next poll time on the grid anchored at `previous`. When whole intervals were
// missed the latest missed grid point is returned, so the caller runs at once.
TimePoint next_tick_after(TimePoint previous, Seconds interval, TimePoint now);

class MonitorLoop {
public:
    // Throws ConfigError for invalid thresholds/options or a missing collaborator
    MonitorLoop(const ThresholdConfig& config,
                const MonitorOptions& options,
                std::shared_ptr<DataSource> source,
                std::shared_ptr<ReadingStore> store,
                std::shared_ptr<AlertSink> sink,
                std::shared_ptr<Clock> clock = create_system_clock());
    ~MonitorLoop();

    MonitorLoop(const MonitorLoop&) = delete;
    MonitorLoop& operator=(const MonitorLoop&) = delete;

    // Run the loop on its own thread
    void start();

    // Run the loop on the calling thread until stop()
    void run();

    // Safe from any thread. Once it returns no further sink call is made.
    void stop();

    bool is_running() const { return running_; }

    // One fetch/store/classify/alert pass
    CycleOutcome run_cycle();

    // Snooze ingress, callable while a cycle is in progress
    TimePoint snooze(Seconds duration);
    bool cancel_snooze();

    // Seed the alert state before start(), e.g. from a session being replaced
    void restore_alert_state(const AlertState& state);

    AlertState alert_state() const;
    MonitorStats stats() const;
    std::optional<Reading> last_reading() const;
    const ThresholdConfig& config() const { return config_; }
    const MonitorOptions& options() const { return options_; }

private:
    void loop();
    std::optional<Reading> fetch_with_timeout();
    bool wait_until(TimePoint deadline);
    void dispatch(const AlertDecision& decision);
    void record_fetch_failure(const std::string& message);
    std::string unit_label() const;

    const ThresholdConfig config_;
    const MonitorOptions options_;
    std::shared_ptr<DataSource> source_;
    std::shared_ptr<ReadingStore> store_;
    std::shared_ptr<AlertSink> sink_;
    std::shared_ptr<Clock> clock_;

    AlertStateMachine state_machine_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::thread thread_;

    // Held across the alert transition and sink call; stop() takes it so none starts afterwards
    std::mutex dispatch_mutex_;

    // Fetch workers that timed out and are still blocked in the source
    std::shared_ptr<std::atomic<int>> abandoned_fetches_;

    mutable std::mutex stats_mutex_;
    MonitorStats stats_;
    std::optional<Reading> last_reading_;
};

} // namespace bearalarm
