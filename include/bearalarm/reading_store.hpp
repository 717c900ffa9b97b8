#pragma once

#include "bearalarm/config_manager.hpp"
#include "bearalarm/data_source.hpp"
#include <fstream>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace bearalarm {

enum class AppendResult {
    Appended,
    Duplicate                                // Timestamp not newer than the latest stored reading
};

struct ReadingStats {
    size_t count = 0;
    double min = 0.0;
    double max = 0.0;
    double average = 0.0;
    double time_in_range_percent = 0.0;      // Share of readings classified Normal
};

// Append-only, chronologically ordered reading history. One writer (the monitor
// loop) and any number of concurrent readers. An optional CSV journal
// ("epoch_ms,value,trend") keeps the history across sessions.
class ReadingStore {
public:
    // In-memory only
    ReadingStore() = default;

    // Loads and then appends to the journal at journal_path. Throws PersistenceError
    // if the journal exists but cannot be read or opened for appending.
    explicit ReadingStore(const std::string& journal_path);
    ~ReadingStore();

    ReadingStore(const ReadingStore&) = delete;
    ReadingStore& operator=(const ReadingStore&) = delete;

    // The reading is kept in memory even if the journal write fails; in that
    // case PersistenceError is thrown after the in-memory append.
    AppendResult append(const Reading& reading);

    // Readings with timestamp >= since, oldest first
    std::vector<Reading> query(TimePoint since) const;
    std::vector<Reading> all() const;

    std::optional<Reading> latest() const;
    size_t size() const;

    ReadingStats stats(TimePoint since, const ThresholdConfig& thresholds) const;

    // Drops readings older than cutoff and rewrites the journal. Returns the number removed.
    size_t prune_before(TimePoint cutoff);

    const std::string& journal_path() const { return journal_path_; }

private:
    void load_journal();
    void open_journal();
    void write_entry(const Reading& reading);

    std::string journal_path_;
    std::ofstream journal_;
    std::vector<Reading> readings_;
    mutable std::shared_mutex mutex_;
};

std::string format_journal_line(const Reading& reading);

} // namespace bearalarm
