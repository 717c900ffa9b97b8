#include "bearalarm/reading_store.hpp"
#include "bearalarm/errors.hpp"
#include "bearalarm/logging.hpp"
#include "bearalarm/threshold_evaluator.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iterator>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace bearalarm {

static long long to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string format_journal_line(const Reading& reading) {
    std::ostringstream oss;
    oss << to_epoch_ms(reading.timestamp) << ","
        << std::setprecision(10) << reading.value << ","
        << trend_name(reading.trend);
    return oss.str();
}

// Journal timestamps are always milliseconds
static std::optional<Reading> parse_journal_line(const std::string& line) {
    std::istringstream iss(line);
    std::string stamp, value, trend;
    if (!std::getline(iss, stamp, ',') || !std::getline(iss, value, ',')) {
        return std::nullopt;
    }
    std::getline(iss, trend);

    Reading reading;
    try {
        reading.timestamp = TimePoint(std::chrono::milliseconds(std::stoll(stamp)));
        reading.value = std::stod(value);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
    reading.trend = parse_trend(trend);
    return reading;
}

static bool timestamp_less(const Reading& reading, TimePoint since) {
    return reading.timestamp < since;
}

ReadingStore::ReadingStore(const std::string& journal_path)
    : journal_path_(journal_path)
{
    if (!journal_path_.empty()) {
        load_journal();
        open_journal();
    }
}

ReadingStore::~ReadingStore() {
    if (journal_.is_open()) {
        journal_.close();
    }
}

void ReadingStore::load_journal() {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(journal_path_, ec)) {
        return;
    }

    std::ifstream in(journal_path_);
    if (!in.is_open()) {
        throw PersistenceError("cannot read reading journal " + journal_path_);
    }

    std::string line;
    size_t skipped = 0;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }
        auto reading = parse_journal_line(line);
        if (!reading || (!readings_.empty() && reading->timestamp <= readings_.back().timestamp)) {
            ++skipped;
            continue;
        }
        readings_.push_back(*reading);
    }

    if (skipped > 0) {
        Logger::warn("Skipped ", skipped, " unreadable or out-of-order lines in ", journal_path_);
    }
    DebugLogger::log("Loaded ", readings_.size(), " readings from ", journal_path_);
}

void ReadingStore::open_journal() {
    auto parent = std::filesystem::path(journal_path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    journal_.open(journal_path_, std::ios::app);
    if (!journal_.is_open()) {
        throw PersistenceError("cannot open reading journal " + journal_path_ + " for writing");
    }
}

void ReadingStore::write_entry(const Reading& reading) {
    if (journal_path_.empty()) {
        return;
    }
    if (!journal_.is_open()) {
        throw PersistenceError("reading journal " + journal_path_ + " is not open");
    }

    journal_ << format_journal_line(reading) << "\n";
    journal_.flush();
    if (!journal_) {
        journal_.clear();
        throw PersistenceError("failed to write reading journal " + journal_path_);
    }
}

AppendResult ReadingStore::append(const Reading& reading) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (!readings_.empty() && reading.timestamp <= readings_.back().timestamp) {
        return AppendResult::Duplicate;
    }

    readings_.push_back(reading);
    write_entry(reading);
    return AppendResult::Appended;
}

std::vector<Reading> ReadingStore::query(TimePoint since) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto first = std::lower_bound(readings_.begin(), readings_.end(), since, timestamp_less);
    return std::vector<Reading>(first, readings_.end());
}

std::vector<Reading> ReadingStore::all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return readings_;
}

std::optional<Reading> ReadingStore::latest() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (readings_.empty()) {
        return std::nullopt;
    }
    return readings_.back();
}

size_t ReadingStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return readings_.size();
}

ReadingStats ReadingStore::stats(TimePoint since, const ThresholdConfig& thresholds) const {
    ReadingStats stats;
    auto readings = query(since);
    if (readings.empty()) {
        return stats;
    }

    double sum = 0.0;
    size_t in_range = 0;
    stats.min = readings.front().value;
    stats.max = readings.front().value;
    for (const auto& r : readings) {
        stats.min = std::min(stats.min, r.value);
        stats.max = std::max(stats.max, r.value);
        sum += r.value;
        if (classify(r, thresholds) == AlertCondition::Normal) {
            ++in_range;
        }
    }

    stats.count = readings.size();
    stats.average = sum / static_cast<double>(stats.count);
    stats.time_in_range_percent = 100.0 * static_cast<double>(in_range) / static_cast<double>(stats.count);
    return stats;
}

size_t ReadingStore::prune_before(TimePoint cutoff) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto first_kept = std::lower_bound(readings_.begin(), readings_.end(), cutoff, timestamp_less);
    size_t removed = static_cast<size_t>(std::distance(readings_.begin(), first_kept));
    if (removed == 0) {
        return 0;
    }

    // Journal is replaced before memory changes, so a failure leaves both intact
    if (!journal_path_.empty()) {
        std::string tmp_path = journal_path_ + ".tmp";
        {
            std::ofstream out(tmp_path, std::ios::trunc);
            if (!out.is_open()) {
                throw PersistenceError("cannot create " + tmp_path);
            }
            for (auto it = first_kept; it != readings_.end(); ++it) {
                out << format_journal_line(*it) << "\n";
            }
            out.flush();
            if (!out) {
                throw PersistenceError("failed to rewrite reading journal " + tmp_path);
            }
        }

        journal_.close();
        std::error_code ec;
        std::filesystem::rename(tmp_path, journal_path_, ec);
        open_journal();
        if (ec) {
            std::filesystem::remove(tmp_path, ec);
            throw PersistenceError("failed to replace reading journal " + journal_path_);
        }
    }

    readings_.erase(readings_.begin(), first_kept);
    Logger::info("Pruned ", removed, " readings older than ", format_timestamp(cutoff));
    return removed;
}

} // namespace bearalarm
