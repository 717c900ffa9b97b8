#pragma once

#include "bearalarm/clock.hpp"
#include <memory>
#include <optional>
#include <string>

namespace bearalarm {

struct SourceConfig;

enum class Trend {
    Unknown,
    Rising,
    Falling,
    Steady
};

struct Reading {
    double value = 0.0;                      // In the deployment unit (mmol/L or mg/dL)
    TimePoint timestamp;
    Trend trend = Trend::Unknown;
};

// Accepts "rising"/"falling"/"steady"/"unknown" and Dexcom Share direction names
Trend parse_trend(const std::string& text);
std::string trend_name(Trend trend);
std::string trend_arrow(Trend trend);

// Parses "<epoch seconds|ms>,<value>[,<trend>]"; nullopt if the line is malformed.
// Timestamps above 1e11 are taken as milliseconds.
std::optional<Reading> parse_reading_line(const std::string& line);

class DataSource {
public:
    virtual ~DataSource() = default;

    // Latest reading from the source. Throws FetchError on any failure.
    virtual Reading fetch_latest() = 0;

    virtual std::string describe() const = 0;
};

// Reads the last line of a CSV file kept up to date by an external fetcher
class FileDataSource : public DataSource {
public:
    explicit FileDataSource(std::string path);

    Reading fetch_latest() override;
    std::string describe() const override;

private:
    std::string path_;
};

// Runs a shell command per fetch and parses the first line it prints
class CommandDataSource : public DataSource {
public:
    explicit CommandDataSource(std::string command);

    Reading fetch_latest() override;
    std::string describe() const override;

private:
    std::string command_;
};

// Factory function
std::unique_ptr<DataSource> create_data_source(const SourceConfig& config);

} // namespace bearalarm
