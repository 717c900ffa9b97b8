#include "bearalarm/data_source.hpp"
#include "bearalarm/config_manager.hpp"
#include "bearalarm/errors.hpp"
#include "bearalarm/logging.hpp"
#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

#ifdef _WIN32
#define popen _popen
#define pclose _pclose
#else
#include <sys/wait.h>
#endif

namespace bearalarm {

static std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

static std::string to_lower(std::string text) {
    for (char& c : text) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return text;
}

Trend parse_trend(const std::string& text) {
    std::string t = to_lower(trim(text));

    if (t == "rising" || t == "doubleup" || t == "singleup" || t == "fortyfiveup") {
        return Trend::Rising;
    }
    if (t == "falling" || t == "doubledown" || t == "singledown" || t == "fortyfivedown") {
        return Trend::Falling;
    }
    if (t == "steady" || t == "flat") {
        return Trend::Steady;
    }
    return Trend::Unknown;
}

std::string trend_name(Trend trend) {
    switch (trend) {
        case Trend::Rising:  return "rising";
        case Trend::Falling: return "falling";
        case Trend::Steady:  return "steady";
        default:             return "unknown";
    }
}

std::string trend_arrow(Trend trend) {
    switch (trend) {
        case Trend::Rising:  return "↑";
        case Trend::Falling: return "↓";
        case Trend::Steady:  return "→";
        default:             return "?";
    }
}

std::optional<Reading> parse_reading_line(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    if (fields.size() < 2 || fields.size() > 3) {
        return std::nullopt;
    }

    long long stamp = 0;
    double value = 0.0;
    try {
        size_t used = 0;
        stamp = std::stoll(fields[0], &used);
        if (used != fields[0].size()) return std::nullopt;
        value = std::stod(fields[1], &used);
        if (used != fields[1].size()) return std::nullopt;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
    if (stamp < 0 || !std::isfinite(value) || value <= 0.0) {
        return std::nullopt;
    }

    Reading reading;
    reading.value = value;
    if (stamp > 100000000000LL) {
        reading.timestamp = TimePoint(std::chrono::milliseconds(stamp));
    } else {
        reading.timestamp = TimePoint(std::chrono::seconds(stamp));
    }
    reading.trend = fields.size() == 3 ? parse_trend(fields[2]) : Trend::Unknown;
    return reading;
}

FileDataSource::FileDataSource(std::string path)
    : path_(std::move(path))
{
}

Reading FileDataSource::fetch_latest() {
    std::ifstream file(path_);
    if (!file.is_open()) {
        throw FetchError("cannot open reading file " + path_);
    }

    std::string line;
    std::string last;
    while (std::getline(file, line)) {
        line = trim(line);
        if (!line.empty() && line[0] != '#') {
            last = line;
        }
    }
    if (last.empty()) {
        throw FetchError("no reading available in " + path_);
    }

    auto reading = parse_reading_line(last);
    if (!reading) {
        throw FetchError("malformed reading in " + path_ + ": '" + last + "'");
    }
    return *reading;
}

std::string FileDataSource::describe() const {
    return "file " + path_;
}

CommandDataSource::CommandDataSource(std::string command)
    : command_(std::move(command))
{
}

Reading CommandDataSource::fetch_latest() {
    FILE* pipe = popen(command_.c_str(), "r");
    if (!pipe) {
        throw FetchError("failed to run source command: " + command_);
    }

    std::string output;
    std::array<char, 256> buffer{};
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        output += buffer.data();
    }

    int status = pclose(pipe);
#ifndef _WIN32
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        throw FetchError("source command failed (status " + std::to_string(status) + ")");
    }
#else
    if (status != 0) {
        throw FetchError("source command failed (status " + std::to_string(status) + ")");
    }
#endif

    std::string first_line = trim(output.substr(0, output.find('\n')));
    DebugLogger::log("source command output: ", first_line);
    if (first_line.empty()) {
        throw FetchError("source command printed no reading");
    }

    auto reading = parse_reading_line(first_line);
    if (!reading) {
        throw FetchError("malformed reading from source command: '" + first_line + "'");
    }
    return *reading;
}

std::string CommandDataSource::describe() const {
    return "command '" + command_ + "'";
}

std::unique_ptr<DataSource> create_data_source(const SourceConfig& config) {
    if (config.type == "file") {
        return std::make_unique<FileDataSource>(config.path);
    }
    if (config.type == "command") {
        return std::make_unique<CommandDataSource>(config.command);
    }
    throw ConfigError("unknown source type '" + config.type + "'");
}

} // namespace bearalarm
