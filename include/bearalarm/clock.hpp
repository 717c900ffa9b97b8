#pragma once

#include <chrono>
#include <memory>
#include <string>

namespace bearalarm {

using TimePoint = std::chrono::system_clock::time_point;
using Seconds = std::chrono::seconds;

class Clock {
public:
    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

std::shared_ptr<Clock> create_system_clock();

// "YYYY-mm-dd HH:MM:SS" in local time
std::string format_timestamp(const TimePoint& tp);

} // namespace bearalarm
