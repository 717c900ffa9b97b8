#include "bearalarm/clock.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace bearalarm {

std::shared_ptr<Clock> create_system_clock() {
    return std::make_shared<SystemClock>();
}

std::string format_timestamp(const TimePoint& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
#ifdef _WIN32
    localtime_s(&tm, &time_t);
#else
    localtime_r(&time_t, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace bearalarm
