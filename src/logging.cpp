#include "bearalarm/logging.hpp"
#include "bearalarm/clock.hpp"

namespace bearalarm {

std::atomic<bool> DebugLogger::enabled_{false};

std::mutex& Logger::mutex() {
    static std::mutex m;
    return m;
}

std::string log_timestamp() {
    return format_timestamp(std::chrono::system_clock::now());
}

} // namespace bearalarm
