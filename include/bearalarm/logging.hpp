#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace bearalarm {

// Timestamp prefix used by every log line, "YYYY-mm-dd HH:MM:SS" in local time
std::string log_timestamp();

class Logger {
public:
    template<typename... Args>
    static void info(Args&&... args) {
        write(std::cout, "INFO", std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(Args&&... args) {
        write(std::cerr, "WARNING", std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(Args&&... args) {
        write(std::cerr, "ERROR", std::forward<Args>(args)...);
    }

private:
    template<typename... Args>
    static void write(std::ostream& out, const char* level, Args&&... args) {
        std::lock_guard<std::mutex> lock(mutex());
        out << "[" << log_timestamp() << "] " << level << " - ";
        ((out << args), ...);
        out << std::endl;
    }

    static std::mutex& mutex();

    friend class DebugLogger;
};

class DebugLogger {
public:
    static void set_enabled(bool enabled) { enabled_ = enabled; }
    static bool is_enabled() { return enabled_; }

    template<typename... Args>
    static void log(Args&&... args) {
        if (enabled_) {
            Logger::write(std::cerr, "DEBUG", std::forward<Args>(args)...);
        }
    }

private:
    static std::atomic<bool> enabled_;
};

} // namespace bearalarm
