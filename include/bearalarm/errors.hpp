#pragma once

#include <stdexcept>
#include <string>

namespace bearalarm {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Threshold ordering violated or a non-positive interval; fatal at startup
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error(message) {}
};

// Network, auth, parse or timeout failure while fetching a reading
class FetchError : public Error {
public:
    explicit FetchError(const std::string& message) : Error(message) {}
};

// Reading store could not durably write
class PersistenceError : public Error {
public:
    explicit PersistenceError(const std::string& message) : Error(message) {}
};

// Alert device unavailable or failed to start/stop
class SinkError : public Error {
public:
    explicit SinkError(const std::string& message) : Error(message) {}
};

} // namespace bearalarm
