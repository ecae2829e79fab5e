#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace sealstream {

enum class LogLevel : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Process-wide logger. Messages below the threshold are dropped; the rest go to the
// installed sink, or to std::clog when none is installed.
class Logger {
public:
    using Sink = std::function<void(LogLevel level, const std::string& message)>;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    [[nodiscard]] LogLevel getLogLevel() const;

    // An empty sink restores console output.
    void setSink(Sink sink);

    [[nodiscard]] bool isEnabled(LogLevel level) const;

    void log(LogLevel level, const std::string& message);

    [[nodiscard]] static std::string levelToString(LogLevel level);

private:
    Logger();

    void logToConsole(LogLevel level, const std::string& message) const;
    [[nodiscard]] static std::string getTimestamp();

    mutable std::mutex mutex_;
    LogLevel currentLogLevel_;
    Sink sink_;
};

}
