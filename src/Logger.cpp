#include "sealstream/Logger.hpp"
#include <ctime>
#include <iostream>
#include <utility>

namespace sealstream {

Logger::Logger() : currentLogLevel_(LogLevel::Warn) {
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::setLogLevel(const LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLogLevel_ = level;
}

LogLevel Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentLogLevel_;
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

bool Logger::isEnabled(const LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= currentLogLevel_;
}

void Logger::log(const LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < currentLogLevel_) {
        return;
    }
    if (sink_) {
        sink_(level, message);
    } else {
        logToConsole(level, message);
    }
}

void Logger::logToConsole(const LogLevel level, const std::string& message) const {
    std::clog << getTimestamp() << " [" << levelToString(level) << "] sealstream: " << message << '\n';
}

std::string Logger::getTimestamp() {
    const std::time_t now = std::time(nullptr);
    std::tm tmBuf{};
    gmtime_r(&now, &tmBuf);
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmBuf) == 0) {
        return "";
    }
    return buf;
}

std::string Logger::levelToString(const LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
    }
    return "UNKNOWN";
}

}
