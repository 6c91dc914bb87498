#include "../include/log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

/**
 * @file log.cpp
 * @brief Implementation of the Logger class.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    namespace {

        std::string formatTimestamp() {
            auto now = std::chrono::system_clock::now();
            std::time_t t = std::chrono::system_clock::to_time_t(now);
            std::tm tm{};
#if defined(_WIN32) || defined(_WIN64)
            localtime_s(&tm, &t);
#else
            localtime_r(&t, &tm);
#endif
            std::ostringstream oss;
            oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
            return oss.str();
        }
    }

    const char* logLevelName(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return "INFO";
            case LogLevel::Warn: return "WARN";
            case LogLevel::Error: return "ERROR";
        }
        return "UNKNOWN";
    }

    Logger& Logger::instance() {
        static Logger logger(std::cerr);
        return logger;
    }

    Logger::Logger(std::ostream& out, LogLevel threshold)
        : stream(out), level(threshold) {}

    void Logger::setThreshold(LogLevel threshold) {
        std::lock_guard<std::mutex> lock(mutex);
        level = threshold;
    }

    LogLevel Logger::threshold() const {
        std::lock_guard<std::mutex> lock(mutex);
        return level;
    }

    bool Logger::enabled(LogLevel candidate) const {
        std::lock_guard<std::mutex> lock(mutex);
        return static_cast<int>(candidate) >= static_cast<int>(level);
    }

    void Logger::log(LogLevel candidate, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex);
        if (static_cast<int>(candidate) < static_cast<int>(level))
            return;

        std::ostringstream line;
        line << "[" << formatTimestamp() << "] [" << logLevelName(candidate) << "] " << message << '\n';
        stream << line.str();
        stream.flush();
    }

}
