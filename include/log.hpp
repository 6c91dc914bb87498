#ifndef LOG_HPP
#define LOG_HPP

#include <mutex>
#include <ostream>
#include <string>

/**
 * @file log.hpp
 * @brief Minimal levelled logger writing timestamped lines to a stream (stderr by default).
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    enum class LogLevel {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3
    };

    const char* logLevelName(LogLevel level);

    /**
     * @class Logger
     * @brief Thread-safe logger; lines below the threshold are dropped.
     *
     * Line format: "[YYYY-MM-DD HH:MM:SS] [LEVEL] message".
     */
    class Logger {
        public:
            /// @brief Process-wide logger used by the command line tool.
            static Logger& instance();

            explicit Logger(std::ostream& out, LogLevel threshold = LogLevel::Info);

            void setThreshold(LogLevel level);
            LogLevel threshold() const;

            bool enabled(LogLevel level) const;

            void log(LogLevel level, const std::string& message);

            void debug(const std::string& message) { log(LogLevel::Debug, message); }
            void info(const std::string& message) { log(LogLevel::Info, message); }
            void warn(const std::string& message) { log(LogLevel::Warn, message); }
            void error(const std::string& message) { log(LogLevel::Error, message); }

        private:
            mutable std::mutex mutex;
            std::ostream& stream;
            LogLevel level;
    };

}

#endif
