#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>

#include "utils/TimeUtils.hpp"  // for TimePoint and formatting

namespace OpsTriage
{
    namespace Utils
    {
        /**
         * Log severity levels used across the system.
         *
         *  - TRACE: very verbose, internal debugging
         *  - DEBUG: per-series / per-signature decisions
         *  - INFO: incident-level flow
         *  - WARN: tolerated input problems (lenient timestamp fallback)
         *  - ERROR: rejected input
         *  - CRITICAL: unrecoverable failures
         */
        enum class LogLevel
        {
            TRACE    = 0,
            DEBUG    = 1,
            INFO     = 2,
            WARN     = 3,
            ERROR    = 4,
            CRITICAL = 5,
        };

        /// Case-insensitive level name parse ("warn" and "warning" both map to WARN).
        std::optional<LogLevel> parseLogLevel(std::string_view name);

        /**
         * Logger
         *
         * Thread-safe, minimal logging facility. Every line carries a
         * timestamp, the level and, when given, the emitting component:
         *
         *   [2025-01-01 12:00:00] [WARN] [Forecast] unparseable timestamp ...
         *
         * Output goes to a console stream (stderr by default) and, optionally,
         * to a file opened in append mode.
         */
        class Logger
        {
        public:
            /// Create a logger that writes to stderr only.
            Logger();

            /**
             * Create a logger with optional file output.
             *
             * If filePath is non-empty, the logger attempts to open the file
             * in append mode. If opening fails, logging falls back to the
             * console only.
             */
            explicit Logger(std::string_view filePath, LogLevel level = LogLevel::INFO);

            Logger(const Logger &)            = delete;
            Logger &operator=(const Logger &) = delete;

            ~Logger();

            /// Set the minimum severity that will be logged.
            void setLevel(LogLevel level) noexcept;

            /// Get the currently configured minimum severity.
            LogLevel level() const noexcept;

            /// Check quickly whether this level would be logged.
            bool isEnabled(LogLevel level) const noexcept;

            /// (Re)open the file sink; an empty path disables it. Returns false if opening fails.
            bool setFile(std::string_view filePath);

            /// Redirect console output (nullptr silences it). Not owned.
            void setConsole(std::ostream *console) noexcept;

            /// Log an untagged message.
            void log(LogLevel level, std::string_view message);

            /// Log a message tagged with the emitting component.
            void log(LogLevel level, std::string_view component, std::string_view message);

            void trace(std::string_view message)   { log(LogLevel::TRACE, message); }
            void debug(std::string_view message)   { log(LogLevel::DEBUG, message); }
            void info(std::string_view message)    { log(LogLevel::INFO,  message); }
            void warn(std::string_view message)    { log(LogLevel::WARN,  message); }
            void error(std::string_view message)   { log(LogLevel::ERROR, message); }
            void critical(std::string_view message){ log(LogLevel::CRITICAL, message); }

        private:
            static const char *toString(LogLevel level) noexcept;

            void writeLine(std::string_view line);

        private:
            LogLevel                        m_level;
            std::ofstream                   m_file;       // RAII-managed file handle
            bool                            m_fileEnabled;
            std::ostream                   *m_console;    // usually &std::cerr
            mutable std::mutex              m_mutex;      // protects all writes
        };

        /**
         * Process-wide logger (stderr, INFO until configured).
         *
         *   Logger &log = getLogger();
         *   log.info("Correlation", "clustered 3 alerts");
         */
        Logger &getLogger();

    } // namespace Utils
} // namespace OpsTriage
