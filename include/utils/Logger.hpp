#pragma once

#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace HiveVerify
{
    namespace Utils
    {
        /**
         * Severity of our own diagnostics (not of the analyzed log lines).
         *
         *  - TRACE/DEBUG: per-line parse decisions, per-check counts
         *  - INFO: pipeline flow (file loaded, entries parsed, verdict)
         *  - WARN: advisory verification findings, ignored config values
         *  - ERROR: invocation failures (missing file, bad arguments)
         *  - CRITICAL: unexpected exceptions caught at the process boundary
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

        /// Parse "debug", "WARN", "warning", ... into a LogLevel.
        std::optional<LogLevel> parseLogLevel(std::string_view text);

        /**
         * Logger
         *
         * Thread-safe, minimal logging facility. Every line is prefixed with a
         * timestamp and level and goes to stderr, and to an append-mode file
         * when one is configured. Stdout is left to the verification report.
         *
         * Non-copyable; reach the process-wide instance through getLogger().
         */
        class Logger
        {
        public:
            /// Stderr only, INFO level.
            Logger();

            Logger(const Logger &)            = delete;
            Logger &operator=(const Logger &) = delete;

            ~Logger();

            void setLevel(LogLevel level) noexcept;
            LogLevel level() const noexcept;
            bool isEnabled(LogLevel level) const noexcept;

            /**
             * Also write to filePath (append mode).
             *
             * Returns false, and keeps logging to the console only, if the
             * file cannot be opened. An empty path closes any current file.
             */
            bool setFile(const std::string &filePath);

            /// Redirect console output (nullptr silences the console sink).
            void setConsole(std::ostream *console) noexcept;

            /// Format "[timestamp] [LEVEL] message" and write it to the sinks.
            void log(LogLevel level, std::string_view message);

            void trace(std::string_view message)   { log(LogLevel::TRACE, message); }
            void debug(std::string_view message)   { log(LogLevel::DEBUG, message); }
            void info(std::string_view message)    { log(LogLevel::INFO,  message); }
            void warn(std::string_view message)    { log(LogLevel::WARN,  message); }
            void error(std::string_view message)   { log(LogLevel::ERROR, message); }
            void critical(std::string_view message){ log(LogLevel::CRITICAL, message); }

            static const char *toString(LogLevel level) noexcept;

        private:
            void writeLine(std::string_view line);

        private:
            LogLevel                        m_level;
            std::ofstream                   m_file;
            bool                            m_fileEnabled;
            std::ostream                   *m_console;    // usually &std::cerr
            mutable std::mutex              m_mutex;      // protects all state
        };

        /// Process-wide logger (stderr, INFO until configured).
        Logger &getLogger();

    } // namespace Utils
} // namespace HiveVerify
