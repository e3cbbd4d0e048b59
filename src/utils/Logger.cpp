#include "utils/Logger.hpp"

#include <iostream>

#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace HiveVerify
{
    namespace Utils
    {
        std::optional<LogLevel> parseLogLevel(std::string_view text)
        {
            const std::string upper = toUpper(trim(text));
            if (upper == "TRACE")    return LogLevel::TRACE;
            if (upper == "DEBUG")    return LogLevel::DEBUG;
            if (upper == "INFO")     return LogLevel::INFO;
            if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
            if (upper == "ERROR")    return LogLevel::ERROR;
            if (upper == "CRITICAL") return LogLevel::CRITICAL;
            return std::nullopt;
        }

        Logger::Logger()
            : m_level(LogLevel::INFO),
              m_file(),
              m_fileEnabled(false),
              m_console(&std::cerr)
        {
        }

        Logger::~Logger()
        {
            if (m_file.is_open())
            {
                m_file.flush();
                m_file.close();
            }
        }

        void Logger::setLevel(LogLevel level) noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_level = level;
        }

        LogLevel Logger::level() const noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_level;
        }

        bool Logger::isEnabled(LogLevel level) const noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return static_cast<int>(level) >= static_cast<int>(m_level);
        }

        bool Logger::setFile(const std::string &filePath)
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            if (m_file.is_open())
            {
                m_file.close();
            }
            m_fileEnabled = false;

            if (filePath.empty())
            {
                return true;
            }

            m_file.clear();
            m_file.open(filePath, std::ios::out | std::ios::app);
            m_fileEnabled = m_file.is_open();
            return m_fileEnabled;
        }

        void Logger::setConsole(std::ostream *console) noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_console = console;
        }

        void Logger::log(LogLevel level, std::string_view message)
        {
            if (!isEnabled(level))
            {
                return;
            }

            const std::string tsStr = formatTimestamp(now(), "%Y-%m-%d %H:%M:%S");
            const char *levelStr = toString(level);

            std::string line;
            line.reserve(tsStr.size() + message.size() + 16);
            line.append("[");
            line.append(tsStr);
            line.append("] [");
            line.append(levelStr);
            line.append("] ");
            line.append(message);

            writeLine(line);
        }

        const char *Logger::toString(LogLevel level) noexcept
        {
            switch (level)
            {
            case LogLevel::TRACE:    return "TRACE";
            case LogLevel::DEBUG:    return "DEBUG";
            case LogLevel::INFO:     return "INFO";
            case LogLevel::WARN:     return "WARN";
            case LogLevel::ERROR:    return "ERROR";
            case LogLevel::CRITICAL: return "CRITICAL";
            default:                 return "UNKNOWN";
            }
        }

        void Logger::writeLine(std::string_view line)
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            if (m_console)
            {
                (*m_console) << line << '\n';
                m_console->flush();
            }

            if (m_fileEnabled && m_file.is_open())
            {
                m_file << line << '\n';
                m_file.flush();
            }
        }

        Logger &getLogger()
        {
            static Logger instance;
            return instance;
        }

    } // namespace Utils
} // namespace HiveVerify
