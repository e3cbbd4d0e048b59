#include "core/LogEntry.hpp"

#include "utils/StringUtils.hpp"

namespace HiveVerify
{
namespace core
{

LogLevel parseLogLevel(std::string_view label) noexcept
{
    static const struct
    {
        std::string_view text;
        LogLevel level;
    } levelMap[] = {
        {"TRACE",    LogLevel::Trace},
        {"DEBUG",    LogLevel::Debug},
        {"INFO",     LogLevel::Info},
        {"WARN",     LogLevel::Warn},
        {"WARNING",  LogLevel::Warn},
        {"ERROR",    LogLevel::Error},
        {"FATAL",    LogLevel::Critical},
        {"CRIT",     LogLevel::Critical},
        {"CRITICAL", LogLevel::Critical},
    };

    const std::string_view trimmed = Utils::trim(label);
    for (const auto& mapping : levelMap)
    {
        if (Utils::iequals(trimmed, mapping.text))
        {
            return mapping.level;
        }
    }
    return LogLevel::Unknown;
}

const char* toString(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace:    return "TRACE";
    case LogLevel::Debug:    return "DEBUG";
    case LogLevel::Info:     return "INFO";
    case LogLevel::Warn:     return "WARN";
    case LogLevel::Error:    return "ERROR";
    case LogLevel::Critical: return "CRITICAL";
    default:                 return "UNKNOWN";
    }
}

} // namespace core
} // namespace HiveVerify
