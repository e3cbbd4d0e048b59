// Core data model representing a single parsed HIVE tracing log line.
// Value type: cheap to keep in a std::vector and never mutated once the
// parser has built it.

#ifndef HIVE_VERIFY_CORE_LOG_ENTRY_HPP
#define HIVE_VERIFY_CORE_LOG_ENTRY_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace HiveVerify
{
namespace core
{

/**
 * @brief Normalized severity, derived from the level label of a line.
 *
 * The label itself is kept verbatim on the entry; this enum exists for
 * statistics and level filters.
 */
enum class LogLevel : std::uint8_t
{
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Unknown  ///< Label not recognized.
};

/**
 * @brief Map a level label ("INFO", "warn", "WARNING", "FATAL", ...) onto LogLevel.
 */
LogLevel parseLogLevel(std::string_view label) noexcept;

/// Upper-case name of a LogLevel ("UNKNOWN" for Unknown).
const char* toString(LogLevel level) noexcept;

/**
 * @brief One parsed log line.
 *
 * Line grammar:
 *   TIMESTAMP LEVEL ThreadId(N) SPAN:TARGET MESSAGE key=value ...
 *
 * Design notes:
 *  - timestamp and level are opaque strings carried through unchanged.
 *  - message keeps the trailing key=value tokens; fields is an
 *    additional, extracted view of them.
 *  - Accessors only: an entry is built once by the parser.
 */
class LogEntry
{
public:
    using Fields = std::unordered_map<std::string, std::string>;

    /// Literal thread id used when the thread token is not ThreadId(N).
    static constexpr const char* kUnknownThread = "unknown";

    LogEntry() = default;

    LogEntry(std::string timestamp,
             std::string level,
             std::string threadId,
             std::string span,
             std::string target,
             std::string message,
             Fields fields = {})
        : m_timestamp(std::move(timestamp)),
          m_level(std::move(level)),
          m_threadId(std::move(threadId)),
          m_span(std::move(span)),
          m_target(std::move(target)),
          m_message(std::move(message)),
          m_fields(std::move(fields))
    {
    }

    LogEntry(const LogEntry&)            = default;
    LogEntry(LogEntry&&) noexcept        = default;
    LogEntry& operator=(const LogEntry&) = default;
    LogEntry& operator=(LogEntry&&) noexcept = default;

    ~LogEntry() = default;

    // ---------- Accessors ----------

    const std::string& timestamp() const noexcept { return m_timestamp; }

    /// Level label exactly as written in the line.
    const std::string& level() const noexcept { return m_level; }

    /// Digits from ThreadId(N), or "unknown".
    const std::string& threadId() const noexcept { return m_threadId; }

    /// Span portion of the span:target segment; empty when the segment has no colon.
    const std::string& span() const noexcept { return m_span; }

    const std::string& target() const noexcept { return m_target; }

    const std::string& message() const noexcept { return m_message; }

    const Fields& fields() const noexcept { return m_fields; }

    // ---------- Convenience Methods ----------

    LogLevel severity() const noexcept
    {
        return parseLogLevel(m_level);
    }

    bool hasField(const std::string& key) const
    {
        return m_fields.find(key) != m_fields.end();
    }

    std::optional<std::string> field(const std::string& key) const
    {
        auto it = m_fields.find(key);
        if (it == m_fields.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::string m_timestamp;
    std::string m_level;
    std::string m_threadId{kUnknownThread};
    std::string m_span;
    std::string m_target;
    std::string m_message;
    Fields      m_fields;
};

} // namespace core
} // namespace HiveVerify

#endif // HIVE_VERIFY_CORE_LOG_ENTRY_HPP
