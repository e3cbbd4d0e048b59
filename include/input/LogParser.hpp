#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/LogEntry.hpp"

namespace HiveVerify
{
    namespace Input
    {
        /**
         * LogParser
         *
         * Responsibilities:
         *  - Turn captured HIVE tracing output into ordered core::LogEntry values.
         *  - Skip lines that do not follow the grammar, without failing the parse.
         *
         * Line grammar (five whitespace-delimited top-level segments):
         *
         *   TIMESTAMP LEVEL THREAD SPAN:TARGET MESSAGE...
         *
         *   - THREAD is ThreadId(N); anything else yields thread id "unknown".
         *   - SPAN:TARGET splits at the first colon; without a colon the whole
         *     segment is the target and the span is empty.
         *   - MESSAGE is the rest of the line. Every key=value token in it
         *     becomes a field. One leading and one trailing '"' are stripped
         *     from the value. When a key repeats, the last occurrence wins.
         *
         * Design notes:
         *  - Stateless and copyable; all parsing is const.
         *  - Recovery is per line: a line that is short, or whose handling
         *    throws, is dropped and parsing continues with the next line.
         */
        class LogParser
        {
        public:
            /// Number of top-level segments in a well-formed line.
            static constexpr std::size_t kSegmentCount = 5;

            /// Diagnostic view of a single line.
            struct ParseResult
            {
                std::optional<core::LogEntry> entry;
                bool malformed = false;
                std::string error; // best-effort reason when malformed
            };

            /// Line counters for one parse() call.
            struct ParseStats
            {
                std::size_t totalLines   = 0;
                std::size_t blankLines   = 0;
                std::size_t parsedLines  = 0;
                std::size_t skippedLines = 0;
            };

            LogParser() = default;

            LogParser(const LogParser &)            = default;
            LogParser &operator=(const LogParser &) = default;

            LogParser(LogParser &&)                 = default;
            LogParser &operator=(LogParser &&)      = default;

            /**
             * Parse a whole log buffer.
             *
             * Never throws for malformed input: empty, blank or fully malformed
             * text yields an empty vector. Entries keep input line order.
             * Pass stats to receive line counters.
             */
            std::vector<core::LogEntry> parse(std::string_view text,
                                              ParseStats *stats = nullptr) const;

            /// Parse one line; std::nullopt if it is blank or malformed.
            std::optional<core::LogEntry> parseLine(std::string_view rawLine) const;

            /// Parse one line and report why it was rejected.
            ParseResult parseLineDetailed(std::string_view rawLine) const;

            // ---- Grammar building blocks (exposed for tests and tools) ----

            /**
             * Split into at most kSegmentCount segments on runs of whitespace.
             * The last segment is the untouched remainder of the line.
             */
            static std::vector<std::string_view> splitSegments(std::string_view line);

            /// Digits of a leading ThreadId(N), else "unknown".
            static std::string extractThreadId(std::string_view token);

            /// {span, target} split at the first colon.
            static std::pair<std::string, std::string> splitSpanTarget(std::string_view segment);

            /**
             * Tokenizer for key=value fields.
             *
             * Scans left to right for [A-Za-z0-9_]+=\S+ without overlap;
             * later keys overwrite earlier ones. Hand-written and linear, so
             * values of any length are safe.
             */
            static core::LogEntry::Fields extractFields(std::string_view text);

            /// Remove one leading and one trailing '"', paired or not.
            static std::string stripQuotes(std::string_view value);
        };

    } // namespace Input
} // namespace HiveVerify
