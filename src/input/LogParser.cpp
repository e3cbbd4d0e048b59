#include "input/LogParser.hpp"

#include <algorithm>
#include <cctype>
#include <exception>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace HiveVerify
{
    namespace Input
    {
        namespace
        {
            inline bool isSpace(char c) noexcept
            {
                return std::isspace(static_cast<unsigned char>(c)) != 0;
            }

            inline bool isDigit(char c) noexcept
            {
                return std::isdigit(static_cast<unsigned char>(c)) != 0;
            }

            // [A-Za-z0-9_]
            inline bool isKeyChar(char c) noexcept
            {
                return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
            }

            constexpr std::string_view kThreadPrefix = "ThreadId(";
        } // anonymous namespace

        std::vector<core::LogEntry> LogParser::parse(std::string_view text,
                                                     ParseStats *stats) const
        {
            auto &logger = Utils::getLogger();

            ParseStats counters;
            std::vector<core::LogEntry> entries;

            std::size_t start = 0;
            while (start < text.size())
            {
                const std::size_t newline = text.find('\n', start);
                const std::size_t end = (newline == std::string_view::npos) ? text.size() : newline;
                std::string_view line = text.substr(start, end - start);
                start = end + 1;

                ++counters.totalLines;

                if (!line.empty() && line.back() == '\r')
                {
                    line.remove_suffix(1);
                }

                if (Utils::isBlank(line))
                {
                    ++counters.blankLines;
                    continue;
                }

                auto result = parseLineDetailed(line);
                if (result.entry)
                {
                    entries.push_back(std::move(*result.entry));
                    ++counters.parsedLines;
                }
                else
                {
                    ++counters.skippedLines;
                    if (logger.isEnabled(Utils::LogLevel::DEBUG))
                    {
                        logger.debug("Skipping line " + std::to_string(counters.totalLines) +
                                     ": " + result.error);
                    }
                }
            }

            logger.debug("Parsed " + std::to_string(counters.parsedLines) + " of " +
                         std::to_string(counters.totalLines) + " lines (" +
                         std::to_string(counters.skippedLines) + " skipped)");

            if (stats)
            {
                *stats = counters;
            }
            return entries;
        }

        std::optional<core::LogEntry> LogParser::parseLine(std::string_view rawLine) const
        {
            return parseLineDetailed(rawLine).entry;
        }

        LogParser::ParseResult LogParser::parseLineDetailed(std::string_view rawLine) const
        {
            ParseResult r;

            if (Utils::isBlank(rawLine))
            {
                r.malformed = true;
                r.error = "Empty line";
                return r;
            }

            try
            {
                const auto segments = splitSegments(rawLine);
                if (segments.size() < kSegmentCount)
                {
                    r.malformed = true;
                    r.error = "Expected " + std::to_string(kSegmentCount) +
                              " segments, found " + std::to_string(segments.size());
                    return r;
                }

                auto [span, target] = splitSpanTarget(segments[3]);

                r.entry = core::LogEntry(std::string(segments[0]),
                                         std::string(segments[1]),
                                         extractThreadId(segments[2]),
                                         std::move(span),
                                         std::move(target),
                                         std::string(segments[4]),
                                         extractFields(segments[4]));
            }
            catch (const std::exception &e)
            {
                r.entry.reset();
                r.malformed = true;
                r.error = e.what();
            }

            return r;
        }

        std::vector<std::string_view> LogParser::splitSegments(std::string_view line)
        {
            std::vector<std::string_view> segments;
            segments.reserve(kSegmentCount);

            std::size_t pos = 0;
            while (segments.size() + 1 < kSegmentCount)
            {
                while (pos < line.size() && isSpace(line[pos]))
                {
                    ++pos;
                }
                if (pos == line.size())
                {
                    return segments;
                }

                const std::size_t begin = pos;
                while (pos < line.size() && !isSpace(line[pos]))
                {
                    ++pos;
                }
                segments.push_back(line.substr(begin, pos - begin));
            }

            while (pos < line.size() && isSpace(line[pos]))
            {
                ++pos;
            }
            if (pos < line.size())
            {
                segments.push_back(line.substr(pos));
            }

            return segments;
        }

        std::string LogParser::extractThreadId(std::string_view token)
        {
            if (!Utils::startsWith(token, kThreadPrefix))
            {
                return core::LogEntry::kUnknownThread;
            }

            std::size_t end = kThreadPrefix.size();
            while (end < token.size() && isDigit(token[end]))
            {
                ++end;
            }
            if (end == kThreadPrefix.size() || end == token.size() || token[end] != ')')
            {
                return core::LogEntry::kUnknownThread;
            }
            return std::string(token.substr(kThreadPrefix.size(), end - kThreadPrefix.size()));
        }

        std::pair<std::string, std::string> LogParser::splitSpanTarget(std::string_view segment)
        {
            const auto colon = segment.find(':');
            if (colon == std::string_view::npos)
            {
                return {std::string(), std::string(segment)};
            }
            return {std::string(segment.substr(0, colon)),
                    std::string(segment.substr(colon + 1))};
        }

        core::LogEntry::Fields LogParser::extractFields(std::string_view text)
        {
            core::LogEntry::Fields fields;

            // Linear scan: each '=' followed by a non-space is a candidate;
            // its key is the run of key characters before it, bounded by the
            // end of the previous match.
            std::size_t pos = 0;
            std::size_t eq = 0;
            while ((eq = text.find('=', std::max(eq, pos))) != std::string_view::npos)
            {
                if (eq + 1 >= text.size() || isSpace(text[eq + 1]))
                {
                    ++eq;
                    continue;
                }

                std::size_t keyBegin = eq;
                while (keyBegin > pos && isKeyChar(text[keyBegin - 1]))
                {
                    --keyBegin;
                }
                if (keyBegin == eq)
                {
                    ++eq;
                    continue;
                }

                std::size_t valueEnd = eq + 1;
                while (valueEnd < text.size() && !isSpace(text[valueEnd]))
                {
                    ++valueEnd;
                }

                // Assignment, not emplace: the last occurrence of a key wins.
                fields[std::string(text.substr(keyBegin, eq - keyBegin))] =
                    stripQuotes(text.substr(eq + 1, valueEnd - eq - 1));
                pos = valueEnd;
            }

            return fields;
        }

        std::string LogParser::stripQuotes(std::string_view value)
        {
            if (!value.empty() && value.front() == '"')
            {
                value.remove_prefix(1);
            }
            if (!value.empty() && value.back() == '"')
            {
                value.remove_suffix(1);
            }
            return std::string(value);
        }

    } // namespace Input
} // namespace HiveVerify
