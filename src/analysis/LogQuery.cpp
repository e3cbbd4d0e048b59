#include "analysis/LogQuery.hpp"

#include "utils/StringUtils.hpp"

namespace HiveVerify
{
    namespace Analysis
    {
        namespace
        {
            bool matches(std::string_view text, std::string_view pattern, bool ignoreCase)
            {
                return ignoreCase ? Utils::icontains(text, pattern)
                                  : Utils::contains(text, pattern);
            }
        } // namespace

        LogQuery::Selection LogQuery::byLevel(core::LogLevel level) const
        {
            return where([level](const core::LogEntry &e) { return e.severity() == level; });
        }

        LogQuery::Selection LogQuery::byTarget(std::string_view pattern, bool ignoreCase) const
        {
            return where([&](const core::LogEntry &e) { return matches(e.target(), pattern, ignoreCase); });
        }

        LogQuery::Selection LogQuery::bySpan(std::string_view pattern) const
        {
            return where([&](const core::LogEntry &e) { return Utils::contains(e.span(), pattern); });
        }

        LogQuery::Selection LogQuery::withMessage(std::string_view pattern, bool ignoreCase) const
        {
            return where([&](const core::LogEntry &e) { return matches(e.message(), pattern, ignoreCase); });
        }

        LogQuery::Selection LogQuery::withField(const std::string &name) const
        {
            return where([&](const core::LogEntry &e) { return e.hasField(name); });
        }

        LogQuery::Selection LogQuery::withFieldValue(const std::string &name, std::string_view value) const
        {
            return where([&](const core::LogEntry &e) {
                const auto v = e.field(name);
                return v && *v == value;
            });
        }

        LogQuery::Selection LogQuery::byThread(std::string_view threadId) const
        {
            return where([&](const core::LogEntry &e) { return e.threadId() == threadId; });
        }

        bool LogQuery::containsSequence(const std::vector<std::string> &patterns) const
        {
            std::size_t next = 0;
            for (const auto &entry : *m_entries)
            {
                if (next == patterns.size())
                {
                    break;
                }
                if (Utils::contains(entry.message(), patterns[next]))
                {
                    ++next;
                }
            }
            return next == patterns.size();
        }

    } // namespace Analysis
} // namespace HiveVerify
