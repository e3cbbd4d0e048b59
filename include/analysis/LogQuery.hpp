#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "core/LogEntry.hpp"

namespace HiveVerify
{
    namespace Analysis
    {
        /**
         * LogQuery
         *
         * Read-only filtering over an already parsed entry sequence. The
         * verification checks are written in terms of these selections, and
         * tests and tools use them to ask ad-hoc questions about a log.
         *
         * Design notes:
         *  - Non-owning: the entry vector must outlive the query and every
         *    Selection taken from it.
         *  - Selections keep input order.
         *  - Pattern filters are substring matches; an empty pattern matches
         *    every entry.
         */
        class LogQuery
        {
        public:
            using Selection = std::vector<const core::LogEntry *>;

            explicit LogQuery(const std::vector<core::LogEntry> &entries) noexcept
                : m_entries(&entries)
            {
            }

            std::size_t size() const noexcept { return m_entries->size(); }

            /// Entries for which pred(entry) is true.
            template <typename Predicate>
            Selection where(Predicate pred) const
            {
                Selection out;
                for (const auto &entry : *m_entries)
                {
                    if (pred(entry))
                    {
                        out.push_back(&entry);
                    }
                }
                return out;
            }

            /// Number of entries for which pred(entry) is true.
            template <typename Predicate>
            std::size_t count(Predicate pred) const
            {
                std::size_t n = 0;
                for (const auto &entry : *m_entries)
                {
                    if (pred(entry))
                    {
                        ++n;
                    }
                }
                return n;
            }

            Selection byLevel(core::LogLevel level) const;

            Selection byTarget(std::string_view pattern, bool ignoreCase = false) const;

            Selection bySpan(std::string_view pattern) const;

            Selection withMessage(std::string_view pattern, bool ignoreCase = false) const;

            Selection withField(const std::string &name) const;

            Selection withFieldValue(const std::string &name, std::string_view value) const;

            /// Exact thread id ("7" for ThreadId(7), or "unknown").
            Selection byThread(std::string_view threadId) const;

            /**
             * True if messages containing patterns[0], patterns[1], ... occur
             * in that order (not necessarily adjacent). An empty list is
             * trivially contained.
             */
            bool containsSequence(const std::vector<std::string> &patterns) const;

        private:
            const std::vector<core::LogEntry> *m_entries;
        };

    } // namespace Analysis
} // namespace HiveVerify
