#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "core/LogEntry.hpp"

namespace HiveVerify
{
    namespace Analysis
    {
        /**
         * FrequencyAnalyzer
         *
         * Counts entries per severity, target, span and thread so a
         * verification run can show what the log actually contained next to
         * what was expected. Entries with an empty span are not counted per
         * span.
         */
        class FrequencyAnalyzer
        {
        public:
            using Ranking = std::vector<std::pair<std::string, std::size_t>>;

            struct FrequencyStats
            {
                std::size_t totalEntries = 0;

                std::map<core::LogLevel, std::size_t> byLevel;
                std::map<std::string, std::size_t> byTarget;
                std::map<std::string, std::size_t> bySpan;
                std::map<std::string, std::size_t> byThread;

                Ranking topTargets; // count desc, then name asc
                Ranking topSpans;
            };

            explicit FrequencyAnalyzer(std::size_t topN = 10);

            FrequencyAnalyzer(const FrequencyAnalyzer &)            = delete;
            FrequencyAnalyzer &operator=(const FrequencyAnalyzer &) = delete;

            void addEntry(const core::LogEntry &entry);
            void addEntries(const std::vector<core::LogEntry> &entries);

            FrequencyStats getStats() const;

            void reset();

            std::size_t topN() const noexcept { return m_topN; }

        private:
            static Ranking rank(const std::map<std::string, std::size_t> &counts, std::size_t limit);

        private:
            mutable std::mutex m_mutex;

            std::size_t m_total = 0;
            std::map<core::LogLevel, std::size_t> m_levelCounts;
            std::map<std::string, std::size_t> m_targetCounts;
            std::map<std::string, std::size_t> m_spanCounts;
            std::map<std::string, std::size_t> m_threadCounts;

            std::size_t m_topN;
        };

    } // namespace Analysis
} // namespace HiveVerify
