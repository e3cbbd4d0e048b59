#include "analysis/FrequencyAnalyzer.hpp"

#include <algorithm>

#include "utils/Logger.hpp"

namespace HiveVerify
{
    namespace Analysis
    {
        FrequencyAnalyzer::FrequencyAnalyzer(std::size_t topN)
            : m_topN(topN)
        {
        }

        void FrequencyAnalyzer::addEntry(const core::LogEntry &entry)
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            ++m_total;
            ++m_levelCounts[entry.severity()];
            ++m_targetCounts[entry.target()];
            ++m_threadCounts[entry.threadId()];
            if (!entry.span().empty())
            {
                ++m_spanCounts[entry.span()];
            }
        }

        void FrequencyAnalyzer::addEntries(const std::vector<core::LogEntry> &entries)
        {
            for (const auto &entry : entries)
            {
                addEntry(entry);
            }
            Utils::getLogger().debug("FrequencyAnalyzer counted " + std::to_string(entries.size()) + " entries");
        }

        FrequencyAnalyzer::FrequencyStats FrequencyAnalyzer::getStats() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            FrequencyStats stats;
            stats.totalEntries = m_total;
            stats.byLevel      = m_levelCounts;
            stats.byTarget     = m_targetCounts;
            stats.bySpan       = m_spanCounts;
            stats.byThread     = m_threadCounts;
            stats.topTargets   = rank(m_targetCounts, m_topN);
            stats.topSpans     = rank(m_spanCounts, m_topN);
            return stats;
        }

        void FrequencyAnalyzer::reset()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_total = 0;
            m_levelCounts.clear();
            m_targetCounts.clear();
            m_spanCounts.clear();
            m_threadCounts.clear();
        }

        FrequencyAnalyzer::Ranking FrequencyAnalyzer::rank(const std::map<std::string, std::size_t> &counts,
                                                           std::size_t limit)
        {
            Ranking ranking(counts.begin(), counts.end());

            // std::map iteration is already name-ordered; stable_sort keeps that for ties.
            std::stable_sort(ranking.begin(), ranking.end(),
                             [](const auto &a, const auto &b) { return a.second > b.second; });

            if (limit > 0 && ranking.size() > limit)
            {
                ranking.resize(limit);
            }
            return ranking;
        }

    } // namespace Analysis
} // namespace HiveVerify
