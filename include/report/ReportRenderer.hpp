#pragma once

#include <iosfwd>
#include <string>

#include "analysis/FrequencyAnalyzer.hpp"
#include "core/VerificationResult.hpp"

namespace HiveVerify
{
    namespace Report
    {
        /**
         * ReportRenderer
         *
         * Responsibilities:
         *  - Turn a VerificationReport into human-readable text.
         *  - Derive the process exit status from it.
         *
         * Layout: title, overall status, then one block per category in
         * report order: "<Title>: PASSED|FAILED", its summary metrics, its
         * errors, its warnings, and a blank line.
         *
         * ANSI colors are added only when enabled (AUTO enables them when
         * stdout is a terminal).
         */
        class ReportRenderer
        {
        public:
            enum class ColorMode
            {
                NEVER,
                ALWAYS,
                AUTO
            };

            explicit ReportRenderer(ColorMode colors = ColorMode::NEVER);

            ReportRenderer(const ReportRenderer &) = default;
            ReportRenderer &operator=(const ReportRenderer &) = default;

            /// Full text report; ends with a blank line after the last category.
            std::string render(const core::VerificationReport &report) const;

            /// Entry statistics block (used with --stats).
            std::string renderStatistics(const Analysis::FrequencyAnalyzer::FrequencyStats &stats) const;

            /// 0 when every category passed, 1 otherwise.
            static int exitStatus(const core::VerificationReport &report) noexcept;

            /// Write render(report) to the output stream and flush.
            void print(const core::VerificationReport &report);

            void printStatistics(const Analysis::FrequencyAnalyzer::FrequencyStats &stats);

            /// "agent_lifecycle" -> "Agent Lifecycle"
            static std::string categoryTitle(const std::string &name);

            /// "hive_startup_events" -> "hive startup events"
            static std::string metricLabel(const std::string &name);

            void setColorMode(ColorMode mode) noexcept;
            bool colorsEnabled() const noexcept { return m_colorsEnabled; }

            /// Redirect print() output (defaults to std::cout).
            void setOutput(std::ostream &output) noexcept;

        private:
            std::string colorize(const std::string &text, const char *color) const;

        private:
            bool m_colorsEnabled;
            std::ostream *m_output;
        };

    } // namespace Report
} // namespace HiveVerify
