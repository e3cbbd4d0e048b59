#pragma once

#include <optional>
#include <ostream>
#include <string>

#include "analysis/FrequencyAnalyzer.hpp"
#include "core/VerificationResult.hpp"

namespace HiveVerify
{
    namespace Report
    {
        /**
         * JsonReporter
         *
         * Responsibilities:
         *  - Generate structured JSON output for CI pipelines and scripts
         *  - Carry the same verdict as the text report (overall_passed, exit_status)
         *  - Optionally attach entry statistics
         *
         * Design notes:
         *  - No external dependencies; strings go through Utils::escapeJson
         *  - Categories and summary metrics keep report order
         *  - Compact and pretty-print modes
         *
         * Shape:
         *   {"generated": "...", "overall_passed": true, "exit_status": 0,
         *    "categories": {"system_startup": {"passed": true,
         *                   "summary": {...}, "errors": [...], "warnings": [...]}, ...},
         *    "statistics": {...}}   // only when statistics were supplied
         */
        class JsonReporter
        {
        public:
            enum class PrettyPrint
            {
                COMPACT,  // Single line, minimal whitespace
                PRETTY    // Indented, human-readable JSON
            };

            JsonReporter(PrettyPrint pretty = PrettyPrint::COMPACT);

            JsonReporter(const JsonReporter &) = default;
            JsonReporter &operator=(const JsonReporter &) = default;

            /**
             * Capture the data to serialize. Statistics are optional; pass
             * nullptr to leave the "statistics" member out.
             */
            void generateReport(const core::VerificationReport &report,
                                const Analysis::FrequencyAnalyzer::FrequencyStats *stats = nullptr);

            void writeJson(std::ostream &output) const;

            std::string getJsonString() const;

            /// One category object: passed, summary, errors, warnings.
            std::string categoryToJson(const core::VerificationResult &result) const;

            std::string statisticsToJson(const Analysis::FrequencyAnalyzer::FrequencyStats &stats) const;

            void setPrettyPrint(PrettyPrint mode) noexcept;

        private:
            std::string newline() const;
            std::string indent(int depth) const;
            std::string separator() const;

        private:
            core::VerificationReport m_report;
            std::optional<Analysis::FrequencyAnalyzer::FrequencyStats> m_stats;
            PrettyPrint m_prettyPrint;
        };

        /**
         * Convenience: serialize in one call.
         */
        std::string toJson(const core::VerificationReport &report,
                           const Analysis::FrequencyAnalyzer::FrequencyStats *stats = nullptr,
                           JsonReporter::PrettyPrint pretty = JsonReporter::PrettyPrint::PRETTY);

    } // namespace Report
} // namespace HiveVerify
