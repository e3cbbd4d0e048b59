#include "report/JsonReporter.hpp"

#include <sstream>

#include "report/ReportRenderer.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace HiveVerify
{
namespace Report
{
    namespace
    {
        std::string quoted(std::string_view s)
        {
            return "\"" + Utils::escapeJson(s) + "\"";
        }
    } // namespace

    JsonReporter::JsonReporter(PrettyPrint pretty)
        : m_prettyPrint(pretty)
    {
    }

    void JsonReporter::generateReport(const core::VerificationReport &report,
                                      const Analysis::FrequencyAnalyzer::FrequencyStats *stats)
    {
        m_report = report;
        if (stats)
            m_stats = *stats;
        else
            m_stats.reset();

        Utils::getLogger().debug(
            "Json report prepared: " + std::to_string(m_report.size()) + " categories");
    }

    void JsonReporter::writeJson(std::ostream &output) const
    {
        const std::string nl = newline();

        output << "{" << nl;
        output << indent(1) << "\"generated\":" << separator() << quoted(Utils::toIso8601(Utils::now())) << "," << nl;
        output << indent(1) << "\"overall_passed\":" << separator() << (m_report.passed() ? "true" : "false") << "," << nl;
        output << indent(1) << "\"exit_status\":" << separator() << ReportRenderer::exitStatus(m_report) << "," << nl;

        output << indent(1) << "\"categories\":" << separator() << "{";
        bool first = true;
        for (const auto &[name, result] : m_report)
        {
            output << (first ? "" : ",") << nl;
            output << indent(2) << quoted(name) << ":" << separator() << categoryToJson(result);
            first = false;
        }
        if (!first)
            output << nl << indent(1);
        output << "}";

        if (m_stats)
        {
            output << "," << nl;
            output << indent(1) << "\"statistics\":" << separator() << statisticsToJson(*m_stats);
        }

        output << nl << "}";
        if (m_prettyPrint == PrettyPrint::PRETTY)
            output << "\n";
    }

    std::string JsonReporter::getJsonString() const
    {
        std::ostringstream oss;
        writeJson(oss);
        return oss.str();
    }

    std::string JsonReporter::categoryToJson(const core::VerificationResult &result) const
    {
        std::ostringstream oss;
        const std::string sep = separator();

        oss << "{";
        oss << "\"passed\":" << sep << (result.passed() ? "true" : "false") << "," << sep;

        oss << "\"summary\":" << sep << "{";
        for (std::size_t i = 0; i < result.summary().size(); ++i)
        {
            const auto &[name, value] = result.summary()[i];
            if (i) oss << "," << sep;
            oss << quoted(name) << ":" << sep << value;
        }
        oss << "}," << sep;

        oss << "\"errors\":" << sep << "[";
        for (std::size_t i = 0; i < result.errors().size(); ++i)
        {
            if (i) oss << "," << sep;
            oss << quoted(result.errors()[i]);
        }
        oss << "]," << sep;

        oss << "\"warnings\":" << sep << "[";
        for (std::size_t i = 0; i < result.warnings().size(); ++i)
        {
            if (i) oss << "," << sep;
            oss << quoted(result.warnings()[i]);
        }
        oss << "]";

        oss << "}";
        return oss.str();
    }

    std::string JsonReporter::statisticsToJson(const Analysis::FrequencyAnalyzer::FrequencyStats &stats) const
    {
        std::ostringstream oss;
        const std::string sep = separator();

        auto writeCounts = [&](const char *key, const auto &counts, auto keyOf) {
            oss << "\"" << key << "\":" << sep << "{";
            bool first = true;
            for (const auto &[k, count] : counts)
            {
                if (!first) oss << "," << sep;
                oss << quoted(keyOf(k)) << ":" << sep << count;
                first = false;
            }
            oss << "}";
        };
        const auto asIs = [](const std::string &s) { return s; };

        oss << "{";
        oss << "\"total_entries\":" << sep << stats.totalEntries << "," << sep;
        writeCounts("by_level", stats.byLevel,
                    [](core::LogLevel level) { return std::string(core::toString(level)); });
        oss << "," << sep;
        writeCounts("by_target", stats.byTarget, asIs);
        oss << "," << sep;
        writeCounts("by_span", stats.bySpan, asIs);
        oss << "," << sep;
        writeCounts("by_thread", stats.byThread, asIs);
        oss << "}";
        return oss.str();
    }

    void JsonReporter::setPrettyPrint(PrettyPrint mode) noexcept
    {
        m_prettyPrint = mode;
    }

    // ---- Private helpers ----

    std::string JsonReporter::newline() const
    {
        return m_prettyPrint == PrettyPrint::PRETTY ? "\n" : "";
    }

    std::string JsonReporter::indent(int depth) const
    {
        if (m_prettyPrint != PrettyPrint::PRETTY)
            return {};
        return std::string(static_cast<std::size_t>(depth) * 2, ' ');
    }

    std::string JsonReporter::separator() const
    {
        return m_prettyPrint == PrettyPrint::PRETTY ? " " : "";
    }

    std::string toJson(const core::VerificationReport &report,
                       const Analysis::FrequencyAnalyzer::FrequencyStats *stats,
                       JsonReporter::PrettyPrint pretty)
    {
        JsonReporter reporter(pretty);
        reporter.generateReport(report, stats);
        return reporter.getJsonString();
    }

} // namespace Report
} // namespace HiveVerify
