#include "report/ReportRenderer.hpp"

#include <cctype>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "utils/StringUtils.hpp"

#if defined(_WIN32)
  #include <io.h>      // _isatty, _fileno
#else
  #include <unistd.h>  // isatty, fileno
#endif

namespace HiveVerify
{
namespace Report
{
    namespace
    {
        constexpr const char *kGreen  = "\033[92m";
        constexpr const char *kRed    = "\033[91m";
        constexpr const char *kYellow = "\033[93m";
        constexpr const char *kReset  = "\033[0m";

        constexpr int kRuleWidth = 50;

        bool stdoutIsTty() noexcept
        {
        #if defined(_WIN32)
            return _isatty(_fileno(stdout)) != 0;
        #else
            return ::isatty(::fileno(stdout)) != 0;
        #endif
        }

        void printRanking(std::ostream &os, const char *heading,
                          const Analysis::FrequencyAnalyzer::Ranking &ranking)
        {
            if (ranking.empty())
                return;

            const int colName  = 40;
            const int colCount = 10;

            os << heading << "\n";
            os << "  " << std::left << std::setw(colName) << "Name"
               << std::right << std::setw(colCount) << "Count" << "\n";
            os << "  " << std::string(colName + colCount, '-') << "\n";
            for (const auto &[name, count] : ranking)
            {
                os << "  " << std::left << std::setw(colName) << name
                   << std::right << std::setw(colCount) << count << "\n";
            }
        }
    } // namespace

    ReportRenderer::ReportRenderer(ColorMode colors)
        : m_colorsEnabled(false),
          m_output(&std::cout)
    {
        setColorMode(colors);
    }

    std::string ReportRenderer::render(const core::VerificationReport &report) const
    {
        std::ostringstream out;

        const bool overall = report.passed();
        out << "\n=== HIVE LOG VERIFICATION REPORT ===\n";
        out << std::string(kRuleWidth, '=') << "\n";
        out << "Overall Status: "
            << (overall ? colorize("PASSED", kGreen) : colorize("FAILED", kRed)) << "\n\n";

        for (const auto &[name, result] : report)
        {
            out << categoryTitle(name) << ": "
                << (result.passed() ? colorize("PASSED", kGreen) : colorize("FAILED", kRed)) << "\n";

            for (const auto &[metric, value] : result.summary())
            {
                out << "  - " << metricLabel(metric) << ": " << value << "\n";
            }
            for (const auto &error : result.errors())
            {
                out << "  " << colorize("[ERROR]", kRed) << " " << error << "\n";
            }
            for (const auto &warning : result.warnings())
            {
                out << "  " << colorize("[WARN]", kYellow) << " " << warning << "\n";
            }
            out << "\n";
        }

        return out.str();
    }

    std::string ReportRenderer::renderStatistics(const Analysis::FrequencyAnalyzer::FrequencyStats &stats) const
    {
        std::ostringstream out;

        out << "=== LOG STATISTICS ===\n";
        out << "Total Entries: " << stats.totalEntries << "\n";
        out << "Threads:       " << stats.byThread.size() << "\n";

        if (!stats.byLevel.empty())
        {
            out << "By Level\n";
            for (const auto &[level, count] : stats.byLevel)
            {
                out << "  " << std::left << std::setw(10) << core::toString(level)
                    << std::right << std::setw(10) << count << "\n";
            }
        }

        printRanking(out, "Top Targets", stats.topTargets);
        printRanking(out, "Top Spans", stats.topSpans);
        out << "\n";

        return out.str();
    }

    int ReportRenderer::exitStatus(const core::VerificationReport &report) noexcept
    {
        return report.passed() ? 0 : 1;
    }

    void ReportRenderer::print(const core::VerificationReport &report)
    {
        *m_output << render(report);
        m_output->flush();
    }

    void ReportRenderer::printStatistics(const Analysis::FrequencyAnalyzer::FrequencyStats &stats)
    {
        *m_output << renderStatistics(stats);
        m_output->flush();
    }

    std::string ReportRenderer::categoryTitle(const std::string &name)
    {
        std::string title = Utils::replaceAll(name, "_", " ");
        bool wordStart = true;
        for (char &c : title)
        {
            const auto uc = static_cast<unsigned char>(c);
            if (std::isalpha(uc))
            {
                c = static_cast<char>(wordStart ? std::toupper(uc) : std::tolower(uc));
                wordStart = false;
            }
            else
            {
                wordStart = true;
            }
        }
        return title;
    }

    std::string ReportRenderer::metricLabel(const std::string &name)
    {
        return Utils::replaceAll(name, "_", " ");
    }

    void ReportRenderer::setColorMode(ColorMode mode) noexcept
    {
        switch (mode)
        {
        case ColorMode::ALWAYS: m_colorsEnabled = true; break;
        case ColorMode::AUTO:   m_colorsEnabled = stdoutIsTty(); break;
        case ColorMode::NEVER:
        default:                m_colorsEnabled = false; break;
        }
    }

    void ReportRenderer::setOutput(std::ostream &output) noexcept
    {
        m_output = &output;
    }

    std::string ReportRenderer::colorize(const std::string &text, const char *color) const
    {
        if (!m_colorsEnabled)
            return text;
        return std::string(color) + text + kReset;
    }

} // namespace Report
} // namespace HiveVerify
