#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "analysis/FrequencyAnalyzer.hpp"
#include "core/VerificationResult.hpp"
#include "report/ReportRenderer.hpp"

using HiveVerify::core::VerificationReport;
using HiveVerify::core::VerificationResult;
using HiveVerify::Report::ReportRenderer;

namespace {

VerificationReport sampleReport() {
    VerificationResult startup;
    startup.setMetric("hive_startup_events", 1);
    startup.setMetric("config_events", 0);
    startup.addWarning("No config loading events found");

    VerificationResult lifecycle;
    lifecycle.setMetric("agents_started", 0);
    lifecycle.addError("No agents were started");

    VerificationReport report;
    report.add("system_startup", startup);
    report.add("agent_lifecycle", lifecycle);
    return report;
}

} // namespace

TEST(ReportRenderer, CategoryTitleAndMetricLabel) {
    EXPECT_EQ(ReportRenderer::categoryTitle("agent_lifecycle"), "Agent Lifecycle");
    EXPECT_EQ(ReportRenderer::categoryTitle("llm_interaction"), "Llm Interaction");
    EXPECT_EQ(ReportRenderer::metricLabel("hive_startup_events"), "hive startup events");
}

TEST(ReportRenderer, RendersCategoriesInOrder) {
    const ReportRenderer renderer;
    const std::string text = renderer.render(sampleReport());

    EXPECT_NE(text.find("=== HIVE LOG VERIFICATION REPORT ==="), std::string::npos);
    EXPECT_NE(text.find("Overall Status: FAILED"), std::string::npos);

    const auto startup = text.find("System Startup: PASSED");
    const auto lifecycle = text.find("Agent Lifecycle: FAILED");
    ASSERT_NE(startup, std::string::npos);
    ASSERT_NE(lifecycle, std::string::npos);
    EXPECT_LT(startup, lifecycle);
}

TEST(ReportRenderer, MetricsThenErrorsThenWarnings) {
    VerificationResult result;
    result.addWarning("a warning");
    result.addError("an error");
    result.setMetric("some_metric", 3);

    VerificationReport report;
    report.add("tool_execution", result);

    const std::string text = ReportRenderer().render(report);
    const auto metric = text.find("  - some metric: 3");
    const auto error = text.find("  [ERROR] an error");
    const auto warning = text.find("  [WARN] a warning");
    ASSERT_NE(metric, std::string::npos);
    ASSERT_NE(error, std::string::npos);
    ASSERT_NE(warning, std::string::npos);
    EXPECT_LT(metric, error);
    EXPECT_LT(error, warning);
}

TEST(ReportRenderer, NoAnsiCodesWhenColorsDisabled) {
    const ReportRenderer renderer(ReportRenderer::ColorMode::NEVER);
    EXPECT_FALSE(renderer.colorsEnabled());
    EXPECT_EQ(renderer.render(sampleReport()).find('\033'), std::string::npos);
}

TEST(ReportRenderer, AnsiCodesWhenColorsForced) {
    const ReportRenderer renderer(ReportRenderer::ColorMode::ALWAYS);
    EXPECT_TRUE(renderer.colorsEnabled());
    EXPECT_NE(renderer.render(sampleReport()).find("\033[91mFAILED\033[0m"), std::string::npos);
}

TEST(ReportRenderer, ExitStatusFollowsVerdict) {
    EXPECT_EQ(ReportRenderer::exitStatus(sampleReport()), 1);
    EXPECT_EQ(ReportRenderer::exitStatus(VerificationReport{}), 0);

    VerificationResult warnOnly;
    warnOnly.addWarning("advisory");
    VerificationReport report;
    report.add("llm_interaction", warnOnly);
    EXPECT_EQ(ReportRenderer::exitStatus(report), 0);
}

TEST(ReportRenderer, PrintWritesToConfiguredStream) {
    ReportRenderer renderer;
    std::ostringstream out;
    renderer.setOutput(out);
    renderer.print(sampleReport());
    EXPECT_EQ(out.str(), renderer.render(sampleReport()));
}

TEST(ReportRenderer, RendersStatistics) {
    HiveVerify::Analysis::FrequencyAnalyzer analyzer;
    analyzer.addEntry(HiveVerify::core::LogEntry("ts", "INFO", "1", "main", "hive", "hello"));
    analyzer.addEntry(HiveVerify::core::LogEntry("ts", "DEBUG", "2", "", "hive", "world"));

    const std::string text = ReportRenderer().renderStatistics(analyzer.getStats());
    EXPECT_NE(text.find("=== LOG STATISTICS ==="), std::string::npos);
    EXPECT_NE(text.find("Total Entries: 2"), std::string::npos);
    EXPECT_NE(text.find("Top Targets"), std::string::npos);
    EXPECT_NE(text.find("hive"), std::string::npos);
}
