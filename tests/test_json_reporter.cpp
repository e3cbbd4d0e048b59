#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "analysis/FrequencyAnalyzer.hpp"
#include "core/VerificationResult.hpp"
#include "report/JsonReporter.hpp"

using HiveVerify::core::VerificationReport;
using HiveVerify::core::VerificationResult;
using HiveVerify::Report::JsonReporter;

namespace {

VerificationReport failingReport() {
    VerificationResult llm;
    llm.setMetric("llm_requests", 0);
    llm.setMetric("network_connections", 2);
    llm.addError("No LLM requests found");

    VerificationReport report;
    report.add("llm_interaction", llm);
    return report;
}

} // namespace

TEST(JsonReporter, CompactCategoryObject) {
    const JsonReporter reporter(JsonReporter::PrettyPrint::COMPACT);
    const auto json = reporter.categoryToJson(*failingReport().find("llm_interaction"));

    EXPECT_EQ(json,
              "{\"passed\":false,"
              "\"summary\":{\"llm_requests\":0,\"network_connections\":2},"
              "\"errors\":[\"No LLM requests found\"],"
              "\"warnings\":[]}");
}

TEST(JsonReporter, CompactReportCarriesVerdict) {
    JsonReporter reporter(JsonReporter::PrettyPrint::COMPACT);
    reporter.generateReport(failingReport());
    const auto json = reporter.getJsonString();

    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_NE(json.find("\"overall_passed\":false"), std::string::npos);
    EXPECT_NE(json.find("\"exit_status\":1"), std::string::npos);
    EXPECT_NE(json.find("\"categories\":{\"llm_interaction\":{"), std::string::npos);
    EXPECT_EQ(json.find("\"statistics\""), std::string::npos);
    EXPECT_EQ(json.find('\n'), std::string::npos);
}

TEST(JsonReporter, PrettyOutputIsIndented) {
    const auto json = HiveVerify::Report::toJson(VerificationReport{});
    EXPECT_NE(json.find("\n  \"overall_passed\": true"), std::string::npos);
    EXPECT_NE(json.find("\"exit_status\": 0"), std::string::npos);
    EXPECT_NE(json.find("\"categories\": {}"), std::string::npos);
}

TEST(JsonReporter, EscapesMessages) {
    VerificationResult result;
    result.addWarning("quote \" backslash \\ tab \t");
    VerificationReport report;
    report.add("system_startup", result);

    const auto json = HiveVerify::Report::toJson(report, nullptr, JsonReporter::PrettyPrint::COMPACT);
    EXPECT_NE(json.find("\"quote \\\" backslash \\\\ tab \\t\""), std::string::npos);
}

TEST(JsonReporter, IncludesStatisticsWhenGiven) {
    HiveVerify::Analysis::FrequencyAnalyzer analyzer;
    analyzer.addEntry(HiveVerify::core::LogEntry("ts", "INFO", "1", "main", "hive", "hello"));
    const auto stats = analyzer.getStats();

    const auto json = HiveVerify::Report::toJson(failingReport(), &stats, JsonReporter::PrettyPrint::COMPACT);
    EXPECT_NE(json.find("\"statistics\":{\"total_entries\":1,"), std::string::npos);
    EXPECT_NE(json.find("\"by_level\":{\"INFO\":1}"), std::string::npos);
    EXPECT_NE(json.find("\"by_span\":{\"main\":1}"), std::string::npos);
}
