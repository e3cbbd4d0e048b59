#include <gtest/gtest.h>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "core/LogEntry.hpp"
#include "utils/Logger.hpp"
#include "verify/Checks.hpp"

using HiveVerify::core::LogEntry;
using namespace HiveVerify::Verify;

namespace {

LogEntry makeEntry(const std::string& span,
                   const std::string& target,
                   const std::string& message,
                   LogEntry::Fields fields = {}) {
    return LogEntry("2025-01-15T10:00:00Z", "INFO", "1", span, target, message, std::move(fields));
}

std::vector<LogEntry> readyActors(int n) {
    std::vector<LogEntry> entries;
    for (int i = 0; i < n; ++i) {
        entries.push_back(makeEntry("actor", "hive_actor", "Actor ready, sending ready signal"));
    }
    return entries;
}

} // namespace

// ---- system_startup ----

TEST(SystemStartupCheck, FailsWithoutStartupLine) {
    std::vector<LogEntry> entries{makeEntry("main", "config", "Loaded configuration")};
    auto result = verifySystemStartup(entries);

    EXPECT_FALSE(result.passed());
    ASSERT_EQ(result.errors().size(), 1u);
    EXPECT_EQ(result.errors()[0], "HIVE system startup not found");
    EXPECT_EQ(result.metric("hive_startup_events"), 0);
    EXPECT_TRUE(result.warnings().empty());
}

TEST(SystemStartupCheck, MissingConfigIsOnlyAWarning) {
    std::vector<LogEntry> entries{
        makeEntry("main", "hive", "Starting headless HIVE multi-agent system"),
        makeEntry("agent_run", "hive_actors", "Starting actors for agent"),
    };
    auto result = verifySystemStartup(entries);

    EXPECT_TRUE(result.passed());
    ASSERT_EQ(result.warnings().size(), 1u);
    EXPECT_EQ(result.warnings()[0], "No config loading events found");
    EXPECT_EQ(result.metric("hive_startup_events"), 1);
    EXPECT_EQ(result.metric("config_events"), 0);
    EXPECT_EQ(result.metric("actor_creation_events"), 1);
}

TEST(SystemStartupCheck, ConfigTargetMatchIgnoresCase) {
    std::vector<LogEntry> entries{
        makeEntry("main", "hive", "Starting headless HIVE multi-agent system"),
        makeEntry("", "hive::Config", "Loaded"),
    };
    auto result = verifySystemStartup(entries);
    EXPECT_EQ(result.metric("config_events"), 1);
    EXPECT_TRUE(result.warnings().empty());
}

TEST(SystemStartupCheck, SummaryKeysInOrder) {
    auto result = verifySystemStartup({});
    ASSERT_EQ(result.summary().size(), 3u);
    EXPECT_EQ(result.summary()[0].first, "hive_startup_events");
    EXPECT_EQ(result.summary()[1].first, "config_events");
    EXPECT_EQ(result.summary()[2].first, "actor_creation_events");
}

// ---- agent_lifecycle ----

TEST(AgentLifecycleCheck, FewReadyActorsWarnButPass) {
    auto entries = readyActors(3);
    entries.push_back(makeEntry("agent_run", "hive_agent", "Agent starting execution"));
    entries.push_back(makeEntry("agent_run", "hive_agent", "Agent state transition"));

    auto result = verifyAgentLifecycle(entries);

    EXPECT_TRUE(result.passed());
    ASSERT_EQ(result.warnings().size(), 1u);
    EXPECT_EQ(result.warnings()[0], "Expected at least 4 actors to be ready, got 3");
    EXPECT_EQ(result.metric("agents_started"), 1);
    EXPECT_EQ(result.metric("actors_ready"), 3);
    EXPECT_EQ(result.metric("state_transitions"), 1);
}

TEST(AgentLifecycleCheck, ThresholdIsConfigurable) {
    auto entries = readyActors(2);
    entries.push_back(makeEntry("agent_run", "hive_agent", "Agent starting execution"));
    entries.push_back(makeEntry("agent_run", "hive_agent", "Agent state transition"));

    EXPECT_TRUE(verifyAgentLifecycle(entries, 2).warnings().empty());

    auto strict = verifyAgentLifecycle(entries, 5);
    ASSERT_EQ(strict.warnings().size(), 1u);
    EXPECT_EQ(strict.warnings()[0], "Expected at least 5 actors to be ready, got 2");
}

TEST(AgentLifecycleCheck, NoStartAndNoTransitionAreTwoErrors) {
    auto result = verifyAgentLifecycle(readyActors(4));

    EXPECT_FALSE(result.passed());
    ASSERT_EQ(result.errors().size(), 2u);
    EXPECT_EQ(result.errors()[0], "No agents were started");
    EXPECT_EQ(result.errors()[1], "No agent state transitions found");
    EXPECT_TRUE(result.warnings().empty());
}

// ---- tool_execution ----

TEST(ToolExecutionCheck, NeverFails) {
    auto result = verifyToolExecution({}, {"planner"});
    EXPECT_TRUE(result.passed());
    EXPECT_TRUE(result.warnings().empty());
    EXPECT_EQ(result.metric("tool_registration_events"), 0);
    EXPECT_EQ(result.metric("llm_requests_with_tools"), 0);
    EXPECT_FALSE(result.hasMetric("max_tools_in_request"));
    EXPECT_EQ(result.metric("planner_calls"), 0);
}

TEST(ToolExecutionCheck, CountsRegistrationsRequestsAndCalls) {
    std::vector<LogEntry> entries{
        makeEntry("tools_available", "hive_tools", "Registered tools"),
        makeEntry("llm_request", "hive_llm", "Executing LLM chat request tools_count=3",
                  {{"tools_count", "3"}}),
        makeEntry("llm_request", "hive_llm", "Executing LLM chat request tools_count=7",
                  {{"tools_count", "7"}}),
        makeEntry("llm_request", "hive_llm", "Executing LLM chat request"),
        makeEntry("agent", "hive_agent", "Calling PLANNER tool"),
        makeEntry("agent", "hive_agent", "spawn_agent finished"),
    };

    auto result = verifyToolExecution(entries, {"planner", "spawn_agent", "command"});

    EXPECT_TRUE(result.passed());
    EXPECT_EQ(result.metric("tool_registration_events"), 1);
    EXPECT_EQ(result.metric("llm_requests_with_tools"), 2);
    EXPECT_EQ(result.metric("max_tools_in_request"), 7);
    EXPECT_EQ(result.metric("planner_calls"), 1);
    EXPECT_EQ(result.metric("spawn_agent_calls"), 1);
    EXPECT_EQ(result.metric("command_calls"), 0);
}

TEST(ToolExecutionCheck, NonNumericToolsCountCountsAsZero) {
    std::vector<LogEntry> entries{
        makeEntry("llm_request", "hive_llm", "request", {{"tools_count", "many"}}),
    };
    auto result = verifyToolExecution(entries, {});
    EXPECT_EQ(result.metric("llm_requests_with_tools"), 1);
    EXPECT_EQ(result.metric("max_tools_in_request"), 0);
}

TEST(ToolExecutionCheck, ToolNameMatchIgnoresCase) {
    std::vector<LogEntry> entries{makeEntry("agent", "hive_agent", "file_reader read 3 files")};
    auto result = verifyToolExecution(entries, {"File_Reader"});
    EXPECT_EQ(result.metric("File_Reader_calls"), 1);
}

// ---- llm_interaction ----

TEST(LlmInteractionCheck, FailsWithoutRequests) {
    auto result = verifyLlmInteraction({});
    EXPECT_FALSE(result.passed());
    ASSERT_EQ(result.errors().size(), 1u);
    EXPECT_EQ(result.errors()[0], "No LLM requests found");
    EXPECT_TRUE(result.warnings().empty());
}

TEST(LlmInteractionCheck, RequestsWithoutConnectionsWarn) {
    std::vector<LogEntry> entries{
        makeEntry("llm_request", "hive_llm", "Executing LLM chat request"),
        makeEntry("user_input", "hive_tui", "Received input"),
    };
    auto result = verifyLlmInteraction(entries);

    EXPECT_TRUE(result.passed());
    ASSERT_EQ(result.warnings().size(), 1u);
    EXPECT_EQ(result.warnings()[0], "LLM requests found but no network connections");
    EXPECT_EQ(result.metric("llm_requests"), 1);
    EXPECT_EQ(result.metric("network_connections"), 0);
    EXPECT_EQ(result.metric("user_input_events"), 1);
}

TEST(LlmInteractionCheck, ConnectionClearsWarning) {
    std::vector<LogEntry> entries{
        makeEntry("llm_request", "hive_llm", "Executing LLM chat request"),
        makeEntry("", "hyper_util", "starting new connection: https://api.example.com/"),
    };
    auto result = verifyLlmInteraction(entries);
    EXPECT_TRUE(result.passed());
    EXPECT_TRUE(result.warnings().empty());
    EXPECT_EQ(result.metric("network_connections"), 1);
}

// ---- diagnostics ----

TEST(CheckDiagnostics, CountsLoggedOnlyAtDebugLevel) {
    using HiveVerify::Utils::LogLevel;
    auto& logger = HiveVerify::Utils::getLogger();
    const LogLevel previous = logger.level();
    std::ostringstream sink;
    logger.setConsole(&sink);

    logger.setLevel(LogLevel::INFO);
    verifySystemStartup({});
    verifyAgentLifecycle({});
    verifyToolExecution({}, {"planner"});
    verifyLlmInteraction({});
    EXPECT_TRUE(sink.str().empty());

    logger.setLevel(LogLevel::DEBUG);
    verifyAgentLifecycle(readyActors(2));
    EXPECT_NE(sink.str().find("agent_lifecycle: 0 started, 2 ready, 0 transitions"), std::string::npos);

    logger.setLevel(previous);
    logger.setConsole(&std::cerr);
}
