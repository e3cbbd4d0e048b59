#pragma once

#include <string>
#include <vector>

#include "core/LogEntry.hpp"
#include "core/VerificationResult.hpp"

namespace HiveVerify
{
    namespace Verify
    {
        /**
         * The four verification categories.
         *
         * Each check is a free function of the parsed entries: it reads them,
         * never modifies them, keeps no state between calls, and always
         * returns a result instead of throwing. Checks can run in any order.
         */

        /// Expected minimum of "actor ready" lines (assistant, planner, spawn_agent, plan_approval).
        inline constexpr int kDefaultMinReadyActors = 4;

        /**
         * System startup.
         *
         * Summary: hive_startup_events, config_events, actor_creation_events.
         * Error when no startup announcement; warning when no target mentions config.
         */
        core::VerificationResult verifySystemStartup(const std::vector<core::LogEntry> &entries);

        /**
         * Agent lifecycle.
         *
         * Summary: agents_started, actors_ready, state_transitions.
         * Errors when no agent started or no state transition was logged;
         * warning when fewer than minReadyActors actors reported ready.
         */
        core::VerificationResult verifyAgentLifecycle(const std::vector<core::LogEntry> &entries,
                                                      int minReadyActors = kDefaultMinReadyActors);

        /**
         * Tool execution. Descriptive only: never records errors or warnings.
         *
         * Summary: tool_registration_events, llm_requests_with_tools,
         * max_tools_in_request (only when llm_requests_with_tools > 0), and
         * <tool>_calls for every expected tool.
         *
         * <tool>_calls counts messages containing the tool name with both
         * sides compared case-insensitively, so "File_Reader" matches a
         * message mentioning "file_reader". The metric key keeps the name as
         * given.
         */
        core::VerificationResult verifyToolExecution(const std::vector<core::LogEntry> &entries,
                                                     const std::vector<std::string> &expectedTools);

        /**
         * LLM interaction.
         *
         * Summary: llm_requests, network_connections, user_input_events.
         * Error when no chat request; warning when requests were made but no
         * connection was ever opened.
         */
        core::VerificationResult verifyLlmInteraction(const std::vector<core::LogEntry> &entries);

    } // namespace Verify
} // namespace HiveVerify
