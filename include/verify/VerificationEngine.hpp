#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "core/LogEntry.hpp"
#include "core/VerificationResult.hpp"
#include "verify/Checks.hpp"

namespace HiveVerify
{
    namespace Utils
    {
        class ConfigLoader;
    }

    namespace Verify
    {
        /// Category names, in the order they appear in every report.
        namespace Category
        {
            inline constexpr const char *kSystemStartup = "system_startup";
            inline constexpr const char *kAgentLifecycle = "agent_lifecycle";
            inline constexpr const char *kToolExecution  = "tool_execution";
            inline constexpr const char *kLlmInteraction = "llm_interaction";
        } // namespace Category

        /// planner, spawn_agent, command, file_reader
        const std::vector<std::string> &defaultExpectedTools();

        struct VerificationOptions
        {
            std::vector<std::string> expectedTools = defaultExpectedTools();
            int minReadyActors = kDefaultMinReadyActors;

            /**
             * Options from "expected_tools" (comma-separated) and
             * "min_ready_actors". Missing keys keep the defaults; an invalid
             * min_ready_actors is logged and ignored.
             */
            static VerificationOptions fromConfig(const Utils::ConfigLoader &config);
        };

        /**
         * Run all four checks against one entry sequence.
         *
         * The report holds system_startup, agent_lifecycle, tool_execution and
         * llm_interaction in that order. Never throws on log content.
         */
        core::VerificationReport verifyEntries(const std::vector<core::LogEntry> &entries,
                                               const VerificationOptions &options = {});

        /// Parse logText once, then verifyEntries().
        core::VerificationReport verify(std::string_view logText,
                                        const VerificationOptions &options = {});

    } // namespace Verify
} // namespace HiveVerify
