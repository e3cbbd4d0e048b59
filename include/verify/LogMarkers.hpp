#pragma once

#include <string_view>

namespace HiveVerify
{
    namespace Verify
    {
        /**
         * Text the HIVE runtime writes at the lifecycle points the checks look
         * for. Matching is by substring on the message, span or target named
         * in each group.
         */
        namespace Markers
        {
            // Messages
            inline constexpr std::string_view kHiveStartup       = "Starting headless HIVE multi-agent system";
            inline constexpr std::string_view kActorCreation     = "Starting actors for agent";
            inline constexpr std::string_view kAgentStart        = "Agent starting execution";
            inline constexpr std::string_view kActorReady        = "Actor ready, sending ready signal";
            inline constexpr std::string_view kStateTransition   = "state transition";
            inline constexpr std::string_view kLlmChatRequest    = "Executing LLM chat request";
            inline constexpr std::string_view kConnectionStart   = "starting new connection";

            // Targets (case-insensitive)
            inline constexpr std::string_view kConfigTarget      = "config";

            // Spans
            inline constexpr std::string_view kToolsAvailableSpan = "tools_available";
            inline constexpr std::string_view kLlmRequestSpan     = "llm_request";
            inline constexpr std::string_view kUserInputSpan      = "user_input";

            // Fields
            inline constexpr std::string_view kToolsCountField    = "tools_count";
        } // namespace Markers

    } // namespace Verify
} // namespace HiveVerify
