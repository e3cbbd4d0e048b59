#include "verify/Checks.hpp"

#include "analysis/LogQuery.hpp"
#include "utils/Logger.hpp"
#include "verify/LogMarkers.hpp"

namespace HiveVerify
{
    namespace Verify
    {
        core::VerificationResult verifyLlmInteraction(const std::vector<core::LogEntry> &entries)
        {
            const Analysis::LogQuery query(entries);
            core::VerificationResult result;

            const auto requests = query.withMessage(Markers::kLlmChatRequest).size();
            result.setMetric("llm_requests", static_cast<std::int64_t>(requests));
            if (requests == 0)
            {
                result.addError("No LLM requests found");
            }

            const auto connections = query.withMessage(Markers::kConnectionStart).size();
            result.setMetric("network_connections", static_cast<std::int64_t>(connections));
            if (requests > 0 && connections == 0)
            {
                result.addWarning("LLM requests found but no network connections");
            }

            const auto userInput = query.bySpan(Markers::kUserInputSpan).size();
            result.setMetric("user_input_events", static_cast<std::int64_t>(userInput));

            auto &logger = Utils::getLogger();
            if (logger.isEnabled(Utils::LogLevel::DEBUG))
            {
                logger.debug("llm_interaction: " + std::to_string(requests) + " requests, " +
                                 std::to_string(connections) + " connections");
            }
            return result;
        }

    } // namespace Verify
} // namespace HiveVerify
