#include "verify/Checks.hpp"

#include "analysis/LogQuery.hpp"
#include "utils/Logger.hpp"
#include "verify/LogMarkers.hpp"

namespace HiveVerify
{
    namespace Verify
    {
        core::VerificationResult verifyAgentLifecycle(const std::vector<core::LogEntry> &entries,
                                                      int minReadyActors)
        {
            const Analysis::LogQuery query(entries);
            core::VerificationResult result;

            const auto started = query.withMessage(Markers::kAgentStart).size();
            result.setMetric("agents_started", static_cast<std::int64_t>(started));
            if (started == 0)
            {
                result.addError("No agents were started");
            }

            const auto ready = static_cast<std::int64_t>(query.withMessage(Markers::kActorReady).size());
            result.setMetric("actors_ready", ready);
            if (ready < minReadyActors)
            {
                result.addWarning("Expected at least " + std::to_string(minReadyActors) +
                                  " actors to be ready, got " + std::to_string(ready));
            }

            const auto transitions = query.withMessage(Markers::kStateTransition).size();
            result.setMetric("state_transitions", static_cast<std::int64_t>(transitions));
            if (transitions == 0)
            {
                result.addError("No agent state transitions found");
            }

            auto &logger = Utils::getLogger();
            if (logger.isEnabled(Utils::LogLevel::DEBUG))
            {
                logger.debug("agent_lifecycle: " + std::to_string(started) + " started, " +
                                 std::to_string(ready) + " ready, " +
                                 std::to_string(transitions) + " transitions");
            }
            return result;
        }

    } // namespace Verify
} // namespace HiveVerify
