#include "verify/Checks.hpp"

#include "analysis/LogQuery.hpp"
#include "utils/Logger.hpp"
#include "verify/LogMarkers.hpp"

namespace HiveVerify
{
    namespace Verify
    {
        core::VerificationResult verifySystemStartup(const std::vector<core::LogEntry> &entries)
        {
            const Analysis::LogQuery query(entries);
            core::VerificationResult result;

            const auto startups = query.withMessage(Markers::kHiveStartup).size();
            result.setMetric("hive_startup_events", static_cast<std::int64_t>(startups));
            if (startups == 0)
            {
                result.addError("HIVE system startup not found");
            }

            const auto configEvents = query.byTarget(Markers::kConfigTarget, /*ignoreCase=*/true).size();
            result.setMetric("config_events", static_cast<std::int64_t>(configEvents));
            if (configEvents == 0)
            {
                result.addWarning("No config loading events found");
            }

            const auto actorCreation = query.withMessage(Markers::kActorCreation).size();
            result.setMetric("actor_creation_events", static_cast<std::int64_t>(actorCreation));

            auto &logger = Utils::getLogger();
            if (logger.isEnabled(Utils::LogLevel::DEBUG))
            {
                logger.debug("system_startup: " + std::to_string(startups) + " startup, " +
                                 std::to_string(configEvents) + " config events");
            }
            return result;
        }

    } // namespace Verify
} // namespace HiveVerify
