#include "verify/Checks.hpp"

#include <algorithm>

#include "analysis/LogQuery.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include "verify/LogMarkers.hpp"

namespace HiveVerify
{
    namespace Verify
    {
        namespace
        {
            // Whole-value integer; anything else counts as 0.
            std::int64_t toolsCountOf(const core::LogEntry &entry)
            {
                const auto raw = entry.field(std::string(Markers::kToolsCountField));
                if (!raw)
                {
                    return 0;
                }
                return Utils::parseInteger<std::int64_t>(*raw).value_or(0);
            }
        } // namespace

        core::VerificationResult verifyToolExecution(const std::vector<core::LogEntry> &entries,
                                                     const std::vector<std::string> &expectedTools)
        {
            const Analysis::LogQuery query(entries);
            core::VerificationResult result;

            const auto registrations = query.bySpan(Markers::kToolsAvailableSpan).size();
            result.setMetric("tool_registration_events", static_cast<std::int64_t>(registrations));

            const std::string toolsCountField(Markers::kToolsCountField);
            const auto requests = query.where([&](const core::LogEntry &e) {
                return Utils::contains(e.span(), Markers::kLlmRequestSpan) && e.hasField(toolsCountField);
            });
            result.setMetric("llm_requests_with_tools", static_cast<std::int64_t>(requests.size()));

            if (!requests.empty())
            {
                std::int64_t maxTools = toolsCountOf(*requests.front());
                for (const auto *entry : requests)
                {
                    maxTools = std::max(maxTools, toolsCountOf(*entry));
                }
                result.setMetric("max_tools_in_request", maxTools);
            }

            for (const auto &tool : expectedTools)
            {
                const auto calls = query.withMessage(tool, /*ignoreCase=*/true).size();
                result.setMetric(tool + "_calls", static_cast<std::int64_t>(calls));
            }

            auto &logger = Utils::getLogger();
            if (logger.isEnabled(Utils::LogLevel::DEBUG))
            {
                logger.debug("tool_execution: " + std::to_string(registrations) +
                                 " registrations, " + std::to_string(requests.size()) +
                                 " requests with tools");
            }
            return result;
        }

    } // namespace Verify
} // namespace HiveVerify
