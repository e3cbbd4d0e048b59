#include "verify/VerificationEngine.hpp"

#include "input/LogParser.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"

namespace HiveVerify
{
    namespace Verify
    {
        const std::vector<std::string> &defaultExpectedTools()
        {
            static const std::vector<std::string> tools = {
                "planner", "spawn_agent", "command", "file_reader"};
            return tools;
        }

        VerificationOptions VerificationOptions::fromConfig(const Utils::ConfigLoader &config)
        {
            VerificationOptions options;

            if (auto tools = config.getList("expected_tools"))
            {
                options.expectedTools = std::move(*tools);
            }

            if (config.hasKey("min_ready_actors"))
            {
                const auto minReady = config.getInt("min_ready_actors");
                if (minReady && *minReady >= 0)
                {
                    options.minReadyActors = *minReady;
                }
                else
                {
                    Utils::getLogger().warn("Ignoring invalid min_ready_actors '" +
                                            config.getStringOr("min_ready_actors", "") +
                                            "', using " + std::to_string(kDefaultMinReadyActors));
                }
            }

            return options;
        }

        core::VerificationReport verifyEntries(const std::vector<core::LogEntry> &entries,
                                               const VerificationOptions &options)
        {
            core::VerificationReport report;
            report.add(Category::kSystemStartup, verifySystemStartup(entries));
            report.add(Category::kAgentLifecycle, verifyAgentLifecycle(entries, options.minReadyActors));
            report.add(Category::kToolExecution, verifyToolExecution(entries, options.expectedTools));
            report.add(Category::kLlmInteraction, verifyLlmInteraction(entries));

            auto &logger = Utils::getLogger();
            for (const auto &[name, result] : report)
            {
                for (const auto &warning : result.warnings())
                {
                    logger.debug(name + " warning: " + warning);
                }
            }
            logger.info(std::string("Verification ") + (report.passed() ? "passed" : "failed") +
                        " over " + std::to_string(entries.size()) + " entries");
            return report;
        }

        core::VerificationReport verify(std::string_view logText, const VerificationOptions &options)
        {
            const Input::LogParser parser{};
            const auto entries = parser.parse(logText);
            return verifyEntries(entries, options);
        }

    } // namespace Verify
} // namespace HiveVerify
