#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include <string_view>

namespace HiveVerify
{
    namespace Utils
    {
        /**
         * Wall-clock helpers for diagnostics and report metadata.
         *
         * Timestamps inside the analyzed logs are opaque strings and never go
         * through these functions; they only stamp our own output.
         */

        using Clock     = std::chrono::system_clock;
        using TimePoint = std::chrono::time_point<Clock>;

        /// Current system time.
        TimePoint now() noexcept;

        /**
         * Format a TimePoint in local time.
         *
         * Default format: "YYYY-MM-DD HH:MM:SS", used by the Logger line prefix.
         */
        std::string formatTimestamp(TimePoint tp,
                                    std::string_view format = "%Y-%m-%d %H:%M:%S");

        /// "YYYY-MM-DDTHH:MM:SS", used for the JSON report's generation time.
        std::string toIso8601(TimePoint tp);

    } // namespace Utils
} // namespace HiveVerify
