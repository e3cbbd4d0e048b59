#include "utils/TimeUtils.hpp"

#include <iomanip>
#include <sstream>

namespace HiveVerify
{
    namespace Utils
    {
        TimePoint now() noexcept
        {
            return Clock::now();
        }

        std::string formatTimestamp(TimePoint tp, std::string_view format)
        {
            const std::time_t t = Clock::to_time_t(tp);
            std::tm tm_buf{};
        #if defined(_WIN32)
            localtime_s(&tm_buf, &t);
        #else
            localtime_r(&t, &tm_buf);
        #endif

            // put_time needs a NUL-terminated format.
            const std::string fmt(format);
            std::ostringstream oss;
            oss << std::put_time(&tm_buf, fmt.c_str());
            return oss.str();
        }

        std::string toIso8601(TimePoint tp)
        {
            return formatTimestamp(tp, "%Y-%m-%dT%H:%M:%S");
        }

    } // namespace Utils
} // namespace HiveVerify
