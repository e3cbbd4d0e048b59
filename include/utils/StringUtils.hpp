#pragma once

#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace HiveVerify
{
    namespace Utils
    {
        /**
         * String helpers shared by the parser, the checks and the reporters.
         *
         * All functions are stateless and thread-safe, and take
         * std::string_view where no copy is needed.
         */

        /// Trim whitespace (space, tab, CR, LF) from the left side.
        inline std::string_view ltrim(std::string_view sv) noexcept
        {
            const auto it = std::find_if_not(
                sv.begin(),
                sv.end(),
                [](unsigned char ch) { return std::isspace(ch) != 0; }
            );
            return sv.substr(static_cast<std::size_t>(it - sv.begin()));
        }

        /// Trim whitespace from the right side.
        inline std::string_view rtrim(std::string_view sv) noexcept
        {
            const auto it = std::find_if_not(
                sv.rbegin(),
                sv.rend(),
                [](unsigned char ch) { return std::isspace(ch) != 0; }
            );
            return sv.substr(0, static_cast<std::size_t>(sv.rend() - it));
        }

        inline std::string_view trim(std::string_view sv) noexcept
        {
            return rtrim(ltrim(sv));
        }

        inline bool isBlank(std::string_view sv) noexcept
        {
            return trim(sv).empty();
        }

        inline std::string toLower(std::string_view sv)
        {
            std::string result;
            result.reserve(sv.size());
            std::transform(
                sv.begin(),
                sv.end(),
                std::back_inserter(result),
                [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); }
            );
            return result;
        }

        inline std::string toUpper(std::string_view sv)
        {
            std::string result;
            result.reserve(sv.size());
            std::transform(
                sv.begin(),
                sv.end(),
                std::back_inserter(result),
                [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); }
            );
            return result;
        }

        inline bool startsWith(std::string_view sv, std::string_view prefix) noexcept
        {
            return sv.size() >= prefix.size()
                   && sv.compare(0, prefix.size(), prefix) == 0;
        }

        /// Case-insensitive equality without allocations.
        inline bool iequals(std::string_view a, std::string_view b) noexcept
        {
            if (a.size() != b.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i)
            {
                unsigned char ca = static_cast<unsigned char>(a[i]);
                unsigned char cb = static_cast<unsigned char>(b[i]);
                if (std::tolower(ca) != std::tolower(cb))
                {
                    return false;
                }
            }
            return true;
        }

        /// Substring test (case-sensitive). An empty needle always matches.
        inline bool contains(std::string_view sv, std::string_view needle) noexcept
        {
            return sv.find(needle) != std::string_view::npos;
        }

        /// Substring test ignoring ASCII case.
        inline bool icontains(std::string_view sv, std::string_view needle)
        {
            return contains(toLower(sv), toLower(needle));
        }

        /**
         * Split by a single-character delimiter.
         *
         * Empty fields are dropped unless keepEmpty is true. Tokens are not
         * trimmed; see splitAndTrim().
         */
        inline std::vector<std::string_view> split(
            std::string_view sv,
            char delimiter,
            bool keepEmpty = false)
        {
            std::vector<std::string_view> result;
            std::size_t start = 0;

            while (start <= sv.size())
            {
                const std::size_t pos = sv.find(delimiter, start);
                const bool found = (pos != std::string_view::npos);
                const std::size_t end = found ? pos : sv.size();

                if (end > start || keepEmpty)
                {
                    result.emplace_back(sv.data() + start, end - start);
                }

                if (!found)
                {
                    break;
                }
                start = end + 1;
            }

            return result;
        }

        /// Split and trim each token; empty tokens are dropped.
        inline std::vector<std::string> splitAndTrim(std::string_view sv, char delimiter)
        {
            std::vector<std::string> result;
            for (auto part : split(sv, delimiter))
            {
                const std::string_view t = trim(part);
                if (!t.empty())
                {
                    result.emplace_back(t);
                }
            }
            return result;
        }

        /**
         * Parse a whole string as an integer.
         *
         * Returns std::nullopt on failure, overflow, or trailing characters
         * after trimming ("12abc" is rejected, not read as 12).
         */
        template <typename IntType>
        std::optional<IntType> parseInteger(std::string_view sv)
        {
            static_assert(std::is_integral<IntType>::value,
                          "parseInteger requires an integral type");

            sv = trim(sv);
            if (sv.empty())
            {
                return std::nullopt;
            }

            std::istringstream iss{std::string(sv)};
            IntType value{};
            iss >> value;

            if (!iss || !iss.eof())
            {
                return std::nullopt;
            }
            return value;
        }

        inline std::string replaceAll(std::string_view sv,
                                      std::string_view from,
                                      std::string_view to)
        {
            std::string result(sv);
            if (from.empty())
            {
                return result;
            }

            std::size_t pos = 0;
            while ((pos = result.find(from, pos)) != std::string::npos)
            {
                result.replace(pos, from.size(), to);
                pos += to.size();
            }
            return result;
        }

        /// Escape for a JSON string literal (RFC 8259); no surrounding quotes.
        std::string escapeJson(std::string_view s);

    } // namespace Utils
} // namespace HiveVerify
