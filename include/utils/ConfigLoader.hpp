#pragma once

#include <istream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace HiveVerify
{
    namespace Utils
    {
        /**
         * ConfigLoader
         *
         * Responsibilities:
         *  - Load a simple "key = value" configuration file.
         *  - Expose typed, read-only access with defaults.
         *
         * Format:
         *  - Lines starting with '#' or ';' (after whitespace) are comments.
         *  - Empty lines and lines without '=' are ignored.
         *  - Whitespace around key and value is trimmed.
         *  - The last occurrence of a repeated key wins.
         *
         * Example:
         *   expected_tools   = planner, spawn_agent, command, file_reader
         *   min_ready_actors = 4
         *   log_level        = debug
         *   report_format    = json
         */
        class ConfigLoader
        {
        public:
            ConfigLoader() = default;

            ConfigLoader(const ConfigLoader &)            = delete;
            ConfigLoader &operator=(const ConfigLoader &) = delete;

            ~ConfigLoader() = default;

            /**
             * Replace the current values with the contents of filePath.
             *
             * Returns false, leaving the current values untouched, if the file
             * cannot be opened. Malformed lines are skipped.
             */
            bool loadFromFile(const std::string &filePath);

            /// Same as loadFromFile() for an already-open stream.
            void loadFromStream(std::istream &in);

            /// Set or override one value (command-line overrides, tests).
            void set(std::string key, std::string value);

            bool hasKey(std::string_view key) const;

            std::optional<std::string> getString(std::string_view key) const;
            std::string getStringOr(std::string_view key,
                                    std::string_view defaultValue) const;

            /// Integer value; std::nullopt if missing or not a whole integer.
            std::optional<int> getInt(std::string_view key) const;
            int getIntOr(std::string_view key, int defaultValue) const;

            /**
             * Boolean value; std::nullopt if missing or unrecognized.
             *
             * True (case-insensitive): "1", "true", "yes", "on"
             * False (case-insensitive): "0", "false", "no", "off"
             */
            std::optional<bool> getBool(std::string_view key) const;
            bool getBoolOr(std::string_view key, bool defaultValue) const;

            /**
             * Comma-separated list with each item trimmed and empty items
             * dropped; std::nullopt if the key is missing.
             */
            std::optional<std::vector<std::string>> getList(std::string_view key) const;

        private:
            std::optional<std::string> getRawUnlocked(std::string_view key) const;

        private:
            std::unordered_map<std::string, std::string> m_values;
            mutable std::mutex m_mutex;
        };

        /// Process-wide configuration, filled by the CLI before verification.
        ConfigLoader &getGlobalConfig();

    } // namespace Utils
} // namespace HiveVerify
