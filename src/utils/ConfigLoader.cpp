#include "utils/ConfigLoader.hpp"

#include <fstream>

#include "utils/StringUtils.hpp"

namespace HiveVerify
{
    namespace Utils
    {
        bool ConfigLoader::loadFromFile(const std::string &filePath)
        {
            std::ifstream in(filePath);
            if (!in.is_open())
            {
                return false;
            }

            loadFromStream(in);
            return true;
        }

        void ConfigLoader::loadFromStream(std::istream &in)
        {
            std::unordered_map<std::string, std::string> newValues;

            std::string line;
            while (std::getline(in, line))
            {
                const std::string_view content = trim(line);
                if (content.empty() || content.front() == '#' || content.front() == ';')
                {
                    continue;
                }

                const auto pos = content.find('=');
                if (pos == std::string_view::npos)
                {
                    continue;
                }

                std::string key(trim(content.substr(0, pos)));
                std::string value(trim(content.substr(pos + 1)));
                if (key.empty())
                {
                    continue;
                }

                newValues[std::move(key)] = std::move(value);
            }

            // Commit in one step so readers never see a half-loaded file.
            std::lock_guard<std::mutex> lock(m_mutex);
            m_values = std::move(newValues);
        }

        void ConfigLoader::set(std::string key, std::string value)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_values[std::move(key)] = std::move(value);
        }

        bool ConfigLoader::hasKey(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_values.find(std::string(key)) != m_values.end();
        }

        std::optional<std::string> ConfigLoader::getRawUnlocked(std::string_view key) const
        {
            auto it = m_values.find(std::string(key));
            if (it == m_values.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::optional<std::string> ConfigLoader::getString(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return getRawUnlocked(key);
        }

        std::string ConfigLoader::getStringOr(std::string_view key,
                                              std::string_view defaultValue) const
        {
            auto v = getString(key);
            return v ? *v : std::string(defaultValue);
        }

        std::optional<int> ConfigLoader::getInt(std::string_view key) const
        {
            auto v = getString(key);
            if (!v)
            {
                return std::nullopt;
            }
            return parseInteger<int>(*v);
        }

        int ConfigLoader::getIntOr(std::string_view key, int defaultValue) const
        {
            auto v = getInt(key);
            return v ? *v : defaultValue;
        }

        std::optional<bool> ConfigLoader::getBool(std::string_view key) const
        {
            auto v = getString(key);
            if (!v)
            {
                return std::nullopt;
            }

            const std::string_view s = trim(*v);
            if (iequals(s, "1") || iequals(s, "true") ||
                iequals(s, "yes") || iequals(s, "on"))
            {
                return true;
            }
            if (iequals(s, "0") || iequals(s, "false") ||
                iequals(s, "no") || iequals(s, "off"))
            {
                return false;
            }

            return std::nullopt;
        }

        bool ConfigLoader::getBoolOr(std::string_view key, bool defaultValue) const
        {
            auto v = getBool(key);
            return v ? *v : defaultValue;
        }

        std::optional<std::vector<std::string>> ConfigLoader::getList(std::string_view key) const
        {
            auto v = getString(key);
            if (!v)
            {
                return std::nullopt;
            }
            return splitAndTrim(*v, ',');
        }

        ConfigLoader &getGlobalConfig()
        {
            static ConfigLoader instance;
            return instance;
        }

    } // namespace Utils
} // namespace HiveVerify
