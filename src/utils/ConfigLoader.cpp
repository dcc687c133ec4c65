#include "utils/ConfigLoader.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>

#include "utils/StringUtils.hpp"

namespace OpsTriage
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

            auto newValues = parse(in);

            // Commit under the mutex to avoid partial updates.
            std::lock_guard<std::mutex> lock(m_mutex);
            m_values = std::move(newValues);
            return true;
        }

        void ConfigLoader::loadFromString(std::string_view text)
        {
            std::istringstream in{std::string(text)};
            auto newValues = parse(in);

            std::lock_guard<std::mutex> lock(m_mutex);
            m_values = std::move(newValues);
        }

        std::unordered_map<std::string, std::string> ConfigLoader::parse(std::istream &in)
        {
            std::unordered_map<std::string, std::string> values;

            std::string line;
            while (std::getline(in, line))
            {
                const std::string_view trimmed = trim(line);
                if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';')
                {
                    continue;
                }

                const auto pos = trimmed.find('=');
                if (pos == std::string_view::npos)
                {
                    continue;
                }

                const std::string_view key   = trim(trimmed.substr(0, pos));
                const std::string_view value = trim(trimmed.substr(pos + 1));
                if (key.empty())
                {
                    continue;
                }

                values[std::string(key)] = std::string(value);
            }

            return values;
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

        std::optional<long long> ConfigLoader::getInt(std::string_view key) const
        {
            const auto v = getString(key);
            if (!v || v->empty())
            {
                return std::nullopt;
            }

            long long value = 0;
            const char *first = v->data();
            const char *last  = v->data() + v->size();
            if (*first == '+')
            {
                ++first;
            }
            const auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc{} || ptr != last)
            {
                return std::nullopt;
            }
            return value;
        }

        long long ConfigLoader::getIntOr(std::string_view key, long long defaultValue) const
        {
            auto v = getInt(key);
            return v ? *v : defaultValue;
        }

        std::optional<double> ConfigLoader::getDouble(std::string_view key) const
        {
            const auto v = getString(key);
            if (!v)
            {
                return std::nullopt;
            }
            return parseFloat<double>(*v);
        }

        double ConfigLoader::getDoubleOr(std::string_view key,
                                         double defaultValue) const
        {
            auto v = getDouble(key);
            return v ? *v : defaultValue;
        }

        std::vector<std::string> ConfigLoader::keys() const
        {
            std::vector<std::string> result;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                result.reserve(m_values.size());
                for (const auto &[key, value] : m_values)
                {
                    result.push_back(key);
                }
            }
            std::sort(result.begin(), result.end());
            return result;
        }

    } // namespace Utils
} // namespace OpsTriage
