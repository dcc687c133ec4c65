#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <optional>
#include <mutex>
#include <vector>
#include <iosfwd>

namespace OpsTriage
{
    namespace Utils
    {
        /**
         * ConfigLoader
         *
         * Responsibilities:
         *  - Load a simple text configuration (key = value format).
         *  - Expose read-only, typed access to configuration values.
         *
         * Format:
         *  - Each line is: key = value
         *  - Lines starting with '#' or ';' are comments.
         *  - Empty lines are ignored; lines without '=' are skipped.
         *  - Whitespace around key and value is trimmed.
         *  - Last occurrence of a key wins.
         *
         * Example:
         *   correlation.edge_threshold = 0.5
         *   forecast.alpha             = 0.4
         *   log.level                  = DEBUG
         */
        class ConfigLoader
        {
        public:
            ConfigLoader() = default;

            ConfigLoader(const ConfigLoader &)            = delete;
            ConfigLoader &operator=(const ConfigLoader &) = delete;

            ~ConfigLoader() = default;

            /**
             * Load configuration from a file path, replacing current values.
             *
             * Returns false if the file cannot be opened; the existing
             * configuration is kept in that case.
             */
            bool loadFromFile(const std::string &filePath);

            /// Parse configuration text, replacing current values.
            void loadFromString(std::string_view text);

            /// Manually set a key (tests, command-line overrides).
            void set(std::string key, std::string value);

            bool hasKey(std::string_view key) const;

            /// Raw string value; std::nullopt if missing.
            std::optional<std::string> getString(std::string_view key) const;

            std::string getStringOr(std::string_view key,
                                    std::string_view defaultValue) const;

            /// Integer value; std::nullopt if missing or not a whole integer.
            std::optional<long long> getInt(std::string_view key) const;

            long long getIntOr(std::string_view key, long long defaultValue) const;

            /// Double value; std::nullopt if missing or invalid.
            std::optional<double> getDouble(std::string_view key) const;

            double getDoubleOr(std::string_view key, double defaultValue) const;

            /// All keys currently loaded, sorted.
            std::vector<std::string> keys() const;

        private:
            std::optional<std::string> getRawUnlocked(std::string_view key) const;

            static std::unordered_map<std::string, std::string> parse(std::istream &in);

        private:
            std::unordered_map<std::string, std::string> m_values;

            // Protects m_values for thread-safe reads/writes if config is updated at runtime.
            mutable std::mutex m_mutex;
        };

    } // namespace Utils
} // namespace OpsTriage
