#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <iterator>
#include <type_traits>

namespace OpsTriage
{
    namespace Utils
    {
        /**
         * String utility helpers for record parsing and keyword extraction.
         *
         * All functions are:
         *  - Stateless and thread-safe.
         *  - Using std::string_view where possible to avoid unnecessary copies.
         */

        /// Trim whitespace (space, tab, CR, LF) from the left side of the string view.
        inline std::string_view ltrim(std::string_view sv) noexcept
        {
            const auto it = std::find_if_not(
                sv.begin(),
                sv.end(),
                [](unsigned char ch) { return std::isspace(ch) != 0; }
            );
            return sv.substr(static_cast<std::size_t>(it - sv.begin()));
        }

        /// Trim whitespace (space, tab, CR, LF) from the right side of the string view.
        inline std::string_view rtrim(std::string_view sv) noexcept
        {
            const auto it = std::find_if_not(
                sv.rbegin(),
                sv.rend(),
                [](unsigned char ch) { return std::isspace(ch) != 0; }
            );
            return sv.substr(0, static_cast<std::size_t>(sv.rend() - it));
        }

        /// Trim whitespace from both ends of the string view.
        inline std::string_view trim(std::string_view sv) noexcept
        {
            return rtrim(ltrim(sv));
        }

        /// Convert a string to lowercase (returns a new std::string).
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

        /// Case-insensitive equality comparison without allocations.
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

        /// Check if a string_view contains a given substring (case-sensitive).
        inline bool contains(std::string_view sv, std::string_view needle) noexcept
        {
            if (needle.empty())
            {
                return true;
            }
            return sv.find(needle) != std::string_view::npos;
        }

        /**
         * Safely parse a floating-point number from a string_view.
         *
         * Returns std::nullopt if parsing fails or trailing characters exist.
         */
        template <typename FloatType>
        std::optional<FloatType> parseFloat(std::string_view sv)
        {
            static_assert(std::is_floating_point<FloatType>::value,
                          "parseFloat requires a floating-point type");

            sv = trim(sv);
            if (sv.empty())
            {
                return std::nullopt;
            }

            std::string s(sv);
            std::istringstream iss(s);
            FloatType value{};
            iss >> value;

            if (!iss || !iss.eof())
            {
                return std::nullopt;
            }
            return value;
        }

        /// Split on any run of whitespace; never yields empty tokens.
        std::vector<std::string> splitWhitespace(std::string_view input);

        /// Lowercased whitespace tokens, duplicates kept in input order.
        std::vector<std::string> tokenizeLower(std::string_view input);

        /// Join parts with a delimiter ("a", "b" + "_" -> "a_b").
        std::string join(const std::vector<std::string>& parts, std::string_view delimiter);

    } // namespace Utils
} // namespace OpsTriage
