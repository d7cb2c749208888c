#ifndef CODESTRUCTUREANALYZER_STRING_UTILS_HPP
#define CODESTRUCTUREANALYZER_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers shared by the parsers, analyzers and CLI.
 */

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>

namespace csa::string_utils {

    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits a string on every occurrence of @p delimiter.
     *
     * Always returns at least one element: splitting "" yields {""} and a
     * trailing delimiter yields a trailing empty element.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            result.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        result.push_back(s.substr(start));
        return result;
    }

    /**
     * Splits text into lines the way a line-oriented editor counts them.
     *
     * "\n", "\r\n" and "\r" all terminate a line; a final terminator does
     * not start a new empty line, and empty text has no lines.
     */
    inline std::vector<std::string_view> split_lines(std::string_view s) {
        std::vector<std::string_view> lines;
        std::size_t start = 0;

        for (std::size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '\n' || s[i] == '\r') {
                lines.push_back(s.substr(start, i - start));
                if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n') {
                    ++i;
                }
                start = i + 1;
            }
        }

        if (start < s.size()) {
            lines.push_back(s.substr(start));
        }
        return lines;
    }

    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        std::string result;
        bool first = true;

        for (const auto& part : parts) {
            if (!first) {
                result += delimiter;
            }
            result += part;
            first = false;
        }

        return result;
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    inline bool ends_with(const std::string_view s, const std::string_view suffix) noexcept {
        return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(), [](const unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return result;
    }

    /**
     * Replaces each tab with spaces up to the next multiple of @p tab_size.
     */
    inline std::string expand_tabs(const std::string_view s, const std::size_t tab_size = 8) {
        std::string result;
        result.reserve(s.size());
        std::size_t column = 0;

        for (const char c : s) {
            if (c == '\t') {
                const std::size_t spaces = tab_size - (column % tab_size);
                result.append(spaces, ' ');
                column += spaces;
            } else if (c == '\n' || c == '\r') {
                result += c;
                column = 0;
            } else {
                result += c;
                ++column;
            }
        }

        return result;
    }

}  // namespace csa::string_utils

#endif //CODESTRUCTUREANALYZER_STRING_UTILS_HPP
