#include "csa/parsers/python_syntax.hpp"
#include "csa/utils/string_utils.hpp"

#include <algorithm>
#include <limits>
#include <vector>

namespace csa::parsers::python {

    namespace {

        std::string decode_escapes(const std::string_view body) {
            std::string result;
            result.reserve(body.size());

            for (std::size_t i = 0; i < body.size(); ++i) {
                const char c = body[i];
                if (c != '\\' || i + 1 >= body.size()) {
                    result += c;
                    continue;
                }

                const char next = body[++i];
                switch (next) {
                    case '\n': break;
                    case '\\': result += '\\'; break;
                    case '\'': result += '\''; break;
                    case '"': result += '"'; break;
                    case 'n': result += '\n'; break;
                    case 't': result += '\t'; break;
                    case 'r': result += '\r'; break;
                    case 'a': result += '\a'; break;
                    case 'b': result += '\b'; break;
                    case 'f': result += '\f'; break;
                    case 'v': result += '\v'; break;
                    default:
                        // Numeric and named escapes are kept verbatim.
                        result += '\\';
                        result += next;
                        break;
                }
            }

            return result;
        }

        std::optional<std::string> single_string_value(const std::string_view text) {
            const auto quote = text.find_first_of("'\"");
            if (quote == std::string_view::npos) {
                return std::nullopt;
            }

            const std::string prefix = string_utils::to_lower(text.substr(0, quote));
            if (prefix.find_first_of("bft") != std::string::npos) {
                return std::nullopt;
            }
            const bool raw = prefix.find('r') != std::string::npos;

            const std::string_view rest = text.substr(quote);
            std::size_t delimiter = 1;
            if (rest.size() >= 6 && (string_utils::starts_with(rest, "\"\"\"") || string_utils::starts_with(rest, "'''"))) {
                delimiter = 3;
            }
            if (rest.size() < 2 * delimiter) {
                return std::nullopt;
            }

            const std::string_view body = rest.substr(delimiter, rest.size() - 2 * delimiter);
            return raw ? std::string(body) : decode_escapes(body);
        }

        bool has_interpolation(const TSNode node) {
            if (ts::is(node, "interpolation")) {
                return true;
            }
            return std::ranges::any_of(ts::named_children(node), [](const TSNode child) {
                return has_interpolation(child);
            });
        }

    }  // namespace

    bool is_literal(const TSNode node) noexcept {
        const auto type = ts::type(node);
        return type == "integer" || type == "float" ||
               type == "string" || type == "concatenated_string";
    }

    bool is_statement(const TSNode node) noexcept {
        const auto type = ts::type(node);
        return string_utils::ends_with(type, "_statement") ||
               string_utils::ends_with(type, "_definition");
    }

    std::string decorator_name(const SyntaxTree& tree, const TSNode decorator) {
        TSNode expression{};
        for (const TSNode child : ts::named_children(decorator)) {
            if (!ts::is(child, "comment")) {
                expression = child;
                break;
            }
        }

        if (ts::is(expression, "call")) {
            return std::string(tree.text(ts::field(expression, "function")));
        }
        return std::string(tree.text(expression));
    }

    std::optional<std::string> string_value(const SyntaxTree& tree, const TSNode node) {
        if (has_interpolation(node)) {
            return std::nullopt;
        }

        if (ts::is(node, "string")) {
            return single_string_value(tree.text(node));
        }

        if (ts::is(node, "concatenated_string")) {
            std::string value;
            for (const TSNode part : ts::named_children(node)) {
                if (ts::is(part, "comment")) {
                    continue;
                }
                auto piece = string_value(tree, part);
                if (!piece) {
                    return std::nullopt;
                }
                value += *piece;
            }
            return value;
        }

        return std::nullopt;
    }

    std::string cleandoc(const std::string_view doc) {
        const std::string expanded = string_utils::expand_tabs(doc);

        std::vector<std::string> lines;
        for (const auto line : string_utils::split(expanded, '\n')) {
            lines.emplace_back(line);
        }

        std::size_t margin = std::numeric_limits<std::size_t>::max();
        for (std::size_t i = 1; i < lines.size(); ++i) {
            const auto content = string_utils::trim_left(lines[i]);
            if (!content.empty()) {
                margin = std::min(margin, lines[i].size() - content.size());
            }
        }

        if (!lines.empty()) {
            lines[0] = std::string(string_utils::trim_left(lines[0]));
        }
        if (margin != std::numeric_limits<std::size_t>::max()) {
            for (std::size_t i = 1; i < lines.size(); ++i) {
                lines[i] = lines[i].size() > margin ? lines[i].substr(margin) : std::string{};
            }
        }

        const auto blank = [](const std::string& line) {
            return string_utils::trim(line).empty();
        };

        while (!lines.empty() && blank(lines.back())) {
            lines.pop_back();
        }
        const auto first = std::ranges::find_if_not(lines, blank);
        lines.erase(lines.begin(), first);

        return string_utils::join(lines, "\n");
    }

    std::optional<std::string> docstring(const SyntaxTree& tree, const TSNode body) {
        for (const TSNode statement : ts::named_children(body)) {
            if (ts::is(statement, "comment")) {
                continue;
            }
            if (!ts::is(statement, "expression_statement")) {
                return std::nullopt;
            }

            std::vector<TSNode> expressions;
            for (const TSNode child : ts::named_children(statement)) {
                if (!ts::is(child, "comment")) {
                    expressions.push_back(child);
                }
            }
            if (expressions.size() != 1) {
                return std::nullopt;
            }

            auto value = string_value(tree, expressions.front());
            if (!value) {
                return std::nullopt;
            }
            return cleandoc(*value);
        }
        return std::nullopt;
    }

}  // namespace csa::parsers::python
