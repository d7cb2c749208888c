#include "csa/parsers/syntax_tree.hpp"

extern "C" {
#include <tree_sitter/tree-sitter-python.h>
}

#include <algorithm>
#include <limits>

namespace csa::parsers {

    namespace {

        struct CursorGuard {
            TSTreeCursor cursor;

            explicit CursorGuard(const TSNode node) : cursor(ts_tree_cursor_new(node)) {}
            ~CursorGuard() { ts_tree_cursor_delete(&cursor); }

            CursorGuard(const CursorGuard&) = delete;
            CursorGuard& operator=(const CursorGuard&) = delete;
        };

        std::vector<std::size_t> compute_line_offsets(const std::string_view source) {
            std::vector<std::size_t> offsets{0};
            for (std::size_t i = 0; i < source.size(); ++i) {
                if (source[i] == '\n') {
                    offsets.push_back(i + 1);
                }
            }
            return offsets;
        }

    }  // namespace

    namespace ts {

        std::string_view type(const TSNode node) noexcept {
            if (ts_node_is_null(node)) {
                return {};
            }
            return ts_node_type(node);
        }

        TSNode field(const TSNode node, const std::string_view name) noexcept {
            return ts_node_child_by_field_name(node, name.data(), static_cast<uint32_t>(name.size()));
        }

        std::vector<TSNode> field_children(const TSNode node, const std::string_view name) {
            std::vector<TSNode> result;
            if (ts_node_is_null(node)) {
                return result;
            }

            CursorGuard guard(node);
            if (!ts_tree_cursor_goto_first_child(&guard.cursor)) {
                return result;
            }

            do {
                if (const char* field_name = ts_tree_cursor_current_field_name(&guard.cursor);
                    field_name && name == field_name) {
                    result.push_back(ts_tree_cursor_current_node(&guard.cursor));
                }
            } while (ts_tree_cursor_goto_next_sibling(&guard.cursor));

            return result;
        }

        std::vector<TSNode> named_children(const TSNode node) {
            std::vector<TSNode> result;
            if (ts_node_is_null(node)) {
                return result;
            }

            const uint32_t count = ts_node_named_child_count(node);
            result.reserve(count);
            for (uint32_t i = 0; i < count; ++i) {
                result.push_back(ts_node_named_child(node, i));
            }
            return result;
        }

        std::vector<TSNode> children(const TSNode node) {
            std::vector<TSNode> result;
            if (ts_node_is_null(node)) {
                return result;
            }

            const uint32_t count = ts_node_child_count(node);
            result.reserve(count);
            for (uint32_t i = 0; i < count; ++i) {
                result.push_back(ts_node_child(node, i));
            }
            return result;
        }

        bool has_token(const TSNode node, const std::string_view token) noexcept {
            if (ts_node_is_null(node)) {
                return false;
            }

            const uint32_t count = ts_node_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                const TSNode child = ts_node_child(node, i);
                if (!ts_node_is_named(child) && type(child) == token) {
                    return true;
                }
            }
            return false;
        }

    }  // namespace ts

    SyntaxTree::SyntaxTree(std::string source, TSTree* tree)
        : source_(std::move(source))
        , line_offsets_(compute_line_offsets(source_))
        , tree_(tree, &ts_tree_delete) {}

    Result<SyntaxTree, Error> SyntaxTree::parse_python(const std::string_view source) {
        if (source.size() > std::numeric_limits<uint32_t>::max()) {
            return Result<SyntaxTree, Error>::failure(
                Error::invalid_argument("Source text too large for the parser")
            );
        }

        const std::unique_ptr<TSParser, decltype(&ts_parser_delete)> parser(ts_parser_new(), &ts_parser_delete);
        if (!parser) {
            return Result<SyntaxTree, Error>::failure(
                Error::internal_error("Failed to create tree-sitter parser")
            );
        }

        if (!ts_parser_set_language(parser.get(), tree_sitter_python())) {
            return Result<SyntaxTree, Error>::failure(
                Error::internal_error("Incompatible tree-sitter-python grammar version")
            );
        }

        std::string text(source);
        TSTree* tree = ts_parser_parse_string(
            parser.get(), nullptr, text.data(), static_cast<uint32_t>(text.size())
        );
        if (!tree) {
            return Result<SyntaxTree, Error>::failure(
                Error::internal_error("tree-sitter returned no tree")
            );
        }

        return Result<SyntaxTree, Error>::success(SyntaxTree(std::move(text), tree));
    }

    TSNode SyntaxTree::root() const noexcept {
        return ts_tree_root_node(tree_.get());
    }

    std::string_view SyntaxTree::text(const TSNode node) const noexcept {
        if (ts_node_is_null(node)) {
            return {};
        }

        const std::size_t start = ts_node_start_byte(node);
        const std::size_t end = ts_node_end_byte(node);
        if (start >= source_.size() || end <= start) {
            return {};
        }
        return std::string_view(source_).substr(start, std::min(end, source_.size()) - start);
    }

    std::string_view SyntaxTree::line_text(const std::size_t line) const noexcept {
        if (line == 0 || line > line_offsets_.size()) {
            return {};
        }

        const std::size_t start = line_offsets_[line - 1];
        std::size_t end = line < line_offsets_.size() ? line_offsets_[line] - 1 : source_.size();
        if (end > start && source_[end - 1] == '\r') {
            --end;
        }
        return std::string_view(source_).substr(start, end - start);
    }

    ast::SourceLocation SyntaxTree::start_of(const TSNode node) const noexcept {
        const TSPoint point = ts_node_start_point(node);
        return {point.row + 1, point.column};
    }

    ast::SourceLocation SyntaxTree::end_of(const TSNode node) const noexcept {
        const TSPoint start = ts_node_start_point(node);
        const TSPoint end = ts_node_end_point(node);

        if (end.column == 0 && end.row > start.row) {
            return {end.row, line_text(end.row).size()};
        }
        return {end.row + 1, end.column};
    }

    bool SyntaxTree::has_errors() const noexcept {
        return ts_node_has_error(root());
    }

    std::vector<ParseDiagnostic> SyntaxTree::syntax_errors() const {
        std::vector<ParseDiagnostic> errors;
        collect_errors(root(), errors);
        return errors;
    }

    void SyntaxTree::collect_errors(const TSNode node, std::vector<ParseDiagnostic>& out) const {
        if (ts_node_is_null(node) || !ts_node_has_error(node)) {
            return;
        }

        if (ts::is(node, "ERROR") || ts_node_is_missing(node)) {
            const ast::SourceLocation location = start_of(node);

            ParseDiagnostic diagnostic;
            diagnostic.kind = "SyntaxError";
            diagnostic.message = ts_node_is_missing(node)
                ? "expected '" + std::string(ts::type(node)) + "'"
                : "invalid syntax";
            diagnostic.line = location.line;
            diagnostic.column = location.column;
            diagnostic.text = std::string(line_text(location.line));

            out.push_back(std::move(diagnostic));
            return;
        }

        const uint32_t count = ts_node_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            collect_errors(ts_node_child(node, i), out);
        }
    }

}  // namespace csa::parsers
