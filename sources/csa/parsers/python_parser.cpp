#include "csa/parsers/python_parser.hpp"
#include "csa/parsers/python_syntax.hpp"
#include "csa/parsers/syntax_tree.hpp"
#include "csa/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace csa::parsers {

    namespace {

        using ast::NodePtr;

        bool is_skipped(const TSNode node) noexcept {
            return ts_node_is_null(node) ||
                   ts_node_is_missing(node) ||
                   ts::is(node, "comment") ||
                   ts::is(node, "ERROR");
        }

        bool is_destructuring_target(const TSNode node) noexcept {
            const auto type = ts::type(node);
            return type == "pattern_list" || type == "tuple_pattern" ||
                   type == "list_pattern" || type == "tuple" || type == "list";
        }

        TSNode first_named(const TSNode node) {
            for (const TSNode child : ts::named_children(node)) {
                if (!ts::is(child, "comment")) {
                    return child;
                }
            }
            return TSNode{};
        }

        TSNode child_of_type(const TSNode node, const std::string_view type) {
            for (const TSNode child : ts::named_children(node)) {
                if (ts::is(child, type)) {
                    return child;
                }
            }
            return TSNode{};
        }

        void collect_interpolations(const TSNode node, std::vector<TSNode>& out) {
            if (ts::is(node, "interpolation")) {
                out.push_back(node);
                return;
            }
            for (const TSNode child : ts::named_children(node)) {
                collect_interpolations(child, out);
            }
        }

        /**
         * True if a yield occurs in @p node without crossing into a nested
         * function, class or lambda.
         */
        bool contains_yield(const TSNode node) {
            for (const TSNode child : ts::named_children(node)) {
                const auto type = ts::type(child);
                if (type == "yield") {
                    return true;
                }
                if (type == "function_definition" || type == "class_definition" || type == "lambda") {
                    continue;
                }
                if (contains_yield(child)) {
                    return true;
                }
            }
            return false;
        }

        /**
         * Converts one tree-sitter Python tree into the canonical AST.
         */
        class TreeConverter {
        public:
            TreeConverter(const SyntaxTree& tree, const ParserConfig& config, std::vector<ParseDiagnostic>& warnings)
                : tree_(tree)
                , config_(config)
                , warnings_(warnings) {}

            std::unique_ptr<ast::Program> convert_module() {
                const TSNode root = tree_.root();
                auto program = make<ast::Program>(root);
                program->source_type = config_.source_type;
                convert_statements(root, program->body, false);
                return program;
            }

        private:
            template<typename T>
            std::unique_ptr<T> make(const TSNode node) const {
                auto result = std::make_unique<T>();
                if (config_.include_locations && !ts_node_is_null(node)) {
                    result->range = tree_.range_of(node);
                }
                return result;
            }

            std::string text(const TSNode node) const {
                return std::string(tree_.text(node));
            }

            void add_warning(const TSNode node, std::string message) {
                const ast::SourceLocation location = tree_.start_of(node);

                ParseDiagnostic warning;
                warning.kind = "SyntaxWarning";
                warning.message = std::move(message);
                warning.line = location.line;
                warning.column = location.column;
                warning.text = std::string(tree_.line_text(location.line));
                warnings_.push_back(std::move(warning));
            }

            void convert_statements(const TSNode container, std::vector<NodePtr>& out, const bool in_class_body) {
                for (const TSNode child : ts::named_children(container)) {
                    if (ts::is(child, "ERROR")) {
                        // Keep whole statements the parser recovered inside the error region.
                        for (const TSNode inner : ts::named_children(child)) {
                            if (python::is_statement(inner)) {
                                convert_statement(inner, out, in_class_body);
                            }
                        }
                        continue;
                    }
                    convert_statement(child, out, in_class_body);
                }
            }

            std::unique_ptr<ast::BlockStatement> convert_block(const TSNode block) {
                if (ts_node_is_null(block)) {
                    return nullptr;
                }
                auto result = make<ast::BlockStatement>(block);
                convert_statements(block, result->body, false);
                return result;
            }

            std::unique_ptr<ast::BlockStatement> make_construct(const TSNode node, const std::string_view construct) const {
                auto block = make<ast::BlockStatement>(node);
                block->metadata["construct"] = std::string(construct);
                return block;
            }

            void convert_statement(const TSNode node, std::vector<NodePtr>& out, const bool in_class_body) {
                if (is_skipped(node)) {
                    return;
                }

                const auto kind = ts::type(node);

                if (kind == "function_definition" || kind == "class_definition") {
                    if (auto definition = convert_definition(node, {}, in_class_body)) {
                        out.push_back(std::move(definition));
                    }
                } else if (kind == "decorated_definition") {
                    std::vector<std::string> decorators;
                    for (const TSNode child : ts::named_children(node)) {
                        if (ts::is(child, "decorator")) {
                            decorators.push_back(python::decorator_name(tree_, child));
                        }
                    }
                    if (auto definition = convert_definition(ts::field(node, "definition"), decorators, in_class_body)) {
                        out.push_back(std::move(definition));
                    }
                } else if (kind == "expression_statement") {
                    convert_expression_statement(node, out);
                } else if (kind == "return_statement") {
                    auto statement = make<ast::ReturnStatement>(node);
                    statement->argument = convert_expression(first_named(node));
                    out.push_back(std::move(statement));
                } else if (kind == "if_statement") {
                    out.push_back(convert_if(node));
                } else if (kind == "while_statement") {
                    auto loop = make<ast::WhileLoop>(node);
                    loop->test = convert_expression(ts::field(node, "condition"));
                    loop->body = convert_block(ts::field(node, "body"));
                    out.push_back(std::move(loop));
                    convert_else(ts::field(node, "alternative"), out);
                } else if (kind == "for_statement") {
                    auto loop = make<ast::ForLoop>(node);
                    loop->init = convert_expression(ts::field(node, "left"));
                    loop->test = convert_expression(ts::field(node, "right"));
                    loop->body = convert_block(ts::field(node, "body"));
                    if (ts::has_token(node, "async")) {
                        loop->metadata["async"] = "true";
                    }
                    out.push_back(std::move(loop));
                    convert_else(ts::field(node, "alternative"), out);
                } else if (kind == "try_statement") {
                    out.push_back(convert_try(node));
                } else if (kind == "with_statement") {
                    out.push_back(convert_with(node));
                } else if (kind == "match_statement") {
                    out.push_back(convert_match(node));
                } else if (kind == "import_statement" || kind == "import_from_statement" ||
                           kind == "future_import_statement") {
                    auto statement = make<ast::ExpressionStatement>(node);
                    statement->metadata["kind"] = std::string(kind);
                    statement->metadata["source"] = text(node);
                    out.push_back(std::move(statement));
                } else if (kind == "assert_statement") {
                    check_assert(node);
                    out.push_back(make_composite(node, kind));
                } else {
                    out.push_back(make_composite(node, kind));
                }
            }

            NodePtr convert_definition(const TSNode node, const std::vector<std::string>& decorators, const bool in_class_body) {
                if (ts::is(node, "function_definition")) {
                    return convert_function(node, decorators, in_class_body);
                }
                if (ts::is(node, "class_definition")) {
                    return convert_class(node, decorators);
                }
                return nullptr;
            }

            NodePtr convert_function(const TSNode node, const std::vector<std::string>& decorators, const bool in_class_body) {
                std::unique_ptr<ast::CallableDeclaration> declaration;
                if (in_class_body) {
                    auto method = make<ast::MethodDeclaration>(node);
                    method->is_static = std::ranges::find(decorators, "staticmethod") != decorators.end();
                    declaration = std::move(method);
                } else {
                    declaration = make<ast::FunctionDeclaration>(node);
                }

                declaration->name = text(ts::field(node, "name"));
                declaration->params = convert_parameters(ts::field(node, "parameters"));
                declaration->is_async = ts::has_token(node, "async");

                if (const TSNode returns = ts::field(node, "return_type"); !ts_node_is_null(returns)) {
                    declaration->return_type = text(returns);
                }

                const TSNode body = ts::field(node, "body");
                declaration->is_generator = !ts_node_is_null(body) && contains_yield(body);
                declaration->body = convert_block(body);

                if (!decorators.empty()) {
                    declaration->metadata["decorators"] = string_utils::join(decorators, ",");
                }

                return declaration;
            }

            std::vector<ast::Parameter> convert_parameters(const TSNode parameters) const {
                std::vector<ast::Parameter> result;

                for (const TSNode child : ts::named_children(parameters)) {
                    const auto kind = ts::type(child);
                    ast::Parameter parameter;

                    if (kind == "identifier" || kind == "list_splat_pattern" ||
                        kind == "dictionary_splat_pattern" || kind == "tuple_pattern") {
                        parameter.name = text(child);
                    } else if (kind == "typed_parameter") {
                        parameter.name = text(first_named(child));
                        parameter.type = text(ts::field(child, "type"));
                    } else if (kind == "default_parameter" || kind == "typed_default_parameter") {
                        parameter.name = text(ts::field(child, "name"));
                        parameter.default_value = text(ts::field(child, "value"));
                        if (const TSNode type = ts::field(child, "type"); !ts_node_is_null(type)) {
                            parameter.type = text(type);
                        }
                    } else {
                        continue;
                    }

                    result.push_back(std::move(parameter));
                }

                return result;
            }

            NodePtr convert_class(const TSNode node, const std::vector<std::string>& decorators) {
                auto declaration = make<ast::ClassDeclaration>(node);
                declaration->name = text(ts::field(node, "name"));

                for (const TSNode base : ts::named_children(ts::field(node, "superclasses"))) {
                    if (ts::is(base, "keyword_argument") || ts::is(base, "comment")) {
                        continue;
                    }
                    declaration->bases.push_back(text(base));
                }
                if (!declaration->bases.empty()) {
                    declaration->super_class = declaration->bases.front();
                }

                convert_statements(ts::field(node, "body"), declaration->body, true);

                if (!decorators.empty()) {
                    declaration->metadata["decorators"] = string_utils::join(decorators, ",");
                }

                return declaration;
            }

            NodePtr convert_if(const TSNode node) {
                auto statement = make<ast::IfStatement>(node);
                statement->test = convert_expression(ts::field(node, "condition"));
                statement->consequent = convert_block(ts::field(node, "consequence"));

                // Build the elif chain from the innermost branch outwards.
                NodePtr alternate;
                const auto alternatives = ts::field_children(node, "alternative");
                for (auto it = alternatives.rbegin(); it != alternatives.rend(); ++it) {
                    if (ts::is(*it, "else_clause")) {
                        alternate = convert_block(ts::field(*it, "body"));
                    } else if (ts::is(*it, "elif_clause")) {
                        auto branch = make<ast::IfStatement>(*it);
                        branch->test = convert_expression(ts::field(*it, "condition"));
                        branch->consequent = convert_block(ts::field(*it, "consequence"));
                        branch->alternate = std::move(alternate);
                        alternate = std::move(branch);
                    }
                }

                statement->alternate = std::move(alternate);
                return statement;
            }

            void convert_else(const TSNode clause, std::vector<NodePtr>& out) {
                if (!ts::is(clause, "else_clause")) {
                    return;
                }
                auto block = make_construct(clause, "else");
                convert_statements(ts::field(clause, "body"), block->body, false);
                out.push_back(std::move(block));
            }

            NodePtr convert_try(const TSNode node) {
                auto block = make_construct(node, "try");
                convert_statements(ts::field(node, "body"), block->body, false);

                for (const TSNode clause : ts::named_children(node)) {
                    const auto kind = ts::type(clause);

                    if (kind == "except_clause" || kind == "except_group_clause") {
                        auto handler = make_construct(clause, "except");
                        auto types = make<ast::ExpressionStatement>(clause);
                        types->metadata["kind"] = "exception_types";

                        for (const TSNode child : ts::named_children(clause)) {
                            if (ts::is(child, "block")) {
                                continue;
                            }
                            if (auto expression = convert_expression(child)) {
                                types->expressions.push_back(std::move(expression));
                            }
                        }
                        if (!types->expressions.empty()) {
                            handler->body.push_back(std::move(types));
                        }

                        convert_statements(child_of_type(clause, "block"), handler->body, false);
                        block->body.push_back(std::move(handler));
                    } else if (kind == "else_clause") {
                        auto branch = make_construct(clause, "else");
                        convert_statements(ts::field(clause, "body"), branch->body, false);
                        block->body.push_back(std::move(branch));
                    } else if (kind == "finally_clause") {
                        auto branch = make_construct(clause, "finally");
                        convert_statements(child_of_type(clause, "block"), branch->body, false);
                        block->body.push_back(std::move(branch));
                    }
                }

                return block;
            }

            NodePtr convert_with(const TSNode node) {
                auto block = make_construct(node, "with");
                if (ts::has_token(node, "async")) {
                    block->metadata["async"] = "true";
                }

                for (const TSNode item : ts::named_children(child_of_type(node, "with_clause"))) {
                    if (!ts::is(item, "with_item")) {
                        continue;
                    }
                    auto statement = make<ast::ExpressionStatement>(item);
                    statement->metadata["kind"] = "with_item";
                    if (auto value = convert_expression(ts::field(item, "value"))) {
                        statement->expressions.push_back(std::move(value));
                    }
                    block->body.push_back(std::move(statement));
                }

                convert_statements(ts::field(node, "body"), block->body, false);
                return block;
            }

            NodePtr convert_match(const TSNode node) {
                auto block = make_construct(node, "match");

                auto subject = make<ast::ExpressionStatement>(node);
                subject->metadata["kind"] = "match_subject";
                for (const TSNode expression : ts::field_children(node, "subject")) {
                    if (auto converted = convert_expression(expression)) {
                        subject->expressions.push_back(std::move(converted));
                    }
                }
                if (!subject->expressions.empty()) {
                    block->body.push_back(std::move(subject));
                }

                TSNode cases = ts::field(node, "body");
                if (ts_node_is_null(cases)) {
                    cases = node;
                }

                for (const TSNode clause : ts::named_children(cases)) {
                    if (!ts::is(clause, "case_clause")) {
                        continue;
                    }
                    auto branch = make_construct(clause, "case");
                    convert_statements(ts::field(clause, "consequence"), branch->body, false);
                    block->body.push_back(std::move(branch));
                }

                return block;
            }

            void convert_expression_statement(const TSNode node, std::vector<NodePtr>& out) {
                auto statement = make<ast::ExpressionStatement>(node);

                for (const TSNode child : ts::named_children(node)) {
                    if (ts::is(child, "assignment")) {
                        convert_assignment(child, node, out);
                    } else if (auto expression = convert_expression(child)) {
                        statement->expressions.push_back(std::move(expression));
                    }
                }

                if (!statement->expressions.empty()) {
                    out.push_back(std::move(statement));
                }
            }

            /**
             * Assignments with plain name targets become VariableDeclarations.
             * A chain (a = b = 1) yields one declaration per name; the value
             * is attached to the first. Destructured names are declared
             * without an initializer. Any remaining targets and an
             * unattached value are kept in an ExpressionStatement.
             */
            void convert_assignment(const TSNode assignment, const TSNode statement, std::vector<NodePtr>& out) {
                std::vector<TSNode> targets;
                TSNode annotation{};
                TSNode current = assignment;

                while (ts::is(current, "assignment")) {
                    targets.push_back(ts::field(current, "left"));
                    if (ts_node_is_null(annotation)) {
                        annotation = ts::field(current, "type");
                    }
                    current = ts::field(current, "right");
                }

                NodePtr init = convert_expression(current);

                auto rest = make<ast::ExpressionStatement>(statement);
                rest->metadata["kind"] = "assignment";

                for (const TSNode target : targets) {
                    if (ts::is(target, "identifier")) {
                        auto declaration = make<ast::VariableDeclaration>(statement);
                        declaration->name = text(target);
                        if (!ts_node_is_null(annotation)) {
                            declaration->type_annotation = text(annotation);
                        }
                        if (init) {
                            declaration->init = std::move(init);
                        }
                        out.push_back(std::move(declaration));
                    } else if (is_destructuring_target(target)) {
                        for (const TSNode element : ts::named_children(target)) {
                            if (ts::is(element, "identifier")) {
                                auto declaration = make<ast::VariableDeclaration>(statement);
                                declaration->name = text(element);
                                declaration->metadata["destructured"] = "true";
                                out.push_back(std::move(declaration));
                            } else if (auto expression = convert_expression(element)) {
                                rest->expressions.push_back(std::move(expression));
                            }
                        }
                    } else if (auto expression = convert_expression(target)) {
                        rest->expressions.push_back(std::move(expression));
                    }
                }

                if (init) {
                    rest->expressions.push_back(std::move(init));
                }
                if (!rest->expressions.empty()) {
                    out.push_back(std::move(rest));
                }
            }

            NodePtr convert_expression(const TSNode node) {
                if (is_skipped(node)) {
                    return nullptr;
                }

                const auto kind = ts::type(node);

                if (kind == "identifier") {
                    auto identifier = make<ast::Identifier>(node);
                    identifier->name = text(node);
                    return identifier;
                }
                if (kind == "integer" || kind == "float") {
                    return make_literal(node, ast::LiteralKind::Number);
                }
                if (kind == "true" || kind == "false") {
                    return make_literal(node, ast::LiteralKind::Boolean);
                }
                if (kind == "none") {
                    return make_literal(node, ast::LiteralKind::None);
                }
                if (kind == "ellipsis") {
                    return make_literal(node, ast::LiteralKind::Ellipsis);
                }
                if (kind == "string" || kind == "concatenated_string") {
                    return convert_string(node);
                }
                if (kind == "parenthesized_expression") {
                    return convert_expression(first_named(node));
                }
                if (kind == "keyword_argument") {
                    return convert_expression(ts::field(node, "value"));
                }
                if (kind == "call") {
                    return convert_call(node);
                }
                if (kind == "attribute") {
                    auto access = make<ast::ExpressionStatement>(node);
                    access->metadata["kind"] = "attribute";
                    access->metadata["attribute"] = text(ts::field(node, "attribute"));
                    if (auto object = convert_expression(ts::field(node, "object"))) {
                        access->expressions.push_back(std::move(object));
                    }
                    return access;
                }
                if (kind == "comparison_operator") {
                    check_comparison(node);
                }

                return make_composite(node, kind);
            }

            NodePtr make_literal(const TSNode node, const ast::LiteralKind literal_kind) const {
                auto literal = make<ast::Literal>(node);
                literal->kind = literal_kind;
                literal->raw = text(node);
                return literal;
            }

            NodePtr convert_string(const TSNode node) {
                std::vector<TSNode> interpolations;
                collect_interpolations(node, interpolations);

                if (interpolations.empty()) {
                    return make_literal(node, ast::LiteralKind::String);
                }

                auto formatted = make<ast::ExpressionStatement>(node);
                formatted->metadata["kind"] = "formatted_string";
                for (const TSNode interpolation : interpolations) {
                    TSNode expression = ts::field(interpolation, "expression");
                    if (ts_node_is_null(expression)) {
                        expression = first_named(interpolation);
                    }
                    if (auto converted = convert_expression(expression)) {
                        formatted->expressions.push_back(std::move(converted));
                    }
                }
                return formatted;
            }

            NodePtr convert_call(const TSNode node) {
                auto call = make<ast::CallExpression>(node);
                call->callee = convert_expression(ts::field(node, "function"));

                const TSNode arguments = ts::field(node, "arguments");
                if (ts::is(arguments, "argument_list")) {
                    for (const TSNode argument : ts::named_children(arguments)) {
                        if (auto converted = convert_expression(argument)) {
                            call->arguments.push_back(std::move(converted));
                        }
                    }
                } else if (auto converted = convert_expression(arguments)) {
                    call->arguments.push_back(std::move(converted));
                }

                return call;
            }

            /**
             * Any construct without a dedicated kind: its named children are
             * converted as operands.
             */
            NodePtr make_composite(const TSNode node, const std::string_view kind) {
                auto composite = make<ast::ExpressionStatement>(node);
                composite->metadata["kind"] = std::string(kind);

                if (const TSNode op = ts::field(node, "operator"); !ts_node_is_null(op)) {
                    composite->metadata["operator"] = text(op);
                }

                for (const TSNode child : ts::named_children(node)) {
                    if (auto converted = convert_expression(child)) {
                        composite->expressions.push_back(std::move(converted));
                    }
                }
                return composite;
            }

            void check_comparison(const TSNode node) {
                const auto children = ts::children(node);

                for (std::size_t i = 0; i < children.size(); ++i) {
                    if (ts_node_is_named(children[i])) {
                        continue;
                    }

                    const auto op = ts::type(children[i]);
                    if (op != "is" && op != "is not") {
                        continue;
                    }

                    const bool left_literal = i > 0 && python::is_literal(children[i - 1]);
                    const bool right_literal = i + 1 < children.size() && python::is_literal(children[i + 1]);
                    if (!left_literal && !right_literal) {
                        continue;
                    }

                    add_warning(node, op == "is"
                        ? "\"is\" with a literal. Did you mean \"==\"?"
                        : "\"is not\" with a literal. Did you mean \"!=\"?");
                }
            }

            void check_assert(const TSNode node) {
                const TSNode test = first_named(node);
                if (ts::is(test, "tuple") && !ts::named_children(test).empty()) {
                    add_warning(node, "assertion is always true, perhaps remove parentheses?");
                }
            }

            const SyntaxTree& tree_;
            const ParserConfig& config_;
            std::vector<ParseDiagnostic>& warnings_;
        };

    }  // namespace

    PythonParser::PythonParser(ParserConfig config)
        : config_(std::move(config)) {}

    ParseResult PythonParser::do_parse(const std::string_view source) const {
        ParseResult result;

        auto tree = SyntaxTree::parse_python(source);
        if (tree.is_err()) {
            spdlog::error("Python parser unavailable: {}", tree.error().message());

            ParseDiagnostic diagnostic;
            diagnostic.kind = "ParserError";
            diagnostic.message = tree.error().message();
            result.errors.push_back(std::move(diagnostic));
            return result;
        }

        const SyntaxTree& syntax = tree.value();
        result.errors = syntax.syntax_errors();

        TreeConverter converter(syntax, config_, result.warnings);
        result.ast = converter.convert_module();

        if (!result.errors.empty()) {
            spdlog::warn("Python source has {} syntax error(s); first at line {}",
                         result.errors.size(), result.errors.front().line);
        }

        return result;
    }

}  // namespace csa::parsers
