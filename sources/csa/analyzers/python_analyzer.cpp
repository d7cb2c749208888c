#include "csa/analyzers/python_analyzer.hpp"
#include "csa/parsers/python_syntax.hpp"
#include "csa/parsers/syntax_tree.hpp"
#include "csa/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <optional>

namespace csa::analyzers {

    namespace ts = parsers::ts;
    namespace python = parsers::python;

    namespace {

        bool is_import(const TSNode node) noexcept {
            const auto type = ts::type(node);
            return type == "import_statement" ||
                   type == "import_from_statement" ||
                   type == "future_import_statement";
        }

        bool is_decision_point(const TSNode node) noexcept {
            const auto type = ts::type(node);
            return type == "if_statement" ||
                   type == "elif_clause" ||
                   type == "while_statement" ||
                   type == "for_statement" ||
                   type == "except_clause" ||
                   type == "except_group_clause" ||
                   type == "boolean_operator";
        }

        std::size_t count_decision_points(const TSNode node) {
            std::size_t count = 0;
            for (const TSNode child : ts::named_children(node)) {
                if (is_decision_point(child)) {
                    ++count;
                }
                count += count_decision_points(child);
            }
            return count;
        }

        /**
         * Walks one module's tree and fills a ModuleAnalysis.
         */
        class ModuleCollector {
        public:
            ModuleCollector(const parsers::SyntaxTree& tree, ModuleAnalysis& analysis)
                : tree_(tree)
                , analysis_(analysis) {}

            void run() {
                const TSNode root = tree_.root();

                for (const TSNode child : ts::named_children(root)) {
                    visit(child, std::nullopt);
                }
                collect_globals(root);
                collect_used_names(root);
            }

        private:
            std::string text(const TSNode node) const {
                return std::string(tree_.text(node));
            }

            /**
             * @param owning_class Index of the class whose body directly
             *        contains @p node, if any.
             */
            void visit(const TSNode node, const std::optional<std::size_t> owning_class) {
                const auto kind = ts::type(node);

                if (kind == "decorated_definition") {
                    std::vector<std::string> decorators;
                    for (const TSNode child : ts::named_children(node)) {
                        if (ts::is(child, "decorator")) {
                            decorators.push_back(python::decorator_name(tree_, child));
                        }
                    }
                    visit_definition(ts::field(node, "definition"), decorators, owning_class);
                    return;
                }

                if (kind == "function_definition" || kind == "class_definition") {
                    visit_definition(node, {}, owning_class);
                    return;
                }

                if (is_import(node)) {
                    collect_import(node);
                    return;
                }

                for (const TSNode child : ts::named_children(node)) {
                    visit(child, std::nullopt);
                }
            }

            void visit_definition(
                const TSNode node,
                const std::vector<std::string>& decorators,
                const std::optional<std::size_t> owning_class
            ) {
                if (ts::is(node, "function_definition")) {
                    FunctionInfo info = analyze_function(node, decorators);
                    if (owning_class) {
                        analysis_.classes[*owning_class].methods.push_back(std::move(info));
                    } else {
                        analysis_.functions.push_back(std::move(info));
                    }

                    for (const TSNode child : ts::named_children(ts::field(node, "body"))) {
                        visit(child, std::nullopt);
                    }
                    return;
                }

                if (ts::is(node, "class_definition")) {
                    const std::size_t index = analysis_.classes.size();
                    analysis_.classes.push_back(analyze_class(node, decorators));

                    for (const TSNode child : ts::named_children(ts::field(node, "body"))) {
                        visit(child, index);
                    }
                    return;
                }

                if (!ts_node_is_null(node)) {
                    visit(node, std::nullopt);
                }
            }

            FunctionInfo analyze_function(const TSNode node, const std::vector<std::string>& decorators) const {
                FunctionInfo info;
                info.name = text(ts::field(node, "name"));
                info.args = positional_args(ts::field(node, "parameters"));

                if (const TSNode returns = ts::field(node, "return_type"); !ts_node_is_null(returns)) {
                    info.returns = text(returns);
                }

                info.docstring = python::docstring(tree_, ts::field(node, "body"));
                info.line_start = tree_.start_of(node).line;
                info.line_end = tree_.end_of(node).line;
                info.complexity = 1 + count_decision_points(node);
                collect_calls(node, info.calls);
                info.decorators = decorators;
                info.is_async = ts::has_token(node, "async");

                return info;
            }

            /**
             * Names of the ordinary positional parameters: positional-only
             * parameters (before "/"), *args, keyword-only parameters and
             * **kwargs are excluded.
             */
            std::vector<std::string> positional_args(const TSNode parameters) const {
                std::vector<std::string> args;

                for (const TSNode child : ts::named_children(parameters)) {
                    const auto kind = ts::type(child);

                    if (kind == "positional_separator") {
                        args.clear();
                    } else if (kind == "keyword_separator" ||
                               kind == "list_splat_pattern" ||
                               kind == "dictionary_splat_pattern") {
                        break;
                    } else if (kind == "identifier") {
                        args.push_back(text(child));
                    } else if (kind == "typed_parameter") {
                        const TSNode name = ts_node_named_child(child, 0);
                        if (!ts::is(name, "identifier")) {
                            break;
                        }
                        args.push_back(text(name));
                    } else if (kind == "default_parameter" || kind == "typed_default_parameter") {
                        args.push_back(text(ts::field(child, "name")));
                    }
                }

                return args;
            }

            void collect_calls(const TSNode node, std::set<std::string>& calls) const {
                for (const TSNode child : ts::named_children(node)) {
                    if (ts::is(child, "call")) {
                        const TSNode function = ts::field(child, "function");
                        if (ts::is(function, "identifier")) {
                            calls.insert(text(function));
                        } else if (ts::is(function, "attribute")) {
                            calls.insert(text(ts::field(function, "attribute")));
                        }
                    }
                    collect_calls(child, calls);
                }
            }

            ClassInfo analyze_class(const TSNode node, const std::vector<std::string>& decorators) const {
                ClassInfo info;
                info.name = text(ts::field(node, "name"));

                for (const TSNode base : ts::named_children(ts::field(node, "superclasses"))) {
                    if (ts::is(base, "identifier")) {
                        info.bases.push_back(text(base));
                    } else if (ts::is(base, "attribute")) {
                        info.bases.push_back(text(ts::field(base, "attribute")));
                    }
                }

                info.docstring = python::docstring(tree_, ts::field(node, "body"));
                info.line_start = tree_.start_of(node).line;
                info.line_end = tree_.end_of(node).line;
                info.decorators = decorators;

                return info;
            }

            void collect_import(const TSNode node) {
                const std::size_t line = tree_.start_of(node).line;

                if (ts::is(node, "import_statement")) {
                    for (const TSNode name : ts::field_children(node, "name")) {
                        ImportInfo import;
                        import.line = line;

                        if (ts::is(name, "aliased_import")) {
                            import.module = text(ts::field(name, "name"));
                            import.alias = text(ts::field(name, "alias"));
                            import.bound_names.push_back(*import.alias);
                        } else {
                            import.module = text(name);
                            import.bound_names.emplace_back(string_utils::split(import.module, '.').front());
                        }

                        import.names.push_back(import.module);
                        analysis_.imports.push_back(std::move(import));
                    }
                    return;
                }

                ImportInfo import;
                import.line = line;
                import.is_from = true;
                import.module = ts::is(node, "future_import_statement")
                    ? "__future__"
                    : text(ts::field(node, "module_name"));

                for (const TSNode name : ts::field_children(node, "name")) {
                    if (ts::is(name, "aliased_import")) {
                        import.names.push_back(text(ts::field(name, "name")));
                        import.bound_names.push_back(text(ts::field(name, "alias")));
                    } else {
                        import.names.push_back(text(name));
                        import.bound_names.push_back(text(name));
                    }
                }

                for (const TSNode child : ts::named_children(node)) {
                    if (ts::is(child, "wildcard_import")) {
                        import.names.emplace_back("*");
                    }
                }

                analysis_.imports.push_back(std::move(import));
            }

            void collect_globals(const TSNode root) {
                for (const TSNode statement : ts::named_children(root)) {
                    if (!ts::is(statement, "expression_statement")) {
                        continue;
                    }

                    const std::size_t line = tree_.start_of(statement).line;
                    for (const TSNode child : ts::named_children(statement)) {
                        TSNode current = child;
                        while (ts::is(current, "assignment")) {
                            if (const TSNode target = ts::field(current, "left"); ts::is(target, "identifier")) {
                                VariableInfo variable;
                                variable.name = text(target);
                                variable.line = line;
                                if (const TSNode type = ts::field(current, "type"); !ts_node_is_null(type)) {
                                    variable.annotation = text(type);
                                }
                                analysis_.globals.push_back(std::move(variable));
                            }
                            current = ts::field(current, "right");
                        }
                    }
                }
            }

            /**
             * Collects names in load or store position. Definition names,
             * parameter names, keyword-argument names, attribute names after
             * the dot and everything inside import statements are skipped.
             */
            void collect_used_names(const TSNode node) {
                const auto kind = ts::type(node);

                if (is_import(node)) {
                    return;
                }

                if (kind == "identifier") {
                    analysis_.used_names.insert(text(node));
                    return;
                }

                if (kind == "parameters" || kind == "lambda_parameters") {
                    for (const TSNode parameter : ts::named_children(node)) {
                        collect_parameter_defaults(parameter);
                    }
                    return;
                }

                TSNode skipped{};
                if (kind == "attribute") {
                    skipped = ts::field(node, "attribute");
                } else if (kind == "function_definition" || kind == "class_definition" || kind == "keyword_argument") {
                    skipped = ts::field(node, "name");
                }

                for (const TSNode child : ts::named_children(node)) {
                    if (!ts_node_is_null(skipped) && ts_node_eq(child, skipped)) {
                        continue;
                    }
                    collect_used_names(child);
                }
            }

            void collect_parameter_defaults(const TSNode parameter) {
                const auto kind = ts::type(parameter);
                if (kind == "typed_parameter" || kind == "typed_default_parameter") {
                    collect_used_names(ts::field(parameter, "type"));
                }
                if (kind == "default_parameter" || kind == "typed_default_parameter") {
                    collect_used_names(ts::field(parameter, "value"));
                }
            }

            const parsers::SyntaxTree& tree_;
            ModuleAnalysis& analysis_;
        };

    }  // namespace

    Result<ModuleAnalysis, Error> PythonAnalyzer::analyze(
        const std::string_view source,
        const std::string_view filename
    ) const {
        auto tree = parsers::SyntaxTree::parse_python(source);
        if (tree.is_err()) {
            return Result<ModuleAnalysis, Error>::failure(
                Error::analysis_error("Failed to build Python syntax tree", tree.error().message())
            );
        }

        const parsers::SyntaxTree& syntax = tree.value();

        ModuleAnalysis analysis;
        analysis.language = std::string(language_id());
        if (!filename.empty()) {
            analysis.filename = std::string(filename);
        }
        analysis.syntax_errors = syntax.syntax_errors();

        ModuleCollector(syntax, analysis).run();

        const auto [total, non_empty] = count_lines(source, "#");
        analysis.total_lines = total;
        analysis.non_empty_lines = non_empty;

        if (!analysis.syntax_errors.empty()) {
            spdlog::warn("{}: {} syntax error(s); analysis covers the recoverable part",
                         filename.empty() ? "<string>" : filename, analysis.syntax_errors.size());
        }
        spdlog::debug("Analyzed {}: {} functions, {} classes, {} imports",
                      filename.empty() ? "<string>" : filename,
                      analysis.functions.size(), analysis.classes.size(), analysis.imports.size());

        return Result<ModuleAnalysis, Error>::success(std::move(analysis));
    }

}  // namespace csa::analyzers
