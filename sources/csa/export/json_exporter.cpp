#include "csa/export/json_exporter.hpp"

namespace csa::exporters {

    using json = nlohmann::json;

    namespace {

        json location_to_json(const ast::SourceLocation& location) {
            return {{"line", location.line}, {"column", location.column}};
        }

        template<typename T>
        json optional_to_json(const std::optional<T>& value) {
            if (value) {
                return *value;
            }
            return nullptr;
        }

        json parameters_to_json(const std::vector<ast::Parameter>& params) {
            json result = json::array();
            for (const auto& param : params) {
                result.push_back({
                    {"name", param.name},
                    {"type", optional_to_json(param.type)},
                    {"default_value", optional_to_json(param.default_value)}
                });
            }
            return result;
        }

    }  // namespace

    JsonExporter::JsonExporter(ExportOptions options)
        : options_(std::move(options)) {}

    json JsonExporter::node_to_json(const ast::Node& node) const {
        const auto child = [this](const ast::Node* value) -> json {
            return value ? node_to_json(*value) : json(nullptr);
        };
        const auto list = [this](const std::vector<ast::NodePtr>& values) {
            json result = json::array();
            for (const auto& value : values) {
                if (value) {
                    result.push_back(node_to_json(*value));
                }
            }
            return result;
        };

        json output;
        output["type"] = ast::node_type_to_string(node.type());

        if (options_.include_locations && node.range) {
            output["loc"] = {
                {"start", location_to_json(node.range->start)},
                {"end", location_to_json(node.range->end)}
            };
        }
        if (!node.metadata.empty()) {
            output["metadata"] = node.metadata;
        }

        switch (node.type()) {
            case ast::NodeType::Program: {
                const auto& program = static_cast<const ast::Program&>(node);
                output["source_type"] = program.source_type;
                output["body"] = list(program.body);
                break;
            }
            case ast::NodeType::FunctionDeclaration:
            case ast::NodeType::MethodDeclaration: {
                const auto& callable = static_cast<const ast::CallableDeclaration&>(node);
                output["name"] = callable.name;
                output["params"] = parameters_to_json(callable.params);
                output["return_type"] = optional_to_json(callable.return_type);
                output["is_async"] = callable.is_async;
                output["is_generator"] = callable.is_generator;
                if (const auto* method = ast::node_cast<ast::MethodDeclaration>(node)) {
                    output["is_static"] = method->is_static;
                }
                output["body"] = child(callable.body.get());
                break;
            }
            case ast::NodeType::ClassDeclaration: {
                const auto& cls = static_cast<const ast::ClassDeclaration&>(node);
                output["name"] = cls.name;
                output["super_class"] = optional_to_json(cls.super_class);
                output["bases"] = cls.bases;
                output["body"] = list(cls.body);
                break;
            }
            case ast::NodeType::VariableDeclaration: {
                const auto& variable = static_cast<const ast::VariableDeclaration&>(node);
                output["name"] = variable.name;
                output["kind"] = variable.kind;
                output["type_annotation"] = optional_to_json(variable.type_annotation);
                output["init"] = child(variable.init.get());
                break;
            }
            case ast::NodeType::IfStatement: {
                const auto& statement = static_cast<const ast::IfStatement&>(node);
                output["test"] = child(statement.test.get());
                output["consequent"] = child(statement.consequent.get());
                output["alternate"] = child(statement.alternate.get());
                break;
            }
            case ast::NodeType::WhileLoop: {
                const auto& loop = static_cast<const ast::WhileLoop&>(node);
                output["test"] = child(loop.test.get());
                output["body"] = child(loop.body.get());
                break;
            }
            case ast::NodeType::ForLoop: {
                const auto& loop = static_cast<const ast::ForLoop&>(node);
                output["init"] = child(loop.init.get());
                output["test"] = child(loop.test.get());
                output["update"] = child(loop.update.get());
                output["body"] = child(loop.body.get());
                break;
            }
            case ast::NodeType::ReturnStatement: {
                const auto& statement = static_cast<const ast::ReturnStatement&>(node);
                output["argument"] = child(statement.argument.get());
                break;
            }
            case ast::NodeType::ExpressionStatement: {
                const auto& statement = static_cast<const ast::ExpressionStatement&>(node);
                output["expressions"] = list(statement.expressions);
                break;
            }
            case ast::NodeType::BlockStatement: {
                const auto& block = static_cast<const ast::BlockStatement&>(node);
                output["body"] = list(block.body);
                break;
            }
            case ast::NodeType::CallExpression: {
                const auto& call = static_cast<const ast::CallExpression&>(node);
                output["callee"] = child(call.callee.get());
                output["arguments"] = list(call.arguments);
                break;
            }
            case ast::NodeType::Identifier: {
                output["name"] = static_cast<const ast::Identifier&>(node).name;
                break;
            }
            case ast::NodeType::Literal: {
                const auto& literal = static_cast<const ast::Literal&>(node);
                output["kind"] = ast::literal_kind_to_string(literal.kind);
                output["raw"] = literal.raw;
                break;
            }
        }

        return output;
    }

    json JsonExporter::diagnostic_to_json(const parsers::ParseDiagnostic& diagnostic) {
        json output = {
            {"kind", diagnostic.kind},
            {"message", diagnostic.message},
            {"line", diagnostic.line},
            {"column", diagnostic.column}
        };
        if (diagnostic.text) {
            output["text"] = *diagnostic.text;
        }
        return output;
    }

    json JsonExporter::parse_result_to_json(const parsers::ParseResult& result) const {
        json errors = json::array();
        for (const auto& error : result.errors) {
            errors.push_back(diagnostic_to_json(error));
        }

        json warnings = json::array();
        for (const auto& warning : result.warnings) {
            warnings.push_back(diagnostic_to_json(warning));
        }

        const auto& metadata = result.metadata;

        json output;
        output["ast"] = options_.include_ast && result.ast ? node_to_json(*result.ast) : json(nullptr);
        output["errors"] = errors;
        output["warnings"] = warnings;
        output["metadata"] = {
            {"language", metadata.language},
            {"parse_time_ms", metadata.parse_time_ms},
            {"node_count", metadata.node_count},
            {"line_count", metadata.line_count},
            {"filename", optional_to_json(metadata.filename)}
        };
        return output;
    }

    json JsonExporter::metrics_to_json(const ast::CodeMetrics& metrics) {
        return {
            {"functions", metrics.functions},
            {"methods", metrics.methods},
            {"classes", metrics.classes},
            {"variables", metrics.variables},
            {"conditionals", metrics.conditionals},
            {"loops", metrics.loops},
            {"complexity", metrics.complexity},
            {"depth", metrics.depth},
            {"node_count", metrics.node_count}
        };
    }

    std::string JsonExporter::dump(const json& document) const {
        const int indent = options_.pretty_print ? options_.indent : -1;
        return document.dump(indent, ' ', false, json::error_handler_t::replace);
    }

    Result<void, Error> JsonExporter::write(std::ostream& stream, const json& document) const {
        stream << dump(document) << '\n';
        if (!stream) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write JSON output")
            );
        }
        return Result<void, Error>::success();
    }

}  // namespace csa::exporters
