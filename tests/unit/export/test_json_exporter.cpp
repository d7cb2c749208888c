#include <gtest/gtest.h>
#include "csa/export/json_exporter.hpp"
#include "csa/parsers/python_parser.hpp"

#include <sstream>

using namespace csa;
using namespace csa::exporters;
using namespace csa::ast;

using json = nlohmann::json;

namespace {

    std::unique_ptr<Program> sample_program() {
        auto program = std::make_unique<Program>();
        program->range = SourceRange{{1, 0}, {3, 12}};

        auto function = std::make_unique<FunctionDeclaration>();
        function->name = "area";
        function->params.push_back({"width", std::string("int"), std::nullopt});
        function->params.push_back({"height", std::nullopt, std::string("1")});
        function->return_type = "int";
        function->body = std::make_unique<BlockStatement>();

        auto product = std::make_unique<CallExpression>();
        product->callee = std::make_unique<Identifier>("mul");
        product->arguments.push_back(std::make_unique<Identifier>("width"));
        auto two = std::make_unique<Literal>();
        two->kind = LiteralKind::Number;
        two->raw = "2";
        product->arguments.push_back(std::move(two));

        auto returned = std::make_unique<ReturnStatement>();
        returned->argument = std::move(product);
        function->body->body.push_back(std::move(returned));
        program->body.push_back(std::move(function));

        auto empty_return = std::make_unique<ReturnStatement>();
        empty_return->metadata["note"] = "bare";
        program->body.push_back(std::move(empty_return));

        return program;
    }

}  // namespace

class JsonExporterTest : public ::testing::Test {
protected:
    JsonExporter exporter_;
};

TEST_F(JsonExporterTest, DefaultOptions) {
    const ExportOptions& options = exporter_.options();
    EXPECT_TRUE(options.pretty_print);
    EXPECT_EQ(options.indent, 2);
    EXPECT_TRUE(options.include_ast);
    EXPECT_TRUE(options.include_locations);
}

TEST_F(JsonExporterTest, NodeFields) {
    const auto program = sample_program();
    const json document = exporter_.node_to_json(*program);

    EXPECT_EQ(document["type"], "Program");
    EXPECT_EQ(document["source_type"], "module");
    EXPECT_EQ(document["loc"]["start"]["line"], 1);
    EXPECT_EQ(document["loc"]["end"]["column"], 12);
    ASSERT_EQ(document["body"].size(), 2u);

    const json& function = document["body"][0];
    EXPECT_EQ(function["type"], "FunctionDeclaration");
    EXPECT_EQ(function["name"], "area");
    EXPECT_EQ(function["return_type"], "int");
    EXPECT_FALSE(function["is_async"].get<bool>());
    EXPECT_FALSE(function.contains("is_static"));
    EXPECT_FALSE(function.contains("loc"));
    EXPECT_EQ(function["params"][0]["type"], "int");
    EXPECT_TRUE(function["params"][0]["default_value"].is_null());
    EXPECT_EQ(function["params"][1]["default_value"], "1");

    const json& call = function["body"]["body"][0]["argument"];
    EXPECT_EQ(call["type"], "CallExpression");
    EXPECT_EQ(call["callee"]["name"], "mul");
    EXPECT_EQ(call["arguments"][1]["kind"], "number");
    EXPECT_EQ(call["arguments"][1]["raw"], "2");

    const json& bare = document["body"][1];
    EXPECT_TRUE(bare["argument"].is_null());
    EXPECT_EQ(bare["metadata"]["note"], "bare");
}

TEST_F(JsonExporterTest, MethodCarriesStaticFlag) {
    MethodDeclaration method;
    method.name = "build";
    method.is_static = true;

    const json document = exporter_.node_to_json(method);
    EXPECT_EQ(document["type"], "MethodDeclaration");
    EXPECT_TRUE(document["is_static"].get<bool>());
    EXPECT_TRUE(document["body"].is_null());
}

TEST_F(JsonExporterTest, LocationsCanBeDisabled) {
    const JsonExporter exporter(ExportOptions{.include_locations = false});
    const auto program = sample_program();

    const json document = exporter.node_to_json(*program);
    EXPECT_FALSE(document.contains("loc"));
}

TEST_F(JsonExporterTest, ParseResultWithAndWithoutAst) {
    const parsers::PythonParser parser;
    const auto result = parser.parse("def f():\n    return 1\n", std::string("f.py"));

    const json with_ast = exporter_.parse_result_to_json(result);
    EXPECT_EQ(with_ast["ast"]["type"], "Program");
    EXPECT_TRUE(with_ast["errors"].empty());
    EXPECT_TRUE(with_ast["warnings"].is_array());
    EXPECT_EQ(with_ast["metadata"]["language"], "python");
    EXPECT_EQ(with_ast["metadata"]["filename"], "f.py");
    EXPECT_EQ(with_ast["metadata"]["node_count"], result.metadata.node_count);

    const JsonExporter summary(ExportOptions{.include_ast = false});
    const json without_ast = summary.parse_result_to_json(result);
    EXPECT_TRUE(without_ast["ast"].is_null());
    EXPECT_EQ(without_ast["metadata"], with_ast["metadata"]);
}

TEST_F(JsonExporterTest, Diagnostics) {
    const parsers::ParseDiagnostic with_text{"syntax", "Unexpected token", 4, 2, std::string("(:")};
    const json document = JsonExporter::diagnostic_to_json(with_text);
    EXPECT_EQ(document["kind"], "syntax");
    EXPECT_EQ(document["line"], 4);
    EXPECT_EQ(document["column"], 2);
    EXPECT_EQ(document["text"], "(:");

    const parsers::ParseDiagnostic without_text{"warning", "Suspicious", 1, 0, std::nullopt};
    EXPECT_FALSE(JsonExporter::diagnostic_to_json(without_text).contains("text"));
}

TEST_F(JsonExporterTest, Metrics) {
    const auto program = sample_program();
    const CodeMetrics metrics = extract_metrics(*program);

    const json document = JsonExporter::metrics_to_json(metrics);
    EXPECT_EQ(document["functions"], 1);
    EXPECT_EQ(document["complexity"], 1);
    EXPECT_EQ(document["node_count"], metrics.node_count);
    EXPECT_EQ(document.size(), 9u);
}

TEST_F(JsonExporterTest, DumpHonorsFormatting) {
    const json document = {{"a", 1}, {"b", {1, 2}}};

    EXPECT_EQ(JsonExporter(ExportOptions{.pretty_print = false}).dump(document), R"({"a":1,"b":[1,2]})");

    const std::string pretty = JsonExporter(ExportOptions{.indent = 4}).dump(document);
    EXPECT_NE(pretty.find("\n    \"a\": 1"), std::string::npos);
}

TEST_F(JsonExporterTest, DumpReplacesInvalidUtf8) {
    const json document = {{"name", std::string("bad\xff")}};
    EXPECT_NO_THROW({
        const std::string text = exporter_.dump(document);
        EXPECT_NE(text.find("bad"), std::string::npos);
    });
}

TEST_F(JsonExporterTest, WriteAppendsNewline) {
    std::ostringstream stream;
    const JsonExporter compact(ExportOptions{.pretty_print = false});

    auto result = compact.write(stream, json{{"ok", true}});
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(stream.str(), "{\"ok\":true}\n");
}

TEST_F(JsonExporterTest, WriteReportsStreamFailure) {
    std::ostringstream stream;
    stream.setstate(std::ios::badbit);

    auto result = exporter_.write(stream, json::object());
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::IoError);
}
