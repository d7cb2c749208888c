#include <gtest/gtest.h>
#include "csa/parsers/python_parser.hpp"
#include "csa/ast/traversal.hpp"
#include "csa/export/json_exporter.hpp"

#include <string>

using namespace csa;
using namespace csa::ast;
using namespace csa::parsers;

class PythonParserTest : public ::testing::Test {
protected:
    ParseResult parse(const std::string& source) const {
        return parser_.parse(source, std::string("test.py"));
    }

    template<typename T>
    static const T& as(const NodePtr& node) {
        EXPECT_NE(node, nullptr);
        EXPECT_EQ(node->type(), T::KIND);
        return static_cast<const T&>(*node);
    }

    PythonParser parser_;
};

TEST_F(PythonParserTest, Identity) {
    EXPECT_EQ(parser_.language_id(), "python");
    EXPECT_EQ(parser_.supported_extensions(), (std::set<std::string>{"py", "pyw", "python"}));
    EXPECT_TRUE(parser_.can_parse("pkg/module.py"));
    EXPECT_TRUE(parser_.can_parse("Tool.PYW"));
    EXPECT_FALSE(parser_.can_parse("module.pyc"));
    EXPECT_FALSE(parser_.can_parse("Makefile"));
}

TEST_F(PythonParserTest, EmptySourceIsEmptyProgram) {
    const auto result = parse("");

    ASSERT_NE(result.ast, nullptr);
    EXPECT_TRUE(result.ast->body.empty());
    EXPECT_EQ(count_nodes(*result.ast), 1u);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(result.metadata.language, "python");
    EXPECT_EQ(result.metadata.filename, "test.py");
}

TEST_F(PythonParserTest, FunctionWithBranch) {
    const auto result = parse("def f(x):\n    if x:\n        return 1\n    return 0\n");
    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.ast->body.size(), 1u);

    const auto& function = as<FunctionDeclaration>(result.ast->body[0]);
    EXPECT_EQ(function.name, "f");
    ASSERT_EQ(function.params.size(), 1u);
    EXPECT_EQ(function.params[0].name, "x");
    EXPECT_FALSE(function.is_async);
    EXPECT_FALSE(function.is_generator);
    ASSERT_NE(function.body, nullptr);
    ASSERT_EQ(function.body->body.size(), 2u);

    const auto& branch = as<IfStatement>(function.body->body[0]);
    EXPECT_EQ(as<Identifier>(branch.test).name, "x");
    EXPECT_EQ(branch.alternate, nullptr);

    const auto& consequent = as<BlockStatement>(branch.consequent);
    ASSERT_EQ(consequent.body.size(), 1u);
    const auto& returned = as<ReturnStatement>(consequent.body[0]);
    const auto& literal = as<Literal>(returned.argument);
    EXPECT_EQ(literal.kind, LiteralKind::Number);
    EXPECT_EQ(literal.raw, "1");

    EXPECT_EQ(calculate_complexity(function), 2u);
    EXPECT_EQ(count_nodes(*result.ast), 10u);
    EXPECT_EQ(result.metadata.node_count, 10u);
    EXPECT_EQ(result.metadata.line_count, 4u);

    ASSERT_TRUE(function.range.has_value());
    EXPECT_EQ(function.range->start.line, 1u);
    EXPECT_EQ(function.range->start.column, 0u);
    EXPECT_EQ(function.range->end.line, 4u);
}

TEST_F(PythonParserTest, Parameters) {
    const auto result = parse(
        "def h(a, b: int, c=1, d: str = \"x\", *args, **kwargs) -> bool:\n"
        "    pass\n"
    );
    ASSERT_TRUE(result.errors.empty());

    const auto& function = as<FunctionDeclaration>(result.ast->body[0]);
    ASSERT_EQ(function.params.size(), 6u);

    EXPECT_EQ(function.params[0].name, "a");
    EXPECT_FALSE(function.params[0].type.has_value());

    EXPECT_EQ(function.params[1].name, "b");
    EXPECT_EQ(function.params[1].type, "int");

    EXPECT_EQ(function.params[2].name, "c");
    EXPECT_EQ(function.params[2].default_value, "1");

    EXPECT_EQ(function.params[3].name, "d");
    EXPECT_EQ(function.params[3].type, "str");
    EXPECT_EQ(function.params[3].default_value, "\"x\"");

    EXPECT_EQ(function.params[4].name, "*args");
    EXPECT_EQ(function.params[5].name, "**kwargs");
    EXPECT_EQ(function.return_type, "bool");
}

TEST_F(PythonParserTest, AsyncAndGeneratorFlags) {
    const auto result = parse(
        "async def g():\n"
        "    yield 1\n"
        "\n"
        "def outer():\n"
        "    def inner():\n"
        "        yield 1\n"
        "    return inner\n"
    );
    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.ast->body.size(), 2u);

    const auto& g = as<FunctionDeclaration>(result.ast->body[0]);
    EXPECT_TRUE(g.is_async);
    EXPECT_TRUE(g.is_generator);

    const auto& outer = as<FunctionDeclaration>(result.ast->body[1]);
    EXPECT_FALSE(outer.is_generator);

    const auto& inner = as<FunctionDeclaration>(outer.body->body[0]);
    EXPECT_EQ(inner.name, "inner");
    EXPECT_TRUE(inner.is_generator);
}

TEST_F(PythonParserTest, ClassesAndMethods) {
    const auto result = parse(
        "@dataclass\n"
        "class A(Base, mixins.Mixin, metaclass=Meta):\n"
        "    limit = 3\n"
        "    def m(self):\n"
        "        def helper():\n"
        "            pass\n"
        "        return helper\n"
        "    @staticmethod\n"
        "    def s():\n"
        "        pass\n"
    );
    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.ast->body.size(), 1u);

    const auto& cls = as<ClassDeclaration>(result.ast->body[0]);
    EXPECT_EQ(cls.name, "A");
    EXPECT_EQ(cls.bases, (std::vector<std::string>{"Base", "mixins.Mixin"}));
    EXPECT_EQ(cls.super_class, "Base");
    EXPECT_EQ(cls.metadata.at("decorators"), "dataclass");
    ASSERT_EQ(cls.body.size(), 3u);

    EXPECT_EQ(as<VariableDeclaration>(cls.body[0]).name, "limit");

    const auto& m = as<MethodDeclaration>(cls.body[1]);
    EXPECT_EQ(m.name, "m");
    EXPECT_FALSE(m.is_static);
    EXPECT_EQ(as<FunctionDeclaration>(m.body->body[0]).name, "helper");

    const auto& s = as<MethodDeclaration>(cls.body[2]);
    EXPECT_TRUE(s.is_static);
    EXPECT_EQ(s.metadata.at("decorators"), "staticmethod");
}

TEST_F(PythonParserTest, ElifChainNestsIfStatements) {
    const auto result = parse(
        "if a:\n"
        "    pass\n"
        "elif b:\n"
        "    pass\n"
        "else:\n"
        "    pass\n"
    );
    ASSERT_TRUE(result.errors.empty());

    const auto& top = as<IfStatement>(result.ast->body[0]);
    EXPECT_EQ(as<Identifier>(top.test).name, "a");

    const auto& elif = as<IfStatement>(top.alternate);
    EXPECT_EQ(as<Identifier>(elif.test).name, "b");
    EXPECT_NE(node_cast<BlockStatement>(*elif.alternate), nullptr);

    EXPECT_EQ(find_nodes_by_type(*result.ast, NodeType::IfStatement).size(), 2u);
}

TEST_F(PythonParserTest, LoopsAndElseClauses) {
    const auto result = parse(
        "for i in range(3):\n"
        "    pass\n"
        "else:\n"
        "    pass\n"
        "while running:\n"
        "    step()\n"
    );
    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.ast->body.size(), 3u);

    const auto& loop = as<ForLoop>(result.ast->body[0]);
    EXPECT_EQ(as<Identifier>(loop.init).name, "i");
    const auto& iterable = as<CallExpression>(loop.test);
    EXPECT_EQ(as<Identifier>(iterable.callee).name, "range");
    EXPECT_EQ(loop.update, nullptr);

    const auto& else_block = as<BlockStatement>(result.ast->body[1]);
    EXPECT_EQ(else_block.metadata.at("construct"), "else");

    const auto& while_loop = as<WhileLoop>(result.ast->body[2]);
    EXPECT_EQ(as<Identifier>(while_loop.test).name, "running");
}

TEST_F(PythonParserTest, Assignments) {
    const auto result = parse(
        "a = b = 1\n"
        "x, y = pair\n"
        "count: int = 0\n"
        "obj.attr = 3\n"
    );
    ASSERT_TRUE(result.errors.empty());

    const auto variables = find_nodes_by_type(*result.ast, NodeType::VariableDeclaration);
    ASSERT_EQ(variables.size(), 5u);

    const auto& a = static_cast<const VariableDeclaration&>(*variables[0]);
    EXPECT_EQ(a.name, "a");
    EXPECT_NE(a.init, nullptr);

    const auto& b = static_cast<const VariableDeclaration&>(*variables[1]);
    EXPECT_EQ(b.name, "b");
    EXPECT_EQ(b.init, nullptr);

    const auto& x = static_cast<const VariableDeclaration&>(*variables[2]);
    EXPECT_EQ(x.name, "x");
    EXPECT_EQ(x.metadata.at("destructured"), "true");

    const auto& count = static_cast<const VariableDeclaration&>(*variables[4]);
    EXPECT_EQ(count.name, "count");
    EXPECT_EQ(count.type_annotation, "int");
    EXPECT_EQ(as<Literal>(count.init).raw, "0");

    const auto& attribute_assignment = as<ExpressionStatement>(result.ast->body.back());
    EXPECT_EQ(attribute_assignment.metadata.at("kind"), "assignment");
    ASSERT_EQ(attribute_assignment.expressions.size(), 2u);
    EXPECT_EQ(attribute_assignment.expressions[0]->metadata.at("attribute"), "attr");
}

TEST_F(PythonParserTest, CallsAndStrings) {
    const auto result = parse(
        "print(a, sep=\"-\")\n"
        "greeting = f\"hello {name}\"\n"
    );
    ASSERT_TRUE(result.errors.empty());

    const auto& statement = as<ExpressionStatement>(result.ast->body[0]);
    const auto& call = as<CallExpression>(statement.expressions[0]);
    EXPECT_EQ(as<Identifier>(call.callee).name, "print");
    ASSERT_EQ(call.arguments.size(), 2u);
    EXPECT_EQ(as<Identifier>(call.arguments[0]).name, "a");
    EXPECT_EQ(as<Literal>(call.arguments[1]).kind, LiteralKind::String);

    const auto& greeting = as<VariableDeclaration>(result.ast->body[1]);
    const auto& formatted = as<ExpressionStatement>(greeting.init);
    EXPECT_EQ(formatted.metadata.at("kind"), "formatted_string");
    ASSERT_EQ(formatted.expressions.size(), 1u);
    EXPECT_EQ(as<Identifier>(formatted.expressions[0]).name, "name");
}

TEST_F(PythonParserTest, CompoundStatementsBecomeBlocks) {
    const auto result = parse(
        "import os\n"
        "try:\n"
        "    run()\n"
        "except ValueError:\n"
        "    pass\n"
        "finally:\n"
        "    close()\n"
        "with open(path) as handle:\n"
        "    read(handle)\n"
    );
    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.ast->body.size(), 3u);

    const auto& import = as<ExpressionStatement>(result.ast->body[0]);
    EXPECT_EQ(import.metadata.at("kind"), "import_statement");
    EXPECT_EQ(import.metadata.at("source"), "import os");

    const auto& try_block = as<BlockStatement>(result.ast->body[1]);
    EXPECT_EQ(try_block.metadata.at("construct"), "try");
    ASSERT_EQ(try_block.body.size(), 3u);

    const auto& handler = as<BlockStatement>(try_block.body[1]);
    EXPECT_EQ(handler.metadata.at("construct"), "except");
    const auto& types = as<ExpressionStatement>(handler.body[0]);
    EXPECT_EQ(types.metadata.at("kind"), "exception_types");
    EXPECT_EQ(as<Identifier>(types.expressions[0]).name, "ValueError");

    EXPECT_EQ(as<BlockStatement>(try_block.body[2]).metadata.at("construct"), "finally");

    const auto& with_block = as<BlockStatement>(result.ast->body[2]);
    EXPECT_EQ(with_block.metadata.at("construct"), "with");
    EXPECT_EQ(as<ExpressionStatement>(with_block.body[0]).metadata.at("kind"), "with_item");
}

TEST_F(PythonParserTest, LiteralComparisonWarnings) {
    const auto result = parse(
        "if x is 1:\n"
        "    pass\n"
        "if y is not \"a\":\n"
        "    pass\n"
        "if z is None:\n"
        "    pass\n"
    );
    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.warnings.size(), 2u);

    EXPECT_EQ(result.warnings[0].kind, "SyntaxWarning");
    EXPECT_EQ(result.warnings[0].message, "\"is\" with a literal. Did you mean \"==\"?");
    EXPECT_EQ(result.warnings[0].line, 1u);
    EXPECT_EQ(result.warnings[0].text, "if x is 1:");

    EXPECT_EQ(result.warnings[1].message, "\"is not\" with a literal. Did you mean \"!=\"?");
    EXPECT_EQ(result.warnings[1].line, 3u);
}

TEST_F(PythonParserTest, TupleAssertWarning) {
    const auto result = parse("assert (x, \"message\")\nassert x, \"message\"\n");
    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].message, "assertion is always true, perhaps remove parentheses?");
    EXPECT_EQ(result.warnings[0].line, 1u);
}

TEST_F(PythonParserTest, SyntaxErrorsAreReportedNotThrown) {
    const auto result = parse("def f(:\n    pass\n");

    ASSERT_NE(result.ast, nullptr);
    ASSERT_TRUE(result.has_errors());
    EXPECT_EQ(result.errors[0].kind, "SyntaxError");
    EXPECT_EQ(result.errors[0].line, 1u);
    EXPECT_TRUE(result.errors[0].text.has_value());
}

TEST_F(PythonParserTest, LocationsCanBeDisabled) {
    const PythonParser parser(ParserConfig{.source_type = "script", .include_locations = false});
    const auto result = parser.parse("def f():\n    return 1\n");

    EXPECT_EQ(result.ast->source_type, "script");
    walk(*result.ast, [](const Node& node, const Node*) {
        EXPECT_FALSE(node.range.has_value()) << node_type_to_string(node.type());
    });
}

TEST_F(PythonParserTest, RepeatedParsesAreIdentical) {
    const std::string source =
        "import sys\n"
        "class Runner:\n"
        "    def run(self, argv):\n"
        "        for arg in argv:\n"
        "            if arg.startswith('-'):\n"
        "                continue\n"
        "        return len(argv)\n";

    const exporters::JsonExporter exporter;
    const auto first = parse(source);
    const auto second = parse(source);

    EXPECT_EQ(exporter.node_to_json(*first.ast), exporter.node_to_json(*second.ast));
    EXPECT_EQ(first.metadata.node_count, second.metadata.node_count);
    EXPECT_EQ(first.errors.size(), second.errors.size());
}
