#include <gtest/gtest.h>
#include "csa/ast/visitor.hpp"

#include <string>
#include <vector>

using namespace csa::ast;

namespace {

    class RecordingVisitor : public NodeVisitor {
    public:
        std::vector<std::string> functions;
        std::vector<std::string> identifiers;
        std::size_t nodes = 0;
        bool skip_functions = false;

    protected:
        VisitAction visit_function(const FunctionDeclaration& node) override {
            functions.push_back(node.name);
            return skip_functions ? VisitAction::SkipChildren : VisitAction::Continue;
        }

        VisitAction visit_identifier(const Identifier& node) override {
            identifiers.push_back(node.name);
            return VisitAction::Continue;
        }

        VisitAction visit_node(const Node&) override {
            ++nodes;
            return VisitAction::Continue;
        }
    };

    class ClassPruner : public NodeVisitor {
    public:
        std::size_t methods = 0;

    protected:
        VisitAction visit_method(const MethodDeclaration&) override {
            ++methods;
            return VisitAction::Continue;
        }

        VisitAction visit_node(const Node& node) override {
            return node.type() == NodeType::ClassDeclaration ? VisitAction::SkipChildren : VisitAction::Continue;
        }
    };

    std::unique_ptr<Program> make_program() {
        auto function = std::make_unique<FunctionDeclaration>();
        function->name = "outer";
        function->body = std::make_unique<BlockStatement>();

        auto returned = std::make_unique<ReturnStatement>();
        returned->argument = std::make_unique<Identifier>("inner_value");
        function->body->body.push_back(std::move(returned));

        auto cls = std::make_unique<ClassDeclaration>();
        cls->name = "Holder";
        auto method = std::make_unique<MethodDeclaration>();
        method->name = "get";
        cls->body.push_back(std::move(method));

        auto call = std::make_unique<CallExpression>();
        call->callee = std::make_unique<Identifier>("print");
        auto statement = std::make_unique<ExpressionStatement>();
        statement->expressions.push_back(std::move(call));

        auto program = std::make_unique<Program>();
        program->body.push_back(std::move(function));
        program->body.push_back(std::move(cls));
        program->body.push_back(std::move(statement));
        return program;
    }

}  // namespace

TEST(NodeVisitorTest, DispatchesSpecificAndGenericHooks) {
    const auto program = make_program();

    RecordingVisitor visitor;
    visitor.traverse(*program);

    EXPECT_EQ(visitor.functions, std::vector<std::string>{"outer"});
    EXPECT_EQ(visitor.identifiers, (std::vector<std::string>{"inner_value", "print"}));
    EXPECT_EQ(visitor.nodes, 10u);
}

TEST(NodeVisitorTest, SkipChildrenFromSpecificHookPrunesSubtree) {
    const auto program = make_program();

    RecordingVisitor visitor;
    visitor.skip_functions = true;
    visitor.traverse(*program);

    EXPECT_EQ(visitor.functions, std::vector<std::string>{"outer"});
    EXPECT_EQ(visitor.identifiers, std::vector<std::string>{"print"});
    EXPECT_EQ(visitor.nodes, 7u);
}

TEST(NodeVisitorTest, SkipChildrenFromGenericHookPrunesSubtree) {
    const auto program = make_program();

    ClassPruner pruner;
    pruner.traverse(*program);

    EXPECT_EQ(pruner.methods, 0u);
}
