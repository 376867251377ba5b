// test_expressions.cpp - AstGenerator expression productions and operator policies
//
#include <gtest/gtest.h>

#include <string>

#include "surn/ast/ast.hpp"
#include "surn/basic/casting.hpp"
#include "surn/basic/diagnostic.hpp"
#include "surn/test_support/parse_helpers.hpp"

namespace surn
{

namespace
{

const OperationExpr * as_op(const AstNode * node) { return dyn_cast<OperationExpr>(node); }

std::string_view literal_value(const AstNode * node)
{
  const auto * lit = dyn_cast<LiteralExpr>(node);
  return lit != nullptr ? lit->value : std::string_view("<not a literal>");
}

}  // namespace

// ============================================================================
// Operands
// ============================================================================

TEST(ExpressionsTest, LiteralKinds)
{
  auto unit = test_support::parse("name; 42; 3.14; \"text\"; true;");
  ASSERT_TRUE(unit.success);
  ASSERT_EQ(unit.body.size(), 5U);

  const LiteralKind expected[] = {
    LiteralKind::Identifier, LiteralKind::Number, LiteralKind::Number, LiteralKind::String,
    LiteralKind::Boolean};
  const std::string_view values[] = {"name", "42", "3.14", "text", "true"};
  for (size_t i = 0; i < 5; ++i) {
    const auto * lit = unit.node_as<LiteralExpr>(i);
    ASSERT_NE(lit, nullptr) << "node " << i;
    EXPECT_EQ(lit->literal_kind, expected[i]);
    EXPECT_EQ(lit->value, values[i]);
    EXPECT_TRUE(unit.body.get_program()[i].is_expression());
  }
}

TEST(ExpressionsTest, TopLevelStatementEndBelongsToExpression)
{
  auto unit = test_support::parse("a + b;");
  ASSERT_TRUE(unit.success);
  ASSERT_EQ(unit.body.size(), 1U);
  const auto & top = unit.body.get_program()[0];
  EXPECT_EQ(unit.slice(top.range()), "a + b;");
  EXPECT_EQ(unit.slice(top.inner()->get_range()), "a + b");
}

TEST(ExpressionsTest, CallWithArguments)
{
  auto unit = test_support::parse("print(1, g(2), \"x\");");
  ASSERT_TRUE(unit.success);
  const auto * call = unit.node_as<CallExpr>(0);
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(call->name, "print");
  ASSERT_EQ(call->args.size(), 3U);
  EXPECT_EQ(literal_value(call->args[0]), "1");

  const auto * inner = dyn_cast<CallExpr>(call->args[1]);
  ASSERT_NE(inner, nullptr);
  EXPECT_EQ(inner->name, "g");
  ASSERT_EQ(inner->args.size(), 1U);
  EXPECT_EQ(literal_value(inner->args[0]), "2");

  EXPECT_EQ(literal_value(call->args[2]), "x");
  EXPECT_EQ(unit.slice(call->get_range()), "print(1, g(2), \"x\")");
}

TEST(ExpressionsTest, CallWithoutArguments)
{
  auto unit = test_support::parse("now();");
  ASSERT_TRUE(unit.success);
  const auto * call = unit.node_as<CallExpr>(0);
  ASSERT_NE(call, nullptr);
  EXPECT_TRUE(call->args.empty());
}

TEST(ExpressionsTest, NewExpression)
{
  auto unit = test_support::parse("var p = new Point(1, 2);");
  ASSERT_TRUE(unit.success);
  const auto * var = unit.node_as<VariableStmt>(0);
  ASSERT_NE(var, nullptr);
  const auto * created = dyn_cast<NewExpr>(var->assignment);
  ASSERT_NE(created, nullptr);
  EXPECT_EQ(created->name, "Point");
  EXPECT_EQ(created->args.size(), 2U);
  EXPECT_EQ(unit.slice(created->get_range()), "new Point(1, 2)");
}

TEST(ExpressionsTest, NewNeedsArguments)
{
  auto unit = test_support::parse("new Point;");
  EXPECT_FALSE(unit.success);
  const Diagnostic * d = unit.diags.find_code(diag_codes::k_parse_error);
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->message, "Expected a function call inputs to follow a new expression.");
}

TEST(ExpressionsTest, MemberLookupKinds)
{
  auto unit = test_support::parse("point.x;\nmath::max(1, 2);");
  ASSERT_TRUE(unit.success);
  ASSERT_EQ(unit.body.size(), 2U);

  const auto * dynamic = unit.node_as<MemberExpr>(0);
  ASSERT_NE(dynamic, nullptr);
  EXPECT_EQ(dynamic->origin, "point");
  EXPECT_EQ(dynamic->lookup, MemberLookup::Dynamic);
  EXPECT_EQ(literal_value(dynamic->member), "x");
  EXPECT_EQ(unit.slice(dynamic->origin_range), "point");

  const auto * fixed = unit.node_as<MemberExpr>(1);
  ASSERT_NE(fixed, nullptr);
  EXPECT_EQ(fixed->origin, "math");
  EXPECT_EQ(fixed->lookup, MemberLookup::Static);
  const auto * call = dyn_cast<CallExpr>(fixed->member);
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(call->name, "max");
}

TEST(ExpressionsTest, MemberChainNestsToTheRight)
{
  auto unit = test_support::parse("a.b.c;");
  ASSERT_TRUE(unit.success);
  const auto * outer = unit.node_as<MemberExpr>(0);
  ASSERT_NE(outer, nullptr);
  EXPECT_EQ(outer->origin, "a");
  const auto * inner = dyn_cast<MemberExpr>(outer->member);
  ASSERT_NE(inner, nullptr);
  EXPECT_EQ(inner->origin, "b");
  EXPECT_EQ(literal_value(inner->member), "c");
}

TEST(ExpressionsTest, ArraysNest)
{
  auto unit = test_support::parse("[1, [2, 3], []];");
  ASSERT_TRUE(unit.success);
  const auto * arr = unit.node_as<ArrayExpr>(0);
  ASSERT_NE(arr, nullptr);
  ASSERT_EQ(arr->elements.size(), 3U);
  EXPECT_EQ(literal_value(arr->elements[0]), "1");

  const auto * nested = dyn_cast<ArrayExpr>(arr->elements[1]);
  ASSERT_NE(nested, nullptr);
  EXPECT_EQ(nested->elements.size(), 2U);

  const auto * empty = dyn_cast<ArrayExpr>(arr->elements[2]);
  ASSERT_NE(empty, nullptr);
  EXPECT_TRUE(empty->elements.empty());
  EXPECT_EQ(arr->element_type, nullptr);
}

TEST(ExpressionsTest, UnclosedArrayReportsWholeSpan)
{
  auto unit = test_support::parse("[1, 2,");
  EXPECT_FALSE(unit.success);
  EXPECT_TRUE(unit.body.empty());
  const Diagnostic * d = unit.diags.find_code(diag_codes::k_parse_error);
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->message, "An array must be closed.");
  EXPECT_EQ(d->primary_range().start(), 0U);
  EXPECT_EQ(d->primary_range().end(), 6U);
}

TEST(ExpressionsTest, MissingCommaInArray)
{
  auto unit = test_support::parse("[1 2]");
  EXPECT_FALSE(unit.success);
  const Diagnostic * d = unit.diags.find_code(diag_codes::k_parse_error);
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->message, "A comma is required to separate array elements.");
}

TEST(ExpressionsTest, ObjectLiteral)
{
  auto unit = test_support::parse("var o = { name: \"x\", size: 2 + 3 };");
  ASSERT_TRUE(unit.success);
  const auto * var = unit.node_as<VariableStmt>(0);
  ASSERT_NE(var, nullptr);
  const auto * obj = dyn_cast<ObjectExpr>(var->assignment);
  ASSERT_NE(obj, nullptr);
  ASSERT_EQ(obj->properties.size(), 2U);
  EXPECT_EQ(obj->properties[0]->name, "name");
  EXPECT_EQ(literal_value(obj->properties[0]->value), "x");
  EXPECT_EQ(obj->properties[1]->name, "size");
  EXPECT_NE(as_op(obj->properties[1]->value), nullptr);
  EXPECT_EQ(unit.slice(obj->properties[1]->get_range()), "size: 2 + 3");
}

TEST(ExpressionsTest, ObjectPropertyNeedsColon)
{
  auto unit = test_support::parse("var o = { name \"x\" };");
  EXPECT_FALSE(unit.success);
  const Diagnostic * d = unit.diags.find_code(diag_codes::k_parse_error);
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->message, "Expected a colon to follow a property name.");
}

TEST(ExpressionsTest, MissingRightOperand)
{
  auto unit = test_support::parse("1 +");
  EXPECT_FALSE(unit.success);
  const Diagnostic * d = unit.diags.find_code(diag_codes::k_parse_error);
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->message, "Expected an expression to follow an operation.");
}

TEST(ExpressionsTest, UnclosedCallArguments)
{
  auto unit = test_support::parse("f(1, 2");
  EXPECT_FALSE(unit.success);
  const Diagnostic * parse_error = unit.diags.find_code(diag_codes::k_parse_error);
  ASSERT_NE(parse_error, nullptr);
  EXPECT_EQ(parse_error->message, "Function arguments must be closed.");
  EXPECT_NE(unit.diags.find_code(diag_codes::k_unclosed_paren), nullptr);
}

// ============================================================================
// Right-recursive operators (default)
// ============================================================================

TEST(ExpressionsTest, OperatorNodeRangeExcludesTrailingTrivia)
{
  auto unit = test_support::parse("x = 1   ;");
  ASSERT_TRUE(unit.success);
  const auto * op = unit.node_as<OperationExpr>(0);
  ASSERT_NE(op, nullptr);
  EXPECT_EQ(op->op, BinaryOp::Assign);
  EXPECT_EQ(op->category(), OperatorCategory::Assignment);
  EXPECT_EQ(unit.slice(op->get_range()), "x = 1");
}

TEST(ExpressionsTest, StatementEndAfterNewline)
{
  auto unit = test_support::parse("a\n;");
  ASSERT_TRUE(unit.success);
  ASSERT_EQ(unit.body.size(), 1U);
  EXPECT_EQ(unit.diags.find_code(diag_codes::k_parse_error), nullptr);
  EXPECT_EQ(literal_value(unit.node(0)), "a");
  EXPECT_EQ(unit.slice(unit.body.get_program()[0].range()), "a\n;");
}

TEST(ExpressionsTest, StatementEndAfterSpacedCall)
{
  auto unit = test_support::parse("foo() ;\nbar();");
  ASSERT_TRUE(unit.success);
  ASSERT_EQ(unit.body.size(), 2U);
  EXPECT_EQ(unit.diags.find_code(diag_codes::k_parse_error), nullptr);
  const auto * call = unit.node_as<CallExpr>(0);
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(unit.slice(call->get_range()), "foo()");
  EXPECT_NE(unit.node_as<CallExpr>(1), nullptr);
}

TEST(ExpressionsTest, DefaultPolicyGroupsToTheRight)
{
  auto unit = test_support::parse("1 - 2 - 3;");
  ASSERT_TRUE(unit.success);
  const auto * root = unit.node_as<OperationExpr>(0);
  ASSERT_NE(root, nullptr);
  EXPECT_EQ(root->op, BinaryOp::Minus);
  EXPECT_EQ(literal_value(root->lhs), "1");

  const auto * right = as_op(root->rhs);
  ASSERT_NE(right, nullptr);
  EXPECT_EQ(literal_value(right->lhs), "2");
  EXPECT_EQ(literal_value(right->rhs), "3");
}

TEST(ExpressionsTest, DefaultPolicyIgnoresPrecedence)
{
  auto unit = test_support::parse("2 * 3 + 4;");
  ASSERT_TRUE(unit.success);
  const auto * root = unit.node_as<OperationExpr>(0);
  ASSERT_NE(root, nullptr);
  EXPECT_EQ(root->op, BinaryOp::Mul);
  const auto * right = as_op(root->rhs);
  ASSERT_NE(right, nullptr);
  EXPECT_EQ(right->op, BinaryOp::Plus);
}

TEST(ExpressionsTest, DefaultPolicyMemberTakesWholeExpression)
{
  auto unit = test_support::parse("a.b + c;");
  ASSERT_TRUE(unit.success);
  const auto * member = unit.node_as<MemberExpr>(0);
  ASSERT_NE(member, nullptr);
  EXPECT_EQ(member->origin, "a");
  const auto * op = as_op(member->member);
  ASSERT_NE(op, nullptr);
  EXPECT_EQ(op->op, BinaryOp::Plus);
  EXPECT_EQ(literal_value(op->lhs), "b");
  EXPECT_EQ(literal_value(op->rhs), "c");
}

TEST(ExpressionsTest, WordOperatorsAndCategories)
{
  auto unit = test_support::parse("a and b;\nx < y;\nm ^ n;");
  ASSERT_TRUE(unit.success);
  ASSERT_EQ(unit.body.size(), 3U);
  EXPECT_EQ(unit.node_as<OperationExpr>(0)->category(), OperatorCategory::Logical);
  EXPECT_EQ(unit.node_as<OperationExpr>(1)->category(), OperatorCategory::Comparison);
  EXPECT_EQ(unit.node_as<OperationExpr>(2)->category(), OperatorCategory::Bitwise);
}

// ============================================================================
// Precedence climbing
// ============================================================================

TEST(ExpressionsTest, PrecedenceLeftAssociative)
{
  auto unit = test_support::parse_with_precedence("1 - 2 - 3;");
  ASSERT_TRUE(unit.success);
  const auto * root = unit.node_as<OperationExpr>(0);
  ASSERT_NE(root, nullptr);
  EXPECT_EQ(literal_value(root->rhs), "3");
  const auto * left = as_op(root->lhs);
  ASSERT_NE(left, nullptr);
  EXPECT_EQ(literal_value(left->lhs), "1");
  EXPECT_EQ(literal_value(left->rhs), "2");
  EXPECT_EQ(unit.slice(left->get_range()), "1 - 2");
  EXPECT_EQ(unit.slice(root->get_range()), "1 - 2 - 3");
}

TEST(ExpressionsTest, PrecedenceAssignmentIsRightAssociative)
{
  auto unit = test_support::parse_with_precedence("a = b = c;");
  ASSERT_TRUE(unit.success);
  const auto * root = unit.node_as<OperationExpr>(0);
  ASSERT_NE(root, nullptr);
  EXPECT_EQ(literal_value(root->lhs), "a");
  const auto * right = as_op(root->rhs);
  ASSERT_NE(right, nullptr);
  EXPECT_EQ(right->op, BinaryOp::Assign);
  EXPECT_EQ(literal_value(right->lhs), "b");
  EXPECT_EQ(literal_value(right->rhs), "c");
}

TEST(ExpressionsTest, PrecedenceBindsTighterOperatorsFirst)
{
  auto unit = test_support::parse_with_precedence("x = 1 + 2 * 3;");
  ASSERT_TRUE(unit.success);
  const auto * assign = unit.node_as<OperationExpr>(0);
  ASSERT_NE(assign, nullptr);
  EXPECT_EQ(assign->op, BinaryOp::Assign);

  const auto * sum = as_op(assign->rhs);
  ASSERT_NE(sum, nullptr);
  EXPECT_EQ(sum->op, BinaryOp::Plus);
  EXPECT_EQ(literal_value(sum->lhs), "1");

  const auto * product = as_op(sum->rhs);
  ASSERT_NE(product, nullptr);
  EXPECT_EQ(product->op, BinaryOp::Mul);
  EXPECT_EQ(unit.slice(product->get_range()), "2 * 3");
}

TEST(ExpressionsTest, PrecedenceLogicalOperators)
{
  auto unit = test_support::parse_with_precedence("a or b and c;");
  ASSERT_TRUE(unit.success);
  const auto * root = unit.node_as<OperationExpr>(0);
  ASSERT_NE(root, nullptr);
  EXPECT_EQ(root->op, BinaryOp::Or);
  const auto * right = as_op(root->rhs);
  ASSERT_NE(right, nullptr);
  EXPECT_EQ(right->op, BinaryOp::And);
}

TEST(ExpressionsTest, PrecedenceMemberIsAnOperand)
{
  auto unit = test_support::parse_with_precedence("a.b + c;");
  ASSERT_TRUE(unit.success);
  const auto * root = unit.node_as<OperationExpr>(0);
  ASSERT_NE(root, nullptr);
  EXPECT_EQ(root->op, BinaryOp::Plus);
  const auto * member = dyn_cast<MemberExpr>(root->lhs);
  ASSERT_NE(member, nullptr);
  EXPECT_EQ(literal_value(member->member), "b");
  EXPECT_EQ(literal_value(root->rhs), "c");
}

TEST(ExpressionsTest, PrecedenceInsideDeclaration)
{
  auto unit = test_support::parse_with_precedence("var total = a * b + c;");
  ASSERT_TRUE(unit.success);
  const auto * var = unit.node_as<VariableStmt>(0);
  ASSERT_NE(var, nullptr);
  const auto * sum = as_op(var->assignment);
  ASSERT_NE(sum, nullptr);
  EXPECT_EQ(sum->op, BinaryOp::Plus);
  const auto * product = as_op(sum->lhs);
  ASSERT_NE(product, nullptr);
  EXPECT_EQ(product->op, BinaryOp::Mul);
}

}  // namespace surn
