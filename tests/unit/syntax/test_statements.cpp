// test_statements.cpp - AstGenerator statement productions
//
#include <gtest/gtest.h>

#include <string>

#include "surn/ast/ast.hpp"
#include "surn/basic/casting.hpp"
#include "surn/test_support/parse_helpers.hpp"

namespace surn
{

class StatementsTest : public ::testing::Test
{
protected:
  static const BuiltInType * as_builtin(const AstNode * node) { return dyn_cast<BuiltInType>(node); }

  static void expect_builtin(const AstNode * node, BuiltInKind kind)
  {
    const auto * b = as_builtin(node);
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->builtin, kind);
  }
};

// ============================================================================
// Variables
// ============================================================================

TEST_F(StatementsTest, VarWithInitializer)
{
  auto unit = test_support::parse("var x = 5;");
  ASSERT_TRUE(unit.success);
  ASSERT_EQ(unit.body.size(), 1U);
  EXPECT_TRUE(unit.body.get_program()[0].is_statement());

  const auto * var = unit.node_as<VariableStmt>(0);
  ASSERT_NE(var, nullptr);
  EXPECT_EQ(var->name, "x");
  EXPECT_FALSE(var->is_constant);
  EXPECT_EQ(var->type, nullptr);
  EXPECT_EQ(var->visibility, Visibility::Private);
  EXPECT_FALSE(var->is_uninit());

  const auto * init = dyn_cast<LiteralExpr>(var->assignment);
  ASSERT_NE(init, nullptr);
  EXPECT_EQ(init->literal_kind, LiteralKind::Number);
  EXPECT_EQ(init->value, "5");

  EXPECT_EQ(unit.slice(unit.body.get_program()[0].range()), "var x = 5;");
  EXPECT_EQ(unit.slice(var->get_range()), "var x = 5;");
}

TEST_F(StatementsTest, ConstWithUnionType)
{
  auto unit = test_support::parse("const y: int | string = \"a\";");
  ASSERT_TRUE(unit.success);
  const auto * var = unit.node_as<VariableStmt>(0);
  ASSERT_NE(var, nullptr);
  EXPECT_TRUE(var->is_constant);
  EXPECT_EQ(var->name, "y");

  const auto * u = dyn_cast<TypeUnion>(var->type);
  ASSERT_NE(u, nullptr);
  ASSERT_EQ(u->types.size(), 2U);
  expect_builtin(u->types[0], BuiltInKind::Int);
  expect_builtin(u->types[1], BuiltInKind::String);
  EXPECT_EQ(unit.slice(u->get_range()), "int | string");

  const auto * init = dyn_cast<LiteralExpr>(var->assignment);
  ASSERT_NE(init, nullptr);
  EXPECT_EQ(init->literal_kind, LiteralKind::String);
  EXPECT_EQ(init->value, "a");
}

TEST_F(StatementsTest, UninitializedDeclaration)
{
  auto unit = test_support::parse("pub var total: u64;");
  ASSERT_TRUE(unit.success);
  const auto * var = unit.node_as<VariableStmt>(0);
  ASSERT_NE(var, nullptr);
  EXPECT_TRUE(var->is_uninit());
  EXPECT_EQ(var->visibility, Visibility::Public);
  expect_builtin(var->type, BuiltInKind::U64);
}

TEST_F(StatementsTest, UserTypeWithGenerics)
{
  auto unit = test_support::parse("var m: Map<string, Point> = x;");
  ASSERT_TRUE(unit.success);
  const auto * var = unit.node_as<VariableStmt>(0);
  ASSERT_NE(var, nullptr);
  const auto * ref = dyn_cast<TypeReference>(var->type);
  ASSERT_NE(ref, nullptr);
  EXPECT_EQ(ref->name, "Map");
  ASSERT_EQ(ref->generics.size(), 2U);
  expect_builtin(ref->generics[0]->type, BuiltInKind::String);
  const auto * second = dyn_cast<TypeReference>(ref->generics[1]->type);
  ASSERT_NE(second, nullptr);
  EXPECT_EQ(second->name, "Point");
  EXPECT_FALSE(ref->generics[1]->name.has_value());
}

TEST_F(StatementsTest, ArrayTypeRecordsElement)
{
  auto unit = test_support::parse("var xs: array<int> = [1, 2];");
  ASSERT_TRUE(unit.success);
  const auto * var = unit.node_as<VariableStmt>(0);
  ASSERT_NE(var, nullptr);
  const auto * arr = as_builtin(var->type);
  ASSERT_NE(arr, nullptr);
  EXPECT_EQ(arr->builtin, BuiltInKind::Array);
  expect_builtin(arr->element, BuiltInKind::Int);
}

TEST_F(StatementsTest, ScalarBuiltInRejectsParameters)
{
  auto unit = test_support::parse("var m: int<string> = 1;");
  EXPECT_FALSE(unit.success);
  const Diagnostic * d = unit.diags.find_code(diag_codes::k_parse_error);
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->message, "Built-in type 'int' does not take these type parameters.");
}

TEST_F(StatementsTest, NodeIdsIncreasePerFile)
{
  auto unit = test_support::parse("var a = 1;\nconst b = 2;\nfunction f() { }");
  ASSERT_TRUE(unit.success);
  ASSERT_EQ(unit.body.size(), 3U);
  EXPECT_EQ(unit.node_as<VariableStmt>(0)->node_id, 1U);
  EXPECT_EQ(unit.node_as<VariableStmt>(1)->node_id, 2U);
  EXPECT_EQ(unit.node_as<FunctionStmt>(2)->node_id, 3U);
}

TEST_F(StatementsTest, MissingSemicolonAfterVariable)
{
  auto unit = test_support::parse("var x = 5");
  EXPECT_FALSE(unit.success);
  EXPECT_TRUE(unit.body.empty());
  const Diagnostic * d = unit.diags.find_code(diag_codes::k_parse_error);
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->message, "Expected a semicolon to follow a variable declaration.");
}

// ============================================================================
// Namespaces / imports / type aliases
// ============================================================================

TEST_F(StatementsTest, NamespacePathWithoutBody)
{
  auto unit = test_support::parse("namespace a\\b\\c;");
  ASSERT_TRUE(unit.success);
  const auto * ns = unit.node_as<NamespaceStmt>(0);
  ASSERT_NE(ns, nullptr);
  EXPECT_EQ(ns->body, nullptr);
  ASSERT_NE(ns->path, nullptr);
  EXPECT_EQ(ns->path->name, "a");
  ASSERT_EQ(ns->path->parts.size(), 2U);
  EXPECT_EQ(ns->path->parts[0], "b");
  EXPECT_EQ(ns->path->parts[1], "c");
  EXPECT_EQ(unit.slice(ns->path->get_range()), "a\\b\\c");
}

TEST_F(StatementsTest, NamespaceWithBlock)
{
  auto unit = test_support::parse("namespace app {\n  var x = 1;\n};");
  ASSERT_TRUE(unit.success);
  const auto * ns = unit.node_as<NamespaceStmt>(0);
  ASSERT_NE(ns, nullptr);
  ASSERT_NE(ns->body, nullptr);
  ASSERT_EQ(ns->body->body.size(), 1U);
  const auto * wrapped = dyn_cast<StatementExpr>(ns->body->body[0]);
  ASSERT_NE(wrapped, nullptr);
  EXPECT_TRUE(isa<VariableStmt>(wrapped->statement));
}

TEST_F(StatementsTest, NamespaceBlockNeedsStatementEnd)
{
  auto unit = test_support::parse("namespace app { }");
  EXPECT_FALSE(unit.success);
  const Diagnostic * d = unit.diags.find_code(diag_codes::k_parse_error);
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->message, "Expected statement end after namespace statement.");
}

TEST_F(StatementsTest, ImportPath)
{
  auto unit = test_support::parse("use std::io;");
  ASSERT_TRUE(unit.success);
  const auto * imp = unit.node_as<ImportStmt>(0);
  ASSERT_NE(imp, nullptr);
  EXPECT_EQ(imp->path->name, "std");
  ASSERT_EQ(imp->path->parts.size(), 1U);
  EXPECT_EQ(imp->path->parts[0], "io");
  EXPECT_TRUE(imp->items.empty());
  EXPECT_EQ(unit.slice(imp->path->get_range()), "std::io");
}

TEST_F(StatementsTest, ImportItemList)
{
  auto unit = test_support::parse("use std::collections::{Map, Set};");
  ASSERT_TRUE(unit.success);
  const auto * imp = unit.node_as<ImportStmt>(0);
  ASSERT_NE(imp, nullptr);
  ASSERT_EQ(imp->path->parts.size(), 1U);
  EXPECT_EQ(imp->path->parts[0], "collections");
  ASSERT_EQ(imp->items.size(), 2U);
  EXPECT_EQ(imp->items[0], "Map");
  EXPECT_EQ(imp->items[1], "Set");
}

TEST_F(StatementsTest, TypeAliasWithParameters)
{
  auto unit = test_support::parse("type Pair<K, V> = Map<K, V>;");
  ASSERT_TRUE(unit.success);
  const auto * td = unit.node_as<TypeDefStmt>(0);
  ASSERT_NE(td, nullptr);
  EXPECT_EQ(td->name, "Pair");
  ASSERT_EQ(td->params.size(), 2U);
  const auto * k = dyn_cast<TypeReference>(td->params[0]->type);
  ASSERT_NE(k, nullptr);
  EXPECT_EQ(k->name, "K");

  const auto * aliased = dyn_cast<TypeReference>(td->type);
  ASSERT_NE(aliased, nullptr);
  EXPECT_EQ(aliased->name, "Map");
  EXPECT_EQ(aliased->generics.size(), 2U);
}

TEST_F(StatementsTest, TypeAliasOfUnion)
{
  auto unit = test_support::parse("type Id = int | string;");
  ASSERT_TRUE(unit.success);
  const auto * td = unit.node_as<TypeDefStmt>(0);
  ASSERT_NE(td, nullptr);
  EXPECT_TRUE(td->params.empty());
  EXPECT_TRUE(isa<TypeUnion>(td->type));
}

// ============================================================================
// Functions
// ============================================================================

TEST_F(StatementsTest, FunctionSignature)
{
  auto unit = test_support::parse("function foo(x: int, y: int): int { }");
  ASSERT_TRUE(unit.success);
  const auto * fn = unit.node_as<FunctionStmt>(0);
  ASSERT_NE(fn, nullptr);
  ASSERT_TRUE(fn->name.has_value());
  EXPECT_EQ(*fn->name, "foo");
  EXPECT_EQ(fn->visibility, Visibility::Public);

  ASSERT_EQ(fn->inputs.size(), 2U);
  EXPECT_EQ(fn->inputs[0]->name, "x");
  EXPECT_EQ(fn->inputs[1]->name, "y");
  expect_builtin(fn->inputs[0]->type, BuiltInKind::Int);
  expect_builtin(fn->inputs[1]->type, BuiltInKind::Int);
  expect_builtin(fn->outputs, BuiltInKind::Int);

  ASSERT_NE(fn->body, nullptr);
  EXPECT_TRUE(fn->body->body.empty());
  EXPECT_EQ(unit.slice(fn->inputs[0]->get_range()), "x: int");
}

TEST_F(StatementsTest, FunctionWithoutReturnType)
{
  auto unit = test_support::parse("fn log(msg: string) { print(msg); }");
  ASSERT_TRUE(unit.success);
  const auto * fn = unit.node_as<FunctionStmt>(0);
  ASSERT_NE(fn, nullptr);
  EXPECT_EQ(fn->outputs, nullptr);
  ASSERT_EQ(fn->body->body.size(), 2U);
  EXPECT_TRUE(isa<CallExpr>(fn->body->body[0]));
  EXPECT_TRUE(isa<EndOfLineExpr>(fn->body->body[1]));
}

TEST_F(StatementsTest, FunctionVisibilityEitherSide)
{
  auto unit = test_support::parse("priv function a() { }\nfunction prot b() { }");
  ASSERT_TRUE(unit.success);
  ASSERT_EQ(unit.body.size(), 2U);
  EXPECT_EQ(unit.node_as<FunctionStmt>(0)->visibility, Visibility::Private);
  EXPECT_EQ(unit.node_as<FunctionStmt>(1)->visibility, Visibility::Protected);
}

TEST_F(StatementsTest, AnonymousFunctionAsValue)
{
  auto unit = test_support::parse("var f = function (a: int) { a; };");
  ASSERT_TRUE(unit.success);
  const auto * var = unit.node_as<VariableStmt>(0);
  ASSERT_NE(var, nullptr);
  const auto * wrapped = dyn_cast<StatementExpr>(var->assignment);
  ASSERT_NE(wrapped, nullptr);
  const auto * fn = dyn_cast<FunctionStmt>(wrapped->statement);
  ASSERT_NE(fn, nullptr);
  EXPECT_FALSE(fn->name.has_value());
  EXPECT_EQ(fn->inputs.size(), 1U);
}

TEST_F(StatementsTest, ReturnInsideBlock)
{
  auto unit = test_support::parse("function id(v: any): any { return v; }");
  ASSERT_TRUE(unit.success);
  const auto * fn = unit.node_as<FunctionStmt>(0);
  ASSERT_NE(fn, nullptr);
  ASSERT_EQ(fn->body->body.size(), 1U);
  const auto * wrapped = dyn_cast<StatementExpr>(fn->body->body[0]);
  ASSERT_NE(wrapped, nullptr);
  const auto * ret = dyn_cast<ReturnStmt>(wrapped->statement);
  ASSERT_NE(ret, nullptr);
  const auto * value = dyn_cast<LiteralExpr>(ret->value);
  ASSERT_NE(value, nullptr);
  EXPECT_EQ(value->value, "v");
}

TEST_F(StatementsTest, FunctionNeedsBlock)
{
  auto unit = test_support::parse("function f(): int;");
  EXPECT_FALSE(unit.success);
  const Diagnostic * d = unit.diags.find_code(diag_codes::k_parse_error);
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->message, "Expected a block to follow a function declaration.");
}

TEST_F(StatementsTest, UnclosedBlock)
{
  auto unit = test_support::parse("function f() { var a = 1;");
  EXPECT_FALSE(unit.success);
  const Diagnostic * d = unit.diags.find_code(diag_codes::k_parse_error);
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->message, "A block must be closed.");
  ASSERT_NE(d->primary_label(), nullptr);
  EXPECT_EQ(d->primary_label()->message, "the input ends before this is complete");
}

// ============================================================================
// Static
// ============================================================================

TEST_F(StatementsTest, StaticWrapsStatement)
{
  auto unit = test_support::parse("static var counter = 0;\npub static function make() { }");
  ASSERT_TRUE(unit.success);
  ASSERT_EQ(unit.body.size(), 2U);

  const auto * first = unit.node_as<StaticStmt>(0);
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->visibility, Visibility::Private);
  EXPECT_TRUE(isa<VariableStmt>(first->statement));

  const auto * second = unit.node_as<StaticStmt>(1);
  ASSERT_NE(second, nullptr);
  EXPECT_EQ(second->visibility, Visibility::Public);
  EXPECT_TRUE(isa<FunctionStmt>(second->statement));
}

// ============================================================================
// Classes
// ============================================================================

TEST_F(StatementsTest, ClassMembersAreSorted)
{
  auto unit = test_support::parse(R"(class Point extends Base implements Show, Eq {
  x: int;
  y: int = 0;
  function len(): int { return x; }
  pub name: string;
  static count = 0;
  pub static function make() { }
})");
  ASSERT_TRUE(unit.success);
  const auto * cls = unit.node_as<ClassStmt>(0);
  ASSERT_NE(cls, nullptr);
  EXPECT_EQ(cls->name, "Point");
  ASSERT_TRUE(cls->extends.has_value());
  EXPECT_EQ(*cls->extends, "Base");
  ASSERT_EQ(cls->implements.size(), 2U);
  EXPECT_EQ(cls->implements[0], "Show");
  EXPECT_EQ(cls->implements[1], "Eq");

  ASSERT_EQ(cls->properties.size(), 2U);
  EXPECT_EQ(cls->properties[0]->name, "x");
  EXPECT_EQ(cls->properties[0]->assignment, nullptr);
  EXPECT_EQ(cls->properties[1]->name, "y");
  EXPECT_NE(cls->properties[1]->assignment, nullptr);
  EXPECT_EQ(cls->properties[0]->visibility, Visibility::Private);

  ASSERT_EQ(cls->methods.size(), 1U);
  EXPECT_EQ(*cls->methods[0]->name, "len");

  ASSERT_EQ(cls->other.size(), 3U);
  const auto * pub_prop = dyn_cast<ClassProperty>(cls->other[0]);
  ASSERT_NE(pub_prop, nullptr);
  EXPECT_EQ(pub_prop->visibility, Visibility::Public);

  const auto * static_prop = dyn_cast<StaticStmt>(cls->other[1]);
  ASSERT_NE(static_prop, nullptr);
  EXPECT_TRUE(isa<ClassProperty>(static_prop->statement));

  const auto * static_fn = dyn_cast<StaticStmt>(cls->other[2]);
  ASSERT_NE(static_fn, nullptr);
  EXPECT_EQ(static_fn->visibility, Visibility::Public);
  EXPECT_TRUE(isa<FunctionStmt>(static_fn->statement));
}

TEST_F(StatementsTest, EmptyClass)
{
  auto unit = test_support::parse("class Empty { }");
  ASSERT_TRUE(unit.success);
  const auto * cls = unit.node_as<ClassStmt>(0);
  ASSERT_NE(cls, nullptr);
  EXPECT_FALSE(cls->extends.has_value());
  EXPECT_TRUE(cls->properties.empty());
  EXPECT_TRUE(cls->methods.empty());
  EXPECT_TRUE(cls->other.empty());
}

TEST_F(StatementsTest, ClassNeedsBody)
{
  auto unit = test_support::parse("class Foo;");
  EXPECT_FALSE(unit.success);
  const Diagnostic * d = unit.diags.find_code(diag_codes::k_parse_error);
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->message, "Expected a class body to follow a class declaration.");
}

TEST_F(StatementsTest, ClassRejectsStrayExpression)
{
  auto unit = test_support::parse("class Foo { 5 }");
  EXPECT_FALSE(unit.success);
  const Diagnostic * d = unit.diags.find_code(diag_codes::k_parse_error);
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->message, "Classes must contain a property, method, import or macro.");
}

// ============================================================================
// Top level
// ============================================================================

TEST_F(StatementsTest, EmptySourceParsesToEmptyBody)
{
  auto unit = test_support::parse("  // nothing here\n");
  EXPECT_TRUE(unit.success);
  EXPECT_TRUE(unit.body.empty());
  EXPECT_TRUE(unit.diags.empty());
}

TEST_F(StatementsTest, UnexpectedTokenInGlobalScope)
{
  auto unit = test_support::parse(")");
  EXPECT_FALSE(unit.success);
  const Diagnostic * d = unit.diags.find_code(diag_codes::k_parse_error);
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->message, "Missing a valid statement or expression in global scope.");
  ASSERT_NE(d->primary_label(), nullptr);
  EXPECT_EQ(d->primary_label()->message, "Unexpected token: \"Closing Delimiter\"");
  EXPECT_EQ(d->primary_range().start(), 0U);
  EXPECT_EQ(d->primary_range().end(), 1U);
}

TEST_F(StatementsTest, PartialBodyIsKeptOnError)
{
  auto unit = test_support::parse("var a = 1;\n[1, 2,");
  EXPECT_FALSE(unit.success);
  ASSERT_EQ(unit.body.size(), 1U);
  EXPECT_NE(unit.node_as<VariableStmt>(0), nullptr);
  EXPECT_EQ(unit.diags.errors().size(), 1U);
}

}  // namespace surn
