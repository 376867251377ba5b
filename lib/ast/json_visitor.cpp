// surn/ast/json_visitor.cpp - JSON serialization implementation
//
#include "surn/ast/json_visitor.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <utility>

#include "surn/ast/ast.hpp"
#include "surn/ast/ast_enums.hpp"
#include "surn/ast/visitor.hpp"
#include "surn/basic/source_manager.hpp"

namespace surn
{
namespace
{

using nlohmann::json;

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.start()}, {"end", r.end()}};
}

json j_names(gsl::span<std::string_view> names)
{
  json arr = json::array();
  for (const auto n : names) {
    arr.push_back(std::string(n));
  }
  return arr;
}

// ============================================================================
// JsonBuilder
// ============================================================================

class JsonBuilder : public ConstAstVisitor<JsonBuilder, json>
{
public:
  template <typename T>
  json list(gsl::span<T *> nodes)
  {
    json arr = json::array();
    for (const auto * n : nodes) {
      arr.push_back(visit(n));
    }
    return arr;
  }

  // --- Expressions ---

  json visit_call_expr(const CallExpr * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    j["args"] = list(n->args);
    return j;
  }

  json visit_method_call_expr(const MethodCallExpr * n)
  {
    json j = base(n);
    j["object"] = visit(n->object);
    j["name"] = std::string(n->name);
    j["args"] = list(n->args);
    return j;
  }

  json visit_new_expr(const NewExpr * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    j["args"] = list(n->args);
    return j;
  }

  json visit_array_expr(const ArrayExpr * n)
  {
    json j = base(n);
    j["elements"] = list(n->elements);
    j["elementType"] = visit(n->element_type);
    return j;
  }

  json visit_object_expr(const ObjectExpr * n)
  {
    json j = base(n);
    j["properties"] = list(n->properties);
    j["valueType"] = visit(n->type);
    return j;
  }

  json visit_operation_expr(const OperationExpr * n)
  {
    json j = base(n);
    j["op"] = std::string(to_string(n->op));
    j["category"] = std::string(to_string(n->category()));
    j["left"] = visit(n->lhs);
    j["right"] = visit(n->rhs);
    return j;
  }

  json visit_member_expr(const MemberExpr * n)
  {
    json j = base(n);
    j["origin"] = std::string(n->origin);
    j["originRange"] = j_range(n->origin_range);
    j["lookup"] = std::string(to_string(n->lookup));
    j["member"] = visit(n->member);
    return j;
  }

  json visit_literal_expr(const LiteralExpr * n)
  {
    json j = base(n);
    j["kind"] = std::string(to_string(n->literal_kind));
    j["value"] = std::string(n->value);
    j["valueType"] = visit(n->type);
    return j;
  }

  json visit_statement_expr(const StatementExpr * n)
  {
    json j = base(n);
    j["statement"] = visit(n->statement);
    return j;
  }

  json visit_end_of_line_expr(const EndOfLineExpr * n) { return base(n); }

  // --- Types ---

  json visit_built_in_type(const BuiltInType * n)
  {
    json j = base(n);
    j["name"] = std::string(to_string(n->builtin));
    j["strict"] = is_strict(n->builtin);
    if (n->element) {
      j["element"] = visit(n->element);
    }
    return j;
  }

  json visit_type_reference(const TypeReference * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    j["generics"] = list(n->generics);
    return j;
  }

  json visit_type_union(const TypeUnion * n)
  {
    json j = base(n);
    j["types"] = list(n->types);
    return j;
  }

  json visit_runtime_type(const RuntimeType * n)
  {
    json j = base(n);
    j["params"] = list(n->params);
    j["body"] = visit(n->body);
    return j;
  }

  // --- Statements ---

  json visit_variable_stmt(const VariableStmt * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    j["constant"] = n->is_constant;
    j["visibility"] = std::string(to_string(n->visibility));
    j["nodeId"] = n->node_id;
    j["varType"] = visit(n->type);
    j["assignment"] = visit(n->assignment);
    return j;
  }

  json visit_static_stmt(const StaticStmt * n)
  {
    json j = base(n);
    j["visibility"] = std::string(to_string(n->visibility));
    j["statement"] = visit(n->statement);
    return j;
  }

  json visit_function_stmt(const FunctionStmt * n)
  {
    json j = base(n);
    j["name"] = n->name ? json(std::string(*n->name)) : json(nullptr);
    j["visibility"] = std::string(to_string(n->visibility));
    j["nodeId"] = n->node_id;
    j["inputs"] = list(n->inputs);
    j["outputs"] = visit(n->outputs);
    j["body"] = visit(n->body);
    return j;
  }

  json visit_class_stmt(const ClassStmt * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    j["extends"] = n->extends ? json(std::string(*n->extends)) : json(nullptr);
    j["implements"] = j_names(n->implements);
    j["nodeId"] = n->node_id;
    j["properties"] = list(n->properties);
    j["methods"] = list(n->methods);
    j["other"] = list(n->other);
    return j;
  }

  json visit_block_stmt(const BlockStmt * n)
  {
    json j = base(n);
    j["body"] = list(n->body);
    return j;
  }

  json visit_import_stmt(const ImportStmt * n)
  {
    json j = base(n);
    j["path"] = visit(n->path);
    j["items"] = j_names(n->items);
    return j;
  }

  json visit_namespace_stmt(const NamespaceStmt * n)
  {
    json j = base(n);
    j["path"] = visit(n->path);
    j["body"] = visit(n->body);
    return j;
  }

  json visit_type_def_stmt(const TypeDefStmt * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    j["params"] = list(n->params);
    j["aliased"] = visit(n->type);
    return j;
  }

  json visit_return_stmt(const ReturnStmt * n)
  {
    json j = base(n);
    j["value"] = visit(n->value);
    return j;
  }

  json visit_macro_invocation_stmt(const MacroInvocationStmt * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    j["args"] = list(n->args);
    return j;
  }

  // --- Supporting nodes ---

  json visit_type_param(const TypeParam * n)
  {
    json j = base(n);
    j["name"] = n->name ? json(std::string(*n->name)) : json(nullptr);
    j["paramType"] = visit(n->type);
    return j;
  }

  json visit_function_input(const FunctionInput * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    j["inputType"] = visit(n->type);
    return j;
  }

  json visit_object_property(const ObjectProperty * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    j["value"] = visit(n->value);
    return j;
  }

  json visit_class_property(const ClassProperty * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    j["visibility"] = std::string(to_string(n->visibility));
    j["propertyType"] = visit(n->type);
    j["assignment"] = visit(n->assignment);
    return j;
  }

  json visit_path(const Path * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    j["parts"] = j_names(n->parts);
    return j;
  }

private:
  static json base(const AstNode * n)
  {
    return json{{"type", std::string(to_string(n->get_kind()))}, {"range", j_range(n->get_range())}};
  }
};

}  // namespace

json to_json(const AstNode * node)
{
  JsonBuilder builder;
  return builder.visit(node);
}

json to_json(const AstBody & body)
{
  JsonBuilder builder;
  json program = json::array();
  for (const auto & node : body.get_program()) {
    json entry = builder.visit(node.inner());
    entry["nodeRange"] = j_range(node.range());
    program.push_back(std::move(entry));
  }
  return json{{"type", "AstBody"}, {"program", std::move(program)}};
}

}  // namespace surn
