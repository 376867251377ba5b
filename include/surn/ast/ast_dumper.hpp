// surn/ast/ast_dumper.hpp - Debug AST tree output
//
// Prints an AstBody or a single node as an indented tree, for `surnc parse
// --dump-ast` and for readable test failures.
//
#pragma once

#include <initializer_list>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "surn/ast/ast.hpp"
#include "surn/ast/ast_enums.hpp"
#include "surn/ast/visitor.hpp"

namespace surn
{

// ============================================================================
// AstDumper - Debug AST output
// ============================================================================

/**
 * Dumps AST nodes in a human-readable tree format.
 *
 * @code
 *   AstBody
 *   |-VariableStmt name='x' Private var
 *   | `-LiteralExpr Number '5'
 *   `-OperationExpr op='+'
 *     |-LiteralExpr Number '1'
 *     `-LiteralExpr Number '2'
 * @endcode
 */
class AstDumper : public ConstAstVisitor<AstDumper, void>
{
public:
  explicit AstDumper(std::ostream & os) : os_(os) {}

  void dump(const AstNode * node)
  {
    visit(node);
    os_.flush();
  }

  void dump(const AstBody & body)
  {
    os_ << "AstBody\n";
    const auto & program = body.get_program();
    for (size_t i = 0; i < program.size(); ++i) {
      is_last_ = (i == program.size() - 1);
      visit(program[i].inner());
    }
    os_.flush();
  }

  // ===========================================================================
  // Generic tree printer
  // ===========================================================================

  /// Property for display: key='value', or a bare value when key is empty
  struct Prop
  {
    std::string_view key;
    std::string value;

    Prop(std::string_view k, std::string_view v) : key(k), value(v) {}
    Prop(std::string_view k, std::string v) : key(k), value(std::move(v)) {}
    Prop(std::string_view k, const char * v) : key(k), value(v) {}

    Prop(std::string_view v) : value(v) {}
    Prop(std::string v) : value(std::move(v)) {}
    Prop(const char * v) : value(v) {}
  };

  template <typename... Containers>
  void print_tree(
    std::string_view label, const std::vector<Prop> & props, const Containers &... children)
  {
    print_prefix();
    os_ << label;
    for (const auto & prop : props) {
      if (prop.key.empty()) {
        os_ << " " << prop.value;
      } else {
        os_ << " " << prop.key << "='" << prop.value << "'";
      }
    }
    os_ << "\n";

    std::vector<const AstNode *> all_children;
    (collect_children(all_children, children), ...);

    if (!all_children.empty()) {
      const IndentScope scope(*this);
      for (size_t i = 0; i < all_children.size(); ++i) {
        is_last_ = (i == all_children.size() - 1);
        visit(all_children[i]);
      }
    }
  }

  template <typename... Containers>
  void print_tree(
    std::string_view label, std::initializer_list<Prop> props, const Containers &... children)
  {
    print_tree(label, std::vector<Prop>(props), children...);
  }

  // ===========================================================================
  // Visit methods
  // ===========================================================================

  // --- Expressions ---
  void visit_call_expr(const CallExpr * node) { print_tree("CallExpr", {{"name", node->name}}, node->args); }
  void visit_method_call_expr(const MethodCallExpr * node)
  {
    print_tree("MethodCallExpr", {{"name", node->name}}, node->object, node->args);
  }
  void visit_new_expr(const NewExpr * node) { print_tree("NewExpr", {{"name", node->name}}, node->args); }
  void visit_array_expr(const ArrayExpr * node)
  {
    print_tree("ArrayExpr", {}, node->elements, node->element_type);
  }
  void visit_object_expr(const ObjectExpr * node)
  {
    print_tree("ObjectExpr", {}, node->properties, node->type);
  }
  void visit_operation_expr(const OperationExpr * node)
  {
    print_tree(
      "OperationExpr", {{"op", to_string(node->op)}, {to_string(node->category())}}, node->lhs,
      node->rhs);
  }
  void visit_member_expr(const MemberExpr * node)
  {
    print_tree(
      "MemberExpr", {{"origin", node->origin}, {to_string(node->lookup)}}, node->member);
  }
  void visit_literal_expr(const LiteralExpr * node)
  {
    print_tree(
      "LiteralExpr", {{to_string(node->literal_kind)}, {"'" + std::string(node->value) + "'"}},
      node->type);
  }
  void visit_statement_expr(const StatementExpr * node)
  {
    // Transparent wrapper: print the statement in its place.
    visit(node->statement);
  }
  void visit_end_of_line_expr(const EndOfLineExpr * /*node*/) { print_tree("EndOfLineExpr", {}); }

  // --- Types ---
  void visit_built_in_type(const BuiltInType * node)
  {
    print_tree("BuiltInType", {{to_string(node->builtin)}}, node->element);
  }
  void visit_type_reference(const TypeReference * node)
  {
    print_tree("TypeReference", {{"name", node->name}}, node->generics);
  }
  void visit_type_union(const TypeUnion * node) { print_tree("TypeUnion", {}, node->types); }
  void visit_runtime_type(const RuntimeType * node)
  {
    print_tree("RuntimeType", {}, node->params, node->body);
  }

  // --- Statements ---
  void visit_variable_stmt(const VariableStmt * node)
  {
    print_tree(
      "VariableStmt",
      {{"name", node->name}, {to_string(node->visibility)}, {node->is_constant ? "const" : "var"}},
      node->type, node->assignment);
  }
  void visit_static_stmt(const StaticStmt * node)
  {
    print_tree("StaticStmt", {{to_string(node->visibility)}}, node->statement);
  }
  void visit_function_stmt(const FunctionStmt * node)
  {
    std::vector<Prop> props;
    props.emplace_back("name", node->name.value_or("<anonymous>"));
    props.emplace_back(to_string(node->visibility));
    print_tree("FunctionStmt", props, node->inputs, node->outputs, node->body);
  }
  void visit_class_stmt(const ClassStmt * node)
  {
    std::vector<Prop> props = {{"name", node->name}};
    if (node->extends) props.emplace_back("extends", *node->extends);
    if (!node->implements.empty()) props.emplace_back("implements", join(node->implements, ", "));
    print_tree("ClassStmt", props, node->properties, node->methods, node->other);
  }
  void visit_block_stmt(const BlockStmt * node) { print_tree("BlockStmt", {}, node->body); }
  void visit_import_stmt(const ImportStmt * node)
  {
    std::vector<Prop> props;
    if (!node->items.empty()) props.emplace_back("items", join(node->items, ", "));
    print_tree("ImportStmt", props, node->path);
  }
  void visit_namespace_stmt(const NamespaceStmt * node)
  {
    print_tree("NamespaceStmt", {}, node->path, node->body);
  }
  void visit_type_def_stmt(const TypeDefStmt * node)
  {
    print_tree("TypeDefStmt", {{"name", node->name}}, node->params, node->type);
  }
  void visit_return_stmt(const ReturnStmt * node) { print_tree("ReturnStmt", {}, node->value); }
  void visit_macro_invocation_stmt(const MacroInvocationStmt * node)
  {
    print_tree("MacroInvocationStmt", {{"name", node->name}}, node->args);
  }

  // --- Supporting nodes ---
  void visit_type_param(const TypeParam * node)
  {
    std::vector<Prop> props;
    if (node->name) props.emplace_back("name", *node->name);
    print_tree("TypeParam", props, node->type);
  }
  void visit_function_input(const FunctionInput * node)
  {
    print_tree("FunctionInput", {{"name", node->name}}, node->type);
  }
  void visit_object_property(const ObjectProperty * node)
  {
    print_tree("ObjectProperty", {{"name", node->name}}, node->value);
  }
  void visit_class_property(const ClassProperty * node)
  {
    print_tree(
      "ClassProperty", {{"name", node->name}, {to_string(node->visibility)}}, node->type,
      node->assignment);
  }
  void visit_path(const Path * node)
  {
    std::string full(node->name);
    for (const auto part : node->parts) {
      full += "\\";
      full += part;
    }
    print_tree("Path", {{full}});
  }

private:
  std::ostream & os_;
  std::string prefix_;
  bool is_last_ = true;

  static std::string join(gsl::span<std::string_view> parts, std::string_view sep)
  {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
      if (i > 0) out += sep;
      out += parts[i];
    }
    return out;
  }

  // --- Helper: extract children based on type ---

  template <typename T>
  void collect_children(std::vector<const AstNode *> & out, T * ptr)
  {
    if (ptr) out.push_back(ptr);
  }

  template <typename T>
  void collect_children(std::vector<const AstNode *> & out, gsl::span<T *> span)
  {
    for (auto * ptr : span) {
      if (ptr) out.push_back(ptr);
    }
  }

  // --- Rendering ---

  void print_prefix()
  {
    os_ << prefix_;
    os_ << (is_last_ ? "`-" : "|-");
  }

  struct IndentScope
  {
    AstDumper & d;
    std::string saved;

    explicit IndentScope(AstDumper & dumper) : d(dumper), saved(d.prefix_)
    {
      d.prefix_ += d.is_last_ ? "  " : "| ";
    }

    ~IndentScope() { d.prefix_ = saved; }
  };
};

// ============================================================================
// Convenience Functions
// ============================================================================

inline void dump(const AstBody & body, std::ostream & os)
{
  AstDumper dumper(os);
  dumper.dump(body);
}

inline std::string dump_to_string(const AstBody & body)
{
  std::ostringstream ss;
  dump(body, ss);
  return ss.str();
}

inline std::string dump_to_string(const AstNode * node)
{
  std::ostringstream ss;
  AstDumper dumper(ss);
  dumper.dump(node);
  return ss.str();
}

}  // namespace surn
