// surn/ast/ast.hpp - AST node class definitions for surn
//
// LLVM/Clang style hierarchy with classof() for RTTI. All nodes are
// allocated in an AstContext and are immutable once attached to a parent.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string_view>
#include <vector>

#include "surn/ast/ast_enums.hpp"
#include "surn/basic/casting.hpp"
#include "surn/basic/source_manager.hpp"

namespace surn
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every node carries a NodeKind for classof() dispatch and the byte range it
 * was parsed from. Nodes are non-copyable and owned by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

/**
 * CRTP base class that implements classof() for a concrete node.
 *
 * @tparam Derived The concrete node class
 * @tparam Base The category base to inherit from
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

/// Base class for expressions.
class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Base class for type expressions.
class TypeNode : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_type_kind(node->kind); }

protected:
  explicit TypeNode(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Base class for statements.
class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class BlockStmt;
class FunctionStmt;

// ============================================================================
// Type Nodes
// ============================================================================

/// One entry of a generic parameter list: `T` or `name: T`.
class TypeParam : public NodeBase<TypeParam, AstNode, NodeKind::TypeParam>
{
public:
  std::optional<std::string_view> name;
  TypeNode * type;

  TypeParam(std::optional<std::string_view> n, TypeNode * t, SourceRange r = {})
  : NodeBase(r), name(n), type(t)
  {
  }
};

/// `int`, `string`, `u64`, `array<T>` ...
class BuiltInType : public NodeBase<BuiltInType, TypeNode, NodeKind::BuiltIn>
{
public:
  BuiltInKind builtin;
  TypeNode * element = nullptr;  ///< Element type of `array<T>`; nullptr means any

  explicit BuiltInType(BuiltInKind b, SourceRange r = {}) : NodeBase(r), builtin(b) {}
  BuiltInType(BuiltInKind b, TypeNode * elem, SourceRange r) : NodeBase(r), builtin(b), element(elem)
  {
  }
};

/// A named, possibly generic, user type: `Map<string, int>`.
class TypeReference : public NodeBase<TypeReference, TypeNode, NodeKind::Reference>
{
public:
  std::string_view name;
  gsl::span<TypeParam *> generics;

  TypeReference(std::string_view n, gsl::span<TypeParam *> g, SourceRange r = {})
  : NodeBase(r), name(n), generics(g)
  {
  }
};

/// `a | b | c`
class TypeUnion : public NodeBase<TypeUnion, TypeNode, NodeKind::Union>
{
public:
  gsl::span<TypeNode *> types;

  explicit TypeUnion(gsl::span<TypeNode *> t, SourceRange r = {}) : NodeBase(r), types(t) {}
};

/**
 * A type computed at run time from its parameters. Reserved for the
 * semantic passes; the parser never produces one.
 */
class RuntimeType : public NodeBase<RuntimeType, TypeNode, NodeKind::Runtime>
{
public:
  gsl::span<TypeParam *> params;
  BlockStmt * body;

  RuntimeType(gsl::span<TypeParam *> p, BlockStmt * b, SourceRange r = {})
  : NodeBase(r), params(p), body(b)
  {
  }
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// `name(args...)`
class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::Call>
{
public:
  std::string_view name;
  gsl::span<Expr *> args;

  CallExpr(std::string_view n, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), name(n), args(a)
  {
  }
};

/// `object.name(args...)`, produced by later passes from Member + Call.
class MethodCallExpr : public NodeBase<MethodCallExpr, Expr, NodeKind::MethodCall>
{
public:
  Expr * object;
  std::string_view name;
  gsl::span<Expr *> args;

  MethodCallExpr(Expr * obj, std::string_view n, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), object(obj), name(n), args(a)
  {
  }
};

/// `new Name(args...)`
class NewExpr : public NodeBase<NewExpr, Expr, NodeKind::New>
{
public:
  std::string_view name;
  gsl::span<Expr *> args;

  NewExpr(std::string_view n, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), name(n), args(a)
  {
  }
};

/// `[a, b, c]`
class ArrayExpr : public NodeBase<ArrayExpr, Expr, NodeKind::Array>
{
public:
  gsl::span<Expr *> elements;
  TypeNode * element_type = nullptr;  ///< Filled in by type inference

  explicit ArrayExpr(gsl::span<Expr *> e, SourceRange r = {}) : NodeBase(r), elements(e) {}
};

/// `name: value` inside an object literal.
class ObjectProperty : public NodeBase<ObjectProperty, AstNode, NodeKind::ObjectProperty>
{
public:
  std::string_view name;
  Expr * value;

  ObjectProperty(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v)
  {
  }
};

/// `{ a: 1, b: 2 }`
class ObjectExpr : public NodeBase<ObjectExpr, Expr, NodeKind::Object>
{
public:
  gsl::span<ObjectProperty *> properties;
  TypeNode * type = nullptr;  ///< Filled in by type inference

  explicit ObjectExpr(gsl::span<ObjectProperty *> p, SourceRange r = {})
  : NodeBase(r), properties(p)
  {
  }
};

/// `lhs op rhs`
class OperationExpr : public NodeBase<OperationExpr, Expr, NodeKind::Operation>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  OperationExpr(Expr * l, BinaryOp o, Expr * rr, SourceRange r = {})
  : NodeBase(r), lhs(l), op(o), rhs(rr)
  {
  }

  [[nodiscard]] OperatorCategory category() const noexcept { return category_of(op); }
};

/**
 * `origin.member` / `origin::member`.
 *
 * The right-hand side is a full expression, so `a.b.c` nests as
 * Member(a, Member(b, c)).
 */
class MemberExpr : public NodeBase<MemberExpr, Expr, NodeKind::Member>
{
public:
  std::string_view origin;
  SourceRange origin_range;
  MemberLookup lookup;
  Expr * member;

  MemberExpr(
    std::string_view o, SourceRange o_range, MemberLookup l, Expr * m, SourceRange r = {})
  : NodeBase(r), origin(o), origin_range(o_range), lookup(l), member(m)
  {
  }
};

/// Identifier, number, string or boolean, kept as source text.
class LiteralExpr : public NodeBase<LiteralExpr, Expr, NodeKind::Literal>
{
public:
  LiteralKind literal_kind;
  std::string_view value;
  TypeNode * type = nullptr;  ///< Filled in by type inference

  LiteralExpr(LiteralKind k, std::string_view v, SourceRange r = {})
  : NodeBase(r), literal_kind(k), value(v)
  {
  }
};

/// A statement used in expression position (inside blocks).
class StatementExpr : public NodeBase<StatementExpr, Expr, NodeKind::StatementWrap>
{
public:
  Stmt * statement;

  explicit StatementExpr(Stmt * s, SourceRange r = {}) : NodeBase(r), statement(s) {}
};

/// A bare `;` inside a block.
class EndOfLineExpr : public NodeBase<EndOfLineExpr, Expr, NodeKind::EndOfLine>
{
public:
  explicit EndOfLineExpr(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

/// `var` / `const` declaration.
class VariableStmt : public NodeBase<VariableStmt, Stmt, NodeKind::Variable>
{
public:
  std::string_view name;
  TypeNode * type;
  Visibility visibility;
  Expr * assignment;
  uint32_t node_id;
  bool is_constant;

  VariableStmt(
    std::string_view n, TypeNode * t, Visibility v, Expr * init, uint32_t id, bool constant,
    SourceRange r = {})
  : NodeBase(r), name(n), type(t), visibility(v), assignment(init), node_id(id), is_constant(constant)
  {
  }

  [[nodiscard]] bool is_uninit() const noexcept { return assignment == nullptr; }
};

/// `static <stmt>`; wraps a statement, or a class member inside a class body.
class StaticStmt : public NodeBase<StaticStmt, Stmt, NodeKind::Static>
{
public:
  Visibility visibility;
  AstNode * statement;

  StaticStmt(Visibility v, AstNode * s, SourceRange r = {}) : NodeBase(r), visibility(v), statement(s)
  {
  }
};

/// `name: type` in a function signature.
class FunctionInput : public NodeBase<FunctionInput, AstNode, NodeKind::FunctionInput>
{
public:
  std::string_view name;
  TypeNode * type;

  FunctionInput(std::string_view n, TypeNode * t, SourceRange r = {}) : NodeBase(r), name(n), type(t)
  {
  }
};

class FunctionStmt : public NodeBase<FunctionStmt, Stmt, NodeKind::Function>
{
public:
  std::optional<std::string_view> name;  ///< Absent for anonymous functions
  gsl::span<FunctionInput *> inputs;
  TypeNode * outputs;  ///< Declared return type, nullptr when omitted
  BlockStmt * body;
  Visibility visibility;
  uint32_t node_id;

  FunctionStmt(
    std::optional<std::string_view> n, gsl::span<FunctionInput *> in, TypeNode * out, BlockStmt * b,
    Visibility v, uint32_t id, SourceRange r = {})
  : NodeBase(r), name(n), inputs(in), outputs(out), body(b), visibility(v), node_id(id)
  {
  }
};

/// `name (: type)? (= expr)? ;` inside a class body.
class ClassProperty : public NodeBase<ClassProperty, AstNode, NodeKind::ClassProperty>
{
public:
  std::string_view name;
  Visibility visibility;
  TypeNode * type;
  Expr * assignment;

  ClassProperty(
    std::string_view n, Visibility v, TypeNode * t, Expr * init, SourceRange r = {})
  : NodeBase(r), name(n), visibility(v), type(t), assignment(init)
  {
  }
};

/**
 * Class declaration. Members are sorted while parsing: bare properties and
 * bare methods go to their own lists; anything prefixed with a visibility or
 * `static` goes to `other`.
 */
class ClassStmt : public NodeBase<ClassStmt, Stmt, NodeKind::Class>
{
public:
  std::string_view name;
  std::optional<std::string_view> extends;
  gsl::span<std::string_view> implements;
  gsl::span<ClassProperty *> properties;
  gsl::span<FunctionStmt *> methods;
  gsl::span<AstNode *> other;
  uint32_t node_id;

  ClassStmt(
    std::string_view n, std::optional<std::string_view> ext, gsl::span<std::string_view> impl,
    gsl::span<ClassProperty *> props, gsl::span<FunctionStmt *> meths, gsl::span<AstNode *> oth,
    uint32_t id, SourceRange r = {})
  : NodeBase(r),
    name(n),
    extends(ext),
    implements(impl),
    properties(props),
    methods(meths),
    other(oth),
    node_id(id)
  {
  }
};

/// `{ ... }`
class BlockStmt : public NodeBase<BlockStmt, Stmt, NodeKind::Block>
{
public:
  gsl::span<Expr *> body;

  explicit BlockStmt(gsl::span<Expr *> b, SourceRange r = {}) : NodeBase(r), body(b) {}
};

/// Module path: `a\b\c` (namespaces) or `a::b` (imports).
class Path : public NodeBase<Path, AstNode, NodeKind::Path>
{
public:
  std::string_view name;
  gsl::span<std::string_view> parts;

  Path(std::string_view n, gsl::span<std::string_view> p, SourceRange r = {})
  : NodeBase(r), name(n), parts(p)
  {
  }
};

/// `use a::b;` or `use a::b::{c, d};`
class ImportStmt : public NodeBase<ImportStmt, Stmt, NodeKind::Import>
{
public:
  Path * path;
  gsl::span<std::string_view> items;  ///< Braced item list; empty imports the path itself

  ImportStmt(Path * p, gsl::span<std::string_view> i, SourceRange r = {})
  : NodeBase(r), path(p), items(i)
  {
  }
};

class NamespaceStmt : public NodeBase<NamespaceStmt, Stmt, NodeKind::Namespace>
{
public:
  Path * path;
  BlockStmt * body;  ///< nullptr for `namespace a\b;`

  NamespaceStmt(Path * p, BlockStmt * b, SourceRange r = {}) : NodeBase(r), path(p), body(b) {}
};

/// `type Name<params> = type;`
class TypeDefStmt : public NodeBase<TypeDefStmt, Stmt, NodeKind::TypeDef>
{
public:
  std::string_view name;
  gsl::span<TypeParam *> params;
  TypeNode * type;

  TypeDefStmt(std::string_view n, gsl::span<TypeParam *> p, TypeNode * t, SourceRange r = {})
  : NodeBase(r), name(n), params(p), type(t)
  {
  }
};

class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::Return>
{
public:
  Expr * value;  ///< nullptr for a bare `return;`

  explicit ReturnStmt(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Compiler macro call site; produced by macro expansion, not by the parser.
class MacroInvocationStmt
: public NodeBase<MacroInvocationStmt, Stmt, NodeKind::MacroInvocation>
{
public:
  std::string_view name;
  gsl::span<Expr *> args;

  MacroInvocationStmt(std::string_view n, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), name(n), args(a)
  {
  }
};

// ============================================================================
// Top-level envelope
// ============================================================================

/// One top-level unit of a file: a statement or an expression.
class Node
{
public:
  Node(const AstNode * inner, SourceRange range) : inner_(inner), range_(range) {}

  [[nodiscard]] const AstNode * inner() const noexcept { return inner_; }
  [[nodiscard]] SourceRange range() const noexcept { return range_; }

  [[nodiscard]] bool is_statement() const noexcept { return isa<Stmt>(inner_); }
  [[nodiscard]] bool is_expression() const noexcept { return isa<Expr>(inner_); }

private:
  const AstNode * inner_;
  SourceRange range_;
};

/**
 * Ordered, append-only list of the top-level nodes of one file.
 * Nodes point into the AstContext used for the parse.
 */
class AstBody
{
public:
  void push_node(Node node) { program_.push_back(node); }

  [[nodiscard]] const std::vector<Node> & get_program() const noexcept { return program_; }
  [[nodiscard]] size_t size() const noexcept { return program_.size(); }
  [[nodiscard]] bool empty() const noexcept { return program_.empty(); }

  [[nodiscard]] auto begin() const noexcept { return program_.begin(); }
  [[nodiscard]] auto end() const noexcept { return program_.end(); }

private:
  std::vector<Node> program_;
};

}  // namespace surn
