// surn/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, operators, member lookup modes, visibility and the built-in
// type table used throughout the surn AST.
//
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

#include "surn/syntax/keywords.hpp"

namespace surn
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for range-based classof checks.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "surn/ast/ast_nodes.def"

// === Types ===
#define AST_NODE_TYPE(Class, Kind, Snake) Kind,
#include "surn/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "surn/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "surn/ast/ast_nodes.def"
};

/// Class name of a node kind ("CallExpr", "VariableStmt", ...).
[[nodiscard]] constexpr std::string_view to_string(NodeKind k) noexcept
{
  switch (k) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_TYPE(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Class;
#include "surn/ast/ast_nodes.def"
  }
  return "";
}

// ============================================================================
// Operators
// ============================================================================

/**
 * Binary operators. `Flip` (~) is accepted in binary position because the
 * expression grammar has no unary forms.
 */
enum class BinaryOp : uint8_t {
  Assign,  ///< =
  Lt,      ///< <
  Gt,      ///< >
  BitAnd,  ///< &
  BitOr,   ///< |
  BitXor,  ///< ^
  Flip,    ///< ~
  Minus,   ///< -
  Plus,    ///< +
  Mul,     ///< *
  Div,     ///< /
  Mod,     ///< %
  And,     ///< and
  Or,      ///< or
};

/// Operator family, as reported in AST dumps.
enum class OperatorCategory : uint8_t {
  Assignment,
  Comparison,
  Bitwise,
  Arithmetic,
  Logical,
};

inline constexpr std::array<std::pair<std::string_view, BinaryOp>, 14> k_binary_ops = {{
  {"=", BinaryOp::Assign},
  {"<", BinaryOp::Lt},
  {">", BinaryOp::Gt},
  {"&", BinaryOp::BitAnd},
  {"|", BinaryOp::BitOr},
  {"^", BinaryOp::BitXor},
  {"~", BinaryOp::Flip},
  {"-", BinaryOp::Minus},
  {"+", BinaryOp::Plus},
  {"*", BinaryOp::Mul},
  {"/", BinaryOp::Div},
  {"%", BinaryOp::Mod},
  {"and", BinaryOp::And},
  {"or", BinaryOp::Or},
}};

[[nodiscard]] constexpr std::optional<BinaryOp> binary_op_from_string(std::string_view s) noexcept
{
  for (const auto & [text, op] : k_binary_ops) {
    if (text == s) {
      return op;
    }
  }
  return std::nullopt;
}

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  for (const auto & [text, value] : k_binary_ops) {
    if (value == op) {
      return text;
    }
  }
  return "";
}

[[nodiscard]] constexpr OperatorCategory category_of(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Assign:
      return OperatorCategory::Assignment;
    case BinaryOp::Lt:
    case BinaryOp::Gt:
      return OperatorCategory::Comparison;
    case BinaryOp::BitAnd:
    case BinaryOp::BitOr:
    case BinaryOp::BitXor:
    case BinaryOp::Flip:
      return OperatorCategory::Bitwise;
    case BinaryOp::And:
    case BinaryOp::Or:
      return OperatorCategory::Logical;
    default:
      return OperatorCategory::Arithmetic;
  }
}

[[nodiscard]] constexpr std::string_view to_string(OperatorCategory c) noexcept
{
  switch (c) {
    case OperatorCategory::Assignment:
      return "Assignment";
    case OperatorCategory::Comparison:
      return "Comparison";
    case OperatorCategory::Bitwise:
      return "Bitwise";
    case OperatorCategory::Arithmetic:
      return "Arithmetic";
    case OperatorCategory::Logical:
      return "Logical";
  }
  return "";
}

/**
 * Binding strength used by the precedence-climbing operator policy.
 * Higher binds tighter.
 */
[[nodiscard]] constexpr int operator_precedence(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Assign:
      return 1;
    case BinaryOp::Or:
      return 2;
    case BinaryOp::And:
      return 3;
    case BinaryOp::BitOr:
      return 4;
    case BinaryOp::BitXor:
      return 5;
    case BinaryOp::BitAnd:
      return 6;
    case BinaryOp::Lt:
    case BinaryOp::Gt:
      return 7;
    case BinaryOp::Plus:
    case BinaryOp::Minus:
      return 8;
    case BinaryOp::Mul:
    case BinaryOp::Div:
    case BinaryOp::Mod:
      return 9;
    case BinaryOp::Flip:
      return 10;
  }
  return 0;
}

[[nodiscard]] constexpr bool is_right_associative(BinaryOp op) noexcept
{
  return op == BinaryOp::Assign;
}

// ============================================================================
// Member lookup / visibility
// ============================================================================

enum class MemberLookup : uint8_t {
  Static,   ///< a::b
  Dynamic,  ///< a.b
  Index,    ///< a[b]
};

[[nodiscard]] constexpr std::string_view to_string(MemberLookup m) noexcept
{
  switch (m) {
    case MemberLookup::Static:
      return "Static";
    case MemberLookup::Dynamic:
      return "Dynamic";
    case MemberLookup::Index:
      return "Index";
  }
  return "";
}

enum class Visibility : uint8_t {
  Public,
  Private,
  Protected,
  Module,
};

[[nodiscard]] constexpr std::string_view to_string(Visibility v) noexcept
{
  switch (v) {
    case Visibility::Public:
      return "Public";
    case Visibility::Private:
      return "Private";
    case Visibility::Protected:
      return "Protected";
    case Visibility::Module:
      return "Module";
  }
  return "";
}

/// Visibility named by a `pub` / `priv` / `prot` keyword.
[[nodiscard]] constexpr std::optional<Visibility> visibility_from_keyword(
  syntax::KeyWord k) noexcept
{
  switch (k) {
    case syntax::KeyWord::Public:
      return Visibility::Public;
    case syntax::KeyWord::Private:
      return Visibility::Private;
    case syntax::KeyWord::Protected:
      return Visibility::Protected;
    default:
      return std::nullopt;
  }
}

// ============================================================================
// Literals
// ============================================================================

enum class LiteralKind : uint8_t {
  Identifier,
  Number,
  String,
  Boolean,
};

[[nodiscard]] constexpr std::string_view to_string(LiteralKind k) noexcept
{
  switch (k) {
    case LiteralKind::Identifier:
      return "Identifier";
    case LiteralKind::Number:
      return "Number";
    case LiteralKind::String:
      return "String";
    case LiteralKind::Boolean:
      return "Boolean";
  }
  return "";
}

// ============================================================================
// Built-in types
// ============================================================================

enum class BuiltInKind : uint8_t {
  Byte,
  Short,
  Int,
  Long,
  Float,
  Double,
  Bool,
  String,
  Array,
  Any,
  // Strict-width forms
  U8,
  U16,
  U32,
  U64,
  U128,
  I8,
  I16,
  I32,
  I64,
  I128,
  F32,
  F64,
};

inline constexpr std::array<std::pair<std::string_view, BuiltInKind>, 22> k_builtin_types = {{
  {"byte", BuiltInKind::Byte},     {"short", BuiltInKind::Short},   {"int", BuiltInKind::Int},
  {"long", BuiltInKind::Long},     {"float", BuiltInKind::Float},   {"double", BuiltInKind::Double},
  {"bool", BuiltInKind::Bool},     {"string", BuiltInKind::String}, {"array", BuiltInKind::Array},
  {"any", BuiltInKind::Any},       {"u8", BuiltInKind::U8},         {"u16", BuiltInKind::U16},
  {"u32", BuiltInKind::U32},       {"u64", BuiltInKind::U64},       {"u128", BuiltInKind::U128},
  {"i8", BuiltInKind::I8},         {"i16", BuiltInKind::I16},       {"i32", BuiltInKind::I32},
  {"i64", BuiltInKind::I64},       {"i128", BuiltInKind::I128},     {"f32", BuiltInKind::F32},
  {"f64", BuiltInKind::F64},
}};

[[nodiscard]] constexpr std::optional<BuiltInKind> builtin_from_string(std::string_view s) noexcept
{
  for (const auto & [text, kind] : k_builtin_types) {
    if (text == s) {
      return kind;
    }
  }
  return std::nullopt;
}

[[nodiscard]] constexpr std::string_view to_string(BuiltInKind k) noexcept
{
  for (const auto & [text, kind] : k_builtin_types) {
    if (kind == k) {
      return text;
    }
  }
  return "";
}

[[nodiscard]] constexpr bool is_strict(BuiltInKind k) noexcept { return k >= BuiltInKind::U8; }

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::Call;
inline constexpr NodeKind k_last_expr_kind = NodeKind::EndOfLine;

inline constexpr NodeKind k_first_type_kind = NodeKind::BuiltIn;
inline constexpr NodeKind k_last_type_kind = NodeKind::Runtime;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::Variable;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::MacroInvocation;

}  // namespace detail

/// Check if a NodeKind is an expression
[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

/// Check if a NodeKind is a type
[[nodiscard]] constexpr bool is_type_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_type_kind && kind <= detail::k_last_type_kind;
}

/// Check if a NodeKind is a statement
[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

}  // namespace surn
