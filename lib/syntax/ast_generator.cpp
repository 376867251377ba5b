// surn/syntax/ast_generator.cpp - Recursive-descent productions
#include "surn/syntax/ast_generator.hpp"

#include <fmt/core.h>

#include "surn/syntax/tokenizer.hpp"

namespace surn::syntax
{

namespace
{

TokenPredicate kind_is(TokenKind k)
{
  return [k](const Token & t) { return t.is(k); };
}

TokenPredicate keyword_is(KeyWord k)
{
  return [k](const Token & t) { return t.is_keyword(k); };
}

TokenPredicate operator_is(std::string_view op)
{
  return [op](const Token & t) { return t.is_operator(op); };
}

bool is_trivia(const Token & t) { return t.is_trivia(); }

bool is_declaration_keyword(const Token & t)
{
  return t.is_keyword(KeyWord::Var) || t.is_keyword(KeyWord::Const);
}

}  // namespace

// ============================================================================
// Entry point
// ============================================================================

ParseResult AstGenerator::begin_parse(TokenStream tokens)
{
  tokens_ = std::move(tokens);
  error_.reset();

  ParseResult result;
  while (true) {
    skip_trivia();
    if (tokens_.is_eof()) {
      break;
    }
    const uint32_t start = start_offset();

    auto stmt = parse_statement();
    if (stmt.failed()) {
      break;
    }
    if (stmt.matched()) {
      result.body.push_node(Node(stmt.value(), span_from(start)));
      continue;
    }

    auto expr = parse_expression();
    if (expr.failed()) {
      break;
    }
    if (expr.matched()) {
      // A statement end after a top-level expression belongs to it, trivia
      // in between included.
      if (const auto end = tokens_.find_after(kind_is(TokenKind::StatementEnd), is_trivia)) {
        tokens_.peek_inc(end->first + 1);
      }
      result.body.push_node(Node(expr.value(), span_from(start)));
      continue;
    }

    (void)fail(
      here(), "Missing a valid statement or expression in global scope.",
      fmt::format("Unexpected token: \"{}\"", describe_next()));
    break;
  }

  result.error = std::move(error_);
  return result;
}

// ============================================================================
// Statements
// ============================================================================

Parsed<Stmt *> AstGenerator::parse_statement()
{
  if (auto r = parse_namespace(); !r.no_match()) return r;
  if (auto r = parse_static(); !r.no_match()) return r;
  if (auto r = parse_variable(); !r.no_match()) return r;
  if (auto r = parse_function_statement(); !r.no_match()) return r;
  if (auto r = parse_class(); !r.no_match()) return r;
  if (auto r = parse_type_alias(); !r.no_match()) return r;
  if (auto r = parse_import(); !r.no_match()) return r;
  return {};
}

Parsed<NamespaceStmt *> AstGenerator::parse_namespace()
{
  if (!tokens_.first_if(keyword_is(KeyWord::Namespace))) {
    return {};
  }
  const uint32_t start = start_offset();
  (void)tokens_.peek();
  skip_trivia();

  const auto name = tokens_.peek_if(kind_is(TokenKind::Identifier));
  if (!name) {
    return fail(here(), "Expected a namespace name.", "A namespace name is expected here.");
  }

  std::vector<std::string_view> parts;
  uint32_t path_end = name->end();
  while (true) {
    skip_trivia();
    if (!tokens_.peek_if(kind_is(TokenKind::Backslash))) {
      break;
    }
    const auto part = tokens_.peek_if(kind_is(TokenKind::Identifier));
    if (!part) {
      return fail(here(), "Expected identifier after backslash.", "An identifier is expected here.");
    }
    parts.push_back(intern(*part));
    path_end = part->end();
  }
  auto * path = ast_.create<Path>(
    intern(*name), freeze(parts), SourceRange(file_, name->begin(), path_end));

  if (tokens_.first_if(kind_is(TokenKind::LeftBrace))) {
    auto block = parse_block();
    if (block.failed()) {
      return ParseFailure{};
    }
    skip_trivia();
    if (!tokens_.peek_if(kind_is(TokenKind::StatementEnd))) {
      return fail(
        here(), "Expected statement end after namespace statement.",
        "A semicolon is expected here.");
    }
    return ast_.create<NamespaceStmt>(path, block.value(), span_from(start));
  }

  if (tokens_.peek_if(kind_is(TokenKind::StatementEnd))) {
    return ast_.create<NamespaceStmt>(path, nullptr, span_from(start));
  }

  return fail(
    here(), "Unable to parse namespace path.",
    fmt::format("Unexpected token: {}", describe_next()));
}

Parsed<StaticStmt *> AstGenerator::parse_static()
{
  const uint32_t start = start_offset();
  const auto visibility = visibility_before(keyword_is(KeyWord::Static));
  if (!visibility && !tokens_.first_if(keyword_is(KeyWord::Static))) {
    return {};
  }
  if (visibility) {
    (void)tokens_.peek();
    skip_trivia();
  }
  (void)tokens_.peek();  // static

  if (!skip_trivia_required(start, "Expected a statement after a static keyword, but found none.")) {
    return ParseFailure{};
  }
  auto stmt = parse_statement();
  if (stmt.failed()) {
    return ParseFailure{};
  }
  if (stmt.no_match()) {
    return fail(
      here(), "Expected a statement after a static keyword, but found none.",
      "A statement was expected here.");
  }
  return ast_.create<StaticStmt>(
    visibility.value_or(Visibility::Private), stmt.value(), span_from(start));
}

Parsed<VariableStmt *> AstGenerator::parse_variable()
{
  const uint32_t start = start_offset();
  const auto visibility = visibility_before(is_declaration_keyword);
  if (!visibility && !tokens_.first_if(is_declaration_keyword)) {
    return {};
  }
  if (visibility) {
    (void)tokens_.peek();
    skip_trivia();
  }
  const bool is_constant = tokens_.peek()->is_keyword(KeyWord::Const);
  skip_trivia();

  const auto name = tokens_.peek_if(kind_is(TokenKind::Identifier));
  if (!name) {
    return fail(
      here(), "A name must follow a variable declaration",
      fmt::format("Unexpected token: \"{}\"", describe_next()));
  }
  skip_trivia();

  TypeNode * type = nullptr;
  if (tokens_.peek_if(kind_is(TokenKind::Colon))) {
    skip_trivia();
    auto t = parse_type();
    if (t.failed()) {
      return ParseFailure{};
    }
    if (t.no_match()) {
      return fail(
        here(), "Expected type statement to follow a variable declaration with a colon.",
        "A type statement is expected here.");
    }
    type = t.value();
    skip_trivia();
  }

  Expr * assignment = nullptr;
  if (tokens_.peek_if(operator_is("="))) {
    skip_trivia();
    auto e = parse_expression();
    if (e.failed()) {
      return ParseFailure{};
    }
    if (e.no_match()) {
      return fail(
        here(), "Expected an expression to follow a variable declaration.",
        "An expression is expected here.");
    }
    assignment = e.value();
    skip_trivia();
    if (!tokens_.peek_if(kind_is(TokenKind::StatementEnd))) {
      return fail(
        here(), "Expected a semicolon to follow a variable declaration.",
        "A semicolon is expected here.");
    }
  } else if (!tokens_.peek_if(kind_is(TokenKind::StatementEnd))) {
    return fail(
      here(), "Expected an end of statement to follow an uninitialized declaration.",
      "A semi-colon is expected here.");
  }

  return ast_.create<VariableStmt>(
    intern(*name), type, visibility.value_or(Visibility::Private), assignment,
    context_.get_next_local_id(), is_constant, span_from(start));
}

Parsed<FunctionStmt *> AstGenerator::parse_function_statement()
{
  const uint32_t start = start_offset();
  const auto visibility = visibility_before(keyword_is(KeyWord::Function));
  if (visibility) {
    (void)tokens_.peek();
    skip_trivia();
    return parse_function(start, *visibility);
  }
  return parse_function(start, Visibility::Public);
}

Parsed<FunctionStmt *> AstGenerator::parse_function(uint32_t start, Visibility visibility)
{
  if (!tokens_.first_if(keyword_is(KeyWord::Function))) {
    return {};
  }
  (void)tokens_.peek();
  skip_trivia();

  // `function pub name()` is accepted as well as `pub function name()`.
  if (const auto vis_tok = tokens_.peek_if([](const Token & t) { return t.is_visibility(); })) {
    visibility = *visibility_from_keyword(vis_tok->keyword);
    skip_trivia();
  }

  std::optional<std::string_view> name;
  if (const auto name_tok = tokens_.peek_if(kind_is(TokenKind::Identifier))) {
    name = intern(*name_tok);
  }
  if (!skip_trivia_required(start, "A function input list was expected but none was found.")) {
    return ParseFailure{};
  }

  auto inputs = parse_function_inputs();
  if (inputs.failed()) {
    return ParseFailure{};
  }
  if (inputs.no_match()) {
    return fail(
      here(), "Expected a function input list to follow a function declaration.",
      "A function input list is expected here.");
  }
  skip_trivia();

  TypeNode * outputs = nullptr;
  if (tokens_.peek_if(kind_is(TokenKind::Colon))) {
    skip_trivia();
    auto ret = parse_type();
    if (ret.failed()) {
      return ParseFailure{};
    }
    if (ret.no_match()) {
      return fail(
        here(), "Expected a return type statement to follow a function declaration.",
        "A return type is expected here.");
    }
    outputs = ret.value();
    skip_trivia();
  }

  auto body = parse_block();
  if (body.failed()) {
    return ParseFailure{};
  }
  if (body.no_match()) {
    return fail(
      here(), "Expected a block to follow a function declaration.", "A block is expected here.");
  }

  return ast_.create<FunctionStmt>(
    name, freeze(inputs.value()), outputs, body.value(), visibility, context_.get_next_local_id(),
    span_from(start));
}

Parsed<std::vector<FunctionInput *>> AstGenerator::parse_function_inputs()
{
  if (!tokens_.first_if(kind_is(TokenKind::LeftParen))) {
    return {};
  }
  const uint32_t start = start_offset();
  (void)tokens_.peek();

  std::vector<FunctionInput *> inputs;
  while (true) {
    if (!skip_trivia_required(start, "Function declaration arguments must be closed.")) {
      return ParseFailure{};
    }
    if (tokens_.peek_if(kind_is(TokenKind::RightParen))) {
      return inputs;
    }

    const auto name = tokens_.peek_if(kind_is(TokenKind::Identifier));
    if (!name) {
      return fail(
        here(), "Expected a function parameter name but none was found.",
        "A name is expected here.");
    }
    skip_trivia();
    if (!tokens_.peek_if(kind_is(TokenKind::Colon))) {
      return fail(
        here(), "Expected a type statement to follow a function declaration argument.",
        "A type statement is expected here.");
    }
    skip_trivia();
    auto type = parse_type();
    if (type.failed()) {
      return ParseFailure{};
    }
    if (type.no_match()) {
      return fail(
        here(), "Expected a type statement to follow a function declaration argument.",
        "A type statement is expected here.");
    }
    inputs.push_back(
      ast_.create<FunctionInput>(intern(*name), type.value(), span_from(name->begin())));

    if (!skip_trivia_required(start, "Function declaration arguments must be closed.")) {
      return ParseFailure{};
    }
    if (tokens_.peek_if(kind_is(TokenKind::Comma)) ||
        tokens_.first_if(kind_is(TokenKind::RightParen))) {
      continue;
    }
    return fail(
      here(), "Expected a right parenthesis to follow a function argument declaration.",
      "A right parenthesis is expected here.");
  }
}

Parsed<ClassStmt *> AstGenerator::parse_class()
{
  if (!tokens_.first_if(keyword_is(KeyWord::Class))) {
    return {};
  }
  const uint32_t start = start_offset();
  (void)tokens_.peek();
  skip_trivia();

  const auto name = tokens_.peek_if(kind_is(TokenKind::Identifier));
  if (!name) {
    return fail(
      here(), "Expected a class name but none was found.",
      fmt::format("Unexpected token: {}", describe_next()));
  }
  skip_trivia();

  std::optional<std::string_view> extends;
  if (tokens_.peek_if(keyword_is(KeyWord::Extends))) {
    skip_trivia();
    const auto base = tokens_.peek_if(kind_is(TokenKind::Identifier));
    if (!base) {
      return fail(
        here(), "Expected a class name to extend but none was found.",
        fmt::format("Unexpected token: {}", describe_next()));
    }
    extends = intern(*base);
    skip_trivia();
  }

  std::vector<std::string_view> implements;
  if (tokens_.peek_if(keyword_is(KeyWord::Implements))) {
    skip_trivia();
    const auto first = tokens_.peek_if(kind_is(TokenKind::Identifier));
    if (!first) {
      return fail(
        here(), "Expected a class name to implement but none was found.",
        fmt::format("Unexpected token: {}", describe_next()));
    }
    implements.push_back(intern(*first));
    while (true) {
      skip_trivia();
      if (!tokens_.peek_if(kind_is(TokenKind::Comma))) {
        break;
      }
      skip_trivia();
      const auto next = tokens_.peek_if(kind_is(TokenKind::Identifier));
      if (!next) {
        return fail(
          here(), "Expected a class name or interface to implement but none was found.",
          fmt::format("Unexpected token: {}", describe_next()));
      }
      implements.push_back(intern(*next));
    }
  }

  if (!tokens_.first_if(kind_is(TokenKind::LeftBrace))) {
    return fail(
      here(), "Expected a class body to follow a class declaration.",
      "A left brace is expected here.");
  }
  const uint32_t body_start = start_offset();
  (void)tokens_.peek();

  std::vector<ClassProperty *> properties;
  std::vector<FunctionStmt *> methods;
  std::vector<AstNode *> other;
  while (true) {
    if (!skip_trivia_required(
          body_start, "Expected a right brace to close the class body, found none.")) {
      return ParseFailure{};
    }
    if (tokens_.peek_if(kind_is(TokenKind::RightBrace))) {
      break;
    }

    auto property = parse_class_property(Visibility::Private);
    if (property.failed()) {
      return ParseFailure{};
    }
    if (property.matched()) {
      properties.push_back(property.value());
      continue;
    }

    auto method = parse_function(start_offset(), Visibility::Public);
    if (method.failed()) {
      return ParseFailure{};
    }
    if (method.matched()) {
      methods.push_back(method.value());
      continue;
    }

    auto member = parse_class_member();
    if (member.failed()) {
      return ParseFailure{};
    }
    if (member.matched()) {
      other.push_back(member.value());
      continue;
    }

    return fail(
      here(), "Classes must contain a property, method, import or macro.",
      fmt::format("Unexpected token: \"{}\" inside class body.", describe_next()));
  }

  return ast_.create<ClassStmt>(
    intern(*name), extends, freeze(implements), freeze(properties), freeze(methods), freeze(other),
    context_.get_next_local_id(), span_from(start));
}

Parsed<ClassProperty *> AstGenerator::parse_class_property(Visibility visibility)
{
  if (!tokens_.first_if(kind_is(TokenKind::Identifier))) {
    return {};
  }
  const uint32_t start = start_offset();
  const auto name = tokens_.peek();
  skip_trivia();

  TypeNode * type = nullptr;
  if (tokens_.peek_if(kind_is(TokenKind::Colon))) {
    skip_trivia();
    auto t = parse_type();
    if (t.failed()) {
      return ParseFailure{};
    }
    if (t.no_match()) {
      return fail(
        here(), "Expected a type statement to follow a property declaration.",
        "A type statement is expected here.");
    }
    type = t.value();
    skip_trivia();
  }

  Expr * assignment = nullptr;
  if (tokens_.peek_if(operator_is("="))) {
    if (!skip_trivia_required(start, "An expression was expected but none was found.")) {
      return ParseFailure{};
    }
    auto e = parse_expression();
    if (e.failed()) {
      return ParseFailure{};
    }
    if (e.no_match()) {
      return fail(
        here(), "Expected an expression to follow a property declaration.",
        "An expression is expected here.");
    }
    assignment = e.value();
    skip_trivia();
    if (!tokens_.peek_if(kind_is(TokenKind::StatementEnd))) {
      return fail(
        here(), "Expected a semicolon to follow a property declaration.",
        "A semicolon is expected here.");
    }
  } else if (!tokens_.peek_if(kind_is(TokenKind::StatementEnd))) {
    return fail(
      here(), "Expected an end of statement to follow an uninitialized declaration.",
      "A semi-colon is expected here.");
  }

  return ast_.create<ClassProperty>(intern(*name), visibility, type, assignment, span_from(start));
}

Parsed<AstNode *> AstGenerator::parse_class_member()
{
  const auto head = tokens_.first();
  if (!head || (!head->is_visibility() && !head->is_keyword(KeyWord::Static))) {
    return {};
  }
  const uint32_t start = start_offset();

  Visibility visibility = Visibility::Private;
  if (head->is_visibility()) {
    visibility = *visibility_from_keyword(head->keyword);
    (void)tokens_.peek();
    if (!skip_trivia_required(
          start,
          "A statement or static keyword was expected after a visibility modifier but none was "
          "found.")) {
      return ParseFailure{};
    }
  }
  const bool is_static = tokens_.peek_if(keyword_is(KeyWord::Static)).has_value();
  if (is_static) {
    skip_trivia();
  }

  Parsed<AstNode *> member = parse_class_property(visibility);
  if (member.no_match()) {
    member = parse_function(start_offset(), visibility);
  }
  if (member.failed()) {
    return ParseFailure{};
  }
  if (member.no_match()) {
    return fail(
      here(), "Expected a property or function declaration but none was found.",
      fmt::format("Unexpected token: {}", describe_next()));
  }

  if (is_static) {
    return ast_.create<StaticStmt>(visibility, member.value(), span_from(start));
  }
  return member;
}

Parsed<TypeDefStmt *> AstGenerator::parse_type_alias()
{
  if (!tokens_.first_if(keyword_is(KeyWord::Type))) {
    return {};
  }
  const uint32_t start = start_offset();
  (void)tokens_.peek();
  skip_trivia();

  const auto name = tokens_.peek_if(kind_is(TokenKind::Identifier));
  if (!name) {
    return fail(
      here(), "Expected a type name but none was found.",
      fmt::format("Unexpected token: {}", describe_next()));
  }

  auto params = parse_type_generics();
  if (params.failed()) {
    return ParseFailure{};
  }
  skip_trivia();

  if (!tokens_.peek_if(operator_is("="))) {
    return fail(
      here(), "Expected an assignment to follow a type declaration.", "An '=' is expected here.");
  }
  skip_trivia();
  auto aliased = parse_type();
  if (aliased.failed()) {
    return ParseFailure{};
  }
  if (aliased.no_match()) {
    return fail(
      here(), "Expected a type to follow a type declaration.", "A type is expected here.");
  }
  skip_trivia();
  if (!tokens_.peek_if(kind_is(TokenKind::StatementEnd))) {
    return fail(
      here(), "Expected a semicolon to follow a type declaration.",
      "A semicolon is expected here.");
  }

  return ast_.create<TypeDefStmt>(
    intern(*name), freeze(params.value()), aliased.value(), span_from(start));
}

Parsed<ImportStmt *> AstGenerator::parse_import()
{
  if (!tokens_.first_if(keyword_is(KeyWord::Use))) {
    return {};
  }
  const uint32_t start = start_offset();
  (void)tokens_.peek();
  skip_trivia();

  const auto root = tokens_.peek_if(kind_is(TokenKind::Identifier));
  if (!root) {
    return fail(
      here(), "Expected a module path to follow a use statement.", "A path is expected here.");
  }

  std::vector<std::string_view> parts;
  std::vector<std::string_view> items;
  uint32_t path_end = root->end();
  while (true) {
    skip_trivia();
    const auto separator = [](const Token & t) { return t.is(TokenKind::Accessor) && t.text() == "::"; };
    if (!tokens_.peek_if(separator)) {
      break;
    }
    skip_trivia();

    if (tokens_.first_if(kind_is(TokenKind::LeftBrace))) {
      const uint32_t list_start = start_offset();
      (void)tokens_.peek();
      while (true) {
        if (!skip_trivia_required(list_start, "An import list must be closed.")) {
          return ParseFailure{};
        }
        if (tokens_.peek_if(kind_is(TokenKind::RightBrace))) {
          break;
        }
        const auto item = tokens_.peek_if(kind_is(TokenKind::Identifier));
        if (!item) {
          return fail(
            here(), "Expected an identifier in an import list.", "An identifier is expected here.");
        }
        items.push_back(intern(*item));
        if (!skip_trivia_required(list_start, "An import list must be closed.")) {
          return ParseFailure{};
        }
        if (tokens_.peek_if(kind_is(TokenKind::Comma)) ||
            tokens_.first_if(kind_is(TokenKind::RightBrace))) {
          continue;
        }
        return fail(
          here(), "Expected a comma to separate imported names.", "A comma is expected here.");
      }
      skip_trivia();
      break;
    }

    const auto part = tokens_.peek_if(kind_is(TokenKind::Identifier));
    if (!part) {
      return fail(
        here(), "Expected an identifier after a path separator.",
        "An identifier is expected here.");
    }
    parts.push_back(intern(*part));
    path_end = part->end();
  }

  auto * path = ast_.create<Path>(
    intern(*root), freeze(parts), SourceRange(file_, root->begin(), path_end));
  if (!tokens_.peek_if(kind_is(TokenKind::StatementEnd))) {
    return fail(
      here(), "Expected a semicolon to follow a use statement.", "A semicolon is expected here.");
  }
  return ast_.create<ImportStmt>(path, freeze(items), span_from(start));
}

Parsed<BlockStmt *> AstGenerator::parse_block()
{
  if (!tokens_.first_if(kind_is(TokenKind::LeftBrace))) {
    return {};
  }
  const uint32_t start = start_offset();
  (void)tokens_.peek();

  std::vector<Expr *> body;
  while (true) {
    if (!skip_trivia_required(start, "A block must be closed.")) {
      return ParseFailure{};
    }

    auto expr = parse_expression();
    if (expr.failed()) {
      return ParseFailure{};
    }
    if (expr.matched()) {
      body.push_back(expr.value());
      continue;
    }

    if (tokens_.peek_if(kind_is(TokenKind::RightBrace))) {
      break;
    }
    if (const auto end = tokens_.peek_if(kind_is(TokenKind::StatementEnd))) {
      body.push_back(ast_.create<EndOfLineExpr>(end->range));
      continue;
    }
    if (tokens_.first_if(keyword_is(KeyWord::Return))) {
      const uint32_t ret_start = start_offset();
      auto ret = parse_return();
      if (ret.failed()) {
        return ParseFailure{};
      }
      body.push_back(ast_.create<StatementExpr>(ret.value(), span_from(ret_start)));
      continue;
    }

    return fail(here(), "Expected a statement to follow a block.", "A statement is expected here.");
  }

  return ast_.create<BlockStmt>(freeze(body), span_from(start));
}

Parsed<ReturnStmt *> AstGenerator::parse_return()
{
  const uint32_t start = start_offset();
  (void)tokens_.peek();
  if (!skip_trivia_required(start, "Expected a semicolon to follow a return statement.")) {
    return ParseFailure{};
  }

  Expr * value = nullptr;
  if (!tokens_.first_if(kind_is(TokenKind::StatementEnd))) {
    auto e = parse_expression();
    if (e.failed()) {
      return ParseFailure{};
    }
    if (e.no_match()) {
      return fail(
        here(), "Expected an expression to follow a return statement.",
        "Expected an expression here.");
    }
    value = e.value();
    skip_trivia();
  }
  if (!tokens_.peek_if(kind_is(TokenKind::StatementEnd))) {
    return fail(
      here(), "Expected a semicolon to follow a return statement.",
      "A semicolon is expected here.");
  }
  return ast_.create<ReturnStmt>(value, span_from(start));
}

// ============================================================================
// Types
// ============================================================================

Parsed<TypeNode *> AstGenerator::parse_type()
{
  if (!tokens_.first_if(kind_is(TokenKind::Identifier))) {
    return {};
  }
  const uint32_t start = start_offset();
  auto first = parse_type_atom();
  if (!first.matched()) {
    return first;
  }

  const auto after = tokens_.find_after(operator_is("|"), is_trivia);
  if (!after) {
    return first;
  }
  tokens_.peek_inc(after->first);

  // Every member that names a built-in type is a BuiltInType already,
  // since parse_type_atom resolves built-in names.
  std::vector<TypeNode *> members{first.value()};
  while (tokens_.peek_if(operator_is("|"))) {
    skip_trivia();
    if (!tokens_.first_if(kind_is(TokenKind::Identifier))) {
      return fail(
        here(), "Expected a type reference to follow a union type.",
        "A type reference is expected here.");
    }
    auto member = parse_type_atom();
    if (member.failed()) {
      return ParseFailure{};
    }
    members.push_back(member.value());

    const auto next = tokens_.find_after(operator_is("|"), is_trivia);
    if (!next) {
      break;
    }
    tokens_.peek_inc(next->first);
  }
  return ast_.create<TypeUnion>(freeze(members), span_from(start));
}

Parsed<TypeNode *> AstGenerator::parse_type_atom()
{
  const uint32_t start = start_offset();
  const auto name = tokens_.peek();

  auto generics = parse_type_generics();
  if (generics.failed()) {
    return ParseFailure{};
  }

  const auto builtin = builtin_from_string(name->text());
  if (!builtin) {
    return ast_.create<TypeReference>(intern(*name), freeze(generics.value()), span_from(start));
  }

  const auto & params = generics.value();
  if (params.empty()) {
    return ast_.create<BuiltInType>(*builtin, span_from(start));
  }
  if (*builtin != BuiltInKind::Array || params.size() != 1) {
    return fail(
      span_from(start), fmt::format("Built-in type '{}' does not take these type parameters.", name->text()),
      *builtin == BuiltInKind::Array ? "array takes exactly one element type"
                                     : "unexpected type parameters");
  }
  return ast_.create<BuiltInType>(*builtin, params.front()->type, span_from(start));
}

Parsed<std::vector<TypeParam *>> AstGenerator::parse_type_generics()
{
  std::vector<TypeParam *> params;
  if (!tokens_.first_if(operator_is("<"))) {
    return params;
  }
  const uint32_t start = start_offset();
  (void)tokens_.peek();

  while (true) {
    if (!skip_trivia_required(start, "Expected a type parameter to follow a typed parameter list.")) {
      return ParseFailure{};
    }
    if (tokens_.first_if(operator_is(">"))) {
      if (params.empty()) {
        return fail(
          here(), "Expected a type parameter to follow a typed parameter list.",
          "A type parameter is expected here.");
      }
      (void)tokens_.peek();
      return params;
    }
    if (tokens_.peek_if(kind_is(TokenKind::Comma))) {
      continue;
    }

    const uint32_t param_start = start_offset();
    auto type = parse_type();
    if (type.failed()) {
      return ParseFailure{};
    }
    if (type.no_match()) {
      return fail(
        here(), "Expected a type parameter to follow a typed parameter list.",
        "A type parameter is expected here.");
    }
    params.push_back(ast_.create<TypeParam>(std::nullopt, type.value(), span_from(param_start)));
  }
}

// ============================================================================
// Expressions
// ============================================================================

Parsed<Expr *> AstGenerator::parse_expression()
{
  const uint32_t start = start_offset();
  auto left = parse_operand();
  if (!left.matched()) {
    return left;
  }
  if (options_.operator_policy == OperatorPolicy::PrecedenceClimbing) {
    return parse_binary_rhs(0, left.value(), start);
  }
  return parse_right_recursive(left.value(), start);
}

Parsed<Expr *> AstGenerator::parse_operand()
{
  const uint32_t start = start_offset();
  if (auto stmt = parse_statement(); !stmt.no_match()) {
    if (stmt.failed()) {
      return ParseFailure{};
    }
    return ast_.create<StatementExpr>(stmt.value(), span_from(start));
  }
  if (auto r = parse_call(); !r.no_match()) return r;
  if (auto r = parse_member(); !r.no_match()) return r;
  if (auto r = parse_new(); !r.no_match()) return r;
  if (auto r = parse_array(); !r.no_match()) return r;
  if (auto r = parse_object(); !r.no_match()) return r;
  if (auto r = parse_literal(); !r.no_match()) return r;
  return {};
}

Parsed<Expr *> AstGenerator::parse_right_recursive(Expr * left, uint32_t start)
{
  const auto found = tokens_.find_after(kind_is(TokenKind::Operator), is_trivia);
  if (!found) {
    return left;
  }
  const Token & op_tok = found->second;
  const auto op = binary_op_from_string(op_tok.text());
  if (!op) {
    return fail(op_tok.range, fmt::format("Unknown operator: {}", op_tok.text()), "Unknown operator");
  }
  tokens_.peek_inc(found->first + 1);
  skip_trivia();

  auto right = parse_expression();
  if (right.failed()) {
    return ParseFailure{};
  }
  if (right.no_match()) {
    return fail(
      here(), "Expected an expression to follow an operation.", "An expression is expected here.");
  }
  return ast_.create<OperationExpr>(left, *op, right.value(), span_from(start));
}

Parsed<Expr *> AstGenerator::parse_binary_rhs(int min_precedence, Expr * lhs, uint32_t start)
{
  while (true) {
    const auto found = tokens_.find_after(kind_is(TokenKind::Operator), is_trivia);
    if (!found) {
      return lhs;
    }
    const Token & op_tok = found->second;
    const auto op = binary_op_from_string(op_tok.text());
    if (!op) {
      return fail(
        op_tok.range, fmt::format("Unknown operator: {}", op_tok.text()), "Unknown operator");
    }
    const int precedence = operator_precedence(*op);
    if (precedence < min_precedence) {
      return lhs;
    }
    tokens_.peek_inc(found->first + 1);
    skip_trivia();

    const uint32_t rhs_start = start_offset();
    auto rhs = parse_operand();
    if (rhs.failed()) {
      return ParseFailure{};
    }
    if (rhs.no_match()) {
      return fail(
        here(), "Expected an expression to follow an operation.",
        "An expression is expected here.");
    }

    // Fold tighter-binding operators (and right-associative ones) into the
    // right operand before combining with `lhs`.
    Expr * right = rhs.value();
    while (true) {
      const auto next_found = tokens_.find_after(kind_is(TokenKind::Operator), is_trivia);
      if (!next_found) {
        break;
      }
      const auto next = binary_op_from_string(next_found->second.text());
      if (!next) {
        break;  // reported by the outer loop
      }
      const int next_precedence = operator_precedence(*next);
      int deeper_min = 0;
      if (next_precedence > precedence) {
        deeper_min = precedence + 1;
      } else if (next_precedence == precedence && is_right_associative(*next)) {
        deeper_min = precedence;
      } else {
        break;
      }
      auto deeper = parse_binary_rhs(deeper_min, right, rhs_start);
      if (deeper.failed()) {
        return ParseFailure{};
      }
      right = deeper.value();
    }

    lhs = ast_.create<OperationExpr>(lhs, *op, right, span_from(start));
  }
}

Parsed<CallExpr *> AstGenerator::parse_call()
{
  if (!tokens_.first_if(kind_is(TokenKind::Identifier)) ||
      !tokens_.second_if(kind_is(TokenKind::LeftParen))) {
    return {};
  }
  const uint32_t start = start_offset();
  const auto name = tokens_.peek();
  (void)tokens_.peek();  // (

  auto args = parse_call_arguments(start);
  if (args.failed()) {
    return ParseFailure{};
  }
  return ast_.create<CallExpr>(intern(*name), freeze(args.value()), span_from(start));
}

Parsed<std::vector<Expr *>> AstGenerator::parse_call_arguments(uint32_t start)
{
  std::vector<Expr *> args;
  while (true) {
    if (!skip_trivia_required(start, "Function arguments must be closed.")) {
      return ParseFailure{};
    }
    if (tokens_.peek_if(kind_is(TokenKind::RightParen))) {
      return args;
    }

    auto arg = parse_expression();
    if (arg.failed()) {
      return ParseFailure{};
    }
    if (arg.no_match()) {
      return fail(
        here(), "Expected an expression to follow a function input.",
        "An expression is expected here.");
    }
    args.push_back(arg.value());

    if (!skip_trivia_required(start, "Function arguments must be closed.")) {
      return ParseFailure{};
    }
    if (tokens_.peek_if(kind_is(TokenKind::Comma)) ||
        tokens_.first_if(kind_is(TokenKind::RightParen))) {
      continue;
    }
    return fail(here(), "Expected a comma to follow a function input.", "A comma is expected here.");
  }
}

Parsed<MemberExpr *> AstGenerator::parse_member()
{
  if (!tokens_.first_if(kind_is(TokenKind::Identifier)) ||
      !tokens_.second_if(kind_is(TokenKind::Accessor))) {
    return {};
  }
  const uint32_t start = start_offset();
  const auto origin = tokens_.peek();
  const auto accessor = tokens_.peek();
  const MemberLookup lookup =
    accessor->text() == "::" ? MemberLookup::Static : MemberLookup::Dynamic;
  skip_trivia();

  // The legacy grammar reparses a full expression after the accessor, so
  // `a.b + c` becomes Member(a, b + c). With precedence climbing only the
  // operand is taken and the operator applies to the whole member access.
  auto member = options_.operator_policy == OperatorPolicy::RightRecursive ? parse_expression()
                                                                           : parse_operand();
  if (member.failed()) {
    return ParseFailure{};
  }
  if (member.no_match()) {
    return fail(
      here(), "Expected an expression to follow a property member.",
      "An expression was expected here.");
  }
  return ast_.create<MemberExpr>(
    intern(*origin), origin->range, lookup, member.value(), span_from(start));
}

Parsed<NewExpr *> AstGenerator::parse_new()
{
  if (!tokens_.first_if(keyword_is(KeyWord::New))) {
    return {};
  }
  const auto found = tokens_.find_after_nth(1, kind_is(TokenKind::Identifier), is_trivia);
  if (!found) {
    const auto second = tokens_.second();
    return fail(
      second ? second->range : here(), "Expected a name to follow a new expression.",
      "A name was expected here.");
  }
  const uint32_t start = start_offset();
  tokens_.peek_inc(found->first + 1);
  const Token & name = found->second;

  if (!tokens_.peek_if(kind_is(TokenKind::LeftParen))) {
    return fail(
      here(), "Expected a function call inputs to follow a new expression.",
      "Function inputs expected here.");
  }
  auto args = parse_call_arguments(start);
  if (args.failed()) {
    return ParseFailure{};
  }
  return ast_.create<NewExpr>(intern(name), freeze(args.value()), span_from(start));
}

Parsed<ArrayExpr *> AstGenerator::parse_array()
{
  if (!tokens_.first_if(kind_is(TokenKind::LeftBracket))) {
    return {};
  }
  const uint32_t start = start_offset();
  (void)tokens_.peek();

  std::vector<Expr *> elements;
  while (true) {
    if (!skip_trivia_required(start, "An array must be closed.")) {
      return ParseFailure{};
    }
    if (tokens_.peek_if(kind_is(TokenKind::RightBracket))) {
      break;
    }

    auto element = parse_expression();
    if (element.failed()) {
      return ParseFailure{};
    }
    if (element.no_match()) {
      return fail(
        here(), "Expected an expression to follow an array element.",
        fmt::format("Unexpected Token: {}", describe_next()));
    }
    elements.push_back(element.value());

    if (!skip_trivia_required(start, "An array must be closed.")) {
      return ParseFailure{};
    }
    if (tokens_.peek_if(kind_is(TokenKind::Comma)) ||
        tokens_.first_if(kind_is(TokenKind::RightBracket))) {
      continue;
    }
    return fail(
      here(), "A comma is required to separate array elements.", "A comma is expected here.");
  }

  return ast_.create<ArrayExpr>(freeze(elements), span_from(start));
}

Parsed<ObjectExpr *> AstGenerator::parse_object()
{
  if (!tokens_.first_if(kind_is(TokenKind::LeftBrace))) {
    return {};
  }
  const uint32_t start = start_offset();
  (void)tokens_.peek();

  std::vector<ObjectProperty *> properties;
  while (true) {
    if (!skip_trivia_required(start, "Object body must be closed.")) {
      return ParseFailure{};
    }
    if (tokens_.peek_if(kind_is(TokenKind::RightBrace))) {
      break;
    }

    const auto name = tokens_.peek_if(kind_is(TokenKind::Identifier));
    if (!name) {
      return fail(
        here(), "Expected an object property to follow an object element.",
        "An object property was expected here.");
    }
    skip_trivia();
    if (!tokens_.peek_if(kind_is(TokenKind::Colon))) {
      return fail(here(), "Expected a colon to follow a property name.", "A colon is expected here.");
    }
    skip_trivia();
    auto value = parse_expression();
    if (value.failed()) {
      return ParseFailure{};
    }
    if (value.no_match()) {
      return fail(
        here(), "Expected an expression to follow a property.", "An expression is expected here.");
    }
    properties.push_back(
      ast_.create<ObjectProperty>(intern(*name), value.value(), span_from(name->begin())));

    if (!skip_trivia_required(start, "Object body must be closed.")) {
      return ParseFailure{};
    }
    if (tokens_.peek_if(kind_is(TokenKind::Comma)) ||
        tokens_.first_if(kind_is(TokenKind::RightBrace))) {
      continue;
    }
    return fail(
      here(), "Expected a right brace to close an object body.",
      "A right brace was expected here.");
  }

  return ast_.create<ObjectExpr>(freeze(properties), span_from(start));
}

Parsed<LiteralExpr *> AstGenerator::parse_literal()
{
  const auto tok = tokens_.first();
  if (!tok) {
    return {};
  }
  LiteralKind kind{};
  switch (tok->kind) {
    case TokenKind::Identifier:
      kind = LiteralKind::Identifier;
      break;
    case TokenKind::Number:
      kind = LiteralKind::Number;
      break;
    case TokenKind::String:
      kind = LiteralKind::String;
      break;
    case TokenKind::Boolean:
      kind = LiteralKind::Boolean;
      break;
    default:
      return {};
  }
  (void)tokens_.peek();
  return ast_.create<LiteralExpr>(kind, intern(*tok), tok->range);
}

// ============================================================================
// Helpers
// ============================================================================

void AstGenerator::skip_trivia() { (void)tokens_.eat_while(is_trivia); }

bool AstGenerator::skip_trivia_required(uint32_t start, std::string_view message)
{
  skip_trivia();
  if (!tokens_.is_eof()) {
    return true;
  }
  (void)fail(span_from(start), std::string(message), "the input ends before this is complete");
  return false;
}

ParseFailure AstGenerator::fail(SourceRange range, std::string message, std::string label)
{
  Diagnostic diag;
  diag.severity = Severity::Error;
  diag.code = std::string(diag_codes::k_parse_error);
  diag.message = std::move(message);
  diag.labels.push_back(Label{range, std::move(label), LabelStyle::Primary});
  error_ = std::move(diag);
  return ParseFailure{};
}

std::optional<Visibility> AstGenerator::visibility_before(const TokenPredicate & next) const
{
  const auto head = tokens_.first();
  if (!head || !head->is_visibility()) {
    return std::nullopt;
  }
  if (!tokens_.find_after_nth(1, next, is_trivia)) {
    return std::nullopt;
  }
  return visibility_from_keyword(head->keyword);
}

uint32_t AstGenerator::start_offset() const
{
  if (const auto tok = tokens_.first()) {
    return tok->begin();
  }
  return end_offset();
}

uint32_t AstGenerator::end_offset() const
{
  const auto & prev = tokens_.prev();
  return prev ? prev->end() : 0;
}

SourceRange AstGenerator::here() const
{
  if (const auto tok = tokens_.first()) {
    return tok->range;
  }
  const uint32_t end = end_offset();
  return {file_, end, end};
}

SourceRange AstGenerator::span_from(uint32_t start) const
{
  const uint32_t end = end_offset();
  return {file_, start, end < start ? start : end};
}

std::string AstGenerator::describe_next() const
{
  if (const auto tok = tokens_.first()) {
    return std::string(to_string(tok->kind));
  }
  return "end of input";
}

// ============================================================================
// Free functions
// ============================================================================

ParseResult parse_source(
  std::string_view source, AstContext & ast, Context & context, ParserOptions options)
{
  AstGenerator generator(ast, context, options);
  return generator.begin_parse(TokenStream(tokenize(context.file_id(), source).tokens));
}

}  // namespace surn::syntax
