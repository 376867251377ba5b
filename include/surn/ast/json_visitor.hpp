// surn/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Machine-readable AST dump used by `surnc parse --dump-json` and by tests
// that compare tree shapes.
//
#pragma once

#include <nlohmann/json.hpp>

#include "surn/ast/ast.hpp"

namespace surn
{

/**
 * Serialize an AST node and its subtree to JSON.
 *
 * Every object has a "type" (the node class name) and a "range"
 * ({"start", "end"} byte offsets, both null when unknown). A null node yields
 * JSON null.
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/// Serialize a whole file: {"type": "AstBody", "program": [...]}
[[nodiscard]] nlohmann::json to_json(const AstBody & body);

}  // namespace surn
