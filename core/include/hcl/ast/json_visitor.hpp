// hcl/ast/json_visitor.hpp - JSON serialization for the document model
//
// Produces a tagged JSON tree ({"type": "...", ...}) mirroring the model. Used
// by `hclfmt --json` and by tooling that wants a language-neutral dump.
//
#pragma once

#include <nlohmann/json.hpp>

#include "hcl/ast/expr.hpp"
#include "hcl/ast/structure.hpp"

namespace hcl
{

/**
 * Serialize a body including all nested structures.
 *
 * @param body The body to serialize
 * @return JSON object with "type": "Body" and a "structures" array
 */
[[nodiscard]] nlohmann::json to_json(const Body & body);

/// Serialize a single attribute or block.
[[nodiscard]] nlohmann::json to_json(const Structure & structure);

/// Serialize an expression.
[[nodiscard]] nlohmann::json to_json(const Expression & expr);

/// Serialize a template.
[[nodiscard]] nlohmann::json to_json(const Template & tmpl);

}  // namespace hcl
