// recval/sema/explain.hpp - JSON report of how a type is classified
//
// Shows the resolved kind, the equality capabilities and the verdict of a
// type and of each of its direct members:
//
//   { "type": "StructA", "kind": "ValueComposite",
//     "capabilities": { "value_equals": false, "identity_equals_override": false },
//     "verdict": { "kind": "NestedFailed", "inner": "int[]" },
//     "members": [ { "name": "Numbers", "type": "int[]", "kind": "TypeParameterOrOther",
//                    "verdict": { "kind": "Failed" } } ] }
//
#pragma once

#include <nlohmann/json.hpp>

#include "recval/model/type_symbol.hpp"
#include "recval/sema/value_semantics.hpp"

namespace recval
{

/**
 * Serialize the classification of a type.
 *
 * Each member is classified as its own top-level call, so a member verdict
 * never depends on its siblings.
 *
 * @pre type != nullptr
 */
[[nodiscard]] nlohmann::json explain_to_json(
  TypeRef type, const ValueSemanticsClassifier & classifier = ValueSemanticsClassifier{});

/// Serialize a verdict: { "kind": ..., "inner": ... }
[[nodiscard]] nlohmann::json to_json(const Verdict & verdict);

}  // namespace recval
