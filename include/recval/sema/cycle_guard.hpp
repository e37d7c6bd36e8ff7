// recval/sema/cycle_guard.hpp - Visited-type set for one top-level classification
#pragma once

#include <cstddef>
#include <unordered_set>

#include "recval/model/type_symbol.hpp"

namespace recval
{

/**
 * Identity set bounding recursion over a possibly cyclic type graph.
 *
 * A guard lives for exactly one top-level classification and is never shared
 * between sibling members. It is call-scoped: a type stays visited for the
 * rest of the call tree, not only along the current path.
 */
class CycleGuard
{
public:
  /// @return true if `type` was not visited before
  bool add(TypeRef type) { return visited_.insert(type).second; }

  [[nodiscard]] bool contains(TypeRef type) const { return visited_.count(type) != 0; }
  [[nodiscard]] size_t size() const noexcept { return visited_.size(); }

private:
  std::unordered_set<TypeRef> visited_;
};

}  // namespace recval
