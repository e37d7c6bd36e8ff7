// recval/sema/value_semantics.hpp - Value-semantics classifier
//
// Decides whether equality derived from a type's members would compare
// content or identity. Rules, first match wins:
//
//   1. a nullable value wrapper is replaced by its underlying type
//      (no underlying type: Ok)
//   2. a type already visited in this call: Ok
//   3. object / dynamic: Failed
//   4. primitive, enum: Ok
//   5. inline array: Failed
//   6. known non-value wrapper: Failed, even with its own Equals(T)
//   7. non-tuples: own Equals(T) or Equals(object) override: Ok;
//      record: Ok (checked on its own); class: Failed
//   8. tuples and structs: classify members in order; the first non-Ok
//      member yields NestedFailed(member type), otherwise Ok
//   9. anything else: Failed
//
#pragma once

#include "recval/model/type_symbol.hpp"
#include "recval/sema/cycle_guard.hpp"
#include "recval/sema/type_provider.hpp"
#include "recval/sema/verdict.hpp"

namespace recval
{

/**
 * Stateless classifier; safe to share between threads as long as each
 * top-level call uses its own CycleGuard.
 */
class ValueSemanticsClassifier
{
public:
  /// Classify over the loaded TypeSymbol model
  ValueSemanticsClassifier();

  /// Classify through a custom provider, which must outlive the classifier
  explicit ValueSemanticsClassifier(const TypeDescriptorProvider & provider)
  : provider_(&provider)
  {
  }

  /// Classify a top-level member type with a fresh guard
  [[nodiscard]] Verdict classify(TypeRef type) const;

  /// Classify within an existing call tree
  [[nodiscard]] Verdict classify(TypeRef type, CycleGuard & guard) const;

  [[nodiscard]] const TypeDescriptorProvider & provider() const noexcept { return *provider_; }

private:
  const TypeDescriptorProvider * provider_;
};

}  // namespace recval
