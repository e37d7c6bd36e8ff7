// recval/sema/value_kind.hpp - Value-semantics kind of a type and its equality capabilities
//
// Every type the classifier sees is reduced to exactly one ValueKind. The many
// overlapping facts of the host type system (special type, category,
// attributes, generic origin, record flag) are folded into this single tag by
// the kind resolver, so each tie-break lives in one table.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace recval
{

enum class ValueKind : uint8_t {
  Primitive,                 ///< numeric, bool, char, string
  EnumLike,                  ///< any enumeration, flag-style included
  UntypedOrUniversalBase,    ///< object, dynamic
  FixedSizeBufferOverlay,    ///< inline array struct
  KnownNonValueWrapper,      ///< ArraySegment<T>, Memory<T>, ImmutableArray<T>, ...
  HeterogeneousFixedTuple,   ///< (A, B)
  DerivedEqualityComposite,  ///< record class / record struct
  ReferenceComposite,        ///< plain class
  ValueComposite,            ///< plain struct
  TypeParameterOrOther,      ///< type parameters, interfaces, arrays, delegates, ...
};

[[nodiscard]] std::string_view to_string(ValueKind kind) noexcept;

/**
 * Equality methods a type declares itself.
 */
struct EqualityCapability
{
  /// Equals(T) declared on the type: instance, non-abstract, not an override
  bool has_own_value_equals = false;

  /// Equals(object) override declared on the type
  bool has_own_identity_equals_override = false;

  [[nodiscard]] bool any() const noexcept
  {
    return has_own_value_equals || has_own_identity_equals_override;
  }
};

}  // namespace recval
