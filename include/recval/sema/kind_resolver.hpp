// recval/sema/kind_resolver.hpp - Kind and equality capability resolution
#pragma once

#include <string_view>

#include "recval/model/type_symbol.hpp"
#include "recval/sema/value_kind.hpp"

namespace recval
{

/// Attribute marking a struct as a fixed-size inline buffer
inline constexpr std::string_view k_inline_array_attribute =
  "System.Runtime.CompilerServices.InlineArrayAttribute";

/**
 * Is `original_definition` one of the standard wrappers whose default equality
 * compares the identity of an underlying buffer instead of its contents?
 */
[[nodiscard]] bool is_known_non_value_wrapper(std::string_view original_definition) noexcept;

/**
 * Compute the ValueKind of a type. First match wins:
 *
 *   object / dynamic                       -> UntypedOrUniversalBase
 *   bool, char, integers, floats, string   -> Primitive
 *   enum                                   -> EnumLike
 *   struct with InlineArrayAttribute       -> FixedSizeBufferOverlay
 *   known non-value wrapper definition     -> KnownNonValueWrapper
 *   tuple                                  -> HeterogeneousFixedTuple
 *   record                                 -> DerivedEqualityComposite
 *   class                                  -> ReferenceComposite
 *   struct                                 -> ValueComposite
 *   anything else                          -> TypeParameterOrOther
 *
 * @pre type != nullptr
 */
[[nodiscard]] ValueKind resolve_value_kind(const TypeSymbol & type) noexcept;

/**
 * Compute the equality methods declared directly on a type.
 *
 * Tuples never report a capability; only their elements matter.
 */
[[nodiscard]] EqualityCapability resolve_equality_capability(const TypeSymbol & type) noexcept;

/// Underlying type of a nullable value wrapper; the type itself otherwise
[[nodiscard]] TypeRef unwrap_nullable(TypeRef type) noexcept;

}  // namespace recval
