// recval/sema/kind_resolver.cpp - Kind and equality capability resolution

#include "recval/sema/kind_resolver.hpp"

#include <algorithm>
#include <array>

namespace recval
{

std::string_view to_string(ValueKind kind) noexcept
{
  switch (kind) {
    case ValueKind::Primitive:
      return "Primitive";
    case ValueKind::EnumLike:
      return "EnumLike";
    case ValueKind::UntypedOrUniversalBase:
      return "UntypedOrUniversalBase";
    case ValueKind::FixedSizeBufferOverlay:
      return "FixedSizeBufferOverlay";
    case ValueKind::KnownNonValueWrapper:
      return "KnownNonValueWrapper";
    case ValueKind::HeterogeneousFixedTuple:
      return "HeterogeneousFixedTuple";
    case ValueKind::DerivedEqualityComposite:
      return "DerivedEqualityComposite";
    case ValueKind::ReferenceComposite:
      return "ReferenceComposite";
    case ValueKind::ValueComposite:
      return "ValueComposite";
    case ValueKind::TypeParameterOrOther:
      return "TypeParameterOrOther";
  }
  return "Unknown";
}

namespace
{

constexpr std::array<std::string_view, 4> k_non_value_wrappers = {
  "System.ArraySegment<T>",
  "System.Memory<T>",
  "System.ReadOnlyMemory<T>",
  "System.Collections.Immutable.ImmutableArray<T>",
};

bool is_primitive(SpecialType special) noexcept
{
  switch (special) {
    case SpecialType::Boolean:
    case SpecialType::Char:
    case SpecialType::SByte:
    case SpecialType::Byte:
    case SpecialType::Int16:
    case SpecialType::UInt16:
    case SpecialType::Int32:
    case SpecialType::UInt32:
    case SpecialType::Int64:
    case SpecialType::UInt64:
    case SpecialType::Single:
    case SpecialType::Double:
    case SpecialType::Decimal:
    case SpecialType::String:
      return true;
    default:
      return false;
  }
}

bool is_equals_candidate(const MethodSymbol & m, const TypeSymbol & type) noexcept
{
  return m.name == "Equals" && m.parameters.size() == 1 && !m.is_static &&
         m.declaring_type == &type;
}

bool accepts_self(const ParameterSymbol & p, const TypeSymbol & type) noexcept
{
  if (p.type == &type) return true;
  // S? for a value composite S
  return type.category == TypeCategory::Struct && p.type != nullptr &&
         p.type->nullable_underlying == &type;
}

}  // namespace

bool is_known_non_value_wrapper(std::string_view original_definition) noexcept
{
  return std::find(
           k_non_value_wrappers.begin(), k_non_value_wrappers.end(), original_definition) !=
         k_non_value_wrappers.end();
}

ValueKind resolve_value_kind(const TypeSymbol & type) noexcept
{
  if (type.special == SpecialType::Object || type.category == TypeCategory::Dynamic) {
    return ValueKind::UntypedOrUniversalBase;
  }
  if (is_primitive(type.special)) {
    return ValueKind::Primitive;
  }
  if (type.category == TypeCategory::Enum) {
    return ValueKind::EnumLike;
  }
  if (type.category == TypeCategory::Struct && type.has_attribute(k_inline_array_attribute)) {
    return ValueKind::FixedSizeBufferOverlay;
  }
  if (is_known_non_value_wrapper(type.original_definition)) {
    return ValueKind::KnownNonValueWrapper;
  }
  if (type.is_tuple) {
    return ValueKind::HeterogeneousFixedTuple;
  }
  if (type.is_record) {
    return ValueKind::DerivedEqualityComposite;
  }
  if (type.category == TypeCategory::Class) {
    return ValueKind::ReferenceComposite;
  }
  if (type.category == TypeCategory::Struct) {
    return ValueKind::ValueComposite;
  }
  return ValueKind::TypeParameterOrOther;
}

EqualityCapability resolve_equality_capability(const TypeSymbol & type) noexcept
{
  EqualityCapability caps;
  if (type.is_tuple) {
    return caps;
  }

  for (const auto & m : type.methods) {
    if (!is_equals_candidate(m, type)) continue;

    const ParameterSymbol & param = m.parameters.front();
    if (!m.is_override && !m.is_abstract && accepts_self(param, type)) {
      caps.has_own_value_equals = true;
    }
    if (m.is_override && param.type != nullptr && param.type->special == SpecialType::Object) {
      caps.has_own_identity_equals_override = true;
    }
  }
  return caps;
}

TypeRef unwrap_nullable(TypeRef type) noexcept
{
  if (type != nullptr && type->is_nullable_value_wrapper()) {
    return type->nullable_underlying;
  }
  return type;
}

}  // namespace recval
