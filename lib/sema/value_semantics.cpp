// recval/sema/value_semantics.cpp - Value-semantics classifier

#include "recval/sema/value_semantics.hpp"

#include <optional>
#include <vector>

namespace recval
{

std::string_view to_string(VerdictKind kind) noexcept
{
  switch (kind) {
    case VerdictKind::Ok:
      return "Ok";
    case VerdictKind::Failed:
      return "Failed";
    case VerdictKind::NestedFailed:
      return "NestedFailed";
  }
  return "Unknown";
}

namespace
{

const SymbolTypeProvider & symbol_provider()
{
  static const SymbolTypeProvider provider;
  return provider;
}

}  // namespace

ValueSemanticsClassifier::ValueSemanticsClassifier() : provider_(&symbol_provider()) {}

Verdict ValueSemanticsClassifier::classify(TypeRef type) const
{
  CycleGuard guard;
  return classify(type, guard);
}

Verdict ValueSemanticsClassifier::classify(TypeRef type, CycleGuard & guard) const
{
  const TypeDescriptorProvider & p = *provider_;

  if (p.is_nullable_value_wrapper(type)) {
    type = p.unwrap(type);
  }
  if (type == nullptr) {
    return Verdict::ok();
  }

  if (!guard.add(type)) {
    return Verdict::ok();
  }

  const ValueKind kind = p.kind(type);
  switch (kind) {
    case ValueKind::UntypedOrUniversalBase:
      return Verdict::failed();
    case ValueKind::Primitive:
    case ValueKind::EnumLike:
      return Verdict::ok();
    case ValueKind::FixedSizeBufferOverlay:
    case ValueKind::KnownNonValueWrapper:
      return Verdict::failed();
    default:
      break;
  }

  if (kind != ValueKind::HeterogeneousFixedTuple) {
    const EqualityCapability caps = p.equality(type);
    if (caps.has_own_value_equals || caps.has_own_identity_equals_override) {
      return Verdict::ok();
    }
    if (kind == ValueKind::DerivedEqualityComposite) {
      return Verdict::ok();
    }
    if (kind == ValueKind::ReferenceComposite) {
      return Verdict::failed();
    }
  }

  std::optional<std::vector<TypeMember>> members;
  if (kind == ValueKind::HeterogeneousFixedTuple) {
    members = p.tuple_elements(type);
  } else if (kind == ValueKind::ValueComposite) {
    members = p.members(type);
  }

  if (!members) {
    return Verdict::failed();
  }

  for (const auto & m : *members) {
    if (m.type == nullptr) continue;
    if (!classify(m.type, guard).is_ok()) {
      return Verdict::nested(p.display_name(m.type));
    }
  }
  return Verdict::ok();
}

}  // namespace recval
