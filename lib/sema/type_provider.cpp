// recval/sema/type_provider.cpp - TypeSymbol-backed descriptor provider

#include "recval/sema/type_provider.hpp"

#include "recval/sema/kind_resolver.hpp"

namespace recval
{

namespace
{

std::vector<TypeMember> collect(gsl::span<const MemberSymbol> list, bool skip_static)
{
  std::vector<TypeMember> out;
  out.reserve(list.size());
  for (const auto & m : list) {
    if (skip_static && m.is_static) continue;
    out.push_back(TypeMember{m.name, m.type});
  }
  return out;
}

}  // namespace

ValueKind SymbolTypeProvider::kind(TypeRef type) const
{
  if (type == nullptr) return ValueKind::TypeParameterOrOther;
  return resolve_value_kind(*type);
}

EqualityCapability SymbolTypeProvider::equality(TypeRef type) const
{
  if (type == nullptr) return {};
  return resolve_equality_capability(*type);
}

bool SymbolTypeProvider::is_nullable_value_wrapper(TypeRef type) const
{
  return type != nullptr && type->is_nullable_value_wrapper();
}

TypeRef SymbolTypeProvider::unwrap(TypeRef type) const
{
  if (!is_nullable_value_wrapper(type)) return nullptr;
  return unwrap_nullable(type);
}

std::vector<TypeMember> SymbolTypeProvider::members(TypeRef type) const
{
  if (type == nullptr) return {};
  return collect(type->member_list(), true);
}

std::vector<TypeMember> SymbolTypeProvider::tuple_elements(TypeRef type) const
{
  if (type == nullptr) return {};
  return collect(type->tuple_element_list(), false);
}

std::string SymbolTypeProvider::display_name(TypeRef type) const
{
  return type != nullptr ? type->name : std::string("UNKNOWN");
}

}  // namespace recval
