// recval/sema/type_provider.hpp - Type descriptor access for the classifier
//
// The classifier never inspects TypeSymbol directly. It asks a provider, so
// that the same decision procedure can run over any host type system.
//
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "recval/model/type_symbol.hpp"
#include "recval/sema/value_kind.hpp"

namespace recval
{

/**
 * A (name, type) pair in declaration order.
 */
struct TypeMember
{
  std::string_view name;
  TypeRef type = nullptr;
};

/**
 * Supplies everything the classifier needs to know about a type.
 *
 * Implementations must be deterministic: the same type always yields the same
 * kind, capabilities and member order.
 */
class TypeDescriptorProvider
{
public:
  virtual ~TypeDescriptorProvider() = default;

  [[nodiscard]] virtual ValueKind kind(TypeRef type) const = 0;
  [[nodiscard]] virtual EqualityCapability equality(TypeRef type) const = 0;

  [[nodiscard]] virtual bool is_nullable_value_wrapper(TypeRef type) const = 0;

  /// Underlying type of a nullable value wrapper, nullptr if there is none
  [[nodiscard]] virtual TypeRef unwrap(TypeRef type) const = 0;

  /// Instance fields and properties, in declaration order
  [[nodiscard]] virtual std::vector<TypeMember> members(TypeRef type) const = 0;

  /// Tuple elements, in order
  [[nodiscard]] virtual std::vector<TypeMember> tuple_elements(TypeRef type) const = 0;

  [[nodiscard]] virtual std::string display_name(TypeRef type) const = 0;
};

/**
 * Provider over the loaded TypeSymbol model.
 *
 * Static members are skipped: derived equality only compares instance state.
 * So `struct S { static object Cache; int X; }` is Ok, although a walk over
 * every declared member would report it as NestedFailed(object).
 */
class SymbolTypeProvider : public TypeDescriptorProvider
{
public:
  [[nodiscard]] ValueKind kind(TypeRef type) const override;
  [[nodiscard]] EqualityCapability equality(TypeRef type) const override;
  [[nodiscard]] bool is_nullable_value_wrapper(TypeRef type) const override;
  [[nodiscard]] TypeRef unwrap(TypeRef type) const override;
  [[nodiscard]] std::vector<TypeMember> members(TypeRef type) const override;
  [[nodiscard]] std::vector<TypeMember> tuple_elements(TypeRef type) const override;
  [[nodiscard]] std::string display_name(TypeRef type) const override;
};

}  // namespace recval
