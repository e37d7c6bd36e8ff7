// recval/model/type_symbol.hpp - Raw type information of the host type system
//
// A TypeSymbol is a read-only snapshot of what the host type system knows
// about one type. Symbols are owned by a TypeSymbolTable and referenced by
// pointer; pointer identity is type identity.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <gsl/span>
#include <string>
#include <string_view>
#include <vector>

namespace recval
{

struct TypeSymbol;

/// Handle to a type in the host type system. nullptr means "absent".
using TypeRef = const TypeSymbol *;

// ============================================================================
// Type Category / Special Type
// ============================================================================

/**
 * Declaration category of a type, as the host type system reports it.
 */
enum class TypeCategory : uint8_t {
  Class,
  Struct,
  Interface,
  Enum,
  Delegate,
  Array,
  Pointer,
  TypeParameter,
  Dynamic,
  Error,
};

/**
 * Well-known built-in types.
 */
enum class SpecialType : uint8_t {
  None,
  Object,
  Void,
  Boolean,
  Char,
  SByte,
  Byte,
  Int16,
  UInt16,
  Int32,
  UInt32,
  Int64,
  UInt64,
  Single,
  Double,
  Decimal,
  String,
};

[[nodiscard]] std::string_view to_string(TypeCategory category) noexcept;

/// Parse a model "kind" keyword (class, struct, interface, enum, delegate)
[[nodiscard]] bool parse_type_category(std::string_view text, TypeCategory & out) noexcept;

// ============================================================================
// Members
// ============================================================================

enum class MemberKind : uint8_t {
  Field,
  Property,
  TupleElement,
};

/**
 * A field, property or tuple element. Tuple elements may be unnamed.
 */
struct MemberSymbol
{
  std::string name;
  TypeRef type = nullptr;
  MemberKind kind = MemberKind::Field;
  bool is_static = false;
};

struct ParameterSymbol
{
  std::string name;
  TypeRef type = nullptr;
};

/**
 * A method declared directly on a type.
 *
 * `declaring_type` is the type whose declaration contains the method body; a
 * method copied into an instantiation keeps the instantiation as declaring type.
 */
struct MethodSymbol
{
  std::string name;
  TypeRef return_type = nullptr;
  std::vector<ParameterSymbol> parameters;
  TypeRef declaring_type = nullptr;

  bool is_static = false;
  bool is_override = false;
  bool is_abstract = false;
  bool is_compiler_generated = false;
};

// ============================================================================
// TypeSymbol
// ============================================================================

struct TypeSymbol
{
  std::string name;
  TypeCategory category = TypeCategory::Class;
  SpecialType special = SpecialType::None;

  bool is_record = false;
  bool is_readonly = false;
  bool is_tuple = false;

  /// For a nullable value wrapper (T? over a value type): the wrapped type
  TypeRef nullable_underlying = nullptr;

  /// For arrays: the element type
  TypeRef element_type = nullptr;

  /// Display name of the generic definition, e.g. "System.ArraySegment<T>"
  std::string original_definition;

  /// Generic definitions: parameter names. Instantiations: the arguments.
  std::vector<std::string> type_parameters;
  std::vector<TypeRef> type_arguments;

  /// For instantiations: the generic definition they were created from
  TypeRef generic_definition = nullptr;

  /// For instantiations: generic nesting depth (List<int> is 1, List<List<int>> is 2)
  size_t instantiation_depth = 0;

  /// For type parameters: the generic definition declaring them
  TypeRef owner = nullptr;

  std::vector<std::string> attributes;
  std::vector<MemberSymbol> members;
  std::vector<MemberSymbol> tuple_elements;
  std::vector<MethodSymbol> methods;

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] bool is_value_type() const noexcept
  {
    return category == TypeCategory::Struct || category == TypeCategory::Enum ||
           (special != SpecialType::None && special != SpecialType::Object &&
            special != SpecialType::String && special != SpecialType::Void);
  }

  [[nodiscard]] bool is_nullable_value_wrapper() const noexcept
  {
    return nullable_underlying != nullptr;
  }

  [[nodiscard]] bool is_generic_definition() const noexcept
  {
    return !type_parameters.empty() && type_arguments.empty();
  }

  [[nodiscard]] bool has_attribute(std::string_view attribute) const noexcept;

  [[nodiscard]] gsl::span<const MemberSymbol> member_list() const noexcept
  {
    return {members.data(), members.size()};
  }

  [[nodiscard]] gsl::span<const MemberSymbol> tuple_element_list() const noexcept
  {
    return {tuple_elements.data(), tuple_elements.size()};
  }
};

}  // namespace recval
