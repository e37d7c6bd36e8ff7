// recval/model/symbol_table.hpp - Owner of all type symbols of one model
//
// Registers the built-in types, interns derived types (nullable wrappers,
// arrays, tuples, generic instantiations) and resolves type expressions.
//
#pragma once

#include <cstddef>
#include <deque>
#include <memory_resource>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "recval/model/type_expr.hpp"
#include "recval/model/type_symbol.hpp"

namespace recval
{

/// Deepest generic nesting instantiate() accepts; `Node<T>` holding a
/// `Node<Node<T>>` would otherwise expand forever
inline constexpr size_t k_max_instantiation_depth = 16;

/// Transparent hash functor for string_view heterogeneous lookup
struct SymbolNameHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct SymbolNameEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

/**
 * Type symbol table.
 *
 * Every TypeSymbol handed out lives as long as the table and never moves.
 * Derived types are interned by the identities of their parts, so asking
 * twice for `int?` yields the same TypeRef, while `T[]` of two different
 * generic definitions stays distinct.
 */
class TypeSymbolTable
{
public:
  TypeSymbolTable();

  TypeSymbolTable(const TypeSymbolTable &) = delete;
  TypeSymbolTable & operator=(const TypeSymbolTable &) = delete;

  // ===========================================================================
  // Declaration
  // ===========================================================================

  /**
   * Declare a named type.
   *
   * Generic types are declared with their parameter names and get the display
   * name `Name<T, U>`.
   *
   * @return the new symbol, or nullptr if the name is already taken
   */
  TypeSymbol * declare(
    std::string_view name, TypeCategory category, std::vector<std::string> type_parameters = {});

  /// Mutable access to a symbol declared through this table
  [[nodiscard]] TypeSymbol * get_mutable(TypeRef type) noexcept;

  // ===========================================================================
  // Lookup
  // ===========================================================================

  /// Look up a non-generic type (or a generic definition by display name), resolving aliases
  [[nodiscard]] TypeRef lookup(std::string_view name) const;

  /// Look up a generic definition by base name and arity
  [[nodiscard]] TypeRef lookup_generic(std::string_view base_name, size_t arity) const;

  [[nodiscard]] TypeRef object_type() const noexcept { return object_; }
  [[nodiscard]] TypeRef bool_type() const noexcept { return bool_; }

  // ===========================================================================
  // Derived Types (Interned)
  // ===========================================================================

  /// T? : a nullable wrapper for value types, the type itself for reference types
  TypeRef nullable_of(TypeRef base);

  /// T[]
  TypeRef array_of(TypeRef element);

  /// (A a, B b). `names` may be shorter than `elements`.
  TypeRef tuple_of(const std::vector<TypeRef> & elements, const std::vector<std::string> & names);

  /// Type parameter `name` declared by `owner`
  TypeRef type_parameter(TypeRef owner, std::string_view name);

  /**
   * Instantiate a generic definition.
   *
   * The instance is interned immediately; its members and methods are filled
   * in by complete_instantiations(), once every definition is fully resolved.
   *
   * @return nullptr if the instance would nest deeper than
   *         k_max_instantiation_depth (the definition is then listed by
   *         depth_limited())
   */
  TypeRef instantiate(TypeRef definition, const std::vector<TypeRef> & arguments);

  /**
   * Fill members and methods of every pending instantiation by substituting
   * type arguments into the definition. New instantiations discovered while
   * substituting are completed as well.
   *
   * @return number of instantiations completed
   */
  size_t complete_instantiations();

  /// Generic definitions whose expansion was cut at k_max_instantiation_depth
  [[nodiscard]] const std::vector<std::string> & depth_limited() const noexcept
  {
    return depth_limited_;
  }

  // ===========================================================================
  // Resolution
  // ===========================================================================

  /**
   * Resolve a type expression.
   *
   * Names matching a type parameter of `context` (a generic definition)
   * resolve to that parameter.
   *
   * @return the type, or nullptr with `error` set
   */
  TypeRef resolve(const TypeExpr & expr, TypeRef context, std::string & error);

  [[nodiscard]] size_t size() const noexcept { return symbols_.size(); }

private:
  using SubstitutionMap = std::unordered_map<TypeRef, TypeRef>;

  TypeSymbol & create(TypeSymbol symbol);
  void register_builtins();
  TypeSymbol * register_builtin(std::string_view name, SpecialType special, TypeCategory category);
  TypeSymbol * register_generic(
    std::string_view name, TypeCategory category, std::vector<std::string> params);
  void add_self_equals(TypeSymbol & type);
  void add_alias(std::string_view alias, std::string_view canonical);

  TypeRef substitute(TypeRef type, const SubstitutionMap & map);

  // Arena for symbols; element addresses are handed out widely and must be stable
  std::pmr::monotonic_buffer_resource arena_{16384};
  std::pmr::deque<TypeSymbol> symbols_{&arena_};

  std::unordered_map<std::string, TypeSymbol *, SymbolNameHash, SymbolNameEqual> by_name_;
  std::unordered_map<std::string, TypeSymbol *, SymbolNameHash, SymbolNameEqual> generics_;
  std::unordered_map<std::string, std::string, SymbolNameHash, SymbolNameEqual> aliases_;
  std::unordered_map<std::string, TypeSymbol *, SymbolNameHash, SymbolNameEqual> derived_;

  std::vector<TypeSymbol *> pending_instantiations_;
  std::vector<std::string> depth_limited_;

  TypeRef object_ = nullptr;
  TypeRef bool_ = nullptr;
};

/// Name without generic argument list: "System.ArraySegment<T>" -> "System.ArraySegment"
[[nodiscard]] std::string_view generic_base_name(std::string_view display_name) noexcept;

}  // namespace recval
