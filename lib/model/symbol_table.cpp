// recval/model/symbol_table.cpp - Type symbol table implementation
//
#include "recval/model/symbol_table.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

namespace recval
{

namespace
{

std::string generic_key(std::string_view base_name, size_t arity)
{
  return std::string(base_name) + "`" + std::to_string(arity);
}

std::string generic_display_name(std::string_view base_name, const std::vector<std::string> & params)
{
  std::string out(base_name);
  out += '<';
  for (size_t i = 0; i < params.size(); ++i) {
    if (i > 0) out += ", ";
    out += params[i];
  }
  out += '>';
  return out;
}

/// Interning key part for a component type. Display names are ambiguous
/// (two definitions may both declare `T`), identities are not.
std::string identity_key(TypeRef type)
{
  return std::to_string(reinterpret_cast<std::uintptr_t>(type));
}

/// Deepest generic instantiation reachable through wrappers, arrays and tuples
size_t nesting_depth(TypeRef type)
{
  if (type == nullptr) return 0;
  if (type->nullable_underlying != nullptr) return nesting_depth(type->nullable_underlying);
  if (type->element_type != nullptr) return nesting_depth(type->element_type);
  if (type->is_tuple) {
    size_t depth = 0;
    for (const auto & e : type->tuple_elements) {
      depth = std::max(depth, nesting_depth(e.type));
    }
    return depth;
  }
  return type->instantiation_depth;
}

}  // namespace

std::string_view generic_base_name(std::string_view display_name) noexcept
{
  const size_t lt = display_name.find('<');
  return lt == std::string_view::npos ? display_name : display_name.substr(0, lt);
}

TypeSymbolTable::TypeSymbolTable() { register_builtins(); }

TypeSymbol & TypeSymbolTable::create(TypeSymbol symbol)
{
  symbols_.push_back(std::move(symbol));
  return symbols_.back();
}

// ============================================================================
// Built-ins
// ============================================================================

TypeSymbol * TypeSymbolTable::register_builtin(
  std::string_view name, SpecialType special, TypeCategory category)
{
  TypeSymbol sym;
  sym.name = std::string(name);
  sym.special = special;
  sym.category = category;
  TypeSymbol & created = create(std::move(sym));
  by_name_.emplace(created.name, &created);
  return &created;
}

TypeSymbol * TypeSymbolTable::register_generic(
  std::string_view name, TypeCategory category, std::vector<std::string> params)
{
  TypeSymbol * sym = declare(name, category, std::move(params));
  add_alias(name.substr(name.rfind('.') + 1), name);
  return sym;
}

void TypeSymbolTable::add_self_equals(TypeSymbol & type)
{
  MethodSymbol equals;
  equals.name = "Equals";
  equals.return_type = bool_;
  equals.parameters.push_back(ParameterSymbol{"other", &type});
  equals.declaring_type = &type;
  type.methods.push_back(std::move(equals));
}

void TypeSymbolTable::add_alias(std::string_view alias, std::string_view canonical)
{
  if (alias == canonical) return;
  aliases_.emplace(std::string(alias), std::string(canonical));
}

void TypeSymbolTable::register_builtins()
{
  object_ = register_builtin("object", SpecialType::Object, TypeCategory::Class);
  register_builtin("dynamic", SpecialType::None, TypeCategory::Dynamic);
  register_builtin("void", SpecialType::Void, TypeCategory::Struct);
  bool_ = register_builtin("bool", SpecialType::Boolean, TypeCategory::Struct);
  register_builtin("char", SpecialType::Char, TypeCategory::Struct);
  register_builtin("sbyte", SpecialType::SByte, TypeCategory::Struct);
  register_builtin("byte", SpecialType::Byte, TypeCategory::Struct);
  register_builtin("short", SpecialType::Int16, TypeCategory::Struct);
  register_builtin("ushort", SpecialType::UInt16, TypeCategory::Struct);
  register_builtin("int", SpecialType::Int32, TypeCategory::Struct);
  register_builtin("uint", SpecialType::UInt32, TypeCategory::Struct);
  register_builtin("long", SpecialType::Int64, TypeCategory::Struct);
  register_builtin("ulong", SpecialType::UInt64, TypeCategory::Struct);
  register_builtin("float", SpecialType::Single, TypeCategory::Struct);
  register_builtin("double", SpecialType::Double, TypeCategory::Struct);
  register_builtin("decimal", SpecialType::Decimal, TypeCategory::Struct);
  register_builtin("string", SpecialType::String, TypeCategory::Class);

  add_alias("System.Object", "object");
  add_alias("System.Void", "void");
  add_alias("System.Boolean", "bool");
  add_alias("System.Char", "char");
  add_alias("System.SByte", "sbyte");
  add_alias("System.Byte", "byte");
  add_alias("System.Int16", "short");
  add_alias("System.UInt16", "ushort");
  add_alias("System.Int32", "int");
  add_alias("System.UInt32", "uint");
  add_alias("System.Int64", "long");
  add_alias("System.UInt64", "ulong");
  add_alias("System.Single", "float");
  add_alias("System.Double", "double");
  add_alias("System.Decimal", "decimal");
  add_alias("System.String", "string");

  // Value structs of the base library that declare Equals(T)
  for (const char * name : {"System.DateTime", "System.DateTimeOffset", "System.TimeSpan",
                            "System.Guid", "System.DateOnly", "System.TimeOnly"}) {
    TypeSymbol * sym = declare(name, TypeCategory::Struct);
    add_self_equals(*sym);
    add_alias(std::string_view(name).substr(7), name);
  }

  // Wrappers over a buffer; their Equals(T) compares the buffer reference
  for (const char * name : {"System.ArraySegment", "System.Memory", "System.ReadOnlyMemory",
                            "System.Collections.Immutable.ImmutableArray"}) {
    TypeSymbol * sym = register_generic(name, TypeCategory::Struct, {"T"});
    add_self_equals(*sym);
  }

  register_generic("System.Collections.Generic.List", TypeCategory::Class, {"T"});
  register_generic("System.Collections.Generic.HashSet", TypeCategory::Class, {"T"});
  register_generic("System.Collections.Generic.Dictionary", TypeCategory::Class, {"TKey", "TValue"});
  register_generic("System.Collections.Generic.IEnumerable", TypeCategory::Interface, {"T"});
  register_generic("System.Collections.Generic.IReadOnlyList", TypeCategory::Interface, {"T"});
  register_generic("System.Collections.Generic.IList", TypeCategory::Interface, {"T"});
  register_generic("System.Func", TypeCategory::Delegate, {"TResult"});
  register_generic("System.Action", TypeCategory::Delegate, {"T"});
}

// ============================================================================
// Declaration / Lookup
// ============================================================================

TypeSymbol * TypeSymbolTable::declare(
  std::string_view name, TypeCategory category, std::vector<std::string> type_parameters)
{
  const std::string_view base = generic_base_name(name);

  if (type_parameters.empty()) {
    if (by_name_.find(base) != by_name_.end()) {
      return nullptr;
    }
    TypeSymbol sym;
    sym.name = std::string(base);
    sym.category = category;
    TypeSymbol & created = create(std::move(sym));
    by_name_.emplace(created.name, &created);
    return &created;
  }

  std::string key = generic_key(base, type_parameters.size());
  if (generics_.find(key) != generics_.end()) {
    return nullptr;
  }

  TypeSymbol sym;
  sym.name = generic_display_name(base, type_parameters);
  sym.category = category;
  sym.type_parameters = std::move(type_parameters);
  TypeSymbol & created = create(std::move(sym));
  generics_.emplace(std::move(key), &created);
  by_name_.emplace(created.name, &created);
  return &created;
}

TypeSymbol * TypeSymbolTable::get_mutable(TypeRef type) noexcept
{
  // Every TypeRef handed out by this table points into symbols_
  return const_cast<TypeSymbol *>(type);
}

TypeRef TypeSymbolTable::lookup(std::string_view name) const
{
  // Declared names shadow aliases
  auto it = by_name_.find(name);
  if (it != by_name_.end()) {
    return it->second;
  }

  auto alias_it = aliases_.find(name);
  if (alias_it == aliases_.end()) {
    return nullptr;
  }
  it = by_name_.find(std::string_view(alias_it->second));
  return it != by_name_.end() ? it->second : nullptr;
}

TypeRef TypeSymbolTable::lookup_generic(std::string_view base_name, size_t arity) const
{
  auto it = generics_.find(generic_key(base_name, arity));
  if (it != generics_.end()) {
    return it->second;
  }

  auto alias_it = aliases_.find(base_name);
  if (alias_it == aliases_.end()) {
    return nullptr;
  }
  it = generics_.find(generic_key(alias_it->second, arity));
  return it != generics_.end() ? it->second : nullptr;
}

// ============================================================================
// Derived Types
// ============================================================================

TypeRef TypeSymbolTable::nullable_of(TypeRef base)
{
  if (base == nullptr) return nullptr;

  // Nullable reference annotations do not change the type. Neither does `T?`
  // on an unconstrained type parameter: for T = int it denotes int.
  if (!base->is_value_type() || base->is_nullable_value_wrapper()) {
    return base;
  }

  std::string key = "?" + identity_key(base);
  auto it = derived_.find(key);
  if (it != derived_.end()) {
    return it->second;
  }

  TypeSymbol sym;
  sym.name = base->name + "?";
  sym.category = TypeCategory::Struct;
  sym.nullable_underlying = base;
  sym.original_definition = "System.Nullable<T>";
  sym.type_arguments.push_back(base);
  TypeSymbol & created = create(std::move(sym));
  derived_.emplace(std::move(key), &created);
  return &created;
}

TypeRef TypeSymbolTable::array_of(TypeRef element)
{
  if (element == nullptr) return nullptr;

  std::string key = "[]" + identity_key(element);
  auto it = derived_.find(key);
  if (it != derived_.end()) {
    return it->second;
  }

  TypeSymbol sym;
  sym.name = element->name + "[]";
  sym.category = TypeCategory::Array;
  sym.element_type = element;
  TypeSymbol & created = create(std::move(sym));
  derived_.emplace(std::move(key), &created);
  return &created;
}

TypeRef TypeSymbolTable::tuple_of(
  const std::vector<TypeRef> & elements, const std::vector<std::string> & names)
{
  std::string name = "(";
  std::string key = "(";
  for (size_t i = 0; i < elements.size(); ++i) {
    if (elements[i] == nullptr) return nullptr;
    if (i > 0) {
      name += ", ";
      key += ',';
    }
    name += elements[i]->name;
    key += identity_key(elements[i]);
    if (i < names.size() && !names[i].empty()) {
      name += ' ';
      name += names[i];
      key += ' ';
      key += names[i];
    }
  }
  name += ')';
  key += ')';

  auto it = derived_.find(key);
  if (it != derived_.end()) {
    return it->second;
  }

  TypeSymbol sym;
  sym.name = name;
  sym.category = TypeCategory::Struct;
  sym.is_tuple = true;
  for (size_t i = 0; i < elements.size(); ++i) {
    MemberSymbol element;
    element.name = (i < names.size()) ? names[i] : std::string();
    element.type = elements[i];
    element.kind = MemberKind::TupleElement;
    sym.tuple_elements.push_back(std::move(element));
  }
  TypeSymbol & created = create(std::move(sym));
  derived_.emplace(std::move(key), &created);
  return &created;
}

TypeRef TypeSymbolTable::type_parameter(TypeRef owner, std::string_view name)
{
  std::string key = (owner ? owner->name : std::string()) + "::" + std::string(name);
  auto it = derived_.find(key);
  if (it != derived_.end()) {
    return it->second;
  }

  TypeSymbol sym;
  sym.name = std::string(name);
  sym.category = TypeCategory::TypeParameter;
  sym.owner = owner;
  TypeSymbol & created = create(std::move(sym));
  derived_.emplace(std::move(key), &created);
  return &created;
}

TypeRef TypeSymbolTable::instantiate(TypeRef definition, const std::vector<TypeRef> & arguments)
{
  if (definition == nullptr || definition->type_parameters.size() != arguments.size()) {
    return nullptr;
  }

  std::string name(generic_base_name(definition->name));
  std::string key = identity_key(definition) + "<";
  bool own_parameters = true;
  name += '<';
  for (size_t i = 0; i < arguments.size(); ++i) {
    if (arguments[i] == nullptr) return nullptr;
    if (i > 0) {
      name += ", ";
      key += ',';
    }
    name += arguments[i]->name;
    key += identity_key(arguments[i]);
    own_parameters = own_parameters && arguments[i]->category == TypeCategory::TypeParameter &&
                     arguments[i]->owner == definition &&
                     arguments[i]->name == definition->type_parameters[i];
  }
  name += '>';
  key += '>';

  // The definition instantiated with its own parameters is the definition
  if (own_parameters) {
    return definition;
  }

  auto it = derived_.find(key);
  if (it != derived_.end()) {
    return it->second;
  }

  size_t depth = 0;
  for (const auto * a : arguments) {
    depth = std::max(depth, nesting_depth(a));
  }
  if (depth + 1 > k_max_instantiation_depth) {
    if (std::find(depth_limited_.begin(), depth_limited_.end(), definition->name) ==
        depth_limited_.end()) {
      depth_limited_.push_back(definition->name);
    }
    return nullptr;
  }

  TypeSymbol sym;
  sym.name = name;
  sym.category = definition->category;
  sym.is_record = definition->is_record;
  sym.is_readonly = definition->is_readonly;
  sym.attributes = definition->attributes;
  sym.original_definition = definition->name;
  sym.generic_definition = definition;
  sym.type_arguments = arguments;
  sym.instantiation_depth = depth + 1;
  TypeSymbol & created = create(std::move(sym));
  derived_.emplace(std::move(key), &created);
  pending_instantiations_.push_back(&created);
  return &created;
}

TypeRef TypeSymbolTable::substitute(TypeRef type, const SubstitutionMap & map)
{
  if (type == nullptr) return nullptr;

  auto it = map.find(type);
  if (it != map.end()) {
    return it->second;
  }

  if (type->is_nullable_value_wrapper()) {
    return nullable_of(substitute(type->nullable_underlying, map));
  }
  if (type->category == TypeCategory::Array) {
    return array_of(substitute(type->element_type, map));
  }
  if (type->is_tuple) {
    std::vector<TypeRef> elements;
    std::vector<std::string> names;
    for (const auto & e : type->tuple_elements) {
      elements.push_back(substitute(e.type, map));
      names.push_back(e.name);
    }
    return tuple_of(elements, names);
  }
  if (type->generic_definition != nullptr) {
    std::vector<TypeRef> args;
    args.reserve(type->type_arguments.size());
    for (const auto * a : type->type_arguments) {
      args.push_back(substitute(a, map));
    }
    return instantiate(type->generic_definition, args);
  }
  return type;
}

size_t TypeSymbolTable::complete_instantiations()
{
  size_t completed = 0;

  // Completing one instantiation may append new ones
  for (size_t i = 0; i < pending_instantiations_.size(); ++i) {
    TypeSymbol * inst = pending_instantiations_[i];
    const TypeSymbol * def = inst->generic_definition;

    SubstitutionMap map;
    map.emplace(def, inst);
    for (size_t p = 0; p < def->type_parameters.size(); ++p) {
      map.emplace(type_parameter(def, def->type_parameters[p]), inst->type_arguments[p]);
    }

    for (const auto & m : def->members) {
      MemberSymbol copy = m;
      copy.type = substitute(m.type, map);
      inst->members.push_back(std::move(copy));
    }

    for (const auto & method : def->methods) {
      MethodSymbol copy = method;
      copy.return_type = substitute(method.return_type, map);
      for (auto & param : copy.parameters) {
        param.type = substitute(param.type, map);
      }
      copy.declaring_type = (method.declaring_type == def) ? inst : method.declaring_type;
      inst->methods.push_back(std::move(copy));
    }

    ++completed;
  }

  pending_instantiations_.clear();
  return completed;
}

// ============================================================================
// Resolution
// ============================================================================

TypeRef TypeSymbolTable::resolve(const TypeExpr & expr, TypeRef context, std::string & error)
{
  switch (expr.kind) {
    case TypeExpr::Kind::Nullable:
      return nullable_of(resolve(expr.operand(), context, error));

    case TypeExpr::Kind::Array:
      return array_of(resolve(expr.operand(), context, error));

    case TypeExpr::Kind::Tuple: {
      std::vector<TypeRef> elements;
      elements.reserve(expr.arguments.size());
      for (const auto & a : expr.arguments) {
        TypeRef t = resolve(a, context, error);
        if (t == nullptr) return nullptr;
        elements.push_back(t);
      }
      return tuple_of(elements, expr.element_names);
    }

    case TypeExpr::Kind::Named:
      break;
  }

  if (!expr.is_generic()) {
    // Type parameters of the enclosing definition shadow global names
    for (TypeRef scope = context; scope != nullptr; scope = scope->owner) {
      for (const auto & p : scope->type_parameters) {
        if (p == expr.name) {
          return type_parameter(scope, p);
        }
      }
    }

    if (TypeRef t = lookup(expr.name)) {
      return t;
    }
    error = "unknown type '" + expr.name + "'";
    return nullptr;
  }

  TypeRef definition = lookup_generic(expr.name, expr.arguments.size());
  if (definition == nullptr) {
    error = "unknown generic type '" + expr.name + "' with " +
            std::to_string(expr.arguments.size()) + " type argument(s)";
    return nullptr;
  }

  std::vector<TypeRef> args;
  args.reserve(expr.arguments.size());
  for (const auto & a : expr.arguments) {
    TypeRef t = resolve(a, context, error);
    if (t == nullptr) return nullptr;
    args.push_back(t);
  }
  TypeRef inst = instantiate(definition, args);
  if (inst == nullptr) {
    error = "generic type '" + definition->name + "' is nested deeper than " +
            std::to_string(k_max_instantiation_depth) + " levels";
  }
  return inst;
}

}  // namespace recval
