// recval/test_support/model_helpers.hpp - helpers for unit/integration tests
//
// Two ways to build a type graph in tests: load a JSON model from a string, or
// declare symbols directly in a TypeSymbolTable and attach members with the
// add_* helpers below.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "recval/basic/diagnostic.hpp"
#include "recval/basic/source_manager.hpp"
#include "recval/model/model_loader.hpp"
#include "recval/model/type_expr.hpp"
#include "recval/model/type_model.hpp"

namespace recval::test_support
{

struct TestModelUnit
{
  SourceRegistry sources;
  DiagnosticBag diags;
  std::unique_ptr<TypeModel> model;

  /// Resolve a type reference against the model; nullptr if it does not resolve
  [[nodiscard]] TypeRef type(std::string_view text) const
  {
    if (!model) return nullptr;
    const TypeExprParseResult parsed = parse_type_expr(text);
    if (!parsed.success()) return nullptr;

    std::string error;
    TypeRef t = model->types->resolve(*parsed.expr, nullptr, error);
    model->types->complete_instantiations();
    return t;
  }
};

[[nodiscard]] inline TestModelUnit load_model(
  std::string json_text, const std::filesystem::path & virtual_path = "<test>.json")
{
  TestModelUnit out;
  ModelLoader loader(out.sources, out.diags);
  out.model = loader.load_string(std::move(json_text), virtual_path);
  return out;
}

/// Append an instance field
inline void add_field(TypeSymbol & owner, std::string name, TypeRef type)
{
  owner.members.push_back(MemberSymbol{std::move(name), type, MemberKind::Field, false});
}

/// Append a static field
inline void add_static_field(TypeSymbol & owner, std::string name, TypeRef type)
{
  owner.members.push_back(MemberSymbol{std::move(name), type, MemberKind::Field, true});
}

/// Declare `Equals(parameter_type)` directly on `owner`
inline MethodSymbol & add_equals(
  TypeSymbol & owner, TypeRef parameter_type, TypeRef return_type, bool is_override = false)
{
  MethodSymbol m;
  m.name = "Equals";
  m.return_type = return_type;
  m.parameters.push_back(ParameterSymbol{"other", parameter_type});
  m.declaring_type = &owner;
  m.is_override = is_override;
  owner.methods.push_back(std::move(m));
  return owner.methods.back();
}

}  // namespace recval::test_support
