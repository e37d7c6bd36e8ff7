// recval/model/type_model.hpp - Loaded type model: symbols plus records to check
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "recval/basic/source_manager.hpp"
#include "recval/model/symbol_table.hpp"
#include "recval/model/type_symbol.hpp"

namespace recval
{

/**
 * Where a checked member of a record comes from.
 */
enum class MemberOrigin : uint8_t {
  Parameter,  ///< positional parameter: record A(int I)
  Field,
  Property,
};

/**
 * One top-level member of a record under test.
 *
 * `type` is nullptr when the member's type could not be resolved.
 */
struct RecordMemberDecl
{
  std::string name;
  TypeRef type = nullptr;
  MemberOrigin origin = MemberOrigin::Property;
  SourceRange range;
};

/**
 * A derived-equality type whose members are checked as a unit.
 */
struct RecordDecl
{
  TypeRef type = nullptr;
  SourceRange range;
  std::vector<RecordMemberDecl> parameters;
  std::vector<RecordMemberDecl> members;

  [[nodiscard]] const std::string & name() const { return type->name; }
};

struct TypeModel
{
  std::filesystem::path path;
  std::unique_ptr<TypeSymbolTable> types = std::make_unique<TypeSymbolTable>();
  std::vector<RecordDecl> records;

  [[nodiscard]] const RecordDecl * find_record(std::string_view name) const;
};

}  // namespace recval
