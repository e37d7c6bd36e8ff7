// recval/sema/record_checker.cpp - Value-semantics check of record members

#include "recval/sema/record_checker.hpp"

#include <algorithm>
#include <fmt/format.h>

#include "recval/sema/kind_resolver.hpp"

namespace recval
{

bool record_has_own_equals(const TypeSymbol & record) noexcept
{
  return std::any_of(record.methods.begin(), record.methods.end(), [&](const MethodSymbol & m) {
    return m.name == "Equals" && !m.is_compiler_generated && m.parameters.size() == 1 &&
           m.parameters.front().type == &record && m.return_type != nullptr &&
           m.return_type->special == SpecialType::Boolean;
  });
}

bool RecordChecker::check(const TypeModel & model)
{
  bool clean = true;
  for (const auto & record : model.records) {
    if (!check(record)) {
      clean = false;
    }
  }
  return clean;
}

bool RecordChecker::check(const RecordDecl & record)
{
  if (record.type == nullptr || is_ignored(record.name()) || record_has_own_equals(*record.type)) {
    ++records_skipped_;
    return true;
  }
  ++records_checked_;

  bool clean = true;
  for (const auto & param : record.parameters) {
    if (!check_member(record, param)) clean = false;
  }
  for (const auto & member : record.members) {
    if (!check_member(record, member)) clean = false;
  }
  return clean;
}

bool RecordChecker::is_ignored(std::string_view name) const
{
  return std::find(options_.ignore.begin(), options_.ignore.end(), name) != options_.ignore.end();
}

bool RecordChecker::check_member(const RecordDecl & record, const RecordMemberDecl & member)
{
  if (member.type == nullptr) return true;

  const Verdict verdict = classifier_.classify(member.type);
  if (verdict.is_ok()) return true;

  const bool is_parameter = member.origin == MemberOrigin::Parameter;

  // Positional parameters keep their declared type, declared members show it unwrapped
  const TypeRef shown = is_parameter ? member.type : unwrap_nullable(member.type);
  std::string args = fmt::format("{} {}", shown->name, member.name);
  std::string label;
  if (verdict.kind == VerdictKind::NestedFailed) {
    args += is_parameter ? fmt::format(" (field {})", verdict.inner_type_name)
                         : fmt::format(" ({})", verdict.inner_type_name);
    label = fmt::format("'{}' does not have value semantics", verdict.inner_type_name);
  } else {
    label = "equality of this member compares identity";
  }

  diags_
    .report(
      options_.severity, member.range,
      fmt::format("Member '{}' does not have value semantics", args), std::move(label))
    .with_code(k_value_semantics_code)
    .with_help(fmt::format(
      "implement 'bool Equals({})' in '{}' to define equality explicitly", record.name(),
      record.name()));

  ++reported_;
  return false;
}

}  // namespace recval
