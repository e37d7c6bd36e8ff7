// recval/sema/explain.cpp - JSON report of how a type is classified

#include "recval/sema/explain.hpp"

#include <string>
#include <vector>

namespace recval
{

using json = nlohmann::json;

json to_json(const Verdict & verdict)
{
  json j;
  j["kind"] = std::string(to_string(verdict.kind));
  if (verdict.kind == VerdictKind::NestedFailed) {
    j["inner"] = verdict.inner_type_name;
  }
  return j;
}

json explain_to_json(TypeRef type, const ValueSemanticsClassifier & classifier)
{
  const TypeDescriptorProvider & p = classifier.provider();

  // Report on what the classifier actually inspects
  TypeRef subject = p.is_nullable_value_wrapper(type) ? p.unwrap(type) : type;

  json j;
  j["type"] = p.display_name(type);
  if (subject == nullptr) {
    j["verdict"] = to_json(Verdict::ok());
    return j;
  }

  const ValueKind kind = p.kind(subject);
  const EqualityCapability caps = p.equality(subject);

  j["kind"] = std::string(to_string(kind));
  j["capabilities"] = {
    {"value_equals", caps.has_own_value_equals},
    {"identity_equals_override", caps.has_own_identity_equals_override},
  };
  j["verdict"] = to_json(classifier.classify(type));

  std::vector<TypeMember> members;
  if (kind == ValueKind::HeterogeneousFixedTuple) {
    members = p.tuple_elements(subject);
  } else if (kind == ValueKind::ValueComposite || kind == ValueKind::ReferenceComposite ||
             kind == ValueKind::DerivedEqualityComposite) {
    members = p.members(subject);
  }

  json list = json::array();
  for (const auto & m : members) {
    json entry;
    entry["name"] = std::string(m.name);
    entry["type"] = p.display_name(m.type);
    const TypeRef inspected = p.is_nullable_value_wrapper(m.type) ? p.unwrap(m.type) : m.type;
    if (inspected != nullptr) {
      entry["kind"] = std::string(to_string(p.kind(inspected)));
      entry["verdict"] = to_json(classifier.classify(m.type));
    } else {
      entry["verdict"] = to_json(Verdict::ok());
    }
    list.push_back(std::move(entry));
  }
  j["members"] = std::move(list);
  return j;
}

}  // namespace recval
