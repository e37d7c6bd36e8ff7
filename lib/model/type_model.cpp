// recval/model/type_model.cpp - Loaded type model implementation
//
#include "recval/model/type_model.hpp"

namespace recval
{

const RecordDecl * TypeModel::find_record(std::string_view name) const
{
  for (const auto & r : records) {
    if (r.type != nullptr && r.type->name == name) {
      return &r;
    }
  }
  return nullptr;
}

}  // namespace recval
