// recval/model/type_symbol.cpp - Type symbol helpers
//
#include "recval/model/type_symbol.hpp"

#include <algorithm>

namespace recval
{

std::string_view to_string(TypeCategory category) noexcept
{
  switch (category) {
    case TypeCategory::Class:
      return "class";
    case TypeCategory::Struct:
      return "struct";
    case TypeCategory::Interface:
      return "interface";
    case TypeCategory::Enum:
      return "enum";
    case TypeCategory::Delegate:
      return "delegate";
    case TypeCategory::Array:
      return "array";
    case TypeCategory::Pointer:
      return "pointer";
    case TypeCategory::TypeParameter:
      return "type-parameter";
    case TypeCategory::Dynamic:
      return "dynamic";
    case TypeCategory::Error:
      return "error";
  }
  return "error";
}

bool parse_type_category(std::string_view text, TypeCategory & out) noexcept
{
  if (text == "class") {
    out = TypeCategory::Class;
  } else if (text == "struct") {
    out = TypeCategory::Struct;
  } else if (text == "interface") {
    out = TypeCategory::Interface;
  } else if (text == "enum") {
    out = TypeCategory::Enum;
  } else if (text == "delegate") {
    out = TypeCategory::Delegate;
  } else {
    return false;
  }
  return true;
}

bool TypeSymbol::has_attribute(std::string_view attribute) const noexcept
{
  return std::any_of(attributes.begin(), attributes.end(), [attribute](const std::string & a) {
    return a == attribute;
  });
}

}  // namespace recval
