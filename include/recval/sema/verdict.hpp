// recval/sema/verdict.hpp - Outcome of a value-semantics classification
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace recval
{

enum class VerdictKind : uint8_t {
  Ok,            ///< no defect found
  Failed,        ///< the type itself lacks value semantics
  NestedFailed,  ///< one of its members does; see inner_type_name
};

[[nodiscard]] std::string_view to_string(VerdictKind kind) noexcept;

struct Verdict
{
  VerdictKind kind = VerdictKind::Ok;

  /// Display name of the immediate failing member type (NestedFailed only)
  std::string inner_type_name;

  [[nodiscard]] bool is_ok() const noexcept { return kind == VerdictKind::Ok; }

  static Verdict ok() { return Verdict{}; }
  static Verdict failed() { return Verdict{VerdictKind::Failed, {}}; }
  static Verdict nested(std::string inner)
  {
    return Verdict{VerdictKind::NestedFailed, std::move(inner)};
  }

  [[nodiscard]] bool operator==(const Verdict & other) const
  {
    return kind == other.kind && inner_type_name == other.inner_type_name;
  }
  [[nodiscard]] bool operator!=(const Verdict & other) const { return !(*this == other); }
};

}  // namespace recval
