// recval/model/type_expr.hpp - Type reference expressions used by model files
//
// Grammar:
//   typeref := primary suffix*
//   primary := '(' element (',' element)+ ')'
//            | qualified-name [ '<' typeref (',' typeref)* '>' ]
//   element := typeref [identifier]
//   suffix  := '?' | '[' ']'
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace recval
{

/**
 * Parsed type reference.
 *
 * - Named:    `name` plus generic `arguments` (possibly empty)
 * - Tuple:    `arguments` are the element types, `element_names` parallel to them
 * - Nullable: `arguments[0]` is the operand
 * - Array:    `arguments[0]` is the element type
 */
struct TypeExpr
{
  enum class Kind : uint8_t { Named, Tuple, Nullable, Array };

  Kind kind = Kind::Named;
  std::string name;
  std::vector<TypeExpr> arguments;
  std::vector<std::string> element_names;

  [[nodiscard]] bool is_named() const noexcept { return kind == Kind::Named; }
  [[nodiscard]] bool is_generic() const noexcept
  {
    return kind == Kind::Named && !arguments.empty();
  }
  [[nodiscard]] const TypeExpr & operand() const { return arguments.front(); }

  static TypeExpr named(std::string name, std::vector<TypeExpr> args = {});
  static TypeExpr nullable(TypeExpr operand);
  static TypeExpr array(TypeExpr element);
};

/**
 * Result of parsing a type reference string.
 */
struct TypeExprParseResult
{
  std::optional<TypeExpr> expr;

  /// Error message if parsing failed
  std::string error;

  /// 1-indexed column of the error inside the parsed text
  uint32_t error_column = 0;

  [[nodiscard]] bool success() const noexcept { return expr.has_value(); }

  static TypeExprParseResult ok(TypeExpr e)
  {
    TypeExprParseResult r;
    r.expr = std::move(e);
    return r;
  }

  static TypeExprParseResult fail(std::string msg, uint32_t column)
  {
    TypeExprParseResult r;
    r.error = std::move(msg);
    r.error_column = column;
    return r;
  }
};

/// Parse a type reference. Never throws.
[[nodiscard]] TypeExprParseResult parse_type_expr(std::string_view text);

/// Canonical display string, e.g. "(int a, System.ArraySegment<int>[])"
[[nodiscard]] std::string to_display_string(const TypeExpr & expr);

}  // namespace recval
