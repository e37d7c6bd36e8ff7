// recval/model/type_expr.cpp - Type reference parser
//
#include "recval/model/type_expr.hpp"

#include <cctype>
#include <utility>

namespace recval
{

TypeExpr TypeExpr::named(std::string name, std::vector<TypeExpr> args)
{
  TypeExpr e;
  e.kind = Kind::Named;
  e.name = std::move(name);
  e.arguments = std::move(args);
  return e;
}

TypeExpr TypeExpr::nullable(TypeExpr operand)
{
  TypeExpr e;
  e.kind = Kind::Nullable;
  e.arguments.push_back(std::move(operand));
  return e;
}

TypeExpr TypeExpr::array(TypeExpr element)
{
  TypeExpr e;
  e.kind = Kind::Array;
  e.arguments.push_back(std::move(element));
  return e;
}

namespace
{

bool is_ident_start(char c)
{
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '@';
}

bool is_ident_char(char c)
{
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

class TypeExprParser
{
public:
  explicit TypeExprParser(std::string_view text) : text_(text) {}

  TypeExprParseResult run()
  {
    std::optional<TypeExpr> e = parse_typeref();
    if (!e) {
      return TypeExprParseResult::fail(error_, error_column_);
    }
    skip_ws();
    if (!at_end()) {
      return TypeExprParseResult::fail(
        "unexpected '" + std::string(1, peek()) + "' after type", column());
    }
    return TypeExprParseResult::ok(std::move(*e));
  }

private:
  std::optional<TypeExpr> parse_typeref()
  {
    std::optional<TypeExpr> base = parse_primary();
    if (!base) return std::nullopt;

    while (true) {
      skip_ws();
      if (consume('?')) {
        if (base->kind == TypeExpr::Kind::Nullable) {
          return fail("nullable type cannot be nullable again");
        }
        base = TypeExpr::nullable(std::move(*base));
        continue;
      }
      if (peek() == '[') {
        ++pos_;
        skip_ws();
        if (!consume(']')) {
          return fail("expected ']'");
        }
        base = TypeExpr::array(std::move(*base));
        continue;
      }
      break;
    }
    return base;
  }

  std::optional<TypeExpr> parse_primary()
  {
    skip_ws();
    if (at_end()) {
      return fail("expected a type");
    }
    if (peek() == '(') {
      return parse_tuple();
    }
    return parse_named();
  }

  std::optional<TypeExpr> parse_tuple()
  {
    ++pos_;  // '('
    TypeExpr tuple;
    tuple.kind = TypeExpr::Kind::Tuple;

    while (true) {
      std::optional<TypeExpr> element = parse_typeref();
      if (!element) return std::nullopt;

      skip_ws();
      std::string element_name;
      if (!at_end() && is_ident_start(peek())) {
        element_name = read_identifier();
      }

      tuple.arguments.push_back(std::move(*element));
      tuple.element_names.push_back(std::move(element_name));

      skip_ws();
      if (consume(',')) continue;
      if (consume(')')) break;
      return fail("expected ',' or ')' in tuple type");
    }

    if (tuple.arguments.size() < 2) {
      return fail("tuple type needs at least two elements");
    }
    return tuple;
  }

  std::optional<TypeExpr> parse_named()
  {
    if (!is_ident_start(peek())) {
      return fail("expected a type name");
    }

    std::string name = read_identifier();
    while (peek() == '.' || (peek() == ':' && peek(1) == ':')) {
      const bool alias_qualifier = peek() == ':';
      pos_ += alias_qualifier ? 2 : 1;
      if (at_end() || !is_ident_start(peek())) {
        return fail("expected identifier after qualifier");
      }
      name += alias_qualifier ? "::" : ".";
      name += read_identifier();
    }

    std::vector<TypeExpr> args;
    skip_ws();
    if (consume('<')) {
      while (true) {
        std::optional<TypeExpr> arg = parse_typeref();
        if (!arg) return std::nullopt;
        args.push_back(std::move(*arg));
        skip_ws();
        if (consume(',')) continue;
        if (consume('>')) break;
        return fail("expected ',' or '>' in type argument list");
      }
    }

    return TypeExpr::named(std::move(name), std::move(args));
  }

  std::string read_identifier()
  {
    const size_t start = pos_;
    if (peek() == '@') ++pos_;
    while (!at_end() && is_ident_char(peek())) {
      ++pos_;
    }
    return std::string(text_.substr(start, pos_ - start));
  }

  void skip_ws()
  {
    while (!at_end() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
  }

  bool consume(char c)
  {
    if (!at_end() && text_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  [[nodiscard]] char peek(size_t ahead = 0) const noexcept
  {
    return pos_ + ahead < text_.size() ? text_[pos_ + ahead] : '\0';
  }

  [[nodiscard]] bool at_end() const noexcept { return pos_ >= text_.size(); }
  [[nodiscard]] uint32_t column() const noexcept { return static_cast<uint32_t>(pos_ + 1); }

  std::nullopt_t fail(std::string message)
  {
    if (error_.empty()) {
      error_ = std::move(message);
      error_column_ = column();
    }
    return std::nullopt;
  }

  std::string_view text_;
  size_t pos_ = 0;
  std::string error_;
  uint32_t error_column_ = 0;
};

}  // namespace

TypeExprParseResult parse_type_expr(std::string_view text)
{
  TypeExprParser parser(text);
  return parser.run();
}

std::string to_display_string(const TypeExpr & expr)
{
  switch (expr.kind) {
    case TypeExpr::Kind::Named: {
      std::string out = expr.name;
      if (!expr.arguments.empty()) {
        out += '<';
        for (size_t i = 0; i < expr.arguments.size(); ++i) {
          if (i > 0) out += ", ";
          out += to_display_string(expr.arguments[i]);
        }
        out += '>';
      }
      return out;
    }
    case TypeExpr::Kind::Tuple: {
      std::string out = "(";
      for (size_t i = 0; i < expr.arguments.size(); ++i) {
        if (i > 0) out += ", ";
        out += to_display_string(expr.arguments[i]);
        if (i < expr.element_names.size() && !expr.element_names[i].empty()) {
          out += ' ';
          out += expr.element_names[i];
        }
      }
      out += ')';
      return out;
    }
    case TypeExpr::Kind::Nullable:
      return to_display_string(expr.operand()) + "?";
    case TypeExpr::Kind::Array:
      return to_display_string(expr.operand()) + "[]";
  }
  return {};
}

}  // namespace recval
