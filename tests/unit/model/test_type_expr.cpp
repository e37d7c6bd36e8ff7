// tests/unit/model/test_type_expr.cpp - Type reference parser
//
#include <gtest/gtest.h>

#include <string>

#include "recval/model/type_expr.hpp"

using namespace recval;

namespace
{

std::string roundtrip(std::string_view text)
{
  const auto result = parse_type_expr(text);
  EXPECT_TRUE(result.success()) << text << ": " << result.error;
  return result.success() ? to_display_string(*result.expr) : std::string();
}

}  // namespace

TEST(TypeExprTest, SimpleAndQualifiedNames)
{
  const auto r = parse_type_expr("System.Int32");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.expr->kind, TypeExpr::Kind::Named);
  EXPECT_EQ(r.expr->name, "System.Int32");
  EXPECT_FALSE(r.expr->is_generic());

  EXPECT_EQ(roundtrip("global::System.Guid"), "global::System.Guid");
}

TEST(TypeExprTest, GenericArguments)
{
  const auto r = parse_type_expr("Dictionary< string , List<int> >");
  ASSERT_TRUE(r.success());
  ASSERT_TRUE(r.expr->is_generic());
  ASSERT_EQ(r.expr->arguments.size(), 2U);
  EXPECT_EQ(r.expr->arguments[1].name, "List");
  EXPECT_EQ(to_display_string(*r.expr), "Dictionary<string, List<int>>");
}

TEST(TypeExprTest, Suffixes)
{
  const auto r = parse_type_expr("int?[]");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.expr->kind, TypeExpr::Kind::Array);
  EXPECT_EQ(r.expr->operand().kind, TypeExpr::Kind::Nullable);

  EXPECT_EQ(roundtrip("int[][]"), "int[][]");
  EXPECT_EQ(roundtrip("int[ ]?"), "int[]?");
}

TEST(TypeExprTest, TupleWithNames)
{
  const auto r = parse_type_expr("(int a, (string, int[]) b)");
  ASSERT_TRUE(r.success());
  ASSERT_EQ(r.expr->kind, TypeExpr::Kind::Tuple);
  ASSERT_EQ(r.expr->arguments.size(), 2U);
  EXPECT_EQ(r.expr->element_names[0], "a");
  EXPECT_EQ(r.expr->element_names[1], "b");
  EXPECT_EQ(r.expr->arguments[1].kind, TypeExpr::Kind::Tuple);
  EXPECT_TRUE(r.expr->arguments[1].element_names[0].empty());

  EXPECT_EQ(to_display_string(*r.expr), "(int a, (string, int[]) b)");
}

TEST(TypeExprTest, VerbatimIdentifier)
{
  EXPECT_EQ(roundtrip("@class"), "@class");
}

TEST(TypeExprTest, Errors)
{
  const auto empty = parse_type_expr("");
  EXPECT_FALSE(empty.success());
  EXPECT_EQ(empty.error, "expected a type");

  const auto single = parse_type_expr("(int)");
  EXPECT_FALSE(single.success());
  EXPECT_EQ(single.error, "tuple type needs at least two elements");

  const auto double_nullable = parse_type_expr("int??");
  EXPECT_FALSE(double_nullable.success());

  const auto unclosed = parse_type_expr("List<int");
  EXPECT_FALSE(unclosed.success());

  const auto trailing = parse_type_expr("int x y");
  EXPECT_FALSE(trailing.success());
  EXPECT_EQ(trailing.error_column, 5U);

  const auto bad_qualifier = parse_type_expr("System.");
  EXPECT_FALSE(bad_qualifier.success());
  EXPECT_EQ(bad_qualifier.error_column, 8U);
}
