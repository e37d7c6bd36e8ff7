// tests/unit/model/test_symbol_table.cpp - Type symbol table
//
#include <gtest/gtest.h>

#include <string>

#include "recval/model/symbol_table.hpp"
#include "recval/test_support/model_helpers.hpp"

using namespace recval;

namespace
{

TypeRef resolve_text(TypeSymbolTable & table, std::string_view text, TypeRef context = nullptr)
{
  const auto parsed = parse_type_expr(text);
  EXPECT_TRUE(parsed.success()) << parsed.error;
  if (!parsed.success()) return nullptr;

  std::string error;
  TypeRef t = table.resolve(*parsed.expr, context, error);
  EXPECT_NE(t, nullptr) << error;
  return t;
}

}  // namespace

TEST(SymbolTableTest, BuiltinsAndAliases)
{
  TypeSymbolTable table;

  TypeRef i = table.lookup("int");
  ASSERT_NE(i, nullptr);
  EXPECT_EQ(i->special, SpecialType::Int32);
  EXPECT_EQ(table.lookup("System.Int32"), i);

  EXPECT_EQ(table.lookup("object"), table.object_type());
  EXPECT_EQ(table.lookup("System.Object"), table.object_type());
  EXPECT_EQ(table.lookup("bool"), table.bool_type());
  EXPECT_EQ(table.lookup("dynamic")->category, TypeCategory::Dynamic);
  EXPECT_EQ(table.lookup("string")->category, TypeCategory::Class);

  TypeRef guid = table.lookup("Guid");
  ASSERT_NE(guid, nullptr);
  EXPECT_EQ(guid, table.lookup("System.Guid"));
  EXPECT_EQ(guid->category, TypeCategory::Struct);
  ASSERT_EQ(guid->methods.size(), 1U);
  EXPECT_EQ(guid->methods[0].parameters[0].type, guid);

  EXPECT_EQ(table.lookup("NoSuchType"), nullptr);
}

TEST(SymbolTableTest, DeclareRejectsDuplicates)
{
  TypeSymbolTable table;
  TypeSymbol * a = table.declare("StructA", TypeCategory::Struct);
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(table.declare("StructA", TypeCategory::Class), nullptr);
  EXPECT_EQ(table.declare("int", TypeCategory::Struct), nullptr);
  EXPECT_EQ(table.lookup("StructA"), a);
}

TEST(SymbolTableTest, DeclaredNameShadowsAlias)
{
  TypeSymbolTable table;
  TypeSymbol * guid = table.declare("Guid", TypeCategory::Class);
  ASSERT_NE(guid, nullptr);
  EXPECT_EQ(table.lookup("Guid"), guid);
  EXPECT_NE(table.lookup("System.Guid"), guid);
}

TEST(SymbolTableTest, NullableWrapsValueTypesOnly)
{
  TypeSymbolTable table;
  TypeRef i = table.lookup("int");
  TypeRef s = table.lookup("string");

  TypeRef ni = table.nullable_of(i);
  ASSERT_NE(ni, i);
  EXPECT_TRUE(ni->is_nullable_value_wrapper());
  EXPECT_EQ(ni->nullable_underlying, i);
  EXPECT_EQ(ni->name, "int?");
  EXPECT_EQ(table.nullable_of(i), ni);
  EXPECT_EQ(table.nullable_of(ni), ni);

  EXPECT_EQ(table.nullable_of(s), s);
}

TEST(SymbolTableTest, ArraysAndTuplesAreInterned)
{
  TypeSymbolTable table;
  TypeRef arr = resolve_text(table, "int[]");
  ASSERT_NE(arr, nullptr);
  EXPECT_EQ(arr->category, TypeCategory::Array);
  EXPECT_EQ(arr->element_type, table.lookup("int"));
  EXPECT_EQ(resolve_text(table, "System.Int32[]"), arr);

  TypeRef tuple = resolve_text(table, "(int a, int[] b)");
  ASSERT_NE(tuple, nullptr);
  EXPECT_TRUE(tuple->is_tuple);
  EXPECT_EQ(tuple->name, "(int a, int[] b)");
  ASSERT_EQ(tuple->tuple_element_list().size(), 2U);
  EXPECT_EQ(tuple->tuple_elements[1].type, arr);
  EXPECT_EQ(tuple->tuple_elements[1].kind, MemberKind::TupleElement);

  TypeRef unnamed = resolve_text(table, "(int, int[])");
  EXPECT_NE(unnamed, tuple);
  EXPECT_EQ(unnamed->name, "(int, int[])");
  EXPECT_TRUE(unnamed->tuple_elements[0].name.empty());
}

TEST(SymbolTableTest, WellKnownGenericInstantiation)
{
  TypeSymbolTable table;
  TypeRef seg = resolve_text(table, "ArraySegment<int>");
  ASSERT_NE(seg, nullptr);
  EXPECT_EQ(seg->name, "System.ArraySegment<int>");
  EXPECT_EQ(seg->original_definition, "System.ArraySegment<T>");
  EXPECT_EQ(seg->category, TypeCategory::Struct);
  EXPECT_EQ(resolve_text(table, "System.ArraySegment<System.Int32>"), seg);

  EXPECT_EQ(table.complete_instantiations(), 1U);
  ASSERT_EQ(seg->methods.size(), 1U);
  EXPECT_EQ(seg->methods[0].declaring_type, seg);
  EXPECT_EQ(seg->methods[0].parameters[0].type, seg);
}

TEST(SymbolTableTest, UserGenericSubstitutesMembers)
{
  TypeSymbolTable table;
  TypeSymbol * box = table.declare("Box", TypeCategory::Struct, {"T"});
  ASSERT_NE(box, nullptr);
  EXPECT_EQ(box->name, "Box<T>");
  EXPECT_TRUE(box->is_generic_definition());

  TypeRef t = resolve_text(table, "T", box);
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->category, TypeCategory::TypeParameter);
  EXPECT_EQ(t->owner, box);
  test_support::add_field(*box, "Value", t);
  test_support::add_field(*box, "Next", resolve_text(table, "Box<T>[]", box));

  TypeRef inst = resolve_text(table, "Box<string>");
  table.complete_instantiations();

  ASSERT_EQ(inst->members.size(), 2U);
  EXPECT_EQ(inst->members[0].type, table.lookup("string"));
  EXPECT_EQ(inst->members[1].type->name, "Box<string>[]");
  EXPECT_EQ(inst->members[1].type->element_type, inst);
  EXPECT_EQ(inst->generic_definition, box);
  EXPECT_EQ(inst->type_arguments[0], table.lookup("string"));
}

TEST(SymbolTableTest, UnconstrainedNullableParameterIsTheArgument)
{
  TypeSymbolTable table;
  TypeSymbol * box = table.declare("Box", TypeCategory::Class, {"T"});
  ASSERT_NE(box, nullptr);

  // Without a struct constraint `T?` only annotates; Box<int>.Value is int
  TypeRef t_nullable = resolve_text(table, "T?", box);
  EXPECT_EQ(t_nullable, resolve_text(table, "T", box));
  test_support::add_field(*box, "Value", t_nullable);
  test_support::add_field(*box, "Wrapped", resolve_text(table, "(T? a, int? b)", box));

  TypeRef of_int = resolve_text(table, "Box<int>");
  table.complete_instantiations();

  ASSERT_EQ(of_int->members.size(), 2U);
  EXPECT_EQ(of_int->members[0].type, table.lookup("int"));
  EXPECT_EQ(of_int->members[1].type->name, "(int a, int? b)");
}

TEST(SymbolTableTest, SameParameterNameInTwoDefinitions)
{
  TypeSymbolTable table;
  TypeSymbol * node = table.declare("Node", TypeCategory::Class, {"T"});
  TypeSymbol * wrapper = table.declare("Wrapper", TypeCategory::Struct, {"T"});
  ASSERT_NE(node, nullptr);
  ASSERT_NE(wrapper, nullptr);

  // Both print as "Node<T>" and "T[]", but refer to different parameters
  TypeRef wrapped = resolve_text(table, "Node<T>", wrapper);
  EXPECT_NE(wrapped, node);
  EXPECT_EQ(wrapped->name, "Node<T>");
  EXPECT_EQ(resolve_text(table, "Node<T>", node), node);
  EXPECT_NE(resolve_text(table, "T[]", wrapper), resolve_text(table, "T[]", node));

  test_support::add_field(*wrapper, "Items", wrapped);
  TypeRef of_int = resolve_text(table, "Wrapper<int>");
  table.complete_instantiations();

  ASSERT_EQ(of_int->members.size(), 1U);
  EXPECT_EQ(of_int->members[0].type, resolve_text(table, "Node<int>"));
}

TEST(SymbolTableTest, GrowingSelfReferenceIsCut)
{
  TypeSymbolTable table;
  TypeSymbol * node = table.declare("Node", TypeCategory::Class, {"T"});
  ASSERT_NE(node, nullptr);
  test_support::add_field(*node, "Value", resolve_text(table, "T", node));
  test_support::add_field(*node, "Next", resolve_text(table, "Node<Node<T>>", node));

  TypeRef of_int = resolve_text(table, "Node<int>");
  table.complete_instantiations();

  ASSERT_EQ(table.depth_limited().size(), 1U);
  EXPECT_EQ(table.depth_limited()[0], "Node<T>");

  size_t depth = 0;
  std::string expected_name = "int";
  for (TypeRef cur = of_int; cur != nullptr; cur = cur->members[1].type) {
    ++depth;
    expected_name = "Node<" + expected_name + ">";
    EXPECT_EQ(cur->name, expected_name);
    EXPECT_EQ(cur->instantiation_depth, depth);
    ASSERT_EQ(cur->members.size(), 2U);
  }
  EXPECT_EQ(depth, k_max_instantiation_depth);
}

TEST(SymbolTableTest, TooDeeplyNestedReferenceIsAnError)
{
  TypeSymbolTable table;

  std::string text = "int";
  for (size_t i = 0; i <= k_max_instantiation_depth; ++i) {
    text = "List<" + text + ">";
  }
  const auto parsed = parse_type_expr(text);
  ASSERT_TRUE(parsed.success());

  std::string error;
  EXPECT_EQ(table.resolve(*parsed.expr, nullptr, error), nullptr);
  EXPECT_NE(error.find("nested deeper than 16 levels"), std::string::npos) << error;
}

TEST(SymbolTableTest, ResolveErrors)
{
  TypeSymbolTable table;
  std::string error;

  const auto unknown = parse_type_expr("Missing[]");
  ASSERT_TRUE(unknown.success());
  EXPECT_EQ(table.resolve(*unknown.expr, nullptr, error), nullptr);
  EXPECT_EQ(error, "unknown type 'Missing'");

  const auto wrong_arity = parse_type_expr("List<int, int>");
  ASSERT_TRUE(wrong_arity.success());
  EXPECT_EQ(table.resolve(*wrong_arity.expr, nullptr, error), nullptr);
  EXPECT_NE(error.find("unknown generic type 'List'"), std::string::npos);
}

TEST(SymbolTableTest, GenericBaseName)
{
  EXPECT_EQ(generic_base_name("System.ArraySegment<T>"), "System.ArraySegment");
  EXPECT_EQ(generic_base_name("int"), "int");
}
