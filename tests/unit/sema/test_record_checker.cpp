// tests/unit/sema/test_record_checker.cpp - Record member checks and JSV01 messages
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "recval/sema/record_checker.hpp"
#include "recval/test_support/model_helpers.hpp"

using namespace recval;
using recval::test_support::load_model;

namespace
{

std::vector<std::string> messages(const DiagnosticBag & diags)
{
  std::vector<std::string> out;
  for (const auto & d : diags) {
    out.push_back(d.message);
  }
  return out;
}

// Types shared by the record tests below
const char * const k_types = R"json(
    { "name": "StructA", "kind": "struct",
      "members": [ { "name": "I", "type": "int" }, { "name": "Numbers", "type": "int[]" } ] },
    { "name": "StructOk", "kind": "struct", "members": [ { "name": "I", "type": "int" } ] },
    { "name": "ClassA", "kind": "class" },
    { "name": "Color", "kind": "enum" }
)json";

std::string model_with(const std::string & records_json, const std::string & extra_types = "")
{
  return std::string("{ \"types\": [") + k_types + extra_types + "], \"records\": [" +
         records_json + "] }";
}

}  // namespace

TEST(RecordCheckerTest, CleanRecordReportsNothing)
{
  auto unit = load_model(model_with(
    R"json({ "type": "A", "parameters": [ { "name": "I", "type": "int" },
                                          { "name": "S", "type": "string" },
                                          { "name": "C", "type": "Color" },
                                          { "name": "Ok", "type": "StructOk?" } ] })json",
    R"json(, { "name": "A", "kind": "class", "record": true })json"));
  ASSERT_NE(unit.model, nullptr);
  ASSERT_TRUE(unit.diags.empty());

  DiagnosticBag diags;
  RecordChecker checker(diags);
  EXPECT_TRUE(checker.check(*unit.model));
  EXPECT_TRUE(diags.empty());
  EXPECT_EQ(checker.records_checked(), 1U);
}

TEST(RecordCheckerTest, ParameterMessages)
{
  auto unit = load_model(model_with(
    R"json({ "type": "A", "file": "A.cs",
             "parameters": [ { "name": "Numbers", "type": "int[]", "line": 1, "column": 17, "length": 13 },
                             { "name": "Sa", "type": "StructA", "line": 1, "column": 32, "length": 10 },
                             { "name": "Maybe", "type": "StructA?", "line": 1, "column": 44, "length": 14 } ] })json",
    R"json(, { "name": "A", "kind": "class", "record": true })json"));
  ASSERT_NE(unit.model, nullptr);
  ASSERT_TRUE(unit.diags.empty());

  DiagnosticBag diags;
  RecordChecker checker(diags);
  EXPECT_FALSE(checker.check(*unit.model));

  const std::vector<std::string> expected = {
    "Member 'int[] Numbers' does not have value semantics",
    "Member 'StructA Sa (field int[])' does not have value semantics",
    "Member 'StructA? Maybe (field int[])' does not have value semantics",
  };
  EXPECT_EQ(messages(diags), expected);
  EXPECT_EQ(checker.reported_count(), 3U);

  const Diagnostic & first = diags.all().front();
  EXPECT_EQ(first.code, "JSV01");
  EXPECT_EQ(first.severity, Severity::Warning);
  EXPECT_EQ(first.primary_range().line, 1U);
  EXPECT_EQ(first.primary_range().column, 17U);
  ASSERT_TRUE(first.help_message.has_value());
  EXPECT_NE(first.help_message->find("Equals(A)"), std::string::npos);
}

TEST(RecordCheckerTest, MemberMessagesUseUnwrappedType)
{
  auto unit = load_model(model_with(
    R"json({ "type": "B",
             "members": [ { "name": "Sa", "type": "StructA?" },
                          { "name": "Obj", "type": "object", "property": false },
                          { "name": "Klass", "type": "ClassA" } ] })json",
    R"json(, { "name": "B", "kind": "struct", "record": true })json"));
  ASSERT_NE(unit.model, nullptr);
  ASSERT_TRUE(unit.diags.empty());

  DiagnosticBag diags;
  RecordChecker checker(diags);
  checker.check(*unit.model);

  const std::vector<std::string> expected = {
    "Member 'StructA Sa (int[])' does not have value semantics",
    "Member 'object Obj' does not have value semantics",
    "Member 'ClassA Klass' does not have value semantics",
  };
  EXPECT_EQ(messages(diags), expected);
}

TEST(RecordCheckerTest, ParametersBeforeMembers)
{
  auto unit = load_model(model_with(
    R"json({ "type": "A",
             "members": [ { "name": "P", "type": "object" } ],
             "parameters": [ { "name": "Q", "type": "dynamic" } ] })json",
    R"json(, { "name": "A", "kind": "class", "record": true })json"));
  ASSERT_NE(unit.model, nullptr);

  DiagnosticBag diags;
  RecordChecker checker(diags);
  checker.check(*unit.model);

  ASSERT_EQ(diags.size(), 2U);
  EXPECT_EQ(diags.all()[0].message, "Member 'dynamic Q' does not have value semantics");
  EXPECT_EQ(diags.all()[1].message, "Member 'object P' does not have value semantics");
}

TEST(RecordCheckerTest, OwnEqualsSkipsRecord)
{
  auto unit = load_model(model_with(
    R"json({ "type": "A", "parameters": [ { "name": "Numbers", "type": "int[]" } ] })json",
    R"json(, { "name": "A", "kind": "class", "record": true,
               "methods": [ { "name": "Equals", "returns": "bool", "parameters": [ "A" ] } ] })json"));
  ASSERT_NE(unit.model, nullptr);
  ASSERT_TRUE(unit.diags.empty());
  EXPECT_TRUE(record_has_own_equals(*unit.model->records[0].type));

  DiagnosticBag diags;
  RecordChecker checker(diags);
  EXPECT_TRUE(checker.check(*unit.model));
  EXPECT_TRUE(diags.empty());
  EXPECT_EQ(checker.records_skipped(), 1U);
}

TEST(RecordCheckerTest, GeneratedOrMismatchedEqualsDoesNotCount)
{
  auto unit = load_model(model_with(
    R"json({ "type": "A", "parameters": [ { "name": "Numbers", "type": "int[]" } ] })json",
    R"json(, { "name": "A", "kind": "class", "record": true,
               "methods": [ { "name": "Equals", "returns": "bool", "parameters": [ "A" ], "generated": true },
                            { "name": "Equals", "returns": "int", "parameters": [ "A" ] },
                            { "name": "Equals", "returns": "bool", "parameters": [ "object" ], "override": true } ] })json"));
  ASSERT_NE(unit.model, nullptr);
  ASSERT_TRUE(unit.diags.empty());
  EXPECT_FALSE(record_has_own_equals(*unit.model->records[0].type));

  DiagnosticBag diags;
  RecordChecker checker(diags);
  EXPECT_FALSE(checker.check(*unit.model));
  EXPECT_EQ(diags.size(), 1U);
}

TEST(RecordCheckerTest, IgnoreListAndSeverity)
{
  auto unit = load_model(model_with(
    R"json({ "type": "A", "parameters": [ { "name": "O", "type": "object" } ] },
           { "type": "Legacy", "parameters": [ { "name": "O", "type": "object" } ] })json",
    R"json(, { "name": "A", "kind": "class", "record": true },
             { "name": "Legacy", "kind": "class", "record": true })json"));
  ASSERT_NE(unit.model, nullptr);

  RecordCheckOptions options;
  options.severity = Severity::Error;
  options.ignore = {"Legacy"};

  DiagnosticBag diags;
  RecordChecker checker(diags, options);
  checker.check(*unit.model);

  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags.all()[0].severity, Severity::Error);
  EXPECT_EQ(checker.records_checked(), 1U);
  EXPECT_EQ(checker.records_skipped(), 1U);
}

TEST(RecordCheckerTest, UnresolvedMemberTypeIsSkipped)
{
  auto unit = load_model(model_with(
    R"json({ "type": "A", "parameters": [ { "name": "X", "type": "Unknown" } ] })json",
    R"json(, { "name": "A", "kind": "class", "record": true })json"));
  ASSERT_NE(unit.model, nullptr);
  EXPECT_TRUE(unit.diags.has_errors());

  DiagnosticBag diags;
  RecordChecker checker(diags);
  EXPECT_TRUE(checker.check(*unit.model));
  EXPECT_TRUE(diags.empty());
}

TEST(RecordCheckerTest, EachMemberGetsFreshGuard)
{
  // Both parameters reach StructA; the second must still be reported
  auto unit = load_model(model_with(
    R"json({ "type": "A", "parameters": [ { "name": "First", "type": "StructA" },
                                          { "name": "Second", "type": "StructA" } ] })json",
    R"json(, { "name": "A", "kind": "class", "record": true })json"));
  ASSERT_NE(unit.model, nullptr);

  DiagnosticBag diags;
  RecordChecker checker(diags);
  checker.check(*unit.model);
  EXPECT_EQ(diags.size(), 2U);
}
