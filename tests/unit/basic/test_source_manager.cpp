// tests/unit/basic/test_source_manager.cpp - SourceFile and SourceRegistry
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "recval/basic/source_manager.hpp"

using namespace recval;

TEST(SourceFileTest, LineColumnFromOffset)
{
  const SourceFile file("a.cs", "record A(int I);\nrecord B;\n");

  const LineColumn first = file.get_line_column(0);
  EXPECT_EQ(first.line, 1U);
  EXPECT_EQ(first.column, 1U);

  const LineColumn second = file.get_line_column(17);
  EXPECT_EQ(second.line, 2U);
  EXPECT_EQ(second.column, 1U);

  const LineColumn inside = file.get_line_column(20);
  EXPECT_EQ(inside.line, 2U);
  EXPECT_EQ(inside.column, 4U);
}

TEST(SourceFileTest, GetLineStripsTerminators)
{
  const SourceFile file("a.cs", "first\r\nsecond\nthird");

  EXPECT_EQ(file.line_count(), 3U);
  EXPECT_EQ(file.get_line(0), "first");
  EXPECT_EQ(file.get_line(1), "second");
  EXPECT_EQ(file.get_line(2), "third");
  EXPECT_TRUE(file.get_line(3).empty());
}

TEST(SourceRegistryTest, RegisterPathDeduplicates)
{
  SourceRegistry sources;
  const FileId a = sources.register_path("models/../A.cs");
  const FileId b = sources.register_path("A.cs");

  EXPECT_EQ(a, b);
  EXPECT_EQ(sources.size(), 1U);
  EXPECT_EQ(sources.get_path(a), std::filesystem::path("A.cs"));
}

TEST(SourceRegistryTest, InMemoryFile)
{
  SourceRegistry sources;
  const FileId id = sources.add_file("<test>.json", "{}\n");

  const SourceFile * file = sources.get_file(id);
  ASSERT_NE(file, nullptr);
  EXPECT_EQ(file->content(), "{}\n");
}

TEST(SourceRegistryTest, UnreadableFileYieldsNull)
{
  SourceRegistry sources;
  const FileId id = sources.register_path("does/not/exist/Record.cs");

  EXPECT_TRUE(id.is_valid());
  EXPECT_EQ(sources.get_file(id), nullptr);
  EXPECT_EQ(sources.get_file(FileId::invalid()), nullptr);
  EXPECT_TRUE(sources.get_path(FileId::invalid()).empty());
}

TEST(SourceRegistryTest, LoadsRegisteredFileLazily)
{
  const auto path = std::filesystem::temp_directory_path() / "recval_source_manager_test.cs";
  {
    std::ofstream out(path);
    out << "public record A(int[] Numbers);\n";
  }

  SourceRegistry sources;
  const FileId id = sources.register_path(path);
  const SourceFile * file = sources.get_file(id);
  ASSERT_NE(file, nullptr);
  EXPECT_EQ(file->get_line(0), "public record A(int[] Numbers);");

  std::filesystem::remove(path);
}

TEST(SourceRangeTest, Validity)
{
  SourceRange unknown;
  EXPECT_FALSE(unknown.is_valid());

  SourceRange file_only{FileId(0)};
  EXPECT_FALSE(file_only.is_valid());

  SourceRange r{FileId(0), 3, 5, 4};
  EXPECT_TRUE(r.is_valid());
  EXPECT_EQ(r.end_column(), 9U);
}
