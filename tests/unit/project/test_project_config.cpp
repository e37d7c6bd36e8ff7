// tests/unit/project/test_project_config.cpp - recval.yaml loading
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "recval/project/project_config.hpp"

using namespace recval;

namespace fs = std::filesystem;

namespace
{

class TempDir
{
public:
  explicit TempDir(const std::string & name) : path_(fs::temp_directory_path() / name)
  {
    fs::remove_all(path_);
    fs::create_directories(path_);
  }
  ~TempDir() { fs::remove_all(path_); }

  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  [[nodiscard]] const fs::path & path() const { return path_; }

  void write(const fs::path & rel, const std::string & content) const
  {
    fs::create_directories((path_ / rel).parent_path());
    std::ofstream out(path_ / rel);
    out << content;
  }

private:
  fs::path path_;
};

}  // namespace

TEST(ProjectConfigTest, ParsesAllSections)
{
  const auto result = parse_project_config(
    "package:\n"
    "  name: demo\n"
    "  version: '1.2.0'\n"
    "analysis:\n"
    "  models: [ 'model/types.json', '/abs/other.json' ]\n"
    "  severity: error\n"
    "  ignore: [ LegacyRecord ]\n",
    "/projects/demo");

  ASSERT_TRUE(result.success) << result.error;
  const ProjectConfig & cfg = result.config;
  EXPECT_EQ(cfg.package.name, "demo");
  EXPECT_EQ(cfg.package.version, "1.2.0");
  ASSERT_EQ(cfg.analysis.models.size(), 2U);
  EXPECT_EQ(cfg.analysis.severity, Severity::Error);
  ASSERT_EQ(cfg.analysis.ignore.size(), 1U);
  EXPECT_EQ(cfg.analysis.ignore[0], "LegacyRecord");

  const auto models = cfg.resolved_models();
  EXPECT_EQ(models[0], fs::path("/projects/demo/model/types.json"));
  EXPECT_EQ(models[1], fs::path("/abs/other.json"));
}

TEST(ProjectConfigTest, Defaults)
{
  const auto result = parse_project_config("package:\n  name: x\n", "/p");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.analysis.severity, Severity::Warning);
  EXPECT_TRUE(result.config.analysis.models.empty());
  EXPECT_TRUE(result.config.analysis.ignore.empty());

  const auto empty = parse_project_config("", "/p");
  EXPECT_TRUE(empty.success) << empty.error;
}

TEST(ProjectConfigTest, InvalidSeverity)
{
  const auto result = parse_project_config("analysis:\n  severity: fatal\n", "/p");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("analysis.severity"), std::string::npos);
}

TEST(ProjectConfigTest, ListsMustBeSequences)
{
  const auto models = parse_project_config("analysis:\n  models: model.json\n", "/p");
  EXPECT_FALSE(models.success);
  EXPECT_EQ(models.error, "analysis.models must be a list");

  const auto ignore = parse_project_config("analysis:\n  ignore: A\n", "/p");
  EXPECT_FALSE(ignore.success);
  EXPECT_EQ(ignore.error, "analysis.ignore must be a list");
}

TEST(ProjectConfigTest, MalformedYaml)
{
  const auto result = parse_project_config("analysis: [unclosed\n", "/p");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("failed to parse YAML"), std::string::npos);
}

TEST(ProjectConfigTest, LoadFromFile)
{
  const TempDir dir("recval_config_load_test");
  dir.write("recval.yaml", "package:\n  name: on-disk\nanalysis:\n  models: [ m.json ]\n");

  const auto result = load_project_config(dir.path() / "recval.yaml");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.package.name, "on-disk");
  EXPECT_EQ(result.config.project_root, fs::absolute(dir.path()));

  const auto missing = load_project_config(dir.path() / "nope.yaml");
  EXPECT_FALSE(missing.success);
  EXPECT_NE(missing.error.find("not found"), std::string::npos);
}

TEST(ProjectConfigTest, FindSearchesUpward)
{
  const TempDir dir("recval_config_find_test");
  dir.write("recval.yaml", "package:\n  name: root\n");
  dir.write("a/b/c/model.json", "{}");

  const auto from_nested = find_project_config(dir.path() / "a" / "b" / "c");
  ASSERT_TRUE(from_nested.has_value());
  EXPECT_EQ(fs::canonical(*from_nested), fs::canonical(dir.path() / "recval.yaml"));

  const auto from_file = find_project_config(dir.path() / "a" / "b" / "c" / "model.json");
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(fs::canonical(*from_file), fs::canonical(dir.path() / "recval.yaml"));
}
