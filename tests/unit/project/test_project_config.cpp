// tests/project/test_project_config.cpp - dml.yaml loading
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "dml/project/project_config.hpp"

using namespace dml;
namespace fs = std::filesystem;

TEST(ProjectConfig, EmptyDocumentGivesDefaults)
{
  const auto result = parse_project_config("", "/proj");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.sources.empty());
  EXPECT_FALSE(result.config.resolver.test_mode);
  EXPECT_TRUE(result.config.resolver.autoexpose_compositions);
  EXPECT_TRUE(result.config.resolver.scoped_redirections);
}

TEST(ProjectConfig, FullDocument)
{
  const auto result = parse_project_config(
    "sources: [db/model.json, /abs/other.json]\n"
    "resolver:\n"
    "  test_mode: true\n"
    "  attach_valid_names: true\n"
    "  autoexpose_compositions: false\n"
    "severities:\n"
    "  redirected-implicitly-ambiguous: warning\n",
    "/proj");
  ASSERT_TRUE(result.success) << result.error;

  const ProjectConfig & config = result.config;
  ASSERT_EQ(config.sources.size(), 2U);
  EXPECT_EQ(config.sources[0], fs::path("/proj") / "db/model.json");
  EXPECT_EQ(config.sources[1], fs::path("/abs/other.json"));
  EXPECT_TRUE(config.resolver.test_mode);
  EXPECT_TRUE(config.resolver.attach_valid_names);
  EXPECT_FALSE(config.resolver.autoexpose_compositions);
  ASSERT_EQ(config.resolver.severities.count("redirected-implicitly-ambiguous"), 1U);
  EXPECT_EQ(config.resolver.severities.at("redirected-implicitly-ambiguous"), Severity::Warning);
}

TEST(ProjectConfig, Errors)
{
  EXPECT_FALSE(parse_project_config("- a\n- b\n", "/proj").success);
  EXPECT_FALSE(parse_project_config("sources: model.json\n", "/proj").success);
  EXPECT_FALSE(parse_project_config("resolver: [x]\n", "/proj").success);

  const auto flag = parse_project_config("resolver:\n  test_mode: maybe\n", "/proj");
  EXPECT_FALSE(flag.success);
  EXPECT_EQ(flag.error, "resolver.test_mode must be a boolean");

  const auto unknown = parse_project_config("severities:\n  no-such-message: info\n", "/proj");
  EXPECT_FALSE(unknown.success);
  EXPECT_NE(unknown.error.find("no-such-message"), std::string::npos);

  const auto level = parse_project_config("severities:\n  anno-duplicate: loud\n", "/proj");
  EXPECT_FALSE(level.success);
  EXPECT_NE(level.error.find("invalid severity"), std::string::npos);

  EXPECT_FALSE(parse_project_config("resolver: {", "/proj").success);
}

TEST(ProjectConfig, LoadAndFindUpwards)
{
  const fs::path root = fs::temp_directory_path() / "dml_project_config_test";
  fs::remove_all(root);
  fs::create_directories(root / "srv" / "nested");
  {
    std::ofstream out(root / k_project_config_file_name);
    out << "sources: [model.json]\n";
  }

  const auto found = find_project_config(root / "srv" / "nested");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(root / k_project_config_file_name));

  const auto loaded = load_project_config(*found);
  ASSERT_TRUE(loaded.success) << loaded.error;
  ASSERT_EQ(loaded.config.sources.size(), 1U);
  EXPECT_EQ(loaded.config.sources[0].filename(), "model.json");

  EXPECT_FALSE(load_project_config(root / "missing.yaml").success);
  fs::remove_all(root);
}
