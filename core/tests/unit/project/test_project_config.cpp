// tests/unit/project/test_project_config.cpp - Unit tests for tlc.yaml loading
//

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "tlc/project/project_config.hpp"
#include "tlc/sema/types/type.hpp"
#include "tlc/sema/types/type_utils.hpp"

using namespace tlc;
namespace fs = std::filesystem;

namespace
{

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

}  // namespace

class ProjectConfigTest : public ::testing::Test
{
protected:
  TypeContext types;
};

TEST_F(ProjectConfigTest, EmptyDocumentUsesDefaults)
{
  auto r = parse_project_config("", types);
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.output.format, OutputFormat::Text);
  EXPECT_EQ(r.config.output.color, ColorMode::Auto);
  EXPECT_TRUE(r.config.context.empty());
  EXPECT_TRUE(r.config.samples.empty());
}

TEST_F(ProjectConfigTest, FullDocument)
{
  auto r = parse_project_config(R"(
package:
  name: demo
  version: 1.2.0
output:
  format: json
  color: never
context:
  x: Int
  flag: Bool
samples:
  - identity
  - bad_linear
)", types);

  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.package.name, "demo");
  EXPECT_EQ(r.config.package.version, "1.2.0");
  EXPECT_EQ(r.config.output.format, OutputFormat::Json);
  EXPECT_EQ(r.config.output.color, ColorMode::Never);

  ASSERT_EQ(r.config.context.size(), 2U);
  EXPECT_EQ(r.config.context[0].name, "x");
  EXPECT_EQ(r.config.context[0].type, types.int_type());
  EXPECT_EQ(r.config.context[1].name, "flag");
  EXPECT_EQ(r.config.context[1].type, types.bool_type());

  ASSERT_EQ(r.config.samples.size(), 2U);
  EXPECT_EQ(r.config.samples[1], "bad_linear");
}

TEST_F(ProjectConfigTest, CompositeTypes)
{
  auto r = parse_project_config(R"(
context:
  f:
    function: [Int, Bool]
  l:
    linear: Int
  e:
    effect: IO
    type:
      function: [Bool, Int]
)", types);

  ASSERT_TRUE(r.success) << r.error;
  ASSERT_EQ(r.config.context.size(), 3U);
  EXPECT_EQ(to_string(r.config.context[0].type), "(Int -> Bool)");
  EXPECT_EQ(to_string(r.config.context[1].type), "Linear[Int]");
  EXPECT_EQ(to_string(r.config.context[2].type), "Effect[IO, (Bool -> Int)]");
}

TEST_F(ProjectConfigTest, UnknownTypeName)
{
  auto r = parse_project_config("context:\n  s: String\n", types);
  ASSERT_FALSE(r.success);
  EXPECT_NE(r.error.find("'s'"), std::string::npos);
  EXPECT_NE(r.error.find("unknown type 'String'"), std::string::npos);
}

TEST_F(ProjectConfigTest, AmbiguousTypeMap)
{
  auto r = parse_project_config("context:\n  t:\n    linear: Int\n    effect: IO\n", types);
  ASSERT_FALSE(r.success);
  EXPECT_NE(r.error.find("exactly one"), std::string::npos);
}

TEST_F(ProjectConfigTest, FunctionNeedsTwoEntries)
{
  auto r = parse_project_config("context:\n  f:\n    function: [Int]\n", types);
  ASSERT_FALSE(r.success);
}

TEST_F(ProjectConfigTest, EffectNeedsType)
{
  auto r = parse_project_config("context:\n  e:\n    effect: IO\n", types);
  ASSERT_FALSE(r.success);
  EXPECT_NE(r.error.find("'type'"), std::string::npos);
}

TEST_F(ProjectConfigTest, InvalidOutputFormat)
{
  auto r = parse_project_config("output:\n  format: xml\n", types);
  ASSERT_FALSE(r.success);
  EXPECT_NE(r.error.find("output.format"), std::string::npos);
}

TEST_F(ProjectConfigTest, InvalidColorMode)
{
  auto r = parse_project_config("output:\n  color: sometimes\n", types);
  ASSERT_FALSE(r.success);
  EXPECT_NE(r.error.find("output.color"), std::string::npos);
}

TEST_F(ProjectConfigTest, SamplesMustBeList)
{
  auto r = parse_project_config("samples: identity\n", types);
  ASSERT_FALSE(r.success);
}

TEST_F(ProjectConfigTest, MalformedYaml)
{
  auto r = parse_project_config("context: [unclosed\n", types);
  ASSERT_FALSE(r.success);
  EXPECT_NE(r.error.find("failed to parse YAML"), std::string::npos);
}

TEST_F(ProjectConfigTest, LoadFromFileSetsProjectRoot)
{
  const fs::path dir = make_temp_dir("tlc_config");
  {
    std::ofstream out(dir / k_project_config_file_name);
    out << "context:\n  x: Int\n";
  }

  auto r = load_project_config(dir / k_project_config_file_name, types);
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.project_root, fs::absolute(dir));
  ASSERT_EQ(r.config.context.size(), 1U);

  fs::remove_all(dir);
}

TEST_F(ProjectConfigTest, LoadMissingFile)
{
  auto r = load_project_config(fs::temp_directory_path() / "tlc_no_such_dir" / "tlc.yaml", types);
  ASSERT_FALSE(r.success);
  EXPECT_NE(r.error.find("not found"), std::string::npos);
}

TEST_F(ProjectConfigTest, FindSearchesUpward)
{
  const fs::path dir = make_temp_dir("tlc_find");
  const fs::path nested = dir / "a" / "b";
  fs::create_directories(nested);
  {
    std::ofstream out(dir / k_project_config_file_name);
    out << "samples: [identity]\n";
  }

  const auto found = find_project_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(dir / k_project_config_file_name));

  fs::remove_all(dir);
}
