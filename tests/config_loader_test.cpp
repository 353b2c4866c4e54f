// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for EngineConfig loading.
//
// Validates:
//   - Missing keys keep their defaults
//   - Method names and symbols are normalized
//   - Invalid methods and price tables are rejected
//   - loadEngineConfig() returns nullopt for unreadable or malformed files
// =============================================================================

#include "costbasis/config/config_loader.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using costbasis::domain::CostBasisMethod;
using nlohmann::json;

// Writes `content` to a file under the system temp directory and returns the
// path. The caller removes it.
static std::string writeTempFile(const std::string& name,
                                 const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << content;
  return path.string();
}

TEST(ConfigLoaderTest, EmptyObjectKeepsDefaults) {
  const auto config = costbasis::engineConfigFromJson(json::object());

  EXPECT_EQ(config.default_method, CostBasisMethod::Fifo);
  EXPECT_EQ(config.command_endpoint, "tcp://127.0.0.1:5556");
  EXPECT_TRUE(config.prices.empty());
}

TEST(ConfigLoaderTest, ReadsAllFields) {
  const json j = {{"default_method", "hifo"},
                  {"command_endpoint", "ipc:///tmp/costbasis.sock"},
                  {"prices", {{"aapl", 190.5}, {"MSFT", 410.0}}}};

  const auto config = costbasis::engineConfigFromJson(j);

  EXPECT_EQ(config.default_method, CostBasisMethod::Hifo);
  EXPECT_EQ(config.command_endpoint, "ipc:///tmp/costbasis.sock");
  ASSERT_EQ(config.prices.size(), 2u);
  EXPECT_DOUBLE_EQ(config.prices.at("AAPL"), 190.5);
  EXPECT_DOUBLE_EQ(config.prices.at("MSFT"), 410.0);
}

TEST(ConfigLoaderTest, RejectsInvalidValues) {
  EXPECT_THROW(costbasis::engineConfigFromJson({{"default_method", "AVG"}}),
               std::invalid_argument);
  EXPECT_THROW(costbasis::engineConfigFromJson({{"default_method", "SPECID"}}),
               std::invalid_argument);
  EXPECT_THROW(costbasis::engineConfigFromJson({{"prices", json::array()}}),
               std::invalid_argument);
}

TEST(ConfigLoaderTest, LoadsFromFile) {
  const auto path = writeTempFile(
      "costbasis_config_test.json",
      R"({"default_method": "LIFO", "command_endpoint": "", "prices": {}})");

  const auto config = costbasis::loadEngineConfig(path);
  std::remove(path.c_str());

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->default_method, CostBasisMethod::Lifo);
  EXPECT_TRUE(config->command_endpoint.empty());
}

TEST(ConfigLoaderTest, MalformedOrMissingFileYieldsNullopt) {
  const auto path =
      writeTempFile("costbasis_config_bad.json", "{ \"default_method\": ");

  EXPECT_FALSE(costbasis::loadEngineConfig(path).has_value());
  std::remove(path.c_str());

  EXPECT_FALSE(
      costbasis::loadEngineConfig("/nonexistent/costbasis.json").has_value());
}
