#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "core/ConfigManager.h"

namespace fs = std::filesystem;

static fs::path writeConfig(const std::string& dir, const std::string& content) {
  fs::path root = fs::temp_directory_path() / dir;
  std::error_code ec;
  fs::remove_all(root, ec);
  fs::create_directories(root);
  fs::path file = root / "prism.json";
  std::ofstream out(file);
  out << content;
  return file;
}

TEST(Config, Defaults) {
  Config cfg = Config::defaults();
  EXPECT_TRUE(cfg.snapshotPath.empty());
  EXPECT_FALSE(cfg.enableDebug);
  EXPECT_EQ(cfg.limits.defaultCallDepth, 3);
  EXPECT_EQ(cfg.limits.maxCallDepth, 5);
  EXPECT_EQ(cfg.limits.defaultSymbolLimit, 25);
  EXPECT_EQ(cfg.limits.maxSymbolLimit, 100);
  EXPECT_EQ(cfg.limits.callResultsPerLevel, 20);
  EXPECT_EQ(cfg.limits.superMethodSearchCap, 10);
}

TEST(Config, LoadsLimitsAndDisabledLanguages) {
  fs::path file = writeConfig("prism_config_full", R"({
    "snapshot": "index.json",
    "debug": true,
    "disabled_languages": ["Rust"],
    "limits": {"max_call_depth": 4, "default_symbol_limit": 10}
  })");

  Config cfg = Config::load(file.u8string());
  EXPECT_TRUE(cfg.enableDebug);
  EXPECT_TRUE(cfg.isLanguageDisabled("Rust"));
  EXPECT_FALSE(cfg.isLanguageDisabled("go"));
  EXPECT_EQ(cfg.limits.maxCallDepth, 4);
  EXPECT_EQ(cfg.limits.defaultSymbolLimit, 10);
  EXPECT_EQ(cfg.limits.maxSymbolLimit, 100);
}

TEST(Config, RelativeSnapshotIsResolvedAgainstConfigFile) {
  fs::path file = writeConfig("prism_config_relative", R"({"snapshot": "data/index.json"})");
  Config cfg = Config::load(file.u8string());
  EXPECT_EQ(fs::u8path(cfg.snapshotPath), file.parent_path() / "data" / "index.json");
}

TEST(Config, InvalidJsonThrows) {
  fs::path file = writeConfig("prism_config_invalid", "{ snapshot: ");
  EXPECT_THROW(Config::load(file.u8string()), std::runtime_error);
}

TEST(Config, WrongTypeThrows) {
  fs::path file = writeConfig("prism_config_type", R"({"limits": {"max_call_depth": "deep"}})");
  EXPECT_THROW(Config::load(file.u8string()), std::runtime_error);
}

TEST(Config, LimitsAreClampedToSupportedRanges) {
  fs::path file = writeConfig("prism_config_clamp", R"({
    "limits": {"max_call_depth": 500, "default_call_depth": 9,
               "max_symbol_limit": 5000, "default_symbol_limit": 0,
               "call_stack_depth": 1000, "type_hierarchy_depth": 400}
  })");

  Config cfg = Config::load(file.u8string());
  EXPECT_EQ(cfg.limits.maxCallDepth, 5);
  EXPECT_EQ(cfg.limits.defaultCallDepth, 5);
  EXPECT_EQ(cfg.limits.maxSymbolLimit, 100);
  EXPECT_EQ(cfg.limits.defaultSymbolLimit, 1);
  EXPECT_EQ(cfg.limits.callStackDepth, 50);
  EXPECT_EQ(cfg.limits.typeHierarchyDepth, 100);
  EXPECT_EQ(cfg.limits.clampCallDepth(50), 5);
}

TEST(Config, NegativeLimitThrows) {
  fs::path file = writeConfig("prism_config_negative", R"({"limits": {"subtype_limit": -1}})");
  EXPECT_THROW(Config::load(file.u8string()), std::runtime_error);
  EXPECT_THROW(Config::fromJson(nlohmann::json::parse(R"({"limits": {"call_results_per_level": -3}})")),
               std::runtime_error);
}

TEST(Config, MissingFileThrows) {
  EXPECT_THROW(Config::load("/nonexistent/prism.json"), std::runtime_error);
}

TEST(QueryLimits, Clamping) {
  QueryLimits limits;
  EXPECT_EQ(limits.clampCallDepth(0), 1);
  EXPECT_EQ(limits.clampCallDepth(3), 3);
  EXPECT_EQ(limits.clampCallDepth(50), 5);
  EXPECT_EQ(limits.clampSymbolLimit(-4), 1);
  EXPECT_EQ(limits.clampSymbolLimit(1000), 100);
}
