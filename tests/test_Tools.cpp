/**
 * 导航工具测试：通过 ToolRegistry 调用五个工具，验证响应结构与错误格式。
 */
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

#include "tools/NavigationTools.h"
#include "tools/ToolRegistry.h"
#include "TestSnapshots.h"

class NavigationToolsTest : public ::testing::Test {
protected:
  void SetUp() override {
    model = TestSnapshots::load(TestSnapshots::ZOO);
    facade = std::make_unique<QueryFacade>(QueryFacade::create(*model, Config::defaults()));
    registerNavigationTools(registry, *facade);
  }

  static nlohmann::json payloadOf(const nlohmann::json& response) {
    EXPECT_TRUE(response.contains("content")) << response.dump(2);
    return nlohmann::json::parse(response["content"][0]["text"].get<std::string>());
  }

  std::unique_ptr<SnapshotCodeModel> model;
  std::unique_ptr<QueryFacade> facade;
  ToolRegistry registry;
};

TEST_F(NavigationToolsTest, ListsAllTools) {
  EXPECT_EQ(registry.getToolCount(), 5u);
  std::set<std::string> names;
  for (const auto& schema : registry.listToolSchemas()) {
    names.insert(schema["name"].get<std::string>());
    EXPECT_TRUE(schema.contains("description"));
    EXPECT_EQ(schema["inputSchema"]["type"], "object");
  }
  EXPECT_EQ(names, (std::set<std::string>{"call_hierarchy", "find_implementations", "find_symbol",
                                          "super_methods", "type_hierarchy"}));
}

TEST_F(NavigationToolsTest, TypeHierarchyByClassName) {
  auto res = registry.executeTool("type_hierarchy", {{"className", "com.zoo.Dog"}});
  ASSERT_FALSE(res.contains("isError")) << res.dump(2);
  auto payload = payloadOf(res);
  EXPECT_EQ(payload["element"]["name"], "Dog");
  EXPECT_EQ(payload["supertypes"].size(), 2u);
  EXPECT_EQ(payload["subtypes"][0]["name"], "Puppy");
}

TEST_F(NavigationToolsTest, CallHierarchyByPosition) {
  auto res = registry.executeTool("call_hierarchy",
                                  {{"file", "src/Dog.java"}, {"line", 6}, {"column", 9},
                                   {"direction", "callers"}, {"depth", 1}});
  ASSERT_FALSE(res.contains("isError")) << res.dump(2);
  auto payload = payloadOf(res);
  EXPECT_EQ(payload["element"]["name"], "Dog.speak()");
  EXPECT_EQ(payload["calls"].size(), 2u);
}

TEST_F(NavigationToolsTest, FindSymbol) {
  auto res = registry.executeTool("find_symbol", {{"query", "Dog"}, {"limit", 5}});
  ASSERT_FALSE(res.contains("isError")) << res.dump(2);
  auto payload = payloadOf(res);
  EXPECT_EQ(payload["query"], "Dog");
  ASSERT_FALSE(payload["symbols"].empty());
  EXPECT_EQ(payload["symbols"][0]["name"], "Dog");
}

TEST_F(NavigationToolsTest, SuperMethodsAndImplementations) {
  auto supers = registry.executeTool("super_methods", {{"file", "src/Puppy.kt"}, {"line", 4}, {"column", 1}});
  ASSERT_FALSE(supers.contains("isError")) << supers.dump(2);
  EXPECT_EQ(payloadOf(supers)["hierarchy"].size(), 2u);

  auto impls = registry.executeTool("find_implementations",
                                    {{"file", "src/Animal.java"}, {"line", 6}, {"column", 1}});
  ASSERT_FALSE(impls.contains("isError")) << impls.dump(2);
  EXPECT_EQ(payloadOf(impls)["implementations"].size(), 2u);
}

TEST_F(NavigationToolsTest, MissingFileIsInvalidArguments) {
  auto res = registry.executeTool("super_methods", {{"line", 1}, {"column", 1}});
  EXPECT_EQ(res["isError"], true);
  EXPECT_EQ(res["code"], -32602);
  EXPECT_EQ(res["errorKind"], "invalid_arguments");
  EXPECT_TRUE(res.contains("error"));
}

TEST_F(NavigationToolsTest, ZeroLineIsInvalidArguments) {
  auto res = registry.executeTool("type_hierarchy", {{"file", "src/Dog.java"}, {"line", 0}, {"column", 1}});
  EXPECT_EQ(res["isError"], true);
  EXPECT_EQ(res["code"], -32602);
}

TEST_F(NavigationToolsTest, MissingDirection) {
  auto res = registry.executeTool("call_hierarchy", {{"file", "src/Dog.java"}, {"line", 6}, {"column", 9}});
  EXPECT_EQ(res["isError"], true);
  EXPECT_EQ(res["errorKind"], "invalid_arguments");
}

TEST_F(NavigationToolsTest, QueryErrorsCarryCodes) {
  auto res = registry.executeTool("type_hierarchy", {{"file", "src/Nowhere.java"}, {"line", 1}, {"column", 1}});
  EXPECT_EQ(res["isError"], true);
  EXPECT_EQ(res["code"], -32002);
  EXPECT_EQ(res["errorKind"], "no_element_at_position");
}

TEST_F(NavigationToolsTest, CancelledToken) {
  CancellationToken token;
  token.cancel();
  auto res = registry.executeTool("type_hierarchy", {{"className", "com.zoo.Dog"}}, token);
  EXPECT_EQ(res["isError"], true);
  EXPECT_EQ(res["code"], -32800);
}

TEST_F(NavigationToolsTest, UnknownTool) {
  auto res = registry.executeTool("rename_symbol", nlohmann::json::object());
  EXPECT_EQ(res["isError"], true);
  EXPECT_NE(res["error"].get<std::string>().find("rename_symbol"), std::string::npos);
}

TEST_F(NavigationToolsTest, CallHierarchySchemaReflectsLimits) {
  ITool* tool = registry.getTool("call_hierarchy");
  ASSERT_NE(tool, nullptr);
  auto schema = tool->getSchema();
  EXPECT_EQ(schema["properties"]["depth"]["maximum"], 5);
  EXPECT_EQ(schema["properties"]["depth"]["default"], 3);
}
