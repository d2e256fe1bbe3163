#include <gtest/gtest.h>
#include <set>
#include <string>

#include "analysis/CallHierarchyResolver.h"
#include "core/QueryFacade.h"
#include "handlers/python/PythonHandlers.h"
#include "TestSnapshots.h"

static void collectNames(const std::vector<CallNode>& nodes, std::vector<std::string>& out) {
  for (const auto& n : nodes) {
    out.push_back(n.name);
    collectNames(n.children, out);
  }
}

TEST(CallHierarchy, CallersTwoLevelsDeep) {
  auto model = TestSnapshots::load(TestSnapshots::CALLS);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.callHierarchy(StartRef::named("app.t.target"), "callers", 2);
  ASSERT_TRUE(result.ok()) << result.error().message;
  const auto& h = result.value();

  EXPECT_EQ(h.node.name, "target");
  EXPECT_EQ(h.node.file, "app/t.py");
  EXPECT_EQ(h.node.language, "Python");
  ASSERT_EQ(h.calls.size(), 1u);
  EXPECT_EQ(h.calls[0].name, "B.g");
  ASSERT_EQ(h.calls[0].children.size(), 1u);
  EXPECT_EQ(h.calls[0].children[0].name, "A.f");
  EXPECT_TRUE(h.calls[0].children[0].children.empty());
}

TEST(CallHierarchy, DepthOneHasNoGrandchildren) {
  auto model = TestSnapshots::load(TestSnapshots::CALLS);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.callHierarchy(StartRef::named("app.t.target"), "callers", 1);
  ASSERT_TRUE(result.ok()) << result.error().message;
  ASSERT_EQ(result.value().calls.size(), 1u);
  EXPECT_TRUE(result.value().calls[0].children.empty());
}

TEST(CallHierarchy, CycleDoesNotRepeatMethods) {
  auto model = TestSnapshots::load(TestSnapshots::CALLS);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.callHierarchy(StartRef::named("app.t.target"), "callers", 5);
  ASSERT_TRUE(result.ok()) << result.error().message;

  std::vector<std::string> names;
  collectNames(result.value().calls, names);
  std::set<std::string> unique(names.begin(), names.end());
  EXPECT_EQ(names.size(), unique.size());
  EXPECT_EQ(unique.count("target"), 0u);
  EXPECT_EQ(names, (std::vector<std::string>{"B.g", "A.f"}));
}

TEST(CallHierarchy, CalleesWithUnresolvedLeaf) {
  auto model = TestSnapshots::load(TestSnapshots::CALLS);
  auto facade = QueryFacade::create(*model, Config::defaults());

  // Line 3 of app/a.py is inside A.f.
  auto result = facade.callHierarchy(StartRef::at("app/a.py", 3, 5), "callees", 3);
  ASSERT_TRUE(result.ok()) << result.error().message;
  const auto& h = result.value();
  EXPECT_EQ(h.node.name, "A.f");

  ASSERT_EQ(h.calls.size(), 1u);
  const CallNode& g = h.calls[0];
  EXPECT_EQ(g.name, "B.g");
  ASSERT_EQ(g.children.size(), 2u);
  EXPECT_EQ(g.children[0].name, "target");
  // target calls A.f, which is the root.
  EXPECT_TRUE(g.children[0].children.empty());

  const CallNode& print = g.children[1];
  EXPECT_EQ(print.name, "print(...) [unresolved]");
  EXPECT_EQ(print.file, "app/b.py");
  EXPECT_EQ(print.line, 4);
  EXPECT_EQ(print.language, "Python");
  EXPECT_TRUE(print.children.empty());
}

TEST(CallHierarchy, DepthIsClamped) {
  auto model = TestSnapshots::load(TestSnapshots::CALLS);
  Config config = Config::defaults();
  config.limits.maxCallDepth = 1;
  auto facade = QueryFacade::create(*model, config);

  auto result = facade.callHierarchy(StartRef::named("app.t.target"), "callers", 10);
  ASSERT_TRUE(result.ok()) << result.error().message;
  ASSERT_EQ(result.value().calls.size(), 1u);
  EXPECT_TRUE(result.value().calls[0].children.empty());
}

TEST(CallHierarchy, JavaCallersThroughBaseMethod) {
  auto model = TestSnapshots::load(TestSnapshots::ZOO);
  auto facade = QueryFacade::create(*model, Config::defaults());

  // Dog.speak starts on line 5 of Dog.java.
  auto result = facade.callHierarchy(StartRef::at("src/Dog.java", 6, 9), "callers", 1);
  ASSERT_TRUE(result.ok()) << result.error().message;
  const auto& h = result.value();
  EXPECT_EQ(h.node.name, "Dog.speak()");
  EXPECT_EQ(h.node.language, "Java");

  ASSERT_EQ(h.calls.size(), 2u);
  EXPECT_EQ(h.calls[0].name, "Zoo.feed(Dog)");
  EXPECT_EQ(h.calls[1].name, "Zoo.main(String[])");
}

TEST(CallHierarchy, KotlinOverrideFindsCallersOfAncestors) {
  auto model = TestSnapshots::load(TestSnapshots::ZOO);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.callHierarchy(StartRef::at("src/Puppy.kt", 4, 1), "callers", 1);
  ASSERT_TRUE(result.ok()) << result.error().message;
  EXPECT_EQ(result.value().node.language, "Kotlin");
  EXPECT_EQ(result.value().calls.size(), 2u);
}

TEST(CallHierarchy, JavaCalleesIncludeUnresolvedCall) {
  auto model = TestSnapshots::load(TestSnapshots::ZOO);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.callHierarchy(StartRef::at("src/Zoo.java", 12, 1), "callees", 1);
  ASSERT_TRUE(result.ok()) << result.error().message;
  const auto& calls = result.value().calls;
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0].name, "Dog.speak()");
  EXPECT_EQ(calls[1].name, "dog.wagTail(...) [unresolved]");
  EXPECT_EQ(calls[1].line, 14);
}

TEST(CallHierarchy, RustUsesPathSeparator) {
  auto model = TestSnapshots::load(TestSnapshots::RUST);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.callHierarchy(StartRef::at("src/geo.rs", 11, 1), "callers", 2);
  ASSERT_TRUE(result.ok()) << result.error().message;
  EXPECT_EQ(result.value().node.name, "Circle::area");
  ASSERT_EQ(result.value().calls.size(), 1u);
  EXPECT_EQ(result.value().calls[0].name, "main");
  EXPECT_EQ(result.value().calls[0].language, "Rust");
}

TEST(CallHierarchy, ResultsPerLevelAreCapped) {
  auto model = TestSnapshots::load(TestSnapshots::ZOO);
  Config config = Config::defaults();
  config.limits.callResultsPerLevel = 1;
  auto facade = QueryFacade::create(*model, config);
  auto result = facade.callHierarchy(StartRef::at("src/Dog.java", 6, 9), "callers", 1);
  ASSERT_TRUE(result.ok()) << result.error().message;
  EXPECT_EQ(result.value().calls.size(), 1u);
}

TEST(CallHierarchy, ParseDirection) {
  EXPECT_EQ(parseCallDirection("callers"), CallDirection::Callers);
  EXPECT_EQ(parseCallDirection("callees"), CallDirection::Callees);
  EXPECT_FALSE(parseCallDirection("sideways").has_value());
  EXPECT_EQ(callDirectionName(CallDirection::Callees), "callees");
}

TEST(CallHierarchy, ExpandedCallersDoNotUseLevelSlots) {
  auto model = TestSnapshots::load(TestSnapshots::RELAY);
  PythonLanguageSupport support;
  QueryLimits limits;
  limits.callResultsPerLevel = 1;
  QueryContext ctx{*model, limits, CancellationToken::none()};

  auto t = model->resolveByQualifiedName("relay.t");
  ASSERT_TRUE(t.has_value());
  auto result = CallHierarchyResolver(support, ctx).resolve(*t, CallDirection::Callers, 2);
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->calls.size(), 1u);
  EXPECT_EQ(result->calls[0].name, "f");
  // t also calls f, but t is the root; the single slot goes to g.
  ASSERT_EQ(result->calls[0].children.size(), 1u);
  EXPECT_EQ(result->calls[0].children[0].name, "g");
}

TEST(CallHierarchy, PhpCalleesResolveTypeTargets) {
  auto model = TestSnapshots::load(TestSnapshots::PHP);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.callHierarchy(StartRef::at("src/UserRepo.php", 7, 1), "callees", 1);
  ASSERT_TRUE(result.ok()) << result.error().message;
  const auto& h = result.value();
  EXPECT_EQ(h.node.name, "UserRepo::save");
  EXPECT_EQ(h.node.language, "PHP");

  const auto& calls = h.calls;
  ASSERT_EQ(calls.size(), 3u);
  EXPECT_EQ(calls[0].name, "Loggable::log");
  EXPECT_EQ(calls[0].file, "src/Loggable.php");
  // `new User` lands on the declared constructor.
  EXPECT_EQ(calls[1].name, "User::__construct");
  EXPECT_EQ(calls[1].line, 3);
  // Audit declares no constructor; the call still resolved to the class.
  EXPECT_EQ(calls[2].name, "Audit(...)");
  EXPECT_EQ(calls[2].file, "src/Audit.php");
  EXPECT_EQ(calls[2].line, 1);
  EXPECT_EQ(calls[2].name.find("[unresolved]"), std::string::npos);
}
