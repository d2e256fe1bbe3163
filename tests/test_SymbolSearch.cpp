#include <gtest/gtest.h>
#include <algorithm>
#include <string>

#include "analysis/SymbolSearcher.h"
#include "core/QueryFacade.h"
#include "TestSnapshots.h"

static std::vector<std::string> namesOf(const SymbolSearchResult& r) {
  std::vector<std::string> names;
  for (const auto& s : r.symbols) names.push_back(s.name);
  return names;
}

TEST(SymbolSearch, FuzzyMatchRankedByDistance) {
  auto model = TestSnapshots::load(TestSnapshots::SYMBOLS);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.searchSymbols("USvc");
  ASSERT_TRUE(result.ok()) << result.error().message;
  EXPECT_EQ(result.value().query, "USvc");

  // usvc is an exact match; UtilitySvc is 6 edits away, UserService 7.
  auto names = namesOf(result.value());
  EXPECT_EQ(names, (std::vector<std::string>{"usvc", "UtilitySvc", "UserService"}));

  const auto& field = result.value().symbols[0];
  EXPECT_EQ(field.kind, "FIELD");
  ASSERT_TRUE(field.containerName.has_value());
  EXPECT_EQ(*field.containerName, "Other");
  EXPECT_EQ(field.language, "Java");
}

TEST(SymbolSearch, LibrariesOnlyWhenRequested) {
  auto model = TestSnapshots::load(TestSnapshots::SYMBOLS);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto project = facade.searchSymbols("service", SearchScope::Project);
  ASSERT_TRUE(project.ok());
  EXPECT_EQ(namesOf(project.value()), (std::vector<std::string>{"UserService"}));

  auto all = facade.searchSymbols("service", SearchScope::ProjectAndLibraries);
  ASSERT_TRUE(all.ok());
  auto names = namesOf(all.value());
  EXPECT_EQ(names.size(), 2u);
  EXPECT_NE(std::find(names.begin(), names.end(), "UsbService"), names.end());
}

TEST(SymbolSearch, SharedModelResultsAreNotDuplicated) {
  // The JAVA handler and its kotlin delegate both search the same declarations.
  auto model = TestSnapshots::load(TestSnapshots::SYMBOLS);
  auto facade = QueryFacade::create(*model, Config::defaults());
  ASSERT_EQ(facade.getRegistry().getAllSymbolSearchHandlers().size(), 2u);

  auto result = facade.searchSymbols("UtilitySvc");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(namesOf(result.value()), (std::vector<std::string>{"UtilitySvc"}));
}

TEST(SymbolSearch, LimitIsClamped) {
  auto model = TestSnapshots::load(TestSnapshots::SYMBOLS);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto one = facade.searchSymbols("USvc", SearchScope::Project, 1);
  ASSERT_TRUE(one.ok());
  EXPECT_EQ(one.value().symbols.size(), 1u);

  // Non-positive limits are raised to 1.
  auto zero = facade.searchSymbols("USvc", SearchScope::Project, 0);
  ASSERT_TRUE(zero.ok());
  EXPECT_EQ(zero.value().symbols.size(), 1u);
}

TEST(SymbolSearch, BlankPatternIsRejected) {
  auto model = TestSnapshots::load(TestSnapshots::SYMBOLS);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.searchSymbols("   ");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, QueryErrorKind::InvalidArguments);
  EXPECT_EQ(result.error().code(), -32602);
}

TEST(SymbolSearch, NoMatchesIsEmptySuccess) {
  auto model = TestSnapshots::load(TestSnapshots::SYMBOLS);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.searchSymbols("zzqx");
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.value().symbols.empty());
}

TEST(SymbolSearch, NoHandlersReportsNoProvider) {
  auto model = TestSnapshots::load(R"({"version": 1, "languages": ["COBOL"]})");
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.searchSymbols("anything");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, QueryErrorKind::NoProviderForLanguage);
  EXPECT_EQ(result.error().code(), -32003);
}

TEST(SymbolSearch, RankKeepsOrderOfEqualMatches) {
  std::vector<SymbolMatch> matches(3);
  matches[0].name = "abcX";
  matches[0].file = "first";
  matches[1].name = "abc";
  matches[2].name = "abcY";
  matches[2].file = "second";

  SymbolSearcher::rank(matches, NameMatcher("abc"));
  EXPECT_EQ(matches[0].name, "abc");
  EXPECT_EQ(matches[1].file, "first");
  EXPECT_EQ(matches[2].file, "second");
}

TEST(SymbolSearch, DedupKey) {
  SymbolMatch m;
  m.name = "Foo";
  m.file = "a/Foo.java";
  m.line = 12;
  EXPECT_EQ(SymbolSearcher::dedupKey(m), "a/Foo.java:12:Foo");
}
