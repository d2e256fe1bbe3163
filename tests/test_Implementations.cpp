#include <gtest/gtest.h>
#include <string>

#include "core/QueryFacade.h"
#include "TestSnapshots.h"

TEST(Implementations, OverridingMethodsAcrossLanguages) {
  auto model = TestSnapshots::load(TestSnapshots::ZOO);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.findImplementations(StartRef::at("src/Animal.java", 6, 1));
  ASSERT_TRUE(result.ok()) << result.error().message;
  const auto& impls = result.value().implementations;
  ASSERT_EQ(impls.size(), 2u);
  EXPECT_EQ(impls[0].name, "Dog.speak");
  EXPECT_EQ(impls[0].kind, "METHOD");
  EXPECT_EQ(impls[0].language, "Java");
  EXPECT_EQ(impls[1].name, "Puppy.speak");
  EXPECT_EQ(impls[1].language, "Kotlin");
  EXPECT_EQ(impls[1].file, "src/Puppy.kt");
}

TEST(Implementations, SubtypesOfType) {
  auto model = TestSnapshots::load(TestSnapshots::ZOO);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.findImplementations(StartRef::named("com.zoo.Animal"));
  ASSERT_TRUE(result.ok()) << result.error().message;
  const auto& impls = result.value().implementations;
  ASSERT_EQ(impls.size(), 2u);
  EXPECT_EQ(impls[0].name, "com.zoo.Dog");
  EXPECT_EQ(impls[0].kind, "CLASS");
  EXPECT_EQ(impls[1].name, "com.zoo.Puppy");
}

TEST(Implementations, GoInterface) {
  auto model = TestSnapshots::load(TestSnapshots::GO);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.findImplementations(StartRef::named("io.Reader"));
  ASSERT_TRUE(result.ok()) << result.error().message;
  const auto& impls = result.value().implementations;
  ASSERT_EQ(impls.size(), 2u);
  EXPECT_EQ(impls[0].kind, "STRUCT");
  EXPECT_EQ(impls[0].language, "Go");
}

TEST(Implementations, LimitCapsResults) {
  auto model = TestSnapshots::load(TestSnapshots::ZOO);
  Config config = Config::defaults();
  config.limits.implementationLimit = 1;
  auto facade = QueryFacade::create(*model, config);

  auto result = facade.findImplementations(StartRef::named("com.zoo.Animal"));
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value().implementations.size(), 1u);
}

TEST(Implementations, LeafHasNone) {
  auto model = TestSnapshots::load(TestSnapshots::ZOO);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.findImplementations(StartRef::named("com.zoo.Puppy"));
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.value().implementations.empty());
}
