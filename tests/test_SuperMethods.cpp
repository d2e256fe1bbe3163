#include <gtest/gtest.h>
#include <string>

#include "core/QueryFacade.h"
#include "TestSnapshots.h"

TEST(SuperMethods, JavaOverrideChain) {
  auto model = TestSnapshots::load(TestSnapshots::CHAIN);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.superMethods(StartRef::at("Leaf.java", 3, 1));
  ASSERT_TRUE(result.ok()) << result.error().message;
  const auto& r = result.value();

  EXPECT_EQ(r.method.name, "run");
  EXPECT_EQ(r.method.containingClass, "Leaf");
  EXPECT_EQ(r.method.signature, "run(): void");
  EXPECT_EQ(r.method.language, "Java");

  ASSERT_EQ(r.hierarchy.size(), 2u);
  EXPECT_EQ(r.hierarchy[0].containingClass, "Mid");
  EXPECT_EQ(r.hierarchy[0].depth, 1);
  EXPECT_EQ(r.hierarchy[0].containingClassKind, "CLASS");
  EXPECT_FALSE(r.hierarchy[0].isInterface);
  EXPECT_EQ(r.hierarchy[1].containingClass, "Base");
  EXPECT_EQ(r.hierarchy[1].depth, 2);
  ASSERT_TRUE(r.hierarchy[1].file.has_value());
  EXPECT_EQ(*r.hierarchy[1].file, "Base.java");
}

TEST(SuperMethods, RootMethodHasEmptyHierarchy) {
  auto model = TestSnapshots::load(TestSnapshots::CHAIN);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.superMethods(StartRef::at("Base.java", 3, 1));
  ASSERT_TRUE(result.ok()) << result.error().message;
  EXPECT_EQ(result.value().method.containingClass, "Base");
  EXPECT_TRUE(result.value().hierarchy.empty());
}

TEST(SuperMethods, OverrideOfLibraryInterface) {
  auto model = TestSnapshots::load(TestSnapshots::ZOO);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.superMethods(StartRef::at("src/Dog.java", 11, 1));
  ASSERT_TRUE(result.ok()) << result.error().message;
  const auto& h = result.value().hierarchy;
  ASSERT_EQ(h.size(), 1u);
  EXPECT_EQ(h[0].containingClass, "java.lang.Runnable");
  EXPECT_EQ(h[0].containingClassKind, "INTERFACE");
  EXPECT_TRUE(h[0].isInterface);
}

TEST(SuperMethods, PythonSkipsClassesWithoutTheMethod) {
  auto model = TestSnapshots::load(TestSnapshots::SHAPES);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.superMethods(StartRef::at("shapes/chain.py", 10, 5));
  ASSERT_TRUE(result.ok()) << result.error().message;
  const auto& r = result.value();
  EXPECT_EQ(r.method.containingClass, "shapes.Leaf");
  EXPECT_EQ(r.method.signature, "run()");

  ASSERT_EQ(r.hierarchy.size(), 1u);
  EXPECT_EQ(r.hierarchy[0].containingClass, "shapes.Base");
  EXPECT_EQ(r.hierarchy[0].depth, 1);
  EXPECT_EQ(r.hierarchy[0].language, "Python");
}

TEST(SuperMethods, GoRequiresMatchingParameterTypes) {
  auto model = TestSnapshots::load(TestSnapshots::GO);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto matching = facade.superMethods(StartRef::at("os/file.go", 6, 1));
  ASSERT_TRUE(matching.ok()) << matching.error().message;
  EXPECT_EQ(matching.value().method.signature, "func Read(p []byte) (int, error)");
  EXPECT_EQ(matching.value().method.language, "Go");
  ASSERT_EQ(matching.value().hierarchy.size(), 1u);
  EXPECT_EQ(matching.value().hierarchy[0].containingClass, "io.Reader");
  EXPECT_TRUE(matching.value().hierarchy[0].isInterface);

  auto mismatched = facade.superMethods(StartRef::at("bytes/buffer.go", 6, 1));
  ASSERT_TRUE(mismatched.ok()) << mismatched.error().message;
  EXPECT_TRUE(mismatched.value().hierarchy.empty());
}

TEST(SuperMethods, RustFollowsTraitImplEdges) {
  auto model = TestSnapshots::load(TestSnapshots::RUST);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.superMethods(StartRef::at("src/geo.rs", 11, 1));
  ASSERT_TRUE(result.ok()) << result.error().message;
  const auto& r = result.value();
  EXPECT_EQ(r.method.signature, "fn area(self: &self) -> f64");
  ASSERT_EQ(r.hierarchy.size(), 1u);
  EXPECT_EQ(r.hierarchy[0].containingClass, "geo::Shape");
  EXPECT_EQ(r.hierarchy[0].containingClassKind, "TRAIT");
  EXPECT_TRUE(r.hierarchy[0].isInterface);
}

TEST(SuperMethods, FreeFunctionHasNoContainingClass) {
  auto model = TestSnapshots::load(TestSnapshots::CALLS);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.superMethods(StartRef::named("app.t.target"));
  ASSERT_TRUE(result.ok()) << result.error().message;
  EXPECT_EQ(result.value().method.containingClass, "");
  EXPECT_TRUE(result.value().hierarchy.empty());
}

TEST(SuperMethods, ClassIsNotAMethod) {
  auto model = TestSnapshots::load(TestSnapshots::CHAIN);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.superMethods(StartRef::at("Leaf.java", 5, 1));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, QueryErrorKind::NotATypeOrMethod);
  EXPECT_EQ(result.error().code(), -32002);
}

TEST(SuperMethods, TypeScriptWalksBaseClassesByName) {
  auto model = TestSnapshots::load(TestSnapshots::SCRIPT);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.superMethods(StartRef::at("ui/button.ts", 4, 1));
  ASSERT_TRUE(result.ok()) << result.error().message;
  const auto& r = result.value();
  EXPECT_EQ(r.method.signature, "render(ctx: Canvas): void");
  ASSERT_EQ(r.hierarchy.size(), 1u);
  EXPECT_EQ(r.hierarchy[0].containingClass, "ui.Widget");
  EXPECT_EQ(r.hierarchy[0].language, "TypeScript");
}

TEST(SuperMethods, PhpWalksParentClassPastTrait) {
  auto model = TestSnapshots::load(TestSnapshots::PHP);
  auto facade = QueryFacade::create(*model, Config::defaults());

  auto result = facade.superMethods(StartRef::at("src/UserRepo.php", 6, 1));
  ASSERT_TRUE(result.ok()) << result.error().message;
  const auto& r = result.value();
  EXPECT_EQ(r.method.signature, "save(User $user)");
  EXPECT_EQ(r.method.containingClass, "App\\UserRepo");
  EXPECT_EQ(r.method.language, "PHP");

  ASSERT_EQ(r.hierarchy.size(), 2u);
  EXPECT_EQ(r.hierarchy[0].containingClass, "App\\BaseRepo");
  EXPECT_EQ(r.hierarchy[0].signature, "save(Entity $entity)");
  EXPECT_EQ(r.hierarchy[0].depth, 1);
  EXPECT_FALSE(r.hierarchy[0].isInterface);

  EXPECT_EQ(r.hierarchy[1].containingClass, "App\\Repository");
  EXPECT_EQ(r.hierarchy[1].signature, "save($entity)");
  EXPECT_EQ(r.hierarchy[1].depth, 2);
  EXPECT_TRUE(r.hierarchy[1].isInterface);
}
