/**
 * @file hierarchy_example.cpp
 * @brief 演示如何在进程内直接使用 QueryFacade
 *
 * 用法: prism_hierarchy_example [snapshot.json]
 * 不带参数时使用内置的小型 Java 模型。
 */

#include "core/QueryFacade.h"
#include "model/SnapshotLoader.h"
#include "utils/Logger.h"
#include <iostream>
#include <memory>

namespace {

std::unique_ptr<SnapshotCodeModel> buildDemoModel() {
    auto model = std::make_unique<SnapshotCodeModel>();
    model->addLanguage("JAVA");

    auto type = [](std::int64_t id, const std::string& name, const std::string& qualified, int line) {
        SnapshotCodeModel::Element e;
        e.id = id;
        e.kind = ElementKind::Class;
        e.name = name;
        e.qualifiedName = qualified;
        e.language = "JAVA";
        e.location = {"src/Shapes.java", line, 1};
        e.endLine = line + 9;
        return e;
    };
    auto method = [](std::int64_t id, std::int64_t container, int line) {
        SnapshotCodeModel::Element e;
        e.id = id;
        e.kind = ElementKind::Method;
        e.name = "area";
        e.language = "JAVA";
        e.container = container;
        e.location = {"src/Shapes.java", line, 5};
        e.endLine = line + 2;
        e.signature.returnType = "double";
        return e;
    };

    auto shape = type(1, "Shape", "demo.Shape", 1);
    shape.kind = ElementKind::AbstractClass;
    model->addElement(shape);
    model->addElement(method(2, 1, 3));

    auto circle = type(3, "Circle", "demo.Circle", 20);
    circle.supertypes.push_back({"demo.Shape", false, 0});
    model->addElement(circle);
    auto circleArea = method(4, 3, 22);
    circleArea.overrides.push_back(2);
    model->addElement(circleArea);

    auto square = type(5, "Square", "demo.Square", 40);
    square.supertypes.push_back({"demo.Shape", false, 0});
    model->addElement(square);
    auto squareArea = method(6, 5, 42);
    squareArea.overrides.push_back(2);
    model->addElement(squareArea);

    model->buildIndices();
    return model;
}

} // namespace

int main(int argc, char* argv[]) {
    Logger::getInstance().setLogFile("");
    std::cout << "=== Prism 层级查询演示 ===" << std::endl;

    std::unique_ptr<SnapshotCodeModel> model;
    try {
        model = argc > 1 ? SnapshotLoader::loadFile(argv[1]) : buildDemoModel();
    } catch (const std::exception& e) {
        std::cerr << "加载快照失败: " << e.what() << std::endl;
        return 1;
    }

    QueryFacade facade = QueryFacade::create(*model, Config::defaults());

    // ========================================
    // 场景 1: 类型层级
    // ========================================
    auto types = facade.typeHierarchy(StartRef::named(argc > 2 ? argv[2] : "demo.Shape"));
    if (types) {
        std::cout << types.value().toJson().dump(2) << std::endl;
    } else {
        std::cout << "type_hierarchy: " << types.error().message << std::endl;
    }

    // ========================================
    // 场景 2: 覆写方法
    // ========================================
    auto impls = facade.findImplementations(StartRef::at("src/Shapes.java", 3, 5));
    if (impls) {
        for (const auto& impl : impls.value().implementations) {
            std::cout << "  " << impl.name << "  " << impl.file << ":" << impl.line << std::endl;
        }
    } else {
        std::cout << "find_implementations: " << impls.error().message << std::endl;
    }

    // ========================================
    // 场景 3: 模糊符号搜索
    // ========================================
    auto symbols = facade.searchSymbols("shp");
    if (symbols) {
        std::cout << symbols.value().toJson().dump(2) << std::endl;
    }

    return 0;
}
