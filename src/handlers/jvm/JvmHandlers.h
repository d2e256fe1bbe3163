#pragma once
#include "analysis/LanguageSupport.h"
#include "handlers/LanguageFamilies.h"

/**
 * @brief Class-based static family: Java, with Kotlin sharing its model.
 *
 * The model records explicit override edges for this family, and overloads
 * are told apart by parameter types.
 */
class JvmLanguageSupport : public LanguageSupport {
public:
    std::string familyName() const override { return "JVM"; }
    std::vector<std::string> languageIds() const override { return {"JAVA", "kotlin"}; }
    std::string displayLanguage(const std::string& languageId) const override;

    bool isImplicitRoot(const std::string& typeName) const override;
    int hierarchyDepthLimit(const QueryLimits& limits) const override { return limits.typeHierarchyDepth; }

    bool followsOverrideEdges() const override { return true; }
    bool comparesSignatures() const override { return true; }

    std::string methodSignature(const ICodeModel& model, const ElementHandle& callable) const override;
};

void registerJvmHandlers(HandlerRegistry& registry, const LanguageProbe& probe);
