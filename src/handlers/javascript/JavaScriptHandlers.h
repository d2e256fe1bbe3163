#pragma once
#include "analysis/LanguageSupport.h"
#include "handlers/LanguageFamilies.h"

// Script family: JavaScript, with TypeScript sharing its model.
class JavaScriptLanguageSupport : public LanguageSupport {
public:
    std::string familyName() const override { return "JavaScript"; }
    std::vector<std::string> languageIds() const override { return {"JavaScript", "TypeScript"}; }

    bool isImplicitRoot(const std::string& typeName) const override { return typeName == "Object"; }

    std::string callNodeName(const ICodeModel& model, const ElementHandle& callable) const override {
        return memberName(model, callable);
    }
    std::string methodSignature(const ICodeModel& model, const ElementHandle& callable) const override;
    std::string methodKey(const ICodeModel& model, const ElementHandle& callable) const override {
        return locationKey(model, callable);
    }
};

void registerJavaScriptHandlers(HandlerRegistry& registry, const LanguageProbe& probe);
