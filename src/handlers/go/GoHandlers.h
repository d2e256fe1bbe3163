#pragma once
#include "analysis/LanguageSupport.h"
#include "handlers/LanguageFamilies.h"

/**
 * @brief Go. Embedded structs and satisfied interfaces appear as supertypes,
 * and a method matches an ancestor's only when the parameter types agree.
 */
class GoLanguageSupport : public LanguageSupport {
public:
    std::string familyName() const override { return "Go"; }
    std::vector<std::string> languageIds() const override { return {"go"}; }
    std::string displayLanguage(const std::string& languageId) const override {
        return languageId == "go" ? "Go" : languageId;
    }

    bool comparesSignatures() const override { return true; }

    std::string unresolvedSupertypeKind(const SupertypeRef& ref) const override {
        return ref.isInterface ? "INTERFACE" : "STRUCT";
    }

    std::string callNodeName(const ICodeModel& model, const ElementHandle& callable) const override {
        return memberName(model, callable);
    }
    std::string methodSignature(const ICodeModel& model, const ElementHandle& callable) const override;
    std::string methodKey(const ICodeModel& model, const ElementHandle& callable) const override {
        return locationKey(model, callable);
    }
};

void registerGoHandlers(HandlerRegistry& registry, const LanguageProbe& probe);
