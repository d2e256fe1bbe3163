#pragma once
#include "analysis/LanguageSupport.h"
#include "handlers/LanguageFamilies.h"

// Rust. Trait impls are recorded as override edges; members render as Type::name.
class RustLanguageSupport : public LanguageSupport {
public:
    std::string familyName() const override { return "Rust"; }
    std::vector<std::string> languageIds() const override { return {"Rust"}; }

    bool followsOverrideEdges() const override { return true; }

    std::string unresolvedSupertypeKind(const SupertypeRef& ref) const override { return "TRAIT"; }

    std::string callNodeName(const ICodeModel& model, const ElementHandle& callable) const override {
        return memberName(model, callable);
    }
    std::string methodSignature(const ICodeModel& model, const ElementHandle& callable) const override;
    std::string methodKey(const ICodeModel& model, const ElementHandle& callable) const override {
        return locationKey(model, callable);
    }

protected:
    std::string memberSeparator() const override { return "::"; }
};

void registerRustHandlers(HandlerRegistry& registry, const LanguageProbe& probe);
