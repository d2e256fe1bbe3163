#pragma once
#include "analysis/LanguageSupport.h"
#include "handlers/LanguageFamilies.h"

// Dynamic family. Overrides are found by walking base classes by name.
class PythonLanguageSupport : public LanguageSupport {
public:
    std::string familyName() const override { return "Python"; }
    std::vector<std::string> languageIds() const override { return {"Python"}; }

    bool isImplicitRoot(const std::string& typeName) const override;

    std::string callNodeName(const ICodeModel& model, const ElementHandle& callable) const override;
    std::string methodSignature(const ICodeModel& model, const ElementHandle& callable) const override;
    std::string methodKey(const ICodeModel& model, const ElementHandle& callable) const override;

protected:
    std::string renderParameters(const Signature& signature) const override;

private:
    static bool isReceiver(const Parameter& p) { return p.name == "self" || p.name == "cls"; }
};

void registerPythonHandlers(HandlerRegistry& registry, const LanguageProbe& probe);
