#pragma once
#include "analysis/LanguageSupport.h"
#include "handlers/LanguageFamilies.h"

/**
 * @brief PHP. Single class inheritance plus interfaces and traits.
 *
 * There is no common root class and no overloading, so methods are keyed by
 * class and name, and overrides are found by walking supertypes by name.
 * Members render as "Class::method".
 */
class PhpLanguageSupport : public LanguageSupport {
public:
    std::string familyName() const override { return "PHP"; }
    std::vector<std::string> languageIds() const override { return {"PHP"}; }

    std::string callNodeName(const ICodeModel& model, const ElementHandle& callable) const override {
        return memberName(model, callable);
    }
    // "save(User $user, $flush)"
    std::string methodSignature(const ICodeModel& model, const ElementHandle& callable) const override;
    std::string methodKey(const ICodeModel& model, const ElementHandle& callable) const override;

protected:
    std::string memberSeparator() const override { return "::"; }
    std::string renderParameters(const Signature& signature) const override;

private:
    static std::string variableName(const Parameter& p);
};

void registerPhpHandlers(HandlerRegistry& registry, const LanguageProbe& probe);
