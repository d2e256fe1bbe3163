#include "handlers/php/PhpHandlers.h"

std::string PhpLanguageSupport::variableName(const Parameter& p) {
    if (p.name.empty() || p.name[0] == '$') return p.name;
    return "$" + p.name;
}

std::string PhpLanguageSupport::renderParameters(const Signature& signature) const {
    std::vector<std::string> parts;
    for (const auto& p : signature.parameters) {
        std::string var = variableName(p);
        parts.push_back(p.type.empty() ? var : p.type + " " + var);
    }
    return join(parts, ", ");
}

std::string PhpLanguageSupport::methodSignature(const ICodeModel& model, const ElementHandle& callable) const {
    return model.nameOf(callable) + "(" + renderParameters(model.signatureOf(callable)) + ")";
}

std::string PhpLanguageSupport::methodKey(const ICodeModel& model, const ElementHandle& callable) const {
    auto owner = model.enclosingDeclaration(callable);
    auto type = owner ? containingType(model, *owner) : std::nullopt;
    if (!type) return locationKey(model, callable);
    return typeDisplayName(model, *type) + "::" + model.nameOf(callable);
}

void registerPhpHandlers(HandlerRegistry& registry, const LanguageProbe& probe) {
    registerFamily(registry, std::make_shared<PhpLanguageSupport>(), probe);
}
