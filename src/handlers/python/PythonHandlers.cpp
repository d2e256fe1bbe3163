#include "handlers/python/PythonHandlers.h"

bool PythonLanguageSupport::isImplicitRoot(const std::string& typeName) const {
    return typeName == "object" || typeName == "builtins.object";
}

std::string PythonLanguageSupport::callNodeName(const ICodeModel& model, const ElementHandle& callable) const {
    return memberName(model, callable);
}

std::string PythonLanguageSupport::renderParameters(const Signature& signature) const {
    std::vector<std::string> parts;
    for (const auto& p : signature.parameters) {
        if (isReceiver(p)) continue;
        parts.push_back(p.type.empty() ? p.name : p.name + ": " + p.type);
    }
    return join(parts, ", ");
}

std::string PythonLanguageSupport::methodSignature(const ICodeModel& model, const ElementHandle& callable) const {
    Signature sig = model.signatureOf(callable);
    std::string result = model.nameOf(callable) + "(" + renderParameters(sig) + ")";
    if (!sig.returnType.empty()) {
        result += " -> " + sig.returnType;
    }
    return result;
}

// No overloading, so the containing class and name identify a function.
std::string PythonLanguageSupport::methodKey(const ICodeModel& model, const ElementHandle& callable) const {
    auto owner = model.enclosingDeclaration(callable);
    auto type = owner ? containingType(model, *owner) : std::nullopt;
    if (!type) return locationKey(model, callable);
    return typeDisplayName(model, *type) + "." + model.nameOf(callable);
}

void registerPythonHandlers(HandlerRegistry& registry, const LanguageProbe& probe) {
    registerFamily(registry, std::make_shared<PythonLanguageSupport>(), probe);
}
