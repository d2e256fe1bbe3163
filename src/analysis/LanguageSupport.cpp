#include "analysis/LanguageSupport.h"
#include <algorithm>

namespace {
    // Enclosing-declaration chains in well-formed models are shallow.
    constexpr int MAX_ENCLOSING_HOPS = 64;
}

bool LanguageSupport::handlesLanguage(const std::string& languageId) const {
    auto ids = languageIds();
    return std::find(ids.begin(), ids.end(), languageId) != ids.end();
}

bool LanguageSupport::isImplicitRoot(const std::string& typeName) const {
    return false;
}

bool LanguageSupport::signaturesMatch(const Signature& a, const Signature& b) const {
    return a.parameterTypes() == b.parameterTypes();
}

std::optional<ElementHandle> LanguageSupport::containingType(const ICodeModel& model, const ElementHandle& element) const {
    std::optional<ElementHandle> current = element;
    for (int hops = 0; current && hops < MAX_ENCLOSING_HOPS; ++hops) {
        if (isTypeKind(model.kindOf(*current))) return current;
        current = model.enclosingDeclaration(*current);
    }
    return std::nullopt;
}

std::optional<ElementHandle> LanguageSupport::containingCallable(const ICodeModel& model, const ElementHandle& element) const {
    std::optional<ElementHandle> current = element;
    for (int hops = 0; current && hops < MAX_ENCLOSING_HOPS; ++hops) {
        if (isCallable(model.kindOf(*current))) return current;
        current = model.enclosingDeclaration(*current);
    }
    return std::nullopt;
}

std::string LanguageSupport::typeDisplayName(const ICodeModel& model, const ElementHandle& type) const {
    auto qualified = model.qualifiedNameOf(type);
    if (qualified) return *qualified;
    std::string name = model.nameOf(type);
    return name.empty() ? "unknown" : name;
}

std::string LanguageSupport::typeKind(const ICodeModel& model, const ElementHandle& type) const {
    return kindName(model.kindOf(type));
}

std::string LanguageSupport::unresolvedSupertypeKind(const SupertypeRef& ref) const {
    return ref.isInterface ? "INTERFACE" : "CLASS";
}

bool LanguageSupport::isInterfaceLike(ElementKind kind) const {
    return kind == ElementKind::Interface || kind == ElementKind::Trait || kind == ElementKind::Protocol;
}

std::string LanguageSupport::join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::string LanguageSupport::renderParameters(const Signature& signature) const {
    std::vector<std::string> parts;
    for (const auto& p : signature.parameters) {
        parts.push_back(p.type.empty() ? p.name : p.type);
    }
    return join(parts, ", ");
}

std::string LanguageSupport::memberName(const ICodeModel& model, const ElementHandle& callable) const {
    auto owner = model.enclosingDeclaration(callable);
    auto type = owner ? containingType(model, *owner) : std::nullopt;
    if (!type) return model.nameOf(callable);
    return model.nameOf(*type) + memberSeparator() + model.nameOf(callable);
}

std::string LanguageSupport::locationKey(const ICodeModel& model, const ElementHandle& callable) const {
    auto loc = model.locationOf(callable);
    std::string path = loc ? loc->path : std::string();
    int line = loc ? loc->line : 0;
    return path + ":" + std::to_string(line) + ":" + model.nameOf(callable);
}

std::string LanguageSupport::callNodeName(const ICodeModel& model, const ElementHandle& callable) const {
    return memberName(model, callable) + "(" + renderParameters(model.signatureOf(callable)) + ")";
}

std::string LanguageSupport::methodSignature(const ICodeModel& model, const ElementHandle& callable) const {
    Signature sig = model.signatureOf(callable);
    std::vector<std::string> params;
    for (const auto& p : sig.parameters) {
        if (p.type.empty()) {
            params.push_back(p.name);
        } else if (p.name.empty()) {
            params.push_back(p.type);
        } else {
            params.push_back(p.type + " " + p.name);
        }
    }
    std::string result = model.nameOf(callable) + "(" + join(params, ", ") + ")";
    if (!sig.returnType.empty()) {
        result += ": " + sig.returnType;
    }
    return result;
}

std::string LanguageSupport::methodKey(const ICodeModel& model, const ElementHandle& callable) const {
    std::string prefix;
    auto owner = model.enclosingDeclaration(callable);
    auto type = owner ? containingType(model, *owner) : std::nullopt;
    if (type) {
        prefix = typeDisplayName(model, *type) + "." + model.nameOf(callable);
    } else if (auto qualified = model.qualifiedNameOf(callable)) {
        prefix = *qualified;
    } else {
        auto loc = model.locationOf(callable);
        prefix = (loc ? loc->path : std::string("?")) + ":" + model.nameOf(callable);
    }
    return prefix + "(" + join(model.signatureOf(callable).parameterTypes(), ",") + ")";
}

std::string LanguageSupport::implementationName(const ICodeModel& model, const ElementHandle& method) const {
    return memberName(model, method);
}

std::string LanguageSupport::unresolvedCallName(const CallSite& site) const {
    std::string text = site.text.empty() ? "<call>" : site.text.substr(0, 50);
    return text + "(...) [unresolved]";
}
