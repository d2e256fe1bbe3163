#include "handlers/jvm/JvmHandlers.h"

std::string JvmLanguageSupport::displayLanguage(const std::string& languageId) const {
    if (languageId == "kotlin") return "Kotlin";
    if (languageId == "JAVA") return "Java";
    return languageId;
}

bool JvmLanguageSupport::isImplicitRoot(const std::string& typeName) const {
    return typeName == "java.lang.Object" || typeName == "Object" ||
           typeName == "kotlin.Any" || typeName == "Any";
}

std::string JvmLanguageSupport::methodSignature(const ICodeModel& model, const ElementHandle& callable) const {
    Signature sig = model.signatureOf(callable);
    std::vector<std::string> params;
    for (const auto& p : sig.parameters) {
        params.push_back(p.type.empty() ? p.name : p.type + " " + p.name);
    }
    std::string returnType = sig.returnType.empty() ? "void" : sig.returnType;
    return model.nameOf(callable) + "(" + join(params, ", ") + "): " + returnType;
}

void registerJvmHandlers(HandlerRegistry& registry, const LanguageProbe& probe) {
    registerFamily(registry, std::make_shared<JvmLanguageSupport>(), probe, {"kotlin"});
}
