#include "handlers/javascript/JavaScriptHandlers.h"

std::string JavaScriptLanguageSupport::methodSignature(const ICodeModel& model, const ElementHandle& callable) const {
    Signature sig = model.signatureOf(callable);
    std::vector<std::string> params;
    for (const auto& p : sig.parameters) {
        params.push_back(p.type.empty() ? p.name : p.name + ": " + p.type);
    }
    std::string result = model.nameOf(callable) + "(" + join(params, ", ") + ")";
    if (!sig.returnType.empty()) {
        result += ": " + sig.returnType;
    }
    return result;
}

void registerJavaScriptHandlers(HandlerRegistry& registry, const LanguageProbe& probe) {
    registerFamily(registry, std::make_shared<JavaScriptLanguageSupport>(), probe, {"TypeScript"});
}
