#include "handlers/go/GoHandlers.h"

std::string GoLanguageSupport::methodSignature(const ICodeModel& model, const ElementHandle& callable) const {
    Signature sig = model.signatureOf(callable);
    std::vector<std::string> params;
    for (const auto& p : sig.parameters) {
        params.push_back(p.type.empty() ? p.name : p.name + " " + p.type);
    }
    std::string result = "func " + model.nameOf(callable) + "(" + join(params, ", ") + ")";
    if (!sig.returnType.empty()) {
        result += " " + sig.returnType;
    }
    return result;
}

void registerGoHandlers(HandlerRegistry& registry, const LanguageProbe& probe) {
    registerFamily(registry, std::make_shared<GoLanguageSupport>(), probe);
}
