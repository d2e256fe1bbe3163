#include "analysis/ImplementationFinder.h"
#include <algorithm>

ImplementationFinder::ImplementationFinder(const LanguageSupport& support, const QueryContext& ctx)
    : support(support), ctx(ctx) {}

std::optional<ImplementationsResult> ImplementationFinder::find(const ElementHandle& element) const {
    const size_t cap = static_cast<size_t>(std::max(0, ctx.limits.implementationLimit));
    ImplementationsResult result;
    auto& out = result.implementations;

    if (auto method = support.containingCallable(ctx.model, element)) {
        if (cap == 0) return result;
        ctx.model.overridingMethods(*method, [&](const ElementHandle& overrider) {
            ctx.cancel.checkCanceled();
            out.push_back(makeEntry(overrider, support.implementationName(ctx.model, overrider), "METHOD"));
            return out.size() < cap;
        });
        return result;
    }

    if (auto type = support.containingType(ctx.model, element)) {
        if (cap == 0) return result;
        ctx.model.transitiveSubtypes(*type, [&](const ElementHandle& subtype) {
            ctx.cancel.checkCanceled();
            out.push_back(makeEntry(subtype, support.typeDisplayName(ctx.model, subtype),
                                    support.typeKind(ctx.model, subtype)));
            return out.size() < cap;
        });
        return result;
    }
    return std::nullopt;
}

ImplementationEntry ImplementationFinder::makeEntry(const ElementHandle& element, const std::string& name,
                                                    const std::string& kind) const {
    ImplementationEntry entry;
    entry.name = name;
    entry.kind = kind;
    if (auto loc = ctx.model.locationOf(element)) {
        entry.file = loc->path;
        entry.line = loc->line;
    } else {
        entry.file = "unknown";
    }
    entry.language = support.displayLanguage(ctx.model.languageOf(element));
    return entry;
}
