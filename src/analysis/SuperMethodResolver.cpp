#include "analysis/SuperMethodResolver.h"
#include <limits>

SuperMethodResolver::SuperMethodResolver(const LanguageSupport& support, const QueryContext& ctx)
    : support(support), ctx(ctx) {}

std::optional<SuperMethodsResult> SuperMethodResolver::resolve(const ElementHandle& element) const {
    auto method = support.containingCallable(ctx.model, element);
    if (!method) return std::nullopt;

    SuperMethodsResult result;
    result.method = makeMethodInfo(*method);
    for (const auto& ancestor : collectSuperMethods(*method, std::numeric_limits<size_t>::max())) {
        result.hierarchy.push_back(makeEntry(ancestor));
    }
    return result;
}

std::vector<SuperMethodResolver::Ancestor> SuperMethodResolver::collectSuperMethods(const ElementHandle& method, size_t cap) const {
    std::vector<Ancestor> out;
    if (cap == 0) return out;

    std::set<std::string> visited;
    if (support.followsOverrideEdges()) {
        walkOverrideEdges(method, 1, visited, out, cap);
        return out;
    }

    auto owner = ctx.model.enclosingDeclaration(method);
    auto type = owner ? support.containingType(ctx.model, *owner) : std::nullopt;
    if (type) {
        visited.insert(support.typeDisplayName(ctx.model, *type) + "." + ctx.model.nameOf(method));
        walkSupertypes(*type, method, 1, 0, visited, out, cap);
    }
    return out;
}

void SuperMethodResolver::walkOverrideEdges(const ElementHandle& method, int depth, std::set<std::string>& visited,
                                            std::vector<Ancestor>& out, size_t cap) const {
    if (depth > support.hierarchyDepthLimit(ctx.limits)) return;

    for (const auto& superMethod : ctx.model.overriddenMethods(method)) {
        if (out.size() >= cap) return;
        ctx.cancel.checkCanceled();

        std::string key = containerName(superMethod) + "." + ctx.model.nameOf(superMethod);
        if (!visited.insert(key).second) continue;

        out.push_back({superMethod, depth});
        walkOverrideEdges(superMethod, depth + 1, visited, out, cap);
    }
}

void SuperMethodResolver::walkSupertypes(const ElementHandle& type, const ElementHandle& method, int depth, int hops,
                                         std::set<std::string>& visited, std::vector<Ancestor>& out, size_t cap) const {
    if (hops >= support.hierarchyDepthLimit(ctx.limits)) return;

    const std::string name = ctx.model.nameOf(method);
    for (const auto& ref : ctx.model.declaredSupertypes(type)) {
        if (out.size() >= cap) return;
        if (!ref.resolved) continue;
        ctx.cancel.checkCanceled();

        std::string key = support.typeDisplayName(ctx.model, *ref.resolved) + "." + name;
        if (!visited.insert(key).second) continue;

        auto match = findMatchingMethod(*ref.resolved, method);
        if (match) {
            out.push_back({*match, depth});
            walkSupertypes(*ref.resolved, *match, depth + 1, hops + 1, visited, out, cap);
        } else {
            walkSupertypes(*ref.resolved, method, depth, hops + 1, visited, out, cap);
        }
    }
}

std::optional<ElementHandle> SuperMethodResolver::findMatchingMethod(const ElementHandle& type, const ElementHandle& method) const {
    const std::string name = ctx.model.nameOf(method);
    Signature signature = ctx.model.signatureOf(method);
    for (const auto& candidate : ctx.model.methodsOf(type)) {
        if (ctx.model.nameOf(candidate) != name) continue;
        if (support.comparesSignatures() && !support.signaturesMatch(ctx.model.signatureOf(candidate), signature)) {
            continue;
        }
        return candidate;
    }
    return std::nullopt;
}

std::string SuperMethodResolver::containerName(const ElementHandle& method) const {
    auto owner = ctx.model.enclosingDeclaration(method);
    auto type = owner ? support.containingType(ctx.model, *owner) : std::nullopt;
    return type ? support.typeDisplayName(ctx.model, *type) : std::string();
}

MethodInfo SuperMethodResolver::makeMethodInfo(const ElementHandle& method) const {
    MethodInfo info;
    info.name = ctx.model.nameOf(method);
    info.signature = support.methodSignature(ctx.model, method);
    info.containingClass = containerName(method);
    if (auto loc = ctx.model.locationOf(method)) {
        info.file = loc->path;
        info.line = loc->line;
    } else {
        info.file = "unknown";
    }
    info.language = support.displayLanguage(ctx.model.languageOf(method));
    return info;
}

SuperMethodEntry SuperMethodResolver::makeEntry(const Ancestor& ancestor) const {
    SuperMethodEntry entry;
    entry.name = ctx.model.nameOf(ancestor.method);
    entry.signature = support.methodSignature(ctx.model, ancestor.method);
    entry.depth = ancestor.depth;
    entry.language = support.displayLanguage(ctx.model.languageOf(ancestor.method));
    if (auto loc = ctx.model.locationOf(ancestor.method)) {
        entry.file = loc->path;
        entry.line = loc->line;
    }

    auto owner = ctx.model.enclosingDeclaration(ancestor.method);
    auto type = owner ? support.containingType(ctx.model, *owner) : std::nullopt;
    if (type) {
        entry.containingClass = support.typeDisplayName(ctx.model, *type);
        entry.containingClassKind = support.typeKind(ctx.model, *type);
        entry.isInterface = support.isInterfaceLike(ctx.model.kindOf(*type));
    } else {
        entry.containingClass = "unknown";
        entry.containingClassKind = "UNKNOWN";
    }
    return entry;
}
