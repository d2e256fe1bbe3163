#include "analysis/TypeHierarchyResolver.h"
#include <algorithm>
#include "utils/Logger.h"

TypeHierarchyResolver::TypeHierarchyResolver(const LanguageSupport& support, const QueryContext& ctx)
    : support(support), ctx(ctx) {}

std::optional<TypeHierarchyResult> TypeHierarchyResolver::resolve(const ElementHandle& element) const {
    auto type = support.containingType(ctx.model, element);
    if (!type) return std::nullopt;

    TypeHierarchyResult result;
    result.node = makeNode(*type);

    WalkState state;
    state.path.push_back(support.typeDisplayName(ctx.model, *type));
    result.supertypes = collectSupertypes(*type, state, 0);
    result.subtypes = collectSubtypes(*type);

    Logger::getInstance().debug("Type hierarchy for " + result.node.name + ": " +
                                std::to_string(result.supertypes.size()) + " direct supertypes, " +
                                std::to_string(result.subtypes.size()) + " subtypes");
    return result;
}

bool TypeHierarchyResolver::onPath(const WalkState& state, const std::string& name) const {
    return std::find(state.path.begin(), state.path.end(), name) != state.path.end();
}

std::vector<TypeNode> TypeHierarchyResolver::collectSupertypes(const ElementHandle& type, WalkState& state, int depth) const {
    std::vector<TypeNode> nodes;
    if (depth >= support.hierarchyDepthLimit(ctx.limits)) return nodes;

    std::string language = support.displayLanguage(ctx.model.languageOf(type));

    for (const auto& ref : ctx.model.declaredSupertypes(type)) {
        ctx.cancel.checkCanceled();

        if (!ref.resolved) {
            if (support.isImplicitRoot(ref.declaredName) || onPath(state, ref.declaredName)) continue;
            nodes.push_back(makeUnresolvedNode(ref, language));
            continue;
        }

        std::string name = support.typeDisplayName(ctx.model, *ref.resolved);
        if (support.isImplicitRoot(name) || support.isImplicitRoot(ref.declaredName)) continue;
        if (onPath(state, name)) continue;

        TypeNode node = makeNode(*ref.resolved);
        if (state.expanded.insert(name).second) {
            state.path.push_back(name);
            node.supertypes = collectSupertypes(*ref.resolved, state, depth + 1);
            state.path.pop_back();
        }
        nodes.push_back(std::move(node));
    }
    return nodes;
}

std::vector<TypeNode> TypeHierarchyResolver::collectSubtypes(const ElementHandle& type) const {
    std::vector<TypeNode> nodes;
    const size_t cap = static_cast<size_t>(std::max(0, ctx.limits.subtypeLimit));
    if (cap == 0) return nodes;

    ctx.model.transitiveSubtypes(type, [&](const ElementHandle& subtype) {
        ctx.cancel.checkCanceled();
        nodes.push_back(makeNode(subtype));
        return nodes.size() < cap;
    });
    return nodes;
}

TypeNode TypeHierarchyResolver::makeNode(const ElementHandle& type) const {
    TypeNode node;
    node.name = ctx.model.nameOf(type);
    node.qualifiedName = ctx.model.qualifiedNameOf(type);
    if (auto loc = ctx.model.locationOf(type)) {
        node.file = loc->path;
        node.line = loc->line;
    }
    node.kind = support.typeKind(ctx.model, type);
    node.language = support.displayLanguage(ctx.model.languageOf(type));
    return node;
}

TypeNode TypeHierarchyResolver::makeUnresolvedNode(const SupertypeRef& ref, const std::string& language) const {
    TypeNode node;
    node.name = ref.declaredName;
    node.kind = support.unresolvedSupertypeKind(ref);
    node.language = language;
    return node;
}
