#include "analysis/CallHierarchyResolver.h"
#include <algorithm>
#include "analysis/SuperMethodResolver.h"
#include "utils/Logger.h"

std::optional<CallDirection> parseCallDirection(const std::string& text) {
    if (text == "callers") return CallDirection::Callers;
    if (text == "callees") return CallDirection::Callees;
    return std::nullopt;
}

std::string callDirectionName(CallDirection direction) {
    return direction == CallDirection::Callers ? "callers" : "callees";
}

CallHierarchyResolver::CallHierarchyResolver(const LanguageSupport& support, const QueryContext& ctx)
    : support(support), ctx(ctx) {}

std::optional<CallHierarchyResult> CallHierarchyResolver::resolve(const ElementHandle& element, CallDirection direction,
                                                                  int depth) const {
    auto method = support.containingCallable(ctx.model, element);
    if (!method) return std::nullopt;

    std::set<std::string> visited;
    visited.insert(support.methodKey(ctx.model, *method));

    CallHierarchyResult result;
    result.node = makeNode(*method);
    result.calls = direction == CallDirection::Callers
        ? findCallers(*method, depth, visited, 0)
        : findCallees(*method, depth, visited, 0);

    Logger::getInstance().debug("Call hierarchy (" + callDirectionName(direction) + ") for " + result.node.name +
                                ": " + std::to_string(visited.size() - 1) + " methods");
    return result;
}

std::vector<CallNode> CallHierarchyResolver::findCallers(const ElementHandle& method, int depth,
                                                         std::set<std::string>& visited, int stackDepth) const {
    std::vector<CallNode> nodes;
    if (depth <= 0 || stackDepth > ctx.limits.callStackDepth) return nodes;

    // The method itself plus everything it overrides: a call through a base
    // type reference may dispatch here.
    std::vector<ElementHandle> searchSet{method};
    SuperMethodResolver superMethods(support, ctx);
    size_t cap = static_cast<size_t>(std::max(0, ctx.limits.superMethodSearchCap));
    for (const auto& ancestor : superMethods.collectSuperMethods(method, cap)) {
        searchSet.push_back(ancestor.method);
    }

    const size_t perLevel = static_cast<size_t>(std::max(0, ctx.limits.callResultsPerLevel));
    std::vector<ElementHandle> callers;
    std::set<std::string> callerKeys;
    for (const auto& target : searchSet) {
        if (callers.size() >= perLevel) break;
        ctx.model.referencesTo(target, [&](const ElementHandle& reference) {
            ctx.cancel.checkCanceled();
            auto caller = support.containingCallable(ctx.model, reference);
            if (!caller) return true;
            if (std::find(searchSet.begin(), searchSet.end(), *caller) != searchSet.end()) return true;
            std::string key = support.methodKey(ctx.model, *caller);
            // Already placed elsewhere in the tree; must not use up this level's slots.
            if (visited.count(key)) return true;
            if (callerKeys.insert(key).second) {
                callers.push_back(*caller);
            }
            return callers.size() < perLevel;
        });
    }

    // Claim the whole level before descending so a method sits at its
    // shallowest distance.
    std::vector<ElementHandle> claimed;
    for (const auto& caller : callers) {
        if (visited.insert(support.methodKey(ctx.model, caller)).second) {
            claimed.push_back(caller);
        }
    }

    for (const auto& caller : claimed) {
        ctx.cancel.checkCanceled();
        CallNode node = makeNode(caller);
        if (containsSite(nodes, node)) continue;
        if (depth > 1) {
            node.children = findCallers(caller, depth - 1, visited, stackDepth + 1);
        }
        nodes.push_back(std::move(node));
    }
    return nodes;
}

std::vector<CallNode> CallHierarchyResolver::findCallees(const ElementHandle& method, int depth,
                                                         std::set<std::string>& visited, int stackDepth) const {
    std::vector<CallNode> nodes;
    if (depth <= 0 || stackDepth > ctx.limits.callStackDepth) return nodes;

    const size_t perLevel = static_cast<size_t>(std::max(0, ctx.limits.callResultsPerLevel));
    std::vector<CallSite> sites;
    if (perLevel > 0) {
        ctx.model.callSitesWithin(method, [&](const CallSite& site) {
            ctx.cancel.checkCanceled();
            auto callee = callableTarget(site);
            if (callee && visited.count(support.methodKey(ctx.model, *callee))) return true;
            sites.push_back(site);
            return sites.size() < perLevel;
        });
    }

    const std::string language = support.displayLanguage(ctx.model.languageOf(method));
    std::vector<ElementHandle> claimed;
    std::vector<CallNode> leaves;
    for (const auto& site : sites) {
        if (auto callee = callableTarget(site)) {
            if (visited.insert(support.methodKey(ctx.model, *callee)).second) {
                claimed.push_back(*callee);
            }
        } else if (site.target) {
            CallNode leaf = makeTargetNode(*site.target);
            if (!containsSite(leaves, leaf)) leaves.push_back(std::move(leaf));
        } else {
            CallNode leaf = makeUnresolvedNode(site, language);
            if (!containsSite(leaves, leaf)) leaves.push_back(std::move(leaf));
        }
    }

    for (const auto& callee : claimed) {
        ctx.cancel.checkCanceled();
        CallNode node = makeNode(callee);
        if (containsSite(nodes, node)) continue;
        if (depth > 1) {
            node.children = findCallees(callee, depth - 1, visited, stackDepth + 1);
        }
        nodes.push_back(std::move(node));
    }
    for (auto& leaf : leaves) {
        nodes.push_back(std::move(leaf));
    }
    return nodes;
}

std::optional<ElementHandle> CallHierarchyResolver::callableTarget(const CallSite& site) const {
    if (!site.target) return std::nullopt;
    ElementKind kind = ctx.model.kindOf(*site.target);
    if (support.isCallable(kind)) return site.target;
    if (isTypeKind(kind)) {
        for (const auto& member : ctx.model.methodsOf(*site.target)) {
            if (ctx.model.kindOf(member) == ElementKind::Constructor) return member;
        }
    }
    return std::nullopt;
}

CallNode CallHierarchyResolver::makeNode(const ElementHandle& callable) const {
    CallNode node;
    node.name = support.callNodeName(ctx.model, callable);
    if (auto loc = ctx.model.locationOf(callable)) {
        node.file = loc->path;
        node.line = loc->line;
    } else {
        node.file = "unknown";
    }
    node.language = support.displayLanguage(ctx.model.languageOf(callable));
    return node;
}

CallNode CallHierarchyResolver::makeTargetNode(const ElementHandle& target) const {
    CallNode node;
    node.name = ctx.model.nameOf(target) + "(...)";
    if (auto loc = ctx.model.locationOf(target)) {
        node.file = loc->path;
        node.line = loc->line;
    } else {
        node.file = "unknown";
    }
    node.language = support.displayLanguage(ctx.model.languageOf(target));
    return node;
}

CallNode CallHierarchyResolver::makeUnresolvedNode(const CallSite& site, const std::string& language) const {
    CallNode node;
    node.name = support.unresolvedCallName(site);
    node.file = site.location.path.empty() ? "unknown" : site.location.path;
    node.line = site.location.line;
    node.language = language;
    return node;
}

bool CallHierarchyResolver::containsSite(const std::vector<CallNode>& nodes, const CallNode& node) {
    return std::any_of(nodes.begin(), nodes.end(), [&](const CallNode& n) { return n.sameSite(node); });
}
