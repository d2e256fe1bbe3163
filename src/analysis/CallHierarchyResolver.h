#pragma once
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "analysis/HierarchyModels.h"
#include "analysis/LanguageSupport.h"
#include "analysis/QueryContext.h"

enum class CallDirection {
    Callers,
    Callees
};

// "callers" / "callees"; anything else is rejected.
std::optional<CallDirection> parseCallDirection(const std::string& text);
std::string callDirectionName(CallDirection direction);

/**
 * @brief Depth-bounded caller/callee traversal around one method.
 *
 * One visited set of method keys spans the whole query, so a method appears
 * at most once in the result and recursion through call cycles terminates.
 * Callers of a method also include callers of the methods it overrides.
 */
class CallHierarchyResolver {
public:
    CallHierarchyResolver(const LanguageSupport& support, const QueryContext& ctx);

    // Empty when no callable encloses the element. `depth` must already be clamped.
    std::optional<CallHierarchyResult> resolve(const ElementHandle& element, CallDirection direction, int depth) const;

private:
    std::vector<CallNode> findCallers(const ElementHandle& method, int depth, std::set<std::string>& visited,
                                      int stackDepth) const;
    std::vector<CallNode> findCallees(const ElementHandle& method, int depth, std::set<std::string>& visited,
                                      int stackDepth) const;

    // The callable a call site lands on. A site resolved to a type maps to
    // that type's constructor when the model has one.
    std::optional<ElementHandle> callableTarget(const CallSite& site) const;

    CallNode makeNode(const ElementHandle& callable) const;
    // Leaf for a call resolved to something that is not callable itself.
    CallNode makeTargetNode(const ElementHandle& target) const;
    CallNode makeUnresolvedNode(const CallSite& site, const std::string& language) const;
    static bool containsSite(const std::vector<CallNode>& nodes, const CallNode& node);

    const LanguageSupport& support;
    const QueryContext& ctx;
};
