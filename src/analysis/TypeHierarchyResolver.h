#pragma once
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "analysis/HierarchyModels.h"
#include "analysis/LanguageSupport.h"
#include "analysis/QueryContext.h"

/**
 * @brief Builds the supertype tree and flat subtype list of a type.
 *
 * Supertypes are walked depth first in declared order. A name already on the
 * current root-to-leaf path is skipped, and a type already expanded on another
 * branch is emitted as a leaf, so cyclic and diamond graphs terminate.
 */
class TypeHierarchyResolver {
public:
    TypeHierarchyResolver(const LanguageSupport& support, const QueryContext& ctx);

    // Empty when no type encloses the element.
    std::optional<TypeHierarchyResult> resolve(const ElementHandle& element) const;

private:
    struct WalkState {
        std::vector<std::string> path;
        std::set<std::string> expanded;
    };

    std::vector<TypeNode> collectSupertypes(const ElementHandle& type, WalkState& state, int depth) const;
    std::vector<TypeNode> collectSubtypes(const ElementHandle& type) const;
    TypeNode makeNode(const ElementHandle& type) const;
    TypeNode makeUnresolvedNode(const SupertypeRef& ref, const std::string& language) const;
    bool onPath(const WalkState& state, const std::string& name) const;

    const LanguageSupport& support;
    const QueryContext& ctx;
};
