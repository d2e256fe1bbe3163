#pragma once
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "analysis/HierarchyModels.h"
#include "analysis/LanguageSupport.h"
#include "analysis/QueryContext.h"

/**
 * @brief Resolves the chain of methods a method overrides, nearest first.
 *
 * Families whose model records override edges follow them directly. The
 * others walk the declaring type's supertypes and look for a method of the
 * same name (and matching parameter types when the family compares
 * signatures). Ancestor types that declare no such method are passed through
 * without increasing the reported depth.
 */
class SuperMethodResolver {
public:
    struct Ancestor {
        ElementHandle method;
        int depth = 1;
    };

    SuperMethodResolver(const LanguageSupport& support, const QueryContext& ctx);

    // Empty when no callable encloses the element.
    std::optional<SuperMethodsResult> resolve(const ElementHandle& element) const;

    // Every method `method` overrides, in walk order, at most `cap` entries.
    std::vector<Ancestor> collectSuperMethods(const ElementHandle& method, size_t cap) const;

private:
    void walkOverrideEdges(const ElementHandle& method, int depth, std::set<std::string>& visited,
                           std::vector<Ancestor>& out, size_t cap) const;
    void walkSupertypes(const ElementHandle& type, const ElementHandle& method, int depth, int hops,
                        std::set<std::string>& visited, std::vector<Ancestor>& out, size_t cap) const;
    std::optional<ElementHandle> findMatchingMethod(const ElementHandle& type, const ElementHandle& method) const;

    std::string containerName(const ElementHandle& method) const;
    MethodInfo makeMethodInfo(const ElementHandle& method) const;
    SuperMethodEntry makeEntry(const Ancestor& ancestor) const;

    const LanguageSupport& support;
    const QueryContext& ctx;
};
