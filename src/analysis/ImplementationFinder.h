#pragma once
#include <optional>
#include "analysis/HierarchyModels.h"
#include "analysis/LanguageSupport.h"
#include "analysis/QueryContext.h"

// Overriding methods of a method, or subtypes of a type, capped.
class ImplementationFinder {
public:
    ImplementationFinder(const LanguageSupport& support, const QueryContext& ctx);

    // Empty when the element is neither inside a callable nor a type.
    std::optional<ImplementationsResult> find(const ElementHandle& element) const;

private:
    ImplementationEntry makeEntry(const ElementHandle& element, const std::string& name, const std::string& kind) const;

    const LanguageSupport& support;
    const QueryContext& ctx;
};
