#pragma once
#include <string>
#include <vector>
#include "analysis/HierarchyModels.h"
#include "analysis/LanguageSupport.h"
#include "analysis/NameMatcher.h"
#include "analysis/QueryContext.h"

struct SymbolQuery {
    std::string pattern;
    SearchScope scope = SearchScope::Project;
    int limit = 25; // already clamped
};

/**
 * @brief Fuzzy declaration search over the languages of one family.
 *
 * Type names are enumerated first, then callables, then variables and
 * fields, until the limit is reached.
 */
class SymbolSearcher {
public:
    SymbolSearcher(const LanguageSupport& support, const QueryContext& ctx);

    std::vector<SymbolMatch> search(const SymbolQuery& query) const;

    // Exact case-insensitive matches first, then ascending edit distance.
    // Stable, so equal ranks keep enumeration order.
    static void rank(std::vector<SymbolMatch>& matches, const NameMatcher& matcher);
    static std::string dedupKey(const SymbolMatch& match);

private:
    SymbolMatch makeMatch(const ElementHandle& element) const;

    const LanguageSupport& support;
    const QueryContext& ctx;
};
