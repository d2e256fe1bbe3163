#include "analysis/SymbolSearcher.h"
#include <algorithm>
#include <set>

namespace {
    constexpr size_t NAME_BATCH = 100;
    // Matching names collected per category beyond the result limit, since
    // some names resolve to declarations filtered out later.
    constexpr size_t NAME_OVERSAMPLE = 3;

    const NameCategory CATEGORY_ORDER[] = {NameCategory::Types, NameCategory::Callables, NameCategory::Variables};
}

SymbolSearcher::SymbolSearcher(const LanguageSupport& support, const QueryContext& ctx)
    : support(support), ctx(ctx) {}

std::vector<SymbolMatch> SymbolSearcher::search(const SymbolQuery& query) const {
    std::vector<SymbolMatch> results;
    NameMatcher matcher(query.pattern);
    const size_t limit = static_cast<size_t>(std::max(0, query.limit));
    if (limit == 0) return results;

    std::set<std::string> seen;
    for (NameCategory category : CATEGORY_ORDER) {
        for (const auto& languageId : support.languageIds()) {
            if (results.size() >= limit) break;

            std::vector<std::string> names;
            size_t visitedNames = 0;
            ctx.model.allDeclaredNames(category, query.scope, languageId, [&](const std::string& name) {
                if (++visitedNames % NAME_BATCH == 0) ctx.cancel.checkCanceled();
                if (matcher.matches(name)) names.push_back(name);
                return names.size() < limit * NAME_OVERSAMPLE;
            });
            ctx.cancel.checkCanceled();

            for (const auto& name : names) {
                if (results.size() >= limit) break;
                ctx.model.declarationsNamed(name, category, query.scope, languageId, [&](const ElementHandle& element) {
                    SymbolMatch match = makeMatch(element);
                    if (seen.insert(dedupKey(match)).second) {
                        results.push_back(std::move(match));
                    }
                    return results.size() < limit;
                });
            }
        }
    }

    rank(results, matcher);
    return results;
}

void SymbolSearcher::rank(std::vector<SymbolMatch>& matches, const NameMatcher& matcher) {
    std::vector<std::pair<std::pair<bool, int>, SymbolMatch>> keyed;
    keyed.reserve(matches.size());
    for (auto& m : matches) {
        keyed.push_back({{!matcher.isExactMatch(m.name), matcher.distance(m.name)}, std::move(m)});
    }
    std::stable_sort(keyed.begin(), keyed.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    matches.clear();
    for (auto& k : keyed) {
        matches.push_back(std::move(k.second));
    }
}

std::string SymbolSearcher::dedupKey(const SymbolMatch& match) {
    return match.file + ":" + std::to_string(match.line) + ":" + match.name;
}

SymbolMatch SymbolSearcher::makeMatch(const ElementHandle& element) const {
    SymbolMatch match;
    match.name = ctx.model.nameOf(element);
    match.qualifiedName = ctx.model.qualifiedNameOf(element);
    match.kind = kindName(ctx.model.kindOf(element));
    if (auto loc = ctx.model.locationOf(element)) {
        match.file = loc->path;
        match.line = loc->line;
    } else {
        match.file = "unknown";
        match.line = 1;
    }
    if (auto container = ctx.model.enclosingDeclaration(element)) {
        std::string name = ctx.model.nameOf(*container);
        if (!name.empty()) match.containerName = name;
    }
    match.language = support.displayLanguage(ctx.model.languageOf(element));
    return match;
}
