#include "core/QueryFacade.h"
#include <algorithm>
#include <cctype>
#include <set>
#include <utility>
#include "handlers/LanguageFamilies.h"
#include "utils/Logger.h"

QueryFacade::QueryFacade(const ICodeModel& model, HandlerRegistry registry, QueryLimits limits)
    : model(model), registry(std::move(registry)), limits(limits) {}

QueryFacade QueryFacade::create(const ICodeModel& model, const Config& config) {
    HandlerRegistry registry;
    registerLanguageFamilies(registry, model, config);
    return QueryFacade(model, std::move(registry), config.limits);
}

template <typename T, typename Fn>
QueryResult<T> QueryFacade::guarded(const std::string& operation, Fn&& body) const {
    try {
        if (!model.isIndexReady()) {
            return QueryError::indexNotReady();
        }
        return body();
    } catch (const QueryCancelledException&) {
        Logger::getInstance().debug(operation + " cancelled");
        return QueryError::cancelled();
    } catch (const IndexNotReadyException& e) {
        Logger::getInstance().debug(operation + ": " + e.what());
        return QueryError::indexNotReady();
    } catch (const std::exception& e) {
        Logger::getInstance().error(operation + " failed: " + e.what());
        return QueryError::internal(operation + " failed: " + e.what());
    }
}

QueryResult<ElementHandle> QueryFacade::resolveStart(const StartRef& start) const {
    if (start.isNamed()) {
        auto element = model.resolveByQualifiedName(start.qualifiedName);
        if (!element) return QueryError::noElementNamed(start.qualifiedName);
        return *element;
    }

    if (start.file.empty()) {
        return QueryError::invalidArguments("Either a file position or a qualified name is required");
    }
    if (start.line < 1 || start.column < 1) {
        return QueryError::invalidArguments("Line and column are 1-based");
    }
    auto element = model.resolveAt(start.file, start.line, start.column);
    if (!element) return QueryError::noElementAtPosition(start.file, start.line, start.column);
    return *element;
}

QueryError QueryFacade::noProvider(Capability capability, const ElementHandle& element) const {
    std::string supported;
    for (const auto& lang : registry.getSupportedLanguages(capability)) {
        if (!supported.empty()) supported += ", ";
        supported += lang;
    }
    std::string language = model.languageOf(element);
    return QueryError::noProviderForLanguage(language.empty() ? "unknown" : language, supported);
}

QueryResult<TypeHierarchyResult> QueryFacade::typeHierarchy(const StartRef& start,
                                                             const CancellationToken& cancel) const {
    return guarded<TypeHierarchyResult>("type_hierarchy", [&]() -> QueryResult<TypeHierarchyResult> {
        auto element = resolveStart(start);
        if (!element) return element.error();

        const auto* handler = registry.getTypeHierarchyHandler(model, element.value());
        if (!handler) return noProvider(Capability::TypeHierarchy, element.value());

        QueryContext ctx{model, limits, cancel};
        auto result = handler->getTypeHierarchy(element.value(), ctx);
        if (!result) return QueryError::notATypeOrMethod("No class/type found at the specified position");
        return std::move(*result);
    });
}

QueryResult<CallHierarchyResult> QueryFacade::callHierarchy(const StartRef& start, const std::string& direction,
                                                             std::optional<int> depth,
                                                             const CancellationToken& cancel) const {
    return guarded<CallHierarchyResult>("call_hierarchy", [&]() -> QueryResult<CallHierarchyResult> {
        auto parsed = parseCallDirection(direction);
        if (!parsed) {
            return QueryError::invalidArguments("direction must be 'callers' or 'callees', got '" + direction + "'");
        }

        auto element = resolveStart(start);
        if (!element) return element.error();

        const auto* handler = registry.getCallHierarchyHandler(model, element.value());
        if (!handler) return noProvider(Capability::CallHierarchy, element.value());

        int effectiveDepth = limits.clampCallDepth(depth.value_or(limits.defaultCallDepth));
        QueryContext ctx{model, limits, cancel};
        auto result = handler->getCallHierarchy(element.value(), *parsed, effectiveDepth, ctx);
        if (!result) return QueryError::notATypeOrMethod("No method/function found at the specified position");
        return std::move(*result);
    });
}

QueryResult<SuperMethodsResult> QueryFacade::superMethods(const StartRef& start, const CancellationToken& cancel) const {
    return guarded<SuperMethodsResult>("super_methods", [&]() -> QueryResult<SuperMethodsResult> {
        auto element = resolveStart(start);
        if (!element) return element.error();

        const auto* handler = registry.getSuperMethodsHandler(model, element.value());
        if (!handler) return noProvider(Capability::SuperMethods, element.value());

        QueryContext ctx{model, limits, cancel};
        auto result = handler->findSuperMethods(element.value(), ctx);
        if (!result) return QueryError::notATypeOrMethod("No method found at the specified position");
        return std::move(*result);
    });
}

QueryResult<SymbolSearchResult> QueryFacade::searchSymbols(const std::string& pattern, SearchScope scope,
                                                           std::optional<int> limit,
                                                           const CancellationToken& cancel) const {
    return guarded<SymbolSearchResult>("find_symbol", [&]() -> QueryResult<SymbolSearchResult> {
        bool blank = std::all_of(pattern.begin(), pattern.end(), [](unsigned char c) { return std::isspace(c); });
        if (blank) return QueryError::invalidArguments("Search query must not be blank");

        auto handlers = registry.getAllSymbolSearchHandlers();
        if (handlers.empty()) return QueryError::noProviderForLanguage("any", "");

        SymbolQuery query;
        query.pattern = pattern;
        query.scope = scope;
        query.limit = limits.clampSymbolLimit(limit.value_or(limits.defaultSymbolLimit));

        QueryContext ctx{model, limits, cancel};
        SymbolSearchResult result;
        result.query = pattern;
        std::set<std::string> seen;
        for (const auto* handler : handlers) {
            cancel.checkCanceled();
            for (auto& match : handler->searchSymbols(query, ctx)) {
                if (seen.insert(SymbolSearcher::dedupKey(match)).second) {
                    result.symbols.push_back(std::move(match));
                }
            }
        }

        SymbolSearcher::rank(result.symbols, NameMatcher(pattern));
        if (result.symbols.size() > static_cast<size_t>(query.limit)) {
            result.symbols.resize(static_cast<size_t>(query.limit));
        }
        return result;
    });
}

QueryResult<ImplementationsResult> QueryFacade::findImplementations(const StartRef& start,
                                                                   const CancellationToken& cancel) const {
    return guarded<ImplementationsResult>("find_implementations", [&]() -> QueryResult<ImplementationsResult> {
        auto element = resolveStart(start);
        if (!element) return element.error();

        const auto* handler = registry.getImplementationsHandler(model, element.value());
        if (!handler) return noProvider(Capability::Implementations, element.value());

        QueryContext ctx{model, limits, cancel};
        auto result = handler->findImplementations(element.value(), ctx);
        if (!result) return QueryError::notATypeOrMethod("No class or method found at the specified position");
        return std::move(*result);
    });
}
