#pragma once
#include <optional>
#include <string>
#include "core/CancellationToken.h"
#include "core/ConfigManager.h"
#include "core/QueryError.h"
#include "handlers/HandlerRegistry.h"

// Where a query starts: a source position or a fully qualified name.
struct StartRef {
    std::string file;
    int line = 0;
    int column = 0;
    std::string qualifiedName;

    bool isNamed() const { return !qualifiedName.empty(); }

    static StartRef at(const std::string& file, int line, int column) { return {file, line, column, ""}; }
    static StartRef named(const std::string& qualifiedName) { return {"", 0, 0, qualifiedName}; }
};

/**
 * @brief Entry point for every query.
 *
 * Resolves the starting element, picks a handler from the registry it owns,
 * runs it and converts anything thrown along the way into a QueryError.
 * Stateless between calls; safe to call from several threads once built.
 */
class QueryFacade {
public:
    QueryFacade(const ICodeModel& model, HandlerRegistry registry, QueryLimits limits);

    // Registers every language family the model supports and config allows.
    static QueryFacade create(const ICodeModel& model, const Config& config);

    QueryResult<TypeHierarchyResult> typeHierarchy(const StartRef& start,
                                                   const CancellationToken& cancel = CancellationToken::none()) const;

    // direction: "callers" or "callees"; depth defaults to the configured value and is clamped.
    QueryResult<CallHierarchyResult> callHierarchy(const StartRef& start, const std::string& direction,
                                                   std::optional<int> depth = std::nullopt,
                                                   const CancellationToken& cancel = CancellationToken::none()) const;

    QueryResult<SuperMethodsResult> superMethods(const StartRef& start,
                                                 const CancellationToken& cancel = CancellationToken::none()) const;

    QueryResult<SymbolSearchResult> searchSymbols(const std::string& pattern, SearchScope scope = SearchScope::Project,
                                                  std::optional<int> limit = std::nullopt,
                                                  const CancellationToken& cancel = CancellationToken::none()) const;

    QueryResult<ImplementationsResult> findImplementations(const StartRef& start,
                                                           const CancellationToken& cancel = CancellationToken::none()) const;

    const HandlerRegistry& getRegistry() const { return registry; }
    const QueryLimits& getLimits() const { return limits; }

private:
    template <typename T, typename Fn>
    QueryResult<T> guarded(const std::string& operation, Fn&& body) const;

    QueryResult<ElementHandle> resolveStart(const StartRef& start) const;
    QueryError noProvider(Capability capability, const ElementHandle& element) const;

    const ICodeModel& model;
    HandlerRegistry registry;
    QueryLimits limits;
};
