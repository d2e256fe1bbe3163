#pragma once
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "analysis/CallHierarchyResolver.h"
#include "analysis/HierarchyModels.h"
#include "analysis/ImplementationFinder.h"
#include "analysis/LanguageSupport.h"
#include "analysis/QueryContext.h"
#include "analysis/SuperMethodResolver.h"
#include "analysis/SymbolSearcher.h"
#include "analysis/TypeHierarchyResolver.h"

enum class Capability {
    TypeHierarchy,
    Implementations,
    CallHierarchy,
    SymbolSearch,
    SuperMethods
};

std::string capabilityName(Capability capability);

/**
 * @brief Common part of every capability handler.
 *
 * A handler serves one language tag. isAvailable() is probed once by the
 * registry when the handler is registered.
 */
class ILanguageHandler {
public:
    virtual ~ILanguageHandler() = default;

    virtual std::string getLanguageId() const = 0;
    virtual bool canHandle(const ICodeModel& model, const ElementHandle& element) const = 0;
    virtual bool isAvailable() const = 0;
};

class ITypeHierarchyHandler : public ILanguageHandler {
public:
    static constexpr Capability capability = Capability::TypeHierarchy;
    virtual std::optional<TypeHierarchyResult> getTypeHierarchy(const ElementHandle& element,
                                                                 const QueryContext& ctx) const = 0;
};

class IImplementationsHandler : public ILanguageHandler {
public:
    static constexpr Capability capability = Capability::Implementations;
    virtual std::optional<ImplementationsResult> findImplementations(const ElementHandle& element,
                                                                     const QueryContext& ctx) const = 0;
};

class ICallHierarchyHandler : public ILanguageHandler {
public:
    static constexpr Capability capability = Capability::CallHierarchy;
    virtual std::optional<CallHierarchyResult> getCallHierarchy(const ElementHandle& element, CallDirection direction,
                                                                int depth, const QueryContext& ctx) const = 0;
};

class ISymbolSearchHandler : public ILanguageHandler {
public:
    static constexpr Capability capability = Capability::SymbolSearch;
    virtual std::vector<SymbolMatch> searchSymbols(const SymbolQuery& query, const QueryContext& ctx) const = 0;
};

class ISuperMethodsHandler : public ILanguageHandler {
public:
    static constexpr Capability capability = Capability::SuperMethods;
    virtual std::optional<SuperMethodsResult> findSuperMethods(const ElementHandle& element,
                                                               const QueryContext& ctx) const = 0;
};

// Handler backed by a family's LanguageSupport; serves the family's primary tag.
template <typename Interface>
class LanguageFamilyHandler : public Interface {
public:
    LanguageFamilyHandler(std::shared_ptr<const LanguageSupport> support, bool available)
        : support(std::move(support)), available(available) {}

    std::string getLanguageId() const override { return support->languageIds().front(); }

    bool canHandle(const ICodeModel& model, const ElementHandle& element) const override {
        return available && support->handlesLanguage(model.languageOf(element));
    }

    bool isAvailable() const override { return available; }

protected:
    std::shared_ptr<const LanguageSupport> support;
    bool available;
};

class FamilyTypeHierarchyHandler : public LanguageFamilyHandler<ITypeHierarchyHandler> {
public:
    using LanguageFamilyHandler::LanguageFamilyHandler;
    std::optional<TypeHierarchyResult> getTypeHierarchy(const ElementHandle& element,
                                                        const QueryContext& ctx) const override {
        return TypeHierarchyResolver(*support, ctx).resolve(element);
    }
};

class FamilyImplementationsHandler : public LanguageFamilyHandler<IImplementationsHandler> {
public:
    using LanguageFamilyHandler::LanguageFamilyHandler;
    std::optional<ImplementationsResult> findImplementations(const ElementHandle& element,
                                                             const QueryContext& ctx) const override {
        return ImplementationFinder(*support, ctx).find(element);
    }
};

class FamilyCallHierarchyHandler : public LanguageFamilyHandler<ICallHierarchyHandler> {
public:
    using LanguageFamilyHandler::LanguageFamilyHandler;
    std::optional<CallHierarchyResult> getCallHierarchy(const ElementHandle& element, CallDirection direction,
                                                        int depth, const QueryContext& ctx) const override {
        return CallHierarchyResolver(*support, ctx).resolve(element, direction, depth);
    }
};

class FamilySymbolSearchHandler : public LanguageFamilyHandler<ISymbolSearchHandler> {
public:
    using LanguageFamilyHandler::LanguageFamilyHandler;

    // Symbol search has no starting element; any available family may serve it.
    bool canHandle(const ICodeModel& model, const ElementHandle& element) const override { return available; }

    std::vector<SymbolMatch> searchSymbols(const SymbolQuery& query, const QueryContext& ctx) const override {
        return SymbolSearcher(*support, ctx).search(query);
    }
};

class FamilySuperMethodsHandler : public LanguageFamilyHandler<ISuperMethodsHandler> {
public:
    using LanguageFamilyHandler::LanguageFamilyHandler;
    std::optional<SuperMethodsResult> findSuperMethods(const ElementHandle& element,
                                                       const QueryContext& ctx) const override {
        return SuperMethodResolver(*support, ctx).resolve(element);
    }
};

/**
 * @brief Serves another handler under a different language tag.
 *
 * Used where two languages share one declaration model (Kotlin and Java,
 * TypeScript and JavaScript). Only the tag differs; everything else is
 * forwarded.
 */
template <typename Interface>
class TaggedDelegate : public Interface {
public:
    TaggedDelegate(std::string languageId, std::unique_ptr<Interface> delegate)
        : languageId(std::move(languageId)), delegate(std::move(delegate)) {}

    std::string getLanguageId() const override { return languageId; }
    bool canHandle(const ICodeModel& model, const ElementHandle& element) const override {
        return delegate->canHandle(model, element);
    }
    bool isAvailable() const override { return delegate->isAvailable(); }

protected:
    std::string languageId;
    std::unique_ptr<Interface> delegate;
};

class DelegatingTypeHierarchyHandler : public TaggedDelegate<ITypeHierarchyHandler> {
public:
    using TaggedDelegate::TaggedDelegate;
    std::optional<TypeHierarchyResult> getTypeHierarchy(const ElementHandle& element,
                                                        const QueryContext& ctx) const override {
        return delegate->getTypeHierarchy(element, ctx);
    }
};

class DelegatingImplementationsHandler : public TaggedDelegate<IImplementationsHandler> {
public:
    using TaggedDelegate::TaggedDelegate;
    std::optional<ImplementationsResult> findImplementations(const ElementHandle& element,
                                                             const QueryContext& ctx) const override {
        return delegate->findImplementations(element, ctx);
    }
};

class DelegatingCallHierarchyHandler : public TaggedDelegate<ICallHierarchyHandler> {
public:
    using TaggedDelegate::TaggedDelegate;
    std::optional<CallHierarchyResult> getCallHierarchy(const ElementHandle& element, CallDirection direction,
                                                        int depth, const QueryContext& ctx) const override {
        return delegate->getCallHierarchy(element, direction, depth, ctx);
    }
};

class DelegatingSymbolSearchHandler : public TaggedDelegate<ISymbolSearchHandler> {
public:
    using TaggedDelegate::TaggedDelegate;
    std::vector<SymbolMatch> searchSymbols(const SymbolQuery& query, const QueryContext& ctx) const override {
        return delegate->searchSymbols(query, ctx);
    }
};

class DelegatingSuperMethodsHandler : public TaggedDelegate<ISuperMethodsHandler> {
public:
    using TaggedDelegate::TaggedDelegate;
    std::optional<SuperMethodsResult> findSuperMethods(const ElementHandle& element,
                                                       const QueryContext& ctx) const override {
        return delegate->findSuperMethods(element, ctx);
    }
};
