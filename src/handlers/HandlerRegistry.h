#pragma once
#include <memory>
#include <string>
#include <vector>
#include "handlers/LanguageHandler.h"

/**
 * @brief Capability handlers keyed by (capability, language tag).
 *
 * Written only while the owning QueryFacade is being set up; afterwards it is
 * read concurrently by queries without locking.
 *
 * Selection prefers handlers whose language tag equals the element's
 * language, in registration order, and falls back to any other handler that
 * accepts the element. Registering a second handler for a (capability, tag)
 * pair that is already taken is logged and ignored.
 */
class HandlerRegistry {
public:
    HandlerRegistry() = default;
    HandlerRegistry(HandlerRegistry&&) = default;
    HandlerRegistry& operator=(HandlerRegistry&&) = default;

    bool registerTypeHierarchyHandler(std::unique_ptr<ITypeHierarchyHandler> handler);
    bool registerImplementationsHandler(std::unique_ptr<IImplementationsHandler> handler);
    bool registerCallHierarchyHandler(std::unique_ptr<ICallHierarchyHandler> handler);
    bool registerSymbolSearchHandler(std::unique_ptr<ISymbolSearchHandler> handler);
    bool registerSuperMethodsHandler(std::unique_ptr<ISuperMethodsHandler> handler);

    const ITypeHierarchyHandler* getTypeHierarchyHandler(const ICodeModel& model, const ElementHandle& element) const;
    const IImplementationsHandler* getImplementationsHandler(const ICodeModel& model, const ElementHandle& element) const;
    const ICallHierarchyHandler* getCallHierarchyHandler(const ICodeModel& model, const ElementHandle& element) const;
    const ISuperMethodsHandler* getSuperMethodsHandler(const ICodeModel& model, const ElementHandle& element) const;

    // Every available symbol search handler, in registration order.
    std::vector<const ISymbolSearchHandler*> getAllSymbolSearchHandlers() const;

    std::vector<std::string> getSupportedLanguages(Capability capability) const;
    bool hasHandlers(Capability capability) const;
    size_t handlerCount(Capability capability) const;

    void logSummary() const;

private:
    template <typename Handler>
    struct Slot {
        std::unique_ptr<Handler> handler;
        std::string languageId;
        bool available = false;
    };

    template <typename Handler>
    using Slots = std::vector<Slot<Handler>>;

    template <typename Handler>
    static bool add(Slots<Handler>& slots, std::unique_ptr<Handler> handler);

    template <typename Handler>
    static const Handler* select(const Slots<Handler>& slots, const ICodeModel& model, const ElementHandle& element);

    template <typename Handler>
    static std::vector<std::string> languagesOf(const Slots<Handler>& slots);

    Slots<ITypeHierarchyHandler> typeHierarchyHandlers;
    Slots<IImplementationsHandler> implementationsHandlers;
    Slots<ICallHierarchyHandler> callHierarchyHandlers;
    Slots<ISymbolSearchHandler> symbolSearchHandlers;
    Slots<ISuperMethodsHandler> superMethodsHandlers;
};
