#include "handlers/HandlerRegistry.h"
#include <algorithm>
#include "utils/Logger.h"

std::string capabilityName(Capability capability) {
    switch (capability) {
        case Capability::TypeHierarchy: return "type_hierarchy";
        case Capability::Implementations: return "implementations";
        case Capability::CallHierarchy: return "call_hierarchy";
        case Capability::SymbolSearch: return "symbol_search";
        case Capability::SuperMethods: return "super_methods";
    }
    return "unknown";
}

template <typename Handler>
bool HandlerRegistry::add(Slots<Handler>& slots, std::unique_ptr<Handler> handler) {
    if (!handler) return false;

    std::string languageId = handler->getLanguageId();
    bool taken = std::any_of(slots.begin(), slots.end(),
                             [&](const Slot<Handler>& s) { return s.languageId == languageId; });
    if (taken) {
        Logger::getInstance().warn("Ignoring duplicate " + capabilityName(Handler::capability) +
                                   " handler for language " + languageId);
        return false;
    }

    Slot<Handler> slot;
    slot.languageId = languageId;
    slot.available = handler->isAvailable();
    slot.handler = std::move(handler);
    Logger::getInstance().debug("Registered " + capabilityName(Handler::capability) + " handler for " + languageId +
                                (slot.available ? "" : " (unavailable)"));
    slots.push_back(std::move(slot));
    return true;
}

template <typename Handler>
const Handler* HandlerRegistry::select(const Slots<Handler>& slots, const ICodeModel& model,
                                       const ElementHandle& element) {
    const std::string language = model.languageOf(element);
    for (const auto& slot : slots) {
        if (slot.available && slot.languageId == language && slot.handler->canHandle(model, element)) {
            return slot.handler.get();
        }
    }
    for (const auto& slot : slots) {
        if (slot.available && slot.handler->canHandle(model, element)) {
            return slot.handler.get();
        }
    }
    return nullptr;
}

template <typename Handler>
std::vector<std::string> HandlerRegistry::languagesOf(const Slots<Handler>& slots) {
    std::vector<std::string> languages;
    for (const auto& slot : slots) {
        if (slot.available) languages.push_back(slot.languageId);
    }
    return languages;
}

bool HandlerRegistry::registerTypeHierarchyHandler(std::unique_ptr<ITypeHierarchyHandler> handler) {
    return add(typeHierarchyHandlers, std::move(handler));
}

bool HandlerRegistry::registerImplementationsHandler(std::unique_ptr<IImplementationsHandler> handler) {
    return add(implementationsHandlers, std::move(handler));
}

bool HandlerRegistry::registerCallHierarchyHandler(std::unique_ptr<ICallHierarchyHandler> handler) {
    return add(callHierarchyHandlers, std::move(handler));
}

bool HandlerRegistry::registerSymbolSearchHandler(std::unique_ptr<ISymbolSearchHandler> handler) {
    return add(symbolSearchHandlers, std::move(handler));
}

bool HandlerRegistry::registerSuperMethodsHandler(std::unique_ptr<ISuperMethodsHandler> handler) {
    return add(superMethodsHandlers, std::move(handler));
}

const ITypeHierarchyHandler* HandlerRegistry::getTypeHierarchyHandler(const ICodeModel& model,
                                                                      const ElementHandle& element) const {
    return select(typeHierarchyHandlers, model, element);
}

const IImplementationsHandler* HandlerRegistry::getImplementationsHandler(const ICodeModel& model,
                                                                          const ElementHandle& element) const {
    return select(implementationsHandlers, model, element);
}

const ICallHierarchyHandler* HandlerRegistry::getCallHierarchyHandler(const ICodeModel& model,
                                                                      const ElementHandle& element) const {
    return select(callHierarchyHandlers, model, element);
}

const ISuperMethodsHandler* HandlerRegistry::getSuperMethodsHandler(const ICodeModel& model,
                                                                    const ElementHandle& element) const {
    return select(superMethodsHandlers, model, element);
}

std::vector<const ISymbolSearchHandler*> HandlerRegistry::getAllSymbolSearchHandlers() const {
    std::vector<const ISymbolSearchHandler*> handlers;
    for (const auto& slot : symbolSearchHandlers) {
        if (slot.available) handlers.push_back(slot.handler.get());
    }
    return handlers;
}

std::vector<std::string> HandlerRegistry::getSupportedLanguages(Capability capability) const {
    switch (capability) {
        case Capability::TypeHierarchy: return languagesOf(typeHierarchyHandlers);
        case Capability::Implementations: return languagesOf(implementationsHandlers);
        case Capability::CallHierarchy: return languagesOf(callHierarchyHandlers);
        case Capability::SymbolSearch: return languagesOf(symbolSearchHandlers);
        case Capability::SuperMethods: return languagesOf(superMethodsHandlers);
    }
    return {};
}

bool HandlerRegistry::hasHandlers(Capability capability) const {
    return !getSupportedLanguages(capability).empty();
}

size_t HandlerRegistry::handlerCount(Capability capability) const {
    switch (capability) {
        case Capability::TypeHierarchy: return typeHierarchyHandlers.size();
        case Capability::Implementations: return implementationsHandlers.size();
        case Capability::CallHierarchy: return callHierarchyHandlers.size();
        case Capability::SymbolSearch: return symbolSearchHandlers.size();
        case Capability::SuperMethods: return superMethodsHandlers.size();
    }
    return 0;
}

void HandlerRegistry::logSummary() const {
    const Capability all[] = {Capability::TypeHierarchy, Capability::Implementations, Capability::CallHierarchy,
                              Capability::SymbolSearch, Capability::SuperMethods};
    for (Capability capability : all) {
        auto languages = getSupportedLanguages(capability);
        std::string list;
        for (const auto& lang : languages) {
            if (!list.empty()) list += ", ";
            list += lang;
        }
        Logger::getInstance().info(capabilityName(capability) + ": " + std::to_string(handlerCount(capability)) +
                                   " handlers [" + list + "]");
    }
}
