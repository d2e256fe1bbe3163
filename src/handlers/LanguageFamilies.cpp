#include "handlers/LanguageFamilies.h"
#include <functional>
#include <utility>
#include "handlers/go/GoHandlers.h"
#include "handlers/javascript/JavaScriptHandlers.h"
#include "handlers/jvm/JvmHandlers.h"
#include "handlers/php/PhpHandlers.h"
#include "handlers/python/PythonHandlers.h"
#include "handlers/rust/RustHandlers.h"
#include "utils/Logger.h"

LanguageProbe::LanguageProbe(const ICodeModel& model, const Config& config)
    : model(model), config(config) {}

bool LanguageProbe::isAvailable(const std::string& languageId) const {
    return !isDisabled(languageId) && model.hasLanguageSupport(languageId);
}

bool LanguageProbe::isDisabled(const std::string& languageId) const {
    return config.isLanguageDisabled(languageId);
}

namespace {
    template <typename Family, typename Delegate, typename Interface>
    void registerWithDelegates(const std::shared_ptr<const LanguageSupport>& support, bool available,
                               const LanguageProbe& probe, const std::vector<std::string>& delegateTags,
                               const std::function<bool(std::unique_ptr<Interface>)>& add) {
        const std::string primary = support->languageIds().front();
        if (!probe.isDisabled(primary)) {
            add(std::make_unique<Family>(support, available));
        }
        for (const auto& tag : delegateTags) {
            if (probe.isDisabled(tag)) continue;
            add(std::make_unique<Delegate>(tag, std::make_unique<Family>(support, available)));
        }
    }
}

void registerFamily(HandlerRegistry& registry, const std::shared_ptr<const LanguageSupport>& support,
                    const LanguageProbe& probe, const std::vector<std::string>& delegateTags) {
    bool available = false;
    for (const auto& id : support->languageIds()) {
        available = available || probe.isAvailable(id);
    }

    registerWithDelegates<FamilyTypeHierarchyHandler, DelegatingTypeHierarchyHandler, ITypeHierarchyHandler>(
        support, available, probe, delegateTags,
        [&](std::unique_ptr<ITypeHierarchyHandler> h) { return registry.registerTypeHierarchyHandler(std::move(h)); });
    registerWithDelegates<FamilyImplementationsHandler, DelegatingImplementationsHandler, IImplementationsHandler>(
        support, available, probe, delegateTags,
        [&](std::unique_ptr<IImplementationsHandler> h) { return registry.registerImplementationsHandler(std::move(h)); });
    registerWithDelegates<FamilyCallHierarchyHandler, DelegatingCallHierarchyHandler, ICallHierarchyHandler>(
        support, available, probe, delegateTags,
        [&](std::unique_ptr<ICallHierarchyHandler> h) { return registry.registerCallHierarchyHandler(std::move(h)); });
    registerWithDelegates<FamilySymbolSearchHandler, DelegatingSymbolSearchHandler, ISymbolSearchHandler>(
        support, available, probe, delegateTags,
        [&](std::unique_ptr<ISymbolSearchHandler> h) { return registry.registerSymbolSearchHandler(std::move(h)); });
    registerWithDelegates<FamilySuperMethodsHandler, DelegatingSuperMethodsHandler, ISuperMethodsHandler>(
        support, available, probe, delegateTags,
        [&](std::unique_ptr<ISuperMethodsHandler> h) { return registry.registerSuperMethodsHandler(std::move(h)); });

    Logger::getInstance().debug("Language family " + support->familyName() +
                                (available ? " registered" : " registered (unavailable)"));
}

void registerLanguageFamilies(HandlerRegistry& registry, const ICodeModel& model, const Config& config) {
    LanguageProbe probe(model, config);

    const std::vector<std::pair<std::string, std::function<void()>>> families = {
        {"JVM", [&] { registerJvmHandlers(registry, probe); }},
        {"Python", [&] { registerPythonHandlers(registry, probe); }},
        {"JavaScript", [&] { registerJavaScriptHandlers(registry, probe); }},
        {"Go", [&] { registerGoHandlers(registry, probe); }},
        {"Rust", [&] { registerRustHandlers(registry, probe); }},
        {"PHP", [&] { registerPhpHandlers(registry, probe); }},
    };

    for (const auto& [name, registerFn] : families) {
        try {
            registerFn();
        } catch (const std::exception& e) {
            Logger::getInstance().warn("Failed to register " + name + " handlers: " + e.what());
        }
    }
    registry.logSummary();
}
