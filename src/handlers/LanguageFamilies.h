#pragma once
#include <memory>
#include <string>
#include <vector>
#include "core/ConfigManager.h"
#include "handlers/HandlerRegistry.h"

/**
 * @brief Decides once at startup which language tags are usable.
 *
 * A tag is available when the code model reports support for it and the
 * config does not disable it.
 */
class LanguageProbe {
public:
    LanguageProbe(const ICodeModel& model, const Config& config);

    bool isAvailable(const std::string& languageId) const;
    bool isDisabled(const std::string& languageId) const;

private:
    const ICodeModel& model;
    const Config& config;
};

/**
 * @brief Registers all five capability handlers of one family.
 *
 * The family's primary tag gets the real handlers; each tag in `delegateTags`
 * gets thin delegating wrappers around its own instances. Disabled tags are
 * not registered.
 */
void registerFamily(HandlerRegistry& registry, const std::shared_ptr<const LanguageSupport>& support,
                    const LanguageProbe& probe, const std::vector<std::string>& delegateTags = {});

// Registers every compiled-in family; a failure in one family is logged and
// does not prevent the others from registering.
void registerLanguageFamilies(HandlerRegistry& registry, const ICodeModel& model, const Config& config);
