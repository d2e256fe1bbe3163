#pragma once
#include <optional>
#include <string>
#include <vector>
#include "core/ConfigManager.h"
#include "model/CodeModel.h"

/**
 * @brief Per-family knowledge the shared resolution algorithms defer to.
 *
 * The defaults describe a generic class-based language. Each language family
 * overrides what differs: its implicit root types, how overrides are found,
 * and how methods are rendered in results.
 */
class LanguageSupport {
public:
    virtual ~LanguageSupport() = default;

    virtual std::string familyName() const = 0;
    // Language ids (as reported by the code model) this family understands.
    virtual std::vector<std::string> languageIds() const = 0;
    bool handlesLanguage(const std::string& languageId) const;

    // "JAVA" -> "Java"; unknown ids are returned unchanged.
    virtual std::string displayLanguage(const std::string& languageId) const { return languageId; }

    virtual bool isImplicitRoot(const std::string& typeName) const;
    virtual int hierarchyDepthLimit(const QueryLimits& limits) const { return limits.dynamicHierarchyDepth; }

    // True when the model records explicit override edges for this family.
    virtual bool followsOverrideEdges() const { return false; }
    virtual bool comparesSignatures() const { return false; }
    virtual bool signaturesMatch(const Signature& a, const Signature& b) const;

    virtual bool isCallable(ElementKind kind) const { return isCallableKind(kind); }
    std::optional<ElementHandle> containingType(const ICodeModel& model, const ElementHandle& element) const;
    std::optional<ElementHandle> containingCallable(const ICodeModel& model, const ElementHandle& element) const;

    std::string typeDisplayName(const ICodeModel& model, const ElementHandle& type) const;
    virtual std::string typeKind(const ICodeModel& model, const ElementHandle& type) const;
    virtual std::string unresolvedSupertypeKind(const SupertypeRef& ref) const;
    bool isInterfaceLike(ElementKind kind) const;

    // Name of a call hierarchy node, e.g. "UserService.find(String, int)".
    virtual std::string callNodeName(const ICodeModel& model, const ElementHandle& callable) const;
    // Human readable signature, e.g. "find(String id, int limit): User".
    virtual std::string methodSignature(const ICodeModel& model, const ElementHandle& callable) const;
    // Identity used by visited sets; overloads must produce distinct keys.
    virtual std::string methodKey(const ICodeModel& model, const ElementHandle& callable) const;
    virtual std::string implementationName(const ICodeModel& model, const ElementHandle& method) const;
    virtual std::string unresolvedCallName(const CallSite& site) const;

protected:
    virtual std::string memberSeparator() const { return "."; }
    virtual std::string renderParameters(const Signature& signature) const;

    // "Container<sep>name", or just the name for free functions.
    std::string memberName(const ICodeModel& model, const ElementHandle& callable) const;
    // "path:line:name", for families without overload-aware keys.
    std::string locationKey(const ICodeModel& model, const ElementHandle& callable) const;

    static std::string join(const std::vector<std::string>& parts, const std::string& sep);
};
