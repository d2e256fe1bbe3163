#pragma once
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "model/CodeModel.h"

/**
 * @brief In-memory code model over an index exported by an external indexer.
 *
 * Elements are added once (usually by SnapshotLoader), then buildIndices()
 * derives the reverse edges used by the queries. After that the model is
 * immutable and may be read from several threads at once.
 */
class SnapshotCodeModel : public ICodeModel {
public:
    struct SupertypeEntry {
        std::string name;
        bool isInterface = false;
        std::int64_t target = 0; // 0: resolve by qualified name in buildIndices()
    };

    struct CallEntry {
        std::string text;
        SourceLocation location;
        std::int64_t target = 0; // 0: unresolved
    };

    struct Element {
        std::int64_t id = 0;
        ElementKind kind = ElementKind::Unknown;
        std::string name;
        std::string qualifiedName;
        std::string language;
        SourceLocation location;
        int endLine = 0;
        std::int64_t container = 0;
        bool library = false;
        Signature signature;
        std::vector<SupertypeEntry> supertypes;
        std::vector<std::int64_t> overrides;
        std::vector<CallEntry> calls;
        std::int64_t referenceTarget = 0; // only for ElementKind::Reference
    };

    SnapshotCodeModel() = default;

    void addElement(Element element);
    void addLanguage(const std::string& languageId) { languages.insert(languageId); }
    void setIndexReady(bool ready) { indexReady = ready; }
    void buildIndices();

    size_t elementCount() const { return elements.size(); }
    const std::set<std::string>& getLanguages() const { return languages; }

    bool isIndexReady() const override { return indexReady; }
    bool hasLanguageSupport(const std::string& languageId) const override;

    std::optional<ElementHandle> resolveAt(const std::string& path, int line, int column) const override;
    std::optional<ElementHandle> resolveByQualifiedName(const std::string& qualifiedName) const override;

    std::vector<SupertypeRef> declaredSupertypes(const ElementHandle& type) const override;
    void transitiveSubtypes(const ElementHandle& type, const ElementVisitor& visitor) const override;

    void overridingMethods(const ElementHandle& method, const ElementVisitor& visitor) const override;
    std::vector<ElementHandle> overriddenMethods(const ElementHandle& method) const override;
    std::vector<ElementHandle> methodsOf(const ElementHandle& type) const override;

    void referencesTo(const ElementHandle& element, const ElementVisitor& visitor) const override;
    std::optional<ElementHandle> enclosingDeclaration(const ElementHandle& element) const override;
    void callSitesWithin(const ElementHandle& callable, const std::function<bool(const CallSite&)>& visitor) const override;

    void allDeclaredNames(NameCategory category, SearchScope scope, const std::string& languageId,
                          const NameVisitor& visitor) const override;
    void declarationsNamed(const std::string& name, NameCategory category, SearchScope scope,
                           const std::string& languageId, const ElementVisitor& visitor) const override;

    std::optional<SourceLocation> locationOf(const ElementHandle& element) const override;
    ElementKind kindOf(const ElementHandle& element) const override;
    std::string languageOf(const ElementHandle& element) const override;
    Signature signatureOf(const ElementHandle& element) const override;
    std::string nameOf(const ElementHandle& element) const override;
    std::optional<std::string> qualifiedNameOf(const ElementHandle& element) const override;

private:
    std::unordered_map<std::int64_t, Element> elements;
    std::unordered_map<std::string, std::int64_t> byQualifiedName;
    std::unordered_map<std::string, std::vector<std::int64_t>> byFile;
    std::unordered_map<std::int64_t, std::vector<std::int64_t>> directSubtypes;
    std::unordered_map<std::int64_t, std::vector<std::int64_t>> directOverriders;
    std::unordered_map<std::int64_t, std::vector<std::int64_t>> referencesByTarget;
    std::unordered_map<std::int64_t, std::vector<std::int64_t>> membersByContainer;
    std::map<std::string, std::vector<std::int64_t>> byName;
    std::set<std::string> languages;
    bool indexReady = true;

    const Element* find(const ElementHandle& handle) const;
    const Element* find(std::int64_t id) const;
    bool matchesFilter(const Element& e, NameCategory category, SearchScope scope, const std::string& languageId) const;
    void walkTransitive(std::int64_t start, const std::unordered_map<std::int64_t, std::vector<std::int64_t>>& edges,
                        const ElementVisitor& visitor) const;
    static std::string normalizePath(const std::string& path);
};
