#include "model/SnapshotCodeModel.h"
#include "utils/Logger.h"
#include <algorithm>
#include <deque>
#include <stdexcept>
#include <unordered_set>

std::string SnapshotCodeModel::normalizePath(const std::string& path) {
    std::string p = path;
    std::replace(p.begin(), p.end(), '\\', '/');
    while (p.rfind("./", 0) == 0) {
        p.erase(0, 2);
    }
    return p;
}

void SnapshotCodeModel::addElement(Element element) {
    if (element.id <= 0) {
        throw std::runtime_error("Snapshot element has invalid id: " + std::to_string(element.id));
    }
    if (elements.count(element.id)) {
        throw std::runtime_error("Duplicate snapshot element id: " + std::to_string(element.id));
    }
    element.location.path = normalizePath(element.location.path);
    for (auto& call : element.calls) {
        call.location.path = normalizePath(call.location.path);
    }
    if (!element.language.empty() && element.kind != ElementKind::Reference) {
        languages.insert(element.language);
    }
    std::int64_t id = element.id;
    elements.emplace(id, std::move(element));
}

void SnapshotCodeModel::buildIndices() {
    byQualifiedName.clear();
    byFile.clear();
    directSubtypes.clear();
    directOverriders.clear();
    referencesByTarget.clear();
    membersByContainer.clear();
    byName.clear();

    // Deterministic order regardless of hash map iteration.
    std::vector<std::int64_t> ids;
    ids.reserve(elements.size());
    for (const auto& [id, e] : elements) ids.push_back(id);
    std::sort(ids.begin(), ids.end());

    for (auto id : ids) {
        const Element& e = elements.at(id);
        if (e.kind == ElementKind::Reference) continue;
        if (!e.qualifiedName.empty() && !byQualifiedName.count(e.qualifiedName)) {
            byQualifiedName[e.qualifiedName] = id;
        }
        if (!e.location.path.empty()) byFile[e.location.path].push_back(id);
        if (!e.name.empty()) byName[e.name].push_back(id);
        if (e.container != 0) membersByContainer[e.container].push_back(id);
    }

    size_t unresolved = 0;
    for (auto id : ids) {
        Element& e = elements.at(id);
        if (e.kind == ElementKind::Reference) {
            if (e.referenceTarget != 0 && elements.count(e.referenceTarget)) {
                referencesByTarget[e.referenceTarget].push_back(id);
            }
            continue;
        }
        for (auto& st : e.supertypes) {
            if (st.target != 0 && !elements.count(st.target)) {
                st.target = 0;
            }
            if (st.target == 0) {
                auto it = byQualifiedName.find(st.name);
                if (it != byQualifiedName.end() && it->second != id) {
                    st.target = it->second;
                } else {
                    unresolved++;
                }
            }
            if (st.target != 0) {
                directSubtypes[st.target].push_back(id);
            }
        }
        for (auto superId : e.overrides) {
            if (elements.count(superId)) {
                directOverriders[superId].push_back(id);
            }
        }
        for (auto& call : e.calls) {
            if (call.target != 0 && !elements.count(call.target)) {
                call.target = 0;
            }
        }
    }

    Logger::getInstance().debug("Snapshot indexed: " + std::to_string(elements.size()) + " elements, " +
                                std::to_string(unresolved) + " unresolved supertype references");
}

const SnapshotCodeModel::Element* SnapshotCodeModel::find(std::int64_t id) const {
    auto it = elements.find(id);
    return it == elements.end() ? nullptr : &it->second;
}

const SnapshotCodeModel::Element* SnapshotCodeModel::find(const ElementHandle& handle) const {
    return find(handle.id);
}

bool SnapshotCodeModel::hasLanguageSupport(const std::string& languageId) const {
    return languages.count(languageId) > 0;
}

std::optional<ElementHandle> SnapshotCodeModel::resolveAt(const std::string& path, int line, int column) const {
    auto it = byFile.find(normalizePath(path));
    if (it == byFile.end()) return std::nullopt;

    const Element* best = nullptr;
    for (auto id : it->second) {
        const Element& e = elements.at(id);
        int start = e.location.line;
        int end = std::max(e.endLine, start);
        if (line < start || line > end) continue;
        if (line == start && column > 0 && e.location.column > 0 && column < e.location.column) continue;

        // Innermost declaration: latest start wins, then the narrower span.
        if (!best) {
            best = &e;
            continue;
        }
        int bestEnd = std::max(best->endLine, best->location.line);
        if (start > best->location.line ||
            (start == best->location.line && e.location.column > best->location.column) ||
            (start == best->location.line && e.location.column == best->location.column && end < bestEnd)) {
            best = &e;
        }
    }
    if (!best) return std::nullopt;
    return ElementHandle{best->id};
}

std::optional<ElementHandle> SnapshotCodeModel::resolveByQualifiedName(const std::string& qualifiedName) const {
    auto it = byQualifiedName.find(qualifiedName);
    if (it == byQualifiedName.end()) return std::nullopt;
    return ElementHandle{it->second};
}

std::vector<SupertypeRef> SnapshotCodeModel::declaredSupertypes(const ElementHandle& type) const {
    std::vector<SupertypeRef> result;
    const Element* e = find(type);
    if (!e) return result;
    for (const auto& st : e->supertypes) {
        SupertypeRef ref;
        ref.declaredName = st.name;
        ref.isInterface = st.isInterface;
        if (st.target != 0) ref.resolved = ElementHandle{st.target};
        result.push_back(std::move(ref));
    }
    return result;
}

void SnapshotCodeModel::walkTransitive(std::int64_t start,
                                       const std::unordered_map<std::int64_t, std::vector<std::int64_t>>& edges,
                                       const ElementVisitor& visitor) const {
    std::unordered_set<std::int64_t> seen{start};
    std::deque<std::int64_t> queue{start};
    while (!queue.empty()) {
        auto current = queue.front();
        queue.pop_front();
        auto it = edges.find(current);
        if (it == edges.end()) continue;
        for (auto next : it->second) {
            if (!seen.insert(next).second) continue;
            if (!visitor(ElementHandle{next})) return;
            queue.push_back(next);
        }
    }
}

void SnapshotCodeModel::transitiveSubtypes(const ElementHandle& type, const ElementVisitor& visitor) const {
    if (!find(type)) return;
    walkTransitive(type.id, directSubtypes, visitor);
}

void SnapshotCodeModel::overridingMethods(const ElementHandle& method, const ElementVisitor& visitor) const {
    if (!find(method)) return;
    walkTransitive(method.id, directOverriders, visitor);
}

std::vector<ElementHandle> SnapshotCodeModel::overriddenMethods(const ElementHandle& method) const {
    std::vector<ElementHandle> result;
    const Element* e = find(method);
    if (!e) return result;
    for (auto id : e->overrides) {
        if (find(id)) result.push_back(ElementHandle{id});
    }
    return result;
}

std::vector<ElementHandle> SnapshotCodeModel::methodsOf(const ElementHandle& type) const {
    std::vector<ElementHandle> result;
    auto it = membersByContainer.find(type.id);
    if (it == membersByContainer.end()) return result;
    for (auto id : it->second) {
        if (isCallableKind(elements.at(id).kind)) result.push_back(ElementHandle{id});
    }
    return result;
}

void SnapshotCodeModel::referencesTo(const ElementHandle& element, const ElementVisitor& visitor) const {
    auto it = referencesByTarget.find(element.id);
    if (it == referencesByTarget.end()) return;
    for (auto id : it->second) {
        if (!visitor(ElementHandle{id})) return;
    }
}

std::optional<ElementHandle> SnapshotCodeModel::enclosingDeclaration(const ElementHandle& element) const {
    const Element* e = find(element);
    if (!e || e->container == 0 || !find(e->container)) return std::nullopt;
    return ElementHandle{e->container};
}

void SnapshotCodeModel::callSitesWithin(const ElementHandle& callable,
                                        const std::function<bool(const CallSite&)>& visitor) const {
    const Element* e = find(callable);
    if (!e) return;
    for (const auto& call : e->calls) {
        CallSite site;
        site.text = call.text;
        site.location = call.location;
        if (site.location.path.empty()) site.location.path = e->location.path;
        if (call.target != 0) site.target = ElementHandle{call.target};
        if (!visitor(site)) return;
    }
}

bool SnapshotCodeModel::matchesFilter(const Element& e, NameCategory category, SearchScope scope,
                                      const std::string& languageId) const {
    if (!belongsToCategory(e.kind, category)) return false;
    if (scope == SearchScope::Project && e.library) return false;
    if (!languageId.empty() && e.language != languageId) return false;
    return true;
}

void SnapshotCodeModel::allDeclaredNames(NameCategory category, SearchScope scope, const std::string& languageId,
                                         const NameVisitor& visitor) const {
    for (const auto& [name, ids] : byName) {
        bool any = std::any_of(ids.begin(), ids.end(), [&](std::int64_t id) {
            return matchesFilter(elements.at(id), category, scope, languageId);
        });
        if (any && !visitor(name)) return;
    }
}

void SnapshotCodeModel::declarationsNamed(const std::string& name, NameCategory category, SearchScope scope,
                                          const std::string& languageId, const ElementVisitor& visitor) const {
    auto it = byName.find(name);
    if (it == byName.end()) return;
    for (auto id : it->second) {
        if (!matchesFilter(elements.at(id), category, scope, languageId)) continue;
        if (!visitor(ElementHandle{id})) return;
    }
}

std::optional<SourceLocation> SnapshotCodeModel::locationOf(const ElementHandle& element) const {
    const Element* e = find(element);
    if (!e || e->location.path.empty()) return std::nullopt;
    return e->location;
}

ElementKind SnapshotCodeModel::kindOf(const ElementHandle& element) const {
    const Element* e = find(element);
    return e ? e->kind : ElementKind::Unknown;
}

std::string SnapshotCodeModel::languageOf(const ElementHandle& element) const {
    const Element* e = find(element);
    if (!e) return "";
    // References inherit the language of the declaration that encloses them.
    for (int hops = 0; e && e->language.empty() && e->container != 0 && hops < 64; ++hops) {
        e = find(e->container);
    }
    return e ? e->language : "";
}

Signature SnapshotCodeModel::signatureOf(const ElementHandle& element) const {
    const Element* e = find(element);
    return e ? e->signature : Signature{};
}

std::string SnapshotCodeModel::nameOf(const ElementHandle& element) const {
    const Element* e = find(element);
    return e ? e->name : "";
}

std::optional<std::string> SnapshotCodeModel::qualifiedNameOf(const ElementHandle& element) const {
    const Element* e = find(element);
    if (!e || e->qualifiedName.empty()) return std::nullopt;
    return e->qualifiedName;
}
