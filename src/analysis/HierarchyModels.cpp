#include "analysis/HierarchyModels.h"

namespace {
    template <typename T>
    nlohmann::json toJsonArray(const std::vector<T>& items) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& item : items) {
            arr.push_back(item.toJson());
        }
        return arr;
    }

    template <typename T>
    void putOptional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
        if (value) j[key] = *value;
    }
}

nlohmann::json TypeNode::toJson() const {
    nlohmann::json j;
    j["name"] = name;
    putOptional(j, "qualifiedName", qualifiedName);
    putOptional(j, "file", file);
    putOptional(j, "line", line);
    j["kind"] = kind;
    j["language"] = language;
    if (!supertypes.empty()) {
        j["supertypes"] = toJsonArray(supertypes);
    }
    return j;
}

nlohmann::json TypeHierarchyResult::toJson() const {
    return {
        {"element", node.toJson()},
        {"supertypes", toJsonArray(supertypes)},
        {"subtypes", toJsonArray(subtypes)}
    };
}

nlohmann::json CallNode::toJson() const {
    nlohmann::json j = {
        {"name", name},
        {"file", file},
        {"line", line},
        {"language", language}
    };
    if (!children.empty()) {
        j["children"] = toJsonArray(children);
    }
    return j;
}

nlohmann::json CallHierarchyResult::toJson() const {
    return {
        {"element", node.toJson()},
        {"calls", toJsonArray(calls)}
    };
}

nlohmann::json MethodInfo::toJson() const {
    return {
        {"name", name},
        {"signature", signature},
        {"containingClass", containingClass},
        {"file", file},
        {"line", line},
        {"language", language}
    };
}

nlohmann::json SuperMethodEntry::toJson() const {
    nlohmann::json j;
    j["name"] = name;
    j["signature"] = signature;
    j["containingClass"] = containingClass;
    j["containingClassKind"] = containingClassKind;
    putOptional(j, "file", file);
    putOptional(j, "line", line);
    j["isInterface"] = isInterface;
    j["depth"] = depth;
    j["language"] = language;
    return j;
}

nlohmann::json SuperMethodsResult::toJson() const {
    return {
        {"method", method.toJson()},
        {"hierarchy", toJsonArray(hierarchy)},
        {"totalCount", hierarchy.size()}
    };
}

nlohmann::json SymbolMatch::toJson() const {
    nlohmann::json j;
    j["name"] = name;
    putOptional(j, "qualifiedName", qualifiedName);
    j["kind"] = kind;
    j["file"] = file;
    j["line"] = line;
    putOptional(j, "containerName", containerName);
    j["language"] = language;
    return j;
}

nlohmann::json SymbolSearchResult::toJson() const {
    return {
        {"symbols", toJsonArray(symbols)},
        {"totalCount", symbols.size()},
        {"query", query}
    };
}

nlohmann::json ImplementationEntry::toJson() const {
    return {
        {"name", name},
        {"file", file},
        {"line", line},
        {"kind", kind},
        {"language", language}
    };
}

nlohmann::json ImplementationsResult::toJson() const {
    return {
        {"implementations", toJsonArray(implementations)},
        {"totalCount", implementations.size()}
    };
}
