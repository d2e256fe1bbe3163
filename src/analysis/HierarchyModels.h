#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Result values produced per query. None of them refer back into the code model.

struct TypeNode {
    std::string name;
    std::optional<std::string> qualifiedName;
    std::optional<std::string> file;
    std::optional<int> line;
    std::string kind;
    std::string language;
    std::vector<TypeNode> supertypes;

    nlohmann::json toJson() const;
};

struct TypeHierarchyResult {
    TypeNode node;
    std::vector<TypeNode> supertypes;
    std::vector<TypeNode> subtypes;

    nlohmann::json toJson() const;
};

struct CallNode {
    std::string name;
    std::string file;
    int line = 0;
    std::string language;
    std::vector<CallNode> children;

    bool sameSite(const CallNode& other) const {
        return name == other.name && file == other.file && line == other.line;
    }
    nlohmann::json toJson() const;
};

struct CallHierarchyResult {
    CallNode node;
    std::vector<CallNode> calls;

    nlohmann::json toJson() const;
};

struct MethodInfo {
    std::string name;
    std::string signature;
    std::string containingClass;
    std::string file;
    int line = 0;
    std::string language;

    nlohmann::json toJson() const;
};

struct SuperMethodEntry {
    std::string name;
    std::string signature;
    std::string containingClass;
    std::string containingClassKind;
    std::optional<std::string> file;
    std::optional<int> line;
    bool isInterface = false;
    int depth = 1;
    std::string language;

    nlohmann::json toJson() const;
};

struct SuperMethodsResult {
    MethodInfo method;
    std::vector<SuperMethodEntry> hierarchy;

    nlohmann::json toJson() const;
};

struct SymbolMatch {
    std::string name;
    std::optional<std::string> qualifiedName;
    std::string kind;
    std::string file;
    int line = 0;
    std::optional<std::string> containerName;
    std::string language;

    nlohmann::json toJson() const;
};

struct SymbolSearchResult {
    std::vector<SymbolMatch> symbols;
    std::string query;

    nlohmann::json toJson() const;
};

struct ImplementationEntry {
    std::string name;
    std::string file;
    int line = 0;
    std::string kind;
    std::string language;

    nlohmann::json toJson() const;
};

struct ImplementationsResult {
    std::vector<ImplementationEntry> implementations;

    nlohmann::json toJson() const;
};
