#include "NavigationTools.h"
#include "ToolRegistry.h"

QueryResult<StartRef> NavigationTool::parseStartRef(const nlohmann::json& args) const {
    if (args.contains("className") && args["className"].is_string()) {
        std::string name = args["className"].get<std::string>();
        if (!name.empty()) return StartRef::named(name);
    }

    if (!args.contains("file") || !args["file"].is_string()) {
        return QueryError::invalidArguments("Missing required parameter: file");
    }
    if (!args.contains("line") || !args["line"].is_number_integer()) {
        return QueryError::invalidArguments("Missing required parameter: line");
    }
    if (!args.contains("column") || !args["column"].is_number_integer()) {
        return QueryError::invalidArguments("Missing required parameter: column");
    }

    int line = args["line"].get<int>();
    int column = args["column"].get<int>();
    if (line < 1 || column < 1) {
        return QueryError::invalidArguments("line and column must be >= 1");
    }
    return StartRef::at(args["file"].get<std::string>(), line, column);
}

nlohmann::json NavigationTool::positionProperties() {
    return {
        {"file", {
            {"type", "string"},
            {"description", "Path to the file relative to the project root"}
        }},
        {"line", {
            {"type", "integer"},
            {"description", "1-based line number"},
            {"minimum", 1}
        }},
        {"column", {
            {"type", "integer"},
            {"description", "1-based column number"},
            {"minimum", 1}
        }}
    };
}

nlohmann::json NavigationTool::success(const nlohmann::json& payload) {
    nlohmann::json result;
    result["content"] = nlohmann::json::array({
        {{"type", "text"}, {"text", payload.dump()}}
    });
    return result;
}

nlohmann::json NavigationTool::failure(const QueryError& error) {
    return ToolRegistry::errorResponse(error.message, error.code(), error.kindName());
}

// type_hierarchy

std::string TypeHierarchyTool::getDescription() const {
    return "Get the supertypes (as a tree) and subtypes (as a flat list) of a class or interface. "
           "Identify the type by file position or by its fully qualified className.";
}

nlohmann::json TypeHierarchyTool::getSchema() const {
    nlohmann::json properties = positionProperties();
    properties["className"] = {
        {"type", "string"},
        {"description", "Fully qualified type name; alternative to file/line/column"}
    };
    return {
        {"type", "object"},
        {"properties", properties}
    };
}

nlohmann::json TypeHierarchyTool::execute(const nlohmann::json& args, const CancellationToken& cancel) {
    auto start = parseStartRef(args);
    if (!start) return failure(start.error());
    return respond(facade.typeHierarchy(start.value(), cancel));
}

// call_hierarchy

std::string CallHierarchyTool::getDescription() const {
    return "Build a call hierarchy for the method at a position: who calls it (callers) "
           "or what it calls (callees), up to a limited depth.";
}

nlohmann::json CallHierarchyTool::getSchema() const {
    const auto& limits = facade.getLimits();
    nlohmann::json properties = positionProperties();
    properties["direction"] = {
        {"type", "string"},
        {"enum", {"callers", "callees"}},
        {"description", "callers: methods that call this one; callees: methods this one calls"}
    };
    properties["depth"] = {
        {"type", "integer"},
        {"description", "How many levels to traverse"},
        {"default", limits.defaultCallDepth},
        {"minimum", 1},
        {"maximum", limits.maxCallDepth}
    };
    return {
        {"type", "object"},
        {"properties", properties},
        {"required", {"file", "line", "column", "direction"}}
    };
}

nlohmann::json CallHierarchyTool::execute(const nlohmann::json& args, const CancellationToken& cancel) {
    auto start = parseStartRef(args);
    if (!start) return failure(start.error());

    if (!args.contains("direction") || !args["direction"].is_string()) {
        return failure(QueryError::invalidArguments("Missing required parameter: direction"));
    }
    std::optional<int> depth;
    if (args.contains("depth")) {
        if (!args["depth"].is_number_integer()) {
            return failure(QueryError::invalidArguments("depth must be an integer"));
        }
        depth = args["depth"].get<int>();
    }
    return respond(facade.callHierarchy(start.value(), args["direction"].get<std::string>(), depth, cancel));
}

// super_methods

std::string SuperMethodsTool::getDescription() const {
    return "Find the methods that the method at a position overrides or implements, "
           "ordered from the nearest ancestor outwards.";
}

nlohmann::json SuperMethodsTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", positionProperties()},
        {"required", {"file", "line", "column"}}
    };
}

nlohmann::json SuperMethodsTool::execute(const nlohmann::json& args, const CancellationToken& cancel) {
    auto start = parseStartRef(args);
    if (!start) return failure(start.error());
    return respond(facade.superMethods(start.value(), cancel));
}

// find_symbol

std::string FindSymbolTool::getDescription() const {
    return "Search declarations (classes, methods, fields, ...) by name. Matches substrings and "
           "ordered subsequences case-insensitively, e.g. 'USvc' finds 'UserService'.";
}

nlohmann::json FindSymbolTool::getSchema() const {
    const auto& limits = facade.getLimits();
    return {
        {"type", "object"},
        {"properties", {
            {"query", {
                {"type", "string"},
                {"description", "Name or fragment to search for"}
            }},
            {"includeLibraries", {
                {"type", "boolean"},
                {"description", "Also search library declarations"},
                {"default", false}
            }},
            {"limit", {
                {"type", "integer"},
                {"description", "Maximum number of results"},
                {"default", limits.defaultSymbolLimit},
                {"minimum", 1},
                {"maximum", limits.maxSymbolLimit}
            }}
        }},
        {"required", {"query"}}
    };
}

nlohmann::json FindSymbolTool::execute(const nlohmann::json& args, const CancellationToken& cancel) {
    if (!args.contains("query") || !args["query"].is_string()) {
        return failure(QueryError::invalidArguments("Missing required parameter: query"));
    }
    SearchScope scope = args.value("includeLibraries", false) ? SearchScope::ProjectAndLibraries
                                                               : SearchScope::Project;
    std::optional<int> limit;
    if (args.contains("limit")) {
        if (!args["limit"].is_number_integer()) {
            return failure(QueryError::invalidArguments("limit must be an integer"));
        }
        limit = args["limit"].get<int>();
    }
    return respond(facade.searchSymbols(args["query"].get<std::string>(), scope, limit, cancel));
}

// find_implementations

std::string FindImplementationsTool::getDescription() const {
    return "List implementations of the interface, class or method at a position: "
           "subtypes of a type, or overriding methods of a method.";
}

nlohmann::json FindImplementationsTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", positionProperties()},
        {"required", {"file", "line", "column"}}
    };
}

nlohmann::json FindImplementationsTool::execute(const nlohmann::json& args, const CancellationToken& cancel) {
    auto start = parseStartRef(args);
    if (!start) return failure(start.error());
    return respond(facade.findImplementations(start.value(), cancel));
}

void registerNavigationTools(ToolRegistry& registry, const QueryFacade& facade) {
    registry.registerTool(std::make_unique<TypeHierarchyTool>(facade));
    registry.registerTool(std::make_unique<CallHierarchyTool>(facade));
    registry.registerTool(std::make_unique<SuperMethodsTool>(facade));
    registry.registerTool(std::make_unique<FindSymbolTool>(facade));
    registry.registerTool(std::make_unique<FindImplementationsTool>(facade));
}
