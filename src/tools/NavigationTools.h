#pragma once
#include "ITool.h"
#include "core/QueryFacade.h"

/**
 * @brief Shared plumbing for the navigation tools.
 *
 * Reads the common "file"/"line"/"column" (or "className") arguments and
 * wraps façade results into tool responses.
 */
class NavigationTool : public ITool {
public:
    explicit NavigationTool(const QueryFacade& facade) : facade(facade) {}

protected:
    QueryResult<StartRef> parseStartRef(const nlohmann::json& args) const;
    static nlohmann::json positionProperties();

    static nlohmann::json success(const nlohmann::json& payload);
    static nlohmann::json failure(const QueryError& error);

    template <typename T>
    static nlohmann::json respond(const QueryResult<T>& result) {
        return result.ok() ? success(result.value().toJson()) : failure(result.error());
    }

    const QueryFacade& facade;
};

class TypeHierarchyTool : public NavigationTool {
public:
    using NavigationTool::NavigationTool;
    std::string getName() const override { return "type_hierarchy"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const CancellationToken& cancel) override;
};

class CallHierarchyTool : public NavigationTool {
public:
    using NavigationTool::NavigationTool;
    std::string getName() const override { return "call_hierarchy"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const CancellationToken& cancel) override;
};

class SuperMethodsTool : public NavigationTool {
public:
    using NavigationTool::NavigationTool;
    std::string getName() const override { return "super_methods"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const CancellationToken& cancel) override;
};

class FindSymbolTool : public NavigationTool {
public:
    using NavigationTool::NavigationTool;
    std::string getName() const override { return "find_symbol"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const CancellationToken& cancel) override;
};

class FindImplementationsTool : public NavigationTool {
public:
    using NavigationTool::NavigationTool;
    std::string getName() const override { return "find_implementations"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const CancellationToken& cancel) override;
};

// Registers all of the above against one façade.
class ToolRegistry;
void registerNavigationTools(ToolRegistry& registry, const QueryFacade& facade);
