#include "ToolRegistry.h"
#include "core/QueryError.h"
#include "utils/Logger.h"

void ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) return;

    std::string name = tool->getName();
    if (tools.count(name)) {
        Logger::getInstance().warn("Replacing already registered tool: " + name);
    }

    tools[name] = std::move(tool);
}

ITool* ToolRegistry::getTool(const std::string& name) {
    auto it = tools.find(name);
    if (it == tools.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<nlohmann::json> ToolRegistry::listToolSchemas() const {
    std::vector<nlohmann::json> schemas;

    for (const auto& [name, tool] : tools) {
        nlohmann::json schema;
        schema["name"] = tool->getName();
        schema["description"] = tool->getDescription();
        schema["inputSchema"] = tool->getSchema();
        schemas.push_back(schema);
    }

    return schemas;
}

nlohmann::json ToolRegistry::errorResponse(const std::string& message, int code, const std::string& kind) {
    nlohmann::json error;
    error["error"] = message;
    error["code"] = code;
    error["errorKind"] = kind;
    error["isError"] = true;
    return error;
}

nlohmann::json ToolRegistry::executeTool(const std::string& name, const nlohmann::json& args,
                                         const CancellationToken& cancel) {
    ITool* tool = getTool(name);
    if (!tool) {
        return errorResponse("Tool not found: " + name, QueryErrorCodes::INVALID_PARAMS, "invalid_arguments");
    }

    try {
        return tool->execute(args, cancel);
    } catch (const nlohmann::json::exception& e) {
        return errorResponse(std::string("Invalid arguments for ") + name + ": " + e.what(),
                             QueryErrorCodes::INVALID_PARAMS, "invalid_arguments");
    } catch (const std::exception& e) {
        Logger::getInstance().error("Tool " + name + " failed: " + e.what());
        return errorResponse(std::string("Tool execution failed: ") + e.what(),
                             QueryErrorCodes::INTERNAL_ERROR, "internal_error");
    }
}

bool ToolRegistry::hasTool(const std::string& name) const {
    return tools.count(name) > 0;
}
