#pragma once
#include <string>
#include <memory>
#include <map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"

/**
 * @brief 工具注册中心
 *
 * Owns every tool and is the only way a transport reaches them.
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    /**
     * @brief 注册一个工具
     * @param tool Tool instance; a tool with the same name is replaced
     */
    void registerTool(std::unique_ptr<ITool> tool);

    /**
     * @brief 获取工具实例
     * @return nullptr if no tool has this name
     */
    ITool* getTool(const std::string& name);

    /**
     * @brief 列出所有工具的 Schema
     *
     * 格式:
     * [
     *   {
     *     "name": "tool_name",
     *     "description": "...",
     *     "inputSchema": { JSON Schema }
     *   }
     * ]
     */
    std::vector<nlohmann::json> listToolSchemas() const;

    /**
     * @brief 执行工具
     *
     * Unknown tools and exceptions escaping a tool are reported as error
     * responses, never thrown.
     */
    nlohmann::json executeTool(const std::string& name, const nlohmann::json& args,
                               const CancellationToken& cancel = CancellationToken::none());

    size_t getToolCount() const { return tools.size(); }
    bool hasTool(const std::string& name) const;

    // Error response in the same shape the tools use.
    static nlohmann::json errorResponse(const std::string& message, int code, const std::string& kind);

private:
    std::map<std::string, std::unique_ptr<ITool>> tools;
};
