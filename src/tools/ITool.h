#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "core/CancellationToken.h"

/**
 * @brief 工具接口定义
 *
 * Each tool adapts JSON arguments to one query and the query's result back
 * to JSON. Tools hold no state between calls.
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief 获取工具名称
     * @return Unique tool name, e.g. "type_hierarchy"
     */
    virtual std::string getName() const = 0;

    /**
     * @brief 获取工具描述
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief 获取工具的 JSON Schema
     * @return JSON Schema of the accepted arguments
     */
    virtual nlohmann::json getSchema() const = 0;

    /**
     * @brief 执行工具操作
     * @param args   Tool arguments
     * @param cancel Checked cooperatively while the query runs
     * @return Result in MCP form:
     * {
     *   "content": [
     *     {"type": "text", "text": "<result json>"}
     *   ]
     * }
     *
     * Errors:
     * {
     *   "error": "message", "code": -32002, "errorKind": "no_element_at_position", "isError": true
     * }
     */
    virtual nlohmann::json execute(const nlohmann::json& args, const CancellationToken& cancel) = 0;
};
