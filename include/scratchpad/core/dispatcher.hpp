/*
 * Scratchpad C++ - Tool Dispatcher
 *
 * Registry of agent tools plus the line protocol used to drive them.
 *
 * Tool Call Format (one JSON object):
 *   {"tool": "tool_name", "arguments": {"param1": "value1"}}
 *
 * Tool Result Format:
 *   [TOOL_RESULT tool=tool_name success=true]
 *     ... result content ...
 *   [/TOOL_RESULT]
 */
#ifndef scratchpad_CORE_DISPATCHER_HPP
#define scratchpad_CORE_DISPATCHER_HPP

#include "tool.hpp"
#include <string>
#include <vector>
#include <map>

namespace scratchpad {

class ToolDispatcher {
public:
    ToolDispatcher();

    void register_tool(const AgentTool& tool);
    void register_tools(const std::vector<AgentTool>& tools);
    void clear();

    const std::map<std::string, AgentTool>& tools() const { return tools_; }
    bool has_tool(const std::string& name) const;

    // Markdown listing of tools and their parameters
    std::string build_tools_prompt() const;

    // Parse a single JSON tool call. Invalid input yields valid == false.
    ParsedToolCall parse_tool_call(const std::string& text) const;

    AgentToolResult execute(const ParsedToolCall& call) const;

    static std::string format_tool_result(const std::string& tool_name, const AgentToolResult& result);

private:
    std::string available_tools() const;

    std::map<std::string, AgentTool> tools_;
};

} // namespace scratchpad

#endif // scratchpad_CORE_DISPATCHER_HPP
