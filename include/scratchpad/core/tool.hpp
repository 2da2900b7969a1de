/*
 * Scratchpad C++ - Tool definitions
 *
 * A tool is a named, described callable taking JSON parameters and returning
 * text for the calling agent:
 *   {"tool": "read_file", "arguments": {"file_path": "notes.txt"}}
 */
#ifndef scratchpad_CORE_TOOL_HPP
#define scratchpad_CORE_TOOL_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <functional>

namespace scratchpad {

// Schema for a tool parameter
struct ToolParamSchema {
    std::string name;
    std::string type;       // "string", "number", "boolean", "array", "object"
    std::string description;
    bool required;
    std::string default_value;

    ToolParamSchema() : required(false) {}
    ToolParamSchema(const std::string& n, const std::string& t, const std::string& d, bool r = false)
        : name(n), type(t), description(d), required(r) {}
};

// Tool execution result
struct AgentToolResult {
    bool success;
    std::string output;     // Text output to show the agent
    std::string error;      // Error message if failed

    AgentToolResult() : success(false) {}

    static AgentToolResult ok(const std::string& output) {
        AgentToolResult r;
        r.success = true;
        r.output = output;
        return r;
    }

    static AgentToolResult fail(const std::string& err) {
        AgentToolResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

typedef std::function<AgentToolResult(const Json& params)> ToolExecutor;

struct AgentTool {
    std::string name;
    std::string description;
    std::vector<ToolParamSchema> params;
    ToolExecutor execute;

    AgentTool() {}
    AgentTool(const std::string& n, const std::string& d, ToolExecutor e)
        : name(n), description(d), execute(e) {}
};

// A tool invocation parsed from a JSON line
struct ParsedToolCall {
    std::string tool_name;
    Json params;
    std::string raw_content;
    bool valid;
    std::string parse_error;

    ParsedToolCall() : params(Json::object()), valid(false) {}
};

// ============================================================================
// Tool Provider
// ============================================================================

// A group of related tools exposed under one id. Each action is also
// available as an AgentTool with a full parameter description.
class ToolProvider {
public:
    virtual ~ToolProvider() {}

    virtual const char* tool_id() const = 0;
    virtual std::vector<std::string> actions() const = 0;
    virtual AgentToolResult execute(const std::string& action, const Json& params) const = 0;
    virtual std::vector<AgentTool> get_agent_tools() const = 0;
};

} // namespace scratchpad

#endif // scratchpad_CORE_TOOL_HPP
