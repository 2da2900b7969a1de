/*
 * Scratchpad C++ - Tool Dispatcher Implementation
 */
#include <scratchpad/core/dispatcher.hpp>
#include <scratchpad/core/logger.hpp>
#include <scratchpad/core/utils.hpp>

#include <sstream>

namespace scratchpad {

namespace {

struct JsonParseResult {
    bool ok;
    Json value;
    std::string error;

    JsonParseResult() : ok(false) {}
};

JsonParseResult try_parse_json(const std::string& text) {
    JsonParseResult result;
    try {
        result.value = Json::parse(text);
        result.ok = true;
    } catch (const Json::parse_error& e) {
        result.error = e.what();
    }
    return result;
}

} // namespace

ToolDispatcher::ToolDispatcher() {}

void ToolDispatcher::register_tool(const AgentTool& tool) {
    LOG_DEBUG("[Dispatcher] Registering tool: %s", tool.name.c_str());
    tools_[tool.name] = tool;
}

void ToolDispatcher::register_tools(const std::vector<AgentTool>& tools) {
    for (size_t i = 0; i < tools.size(); ++i) {
        register_tool(tools[i]);
    }
}

void ToolDispatcher::clear() {
    LOG_DEBUG("[Dispatcher] Clearing %zu tools", tools_.size());
    tools_.clear();
}

bool ToolDispatcher::has_tool(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

std::string ToolDispatcher::available_tools() const {
    std::vector<std::string> names;
    for (std::map<std::string, AgentTool>::const_iterator it = tools_.begin(); it != tools_.end(); ++it) {
        names.push_back(it->first);
    }
    return join(names, ", ");
}

std::string ToolDispatcher::build_tools_prompt() const {
    if (tools_.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "## Available Tools\n\n";
    oss << "Call a tool with one JSON object per line:\n\n";
    oss << "```json\n";
    oss << "{\"tool\": \"TOOLNAME\", \"arguments\": {\"param\": \"value\"}}\n";
    oss << "```\n\n";
    oss << "All paths are relative to the scratchpad directory.\n\n";
    oss << "### Tools:\n\n";

    for (std::map<std::string, AgentTool>::const_iterator it = tools_.begin();
         it != tools_.end(); ++it) {
        const AgentTool& tool = it->second;
        oss << "**" << tool.name << "**: " << tool.description << "\n";

        if (!tool.params.empty()) {
            oss << "  Parameters:\n";
            for (size_t i = 0; i < tool.params.size(); ++i) {
                const ToolParamSchema& param = tool.params[i];
                oss << "  - `" << param.name << "` (" << param.type;
                if (param.required) oss << ", required";
                if (!param.default_value.empty()) oss << ", default " << param.default_value;
                oss << "): " << param.description << "\n";
            }
        }
        oss << "\n";
    }

    return oss.str();
}

ParsedToolCall ToolDispatcher::parse_tool_call(const std::string& text) const {
    ParsedToolCall call;
    call.raw_content = trim(text);

    JsonParseResult parsed = try_parse_json(call.raw_content);
    if (!parsed.ok) {
        call.parse_error = "Invalid JSON: " + parsed.error;
        LOG_DEBUG("[Dispatcher] Tool call parse failed: %s", parsed.error.c_str());
        return call;
    }

    if (!parsed.value.is_object() || !parsed.value.contains("tool") || !parsed.value["tool"].is_string()) {
        call.parse_error = "Tool call must be an object with a string \"tool\" key";
        return call;
    }

    call.tool_name = parsed.value["tool"].get<std::string>();
    if (call.tool_name.empty()) {
        call.parse_error = "Tool name is empty";
        return call;
    }

    if (!parsed.value.contains("arguments") || parsed.value["arguments"].is_null()) {
        // No arguments field - fine for tools without params
        call.params = Json::object();
        call.valid = true;
    } else if (parsed.value["arguments"].is_object()) {
        call.params = parsed.value["arguments"];
        call.valid = true;
    } else if (parsed.value["arguments"].is_string()) {
        // Models sometimes emit the arguments object as a JSON string
        std::string args_str = parsed.value["arguments"].get<std::string>();
        JsonParseResult args_parsed = try_parse_json(args_str);
        if (args_parsed.ok && args_parsed.value.is_object()) {
            call.params = args_parsed.value;
            call.valid = true;
        } else {
            call.parse_error = "Arguments field is a string but not a JSON object: " + args_str;
            LOG_WARN("[Dispatcher] Failed to parse stringified arguments for '%s'", call.tool_name.c_str());
        }
    } else {
        call.parse_error = "Arguments must be a JSON object";
    }

    LOG_DEBUG("[Dispatcher] Parsed tool call: %s (valid=%s)",
              call.tool_name.c_str(), call.valid ? "yes" : "no");
    return call;
}

AgentToolResult ToolDispatcher::execute(const ParsedToolCall& call) const {
    if (!call.valid) {
        return AgentToolResult::fail("Invalid tool call - " + call.parse_error);
    }

    std::map<std::string, AgentTool>::const_iterator it = tools_.find(call.tool_name);
    if (it == tools_.end()) {
        return AgentToolResult::fail("Unknown tool: " + call.tool_name +
                                     "\nAvailable tools: " + available_tools());
    }
    if (!it->second.execute) {
        return AgentToolResult::fail("Tool has no executor: " + call.tool_name);
    }

    LOG_INFO("[Dispatcher] Executing tool: %s", call.tool_name.c_str());
    LOG_DEBUG("[Dispatcher] Tool params: %s", call.params.dump().c_str());

    try {
        AgentToolResult result = it->second.execute(call.params);
        LOG_DEBUG("[Dispatcher] Tool %s result: success=%s, output_len=%zu",
                  call.tool_name.c_str(), result.success ? "yes" : "no",
                  result.output.size());
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("[Dispatcher] Tool %s threw exception: %s", call.tool_name.c_str(), e.what());
        return AgentToolResult::fail(std::string("Tool exception: ") + e.what());
    }
}

std::string ToolDispatcher::format_tool_result(const std::string& tool_name, const AgentToolResult& result) {
    std::ostringstream oss;
    oss << "[TOOL_RESULT tool=" << tool_name
        << " success=" << (result.success ? "true" : "false") << "]\n";

    if (result.success) {
        oss << result.output;
    } else {
        oss << "Error: " << result.error;
    }

    oss << "\n[/TOOL_RESULT]";
    return oss.str();
}

} // namespace scratchpad
