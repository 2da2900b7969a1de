/*
 * Scratchpad C++ - File Tools
 *
 * Exposes the sandboxed file store to an agent runtime:
 * - create_file / read_file / update_file / delete_file
 * - create_folder / delete_folder
 * - rename_file
 * - list_files / list_files_with_extensions / list_all
 * - get_time
 */
#ifndef scratchpad_CORE_FILE_TOOLS_HPP
#define scratchpad_CORE_FILE_TOOLS_HPP

#include "tool.hpp"
#include "file_store.hpp"
#include <string>
#include <vector>

namespace scratchpad {

class FileToolsProvider : public ToolProvider {
public:
    // The store must outlive the provider and every AgentTool it hands out.
    explicit FileToolsProvider(const SandboxFileStore& store);

    const char* tool_id() const override { return "scratchpad"; }
    std::vector<std::string> actions() const override;
    AgentToolResult execute(const std::string& action, const Json& params) const override;
    std::vector<AgentTool> get_agent_tools() const override;

private:
    const SandboxFileStore& store_;

    AgentToolResult do_create_file(const Json& params) const;
    AgentToolResult do_read_file(const Json& params) const;
    AgentToolResult do_update_file(const Json& params) const;
    AgentToolResult do_delete_file(const Json& params) const;
    AgentToolResult do_create_folder(const Json& params) const;
    AgentToolResult do_delete_folder(const Json& params) const;
    AgentToolResult do_rename_file(const Json& params) const;
    AgentToolResult do_list_files(const Json& params) const;
    AgentToolResult do_list_files_with_extensions(const Json& params) const;
    AgentToolResult do_list_all(const Json& params) const;
    AgentToolResult do_get_time(const Json& params) const;
};

} // namespace scratchpad

#endif // scratchpad_CORE_FILE_TOOLS_HPP
