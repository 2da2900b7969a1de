/*
 * Scratchpad C++ - File Tools Implementation
 *
 * FileToolsProvider class: sandboxed file and folder tools for the agent.
 */
#include <scratchpad/core/file_tools.hpp>
#include <scratchpad/core/logger.hpp>
#include <scratchpad/core/utils.hpp>

namespace scratchpad {

// ============================================================================
// Parameter Utilities
// ============================================================================

namespace file_tools {
namespace args {

bool get_string(const Json& params, const char* name, std::string& out) {
    if (!params.is_object() || !params.contains(name) || !params[name].is_string()) {
        return false;
    }
    out = params[name].get<std::string>();
    return true;
}

bool get_bool(const Json& params, const char* name, bool default_value) {
    if (!params.is_object() || !params.contains(name)) {
        return default_value;
    }
    const Json& value = params[name];
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_string()) return parse_bool_string(value.get<std::string>());
    if (value.is_number_integer()) return value.get<long long>() != 0;
    return default_value;
}

AgentToolResult missing(const char* name) {
    return AgentToolResult::fail(std::string("Missing required parameter: ") + name);
}

AgentToolResult from_fs_result(const FsResult& r) {
    if (r.success) {
        return AgentToolResult::ok(r.message);
    }
    LOG_DEBUG("[FileTools] Store failure (%s): %s", fs_error_kind_name(r.kind), r.message.c_str());
    return AgentToolResult::fail(r.message);
}

} // namespace args
} // namespace file_tools

using file_tools::args::get_string;
using file_tools::args::get_bool;
using file_tools::args::missing;
using file_tools::args::from_fs_result;

// ============================================================================
// FileToolsProvider Implementation
// ============================================================================

FileToolsProvider::FileToolsProvider(const SandboxFileStore& store)
    : store_(store) {
    LOG_INFO("File tools initialized (scratchpad=%s)", store_.root().c_str());
}

std::vector<std::string> FileToolsProvider::actions() const {
    std::vector<std::string> acts;
    acts.push_back("create_file");
    acts.push_back("read_file");
    acts.push_back("update_file");
    acts.push_back("delete_file");
    acts.push_back("create_folder");
    acts.push_back("delete_folder");
    acts.push_back("rename_file");
    acts.push_back("list_files");
    acts.push_back("list_files_with_extensions");
    acts.push_back("list_all");
    acts.push_back("get_time");
    return acts;
}

AgentToolResult FileToolsProvider::execute(const std::string& action, const Json& params) const {
    if (action == "create_file") {
        return do_create_file(params);
    } else if (action == "read_file") {
        return do_read_file(params);
    } else if (action == "update_file") {
        return do_update_file(params);
    } else if (action == "delete_file") {
        return do_delete_file(params);
    } else if (action == "create_folder") {
        return do_create_folder(params);
    } else if (action == "delete_folder") {
        return do_delete_folder(params);
    } else if (action == "rename_file") {
        return do_rename_file(params);
    } else if (action == "list_files") {
        return do_list_files(params);
    } else if (action == "list_files_with_extensions") {
        return do_list_files_with_extensions(params);
    } else if (action == "list_all") {
        return do_list_all(params);
    } else if (action == "get_time") {
        return do_get_time(params);
    }
    return AgentToolResult::fail("Unknown action: " + action);
}

std::vector<AgentTool> FileToolsProvider::get_agent_tools() const {
    std::vector<AgentTool> tools;
    const FileToolsProvider* self = this;

    struct Spec {
        const char* name;
        const char* description;
        std::vector<ToolParamSchema> params;
    };

    std::vector<Spec> specs;
    {
        Spec s;
        s.name = "create_file";
        s.description = "Create a new text file with specified content";
        s.params.push_back(ToolParamSchema("file_path", "string", "Relative path including subdirectories", true));
        s.params.push_back(ToolParamSchema("content", "string", "Text content to write to the file", true));
        specs.push_back(s);
    }
    {
        Spec s;
        s.name = "read_file";
        s.description = "Read contents of a specific file including subdirectories";
        s.params.push_back(ToolParamSchema("file_path", "string", "Relative path of the file to read", true));
        specs.push_back(s);
    }
    {
        Spec s;
        s.name = "update_file";
        s.description = "Update content of an existing file";
        s.params.push_back(ToolParamSchema("file_path", "string", "Relative path of file to update", true));
        s.params.push_back(ToolParamSchema("new_content", "string", "New content to write", true));
        specs.push_back(s);
    }
    {
        Spec s;
        s.name = "delete_file";
        s.description = "Delete a specific file";
        s.params.push_back(ToolParamSchema("file_path", "string", "Relative path of file to delete", true));
        specs.push_back(s);
    }
    {
        Spec s;
        s.name = "create_folder";
        s.description = "Create a new folder, including missing parent folders";
        s.params.push_back(ToolParamSchema("folder_path", "string", "Relative folder path including subdirectories", true));
        ToolParamSchema overwrite("overwrite", "boolean", "Overwrite existing folder, deleting its contents", false);
        overwrite.default_value = "false";
        s.params.push_back(overwrite);
        specs.push_back(s);
    }
    {
        Spec s;
        s.name = "delete_folder";
        s.description = "Delete a folder and its contents";
        s.params.push_back(ToolParamSchema("folder_path", "string", "Relative path of folder to delete", true));
        specs.push_back(s);
    }
    {
        Spec s;
        s.name = "rename_file";
        s.description = "Rename or move a file/folder";
        s.params.push_back(ToolParamSchema("old_path", "string", "Current relative path", true));
        s.params.push_back(ToolParamSchema("new_path", "string", "New relative path", true));
        specs.push_back(s);
    }
    {
        Spec s;
        s.name = "list_files";
        s.description = "List all files (without extensions)";
        specs.push_back(s);
    }
    {
        Spec s;
        s.name = "list_files_with_extensions";
        s.description = "List all files with full paths and extensions";
        specs.push_back(s);
    }
    {
        Spec s;
        s.name = "list_all";
        s.description = "List all files and folders with type indicators";
        specs.push_back(s);
    }
    {
        Spec s;
        s.name = "get_time";
        s.description = "Get current date and time";
        specs.push_back(s);
    }

    for (size_t i = 0; i < specs.size(); ++i) {
        AgentTool tool;
        tool.name = specs[i].name;
        tool.description = specs[i].description;
        tool.params = specs[i].params;

        const std::string action = tool.name;
        tool.execute = [self, action](const Json& params) -> AgentToolResult {
            return self->execute(action, params);
        };

        tools.push_back(tool);
    }

    return tools;
}

// ============================================================================
// FileToolsProvider - Internal Implementations
// ============================================================================

AgentToolResult FileToolsProvider::do_create_file(const Json& params) const {
    std::string file_path;
    std::string content;
    if (!get_string(params, "file_path", file_path)) return missing("file_path");
    if (!get_string(params, "content", content)) return missing("content");

    return from_fs_result(store_.create_file(file_path, content));
}

AgentToolResult FileToolsProvider::do_read_file(const Json& params) const {
    std::string file_path;
    if (!get_string(params, "file_path", file_path)) return missing("file_path");

    return from_fs_result(store_.read_file(file_path));
}

AgentToolResult FileToolsProvider::do_update_file(const Json& params) const {
    std::string file_path;
    std::string new_content;
    if (!get_string(params, "file_path", file_path)) return missing("file_path");
    if (!get_string(params, "new_content", new_content)) return missing("new_content");

    return from_fs_result(store_.update_file(file_path, new_content));
}

AgentToolResult FileToolsProvider::do_delete_file(const Json& params) const {
    std::string file_path;
    if (!get_string(params, "file_path", file_path)) return missing("file_path");

    return from_fs_result(store_.delete_file(file_path));
}

AgentToolResult FileToolsProvider::do_create_folder(const Json& params) const {
    std::string folder_path;
    if (!get_string(params, "folder_path", folder_path)) return missing("folder_path");
    bool overwrite = get_bool(params, "overwrite", false);

    return from_fs_result(store_.create_folder(folder_path, overwrite));
}

AgentToolResult FileToolsProvider::do_delete_folder(const Json& params) const {
    std::string folder_path;
    if (!get_string(params, "folder_path", folder_path)) return missing("folder_path");

    return from_fs_result(store_.delete_folder(folder_path));
}

AgentToolResult FileToolsProvider::do_rename_file(const Json& params) const {
    std::string old_path;
    std::string new_path;
    if (!get_string(params, "old_path", old_path)) return missing("old_path");
    if (!get_string(params, "new_path", new_path)) return missing("new_path");

    return from_fs_result(store_.rename_or_move(old_path, new_path));
}

AgentToolResult FileToolsProvider::do_list_files(const Json& /*params*/) const {
    return from_fs_result(store_.list_files());
}

AgentToolResult FileToolsProvider::do_list_files_with_extensions(const Json& /*params*/) const {
    return from_fs_result(store_.list_files_with_extensions());
}

AgentToolResult FileToolsProvider::do_list_all(const Json& /*params*/) const {
    return from_fs_result(store_.list_all());
}

AgentToolResult FileToolsProvider::do_get_time(const Json& /*params*/) const {
    return from_fs_result(store_.get_time());
}

} // namespace scratchpad
