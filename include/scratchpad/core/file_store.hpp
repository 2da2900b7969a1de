/*
 * Scratchpad C++ - Sandboxed File Store
 *
 * File and folder operations confined to a single scratch directory.
 * Every operation resolves its path argument(s) through PathResolver first,
 * then acts on the filesystem, then reports an FsResult. Nothing throws
 * past this interface once the store is constructed.
 *
 * There is no in-memory state beyond the root: the filesystem is the source
 * of truth and concurrent callers are not serialized.
 */
#ifndef scratchpad_CORE_FILE_STORE_HPP
#define scratchpad_CORE_FILE_STORE_HPP

#include "fs_result.hpp"
#include "path_resolver.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace scratchpad {

class Config;

// Immutable sandbox settings, fixed at construction time.
struct SandboxConfig {
    std::filesystem::path root;

    static const char* default_root() { return "./scratchpad"; }
    static const char* root_env_var() { return "SCRATCH_PAD_DIR"; }

    // scratch_dir from config, overridden by $SCRATCH_PAD_DIR when set
    static SandboxConfig from_config(const Config& cfg);
};

class SandboxFileStore {
public:
    static const char* folder_marker() { return " (Folder)"; }
    static const char* no_files_message() { return "No files found"; }
    static const char* no_entries_message() { return "No files or folders found"; }
    static const char* time_format() { return "%A, %B %d, %Y at %I:%M %p"; }

    // Throws std::runtime_error if the root cannot be established.
    explicit SandboxFileStore(const SandboxConfig& config);

    const std::filesystem::path& root() const { return resolver_.root(); }
    const PathResolver& resolver() const { return resolver_; }

    // Files
    FsResult create_file(const std::string& path, const std::string& content) const;
    FsResult read_file(const std::string& path) const;
    FsResult update_file(const std::string& path, const std::string& new_content) const;
    FsResult delete_file(const std::string& path) const;

    // Folders
    FsResult create_folder(const std::string& path, bool overwrite = false) const;
    FsResult delete_folder(const std::string& path) const;

    // Files or folders
    FsResult rename_or_move(const std::string& old_path, const std::string& new_path) const;

    // Listings (newline-separated, sorted; sentinel message when empty)
    FsResult list_files() const;
    FsResult list_files_with_extensions() const;
    FsResult list_all() const;

    FsResult get_time() const;

private:
    struct Entry {
        std::string relative;   // '/'-separated, relative to root
        bool is_directory;
    };

    // Iterative walk of the whole sandbox. Returns false on any I/O error.
    bool collect_entries(std::vector<Entry>& out, std::string& error) const;

    FsResult list_file_paths(bool keep_extensions) const;

    PathResolver resolver_;
};

} // namespace scratchpad

#endif // scratchpad_CORE_FILE_STORE_HPP
