/*
 * Scratchpad C++ - Sandboxed File Store Implementation
 */
#include <scratchpad/core/file_store.hpp>
#include <scratchpad/core/config.hpp>
#include <scratchpad/core/logger.hpp>
#include <scratchpad/core/utils.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace scratchpad {

// ============================================================================
// Helpers
// ============================================================================

namespace {

FsResult resolve_failure(const std::string& prefix, const ResolvedPath& resolved) {
    return FsResult::fail(resolved.error, prefix + ": " + resolved.message);
}

// lstat-style probe. A missing path is not an error; st reports not_found.
bool probe(const fs::path& path, fs::file_status& st, std::string& error) {
    std::error_code ec;
    st = fs::symlink_status(path, ec);
    if (ec && st.type() != fs::file_type::not_found) {
        error = ec.message();
        return false;
    }
    return true;
}

bool is_within(const fs::path& path, const fs::path& ancestor) {
    fs::path::const_iterator path_it = path.begin();
    for (fs::path::const_iterator it = ancestor.begin(); it != ancestor.end(); ++it, ++path_it) {
        if (path_it == path.end() || *path_it != *it) {
            return false;
        }
    }
    return true;
}

bool read_text(const fs::path& path, std::string& content, std::string& error) {
    std::ifstream file(path.c_str(), std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        error = std::strerror(errno);
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        error = "read error";
        return false;
    }
    content = buffer.str();
    return true;
}

bool write_text(const fs::path& path, const std::string& content, std::string& error) {
    std::ofstream file(path.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        error = std::strerror(errno);
        return false;
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (file.fail()) {
        error = "write error";
        return false;
    }
    return true;
}

// Python-style suffix removal: "notes.txt" -> "notes", ".env" stays,
// "trailing." stays.
std::string strip_extension(const std::string& relative) {
    fs::path p(relative);
    std::string ext = p.extension().string();
    if (ext.size() <= 1) {
        return relative;
    }
    return p.replace_extension().generic_string();
}

} // namespace

// ============================================================================
// SandboxConfig
// ============================================================================

SandboxConfig SandboxConfig::from_config(const Config& cfg) {
    SandboxConfig sc;
    sc.root = cfg.get_string("scratch_dir", default_root());

    const char* env_root = std::getenv(root_env_var());
    if (env_root && env_root[0] != '\0') {
        sc.root = env_root;
        LOG_DEBUG("[Sandbox] %s overrides scratch_dir -> %s", root_env_var(), env_root);
    }
    return sc;
}

// ============================================================================
// SandboxFileStore
// ============================================================================

SandboxFileStore::SandboxFileStore(const SandboxConfig& config)
    : resolver_(config.root) {}

FsResult SandboxFileStore::create_file(const std::string& path, const std::string& content) const {
    const std::string prefix = "Error creating " + path;
    try {
        ResolvedPath target = resolver_.resolve(path);
        if (!target.ok()) {
            return resolve_failure(prefix, target);
        }

        fs::file_status st;
        std::string error;
        if (!probe(target.path, st, error)) {
            LOG_ERROR("[FileStore] Cannot stat %s: %s", target.path.c_str(), error.c_str());
            return FsResult::fail(FsErrorKind::IOFailure, prefix + ": " + error);
        }
        if (fs::is_directory(st)) {
            return FsResult::fail(FsErrorKind::WrongType,
                                  "Path " + path + " is a directory, cannot create file here.");
        }
        if (fs::exists(st)) {
            return FsResult::fail(FsErrorKind::AlreadyExists, "File " + path + " already exists");
        }

        std::error_code ec;
        fs::create_directories(target.path.parent_path(), ec);
        if (ec) {
            LOG_ERROR("[FileStore] Cannot create parents of %s: %s",
                      target.path.c_str(), ec.message().c_str());
            return FsResult::fail(FsErrorKind::IOFailure, prefix + ": " + ec.message());
        }

        if (!write_text(target.path, content, error)) {
            LOG_ERROR("[FileStore] Create failed for %s: %s", target.path.c_str(), error.c_str());
            return FsResult::fail(FsErrorKind::IOFailure, prefix + ": " + error);
        }

        LOG_INFO("[FileStore] Created %s (%zu bytes)", path.c_str(), content.size());
        return FsResult::ok("Created " + path);
    } catch (const std::exception& e) {
        LOG_ERROR("[FileStore] Create failed: %s", e.what());
        return FsResult::fail(FsErrorKind::IOFailure, prefix + ": " + e.what());
    }
}

FsResult SandboxFileStore::read_file(const std::string& path) const {
    const std::string prefix = "Could not read " + path;
    try {
        ResolvedPath target = resolver_.resolve(path);
        if (!target.ok()) {
            return resolve_failure(prefix, target);
        }

        fs::file_status st;
        std::string error;
        if (!probe(target.path, st, error)) {
            LOG_ERROR("[FileStore] Cannot stat %s: %s", target.path.c_str(), error.c_str());
            return FsResult::fail(FsErrorKind::IOFailure, prefix);
        }
        if (!fs::exists(st)) {
            return FsResult::fail(FsErrorKind::NotFound, "File " + path + " not found.");
        }
        if (!fs::is_regular_file(st)) {
            return FsResult::fail(FsErrorKind::WrongType, "Path " + path + " is not a file.");
        }

        std::string content;
        if (!read_text(target.path, content, error)) {
            LOG_ERROR("[FileStore] Read failed for %s: %s", target.path.c_str(), error.c_str());
            return FsResult::fail(FsErrorKind::IOFailure, prefix);
        }

        LOG_DEBUG("[FileStore] Read %s (%zu bytes)", path.c_str(), content.size());
        return FsResult::ok("Contents of " + path + ":\n" + content);
    } catch (const std::exception& e) {
        LOG_ERROR("[FileStore] Read failed: %s", e.what());
        return FsResult::fail(FsErrorKind::IOFailure, prefix);
    }
}

FsResult SandboxFileStore::update_file(const std::string& path, const std::string& new_content) const {
    const std::string prefix = "Failed to update " + path;
    try {
        ResolvedPath target = resolver_.resolve(path);
        if (!target.ok()) {
            return resolve_failure(prefix, target);
        }

        fs::file_status st;
        std::string error;
        if (!probe(target.path, st, error)) {
            LOG_ERROR("[FileStore] Cannot stat %s: %s", target.path.c_str(), error.c_str());
            return FsResult::fail(FsErrorKind::IOFailure, prefix);
        }
        if (!fs::exists(st)) {
            return FsResult::fail(FsErrorKind::NotFound, "File " + path + " not found");
        }
        if (!fs::is_regular_file(st)) {
            return FsResult::fail(FsErrorKind::WrongType, "Path " + path + " is not a file");
        }

        if (!write_text(target.path, new_content, error)) {
            LOG_ERROR("[FileStore] Update failed for %s: %s", target.path.c_str(), error.c_str());
            return FsResult::fail(FsErrorKind::IOFailure, prefix);
        }

        LOG_INFO("[FileStore] Updated %s (%zu bytes)", path.c_str(), new_content.size());
        return FsResult::ok("Updated " + path);
    } catch (const std::exception& e) {
        LOG_ERROR("[FileStore] Update failed: %s", e.what());
        return FsResult::fail(FsErrorKind::IOFailure, prefix);
    }
}

FsResult SandboxFileStore::delete_file(const std::string& path) const {
    const std::string prefix = "Failed to delete " + path;
    try {
        ResolvedPath target = resolver_.resolve(path);
        if (!target.ok()) {
            return resolve_failure(prefix, target);
        }

        fs::file_status st;
        std::string error;
        if (!probe(target.path, st, error)) {
            LOG_ERROR("[FileStore] Cannot stat %s: %s", target.path.c_str(), error.c_str());
            return FsResult::fail(FsErrorKind::IOFailure, prefix);
        }
        if (!fs::exists(st)) {
            return FsResult::fail(FsErrorKind::NotFound, "File " + path + " not found");
        }
        if (!fs::is_regular_file(st)) {
            return FsResult::fail(FsErrorKind::WrongType, "Path " + path + " is not a file");
        }

        std::error_code ec;
        fs::remove(target.path, ec);
        if (ec) {
            LOG_ERROR("[FileStore] Delete failed for %s: %s", target.path.c_str(), ec.message().c_str());
            return FsResult::fail(FsErrorKind::IOFailure, prefix);
        }

        LOG_INFO("[FileStore] Deleted %s", path.c_str());
        return FsResult::ok("Deleted " + path);
    } catch (const std::exception& e) {
        LOG_ERROR("[FileStore] Delete failed: %s", e.what());
        return FsResult::fail(FsErrorKind::IOFailure, prefix);
    }
}

FsResult SandboxFileStore::create_folder(const std::string& path, bool overwrite) const {
    const std::string prefix = "Failed to create folder " + path;
    try {
        ResolvedPath target = resolver_.resolve(path);
        if (!target.ok()) {
            return resolve_failure(prefix, target);
        }

        fs::file_status st;
        std::string error;
        if (!probe(target.path, st, error)) {
            LOG_ERROR("[FileStore] Cannot stat %s: %s", target.path.c_str(), error.c_str());
            return FsResult::fail(FsErrorKind::IOFailure, prefix);
        }

        std::error_code ec;
        if (fs::exists(st)) {
            if (!fs::is_directory(st)) {
                return FsResult::fail(FsErrorKind::WrongType,
                                      "Path " + path + " is a file, cannot create folder here.");
            }
            if (!overwrite) {
                return FsResult::fail(FsErrorKind::AlreadyExists, "Folder " + path + " already exists");
            }
            fs::remove_all(target.path, ec);
            if (ec) {
                LOG_ERROR("[FileStore] Cannot clear %s: %s", target.path.c_str(), ec.message().c_str());
                return FsResult::fail(FsErrorKind::IOFailure, prefix);
            }
            LOG_INFO("[FileStore] Removed existing folder %s for overwrite", path.c_str());
        }

        fs::create_directories(target.path, ec);
        if (ec) {
            LOG_ERROR("[FileStore] Folder creation failed for %s: %s",
                      target.path.c_str(), ec.message().c_str());
            return FsResult::fail(FsErrorKind::IOFailure, prefix);
        }

        LOG_INFO("[FileStore] Created folder %s", path.c_str());
        return FsResult::ok("Created folder " + path);
    } catch (const std::exception& e) {
        LOG_ERROR("[FileStore] Folder creation failed: %s", e.what());
        return FsResult::fail(FsErrorKind::IOFailure, prefix);
    }
}

FsResult SandboxFileStore::delete_folder(const std::string& path) const {
    const std::string prefix = "Failed to delete folder " + path;
    try {
        ResolvedPath target = resolver_.resolve(path);
        if (!target.ok()) {
            return resolve_failure(prefix, target);
        }

        fs::file_status st;
        std::string error;
        if (!probe(target.path, st, error)) {
            LOG_ERROR("[FileStore] Cannot stat %s: %s", target.path.c_str(), error.c_str());
            return FsResult::fail(FsErrorKind::IOFailure, prefix);
        }
        if (!fs::exists(st)) {
            return FsResult::fail(FsErrorKind::NotFound, "Folder " + path + " not found");
        }
        if (!fs::is_directory(st)) {
            return FsResult::fail(FsErrorKind::WrongType, "Path " + path + " is not a directory");
        }

        std::error_code ec;
        std::uintmax_t removed = fs::remove_all(target.path, ec);
        if (ec) {
            LOG_ERROR("[FileStore] Folder deletion failed for %s: %s",
                      target.path.c_str(), ec.message().c_str());
            return FsResult::fail(FsErrorKind::IOFailure, prefix);
        }

        LOG_INFO("[FileStore] Deleted folder %s (%ju entries)", path.c_str(), removed);
        return FsResult::ok("Deleted folder " + path);
    } catch (const std::exception& e) {
        LOG_ERROR("[FileStore] Folder deletion failed: %s", e.what());
        return FsResult::fail(FsErrorKind::IOFailure, prefix);
    }
}

FsResult SandboxFileStore::rename_or_move(const std::string& old_path, const std::string& new_path) const {
    const std::string prefix = "Failed to rename '" + old_path + "'";
    try {
        ResolvedPath src = resolver_.resolve(old_path);
        if (!src.ok()) {
            return resolve_failure(prefix, src);
        }
        ResolvedPath dest = resolver_.resolve(new_path);
        if (!dest.ok()) {
            return resolve_failure(prefix, dest);
        }

        fs::file_status src_st;
        fs::file_status dest_st;
        std::string error;
        if (!probe(src.path, src_st, error) || !probe(dest.path, dest_st, error)) {
            LOG_ERROR("[FileStore] Rename stat failed: %s", error.c_str());
            return FsResult::fail(FsErrorKind::IOFailure, prefix + ": " + error);
        }
        if (!fs::exists(src_st)) {
            return FsResult::fail(FsErrorKind::NotFound,
                                  "Error: Source path '" + old_path + "' does not exist");
        }
        if (fs::exists(dest_st)) {
            return FsResult::fail(FsErrorKind::AlreadyExists,
                                  "Error: Destination path '" + new_path + "' already exists");
        }
        if (fs::is_directory(src_st) && is_within(dest.path, src.path)) {
            return FsResult::fail(FsErrorKind::IOFailure,
                                  prefix + ": cannot move a folder into itself");
        }

        std::error_code ec;
        fs::create_directories(dest.path.parent_path(), ec);
        if (ec) {
            LOG_ERROR("[FileStore] Cannot create parents of %s: %s",
                      dest.path.c_str(), ec.message().c_str());
            return FsResult::fail(FsErrorKind::IOFailure, prefix + ": " + ec.message());
        }

        fs::rename(src.path, dest.path, ec);
        if (ec == std::errc::cross_device_link) {
            LOG_DEBUG("[FileStore] Cross-device move, copying %s", src.path.c_str());
            ec.clear();
            fs::copy(src.path, dest.path,
                     fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
            if (!ec) {
                fs::remove_all(src.path, ec);
            } else {
                std::error_code cleanup_ec;
                fs::remove_all(dest.path, cleanup_ec);
            }
        }
        if (ec) {
            LOG_ERROR("[FileStore] Rename %s -> %s failed: %s",
                      src.path.c_str(), dest.path.c_str(), ec.message().c_str());
            return FsResult::fail(FsErrorKind::IOFailure, prefix + ": " + ec.message());
        }

        LOG_INFO("[FileStore] Moved %s -> %s", old_path.c_str(), new_path.c_str());
        return FsResult::ok("Successfully renamed/moved '" + old_path + "' to '" + new_path + "'");
    } catch (const std::exception& e) {
        LOG_ERROR("[FileStore] Rename failed: %s", e.what());
        return FsResult::fail(FsErrorKind::IOFailure, prefix + ": " + e.what());
    }
}

// ============================================================================
// Listings
// ============================================================================

bool SandboxFileStore::collect_entries(std::vector<Entry>& out, std::string& error) const {
    const fs::path& root = resolver_.root();

    // Explicit stack instead of recursion; symlinked directories are
    // reported but never descended into.
    std::vector<fs::path> pending;
    pending.push_back(root);

    while (!pending.empty()) {
        fs::path dir = pending.back();
        pending.pop_back();

        std::error_code iter_ec;
        fs::directory_iterator it(dir, iter_ec);
        if (iter_ec) {
            error = dir.string() + ": " + iter_ec.message();
            return false;
        }

        for (fs::directory_iterator end; it != end; it.increment(iter_ec)) {
            const fs::directory_entry& entry = *it;
            std::error_code ec;

            fs::file_status st = entry.symlink_status(ec);
            if (ec) {
                error = entry.path().string() + ": " + ec.message();
                return false;
            }

            bool is_link = fs::is_symlink(st);
            if (is_link) {
                // Only links whose target stays inside the sandbox are shown
                fs::path target = fs::canonical(entry.path(), ec);
                if (ec || !is_within(target, root)) {
                    continue;
                }
                st = fs::status(target, ec);
                if (ec) {
                    continue;
                }
            }

            Entry e;
            e.relative = resolver_.relative_to_root(entry.path());
            if (fs::is_directory(st)) {
                e.is_directory = true;
                out.push_back(e);
                if (!is_link) {
                    pending.push_back(entry.path());
                }
            } else if (fs::is_regular_file(st)) {
                e.is_directory = false;
                out.push_back(e);
            }
        }

        if (iter_ec) {
            error = dir.string() + ": " + iter_ec.message();
            return false;
        }
    }

    return true;
}

FsResult SandboxFileStore::list_file_paths(bool keep_extensions) const {
    try {
        std::vector<Entry> entries;
        std::string error;
        if (!collect_entries(entries, error)) {
            LOG_ERROR("[FileStore] List failed: %s", error.c_str());
            return FsResult::fail(FsErrorKind::IOFailure, "Error listing files");
        }

        std::vector<std::string> files;
        for (size_t i = 0; i < entries.size(); ++i) {
            if (entries[i].is_directory) continue;
            files.push_back(keep_extensions ? entries[i].relative
                                            : strip_extension(entries[i].relative));
        }

        LOG_DEBUG("[FileStore] Listed %zu files", files.size());
        if (files.empty()) {
            return FsResult::ok(no_files_message());
        }

        std::sort(files.begin(), files.end());
        return FsResult::ok(join(files, "\n"));
    } catch (const std::exception& e) {
        LOG_ERROR("[FileStore] List failed: %s", e.what());
        return FsResult::fail(FsErrorKind::IOFailure, "Error listing files");
    }
}

FsResult SandboxFileStore::list_files() const {
    return list_file_paths(false);
}

FsResult SandboxFileStore::list_files_with_extensions() const {
    return list_file_paths(true);
}

FsResult SandboxFileStore::list_all() const {
    try {
        std::vector<Entry> entries;
        std::string error;
        if (!collect_entries(entries, error)) {
            LOG_ERROR("[FileStore] List all failed: %s", error.c_str());
            return FsResult::fail(FsErrorKind::IOFailure, "Error listing files and folders");
        }

        LOG_DEBUG("[FileStore] Listed %zu entries", entries.size());
        if (entries.empty()) {
            return FsResult::ok(no_entries_message());
        }

        std::vector<std::pair<bool, std::string> > items;
        items.reserve(entries.size());
        for (size_t i = 0; i < entries.size(); ++i) {
            if (entries[i].is_directory) {
                items.push_back(std::make_pair(false, entries[i].relative + folder_marker()));
            } else {
                items.push_back(std::make_pair(true, entries[i].relative));
            }
        }
        // Folders (false) sort ahead of files (true)
        std::sort(items.begin(), items.end());

        std::ostringstream oss;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) oss << "\n";
            oss << items[i].second;
        }
        return FsResult::ok(oss.str());
    } catch (const std::exception& e) {
        LOG_ERROR("[FileStore] List all failed: %s", e.what());
        return FsResult::fail(FsErrorKind::IOFailure, "Error listing files and folders");
    }
}

FsResult SandboxFileStore::get_time() const {
    return FsResult::ok(format_local_time(std::time(NULL), time_format()));
}

// ============================================================================
// FsErrorKind
// ============================================================================

const char* fs_error_kind_name(FsErrorKind kind) {
    switch (kind) {
        case FsErrorKind::None: return "None";
        case FsErrorKind::InvalidPath: return "InvalidPath";
        case FsErrorKind::PathTraversal: return "PathTraversal";
        case FsErrorKind::NotFound: return "NotFound";
        case FsErrorKind::WrongType: return "WrongType";
        case FsErrorKind::AlreadyExists: return "AlreadyExists";
        case FsErrorKind::IOFailure: return "IOFailure";
        default: return "Unknown";
    }
}

} // namespace scratchpad
