/*
 * Scratchpad C++ - Sandbox path resolution
 */
#include <scratchpad/core/path_resolver.hpp>
#include <scratchpad/core/logger.hpp>
#include <scratchpad/core/utils.hpp>

#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace scratchpad {

PathResolver::PathResolver(const fs::path& root) {
    std::error_code ec;
    fs::path absolute_root = fs::absolute(root, ec);
    if (ec) {
        throw std::runtime_error("Cannot make sandbox root absolute: " + root.string() +
                                 " (" + ec.message() + ")");
    }

    fs::create_directories(absolute_root, ec);
    if (ec) {
        throw std::runtime_error("Cannot create sandbox root: " + absolute_root.string() +
                                 " (" + ec.message() + ")");
    }
    if (!fs::is_directory(absolute_root, ec)) {
        throw std::runtime_error("Sandbox root is not a directory: " + absolute_root.string());
    }

    root_ = fs::canonical(absolute_root, ec);
    if (ec) {
        throw std::runtime_error("Cannot canonicalize sandbox root: " + absolute_root.string() +
                                 " (" + ec.message() + ")");
    }

    LOG_INFO("[Sandbox] Scratchpad directory initialized at: %s", root_.c_str());
}

ResolvedPath PathResolver::resolve(const std::string& relative_path) const {
    ResolvedPath out;

    std::string cleaned = trim(relative_path);
    if (cleaned.empty()) {
        out.error = FsErrorKind::InvalidPath;
        out.message = "Empty path is invalid";
        LOG_DEBUG("[Sandbox] Rejected empty path");
        return out;
    }

    // An absolute argument replaces root_ here; the ancestry check below
    // rejects it unless it already points inside the sandbox.
    fs::path joined = root_ / fs::path(cleaned);

    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(joined, ec);
    if (ec) {
        out.error = FsErrorKind::InvalidPath;
        out.message = "Cannot resolve path (" + ec.message() + ")";
        LOG_WARN("[Sandbox] Cannot resolve '%s': %s", cleaned.c_str(), ec.message().c_str());
        return out;
    }
    canonical = canonical.lexically_normal();
    if (!canonical.has_filename()) {
        canonical = canonical.parent_path();
    }

    if (canonical == root_) {
        out.error = FsErrorKind::InvalidPath;
        out.message = "Path refers to the sandbox root";
        LOG_DEBUG("[Sandbox] Rejected root path '%s'", cleaned.c_str());
        return out;
    }

    if (!is_strict_descendant(canonical)) {
        out.error = FsErrorKind::PathTraversal;
        out.message = "Path traversal attempt detected";
        LOG_WARN("[Sandbox] Path traversal attempt: '%s' -> %s",
                 cleaned.c_str(), canonical.c_str());
        return out;
    }

    if (has_dangling_link(canonical)) {
        out.error = FsErrorKind::PathTraversal;
        out.message = "Path contains an unresolvable symlink";
        LOG_WARN("[Sandbox] Dangling symlink in '%s'", cleaned.c_str());
        return out;
    }

    out.path = canonical;
    return out;
}

std::string PathResolver::relative_to_root(const fs::path& resolved) const {
    return resolved.lexically_relative(root_).generic_string();
}

bool PathResolver::is_strict_descendant(const fs::path& path) const {
    fs::path::const_iterator path_it = path.begin();
    for (fs::path::const_iterator root_it = root_.begin(); root_it != root_.end(); ++root_it, ++path_it) {
        if (path_it == path.end() || *path_it != *root_it) {
            return false;
        }
    }
    return path_it != path.end();
}

// weakly_canonical resolves every link in the existing prefix, so a link
// that survives is the first missing component and points nowhere.
bool PathResolver::has_dangling_link(const fs::path& path) const {
    fs::path tail = path.lexically_relative(root_);
    fs::path current = root_;
    for (fs::path::const_iterator it = tail.begin(); it != tail.end(); ++it) {
        current /= *it;
        std::error_code ec;
        fs::file_status st = fs::symlink_status(current, ec);
        if (ec || !fs::exists(st)) {
            return false;
        }
        if (fs::is_symlink(st)) {
            return true;
        }
    }
    return false;
}

} // namespace scratchpad
