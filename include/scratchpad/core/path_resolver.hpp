/*
 * Scratchpad C++ - Sandbox path resolution
 *
 * Turns untrusted relative path strings into canonical absolute paths that
 * are guaranteed to lie strictly inside the sandbox root.
 *
 * The check is done on the joined, canonicalized path (symlinks resolved),
 * never on the raw string, so "a/../../x", "/etc/passwd" and symlinks that
 * point out of the sandbox are all rejected the same way.
 */
#ifndef scratchpad_CORE_PATH_RESOLVER_HPP
#define scratchpad_CORE_PATH_RESOLVER_HPP

#include "fs_result.hpp"
#include <filesystem>
#include <string>

namespace scratchpad {

struct ResolvedPath {
    std::filesystem::path path;     // canonical absolute path (valid when ok())
    FsErrorKind error;
    std::string message;            // rejection cause when !ok()

    ResolvedPath() : error(FsErrorKind::None) {}

    bool ok() const { return error == FsErrorKind::None; }
};

class PathResolver {
public:
    // Creates the root (and missing parents) if absent, then canonicalizes it.
    // Throws std::runtime_error if the root cannot be created or is not a
    // directory.
    explicit PathResolver(const std::filesystem::path& root);

    const std::filesystem::path& root() const { return root_; }

    ResolvedPath resolve(const std::string& relative_path) const;

    // Path of an already-resolved location relative to the root, using '/'
    std::string relative_to_root(const std::filesystem::path& resolved) const;

private:
    bool is_strict_descendant(const std::filesystem::path& path) const;
    bool has_dangling_link(const std::filesystem::path& path) const;

    std::filesystem::path root_;
};

} // namespace scratchpad

#endif // scratchpad_CORE_PATH_RESOLVER_HPP
