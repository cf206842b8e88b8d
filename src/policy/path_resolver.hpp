#pragma once

#include <filesystem>
#include "core/errors/sandbox_errors.hpp"

namespace skillbox::policy {

class PathResolver {
public:
    // Canonicalizes the sandbox root once. The root must be an existing directory.
    static core::errors::Result<std::filesystem::path> canonicalize_root(
        const std::filesystem::path& root);

    // Resolves `requested_path` against an already canonical `root` and checks,
    // in order: containment in root (path_traversal), existence of a
    // non-directory (not_found), containment in root/scripts_subdir
    // (outside_scripts_dir). No side effects.
    static core::errors::Result<std::filesystem::path> resolve(
        const std::filesystem::path& canonical_root,
        const std::filesystem::path& scripts_subdir,
        const std::filesystem::path& requested_path);

    // Component-wise prefix test on already normalized paths.
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
};

}  // namespace skillbox::policy
