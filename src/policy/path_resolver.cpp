#include "policy/path_resolver.hpp"

#include <system_error>

namespace skillbox::policy {

using core::errors::ErrorCategory;
using core::errors::SandboxError;
namespace codes = core::errors::codes;

namespace {

// Drops a trailing empty component so "a/b/" and "a/b" compare equal.
std::filesystem::path strip_trailing_separator(const std::filesystem::path& path) {
    if (!path.empty() && !path.has_filename() && path.has_parent_path() &&
        path != path.root_path()) {
        return path.parent_path();
    }
    return path;
}

}  // namespace

bool PathResolver::is_within_root(const std::filesystem::path& root,
                                  const std::filesystem::path& child) {
    const auto normalized_root = strip_trailing_separator(root);
    const auto normalized_child = strip_trailing_separator(child);

    auto root_it = normalized_root.begin();
    auto child_it = normalized_child.begin();
    for (; root_it != normalized_root.end() && child_it != normalized_child.end();
         ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == normalized_root.end();
}

core::errors::Result<std::filesystem::path> PathResolver::canonicalize_root(
    const std::filesystem::path& root) {
    std::error_code ec;
    if (root.empty() || !std::filesystem::exists(root, ec) || ec) {
        return SandboxError{ErrorCategory::Input,
                            "Sandbox root does not exist: " + root.string(),
                            codes::kInvalidSandboxRoot};
    }
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return SandboxError{ErrorCategory::Input,
                            "Sandbox root is not a directory: " + root.string(),
                            codes::kInvalidSandboxRoot};
    }

    const std::filesystem::path canonical_root = std::filesystem::canonical(root, ec);
    if (ec) {
        return SandboxError{ErrorCategory::Input,
                            "Unable to resolve sandbox root: " + root.string(),
                            codes::kInvalidSandboxRoot};
    }
    return canonical_root;
}

core::errors::Result<std::filesystem::path> PathResolver::resolve(
    const std::filesystem::path& canonical_root,
    const std::filesystem::path& scripts_subdir,
    const std::filesystem::path& requested_path) {
    std::error_code ec;
    const std::filesystem::path joined = canonical_root / requested_path;

    const std::filesystem::path candidate = std::filesystem::weakly_canonical(joined, ec);
    if (ec) {
        return SandboxError{ErrorCategory::Input,
                            "Unable to resolve path: " + requested_path.string(),
                            codes::kNotFound};
    }

    if (!is_within_root(canonical_root, candidate)) {
        return SandboxError{ErrorCategory::Policy,
                            "Path '" + requested_path.string() +
                                "' escapes the sandbox root. Path traversal is not allowed.",
                            codes::kPathTraversal};
    }

    if (!std::filesystem::exists(candidate, ec) || ec) {
        return SandboxError{ErrorCategory::Input,
                            "Script not found: " + requested_path.string() +
                                ". Expected at: " + candidate.string(),
                            codes::kNotFound};
    }
    if (std::filesystem::is_directory(candidate, ec)) {
        return SandboxError{ErrorCategory::Input,
                            "Script path is a directory, not a file: " +
                                requested_path.string(),
                            codes::kNotFound};
    }

    const std::filesystem::path lexical_scripts =
        (canonical_root / scripts_subdir).lexically_normal();
    const std::filesystem::path canonical_scripts =
        std::filesystem::weakly_canonical(canonical_root / scripts_subdir, ec);
    if (ec) {
        return SandboxError{ErrorCategory::Policy,
                            "Unable to resolve scripts directory: " +
                                scripts_subdir.string(),
                            codes::kOutsideScriptsDir};
    }

    const bool lexically_inside =
        is_within_root(lexical_scripts, joined.lexically_normal());
    const bool canonically_inside = is_within_root(canonical_scripts, candidate);

    // A symlink that leads out of the scripts directory is treated as traversal.
    if (lexically_inside && !canonically_inside) {
        return SandboxError{ErrorCategory::Policy,
                            "Path '" + requested_path.string() +
                                "' leaves the scripts directory through a symlink.",
                            codes::kPathTraversal};
    }
    if (!canonically_inside) {
        return SandboxError{ErrorCategory::Policy,
                            "Script must be in the " + scripts_subdir.string() +
                                "/ directory. Got: " + requested_path.string(),
                            codes::kOutsideScriptsDir};
    }
    if (!is_within_root(canonical_root, canonical_scripts)) {
        return SandboxError{ErrorCategory::Policy,
                            "Scripts directory escapes the sandbox root: " +
                                canonical_scripts.string(),
                            codes::kPathTraversal};
    }

    return candidate;
}

}  // namespace skillbox::policy
