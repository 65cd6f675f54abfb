#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/warden_errors.hpp"

namespace warden::policy {

struct PathPolicy {
    // Credential locations and the workspace state directory. Entries
    // starting with "~" are home-relative; relative entries match any run
    // of path segments.
    std::vector<std::string> blocked_paths = {
        "~/.ssh",
        "~/.aws",
        "~/.gnupg",
        "~/.kube",
        "~/.docker",
        "~/.config/gcloud",
        "/etc/shadow",
        "/etc/sudoers",
        ".direct"};
};

struct PathVerdict {
    bool ok = false;
    std::filesystem::path resolved;
    // Error code when ok is false ("path_traversal", "path_blocked", ...).
    std::string reason;
    std::string message;
};

class PathGuard {
public:
    explicit PathGuard(PathPolicy path_policy = {});

    // Extra entries are appended to the defaults.
    PathGuard(PathPolicy path_policy, const std::vector<std::string>& extra_blocked);

    core::errors::Result<std::filesystem::path> validate_path_in_workspace(
        const std::filesystem::path& workspace_root,
        const std::string& candidate) const;

    PathVerdict validate(const std::filesystem::path& workspace_root,
                         const std::string& candidate) const;

    const std::vector<std::string>& blocked_paths() const {
        return path_policy_.blocked_paths;
    }

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    static bool contains_segments(const std::filesystem::path& haystack,
                                  const std::filesystem::path& needle);
    static bool has_traversal_token(const std::string& raw);

    bool is_blocked(const std::filesystem::path& expanded_raw,
                    const std::filesystem::path& resolved) const;

    PathPolicy path_policy_;
};

}  // namespace warden::policy
