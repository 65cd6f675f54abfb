#include "policy/path_guard.hpp"

#include <cstdlib>
#include <deque>
#include <optional>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace warden::policy {

using core::errors::ErrorCategory;
using core::errors::WardenError;

namespace {

std::filesystem::path normalized(const std::filesystem::path& path) {
    std::filesystem::path out = path.lexically_normal();
    if (!out.has_filename() && out.has_relative_path()) {
        out = out.parent_path();
    }
    return out;
}

std::optional<std::filesystem::path> home_directory() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return std::nullopt;
    }
    return std::filesystem::path(home);
}

// Expands "~" and "~/..."; "~user" forms are not supported.
core::errors::Result<std::filesystem::path> expand_home(const std::string& raw) {
    if (raw.empty() || raw[0] != '~') {
        return std::filesystem::path(raw);
    }
    if (raw.size() > 1 && raw[1] != '/') {
        return WardenError{ErrorCategory::Policy,
                           "Unsupported home directory shorthand: " + raw,
                           "path_resolution_failed"};
    }
    const auto home = home_directory();
    if (!home.has_value()) {
        return WardenError{ErrorCategory::Policy,
                           "Cannot expand '~' without a HOME directory: " + raw,
                           "path_resolution_failed"};
    }
    if (raw.size() <= 2) {
        return home.value();
    }
    return home.value() / raw.substr(2);
}

constexpr int kMaxSymlinkHops = 40;

// Resolves an absolute path one component at a time, following every
// symbolic link including links whose target does not exist yet.
// Missing components are appended as they are.
std::filesystem::path resolve_links(const std::filesystem::path& absolute,
                                    std::error_code& ec) {
    const std::filesystem::path relative = absolute.relative_path();
    std::deque<std::filesystem::path> pending(relative.begin(), relative.end());
    std::filesystem::path resolved = absolute.root_path();
    int hops = 0;

    while (!pending.empty()) {
        const std::filesystem::path part = pending.front();
        pending.pop_front();
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            resolved = resolved.parent_path();
            continue;
        }

        std::filesystem::path next = resolved / part;
        std::error_code status_ec;
        const auto status = std::filesystem::symlink_status(next, status_ec);
        if (status.type() == std::filesystem::file_type::not_found) {
            resolved = std::move(next);
            continue;
        }
        if (status_ec) {
            ec = status_ec;
            return {};
        }
        if (!std::filesystem::is_symlink(status)) {
            resolved = std::move(next);
            continue;
        }

        if (++hops > kMaxSymlinkHops) {
            ec = std::make_error_code(std::errc::too_many_symbolic_link_levels);
            return {};
        }
        const std::filesystem::path link = std::filesystem::read_symlink(next, ec);
        if (ec) {
            return {};
        }
        if (link.is_absolute()) {
            resolved = link.root_path();
        }
        const std::filesystem::path link_rest = link.relative_path();
        pending.insert(pending.begin(), link_rest.begin(), link_rest.end());
    }
    return resolved;
}

}  // namespace

PathGuard::PathGuard(PathPolicy path_policy)
    : path_policy_(std::move(path_policy)) {}

PathGuard::PathGuard(PathPolicy path_policy, const std::vector<std::string>& extra_blocked)
    : path_policy_(std::move(path_policy)) {
    for (const auto& entry : extra_blocked) {
        if (!entry.empty()) {
            path_policy_.blocked_paths.push_back(entry);
        }
    }
}

bool PathGuard::is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

bool PathGuard::contains_segments(const std::filesystem::path& haystack,
                                  const std::filesystem::path& needle) {
    const std::vector<std::filesystem::path> hay(haystack.begin(), haystack.end());
    const std::vector<std::filesystem::path> pins(needle.begin(), needle.end());
    if (pins.empty() || pins.size() > hay.size()) {
        return false;
    }
    for (std::size_t start = 0; start + pins.size() <= hay.size(); ++start) {
        bool matched = true;
        for (std::size_t i = 0; i < pins.size(); ++i) {
            if (hay[start + i] != pins[i]) {
                matched = false;
                break;
            }
        }
        if (matched) {
            return true;
        }
    }
    return false;
}

bool PathGuard::has_traversal_token(const std::string& raw) {
    return raw == ".." || raw.find("../") != std::string::npos ||
           raw.find("/..") != std::string::npos;
}

bool PathGuard::is_blocked(const std::filesystem::path& expanded_raw,
                           const std::filesystem::path& resolved) const {
    const std::filesystem::path raw_normal = normalized(expanded_raw);
    if (!home_directory().has_value()) {
        LOG_WARN("HOME is not set; home-relative blocklist entries match by path segments");
    }
    for (const auto& entry : path_policy_.blocked_paths) {
        std::filesystem::path blocked;
        auto expanded_entry = expand_home(entry);
        if (core::errors::is_error(expanded_entry)) {
            // "~/.ssh" degrades to the relative entry ".ssh".
            const auto slash = entry.find('/');
            if (slash == std::string::npos || slash + 1 >= entry.size()) {
                LOG_WARN("Ignoring blocklist entry " + entry + ": " +
                         core::errors::get_error(expanded_entry).message);
                continue;
            }
            blocked = normalized(entry.substr(slash + 1));
        } else {
            blocked = normalized(core::errors::get_value(expanded_entry));
        }

        if (blocked.is_relative()) {
            if (contains_segments(raw_normal, blocked) ||
                contains_segments(resolved, blocked)) {
                return true;
            }
            continue;
        }

        if (is_within_root(blocked, raw_normal) || is_within_root(blocked, resolved)) {
            return true;
        }
        std::error_code ec;
        const auto canonical_blocked = std::filesystem::weakly_canonical(blocked, ec);
        if (!ec && is_within_root(normalized(canonical_blocked), resolved)) {
            return true;
        }
    }
    return false;
}

core::errors::Result<std::filesystem::path> PathGuard::validate_path_in_workspace(
    const std::filesystem::path& workspace_root,
    const std::string& candidate) const {
    if (candidate.empty()) {
        return WardenError{ErrorCategory::Input, "Path cannot be empty.", "empty_path"};
    }

    // Traversal intent is rejected before normalization can hide it.
    if (has_traversal_token(candidate)) {
        return WardenError{ErrorCategory::Policy,
                           "Path traversal blocked: " + candidate,
                           "path_traversal"};
    }

    auto expanded = expand_home(candidate);
    if (core::errors::is_error(expanded)) {
        return core::errors::get_error(expanded);
    }
    const std::filesystem::path expanded_path = core::errors::get_value(expanded);

    std::error_code ec;
    if (!std::filesystem::exists(workspace_root, ec) || ec) {
        return WardenError{ErrorCategory::Input,
                           "Workspace root does not exist: " + workspace_root.string(),
                           "invalid_workspace_root"};
    }
    if (!std::filesystem::is_directory(workspace_root, ec) || ec) {
        return WardenError{ErrorCategory::Input,
                           "Workspace root is not a directory: " + workspace_root.string(),
                           "invalid_workspace_root"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::canonical(workspace_root, ec);
    if (ec) {
        return WardenError{ErrorCategory::Input,
                           "Unable to resolve workspace root: " + workspace_root.string(),
                           "invalid_workspace_root"};
    }

    std::filesystem::path target = expanded_path;
    if (target.is_relative()) {
        target = canonical_root / target;
    }

    const std::filesystem::path canonical_candidate =
        normalized(resolve_links(normalized(target), ec));
    if (ec) {
        return WardenError{ErrorCategory::Policy,
                           "Unable to resolve target path: " + candidate,
                           "path_resolution_failed"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return WardenError{ErrorCategory::Policy,
                           "Path escapes workspace root: " + canonical_candidate.string(),
                           "path_outside_workspace"};
    }

    if (is_blocked(expanded_path, canonical_candidate)) {
        return WardenError{ErrorCategory::Policy,
                           "Path is on the blocklist: " + canonical_candidate.string(),
                           "path_blocked"};
    }

    return canonical_candidate;
}

PathVerdict PathGuard::validate(const std::filesystem::path& workspace_root,
                                const std::string& candidate) const {
    PathVerdict verdict;
    auto result = validate_path_in_workspace(workspace_root, candidate);
    if (core::errors::is_error(result)) {
        const auto& err = core::errors::get_error(result);
        verdict.reason = err.code;
        verdict.message = err.message;
        return verdict;
    }
    verdict.ok = true;
    verdict.resolved = core::errors::get_value(result);
    return verdict;
}

}  // namespace warden::policy
