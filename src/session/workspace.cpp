#include "session/workspace.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace warden::session {

using core::errors::ErrorCategory;
using core::errors::WardenError;

core::errors::Result<Workspace> Workspace::open(const std::filesystem::path& root) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return WardenError{ErrorCategory::Input,
                           "Workspace root does not exist or is not a directory: " +
                               root.string(),
                           "invalid_workspace_root"};
    }
    std::filesystem::path canonical_root = std::filesystem::canonical(root, ec);
    if (ec) {
        return WardenError{ErrorCategory::Input,
                           "Unable to resolve workspace root: " + root.string(),
                           "invalid_workspace_root"};
    }

    auto config = core::config::load_config_or_defaults(
        core::config::config_path_for(canonical_root));
    return Workspace(std::move(canonical_root), std::move(config));
}

Workspace::Workspace(std::filesystem::path canonical_root, core::config::WardenConfig config)
    : root_(std::move(canonical_root)),
      config_(std::move(config)),
      path_guard_(policy::PathPolicy{}, config_.blocked_paths),
      sanitizer_(policy::PatternPolicy::from_config(config_)),
      audit_log_(root_, sanitizer_, config_.log_full_commands) {}

policy::PathVerdict Workspace::validate_path(const std::string& candidate) const {
    return path_guard_.validate(root_, candidate);
}

core::errors::Result<std::filesystem::path> Workspace::resolve_path(
    const std::string& candidate) const {
    return path_guard_.validate_path_in_workspace(root_, candidate);
}

policy::DangerCheck Workspace::is_dangerous_command(const std::string& code) const {
    return sanitizer_.is_dangerous(code);
}

std::string Workspace::redact_secrets(const std::string& text) const {
    return sanitizer_.redact_secrets(text);
}

std::string Workspace::redact_pii(const std::string& text) const {
    return sanitizer_.redact_pii(text);
}

core::errors::Result<std::filesystem::path> Workspace::log_audit(
    const std::string& session_id, const std::string& tool, const std::string& command,
    const AuditStatus status, const AuditExtras& extras) const {
    return audit_log_.record(session_id, tool, command, status, extras);
}

core::errors::Result<std::vector<AuditRecord>> Workspace::query_audit(
    const AuditFilter& filter) const {
    return audit_log_.query(filter);
}

core::errors::Result<std::size_t> Workspace::export_audit(
    const std::filesystem::path& output_file, const AuditFilter& filter) const {
    return audit_log_.export_csv(output_file, filter);
}

core::errors::Result<AuditStats> Workspace::audit_stats() const {
    return audit_log_.stats();
}

bool Workspace::is_env_var_allowed(const std::string& name) const {
    return std::find(config_.allowed_env_vars.begin(), config_.allowed_env_vars.end(),
                     name) != config_.allowed_env_vars.end();
}

}  // namespace warden::session
