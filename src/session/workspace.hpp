#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "core/config/warden_config.hpp"
#include "core/errors/warden_errors.hpp"
#include "policy/path_guard.hpp"
#include "policy/sanitizer.hpp"
#include "session/audit_log.hpp"

namespace warden::session {

// The trust boundary of one workspace: its canonical root, the loaded
// configuration and the guards built from it. The root never changes for
// the lifetime of the object.
class Workspace {
public:
    // Canonicalizes root (must be an existing directory) and loads
    // <root>/.direct/config.yml, falling back to defaults on config errors.
    static core::errors::Result<Workspace> open(const std::filesystem::path& root);

    Workspace(std::filesystem::path canonical_root, core::config::WardenConfig config);

    policy::PathVerdict validate_path(const std::string& candidate) const;
    core::errors::Result<std::filesystem::path> resolve_path(const std::string& candidate) const;

    policy::DangerCheck is_dangerous_command(const std::string& code) const;
    std::string redact_secrets(const std::string& text) const;
    std::string redact_pii(const std::string& text) const;

    core::errors::Result<std::filesystem::path> log_audit(
        const std::string& session_id, const std::string& tool,
        const std::string& command, AuditStatus status,
        const AuditExtras& extras = {}) const;
    core::errors::Result<std::vector<AuditRecord>> query_audit(
        const AuditFilter& filter = {}) const;
    core::errors::Result<std::size_t> export_audit(
        const std::filesystem::path& output_file, const AuditFilter& filter = {}) const;
    core::errors::Result<AuditStats> audit_stats() const;

    bool is_env_var_allowed(const std::string& name) const;

    const std::filesystem::path& root() const { return root_; }
    const core::config::WardenConfig& config() const { return config_; }
    const policy::Sanitizer& sanitizer() const { return sanitizer_; }

private:
    std::filesystem::path root_;
    core::config::WardenConfig config_;
    policy::PathGuard path_guard_;
    policy::Sanitizer sanitizer_;
    AuditLog audit_log_;
};

}  // namespace warden::session
