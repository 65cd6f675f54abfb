#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/warden_errors.hpp"
#include "policy/sanitizer.hpp"
#include "session/audit_record.hpp"

namespace warden::session {

// Append-only JSONL audit trail at <workspace>/.direct/audit.log. The file is
// opened and closed for every record; nothing is ever rewritten or deleted.
class AuditLog {
public:
    explicit AuditLog(std::filesystem::path workspace_root,
                      policy::Sanitizer sanitizer = policy::Sanitizer{},
                      bool log_full_commands = true);

    // Best effort: failures are logged as warnings and returned with
    // ErrorCategory::Logging, never thrown.
    core::errors::Result<std::filesystem::path> record(
        const std::string& session_id, const std::string& tool,
        const std::string& command, AuditStatus status,
        const AuditExtras& extras = {}) const;

    // Malformed lines are skipped. Filters apply tool, status, since, then last_n.
    core::errors::Result<std::vector<AuditRecord>> query(
        const AuditFilter& filter = {}) const;

    // Columns ts,sid,tool,cmd_sanitized,status. The full command is never
    // exported. Returns the number of rows written.
    core::errors::Result<std::size_t> export_csv(
        const std::filesystem::path& output_file,
        const AuditFilter& filter = {}) const;

    core::errors::Result<AuditStats> stats() const;

    std::filesystem::path log_file() const;

private:
    core::errors::Result<std::filesystem::path> ensure_log_path() const;
    core::errors::Result<std::filesystem::path> append_line(const std::string& line) const;

    std::filesystem::path workspace_root_;
    policy::Sanitizer sanitizer_;
    bool log_full_commands_;
};

}  // namespace warden::session
