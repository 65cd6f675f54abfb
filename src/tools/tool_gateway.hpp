#pragma once

#include <string>
#include "core/errors/warden_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/process_runner.hpp"
#include "session/workspace.hpp"

namespace warden::tools {

// Privileged tools offered to the agent. Each call validates, acts and
// records one audit entry. Policy refusals come back as errors with
// ErrorCategory::Policy; failures of the action itself come back as a
// ToolResult with success == false. A failed audit append never changes
// the returned value.
class ToolGateway {
public:
    ToolGateway(const session::Workspace& workspace, const runtime::CodeRunner& runner);

    core::errors::Result<protocol::ToolResult> run_code(
        const std::string& session_id, const std::string& code) const;

    // Refuses to overwrite existing files.
    core::errors::Result<protocol::ToolResult> write_file(
        const std::string& session_id, const std::string& filename,
        const std::string& content) const;

    // Appends ".R" unless the name carries a known document or data
    // extension, then checks the code for dangerous calls before writing.
    core::errors::Result<protocol::ToolResult> write_script(
        const std::string& session_id, const std::string& filename,
        const std::string& code) const;

    // Only variables listed in allowed_env_vars are readable.
    core::errors::Result<protocol::ToolResult> read_env_var(
        const std::string& session_id, const std::string& name) const;

    static std::string resolve_script_name(const std::string& filename);

private:
    core::errors::Result<protocol::ToolResult> write_checked(
        const std::string& session_id, const std::string& tool,
        const std::string& filename, const std::string& content) const;

    const session::Workspace& workspace_;
    const runtime::CodeRunner& runner_;
};

}  // namespace warden::tools
