#include "tools/tool_gateway.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <system_error>
#include "core/logging/logger.hpp"

namespace warden::tools {

using core::errors::ErrorCategory;
using core::errors::WardenError;
using protocol::ToolResult;
using session::AuditExtras;
using session::AuditStatus;

namespace {

constexpr const char* kScriptExtensions[] = {
    ".R",   ".Rmd", ".qmd", ".Rnw",  ".csv", ".tsv",  ".txt", ".json",
    ".xml", ".md",  ".html", ".tex", ".yaml", ".yml", ".toml", ".Rproj"};

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

bool ends_with_ignore_case(const std::string& value, const std::string& suffix) {
    if (suffix.size() > value.size()) {
        return false;
    }
    return lowercase(value.substr(value.size() - suffix.size())) == lowercase(suffix);
}

std::uint64_t count_lines(const std::string& text) {
    if (text.empty()) {
        return 0;
    }
    auto lines = static_cast<std::uint64_t>(std::count(text.begin(), text.end(), '\n'));
    return text.back() == '\n' ? lines : lines + 1;
}

double elapsed_ms(const std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() -
                                                     started)
        .count();
}

}  // namespace

ToolGateway::ToolGateway(const session::Workspace& workspace,
                         const runtime::CodeRunner& runner)
    : workspace_(workspace), runner_(runner) {}

std::string ToolGateway::resolve_script_name(const std::string& filename) {
    for (const char* extension : kScriptExtensions) {
        if (ends_with_ignore_case(filename, extension)) {
            return filename;
        }
    }
    return filename + ".R";
}

core::errors::Result<ToolResult> ToolGateway::run_code(const std::string& session_id,
                                                       const std::string& code) const {
    constexpr const char* kTool = "run_code";
    if (code.empty()) {
        return WardenError{ErrorCategory::Input, "Code cannot be empty.", "empty_command"};
    }

    const auto check = workspace_.is_dangerous_command(code);
    if (check.dangerous) {
        AuditExtras extras;
        extras.reason = check.rule_id;
        static_cast<void>(workspace_.log_audit(session_id, kTool, code, AuditStatus::Blocked, extras));
        LOG_WARN("Blocked dangerous operation: " + check.rule_id);
        return WardenError{ErrorCategory::Policy,
                           "Potentially dangerous command detected: " + check.rule_id +
                               ". Code will NOT be executed.",
                           "blocked_command"};
    }

    auto captured = runner_.run(code, workspace_.root());
    if (core::errors::is_error(captured)) {
        const auto& err = core::errors::get_error(captured);
        AuditExtras extras;
        extras.error = err.message;
        static_cast<void>(workspace_.log_audit(session_id, kTool, code, AuditStatus::Error, extras));
        return err;
    }
    const auto& capture = core::errors::get_value(captured);

    if (workspace_.sanitizer().withholds_output(capture.stdout_text) ||
        workspace_.sanitizer().withholds_output(capture.stderr_text)) {
        LOG_WARN("Environment read detected in output; output withheld.");
    }

    ToolResult result;
    result.tool = kTool;
    result.output = workspace_.redact_secrets(capture.stdout_text);
    result.error_message = workspace_.redact_secrets(capture.stderr_text);
    result.duration_ms = capture.duration_ms;
    result.success = !capture.timed_out && capture.exit_code == 0;

    AuditExtras extras;
    extras.duration_ms = capture.duration_ms;
    if (capture.timed_out) {
        if (!result.error_message.empty()) {
            result.error_message += "\n";
        }
        result.error_message += "Command timed out.";
        extras.error = "timed out";
    } else if (!result.success) {
        extras.error = "exit code " + std::to_string(capture.exit_code);
        if (result.error_message.empty()) {
            result.error_message =
                "Command failed with exit code " + std::to_string(capture.exit_code);
        }
    }

    static_cast<void>(workspace_.log_audit(
        session_id, kTool, code, result.success ? AuditStatus::Success : AuditStatus::Error,
        extras));
    return result;
}

core::errors::Result<ToolResult> ToolGateway::write_file(const std::string& session_id,
                                                         const std::string& filename,
                                                         const std::string& content) const {
    return write_checked(session_id, "write_file", filename, content);
}

core::errors::Result<ToolResult> ToolGateway::write_script(const std::string& session_id,
                                                           const std::string& filename,
                                                           const std::string& code) const {
    constexpr const char* kTool = "write_script";
    const std::string script_name = resolve_script_name(filename);
    const std::string audited = script_name + "\n" + code;

    auto resolved = workspace_.resolve_path(script_name);
    if (core::errors::is_error(resolved)) {
        const auto& err = core::errors::get_error(resolved);
        AuditExtras extras;
        extras.reason = err.code;
        static_cast<void>(workspace_.log_audit(session_id, kTool, audited, AuditStatus::Blocked, extras));
        return err;
    }

    const auto check = workspace_.is_dangerous_command(code);
    if (check.dangerous) {
        AuditExtras extras;
        extras.reason = check.rule_id;
        static_cast<void>(workspace_.log_audit(session_id, kTool, audited, AuditStatus::Blocked, extras));
        LOG_WARN("Blocked dangerous script content: " + check.rule_id);
        return WardenError{ErrorCategory::Policy,
                           "Dangerous code detected: " + check.rule_id +
                               ". Script will NOT be created.",
                           "blocked_command"};
    }

    return write_checked(session_id, kTool, script_name, code);
}

core::errors::Result<ToolResult> ToolGateway::write_checked(
    const std::string& session_id, const std::string& tool, const std::string& filename,
    const std::string& content) const {
    const auto started = std::chrono::steady_clock::now();
    const std::string audited = filename + "\n" + content;

    auto resolved = workspace_.resolve_path(filename);
    if (core::errors::is_error(resolved)) {
        const auto& err = core::errors::get_error(resolved);
        AuditExtras extras;
        extras.reason = err.code;
        static_cast<void>(workspace_.log_audit(session_id, tool, audited, AuditStatus::Blocked, extras));
        LOG_WARN("Write outside workspace blocked [" + err.code + "]: " + filename);
        return err;
    }
    const std::filesystem::path target = core::errors::get_value(resolved);

    ToolResult result;
    result.tool = tool;

    AuditExtras extras;
    std::error_code ec;
    // A link counts as existing even when its target does not.
    const auto existing = std::filesystem::symlink_status(target, ec);
    if (existing.type() != std::filesystem::file_type::not_found) {
        result.error_message = "File already exists: " + target.string() +
                               ". Use a different name or delete the file first.";
        extras.error = "file exists";
        static_cast<void>(workspace_.log_audit(session_id, tool, audited, AuditStatus::Error, extras));
        return result;
    }

    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        result.error_message = "Unable to create directory: " + target.parent_path().string();
        extras.error = ec.message();
        static_cast<void>(workspace_.log_audit(session_id, tool, audited, AuditStatus::Error, extras));
        return result;
    }

    {
        std::ofstream out(target, std::ios::binary);
        if (out.is_open()) {
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
        }
        if (!out.is_open() || !out.good()) {
            result.error_message = "Error writing file: " + target.string();
            extras.error = "write failed";
            static_cast<void>(workspace_.log_audit(session_id, tool, audited, AuditStatus::Error, extras));
            return result;
        }
    }

    result.success = true;
    result.output = "File created: " + target.string();
    result.duration_ms = elapsed_ms(started);

    extras.duration_ms = result.duration_ms;
    extras.bytes = content.size();
    extras.lines = count_lines(content);
    static_cast<void>(workspace_.log_audit(session_id, tool, audited, AuditStatus::Success, extras));
    return result;
}

core::errors::Result<ToolResult> ToolGateway::read_env_var(const std::string& session_id,
                                                           const std::string& name) const {
    constexpr const char* kTool = "read_env_var";
    if (name.empty()) {
        return WardenError{ErrorCategory::Input, "Variable name cannot be empty.",
                           "empty_variable_name"};
    }

    if (!workspace_.is_env_var_allowed(name)) {
        AuditExtras extras;
        extras.reason = "env_var_not_allowed";
        static_cast<void>(workspace_.log_audit(session_id, kTool, name, AuditStatus::Blocked, extras));
        return WardenError{ErrorCategory::Policy,
                           "Environment variable is not on the allow list: " + name,
                           "env_var_not_allowed",
                           "Add it to allowed_env_vars in .direct/config.yml."};
    }

    ToolResult result;
    result.tool = kTool;
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        result.error_message = "Environment variable is not set: " + name;
        AuditExtras extras;
        extras.error = "not set";
        static_cast<void>(workspace_.log_audit(session_id, kTool, name, AuditStatus::Error, extras));
        return result;
    }

    result.success = true;
    result.output = workspace_.redact_secrets(value);
    static_cast<void>(workspace_.log_audit(session_id, kTool, name, AuditStatus::Success));
    return result;
}

}  // namespace warden::tools
