#include "app/dispatcher.hpp"

#include <istream>
#include <iterator>
#include <ostream>
#include <nlohmann/json.hpp>
#include "core/config/warden_config.hpp"
#include "core/logging/logger.hpp"
#include "session/workspace.hpp"
#include "tools/tool_gateway.hpp"

namespace warden::app {

using cli::CliCommand;
using nlohmann::json;

namespace {

std::string dump(const json& payload) {
    return payload.dump(2, ' ', false, json::error_handler_t::replace);
}

std::string read_all(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

json error_to_json(const core::errors::WardenError& err) {
    json payload;
    payload["category"] = core::errors::to_string(err.category);
    payload["code"] = err.code;
    payload["message"] = err.message;
    if (!err.hint.empty()) {
        payload["hint"] = err.hint;
    }
    return payload;
}

json tool_result_to_json(const protocol::ToolResult& result) {
    json payload;
    payload["tool"] = result.tool;
    payload["success"] = result.success;
    payload["output"] = result.output;
    payload["error_message"] = result.error_message;
    payload["duration_ms"] = result.duration_ms;
    return payload;
}

int emit_tool_result(const core::errors::Result<protocol::ToolResult>& result, std::ostream& out) {
    if (core::errors::is_error(result)) {
        const auto& err = core::errors::get_error(result);
        json payload;
        payload["success"] = false;
        payload["error"] = error_to_json(err);
        out << dump(payload) << "\n";
        return err.category == core::errors::ErrorCategory::Input ? kExitInputError : kExitRefused;
    }
    const auto& value = core::errors::get_value(result);
    out << dump(tool_result_to_json(value)) << "\n";
    return value.success ? kExitOk : kExitRefused;
}

int emit_error(const core::errors::WardenError& err, std::ostream& out) {
    LOG_ERROR("[" + err.code + "]: " + err.message);
    json payload;
    payload["error"] = error_to_json(err);
    out << dump(payload) << "\n";
    return kExitRefused;
}

int run_query(const session::Workspace& workspace, const cli::CliRequest& request,
              std::ostream& out) {
    auto records = workspace.query_audit(request.filter);
    if (core::errors::is_error(records)) {
        return emit_error(core::errors::get_error(records), out);
    }

    const bool full = request.full_view ||
                      workspace.config().default_view == core::config::AuditView::Full;
    if (full) {
        LOG_WARN("Showing FULL commands (may contain PII/secrets)");
    }

    json rows = json::array();
    for (const auto& record : core::errors::get_value(records)) {
        json row = session::record_to_json(record);
        row["cmd_display"] = full ? record.cmd : record.cmd_sanitized;
        if (!full) {
            row.erase("cmd");
        }
        rows.push_back(std::move(row));
    }
    out << dump(rows) << "\n";
    return kExitOk;
}

}  // namespace

int dispatch(const cli::CliRequest& request, const std::string& session_id, std::istream& in,
             std::ostream& out) {
    if (request.command == CliCommand::InitConfig) {
        auto created = core::config::init_config(request.workspace);
        if (core::errors::is_error(created)) {
            emit_error(core::errors::get_error(created), out);
            return kExitWorkspaceError;
        }
        out << dump(json{{"config", core::errors::get_value(created).string()}}) << "\n";
        return kExitOk;
    }

    auto opened = session::Workspace::open(request.workspace);
    if (core::errors::is_error(opened)) {
        emit_error(core::errors::get_error(opened), out);
        return kExitWorkspaceError;
    }
    const session::Workspace& workspace = core::errors::get_value(opened);
    LOG_DEBUG("Workspace: " + workspace.root().string());

    const auto& args = request.arguments;
    switch (request.command) {
        case CliCommand::ValidatePath: {
            const auto verdict = workspace.validate_path(args[0]);
            json payload;
            payload["ok"] = verdict.ok;
            payload["resolved"] = verdict.resolved.string();
            payload["reason"] = verdict.reason;
            payload["message"] = verdict.message;
            out << dump(payload) << "\n";
            return verdict.ok ? kExitOk : kExitRefused;
        }
        case CliCommand::CheckCommand: {
            const auto check = workspace.is_dangerous_command(args[0]);
            out << dump(json{{"dangerous", check.dangerous}, {"rule_id", check.rule_id}}) << "\n";
            return check.dangerous ? kExitRefused : kExitOk;
        }
        case CliCommand::RedactSecrets: {
            const std::string text = args.empty() ? read_all(in) : args[0];
            out << workspace.redact_secrets(text);
            return kExitOk;
        }
        case CliCommand::RedactPii: {
            const std::string text = args.empty() ? read_all(in) : args[0];
            out << workspace.redact_pii(text);
            return kExitOk;
        }
        case CliCommand::Run: {
            const runtime::ProcessRunner runner(request.interpreter);
            const tools::ToolGateway gateway(workspace, runner);
            return emit_tool_result(gateway.run_code(session_id, args[0]), out);
        }
        case CliCommand::WriteFile:
        case CliCommand::WriteScript:
        case CliCommand::GetEnv: {
            const runtime::ProcessRunner runner;
            const tools::ToolGateway gateway(workspace, runner);
            if (request.command == CliCommand::WriteFile) {
                return emit_tool_result(gateway.write_file(session_id, args[0], args[1]), out);
            }
            if (request.command == CliCommand::WriteScript) {
                return emit_tool_result(gateway.write_script(session_id, args[0], args[1]), out);
            }
            return emit_tool_result(gateway.read_env_var(session_id, args[0]), out);
        }
        case CliCommand::Log: {
            const auto status = session::parse_status(args[1]);
            if (!status) {
                return kExitInputError;
            }
            auto logged = workspace.log_audit(session_id, args[0], args[2], status.value());
            if (core::errors::is_error(logged)) {
                return emit_error(core::errors::get_error(logged), out);
            }
            out << dump(json{{"logged", core::errors::get_value(logged).string()}}) << "\n";
            return kExitOk;
        }
        case CliCommand::Query:
            return run_query(workspace, request, out);
        case CliCommand::Export: {
            auto exported = workspace.export_audit(args[0], request.filter);
            if (core::errors::is_error(exported)) {
                return emit_error(core::errors::get_error(exported), out);
            }
            out << dump(json{{"exported", core::errors::get_value(exported)}, {"file", args[0]}})
                << "\n";
            return kExitOk;
        }
        case CliCommand::Stats: {
            auto stats = workspace.audit_stats();
            if (core::errors::is_error(stats)) {
                return emit_error(core::errors::get_error(stats), out);
            }
            out << dump(session::stats_to_json(core::errors::get_value(stats))) << "\n";
            return kExitOk;
        }
        case CliCommand::InitConfig:
            break;
    }
    return kExitInputError;
}

}  // namespace warden::app
