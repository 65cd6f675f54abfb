#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/warden_errors.hpp"
#include "runtime/process_runner.hpp"
#include "session/audit_record.hpp"

namespace warden::app::cli {

    enum class CliCommand {
        ValidatePath,
        CheckCommand,
        RedactSecrets,
        RedactPii,
        Run,
        WriteFile,
        WriteScript,
        GetEnv,
        Log,
        Query,
        Export,
        Stats,
        InitConfig
    };

    // Validated command line, ready for dispatch.
    struct CliRequest {
        CliCommand command = CliCommand::Stats;
        std::vector<std::string> arguments;
        std::filesystem::path workspace = std::filesystem::current_path();
        std::optional<std::string> session_id;
        session::AuditFilter filter;
        bool full_view = false;
        bool verbose = false;
        runtime::InterpreterCommand interpreter;
    };

    warden::core::errors::Result<CliRequest> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
