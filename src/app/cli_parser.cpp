#include "cli_parser.hpp"
#include "core/config/session_id.hpp"
#include <charconv>
#include <system_error>
#include <utility>

namespace warden::app::cli {

    using namespace warden::core::errors;

    namespace {

        struct CommandSpec {
            const char* name;
            CliCommand command;
            std::size_t min_args;
            std::size_t max_args;
            bool accepts_filters;
        };

        constexpr CommandSpec kCommands[] = {
            {"validate-path", CliCommand::ValidatePath, 1, 1, false},
            {"check-command", CliCommand::CheckCommand, 1, 1, false},
            {"redact-secrets", CliCommand::RedactSecrets, 0, 1, false},
            {"redact-pii", CliCommand::RedactPii, 0, 1, false},
            {"run", CliCommand::Run, 1, 1, false},
            {"write-file", CliCommand::WriteFile, 2, 2, false},
            {"write-script", CliCommand::WriteScript, 2, 2, false},
            {"getenv", CliCommand::GetEnv, 1, 1, false},
            {"log", CliCommand::Log, 3, 3, false},
            {"query", CliCommand::Query, 0, 0, true},
            {"export", CliCommand::Export, 1, 1, true},
            {"stats", CliCommand::Stats, 0, 0, false},
            {"init-config", CliCommand::InitConfig, 0, 0, false},
        };

        // Raw strings as typed; validated in a second phase.
        struct RawCliOptions {
            std::optional<std::string> workspace;
            std::optional<std::string> session;
            std::optional<std::string> tool;
            std::optional<std::string> status;
            std::optional<std::string> since;
            std::optional<std::string> last;
            std::optional<std::string> interpreter;
            std::vector<std::string> interpreter_args;
            std::optional<std::string> timeout_ms;
            bool full = false;
            bool verbose = false;
        };

        template <typename T>
        bool parse_unsigned(const std::string& text, T& value) {
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            return ec == std::errc() && ptr == end && !text.empty();
        }

    } // namespace

    std::string usage() {
        return "Usage: warden <command> [options] [arguments]\n"
               "Commands:\n"
               "  validate-path <path>         check a path against the workspace\n"
               "  check-command <code>         detect dangerous operations\n"
               "  redact-secrets [text]        redact secrets (stdin if no text)\n"
               "  redact-pii [text]            redact PII (stdin if no text)\n"
               "  run <code>                   run code through the interpreter\n"
               "  write-file <name> <content>  create a file in the workspace\n"
               "  write-script <name> <code>   create a script in the workspace\n"
               "  getenv <name>                read an allow-listed variable\n"
               "  log <tool> <status> <cmd>    append an audit record\n"
               "  query                        show audit records\n"
               "  export <file.csv>            export sanitized audit records\n"
               "  stats                        audit statistics\n"
               "  init-config                  write .direct/config.yml\n"
               "Options:\n"
               "  --workspace DIR  --session ID  --verbose\n"
               "  --tool T  --status S  --since TS  --last N  --full   (query/export)\n"
               "  --interpreter PROG  --interpreter-arg ARG  --timeout-ms N   (run)\n";
    }

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return WardenError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        const std::string command = argv[1];
        const CommandSpec* entry = nullptr;
        for (const auto& candidate : kCommands) {
            if (command == candidate.name) {
                entry = &candidate;
                break;
            }
        }
        if (entry == nullptr) {
            return WardenError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", usage()};
        }

        RawCliOptions raw;
        std::vector<std::string> positionals;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 1. Parser phase
        bool flags_done = false;
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (flags_done || arg.rfind("--", 0) != 0) {
                positionals.push_back(arg);
                continue;
            }
            if (arg == "--") {
                flags_done = true;
                continue;
            }

            auto take_value = [&](std::optional<std::string>& slot) -> bool {
                if (i + 1 >= args.size()) {
                    return false;
                }
                slot = args[++i];
                return true;
            };

            bool ok = true;
            if (arg == "--workspace") {
                ok = take_value(raw.workspace);
            } else if (arg == "--session") {
                ok = take_value(raw.session);
            } else if (arg == "--tool") {
                ok = take_value(raw.tool);
            } else if (arg == "--status") {
                ok = take_value(raw.status);
            } else if (arg == "--since") {
                ok = take_value(raw.since);
            } else if (arg == "--last") {
                ok = take_value(raw.last);
            } else if (arg == "--interpreter") {
                ok = take_value(raw.interpreter);
            } else if (arg == "--interpreter-arg") {
                std::optional<std::string> value;
                ok = take_value(value);
                if (ok) raw.interpreter_args.push_back(value.value());
            } else if (arg == "--timeout-ms") {
                ok = take_value(raw.timeout_ms);
            } else if (arg == "--full") {
                raw.full = true;
            } else if (arg == "--verbose") {
                raw.verbose = true;
            } else {
                return WardenError{ErrorCategory::Input, "Unknown argument: " + arg, "unknown_argument"};
            }
            if (!ok) {
                return WardenError{ErrorCategory::Input, "Missing value for " + arg, "missing_value"};
            }
        }

        // 2. Validator phase
        if (positionals.size() < entry->min_args || positionals.size() > entry->max_args) {
            return WardenError{ErrorCategory::Input,
                               "Wrong number of arguments for '" + command + "'.",
                               "invalid_argument_count", usage()};
        }

        const bool has_filters = raw.tool || raw.status || raw.since || raw.last || raw.full;
        if (has_filters && !entry->accepts_filters) {
            return WardenError{ErrorCategory::Input,
                               "Filter flags are only valid for query and export.",
                               "unexpected_flag"};
        }
        const bool has_run_flags = raw.interpreter || !raw.interpreter_args.empty() || raw.timeout_ms;
        if (has_run_flags && entry->command != CliCommand::Run) {
            return WardenError{ErrorCategory::Input,
                               "Interpreter flags are only valid for run.",
                               "unexpected_flag"};
        }

        CliRequest req;
        req.command = entry->command;
        req.arguments = std::move(positionals);
        req.verbose = raw.verbose;
        req.full_view = raw.full;

        if (raw.session) {
            if (!core::config::is_valid_session_id(raw.session.value())) {
                return WardenError{ErrorCategory::Input,
                                   "Session id must be 1-64 letters, digits, '.', '_' or '-'.",
                                   "invalid_session_id"};
            }
            req.session_id = raw.session.value();
        }

        if (raw.tool) req.filter.tool = raw.tool.value();
        if (raw.since) req.filter.since = raw.since.value();
        if (raw.status) {
            auto status = session::parse_status(raw.status.value());
            if (!status) {
                return WardenError{ErrorCategory::Input, "Invalid status: " + raw.status.value(), "invalid_status",
                                   "Use success, error or blocked."};
            }
            req.filter.status = status.value();
        }
        if (raw.last) {
            std::size_t last_n = 0;
            if (!parse_unsigned(raw.last.value(), last_n) || last_n == 0) {
                return WardenError{ErrorCategory::Input, "Invalid number for --last", "invalid_integer",
                                   "Provide a positive integer."};
            }
            req.filter.last_n = last_n;
        }

        if (req.command == CliCommand::Log && !session::parse_status(req.arguments[1])) {
            return WardenError{ErrorCategory::Input, "Invalid status: " + req.arguments[1], "invalid_status",
                               "Use success, error or blocked."};
        }

        if (raw.interpreter) {
            if (raw.interpreter->empty()) {
                return WardenError{ErrorCategory::Input, "Interpreter cannot be empty.", "invalid_interpreter"};
            }
            req.interpreter.program = raw.interpreter.value();
            req.interpreter.args = raw.interpreter_args;
        } else if (!raw.interpreter_args.empty()) {
            req.interpreter.args = raw.interpreter_args;
        }
        if (raw.timeout_ms) {
            std::uint32_t timeout = 0;
            if (!parse_unsigned(raw.timeout_ms.value(), timeout) || timeout == 0) {
                return WardenError{ErrorCategory::Input, "Invalid number for --timeout-ms", "invalid_integer",
                                   "Provide a positive integer."};
            }
            req.interpreter.timeout_ms = timeout;
        }

        if (raw.workspace) {
            std::filesystem::path p(raw.workspace.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return WardenError{ErrorCategory::Input, "Workspace does not exist or is not a directory",
                                   "invalid_path"};
            }
            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return WardenError{ErrorCategory::Input, "Failed to canonicalize workspace", "invalid_path"};
            }
            req.workspace = std::move(canonical_path);
        }

        return req;
    }

} // namespace warden::app::cli
