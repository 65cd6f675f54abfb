#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/warden_errors.hpp"

namespace warden::runtime {

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Executes agent-supplied code. The console integration of a host would be
// another implementation.
class CodeRunner {
public:
    virtual ~CodeRunner() = default;

    virtual core::errors::Result<ProcessCapture> run(
        const std::string& code, const std::filesystem::path& working_directory) const = 0;
};

struct InterpreterCommand {
    std::string program = "Rscript";
    // The code is passed as the argument after these.
    std::vector<std::string> args = {"-e"};
    std::uint32_t timeout_ms = 30000;
};

// Runs the interpreter as a child process (no shell), capturing both
// streams and killing it once the timeout elapses.
class ProcessRunner : public CodeRunner {
public:
    explicit ProcessRunner(InterpreterCommand command = {});

    core::errors::Result<ProcessCapture> run(
        const std::string& code,
        const std::filesystem::path& working_directory) const override;

    const InterpreterCommand& command() const { return command_; }

private:
    InterpreterCommand command_;
};

}  // namespace warden::runtime
