#pragma once
#include <iosfwd>
#include <string>
#include "app/cli_parser.hpp"

namespace warden::app {

    // Process exit codes.
    enum ExitCode : int {
        kExitOk = 0,
        kExitRefused = 1,
        kExitInputError = 2,
        kExitWorkspaceError = 3
    };

    // Runs a parsed request. Results go to out (JSON, or plain text for the
    // redact commands); text arguments that are omitted are read from in.
    int dispatch(const cli::CliRequest& request, const std::string& session_id,
                 std::istream& in, std::ostream& out);

}
