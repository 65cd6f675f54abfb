#pragma once
#include <string>

namespace warden::protocol {

    // What a gateway tool hands back to the host. Output meant for the
    // agent has already passed through secret redaction.
    struct ToolResult {
        std::string tool;
        bool success = false;
        std::string output;
        std::string error_message;
        double duration_ms = 0.0;
    };

} // namespace warden::protocol
