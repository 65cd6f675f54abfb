#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace warden::session {

enum class AuditStatus {
    Success,
    Error,
    Blocked
};

// Optional fields written after the fixed ones.
struct AuditExtras {
    std::optional<double> duration_ms;
    std::optional<std::string> error;
    std::optional<std::string> reason;
    std::optional<std::uint64_t> bytes;
    std::optional<std::uint64_t> lines;
};

struct AuditRecord {
    std::string ts;  // UTC, RFC3339 with a trailing "Z"
    std::string sid;
    std::string tool;
    std::string cmd;
    std::string cmd_sanitized;
    AuditStatus status = AuditStatus::Success;
    AuditExtras extras;
};

struct AuditFilter {
    std::optional<std::string> tool;
    std::optional<AuditStatus> status;
    // Records with ts >= since; compared as RFC3339 strings.
    std::optional<std::string> since;
    std::optional<std::size_t> last_n;
};

struct AuditStats {
    std::size_t total_entries = 0;
    std::string first_ts;
    std::string last_ts;
    std::map<std::string, std::size_t> by_tool;
    std::map<std::string, std::size_t> by_status;
    std::map<std::string, std::size_t> by_session;
};

inline std::string to_string(const AuditStatus status) {
    switch (status) {
        case AuditStatus::Success:
            return "success";
        case AuditStatus::Error:
            return "error";
        case AuditStatus::Blocked:
            return "blocked";
        default:
            return "unknown";
    }
}

inline std::optional<AuditStatus> parse_status(const std::string& value) {
    if (value == "success") {
        return AuditStatus::Success;
    }
    if (value == "error") {
        return AuditStatus::Error;
    }
    if (value == "blocked") {
        return AuditStatus::Blocked;
    }
    return std::nullopt;
}

nlohmann::json record_to_json(const AuditRecord& record);

// nullopt when a required field is missing or has the wrong type.
std::optional<AuditRecord> record_from_json(const nlohmann::json& payload);

nlohmann::json stats_to_json(const AuditStats& stats);

}  // namespace warden::session
