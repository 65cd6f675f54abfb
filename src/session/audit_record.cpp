#include "session/audit_record.hpp"

namespace warden::session {

using nlohmann::json;

json record_to_json(const AuditRecord& record) {
    json payload;
    payload["ts"] = record.ts;
    payload["sid"] = record.sid;
    payload["tool"] = record.tool;
    payload["cmd"] = record.cmd;
    payload["cmd_sanitized"] = record.cmd_sanitized;
    payload["status"] = to_string(record.status);

    const auto& extras = record.extras;
    if (extras.duration_ms.has_value()) {
        payload["duration_ms"] = extras.duration_ms.value();
    }
    if (extras.error.has_value()) {
        payload["error"] = extras.error.value();
    }
    if (extras.reason.has_value()) {
        payload["reason"] = extras.reason.value();
    }
    if (extras.bytes.has_value()) {
        payload["bytes"] = extras.bytes.value();
    }
    if (extras.lines.has_value()) {
        payload["lines"] = extras.lines.value();
    }
    return payload;
}

std::optional<AuditRecord> record_from_json(const json& payload) {
    if (!payload.is_object()) {
        return std::nullopt;
    }
    for (const char* key : {"ts", "sid", "tool", "cmd", "status"}) {
        if (!payload.contains(key) || !payload.at(key).is_string()) {
            return std::nullopt;
        }
    }

    const auto status = parse_status(payload.at("status").get<std::string>());
    if (!status.has_value()) {
        return std::nullopt;
    }

    AuditRecord record;
    record.ts = payload.at("ts").get<std::string>();
    record.sid = payload.at("sid").get<std::string>();
    record.tool = payload.at("tool").get<std::string>();
    record.cmd = payload.at("cmd").get<std::string>();
    record.status = status.value();

    // Lines written without a sanitized copy must never fall back to the
    // full command on the export path, so the field stays empty.
    if (payload.contains("cmd_sanitized") && payload.at("cmd_sanitized").is_string()) {
        record.cmd_sanitized = payload.at("cmd_sanitized").get<std::string>();
    }

    if (payload.contains("duration_ms") && payload.at("duration_ms").is_number()) {
        record.extras.duration_ms = payload.at("duration_ms").get<double>();
    }
    if (payload.contains("error") && payload.at("error").is_string()) {
        record.extras.error = payload.at("error").get<std::string>();
    }
    if (payload.contains("reason") && payload.at("reason").is_string()) {
        record.extras.reason = payload.at("reason").get<std::string>();
    }
    if (payload.contains("bytes") && payload.at("bytes").is_number_unsigned()) {
        record.extras.bytes = payload.at("bytes").get<std::uint64_t>();
    }
    if (payload.contains("lines") && payload.at("lines").is_number_unsigned()) {
        record.extras.lines = payload.at("lines").get<std::uint64_t>();
    }
    return record;
}

json stats_to_json(const AuditStats& stats) {
    json payload;
    payload["total_entries"] = stats.total_entries;
    payload["date_range"] = {{"first", stats.first_ts}, {"last", stats.last_ts}};
    payload["by_tool"] = stats.by_tool;
    payload["by_status"] = stats.by_status;
    payload["by_session"] = stats.by_session;
    return payload;
}

}  // namespace warden::session
