#include "session/audit_log.hpp"

#include <algorithm>
#include <ctime>
#include <exception>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/warden_config.hpp"
#include "core/logging/logger.hpp"

namespace warden::session {

using core::errors::ErrorCategory;
using core::errors::WardenError;
using nlohmann::json;

namespace {

constexpr const char* kAuditFileName = "audit.log";

std::string now_rfc3339_utc() {
    const std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buffer[32];
    const std::size_t written =
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer, written);
}

std::string csv_field(const std::string& value) {
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted.push_back('"');
    for (const char c : value) {
        if (c == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

}  // namespace

AuditLog::AuditLog(std::filesystem::path workspace_root, policy::Sanitizer sanitizer,
                   const bool log_full_commands)
    : workspace_root_(std::move(workspace_root)),
      sanitizer_(std::move(sanitizer)),
      log_full_commands_(log_full_commands) {}

std::filesystem::path AuditLog::log_file() const {
    return workspace_root_ / core::config::kStateDirName / kAuditFileName;
}

core::errors::Result<std::filesystem::path> AuditLog::ensure_log_path() const {
    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return WardenError{ErrorCategory::Logging,
                           "Workspace root is not a directory: " + workspace_root_.string(),
                           "invalid_workspace_root"};
    }

    const auto path = log_file();
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        return WardenError{ErrorCategory::Logging,
                           "Unable to create audit directory: " +
                               path.parent_path().string(),
                           "audit_dir_create_failed"};
    }
    return path;
}

core::errors::Result<std::filesystem::path> AuditLog::append_line(
    const std::string& line) const {
    auto path_result = ensure_log_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app | std::ios::binary);
    if (!out.is_open()) {
        return WardenError{ErrorCategory::Logging,
                           "Unable to open audit log: " + path.string(),
                           "audit_open_failed"};
    }

    const std::string framed = line + "\n";
    out.write(framed.data(), static_cast<std::streamsize>(framed.size()));
    out.flush();
    if (!out.good()) {
        return WardenError{ErrorCategory::Logging,
                           "Unable to write audit log: " + path.string(),
                           "audit_write_failed"};
    }
    return path;
}

core::errors::Result<std::filesystem::path> AuditLog::record(
    const std::string& session_id, const std::string& tool, const std::string& command,
    const AuditStatus status, const AuditExtras& extras) const {
    core::errors::Result<std::filesystem::path> result =
        WardenError{ErrorCategory::Logging, "Audit record not written.", "audit_write_failed"};
    try {
        AuditRecord entry;
        entry.ts = now_rfc3339_utc();
        entry.sid = session_id;
        entry.tool = tool;
        entry.cmd_sanitized = sanitizer_.redact_pii(command);
        entry.cmd = log_full_commands_ ? command : entry.cmd_sanitized;
        entry.status = status;
        entry.extras = extras;

        // Invalid UTF-8 in commands is replaced rather than dropping the record.
        const std::string line =
            record_to_json(entry).dump(-1, ' ', false, json::error_handler_t::replace);
        result = append_line(line);
    } catch (const std::exception& e) {
        result = WardenError{ErrorCategory::Logging,
                             std::string("Unexpected audit failure: ") + e.what(),
                             "audit_write_failed"};
    }

    if (core::errors::is_error(result)) {
        LOG_WARN("Failed to write audit log: " + core::errors::get_error(result).message);
    }
    return result;
}

core::errors::Result<std::vector<AuditRecord>> AuditLog::query(
    const AuditFilter& filter) const {
    std::vector<AuditRecord> records;
    const auto path = log_file();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return records;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return WardenError{ErrorCategory::Internal,
                           "Unable to open audit log: " + path.string(),
                           "audit_open_failed"};
    }

    std::string line;
    std::size_t line_no = 0;
    std::size_t skipped = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        const json payload = json::parse(line, nullptr, false);
        if (payload.is_discarded()) {
            ++skipped;
            continue;
        }
        auto parsed = record_from_json(payload);
        if (!parsed.has_value()) {
            ++skipped;
            continue;
        }
        records.push_back(std::move(parsed.value()));
    }
    if (in.bad()) {
        return WardenError{ErrorCategory::Internal,
                           "I/O error while reading audit log: " + path.string(),
                           "audit_read_failed"};
    }
    if (skipped > 0) {
        LOG_DEBUG("AuditLog: skipped " + std::to_string(skipped) + " malformed line(s) of " +
                  std::to_string(line_no));
    }

    // Appends are chronological; ties keep file order.
    std::stable_sort(records.begin(), records.end(),
                     [](const AuditRecord& a, const AuditRecord& b) { return a.ts < b.ts; });

    if (filter.tool.has_value()) {
        records.erase(std::remove_if(records.begin(), records.end(),
                                     [&](const AuditRecord& r) {
                                         return r.tool != filter.tool.value();
                                     }),
                      records.end());
    }
    if (filter.status.has_value()) {
        records.erase(std::remove_if(records.begin(), records.end(),
                                     [&](const AuditRecord& r) {
                                         return r.status != filter.status.value();
                                     }),
                      records.end());
    }
    if (filter.since.has_value()) {
        records.erase(std::remove_if(records.begin(), records.end(),
                                     [&](const AuditRecord& r) {
                                         return r.ts < filter.since.value();
                                     }),
                      records.end());
    }
    if (filter.last_n.has_value() && records.size() > filter.last_n.value()) {
        records.erase(records.begin(),
                      records.end() - static_cast<std::ptrdiff_t>(filter.last_n.value()));
    }
    return records;
}

core::errors::Result<std::size_t> AuditLog::export_csv(
    const std::filesystem::path& output_file, const AuditFilter& filter) const {
    auto queried = query(filter);
    if (core::errors::is_error(queried)) {
        return core::errors::get_error(queried);
    }
    const auto& records = core::errors::get_value(queried);

    std::ofstream out(output_file, std::ios::trunc);
    if (!out.is_open()) {
        return WardenError{ErrorCategory::Internal,
                           "Unable to open export file: " + output_file.string(),
                           "export_open_failed"};
    }

    out << csv_field("ts") << ',' << csv_field("sid") << ',' << csv_field("tool") << ','
        << csv_field("cmd_sanitized") << ',' << csv_field("status") << "\n";
    for (const auto& record : records) {
        out << csv_field(record.ts) << ',' << csv_field(record.sid) << ','
            << csv_field(record.tool) << ',' << csv_field(record.cmd_sanitized) << ','
            << csv_field(to_string(record.status)) << "\n";
    }
    if (!out.good()) {
        return WardenError{ErrorCategory::Internal,
                           "Unable to write export file: " + output_file.string(),
                           "export_write_failed"};
    }

    if (records.empty()) {
        LOG_INFO("No entries to export");
    } else {
        LOG_INFO("Exported " + std::to_string(records.size()) + " entries to: " +
                 output_file.string());
    }
    return records.size();
}

core::errors::Result<AuditStats> AuditLog::stats() const {
    auto queried = query();
    if (core::errors::is_error(queried)) {
        return core::errors::get_error(queried);
    }
    const auto& records = core::errors::get_value(queried);

    AuditStats stats;
    stats.total_entries = records.size();
    for (const auto& record : records) {
        if (stats.first_ts.empty() || record.ts < stats.first_ts) {
            stats.first_ts = record.ts;
        }
        if (stats.last_ts.empty() || record.ts > stats.last_ts) {
            stats.last_ts = record.ts;
        }
        ++stats.by_tool[record.tool];
        ++stats.by_status[to_string(record.status)];
        ++stats.by_session[record.sid];
    }
    return stats;
}

}  // namespace warden::session
