#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/warden_errors.hpp"

namespace warden::core::config {

// Per-workspace state directory holding audit.log and config.yml.
inline constexpr const char* kStateDirName = ".direct";
inline constexpr const char* kConfigFileName = "config.yml";

enum class AuditView {
    Sanitized,
    Full
};

struct PiiPatternConfig {
    std::string pattern;
    std::string replacement;
};

struct WardenConfig {
    // When false the "cmd" field of each audit record holds the
    // PII-redacted text instead of the full command.
    bool log_full_commands = true;
    AuditView default_view = AuditView::Sanitized;
    std::vector<PiiPatternConfig> pii_patterns;
    std::vector<std::string> allowed_env_vars = {"R_HOME", "PATH", "LANG", "TZ"};
    // Appended to the built-in blocklist, never replacing it.
    std::vector<std::string> blocked_paths;
};

std::filesystem::path config_path_for(const std::filesystem::path& workspace_root);

// A missing file is not an error and yields the defaults.
core::errors::Result<WardenConfig> load_config(const std::filesystem::path& path);

// Same as load_config, but any error is logged and the defaults are used.
WardenConfig load_config_or_defaults(const std::filesystem::path& path);

// Writes a commented default config.yml. Never overwrites an existing file.
core::errors::Result<std::filesystem::path> init_config(
    const std::filesystem::path& workspace_root);

std::string to_string(AuditView view);

}  // namespace warden::core::config
