#include "core/config/warden_config.hpp"

#include <fstream>
#include <system_error>
#include <yaml-cpp/yaml.h>
#include "core/logging/logger.hpp"

namespace warden::core::config {

using core::errors::ErrorCategory;
using core::errors::WardenError;

namespace {

constexpr const char* kDefaultConfigTemplate =
    R"(# warden workspace configuration

audit:
  log_full_commands: true       # Store the full command next to cmd_sanitized
  default_view: "sanitized"     # What "warden query" shows by default (sanitized|full)

  # Custom PII patterns, applied after the built-in ones
  pii_patterns:
    # - pattern: "CUST[0-9]{6}"
    #   replacement: "[CUSTOMER_ID]"

# Environment variables the agent may read through "warden getenv"
allowed_env_vars:
  - R_HOME
  - PATH
  - LANG
  - TZ

# Blocked paths, in addition to the built-in ones such as ~/.ssh
blocked_paths:
  # - "/custom/sensitive/dir"
)";

WardenError config_error(const std::string& message, const std::string& code) {
    return WardenError{ErrorCategory::Config, message, code,
                       "Fix or remove .direct/config.yml; built-in defaults apply meanwhile."};
}

std::vector<std::string> read_string_list(const YAML::Node& node) {
    std::vector<std::string> values;
    if (!node || node.IsNull()) {
        return values;
    }
    if (!node.IsSequence()) {
        throw YAML::RepresentationException(node.Mark(), "expected a list of strings");
    }
    for (const auto& item : node) {
        values.push_back(item.as<std::string>());
    }
    return values;
}

}  // namespace

std::filesystem::path config_path_for(const std::filesystem::path& workspace_root) {
    return workspace_root / kStateDirName / kConfigFileName;
}

std::string to_string(const AuditView view) {
    switch (view) {
        case AuditView::Sanitized:
            return "sanitized";
        case AuditView::Full:
            return "full";
        default:
            return "unknown";
    }
}

core::errors::Result<WardenConfig> load_config(const std::filesystem::path& path) {
    WardenConfig config;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return config;
    }

    try {
        const YAML::Node root = YAML::LoadFile(path.string());
        if (!root || root.IsNull()) {
            return config;
        }
        if (!root.IsMap()) {
            return config_error("Config root must be a mapping: " + path.string(),
                                "invalid_config_format");
        }

        const YAML::Node audit = root["audit"];
        if (audit && !audit.IsNull()) {
            if (audit["log_full_commands"]) {
                config.log_full_commands = audit["log_full_commands"].as<bool>();
            }
            if (audit["default_view"]) {
                const auto view = audit["default_view"].as<std::string>();
                if (view == "sanitized") {
                    config.default_view = AuditView::Sanitized;
                } else if (view == "full") {
                    config.default_view = AuditView::Full;
                } else {
                    return config_error("audit.default_view must be 'sanitized' or 'full', got: " + view,
                                        "invalid_config_value");
                }
            }

            const YAML::Node patterns = audit["pii_patterns"];
            if (patterns && !patterns.IsNull()) {
                if (!patterns.IsSequence()) {
                    return config_error("audit.pii_patterns must be a list.",
                                        "invalid_config_value");
                }
                for (const auto& entry : patterns) {
                    if (!entry["pattern"] || !entry["replacement"]) {
                        return config_error(
                            "Each audit.pii_patterns entry needs 'pattern' and 'replacement'.",
                            "invalid_config_value");
                    }
                    config.pii_patterns.push_back(PiiPatternConfig{
                        entry["pattern"].as<std::string>(),
                        entry["replacement"].as<std::string>()});
                }
            }
        }

        if (root["allowed_env_vars"]) {
            config.allowed_env_vars = read_string_list(root["allowed_env_vars"]);
        }
        config.blocked_paths = read_string_list(root["blocked_paths"]);
    } catch (const YAML::Exception& e) {
        return config_error("Unable to parse config " + path.string() + ": " + e.what(),
                            "config_parse_failed");
    }

    return config;
}

WardenConfig load_config_or_defaults(const std::filesystem::path& path) {
    auto loaded = load_config(path);
    if (core::errors::is_error(loaded)) {
        const auto& err = core::errors::get_error(loaded);
        LOG_WARN("Config ignored [" + err.code + "]: " + err.message);
        return WardenConfig{};
    }
    return core::errors::get_value(loaded);
}

core::errors::Result<std::filesystem::path> init_config(
    const std::filesystem::path& workspace_root) {
    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root, ec) || ec) {
        return WardenError{ErrorCategory::Input,
                           "Workspace root is not a directory: " + workspace_root.string(),
                           "invalid_workspace_root"};
    }

    const auto path = config_path_for(workspace_root);
    if (std::filesystem::exists(path, ec)) {
        LOG_INFO("Config already exists at: " + path.string());
        return path;
    }

    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        return WardenError{ErrorCategory::Internal,
                           "Unable to create state directory: " + path.parent_path().string(),
                           "state_dir_create_failed"};
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        return WardenError{ErrorCategory::Internal,
                           "Unable to open config file: " + path.string(),
                           "config_open_failed"};
    }
    out << kDefaultConfigTemplate;
    if (!out.good()) {
        return WardenError{ErrorCategory::Internal,
                           "Unable to write config file: " + path.string(),
                           "config_write_failed"};
    }

    LOG_INFO("Created config at: " + path.string());
    return path;
}

}  // namespace warden::core::config
