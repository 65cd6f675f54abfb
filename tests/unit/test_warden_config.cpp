#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "core/config/warden_config.hpp"
#include "core/errors/warden_errors.hpp"

namespace {

using warden::core::config::AuditView;
using warden::core::config::config_path_for;
using warden::core::config::init_config;
using warden::core::config::load_config;
using warden::core::config::load_config_or_defaults;
using warden::core::errors::ErrorCategory;
using warden::core::errors::get_error;
using warden::core::errors::get_value;
using warden::core::errors::is_error;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_config_" + warden::core::config::generate_session_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_config(const std::filesystem::path& root, const std::string& yaml) {
    const auto path = config_path_for(root);
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << yaml;
}

TEST(WardenConfigTest, MissingFileYieldsDefaults) {
    TempWorkspace workspace;
    auto result = load_config(config_path_for(workspace.root()));
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_TRUE(config.log_full_commands);
    EXPECT_EQ(config.default_view, AuditView::Sanitized);
    EXPECT_TRUE(config.pii_patterns.empty());
    EXPECT_EQ(config.allowed_env_vars.size(), 4u);
    EXPECT_TRUE(config.blocked_paths.empty());
}

TEST(WardenConfigTest, ReadsAllRecognizedKeys) {
    TempWorkspace workspace;
    write_config(workspace.root(),
                 "audit:\n"
                 "  log_full_commands: false\n"
                 "  default_view: full\n"
                 "  pii_patterns:\n"
                 "    - pattern: \"CUST[0-9]{6}\"\n"
                 "      replacement: \"[CUSTOMER_ID]\"\n"
                 "allowed_env_vars:\n"
                 "  - HOME\n"
                 "blocked_paths:\n"
                 "  - secrets\n"
                 "  - /srv/private\n");

    auto result = load_config(config_path_for(workspace.root()));
    ASSERT_FALSE(is_error(result));
    const auto& config = get_value(result);
    EXPECT_FALSE(config.log_full_commands);
    EXPECT_EQ(config.default_view, AuditView::Full);
    ASSERT_EQ(config.pii_patterns.size(), 1u);
    EXPECT_EQ(config.pii_patterns[0].pattern, "CUST[0-9]{6}");
    EXPECT_EQ(config.pii_patterns[0].replacement, "[CUSTOMER_ID]");
    ASSERT_EQ(config.allowed_env_vars.size(), 1u);
    EXPECT_EQ(config.allowed_env_vars[0], "HOME");
    ASSERT_EQ(config.blocked_paths.size(), 2u);
    EXPECT_EQ(config.blocked_paths[1], "/srv/private");
}

TEST(WardenConfigTest, RejectsUnknownDefaultView) {
    TempWorkspace workspace;
    write_config(workspace.root(), "audit:\n  default_view: everything\n");

    auto result = load_config(config_path_for(workspace.root()));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Config);
    EXPECT_EQ(get_error(result).code, "invalid_config_value");
}

TEST(WardenConfigTest, MalformedYamlFallsBackToDefaults) {
    TempWorkspace workspace;
    write_config(workspace.root(), "audit: [unterminated\n");

    auto result = load_config(config_path_for(workspace.root()));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "config_parse_failed");

    const auto config = load_config_or_defaults(config_path_for(workspace.root()));
    EXPECT_TRUE(config.log_full_commands);
    EXPECT_TRUE(config.pii_patterns.empty());
}

TEST(WardenConfigTest, InitWritesTemplateOnce) {
    TempWorkspace workspace;
    auto created = init_config(workspace.root());
    ASSERT_FALSE(is_error(created));
    EXPECT_TRUE(std::filesystem::exists(get_value(created)));

    // The commented template loads cleanly.
    auto loaded = load_config(get_value(created));
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).allowed_env_vars.size(), 4u);

    {
        std::ofstream out(get_value(created), std::ios::app);
        out << "# edited\n";
    }
    auto again = init_config(workspace.root());
    ASSERT_FALSE(is_error(again));
    std::ifstream in(get_value(again));
    const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("# edited"), std::string::npos);
}

}  // namespace
