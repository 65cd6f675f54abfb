#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/warden_errors.hpp"

namespace {

using warden::app::cli::CliCommand;
using warden::app::cli::CliRequest;
using warden::app::cli::parse_and_validate;
using warden::core::errors::ErrorCategory;
using warden::core::errors::get_error;
using warden::core::errors::get_value;
using warden::core::errors::is_error;
using warden::session::AuditStatus;

warden::core::errors::Result<CliRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("warden");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenArgumentCountIsWrong) {
    auto missing = parse_tokens({"validate-path"});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "invalid_argument_count");

    auto extra = parse_tokens({"write-file", "a.txt", "x", "y"});
    ASSERT_TRUE(is_error(extra));
    EXPECT_EQ(get_error(extra).code, "invalid_argument_count");
}

TEST(CliParserTest, FailsOnUnknownFlag) {
    auto result = parse_tokens({"stats", "--colour"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"query", "--tool"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, ParsesQueryFilters) {
    auto result = parse_tokens({"query", "--tool", "run_code", "--status", "blocked",
                                "--since", "2024-01-01T00:00:00Z", "--last", "5", "--full"});
    ASSERT_FALSE(is_error(result));
    const auto& request = get_value(result);
    EXPECT_EQ(request.command, CliCommand::Query);
    EXPECT_EQ(request.filter.tool.value(), "run_code");
    EXPECT_EQ(request.filter.status.value(), AuditStatus::Blocked);
    EXPECT_EQ(request.filter.since.value(), "2024-01-01T00:00:00Z");
    EXPECT_EQ(request.filter.last_n.value(), 5u);
    EXPECT_TRUE(request.full_view);
}

TEST(CliParserTest, FailsWhenStatusInvalid) {
    auto result = parse_tokens({"query", "--status", "exploded"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_status");

    auto logged = parse_tokens({"log", "run", "exploded", "x<-1"});
    ASSERT_TRUE(is_error(logged));
    EXPECT_EQ(get_error(logged).code, "invalid_status");
}

TEST(CliParserTest, FailsWhenLastNotNumeric) {
    auto result = parse_tokens({"query", "--last", "12abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");

    auto zero = parse_tokens({"query", "--last", "0"});
    ASSERT_TRUE(is_error(zero));
    EXPECT_EQ(get_error(zero).code, "invalid_integer");
}

TEST(CliParserTest, RejectsFiltersOutsideQueryAndExport) {
    auto result = parse_tokens({"stats", "--tool", "run_code"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unexpected_flag");

    auto interpreter = parse_tokens({"getenv", "PATH", "--interpreter", "python3"});
    ASSERT_TRUE(is_error(interpreter));
    EXPECT_EQ(get_error(interpreter).code, "unexpected_flag");
}

TEST(CliParserTest, ParsesInterpreterOverrides) {
    auto result = parse_tokens({"run", "--interpreter", "/bin/sh", "--interpreter-arg", "-c",
                                "--timeout-ms", "1500", "echo hi"});
    ASSERT_FALSE(is_error(result));
    const auto& request = get_value(result);
    EXPECT_EQ(request.command, CliCommand::Run);
    EXPECT_EQ(request.interpreter.program, "/bin/sh");
    ASSERT_EQ(request.interpreter.args.size(), 1u);
    EXPECT_EQ(request.interpreter.args[0], "-c");
    EXPECT_EQ(request.interpreter.timeout_ms, 1500u);
    ASSERT_EQ(request.arguments.size(), 1u);
    EXPECT_EQ(request.arguments[0], "echo hi");
}

TEST(CliParserTest, DefaultsToRscript) {
    auto result = parse_tokens({"run", "x <- 1"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).interpreter.program, "Rscript");
    EXPECT_EQ(get_value(result).interpreter.args, std::vector<std::string>{"-e"});
}

TEST(CliParserTest, DoubleDashEndsFlagParsing) {
    auto result = parse_tokens({"redact-pii", "--", "--verbose"});
    ASSERT_FALSE(is_error(result));
    const auto& request = get_value(result);
    EXPECT_FALSE(request.verbose);
    ASSERT_EQ(request.arguments.size(), 1u);
    EXPECT_EQ(request.arguments[0], "--verbose");
}

TEST(CliParserTest, RedactCommandsAcceptNoText) {
    auto result = parse_tokens({"redact-secrets"});
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).arguments.empty());
}

TEST(CliParserTest, FailsWhenWorkspaceMissing) {
    auto result = parse_tokens({"stats", "--workspace", "/definitely/not/here/warden"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, CanonicalizesWorkspaceAndSession) {
    const auto cwd = std::filesystem::current_path();
    auto result = parse_tokens({"stats", "--workspace", ".", "--session", "sess-42", "--verbose"});
    ASSERT_FALSE(is_error(result));
    const auto& request = get_value(result);
    EXPECT_EQ(request.workspace, std::filesystem::canonical(cwd));
    EXPECT_EQ(request.session_id.value(), "sess-42");
    EXPECT_TRUE(request.verbose);

    auto empty_session = parse_tokens({"stats", "--session", ""});
    ASSERT_TRUE(is_error(empty_session));
    EXPECT_EQ(get_error(empty_session).code, "invalid_session_id");
}

TEST(CliParserTest, RejectsSessionIdsUnsafeForLogs) {
    const std::vector<std::string> bad_ids = {"two words", "a\nb", "id;rm", std::string(65, 'x')};
    for (const auto& bad : bad_ids) {
        auto result = parse_tokens({"stats", "--session", bad});
        ASSERT_TRUE(is_error(result)) << bad;
        EXPECT_EQ(get_error(result).code, "invalid_session_id");
    }
}

TEST(CliParserTest, AcceptsGeneratedSessionIds) {
    const auto generated = warden::core::config::generate_session_id();
    ASSERT_EQ(generated.size(), 13u);
    EXPECT_EQ(generated.rfind("sess-", 0), 0u);
    EXPECT_EQ(generated.find_first_not_of("0123456789abcdef", 5), std::string::npos);

    auto result = parse_tokens({"stats", "--session", generated});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).session_id.value(), generated);
}

}  // namespace
