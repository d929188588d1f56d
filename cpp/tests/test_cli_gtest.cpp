// ==============================================================================
// test_cli_gtest.cpp - Тесты модуля CLI (GoogleTest)
// ==============================================================================

#include "quotaprobe/cli.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace quotaprobe::cli::test {

// ==============================================================================
// Вспомогательная структура для argv
// ==============================================================================

struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args) : strings(args) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }

    char** argv() { return ptrs.data(); }
};

// ==============================================================================
// Справка и версия
// ==============================================================================

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    // Arrange
    Args args{"quotaprobe", "--help"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<HelpCommand>(result.command));
}

TEST(CliTest, Parse_HelpAfterOtherOptions_StillHelp) {
    Args args{"quotaprobe", "-j", "-h"};
    ParseResult result = parse(args.argc(), args.argv());
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<HelpCommand>(result.command));
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    Args args{"quotaprobe", "-V"};
    ParseResult result = parse(args.argc(), args.argv());
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));
}

TEST(CliTest, RenderVersion_Format) {
    EXPECT_EQ(render_version(), "quotaprobe 0.1.0\n");
}

TEST(CliTest, RenderHelp_ListsAllOptions) {
    std::string help = render_help();
    EXPECT_NE(help.find("Usage: quotaprobe [OPTIONS]"), std::string::npos);
    for (const char* option : {"--config", "--timeout", "--json", "--output", "--quiet", "-v...",
                               "--help", "--version"}) {
        EXPECT_NE(help.find(option), std::string::npos) << option;
    }
}

// ==============================================================================
// Основной запуск
// ==============================================================================

TEST(CliTest, Parse_NoArguments_RunWithDefaults) {
    // Arrange
    Args args{"quotaprobe"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    ASSERT_TRUE(result.ok);
    const auto* cmd = std::get_if<RunCommand>(&result.command);
    ASSERT_NE(cmd, nullptr);
    EXPECT_FALSE(cmd->config_path.has_value());
    EXPECT_FALSE(cmd->timeout_ms.has_value());
    EXPECT_FALSE(cmd->output.has_value());
    EXPECT_FALSE(cmd->json);
    EXPECT_EQ(result.global.verbose, 0);
    EXPECT_FALSE(result.global.quiet);
}

TEST(CliTest, Parse_AllOptions) {
    // Arrange
    Args args{"quotaprobe", "-c", "probe.yaml", "--timeout=2500", "--json", "-o",
              "out.json",   "-q"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<RunCommand>(result.command);
    ASSERT_TRUE(cmd.config_path.has_value());
    EXPECT_EQ(cmd.config_path->filename(), "probe.yaml");
    ASSERT_TRUE(cmd.timeout_ms.has_value());
    EXPECT_EQ(*cmd.timeout_ms, 2500u);
    EXPECT_TRUE(cmd.json);
    ASSERT_TRUE(cmd.output.has_value());
    EXPECT_EQ(cmd.output->filename(), "out.json");
    EXPECT_TRUE(result.global.quiet);
}

TEST(CliTest, Parse_VerboseCountsRepeats) {
    Args args{"quotaprobe", "-v", "-vv"};
    ParseResult result = parse(args.argc(), args.argv());
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.global.verbose, 3);
}

// ==============================================================================
// Ошибки использования (exit code 2)
// ==============================================================================

TEST(CliTest, Parse_UnknownOption_ExitCode2) {
    // Arrange
    Args args{"quotaprobe", "--bogus"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument '--bogus'"),
              std::string::npos);
    EXPECT_NE(result.diagnostic.stderr_message.find("For more information, try '--help'."),
              std::string::npos);
}

TEST(CliTest, Parse_PositionalArgument_ExitCode2) {
    Args args{"quotaprobe", "status"};
    ParseResult result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
}

TEST(CliTest, Parse_MissingConfigValue_ExitCode2) {
    Args args{"quotaprobe", "--config"};
    ParseResult result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("--config <PATH>"), std::string::npos);
}

TEST(CliTest, Parse_InvalidTimeout_ExitCode2) {
    for (const char* value : {"abc", "0", "-5", "600001", "12ms", ""}) {
        Args args{"quotaprobe", "-t", value};
        ParseResult result = parse(args.argc(), args.argv());
        EXPECT_FALSE(result.ok) << value;
        EXPECT_EQ(result.diagnostic.exit_code, 2) << value;
    }
}

TEST(CliTest, Parse_TimeoutBounds_Accepted) {
    Args low{"quotaprobe", "-t", "1"};
    Args high{"quotaprobe", "--timeout", "600000"};

    ParseResult low_result = parse(low.argc(), low.argv());
    ParseResult high_result = parse(high.argc(), high.argv());

    ASSERT_TRUE(low_result.ok);
    ASSERT_TRUE(high_result.ok);
    EXPECT_EQ(*std::get<RunCommand>(low_result.command).timeout_ms, 1u);
    EXPECT_EQ(*std::get<RunCommand>(high_result.command).timeout_ms, 600000u);
}

}  // namespace quotaprobe::cli::test
