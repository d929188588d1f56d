// ==============================================================================
// test_platform_gtest.cpp - Тесты платформенного модуля (GoogleTest)
// ==============================================================================

#include "quotaprobe/platform.hpp"

#include <cstring>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>

namespace quotaprobe::platform::test {

// ==============================================================================
// Семейство ОС
// ==============================================================================

TEST(PlatformTest, OsName_ReturnsNonEmpty) {
    // Arrange & Act
    std::string name = os_name();

    // Assert
    EXPECT_FALSE(name.empty());
}

TEST(PlatformTest, CurrentOsFamily_MatchesBuildTarget) {
    // Act
    OsFamily family = current_os_family();

    // Assert
#ifdef _WIN32
    EXPECT_EQ(family, OsFamily::Windows);
#else
    EXPECT_EQ(family, OsFamily::Unix);
#endif
}

TEST(PlatformTest, OsFamilyName_DistinctPerFamily) {
    EXPECT_STREQ(os_family_name(OsFamily::Windows), "windows");
    EXPECT_STREQ(os_family_name(OsFamily::Unix), "unix");
}

// ==============================================================================
// Преобразование путей UTF-8 <-> path
// ==============================================================================

TEST(PlatformTest, PathFromUtf8_BasicPath) {
    // Arrange
    std::string utf8 = "config/quotaprobe.yaml";

    // Act
    std::filesystem::path p = path_from_utf8(utf8);

    // Assert
    EXPECT_EQ(p.filename(), "quotaprobe.yaml");
}

TEST(PlatformTest, PathToUtf8_EmptyPath) {
    EXPECT_TRUE(path_to_utf8(std::filesystem::path{}).empty());
}

TEST(PlatformTest, PathConversion_RoundtripWithUnicode) {
    // Arrange
    std::string original_utf8 = "настройки/квоты.yaml";

    // Act
    std::string roundtrip = path_to_utf8(path_from_utf8(original_utf8));

    // Assert
    EXPECT_NE(roundtrip.find("квоты"), std::string::npos);
}

// ==============================================================================
// TTY detection
// ==============================================================================

TEST(PlatformTest, IsTtyStderr_DoesNotThrow) {
    EXPECT_NO_THROW((void)is_tty_stderr());
    EXPECT_NO_THROW((void)is_tty_stdout());
}

// ==============================================================================
// ShellCommandRunner
// ==============================================================================

#ifndef _WIN32

TEST(ShellCommandRunnerTest, Run_CapturesStdout) {
    // Arrange
    ShellCommandRunner runner;

    // Act
    CommandResult result = runner.run("echo quota");

    // Assert
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "quota\n");
}

TEST(ShellCommandRunnerTest, Run_ReportsNonZeroExit) {
    // Arrange
    ShellCommandRunner runner;

    // Act
    CommandResult result = runner.run("sh -c 'exit 3'");

    // Assert
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.error.empty());
}

TEST(ShellCommandRunnerTest, Run_DiscardsStderr) {
    // Arrange
    ShellCommandRunner runner;

    // Act
    CommandResult result = runner.run("sh -c 'echo noise 1>&2; echo data'");

    // Assert
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.output, "data\n");
}

TEST(ShellCommandRunnerTest, Run_MissingCommandFails) {
    // Arrange
    ShellCommandRunner runner;

    // Act
    CommandResult result = runner.run("quotaprobe-no-such-command-xyz");

    // Assert
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.exit_code, 0);
    EXPECT_TRUE(result.output.empty());
}

#endif

}  // namespace quotaprobe::platform::test
