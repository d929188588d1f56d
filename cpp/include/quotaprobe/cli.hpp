// ==============================================================================
// quotaprobe/cli.hpp - CLI парсинг
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef QUOTAPROBE_CLI_HPP
#define QUOTAPROBE_CLI_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace quotaprobe::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (repeatable)
    bool quiet = false;  // -q, --quiet
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Основной запуск: найти процесс, опросить порты, вывести отчёт
struct RunCommand {
    std::optional<std::filesystem::path> config_path;  // -c, --config
    std::optional<std::uint32_t> timeout_ms;           // -t, --timeout
    bool json = false;                                 // -j, --json
    std::optional<std::filesystem::path> output;       // -o, --output
};

struct HelpCommand {};

struct VersionCommand {};

using Command = std::variant<RunCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

std::string render_help();

/// "quotaprobe <VERSION>\n"
std::string render_version();

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Report Antigravity quota usage from the local language server";

}  // namespace quotaprobe::cli

#endif  // QUOTAPROBE_CLI_HPP
