// ==============================================================================
// quotaprobe/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Флаг семейства ОС (Windows / Unix), выбираемый при старте
// - Преобразования path <-> UTF-8
// - TTY detection для цветного вывода
// - Запуск внешних команд (process/socket listing) с захватом stdout
//
// Вся платформенная специфика (#ifdef _WIN32) изолирована в platform.cpp.
//
// ==============================================================================

#ifndef QUOTAPROBE_PLATFORM_HPP
#define QUOTAPROBE_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace quotaprobe::platform {

// ----------------------------------------------------------------------------
// Семейство ОС
// ----------------------------------------------------------------------------

enum class OsFamily {
    Windows,  // PowerShell + netstat -ano
    Unix      // ps + lsof / ss / netstat
};

/// Семейство ОС, под которое собран бинарник
OsFamily current_os_family();

/// "windows" / "unix"
const char* os_family_name(OsFamily family);

/// Человекочитаемое имя ОС: "Windows", "Linux", "macOS" или "Unknown"
std::string os_name();

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str);

std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();

bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Запуск внешних команд
// ----------------------------------------------------------------------------

/// Результат запуска внешней команды
struct CommandResult {
    bool ok = false;     // команда запущена и завершилась с кодом 0
    int exit_code = -1;  // -1 если процесс не удалось запустить
    std::string output;  // полный stdout
    std::string error;   // описание ошибки запуска (если есть)
};

/// Исполнитель команд. Реализация по умолчанию - ShellCommandRunner,
/// в тестах подменяется на фиксированные ответы.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /// Выполнить команду через системную оболочку и дождаться завершения.
    /// stderr команды отбрасывается.
    virtual CommandResult run(const std::string& command) const = 0;
};

/// popen()/_popen() через /bin/sh или cmd.exe
class ShellCommandRunner final : public CommandRunner {
public:
    CommandResult run(const std::string& command) const override;
};

}  // namespace quotaprobe::platform

#endif  // QUOTAPROBE_PLATFORM_HPP
