// ==============================================================================
// quotaprobe/system_probe.hpp - Доступ к таблицам процессов и сокетов ОС
// ==============================================================================
//
// Назначение:
// - SystemProbe: единый интерфейс "перечислить процессы / дать набор
//   инструментов для списка сокетов" вместо ветвлений по ОС в местах вызова
// - WindowsSystemProbe: PowerShell (Get-CimInstance, JSON) + netstat -ano
// - UnixSystemProbe: ps + цепочка lsof -> ss -> netstat
// - make_system_probe(): выбор реализации по platform::OsFamily
//
// Обе реализации компилируются на любой ОС: они только формируют команды и
// разбирают текст, а запуск делегирован platform::CommandRunner.
//
// ==============================================================================

#ifndef QUOTAPROBE_SYSTEM_PROBE_HPP
#define QUOTAPROBE_SYSTEM_PROBE_HPP

#include "quotaprobe/platform.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace quotaprobe::probe {

// ----------------------------------------------------------------------------
// Строка таблицы процессов
// ----------------------------------------------------------------------------

struct ProcessEntry {
    std::string pid;
    std::string name;          // имя исполняемого файла (может быть пустым)
    std::string command_line;  // полная командная строка (может быть пустой)
};

/// Результат перечисления процессов
struct ProcessListing {
    bool ok = false;
    std::vector<ProcessEntry> processes;
    std::string error;
};

// ----------------------------------------------------------------------------
// Строка таблицы сокетов
// ----------------------------------------------------------------------------

/// Строка после разбора колонок конкретного инструмента.
/// state нормализован: любой маркер прослушивания -> "LISTENING".
struct SocketRow {
    std::string local_address;  // "127.0.0.1:42100"
    std::string state;
    std::string pid;
};

/// Набор портов: уникальные, итерация по возрастанию
using PortSet = std::set<std::uint16_t>;

/// Инструмент для списка сокетов: команда + разбор её вывода
struct PortTool {
    std::string name;
    std::string command;
    std::function<std::vector<SocketRow>(std::string_view output)> parse;
};

// ----------------------------------------------------------------------------
// SystemProbe
// ----------------------------------------------------------------------------

class SystemProbe {
public:
    virtual ~SystemProbe() = default;

    virtual platform::OsFamily family() const = 0;

    /// Перечислить процессы, у которых имя или командная строка содержит
    /// name_pattern. Реализация может вернуть и лишние строки: окончательная
    /// фильтрация выполняется в locator.
    virtual ProcessListing list_processes(std::string_view name_pattern) const = 0;

    /// Инструменты для списка сокетов процесса pid в порядке предпочтения
    virtual std::vector<PortTool> port_tools(std::string_view pid) const = 0;

    /// Выполнить команду инструмента
    virtual platform::CommandResult run(const std::string& command) const = 0;
};

class WindowsSystemProbe final : public SystemProbe {
public:
    explicit WindowsSystemProbe(const platform::CommandRunner& runner) : runner_(runner) {}

    platform::OsFamily family() const override { return platform::OsFamily::Windows; }
    ProcessListing list_processes(std::string_view name_pattern) const override;
    std::vector<PortTool> port_tools(std::string_view pid) const override;
    platform::CommandResult run(const std::string& command) const override;

    /// Команда PowerShell для перечисления процессов
    static std::string process_query(std::string_view name_pattern);

private:
    const platform::CommandRunner& runner_;
};

class UnixSystemProbe final : public SystemProbe {
public:
    explicit UnixSystemProbe(const platform::CommandRunner& runner) : runner_(runner) {}

    platform::OsFamily family() const override { return platform::OsFamily::Unix; }
    ProcessListing list_processes(std::string_view name_pattern) const override;
    std::vector<PortTool> port_tools(std::string_view pid) const override;
    platform::CommandResult run(const std::string& command) const override;

private:
    const platform::CommandRunner& runner_;
};

/// Создать SystemProbe для семейства ОС. runner должен пережить результат.
std::unique_ptr<SystemProbe> make_system_probe(platform::OsFamily family,
                                               const platform::CommandRunner& runner);

}  // namespace quotaprobe::probe

#endif  // QUOTAPROBE_SYSTEM_PROBE_HPP
