// ==============================================================================
// quotaprobe/locator.hpp - Поиск процесса языкового сервера
// ==============================================================================
//
// Назначение:
// - Разбор вывода перечисления процессов (JSON от Get-CimInstance, текст ps)
// - Фильтрация по имени целевого приложения (case-insensitive подстрока)
// - Извлечение значения флага --csrf_token из командной строки
// - locate(): первый подходящий процесс с непустым токеном
//
// "Не найден" - штатный исход, а не исключение.
//
// ==============================================================================

#ifndef QUOTAPROBE_LOCATOR_HPP
#define QUOTAPROBE_LOCATOR_HPP

#include "quotaprobe/system_probe.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quotaprobe::locator {

// ----------------------------------------------------------------------------
// ProcessHandle
// ----------------------------------------------------------------------------

/// Найденный процесс. auth_token всегда непустой.
struct ProcessHandle {
    std::string process_id;
    std::string auth_token;
};

struct LocatorOptions {
    std::string process_name = "antigravity";
    std::string token_flag = "--csrf_token";
};

/// Результат поиска
struct LocateResult {
    bool ok = false;
    ProcessHandle handle;
    size_t matched = 0;  // сколько процессов прошло фильтр по имени
    std::string error;   // причина при !ok
};

// ----------------------------------------------------------------------------
// Разбор командной строки
// ----------------------------------------------------------------------------

/// Значение флага: `flag=value`, `flag value`, `flag="value"`, `flag 'value'`.
/// Имя флага сравнивается буквально. nullopt если флага нет или значение пустое.
std::optional<std::string> extract_arg_value(std::string_view command_line,
                                             std::string_view flag_name);

/// Имя или командная строка содержит pattern (без учёта регистра)
bool matches_target(const probe::ProcessEntry& entry, std::string_view pattern);

// ----------------------------------------------------------------------------
// Разбор вывода перечисления процессов
// ----------------------------------------------------------------------------

/// JSON от `Select-Object ProcessId, Name, CommandLine | ConvertTo-Json`:
/// один объект или массив объектов. Некорректный JSON -> ok=false.
probe::ProcessListing parse_cim_process_json(std::string_view json);

/// Вывод `ps -A -ww -o pid=,args=`: "<pid> <command line>" на строку
probe::ProcessListing parse_ps_listing(std::string_view text);

// ----------------------------------------------------------------------------
// Выбор процесса
// ----------------------------------------------------------------------------

/// Первый процесс, прошедший фильтр по имени и содержащий непустой токен
LocateResult select_process(const std::vector<probe::ProcessEntry>& processes,
                            const LocatorOptions& options);

/// Перечислить процессы через probe и выбрать целевой
LocateResult locate(const probe::SystemProbe& probe, const LocatorOptions& options);

}  // namespace quotaprobe::locator

#endif  // QUOTAPROBE_LOCATOR_HPP
