// ==============================================================================
// quotaprobe/scanner.hpp - Поиск loopback-портов процесса
// ==============================================================================
//
// Назначение:
// - Разбор табличного вывода netstat / lsof / ss в SocketRow
// - Отбор строк: PID совпадает, состояние LISTENING, адрес 127.0.0.1
// - scan(): инструменты по порядку предпочтения до первого непустого набора
//
// Форматы колонки PID:
//   netstat -ano (Windows)  "1234"                 5-я колонка
//   lsof -nP -iTCP          "1234"                 2-я колонка
//   ss -ltnp                users:(("x",pid=1234,fd=3))
//   netstat -ltnp (Linux)   "1234/program"         последняя колонка
//
// ==============================================================================

#ifndef QUOTAPROBE_SCANNER_HPP
#define QUOTAPROBE_SCANNER_HPP

#include "quotaprobe/system_probe.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quotaprobe::scanner {

using probe::PortSet;
using probe::SocketRow;

/// Нормализованное состояние прослушивающего сокета
constexpr const char* LISTENING = "LISTENING";

/// Адрес loopback-интерфейса, к которому должен быть привязан порт
constexpr const char* LOOPBACK_ADDRESS = "127.0.0.1";

// ----------------------------------------------------------------------------
// Отбор строк
// ----------------------------------------------------------------------------

/// "LISTEN", "(LISTEN)", "listening" -> "LISTENING"; прочее -> верхний регистр
std::string normalize_state(std::string_view state);

/// Порт после последнего ':'; nullopt если не целое в диапазоне 1..65535
std::optional<std::uint16_t> parse_port(std::string_view local_address);

/// Хост в local_address - ровно 127.0.0.1
bool is_loopback(std::string_view local_address);

/// Строка принадлежит pid, слушает и привязана к loopback
bool row_qualifies(const SocketRow& row, std::string_view pid);

/// Порты из строк, прошедших row_qualifies
PortSet select_ports(const std::vector<SocketRow>& rows, std::string_view pid);

// ----------------------------------------------------------------------------
// Разбор вывода инструментов
// ----------------------------------------------------------------------------

/// `netstat -ano`: Proto Local Foreign State PID
std::vector<SocketRow> parse_windows_netstat(std::string_view text);

/// `lsof -nP -iTCP -sTCP:LISTEN`: COMMAND PID USER FD TYPE DEVICE SIZE/OFF NODE NAME (STATE)
std::vector<SocketRow> parse_lsof(std::string_view text);

/// `ss -ltnp`: State Recv-Q Send-Q Local Peer Process.
/// Для сокета, разделяемого несколькими процессами, одна строка на каждый pid.
std::vector<SocketRow> parse_ss(std::string_view text);

/// `netstat -ltnp` (Linux): Proto Recv-Q Send-Q Local Foreign State PID/Program
std::vector<SocketRow> parse_linux_netstat(std::string_view text);

// ----------------------------------------------------------------------------
// Сканирование
// ----------------------------------------------------------------------------

/// Попытка одного инструмента (для отладочного вывода)
struct ToolAttempt {
    std::string tool;
    bool ran = false;     // команда завершилась успешно
    size_t rows = 0;      // строк разобрано
    size_t matches = 0;   // портов отобрано
    std::string error;
};

struct ScanResult {
    PortSet ports;
    std::string tool;  // инструмент, давший порты (пусто если ни один)
    std::vector<ToolAttempt> attempts;
};

/// Перебрать инструменты probe.port_tools(pid) до первого непустого набора.
/// Ошибка или пустой результат инструмента не прерывают перебор.
ScanResult scan(const probe::SystemProbe& probe, std::string_view pid);

}  // namespace quotaprobe::scanner

#endif  // QUOTAPROBE_SCANNER_HPP
