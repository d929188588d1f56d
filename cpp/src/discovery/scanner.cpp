// ==============================================================================
// scanner.cpp - Поиск loopback-портов процесса
// ==============================================================================

#include "quotaprobe/scanner.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include <sstream>

namespace quotaprobe::scanner {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::vector<std::string> split_whitespace(const std::string& line) {
    std::vector<std::string> columns;
    std::istringstream iss(line);
    std::string column;
    while (iss >> column) {
        columns.push_back(std::move(column));
    }
    return columns;
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    std::istringstream input{std::string(text)};
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

bool all_digits(std::string_view s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// Отбор строк
// ----------------------------------------------------------------------------

std::string normalize_state(std::string_view state) {
    if (state.size() >= 2 && state.front() == '(' && state.back() == ')') {
        state = state.substr(1, state.size() - 2);
    }
    std::string upper(state);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "LISTEN" || upper == LISTENING) {
        return LISTENING;
    }
    return upper;
}

std::optional<std::uint16_t> parse_port(std::string_view local_address) {
    auto colon = local_address.rfind(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    std::string_view text = local_address.substr(colon + 1);
    if (!all_digits(text)) {
        return std::nullopt;
    }

    unsigned long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    if (value == 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

bool is_loopback(std::string_view local_address) {
    auto colon = local_address.rfind(':');
    if (colon == std::string_view::npos) {
        return false;
    }
    return local_address.substr(0, colon) == LOOPBACK_ADDRESS;
}

bool row_qualifies(const SocketRow& row, std::string_view pid) {
    return row.pid == pid && row.state == LISTENING && is_loopback(row.local_address);
}

PortSet select_ports(const std::vector<SocketRow>& rows, std::string_view pid) {
    PortSet ports;
    for (const auto& row : rows) {
        if (!row_qualifies(row, pid)) {
            continue;
        }
        if (auto port = parse_port(row.local_address)) {
            ports.insert(*port);
        }
    }
    return ports;
}

// ----------------------------------------------------------------------------
// Разбор вывода инструментов
// ----------------------------------------------------------------------------

std::vector<SocketRow> parse_windows_netstat(std::string_view text) {
    std::vector<SocketRow> rows;
    for (const auto& line : split_lines(text)) {
        auto columns = split_whitespace(line);
        if (columns.size() < 5) {
            continue;
        }
        SocketRow row;
        row.local_address = columns[1];
        row.state = normalize_state(columns[3]);
        row.pid = columns[4];
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<SocketRow> parse_lsof(std::string_view text) {
    std::vector<SocketRow> rows;
    for (const auto& line : split_lines(text)) {
        auto columns = split_whitespace(line);
        if (columns.size() < 9 || !all_digits(columns[1])) {
            continue;
        }
        SocketRow row;
        row.pid = columns[1];
        const std::string& last = columns.back();
        if (last.size() >= 2 && last.front() == '(' && last.back() == ')') {
            row.state = normalize_state(last);
            row.local_address = columns[columns.size() - 2];
        } else {
            row.local_address = last;
        }
        // Установленные соединения: "local->remote"
        auto arrow = row.local_address.find("->");
        if (arrow != std::string::npos) {
            row.local_address.resize(arrow);
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<SocketRow> parse_ss(std::string_view text) {
    static const std::regex pid_pattern(R"(pid=(\d+))");

    std::vector<SocketRow> rows;
    for (const auto& line : split_lines(text)) {
        auto columns = split_whitespace(line);
        if (columns.size() < 6) {
            continue;
        }
        std::string state = normalize_state(columns[0]);
        const std::string& local = columns[3];

        auto begin = std::sregex_iterator(line.begin(), line.end(), pid_pattern);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            SocketRow row;
            row.local_address = local;
            row.state = state;
            row.pid = (*it)[1].str();
            rows.push_back(std::move(row));
        }
    }
    return rows;
}

std::vector<SocketRow> parse_linux_netstat(std::string_view text) {
    std::vector<SocketRow> rows;
    for (const auto& line : split_lines(text)) {
        auto columns = split_whitespace(line);
        if (columns.size() < 7) {
            continue;
        }
        std::string proto = columns[0];
        if (proto.compare(0, 3, "tcp") != 0) {
            continue;
        }
        SocketRow row;
        row.local_address = columns[3];
        row.state = normalize_state(columns[5]);
        // "1234/language_server" или "-" без прав
        const std::string& owner = columns[6];
        row.pid = owner.substr(0, owner.find('/'));
        rows.push_back(std::move(row));
    }
    return rows;
}

// ----------------------------------------------------------------------------
// Сканирование
// ----------------------------------------------------------------------------

ScanResult scan(const probe::SystemProbe& probe, std::string_view pid) {
    ScanResult result;

    for (const auto& tool : probe.port_tools(pid)) {
        ToolAttempt attempt;
        attempt.tool = tool.name;

        platform::CommandResult command = probe.run(tool.command);
        if (!command.ok) {
            attempt.error = command.error;
            result.attempts.push_back(std::move(attempt));
            continue;
        }
        attempt.ran = true;

        auto rows = tool.parse(command.output);
        attempt.rows = rows.size();
        PortSet ports = select_ports(rows, pid);
        attempt.matches = ports.size();
        result.attempts.push_back(std::move(attempt));

        if (!ports.empty()) {
            result.ports = std::move(ports);
            result.tool = tool.name;
            return result;
        }
    }

    return result;
}

}  // namespace quotaprobe::scanner
