// ==============================================================================
// system_probe.cpp - Реализации SystemProbe для Windows и Unix
// ==============================================================================

#include "quotaprobe/system_probe.hpp"

#include "quotaprobe/locator.hpp"
#include "quotaprobe/scanner.hpp"

#include <algorithm>
#include <cctype>

namespace quotaprobe::probe {

namespace {

/// Подстрока для -like '*...*': одиночные кавычки удваиваются,
/// двойные удаляются (команда целиком передаётся в "...")
std::string powershell_literal(std::string_view s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        if (c == '"') {
            continue;
        }
        if (c == '\'') {
            result += '\'';
        }
        result += c;
    }
    return result;
}

bool is_numeric_pid(std::string_view pid) {
    return !pid.empty() && std::all_of(pid.begin(), pid.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// WindowsSystemProbe
// ----------------------------------------------------------------------------

std::string WindowsSystemProbe::process_query(std::string_view name_pattern) {
    std::string pattern = powershell_literal(name_pattern);
    return "powershell -NoProfile -Command \"Get-CimInstance Win32_Process"
           " | Where-Object { ($_.Name -like '*" +
           pattern + "*') -or ($_.CommandLine -like '*" + pattern +
           "*') }"
           " | Select-Object ProcessId, Name, CommandLine"
           " | ConvertTo-Json -Depth 1\"";
}

ProcessListing WindowsSystemProbe::list_processes(std::string_view name_pattern) const {
    platform::CommandResult command = runner_.run(process_query(name_pattern));
    if (!command.ok) {
        ProcessListing listing;
        listing.error = command.error;
        return listing;
    }
    return locator::parse_cim_process_json(command.output);
}

std::vector<PortTool> WindowsSystemProbe::port_tools(std::string_view /*pid*/) const {
    return {
        PortTool{"netstat", "netstat -ano -p TCP", scanner::parse_windows_netstat},
    };
}

platform::CommandResult WindowsSystemProbe::run(const std::string& command) const {
    return runner_.run(command);
}

// ----------------------------------------------------------------------------
// UnixSystemProbe
// ----------------------------------------------------------------------------

ProcessListing UnixSystemProbe::list_processes(std::string_view /*name_pattern*/) const {
    // ps не умеет фильтровать по подстроке командной строки: берём всё
    platform::CommandResult command = runner_.run("ps -A -ww -o pid=,args=");
    if (!command.ok) {
        ProcessListing listing;
        listing.error = command.error;
        return listing;
    }
    return locator::parse_ps_listing(command.output);
}

std::vector<PortTool> UnixSystemProbe::port_tools(std::string_view pid) const {
    std::vector<PortTool> tools;
    // pid подставляется в команду только если это число
    if (is_numeric_pid(pid)) {
        tools.push_back(PortTool{"lsof",
                                 "lsof -nP -iTCP -sTCP:LISTEN -a -p " + std::string(pid),
                                 scanner::parse_lsof});
    }
    tools.push_back(PortTool{"ss", "ss -ltnp", scanner::parse_ss});
    tools.push_back(PortTool{"netstat", "netstat -ltnp", scanner::parse_linux_netstat});
    return tools;
}

platform::CommandResult UnixSystemProbe::run(const std::string& command) const {
    return runner_.run(command);
}

// ----------------------------------------------------------------------------
// Фабрика
// ----------------------------------------------------------------------------

std::unique_ptr<SystemProbe> make_system_probe(platform::OsFamily family,
                                               const platform::CommandRunner& runner) {
    switch (family) {
    case platform::OsFamily::Windows:
        return std::make_unique<WindowsSystemProbe>(runner);
    case platform::OsFamily::Unix:
        return std::make_unique<UnixSystemProbe>(runner);
    }
    return std::make_unique<UnixSystemProbe>(runner);
}

}  // namespace quotaprobe::probe
