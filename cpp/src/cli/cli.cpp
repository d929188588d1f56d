// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный парсер: формат ошибок и справки фиксирован и проверяется тестами.
//
// ==============================================================================

#include "quotaprobe/cli.hpp"

#include "quotaprobe/platform.hpp"

#include <charconv>
#include <cstring>
#include <string_view>

namespace quotaprobe::cli {

namespace {

constexpr std::uint32_t MAX_TIMEOUT_MS = 600000;

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

/// "-v", "-vv", "-vvv" ...
bool is_verbose_flag(const char* arg) {
    if (arg[0] != '-' || arg[1] != 'v') {
        return false;
    }
    for (const char* p = arg + 1; *p != '\0'; ++p) {
        if (*p != 'v') {
            return false;
        }
    }
    return true;
}

std::string render_usage_error(const std::string& error_msg) {
    return "error: " + error_msg +
           "\n\n"
           "Usage: quotaprobe [OPTIONS]\n\n"
           "For more information, try '--help'.\n";
}

std::optional<std::uint32_t> parse_timeout(std::string_view text) {
    std::uint32_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || text.empty()) {
        return std::nullopt;
    }
    if (value == 0 || value > MAX_TIMEOUT_MS) {
        return std::nullopt;
    }
    return value;
}

/// Значение опции: "--long=value" или следующий аргумент
/// Возвращает nullptr, если значение отсутствует.
const char* take_value(int argc, char** argv, int& i, const char* long_name) {
    const char* arg = argv[i];
    size_t long_len = std::strlen(long_name);
    if (std::strncmp(arg, long_name, long_len) == 0 && arg[long_len] == '=') {
        return arg + long_len + 1;
    }
    if (i + 1 < argc) {
        ++i;
        return argv[i];
    }
    return nullptr;
}

bool matches_option(const char* arg, const char* short_name, const char* long_name) {
    if (str_eq(arg, short_name) || str_eq(arg, long_name)) {
        return true;
    }
    size_t long_len = std::strlen(long_name);
    return std::strncmp(arg, long_name, long_len) == 0 && arg[long_len] == '=';
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("quotaprobe ") + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n"
           "Usage: quotaprobe [OPTIONS]\n"
           "\n"
           "Options:\n"
           "  -c, --config <PATH>   Load settings from a YAML file\n"
           "  -t, --timeout <MS>    Per-port request timeout in milliseconds (default: 5000)\n"
           "  -j, --json            Print the raw status response as JSON\n"
           "  -o, --output <PATH>   Save the report to a file instead of stdout\n"
           "  -v...                 Print verbose output\n"
           "  -q, --quiet           Suppress informational output\n"
           "  -h, --help            Print help\n"
           "  -V, --version         Print version\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    RunCommand run_cmd;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (is_verbose_flag(arg)) {
            result.global.verbose += static_cast<int>(std::strlen(arg)) - 1;
        } else if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            run_cmd.json = true;
        } else if (matches_option(arg, "-c", "--config")) {
            const char* value = take_value(argc, argv, i, "--config");
            if (value == nullptr || *value == '\0') {
                result.diagnostic.stderr_message = render_usage_error(
                    "a value is required for '--config <PATH>' but none was supplied");
                return result;
            }
            run_cmd.config_path = platform::path_from_utf8(value);
        } else if (matches_option(arg, "-o", "--output")) {
            const char* value = take_value(argc, argv, i, "--output");
            if (value == nullptr || *value == '\0') {
                result.diagnostic.stderr_message = render_usage_error(
                    "a value is required for '--output <PATH>' but none was supplied");
                return result;
            }
            run_cmd.output = platform::path_from_utf8(value);
        } else if (matches_option(arg, "-t", "--timeout")) {
            const char* value = take_value(argc, argv, i, "--timeout");
            if (value == nullptr) {
                result.diagnostic.stderr_message = render_usage_error(
                    "a value is required for '--timeout <MS>' but none was supplied");
                return result;
            }
            auto timeout = parse_timeout(value);
            if (!timeout) {
                result.diagnostic.stderr_message =
                    render_usage_error(std::string("invalid value '") + value +
                                       "' for '--timeout <MS>': expected 1..600000");
                return result;
            }
            run_cmd.timeout_ms = timeout;
        } else {
            // Позиционных аргументов нет: всё прочее - ошибка
            result.diagnostic.stderr_message =
                render_usage_error(std::string("unexpected argument '") + arg + "' found");
            return result;
        }
    }

    result.ok = true;
    result.command = run_cmd;
    return result;
}

}  // namespace quotaprobe::cli
