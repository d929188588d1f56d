// ==============================================================================
// locator.cpp - Поиск процесса языкового сервера
// ==============================================================================
//
// Токен ищется регуляркой вида
//   <flag>[=\s]+(?:["']([^"']+)["']|([^\s"']+))
// т.е. разделитель '=' или пробелы, значение в кавычках или без.
//
// ==============================================================================

#include "quotaprobe/locator.hpp"

#include <algorithm>
#include <cctype>
#include <rapidjson/document.h>
#include <regex>
#include <sstream>

namespace quotaprobe::locator {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

/// Экранировать метасимволы ECMAScript, чтобы имя флага совпадало буквально
std::string escape_regex(std::string_view literal) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string result;
    result.reserve(literal.size() * 2);
    for (char c : literal) {
        if (special.find(c) != std::string::npos) {
            result += '\\';
        }
        result += c;
    }
    return result;
}

/// ProcessId в JSON бывает числом или строкой
std::string json_pid(const rapidjson::Value& v) {
    if (v.IsUint64()) {
        return std::to_string(v.GetUint64());
    }
    if (v.IsInt64()) {
        return std::to_string(v.GetInt64());
    }
    if (v.IsString()) {
        return std::string(v.GetString(), v.GetStringLength());
    }
    return {};
}

std::string json_string(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsString()) {
        return {};
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

void append_cim_entry(const rapidjson::Value& obj, std::vector<probe::ProcessEntry>& out) {
    if (!obj.IsObject()) {
        return;
    }
    probe::ProcessEntry entry;
    auto pid_it = obj.FindMember("ProcessId");
    if (pid_it != obj.MemberEnd()) {
        entry.pid = json_pid(pid_it->value);
    }
    entry.name = json_string(obj, "Name");
    entry.command_line = json_string(obj, "CommandLine");
    if (entry.pid.empty()) {
        return;
    }
    out.push_back(std::move(entry));
}

/// Имя исполняемого файла из первого токена командной строки
std::string executable_name(std::string_view command_line) {
    auto end = command_line.find_first_of(" \t");
    std::string_view first = command_line.substr(0, end);
    auto slash = first.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        first.remove_prefix(slash + 1);
    }
    return std::string(first);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// Разбор командной строки
// ----------------------------------------------------------------------------

std::optional<std::string> extract_arg_value(std::string_view command_line,
                                             std::string_view flag_name) {
    if (flag_name.empty()) {
        return std::nullopt;
    }

    std::regex pattern(escape_regex(flag_name) + R"([=\s]+(?:["']([^"']+)["']|([^\s"']+)))",
                       std::regex::ECMAScript);

    std::string subject(command_line);
    std::smatch match;
    if (!std::regex_search(subject, match, pattern)) {
        return std::nullopt;
    }

    std::string value = match[1].matched ? match[1].str() : match[2].str();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

bool matches_target(const probe::ProcessEntry& entry, std::string_view pattern) {
    std::string needle = to_lower(pattern);
    if (needle.empty()) {
        return false;
    }
    return to_lower(entry.name).find(needle) != std::string::npos ||
           to_lower(entry.command_line).find(needle) != std::string::npos;
}

// ----------------------------------------------------------------------------
// Разбор вывода перечисления процессов
// ----------------------------------------------------------------------------

probe::ProcessListing parse_cim_process_json(std::string_view json) {
    probe::ProcessListing listing;

    // PowerShell иногда пишет UTF-8 BOM
    if (json.size() >= 3 && json.substr(0, 3) == "\xEF\xBB\xBF") {
        json.remove_prefix(3);
    }

    // Пустой вывод: Where-Object ничего не нашёл
    if (trim(json).empty()) {
        listing.ok = true;
        return listing;
    }

    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        listing.error = "process listing is not valid JSON";
        return listing;
    }

    if (doc.IsArray()) {
        for (const auto& item : doc.GetArray()) {
            append_cim_entry(item, listing.processes);
        }
    } else if (doc.IsObject()) {
        append_cim_entry(doc, listing.processes);
    } else {
        listing.error = "process listing JSON is neither an object nor an array";
        return listing;
    }

    listing.ok = true;
    return listing;
}

probe::ProcessListing parse_ps_listing(std::string_view text) {
    probe::ProcessListing listing;

    std::istringstream input{std::string(text)};
    std::string raw;
    while (std::getline(input, raw)) {
        std::string_view line = trim(raw);
        if (line.empty()) {
            continue;
        }

        size_t digits = 0;
        while (digits < line.size() && std::isdigit(static_cast<unsigned char>(line[digits]))) {
            ++digits;
        }
        // Заголовок или мусор: первая колонка не PID
        if (digits == 0 ||
            (digits < line.size() && !std::isspace(static_cast<unsigned char>(line[digits])))) {
            continue;
        }

        probe::ProcessEntry entry;
        entry.pid = std::string(line.substr(0, digits));
        entry.command_line = std::string(trim(line.substr(digits)));
        entry.name = executable_name(entry.command_line);
        listing.processes.push_back(std::move(entry));
    }

    listing.ok = true;
    return listing;
}

// ----------------------------------------------------------------------------
// Выбор процесса
// ----------------------------------------------------------------------------

LocateResult select_process(const std::vector<probe::ProcessEntry>& processes,
                            const LocatorOptions& options) {
    LocateResult result;

    for (const auto& entry : processes) {
        if (!matches_target(entry, options.process_name)) {
            continue;
        }
        ++result.matched;

        if (entry.command_line.find(options.token_flag) == std::string::npos) {
            continue;
        }

        auto token = extract_arg_value(entry.command_line, options.token_flag);
        if (!token) {
            continue;
        }

        result.ok = true;
        result.handle.process_id = entry.pid;
        result.handle.auth_token = std::move(*token);
        return result;
    }

    if (result.matched == 0) {
        result.error = "no process matching '" + options.process_name + "'";
    } else {
        result.error = std::to_string(result.matched) + " process(es) matching '" +
                       options.process_name + "' but none carries " + options.token_flag;
    }
    return result;
}

LocateResult locate(const probe::SystemProbe& probe, const LocatorOptions& options) {
    probe::ProcessListing listing = probe.list_processes(options.process_name);
    if (!listing.ok) {
        LocateResult result;
        result.error = "process listing failed: " + listing.error;
        return result;
    }
    return select_process(listing.processes, options);
}

}  // namespace quotaprobe::locator
