// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// Платформенная специфика изолирована здесь: кодировки путей, TTY,
// popen/_popen и разбор статуса завершения дочернего процесса.
//
// ==============================================================================

#include "quotaprobe/platform.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace quotaprobe::platform {

// ----------------------------------------------------------------------------
// Семейство ОС
// ----------------------------------------------------------------------------

OsFamily current_os_family() {
#ifdef _WIN32
    return OsFamily::Windows;
#else
    return OsFamily::Unix;
#endif
}

const char* os_family_name(OsFamily family) {
    switch (family) {
    case OsFamily::Windows:
        return "windows";
    case OsFamily::Unix:
        return "unix";
    }
    return "unknown";
}

std::string os_name() {
#ifdef _WIN32
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    // Windows: UTF-8 -> UTF-16 для native path
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// ShellCommandRunner
// ----------------------------------------------------------------------------

namespace {

#ifdef _WIN32
constexpr const char* DISCARD_STDERR = " 2>NUL";

FILE* open_pipe(const std::string& command) {
    return _popen(command.c_str(), "r");
}

int close_pipe(FILE* pipe) {
    return _pclose(pipe);
}

int decode_exit_status(int status) {
    return status;
}
#else
constexpr const char* DISCARD_STDERR = " 2>/dev/null";

FILE* open_pipe(const std::string& command) {
    return ::popen(command.c_str(), "r");
}

int close_pipe(FILE* pipe) {
    return ::pclose(pipe);
}

int decode_exit_status(int status) {
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    // Завершён сигналом
    return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
}
#endif

struct PipeCloser {
    void operator()(FILE* pipe) const {
        if (pipe != nullptr) {
            close_pipe(pipe);
        }
    }
};

using UniquePipe = std::unique_ptr<FILE, PipeCloser>;

}  // namespace

CommandResult ShellCommandRunner::run(const std::string& command) const {
    CommandResult result;

    std::string full_command = command + DISCARD_STDERR;
    UniquePipe pipe(open_pipe(full_command));
    if (!pipe) {
        result.error = "failed to start '" + command + "': " + std::strerror(errno);
        return result;
    }

    std::array<char, 4096> buffer{};
    size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
        result.output.append(buffer.data(), n);
    }

    // pclose нужен явно: только он возвращает статус завершения
    int status = close_pipe(pipe.release());
    result.exit_code = decode_exit_status(status);
    result.ok = (result.exit_code == 0);
    if (!result.ok) {
        result.error = "'" + command + "' exited with code " + std::to_string(result.exit_code);
    }
    return result;
}

}  // namespace quotaprobe::platform
