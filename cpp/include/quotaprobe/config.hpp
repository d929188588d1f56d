// ==============================================================================
// quotaprobe/config.hpp - Настройки запуска
// ==============================================================================
//
// Назначение:
// - AppConfig: значения по умолчанию, скомпилированные в бинарник
// - Загрузка YAML-файла (--config) поверх значений по умолчанию
// - Преобразование в опции locator / status
//
// Формат файла (все ключи необязательны, неизвестные игнорируются):
//
//   process_name: antigravity
//   token_flag: --csrf_token
//   endpoint_path: /exa.language_server_pb.LanguageServerService/GetUserStatus
//   timeout_ms: 5000
//   metadata:
//     ide_name: antigravity
//     extension_name: antigravity
//     ide_version: 1.0.0
//
// ==============================================================================

#ifndef QUOTAPROBE_CONFIG_HPP
#define QUOTAPROBE_CONFIG_HPP

#include "quotaprobe/locator.hpp"
#include "quotaprobe/status.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace quotaprobe::config {

struct AppConfig {
    std::string process_name = "antigravity";
    std::string token_flag = "--csrf_token";
    std::string endpoint_path = status::DEFAULT_ENDPOINT_PATH;
    std::uint32_t timeout_ms = status::DEFAULT_TIMEOUT_MS;
    status::RequestMetadata metadata;
};

struct LoadResult {
    bool ok = false;
    AppConfig config;
    std::string error;
};

/// Разобрать YAML-текст поверх значений по умолчанию
LoadResult parse_config(std::string_view yaml_text);

/// Прочитать и разобрать YAML-файл
LoadResult load_config(const std::filesystem::path& path);

locator::LocatorOptions locator_options(const AppConfig& config);

status::ClientOptions client_options(const AppConfig& config);

}  // namespace quotaprobe::config

#endif  // QUOTAPROBE_CONFIG_HPP
