// ==============================================================================
// config.cpp - Настройки запуска (yaml-cpp)
// ==============================================================================

#include "quotaprobe/config.hpp"

#include "quotaprobe/platform.hpp"

#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace quotaprobe::config {

namespace {

/// Перезаписать target строковым значением ключа, если он задан
void read_string(const YAML::Node& node, const char* key, std::string& target) {
    if (node[key]) {
        target = node[key].as<std::string>();
    }
}

}  // anonymous namespace

LoadResult parse_config(std::string_view yaml_text) {
    LoadResult result;

    try {
        YAML::Node root = YAML::Load(std::string(yaml_text));

        // Пустой файл - только значения по умолчанию
        if (root.IsNull()) {
            result.ok = true;
            return result;
        }
        if (!root.IsMap()) {
            result.error = "config root must be a mapping";
            return result;
        }

        AppConfig& cfg = result.config;
        read_string(root, "process_name", cfg.process_name);
        read_string(root, "token_flag", cfg.token_flag);
        read_string(root, "endpoint_path", cfg.endpoint_path);

        if (root["timeout_ms"]) {
            long long timeout = root["timeout_ms"].as<long long>();
            if (timeout <= 0 || timeout > 600000) {
                result.error = "timeout_ms must be between 1 and 600000";
                return result;
            }
            cfg.timeout_ms = static_cast<std::uint32_t>(timeout);
        }

        if (const YAML::Node metadata = root["metadata"]) {
            if (!metadata.IsMap()) {
                result.error = "'metadata' must be a mapping";
                return result;
            }
            read_string(metadata, "ide_name", cfg.metadata.ide_name);
            read_string(metadata, "extension_name", cfg.metadata.extension_name);
            read_string(metadata, "ide_version", cfg.metadata.ide_version);
        }

        if (cfg.process_name.empty()) {
            result.error = "'process_name' must not be empty";
            return result;
        }
        if (cfg.token_flag.empty()) {
            result.error = "'token_flag' must not be empty";
            return result;
        }
        if (cfg.endpoint_path.empty() || cfg.endpoint_path.front() != '/') {
            result.error = "'endpoint_path' must start with '/'";
            return result;
        }

        result.ok = true;
        return result;

    } catch (const YAML::Exception& e) {
        result.error = std::string("YAML parse error: ") + e.what();
        return result;
    }
}

LoadResult load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LoadResult result;
        result.error = "cannot open config file: " + platform::path_to_utf8(path);
        return result;
    }
    std::ostringstream content;
    content << file.rdbuf();

    LoadResult result = parse_config(content.str());
    if (!result.ok) {
        result.error = platform::path_to_utf8(path) + ": " + result.error;
    }
    return result;
}

locator::LocatorOptions locator_options(const AppConfig& config) {
    locator::LocatorOptions options;
    options.process_name = config.process_name;
    options.token_flag = config.token_flag;
    return options;
}

status::ClientOptions client_options(const AppConfig& config) {
    status::ClientOptions options;
    options.endpoint_path = config.endpoint_path;
    options.timeout = std::chrono::milliseconds(config.timeout_ms);
    options.metadata = config.metadata;
    return options;
}

}  // namespace quotaprobe::config
