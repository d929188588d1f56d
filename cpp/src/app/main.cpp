// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Загрузка настроек (config)
// 4. Сценарий pipeline: процесс -> порты -> статус
// 5. Отчёт или JSON в stdout (или в файл --output)
//
// Исключения перехватываются на границе app.
//
// ==============================================================================

#include "quotaprobe/cli.hpp"
#include "quotaprobe/config.hpp"
#include "quotaprobe/output.hpp"
#include "quotaprobe/pipeline.hpp"
#include "quotaprobe/platform.hpp"
#include "quotaprobe/status.hpp"
#include "quotaprobe/system_probe.hpp"
#include "quotaprobe/usage.hpp"

#include <clocale>
#include <exception>
#include <iostream>
#include <memory>
#include <rapidjson/document.h>
#include <string>
#include <type_traits>
#include <variant>

namespace {

int run_probe(const quotaprobe::cli::RunCommand& cmd, quotaprobe::output::Writer& writer) {
    using namespace quotaprobe;

    if (cmd.output.has_value() && !writer.has_output_file()) {
        writer.error("cannot open output file: " + platform::path_to_utf8(*cmd.output));
        return 1;
    }

    // Настройки: значения по умолчанию, затем файл, затем флаги
    config::AppConfig app_config;
    if (cmd.config_path.has_value()) {
        config::LoadResult loaded = config::load_config(*cmd.config_path);
        if (!loaded.ok) {
            writer.error(loaded.error);
            return 1;
        }
        app_config = loaded.config;
        writer.debug("Loaded config from " + platform::path_to_utf8(*cmd.config_path));
    }
    if (cmd.timeout_ms.has_value()) {
        app_config.timeout_ms = *cmd.timeout_ms;
    }

    writer.debug(std::string("quotaprobe ") + cli::VERSION + " on " + platform::os_name());
    platform::ShellCommandRunner runner;
    std::unique_ptr<probe::SystemProbe> system_probe =
        probe::make_system_probe(platform::current_os_family(), runner);
    status::TlsStatusTransport transport;

    pipeline::PipelineResult result = pipeline::run(*system_probe, transport, app_config, writer);
    if (!result.ok) {
        writer.error(pipeline::failure_message(result.failure));
        return 1;
    }

    if (cmd.json) {
        rapidjson::Document doc;
        doc.Parse(result.body.c_str(), result.body.size());
        writer.write_json_pretty(doc);
        return 0;
    }

    auto usage_status = usage::parse_usage_body(result.body);
    if (!usage_status) {
        writer.error("malformed status response");
        return 1;
    }
    writer.write(output::Stream::Stdout, usage::render_report(*usage_status));
    writer.flush();
    return 0;
}

int run(int argc, char** argv) {
    using namespace quotaprobe;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    if (parse_result.ok) {
        if (const auto* run_cmd = std::get_if<cli::RunCommand>(&parse_result.command)) {
            out_cfg.output_path = run_cmd->output;
        }
    }
    output::Writer writer(out_cfg);

    // Ошибка парсинга: сообщение как есть, без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                return run_probe(cmd, writer);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

int main(int argc, char** argv) {
    // Время сброса квот печатается в формате локали пользователя
    std::setlocale(LC_TIME, "");

    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
