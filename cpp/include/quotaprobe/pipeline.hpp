// ==============================================================================
// quotaprobe/pipeline.hpp - Сценарий запуска: процесс -> порты -> статус
// ==============================================================================
//
// Три шага строго последовательно, без повторов:
//   1. locator::locate  - процесс и токен
//   2. scanner::scan    - слушающие порты на 127.0.0.1
//   3. status::fetch_user_status - первый порт, давший HTTP 200 + JSON
//
// Каждый терминальный сбой - отдельное значение Failure.
//
// ==============================================================================

#ifndef QUOTAPROBE_PIPELINE_HPP
#define QUOTAPROBE_PIPELINE_HPP

#include "quotaprobe/config.hpp"
#include "quotaprobe/locator.hpp"
#include "quotaprobe/output.hpp"
#include "quotaprobe/status.hpp"
#include "quotaprobe/system_probe.hpp"

#include <cstdint>
#include <string>

namespace quotaprobe::pipeline {

enum class Failure {
    None,
    ProcessNotFound,  // процесс не найден или без токена
    NoPorts,          // нет слушающих портов на 127.0.0.1
    ConnectFailed     // ни один порт не ответил
};

/// Сообщение пользователю для терминального сбоя
const char* failure_message(Failure failure);

struct PipelineResult {
    bool ok = false;
    Failure failure = Failure::None;
    locator::ProcessHandle process;
    probe::PortSet ports;
    std::uint16_t port = 0;  // порт, давший ответ
    std::string body;        // тело ответа (валидный JSON)
};

/// Выполнить сценарий. Ход выполнения пишется в writer на уровнях debug/trace.
PipelineResult run(const probe::SystemProbe& probe, status::StatusTransport& transport,
                   const config::AppConfig& config, output::Writer& writer);

}  // namespace quotaprobe::pipeline

#endif  // QUOTAPROBE_PIPELINE_HPP
