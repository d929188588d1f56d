// ==============================================================================
// pipeline.cpp - Сценарий запуска
// ==============================================================================

#include "quotaprobe/pipeline.hpp"

#include "quotaprobe/scanner.hpp"

#include <algorithm>
#include <sstream>

namespace quotaprobe::pipeline {

namespace {

std::string join_ports(const probe::PortSet& ports) {
    std::ostringstream oss;
    bool first = true;
    for (std::uint16_t port : ports) {
        if (!first) {
            oss << ", ";
        }
        oss << port;
        first = false;
    }
    return oss.str();
}

std::string join_tools(const scanner::ScanResult& scanned) {
    std::string joined;
    for (const auto& attempt : scanned.attempts) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += attempt.tool;
    }
    return joined;
}

/// Токен в отладочном выводе не печатается целиком
std::string mask_token(const std::string& token) {
    if (token.size() <= 4) {
        return std::string(token.size(), '*');
    }
    return token.substr(0, 4) + std::string(token.size() - 4, '*');
}

}  // anonymous namespace

const char* failure_message(Failure failure) {
    switch (failure) {
    case Failure::ProcessNotFound:
        return "Could not find an Antigravity process with csrf token.";
    case Failure::NoPorts:
        return "No local listening ports found for Antigravity process.";
    case Failure::ConnectFailed:
        return "Could not connect to Antigravity local server.";
    case Failure::None:
    default:
        return "";
    }
}

PipelineResult run(const probe::SystemProbe& probe, status::StatusTransport& transport,
                   const config::AppConfig& config, output::Writer& writer) {
    PipelineResult result;

    // 1. Процесс
    writer.debug(std::string("Looking for '") + config.process_name + "' process on " +
                 platform::os_family_name(probe.family()));
    locator::LocateResult located = locator::locate(probe, config::locator_options(config));
    if (!located.ok) {
        writer.debug("Process lookup failed: " + located.error);
        result.failure = Failure::ProcessNotFound;
        return result;
    }
    result.process = located.handle;
    writer.info("Found " + config.process_name + " process " + located.handle.process_id);
    writer.debug("Token " + mask_token(located.handle.auth_token));

    // 2. Порты
    scanner::ScanResult scanned = scanner::scan(probe, located.handle.process_id);
    for (const auto& attempt : scanned.attempts) {
        std::ostringstream oss;
        oss << "Port tool '" << attempt.tool << "': ";
        if (attempt.ran) {
            oss << attempt.rows << " row(s), " << attempt.matches << " port(s)";
        } else {
            oss << "failed";
            if (!attempt.error.empty()) {
                oss << " (" << attempt.error << ")";
            }
        }
        writer.trace(oss.str());
    }
    if (scanned.ports.empty()) {
        bool any_ran = std::any_of(scanned.attempts.begin(), scanned.attempts.end(),
                                   [](const scanner::ToolAttempt& a) { return a.ran; });
        if (!any_ran) {
            writer.warn("No socket listing tool could be run (" + join_tools(scanned) + ")");
        }
        result.failure = Failure::NoPorts;
        return result;
    }
    result.ports = scanned.ports;
    writer.debug("Candidate ports via " + scanned.tool + ": " + join_ports(scanned.ports));

    // 3. Статус
    status::FetchResult fetched = status::fetch_user_status(
        scanned.ports, located.handle.auth_token, config::client_options(config), transport);
    for (const auto& attempt : fetched.attempts) {
        std::ostringstream oss;
        oss << "Port " << attempt.port << ": ";
        if (attempt.ok) {
            oss << "HTTP " << attempt.http_status;
        } else {
            oss << attempt.error;
        }
        writer.debug(oss.str());
    }
    if (!fetched.ok) {
        writer.debug(fetched.error);
        result.failure = Failure::ConnectFailed;
        return result;
    }

    writer.info("Connected to 127.0.0.1:" + std::to_string(fetched.port));
    result.ok = true;
    result.port = fetched.port;
    result.body = std::move(fetched.body);
    return result;
}

}  // namespace quotaprobe::pipeline
