// ==============================================================================
// test_pipeline_gtest.cpp - Сквозные тесты сценария (GoogleTest)
// ==============================================================================
//
// Реальные UnixSystemProbe / WindowsSystemProbe поверх подменённых команд ОС
// и подменённого транспорта: процесс -> порты -> статус -> отчёт.
//
// ==============================================================================

#include "quotaprobe/pipeline.hpp"
#include "quotaprobe/usage.hpp"

#include <gtest/gtest.h>
#include <map>
#include <string>
#include <vector>

namespace quotaprobe::pipeline::test {

namespace {

constexpr const char* STATUS_BODY = R"json({"userStatus":{"email":"dev@example.com",
  "planStatus":{"planInfo":{"monthlyPromptCredits":50000},"availablePromptCredits":500},
  "cascadeModelConfigData":{"clientModelConfigs":[
    {"label":"Gemini 3 Pro (High)","quotaInfo":{"remainingFraction":0.5}},
    {"label":"Fast Autocomplete","quotaInfo":{"remainingFraction":1}}]}}})json";

constexpr const char* PS_OUTPUT =
    "    1 /sbin/init\n"
    " 5150 /opt/Antigravity/resources/bin/language_server_linux_x64 --csrf_token "
    "3f2a-77 --extension_server_port 40000\n";

class FakeRunner : public platform::CommandRunner {
public:
    std::map<std::string, std::string> outputs;

    platform::CommandResult run(const std::string& command) const override {
        platform::CommandResult result;
        auto it = outputs.find(command);
        if (it == outputs.end()) {
            result.exit_code = 127;
            result.error = "not found";
            return result;
        }
        result.ok = true;
        result.exit_code = 0;
        result.output = it->second;
        return result;
    }
};

class ScriptedTransport : public status::StatusTransport {
public:
    std::map<std::uint16_t, status::HttpResponse> responses;
    std::vector<std::uint16_t> ports;
    std::vector<std::string> tokens;

    status::HttpResponse post(const status::HttpRequest& request) override {
        ports.push_back(request.port);
        tokens.push_back(status::find_header(request.headers, status::CSRF_HEADER).value_or(""));
        auto it = responses.find(request.port);
        if (it != responses.end()) {
            return it->second;
        }
        status::HttpResponse refused;
        refused.error = "Connection refused";
        return refused;
    }
};

status::HttpResponse timed_out() {
    status::HttpResponse response;
    response.timed_out = true;
    response.error = "request timed out after 5000 ms";
    return response;
}

status::HttpResponse success(const std::string& body) {
    status::HttpResponse response;
    response.ok = true;
    response.status = 200;
    response.body = body;
    return response;
}

std::string lsof_listing(const std::vector<std::uint16_t>& ports) {
    std::string text = "COMMAND PID USER FD TYPE DEVICE SIZE/OFF NODE NAME\n";
    for (auto port : ports) {
        text += "language_ 5150 dev 23u IPv4 0x1 0t0 TCP 127.0.0.1:" + std::to_string(port) +
                " (LISTEN)\n";
    }
    return text;
}

std::string render(const PipelineResult& result) {
    auto status = usage::parse_usage_body(result.body);
    EXPECT_TRUE(status.has_value());
    return status ? usage::render_report(*status) : std::string();
}

}  // anonymous namespace

// ==============================================================================
// Успешный сценарий
// ==============================================================================

TEST(PipelineTest, Run_FirstTwoPortsTimeOut_SameReportAsThirdAlone) {
    // Arrange: три порта, первые два не отвечают
    FakeRunner runner;
    runner.outputs["ps -A -ww -o pid=,args="] = PS_OUTPUT;
    runner.outputs["lsof -nP -iTCP -sTCP:LISTEN -a -p 5150"] =
        lsof_listing({42103, 42101, 42102});
    probe::UnixSystemProbe probe(runner);

    ScriptedTransport transport;
    transport.responses[42101] = timed_out();
    transport.responses[42102] = timed_out();
    transport.responses[42103] = success(STATUS_BODY);

    FakeRunner single_runner;
    single_runner.outputs["ps -A -ww -o pid=,args="] = PS_OUTPUT;
    single_runner.outputs["lsof -nP -iTCP -sTCP:LISTEN -a -p 5150"] = lsof_listing({42103});
    probe::UnixSystemProbe single_probe(single_runner);

    ScriptedTransport single_transport;
    single_transport.responses[42103] = success(STATUS_BODY);

    output::Writer writer(output::OutputConfig{});
    config::AppConfig config;

    // Act
    PipelineResult result = run(probe, transport, config, writer);
    PipelineResult single = run(single_probe, single_transport, config, writer);

    // Assert
    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(single.ok);
    EXPECT_EQ(result.port, 42103);
    EXPECT_EQ(transport.ports, (std::vector<std::uint16_t>{42101, 42102, 42103}));
    EXPECT_EQ(render(result), render(single));
    EXPECT_EQ(render(result),
              "Antigravity quota usage\n"
              "----------------------------------------\n"
              "User: dev@example.com\n"
              "Credits: 49500 / 50000 used (99%)\n"
              "\n"
              "Model quotas:\n"
              "- Gemini 3 Pro (High): remaining 50%, resets N/A\n");
}

TEST(PipelineTest, Run_TokenForwardedToEveryAttempt) {
    FakeRunner runner;
    runner.outputs["ps -A -ww -o pid=,args="] = PS_OUTPUT;
    runner.outputs["lsof -nP -iTCP -sTCP:LISTEN -a -p 5150"] = lsof_listing({42100, 42200});
    probe::UnixSystemProbe probe(runner);
    ScriptedTransport transport;
    transport.responses[42200] = success(STATUS_BODY);
    output::Writer writer(output::OutputConfig{});

    PipelineResult result = run(probe, transport, config::AppConfig{}, writer);

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.process.process_id, "5150");
    EXPECT_EQ(result.process.auth_token, "3f2a-77");
    EXPECT_EQ(transport.tokens, (std::vector<std::string>{"3f2a-77", "3f2a-77"}));
}

TEST(PipelineTest, Run_WindowsProbeWithNetstat) {
    // Arrange
    FakeRunner runner;
    runner.outputs[probe::WindowsSystemProbe::process_query("antigravity")] =
        R"([{"ProcessId":4242,"Name":"language_server_windows_x64.exe",)"
        R"("CommandLine":"C:\\Antigravity\\ls.exe --csrf_token \"win-tok\""}])";
    runner.outputs["netstat -ano -p TCP"] =
        "  TCP    127.0.0.1:42100        0.0.0.0:0              LISTENING       4242\n";
    probe::WindowsSystemProbe probe(runner);
    ScriptedTransport transport;
    transport.responses[42100] = success(STATUS_BODY);
    output::Writer writer(output::OutputConfig{});

    // Act
    PipelineResult result = run(probe, transport, config::AppConfig{}, writer);

    // Assert
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.process.auth_token, "win-tok");
    EXPECT_EQ(result.port, 42100);
}

// ==============================================================================
// Сообщения о ходе выполнения (stderr)
// ==============================================================================

TEST(PipelineTest, Run_ReportsProcessAndPortAsInfo) {
    // Arrange
    FakeRunner runner;
    runner.outputs["ps -A -ww -o pid=,args="] = PS_OUTPUT;
    runner.outputs["lsof -nP -iTCP -sTCP:LISTEN -a -p 5150"] = lsof_listing({42103});
    probe::UnixSystemProbe probe(runner);
    ScriptedTransport transport;
    transport.responses[42103] = success(STATUS_BODY);
    output::Writer writer(output::OutputConfig{});

    // Act
    ::testing::internal::CaptureStderr();
    PipelineResult result = run(probe, transport, config::AppConfig{}, writer);
    writer.flush();
    std::string captured = ::testing::internal::GetCapturedStderr();

    // Assert
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(captured,
              "[+] Found antigravity process 5150\n"
              "[+] Connected to 127.0.0.1:42103\n");
}

TEST(PipelineTest, Run_QuietSuppressesInfo) {
    FakeRunner runner;
    runner.outputs["ps -A -ww -o pid=,args="] = PS_OUTPUT;
    runner.outputs["lsof -nP -iTCP -sTCP:LISTEN -a -p 5150"] = lsof_listing({42103});
    probe::UnixSystemProbe probe(runner);
    ScriptedTransport transport;
    transport.responses[42103] = success(STATUS_BODY);
    output::OutputConfig quiet;
    quiet.quiet = true;
    output::Writer writer(quiet);

    ::testing::internal::CaptureStderr();
    PipelineResult result = run(probe, transport, config::AppConfig{}, writer);
    writer.flush();
    std::string captured = ::testing::internal::GetCapturedStderr();

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(captured.empty());
}

TEST(PipelineTest, Run_NoToolCouldRun_Warns) {
    // Arrange: ps работает, ни lsof, ни ss, ни netstat не запускаются
    FakeRunner runner;
    runner.outputs["ps -A -ww -o pid=,args="] = PS_OUTPUT;
    probe::UnixSystemProbe probe(runner);
    ScriptedTransport transport;
    output::Writer writer(output::OutputConfig{});

    // Act
    ::testing::internal::CaptureStderr();
    PipelineResult result = run(probe, transport, config::AppConfig{}, writer);
    writer.flush();
    std::string captured = ::testing::internal::GetCapturedStderr();

    // Assert
    EXPECT_EQ(result.failure, Failure::NoPorts);
    EXPECT_NE(captured.find("[!] No socket listing tool could be run (lsof, ss, netstat)\n"),
              std::string::npos);
}

// ==============================================================================
// Терминальные сбои
// ==============================================================================

TEST(PipelineTest, Run_ProcessNotFound) {
    FakeRunner runner;
    runner.outputs["ps -A -ww -o pid=,args="] = "    1 /sbin/init\n";
    probe::UnixSystemProbe probe(runner);
    ScriptedTransport transport;
    output::Writer writer(output::OutputConfig{});

    PipelineResult result = run(probe, transport, config::AppConfig{}, writer);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.failure, Failure::ProcessNotFound);
    EXPECT_STREQ(failure_message(result.failure),
                 "Could not find an Antigravity process with csrf token.");
    EXPECT_TRUE(transport.ports.empty());
}

TEST(PipelineTest, Run_NoLoopbackPorts) {
    FakeRunner runner;
    runner.outputs["ps -A -ww -o pid=,args="] = PS_OUTPUT;
    runner.outputs["lsof -nP -iTCP -sTCP:LISTEN -a -p 5150"] =
        "language_ 5150 dev 23u IPv4 0x1 0t0 TCP *:42100 (LISTEN)\n";
    probe::UnixSystemProbe probe(runner);
    ScriptedTransport transport;
    output::Writer writer(output::OutputConfig{});

    PipelineResult result = run(probe, transport, config::AppConfig{}, writer);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.failure, Failure::NoPorts);
    EXPECT_STREQ(failure_message(result.failure),
                 "No local listening ports found for Antigravity process.");
}

TEST(PipelineTest, Run_AllPortsFail) {
    FakeRunner runner;
    runner.outputs["ps -A -ww -o pid=,args="] = PS_OUTPUT;
    runner.outputs["ss -ltnp"] =
        "LISTEN 0 4096 127.0.0.1:42100 0.0.0.0:* users:((\"ls\",pid=5150,fd=3))\n";
    probe::UnixSystemProbe probe(runner);
    ScriptedTransport transport;
    transport.responses[42100] = timed_out();
    output::Writer writer(output::OutputConfig{});

    PipelineResult result = run(probe, transport, config::AppConfig{}, writer);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.failure, Failure::ConnectFailed);
    EXPECT_STREQ(failure_message(result.failure),
                 "Could not connect to Antigravity local server.");
    EXPECT_EQ(transport.ports, (std::vector<std::uint16_t>{42100}));
}

}  // namespace quotaprobe::pipeline::test
