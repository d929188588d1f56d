// ==============================================================================
// quotaprobe/status.hpp - Запрос GetUserStatus к локальному серверу
// ==============================================================================
//
// Назначение:
// - Формирование HTTP/1.1 POST (JSON-тело + заголовки Connect/CSRF)
// - StatusTransport: интерфейс отправки одного запроса
// - TlsStatusTransport: Boost.Asio + OpenSSL, без проверки сертификата
//   (сервер на 127.0.0.1 использует самоподписанный сертификат)
// - fetch_user_status(): порты по порядку до первого HTTP 200 с валидным JSON
//
// Таймаут на попытку: по истечении сокет закрывается, порт считается
// неудачным, перебор продолжается.
//
// ==============================================================================

#ifndef QUOTAPROBE_STATUS_HPP
#define QUOTAPROBE_STATUS_HPP

#include "quotaprobe/system_probe.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quotaprobe::status {

// ----------------------------------------------------------------------------
// Константы протокола
// ----------------------------------------------------------------------------

constexpr const char* DEFAULT_ENDPOINT_PATH =
    "/exa.language_server_pb.LanguageServerService/GetUserStatus";
constexpr const char* CSRF_HEADER = "X-Codeium-Csrf-Token";
constexpr const char* PROTOCOL_VERSION_HEADER = "Connect-Protocol-Version";
constexpr std::uint32_t DEFAULT_TIMEOUT_MS = 5000;

// ----------------------------------------------------------------------------
// HTTP
// ----------------------------------------------------------------------------

struct HttpHeader {
    std::string name;
    std::string value;
};

struct HttpRequest {
    std::string host = "127.0.0.1";
    std::uint16_t port = 0;
    std::string path;
    std::vector<HttpHeader> headers;
    std::string body;
    std::chrono::milliseconds timeout{DEFAULT_TIMEOUT_MS};
};

struct HttpResponse {
    bool ok = false;         // ответ получен и разобран (любой статус)
    int status = 0;
    std::vector<HttpHeader> headers;
    std::string body;
    bool timed_out = false;
    std::string error;
};

/// Сериализовать запрос. Host, Content-Length и Connection: close
/// добавляются автоматически.
std::string serialize_request(const HttpRequest& request);

/// Разобрать сырой ответ (status line, заголовки, тело).
/// Поддерживает Content-Length и Transfer-Encoding: chunked.
HttpResponse parse_http_response(std::string_view raw);

/// Ответ получен целиком: заголовки + тело по Content-Length или
/// завершающий chunk. Без обоих признаков - только по закрытию соединения.
bool is_complete_response(std::string_view raw);

/// Найти заголовок без учёта регистра имени
std::optional<std::string> find_header(const std::vector<HttpHeader>& headers,
                                       std::string_view name);

// ----------------------------------------------------------------------------
// Транспорт
// ----------------------------------------------------------------------------

class StatusTransport {
public:
    virtual ~StatusTransport() = default;

    /// Отправить POST и дождаться ответа не дольше request.timeout
    virtual HttpResponse post(const HttpRequest& request) = 0;
};

class TlsStatusTransport final : public StatusTransport {
public:
    HttpResponse post(const HttpRequest& request) override;
};

// ----------------------------------------------------------------------------
// Клиент
// ----------------------------------------------------------------------------

/// Поле metadata в теле запроса
struct RequestMetadata {
    std::string ide_name = "antigravity";
    std::string extension_name = "antigravity";
    std::string ide_version = "1.0.0";
};

struct ClientOptions {
    std::string endpoint_path = DEFAULT_ENDPOINT_PATH;
    std::chrono::milliseconds timeout{DEFAULT_TIMEOUT_MS};
    RequestMetadata metadata;
};

/// {"metadata":{"ideName":...,"extensionName":...,"ideVersion":...}}
std::string build_request_body(const RequestMetadata& metadata);

/// Запрос к 127.0.0.1:port с токеном в X-Codeium-Csrf-Token
HttpRequest build_request(std::uint16_t port, std::string_view auth_token,
                          const ClientOptions& options);

/// Одна попытка (для отладочного вывода)
struct ProbeAttempt {
    std::uint16_t port = 0;
    bool ok = false;
    int http_status = 0;
    std::string error;
};

struct FetchResult {
    bool ok = false;
    std::uint16_t port = 0;  // порт, давший ответ
    std::string body;        // тело ответа, гарантированно валидный JSON
    std::vector<ProbeAttempt> attempts;
    std::string error;
};

/// Перебрать порты по возрастанию; первый HTTP 200 с валидным JSON - успех.
/// Неудачи отдельных портов не прерывают перебор.
FetchResult fetch_user_status(const probe::PortSet& ports, std::string_view auth_token,
                              const ClientOptions& options, StatusTransport& transport);

}  // namespace quotaprobe::status

#endif  // QUOTAPROBE_STATUS_HPP
