// ==============================================================================
// status_client.cpp - HTTP-кодек и перебор портов
// ==============================================================================

#include "quotaprobe/status.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace quotaprobe::status {

namespace {

constexpr std::string_view CRLF = "\r\n";
constexpr std::string_view HEADER_END = "\r\n\r\n";

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

bool icontains(std::string_view haystack, std::string_view needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](unsigned char x, unsigned char y) {
                              return std::tolower(x) == std::tolower(y);
                          });
    return it != haystack.end();
}

std::optional<size_t> parse_size(std::string_view text, int base) {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

/// Разобрать заголовки из блока между status line и пустой строкой
std::vector<HttpHeader> parse_headers(std::string_view block) {
    std::vector<HttpHeader> headers;
    size_t pos = 0;
    while (pos < block.size()) {
        size_t eol = block.find(CRLF, pos);
        std::string_view line =
            block.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        pos = (eol == std::string_view::npos) ? block.size() : eol + CRLF.size();

        size_t colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        HttpHeader header;
        header.name = std::string(trim(line.substr(0, colon)));
        header.value = std::string(trim(line.substr(colon + 1)));
        headers.push_back(std::move(header));
    }
    return headers;
}

/// Декодировать Transfer-Encoding: chunked. nullopt если данные неполные.
std::optional<std::string> decode_chunked(std::string_view data) {
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t eol = data.find(CRLF, pos);
        if (eol == std::string_view::npos) {
            return std::nullopt;
        }
        std::string_view size_line = data.substr(pos, eol - pos);
        size_line = size_line.substr(0, size_line.find(';'));  // chunk extensions
        auto size = parse_size(size_line, 16);
        if (!size) {
            return std::nullopt;
        }
        pos = eol + CRLF.size();
        if (*size == 0) {
            return out;
        }
        if (pos + *size + CRLF.size() > data.size()) {
            return std::nullopt;
        }
        out.append(data.substr(pos, *size));
        pos += *size;
        if (data.substr(pos, CRLF.size()) != CRLF) {
            return std::nullopt;
        }
        pos += CRLF.size();
    }
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// HTTP
// ----------------------------------------------------------------------------

std::string serialize_request(const HttpRequest& request) {
    std::string wire;
    wire.reserve(256 + request.body.size());
    wire += "POST " + request.path + " HTTP/1.1\r\n";
    wire += "Host: " + request.host + ":" + std::to_string(request.port) + "\r\n";
    for (const auto& header : request.headers) {
        wire += header.name + ": " + header.value + "\r\n";
    }
    wire += "Content-Length: " + std::to_string(request.body.size()) + "\r\n";
    wire += "Connection: close\r\n";
    wire += "\r\n";
    wire += request.body;
    return wire;
}

std::optional<std::string> find_header(const std::vector<HttpHeader>& headers,
                                       std::string_view name) {
    for (const auto& header : headers) {
        if (iequals(header.name, name)) {
            return header.value;
        }
    }
    return std::nullopt;
}

HttpResponse parse_http_response(std::string_view raw) {
    HttpResponse response;

    size_t header_end = raw.find(HEADER_END);
    if (header_end == std::string_view::npos) {
        response.error = raw.empty() ? "empty response" : "incomplete response headers";
        return response;
    }

    // Status line: "HTTP/1.1 200 OK"
    size_t status_eol = raw.find(CRLF);
    std::string_view status_line = raw.substr(0, status_eol);
    if (status_line.substr(0, 5) != "HTTP/") {
        response.error = "malformed status line";
        return response;
    }
    size_t sp = status_line.find(' ');
    if (sp == std::string_view::npos) {
        response.error = "malformed status line";
        return response;
    }
    std::string_view code = status_line.substr(sp + 1, 3);
    auto status = parse_size(code, 10);
    if (!status || code.size() != 3) {
        response.error = "malformed status code";
        return response;
    }
    response.status = static_cast<int>(*status);

    if (status_eol < header_end) {
        response.headers =
            parse_headers(raw.substr(status_eol + CRLF.size(), header_end - status_eol));
    }

    std::string_view body = raw.substr(header_end + HEADER_END.size());

    auto transfer_encoding = find_header(response.headers, "Transfer-Encoding");
    if (transfer_encoding && icontains(*transfer_encoding, "chunked")) {
        auto decoded = decode_chunked(body);
        if (!decoded) {
            response.error = "truncated chunked body";
            return response;
        }
        response.body = std::move(*decoded);
        response.ok = true;
        return response;
    }

    if (auto length_header = find_header(response.headers, "Content-Length")) {
        auto length = parse_size(*length_header, 10);
        if (!length) {
            response.error = "invalid Content-Length";
            return response;
        }
        if (body.size() < *length) {
            response.error = "truncated body";
            return response;
        }
        response.body = std::string(body.substr(0, *length));
        response.ok = true;
        return response;
    }

    // Без длины тело - всё до закрытия соединения
    response.body = std::string(body);
    response.ok = true;
    return response;
}

bool is_complete_response(std::string_view raw) {
    size_t header_end = raw.find(HEADER_END);
    if (header_end == std::string_view::npos) {
        return false;
    }
    auto headers = parse_headers(raw.substr(0, header_end));
    std::string_view body = raw.substr(header_end + HEADER_END.size());

    auto transfer_encoding = find_header(headers, "Transfer-Encoding");
    if (transfer_encoding && icontains(*transfer_encoding, "chunked")) {
        return decode_chunked(body).has_value();
    }
    if (auto length_header = find_header(headers, "Content-Length")) {
        auto length = parse_size(*length_header, 10);
        return length && body.size() >= *length;
    }
    return false;
}

// ----------------------------------------------------------------------------
// Клиент
// ----------------------------------------------------------------------------

std::string build_request_body(const RequestMetadata& metadata) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("metadata");
    writer.StartObject();
    writer.Key("ideName");
    writer.String(metadata.ide_name.c_str(),
                  static_cast<rapidjson::SizeType>(metadata.ide_name.size()));
    writer.Key("extensionName");
    writer.String(metadata.extension_name.c_str(),
                  static_cast<rapidjson::SizeType>(metadata.extension_name.size()));
    writer.Key("ideVersion");
    writer.String(metadata.ide_version.c_str(),
                  static_cast<rapidjson::SizeType>(metadata.ide_version.size()));
    writer.EndObject();
    writer.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

HttpRequest build_request(std::uint16_t port, std::string_view auth_token,
                          const ClientOptions& options) {
    HttpRequest request;
    request.port = port;
    request.path = options.endpoint_path;
    request.timeout = options.timeout;
    request.headers = {
        {"Content-Type", "application/json"},
        {PROTOCOL_VERSION_HEADER, "1"},
        {CSRF_HEADER, std::string(auth_token)},
    };
    request.body = build_request_body(options.metadata);
    return request;
}

FetchResult fetch_user_status(const probe::PortSet& ports, std::string_view auth_token,
                              const ClientOptions& options, StatusTransport& transport) {
    FetchResult result;

    for (std::uint16_t port : ports) {
        ProbeAttempt attempt;
        attempt.port = port;

        HttpResponse response = transport.post(build_request(port, auth_token, options));
        if (!response.ok) {
            attempt.error = response.error.empty() ? "request failed" : response.error;
            result.attempts.push_back(std::move(attempt));
            continue;
        }

        attempt.http_status = response.status;
        if (response.status != 200) {
            attempt.error = "HTTP " + std::to_string(response.status);
            result.attempts.push_back(std::move(attempt));
            continue;
        }

        rapidjson::Document doc;
        doc.Parse(response.body.c_str(), response.body.size());
        if (doc.HasParseError()) {
            attempt.error = "invalid JSON response";
            result.attempts.push_back(std::move(attempt));
            continue;
        }

        attempt.ok = true;
        result.attempts.push_back(std::move(attempt));
        result.ok = true;
        result.port = port;
        result.body = std::move(response.body);
        return result;
    }

    result.error = "all " + std::to_string(ports.size()) + " candidate port(s) failed";
    return result;
}

}  // namespace quotaprobe::status
