// ==============================================================================
// tls_transport.cpp - HTTPS POST через Boost.Asio + OpenSSL
// ==============================================================================
//
// Цепочка connect -> handshake -> write -> read выполняется асинхронно на
// собственном io_context; run_for() ограничивает её таймаутом запроса.
// По истечении таймаута сокет закрывается и оставшиеся обработчики
// завершаются с operation_aborted до выхода из post().
//
// ==============================================================================

#include "quotaprobe/status.hpp"

#include <array>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>
#include <functional>

namespace quotaprobe::status {

namespace {

namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;
using error_code = boost::system::error_code;
using TlsStream = ssl::stream<tcp::socket>;

/// Закрывает TCP-сокет при выходе из области видимости
class ScopedSocketCloser {
public:
    explicit ScopedSocketCloser(TlsStream::lowest_layer_type& socket) : socket_(socket) {}

    ~ScopedSocketCloser() {
        error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    ScopedSocketCloser(const ScopedSocketCloser&) = delete;
    ScopedSocketCloser& operator=(const ScopedSocketCloser&) = delete;

private:
    TlsStream::lowest_layer_type& socket_;
};

/// Конец потока: штатный EOF или обрыв без close_notify
bool is_end_of_stream(const error_code& ec) {
    return ec == asio::error::eof || ec == ssl::error::stream_truncated;
}

}  // anonymous namespace

HttpResponse TlsStatusTransport::post(const HttpRequest& request) {
    HttpResponse response;

    try {
        asio::io_context io;

        // Локальный сервер использует самоподписанный сертификат
        ssl::context context(ssl::context::tls_client);
        context.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                            ssl::context::no_sslv3);
        context.set_verify_mode(ssl::verify_none);

        TlsStream stream(io, context);
        ScopedSocketCloser closer(stream.lowest_layer());

        error_code address_ec;
        auto address = asio::ip::make_address(request.host, address_ec);
        if (address_ec) {
            response.error = "invalid host '" + request.host + "': " + address_ec.message();
            return response;
        }
        tcp::endpoint endpoint(address, request.port);

        const std::string wire = serialize_request(request);
        std::string raw;
        std::array<char, 4096> chunk{};
        error_code failure;
        bool done = false;

        auto finish = [&](const error_code& ec) {
            failure = ec;
            done = true;
        };

        std::function<void(const error_code&, std::size_t)> on_read;
        on_read = [&](const error_code& ec, std::size_t n) {
            raw.append(chunk.data(), n);
            if (ec) {
                finish(is_end_of_stream(ec) ? error_code{} : ec);
                return;
            }
            if (is_complete_response(raw)) {
                finish({});
                return;
            }
            stream.async_read_some(asio::buffer(chunk), on_read);
        };

        stream.lowest_layer().async_connect(endpoint, [&](const error_code& ec) {
            if (ec) {
                finish(ec);
                return;
            }
            stream.async_handshake(ssl::stream_base::client, [&](const error_code& ec) {
                if (ec) {
                    finish(ec);
                    return;
                }
                asio::async_write(stream, asio::buffer(wire),
                                  [&](const error_code& ec, std::size_t /*written*/) {
                                      if (ec) {
                                          finish(ec);
                                          return;
                                      }
                                      stream.async_read_some(asio::buffer(chunk), on_read);
                                  });
            });
        });

        io.run_for(request.timeout);

        if (!done) {
            // Дедлайн истёк: прервать запрос и дождаться отмены обработчиков
            error_code ignored;
            stream.lowest_layer().cancel(ignored);
            stream.lowest_layer().close(ignored);
            io.run();
            response.timed_out = true;
            response.error =
                "request timed out after " + std::to_string(request.timeout.count()) + " ms";
            return response;
        }

        if (failure) {
            response.error = failure.message();
            return response;
        }

        return parse_http_response(raw);

    } catch (const boost::system::system_error& e) {
        response.error = std::string("TLS transport error: ") + e.what();
        return response;
    }
}

}  // namespace quotaprobe::status
