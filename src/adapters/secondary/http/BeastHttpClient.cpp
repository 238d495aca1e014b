#include "adapters/secondary/http/BeastHttpClient.hpp"
#include "adapters/secondary/http/Url.hpp"
#include "errors/EchoException.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <chrono>
#include <iostream>
#include <type_traits>

namespace echoexec::adapters::secondary {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

using errors::EchoException;
using errors::ErrorKind;
using ports::output::HttpResponse;
using ports::output::ResponseHandler;

namespace {

using TlsStream = beast::ssl_stream<beast::tcp_stream>;
using PlainStream = beast::tcp_stream;
using BeastRequest = http::request<http::string_body>;

BeastRequest toBeastRequest(const ports::output::HttpRequest& request, const Url& url) {
    http::verb verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        throw EchoException(ErrorKind::Http, "unsupported method '" + request.method + "'");
    }

    BeastRequest req{verb, url.target, 11};
    req.set(http::field::host, url.hostHeader());
    bool hasContentLength = false;
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
        if (beast::iequals(name, "Content-Length")) {
            hasContentLength = true;
        }
    }
    // Соединение на один обмен: пула нет
    req.keep_alive(false);
    req.body() = request.body;
    if (!hasContentLength) {
        req.prepare_payload();
    }
    return req;
}

/**
 * @brief Один HTTP обмен
 *
 * Живёт, пока в io_context есть его незавершённые операции
 * (shared_from_this в каждом обработчике).
 */
template <class Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
public:
    static constexpr bool kTls = std::is_same_v<Stream, TlsStream>;
    static constexpr std::chrono::seconds kShutdownTimeout{5};

    template <class... StreamArgs>
    Session(
        net::io_context& ioContext,
        Url url,
        BeastRequest request,
        ResponseHandler handler,
        bool verifyPeer,
        StreamArgs&... streamArgs
    ) : resolver_(net::make_strand(ioContext))
      , stream_(resolver_.get_executor(), streamArgs...)
      , url_(std::move(url))
      , request_(std::move(request))
      , handler_(std::move(handler))
      , verifyPeer_(verifyPeer)
    {}

    void start() {
        if constexpr (kTls) {
            // SNI не передаёт IP адреса
            boost::system::error_code addressError;
            net::ip::make_address(url_.host, addressError);
            if (addressError && !SSL_set_tlsext_host_name(stream_.native_handle(), url_.host.c_str())) {
                boost::system::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                fail(ErrorKind::Tls, "set SNI host name", ec);
                return;
            }
            if (verifyPeer_) {
                stream_.set_verify_callback(ssl::host_name_verification(url_.host));
            }
        }

        resolver_.async_resolve(
            url_.host,
            url_.port,
            beast::bind_front_handler(&Session::onResolve, this->shared_from_this())
        );
    }

private:
    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            return fail(ErrorKind::Transport, "resolve " + url_.host, ec);
        }

        beast::get_lowest_layer(stream_).async_connect(
            results,
            beast::bind_front_handler(&Session::onConnect, this->shared_from_this())
        );
    }

    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) {
            return fail(ErrorKind::Transport, "connect " + url_.hostHeader(), ec);
        }

        if constexpr (kTls) {
            stream_.async_handshake(
                ssl::stream_base::client,
                beast::bind_front_handler(&Session::onHandshake, this->shared_from_this())
            );
        } else {
            write();
        }
    }

    void onHandshake(beast::error_code ec) {
        if (ec) {
            return fail(ErrorKind::Tls, "handshake with " + url_.host, ec);
        }
        write();
    }

    void write() {
        http::async_write(
            stream_,
            request_,
            beast::bind_front_handler(&Session::onWrite, this->shared_from_this())
        );
    }

    void onWrite(beast::error_code ec, std::size_t) {
        if (ec) {
            return fail(ErrorKind::Transport, "write request", ec);
        }

        http::async_read_header(
            stream_,
            buffer_,
            parser_,
            beast::bind_front_handler(&Session::onReadHeader, this->shared_from_this())
        );
    }

    void onReadHeader(beast::error_code ec, std::size_t) {
        if (ec) {
            // http::error - ответ не разобран, остальное - ошибка чтения сокета
            ErrorKind kind = ec.category() == http::make_error_code(http::error::end_of_stream).category()
                ? ErrorKind::Http
                : ErrorKind::Io;
            return fail(kind, "read response", ec);
        }

        // Статус известен до чтения тела и попадает в результат даже при ошибке тела
        result_.status = static_cast<int>(parser_.get().result_int());
        result_.reason = std::string(parser_.get().reason());

        if (parser_.is_done()) {
            return onReadBody({}, 0);
        }

        http::async_read(
            stream_,
            buffer_,
            parser_,
            beast::bind_front_handler(&Session::onReadBody, this->shared_from_this())
        );
    }

    void onReadBody(beast::error_code ec, std::size_t) {
        if (ec) {
            return fail(ErrorKind::Io, "read response body", ec);
        }

        result_.body = std::move(parser_.get().body());
        complete(nullptr);

        if constexpr (kTls) {
            // close_notify: результат уже отдан, ответ сервера не ждём дольше таймаута
            beast::get_lowest_layer(stream_).expires_after(kShutdownTimeout);
            stream_.async_shutdown(
                beast::bind_front_handler(&Session::onShutdown, this->shared_from_this())
            );
        } else {
            beast::error_code ignored;
            // not_connected здесь бывает, ответ уже получен
            stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
        }
    }

    void onShutdown(beast::error_code) {
        // eof, stream_truncated и таймаут после полного ответа ни на что не влияют
        beast::error_code ignored;
        beast::get_lowest_layer(stream_).socket().close(ignored);
    }

    void fail(ErrorKind kind, const std::string& operation, const beast::error_code& ec) {
        complete(std::make_exception_ptr(EchoException::fromErrorCode(kind, operation, ec)));
    }

    void complete(std::exception_ptr error) {
        auto handler = std::move(handler_);
        handler_ = nullptr;
        if (handler) {
            handler(error, std::move(result_));
        }
    }

    tcp::resolver resolver_;
    Stream stream_;
    Url url_;
    BeastRequest request_;
    ResponseHandler handler_;
    bool verifyPeer_;
    beast::flat_buffer buffer_;
    http::response_parser<http::string_body> parser_;
    HttpResponse result_;
};

} // namespace

BeastHttpClient::BeastHttpClient(
    net::io_context& ioContext,
    std::shared_ptr<settings::IDispatcherSettings> settings
) : ioContext_(ioContext)
  , settings_(std::move(settings))
  , sslContext_([]() {
        try {
            return ssl::context(ssl::context::tls_client);
        } catch (const boost::system::system_error& e) {
            throw EchoException::fromErrorCode(ErrorKind::Tls, "create ssl context", e.code());
        }
    }())
{
    try {
        sslContext_.set_default_verify_paths();
        if (!settings_->getCaFile().empty()) {
            sslContext_.load_verify_file(settings_->getCaFile());
        }
        sslContext_.set_verify_mode(settings_->getVerifyPeer() ? ssl::verify_peer : ssl::verify_none);
    } catch (const boost::system::system_error& e) {
        throw EchoException::fromErrorCode(ErrorKind::Tls, "configure ssl context", e.code());
    }

    std::cout << "[BeastHttpClient] Created, verify_peer=" << std::boolalpha
              << settings_->getVerifyPeer() << std::endl;
}

void BeastHttpClient::asyncSend(ports::output::HttpRequest request, ResponseHandler handler) {
    try {
        Url url = parseUrl(request.url);
        BeastRequest beastRequest = toBeastRequest(request, url);

        if (url.isTls()) {
            std::make_shared<Session<TlsStream>>(
                ioContext_, std::move(url), std::move(beastRequest), std::move(handler),
                settings_->getVerifyPeer(), sslContext_
            )->start();
        } else {
            std::make_shared<Session<PlainStream>>(
                ioContext_, std::move(url), std::move(beastRequest), std::move(handler),
                settings_->getVerifyPeer()
            )->start();
        }
    } catch (const EchoException&) {
        // Ошибка сборки запроса отдаётся через handler, как и сетевые
        net::post(ioContext_, [handler = std::move(handler), error = std::current_exception()]() {
            handler(error, HttpResponse{});
        });
    }
}

} // namespace echoexec::adapters::secondary
