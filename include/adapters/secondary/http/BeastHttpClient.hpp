#pragma once

#include "ports/output/IHttpClient.hpp"
#include "settings/IDispatcherSettings.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <memory>

namespace echoexec::adapters::secondary {

/**
 * @brief HTTP/HTTPS клиент на Boost.Beast
 *
 * Все операции выполняются асинхронно на io_context диспетчера.
 * На каждый запрос создаётся отдельная сессия:
 * resolve -> connect -> (TLS handshake) -> write -> read -> (TLS shutdown).
 *
 * Поддерживаются схемы https (SNI + проверка имени хоста) и http
 * (локальные коллекторы в тестах).
 *
 * Между запросами клиент состояния не хранит, asyncSend() можно
 * вызывать из любого потока.
 */
class BeastHttpClient : public ports::output::IHttpClient {
public:
    /**
     * @throws errors::EchoException (ErrorKind::Tls) если SSL контекст не настраивается
     */
    BeastHttpClient(
        boost::asio::io_context& ioContext,
        std::shared_ptr<settings::IDispatcherSettings> settings
    );

    void asyncSend(ports::output::HttpRequest request, ports::output::ResponseHandler handler) override;

private:
    boost::asio::io_context& ioContext_;
    std::shared_ptr<settings::IDispatcherSettings> settings_;
    boost::asio::ssl::context sslContext_;
};

} // namespace echoexec::adapters::secondary
