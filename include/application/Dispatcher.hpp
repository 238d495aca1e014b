#pragma once

#include "domain/Event.hpp"
#include "ports/input/IDispatcher.hpp"
#include "ports/output/IHttpClient.hpp"
#include "settings/IDispatcherSettings.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace echoexec::application {

/**
 * @brief Асинхронный диспетчер Echo событий
 *
 * Владеет io_context с пулом worker threads и одним HTTP клиентом,
 * общими для всех отправок. submit() сериализует события в вызывающем
 * потоке, ставит обмен в io_context и сразу возвращается
 * ("отправил и забыл").
 *
 * @example
 * ```cpp
 * Dispatcher dispatcher;
 *
 * Event event;
 * event.setRoutingKey("atlas-dev-promises").setMessage("hello");
 *
 * Payload payload;
 * payload.setUrl(CollectorUrl::Prod)
 *        .addEvent(event)
 *        .setLogger(std::make_shared<ConsoleLogger>("echo"));
 *
 * dispatcher.submit(payload);
 * ```
 *
 * Порядок доставки между разными submit() не гарантируется.
 * Thread-safe: да
 */
class Dispatcher : public ports::input::IDispatcher {
public:
    /**
     * @brief Фабрика HTTP клиента, привязанного к io_context диспетчера
     */
    using HttpClientFactory =
        std::function<std::shared_ptr<ports::output::IHttpClient>(boost::asio::io_context&)>;

    /**
     * @brief Настройки из окружения, BeastHttpClient
     * @throws errors::EchoException при ошибке настройки TLS или запуска потоков
     */
    Dispatcher();

    explicit Dispatcher(std::shared_ptr<settings::IDispatcherSettings> settings);

    Dispatcher(
        std::shared_ptr<settings::IDispatcherSettings> settings,
        HttpClientFactory clientFactory
    );

    ~Dispatcher() override;

    // Non-copyable, non-movable
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void submit(const domain::Payload& payload) override;

    /**
     * @brief Перестать принимать отправки и дождаться текущих
     *
     * Повторный вызов ничего не делает. Вызывается из деструктора.
     * Из worker thread (например, из логгера) потоки не ждёт:
     * они отсоединяются и завершаются, доработав очередь io_context.
     *
     * @note Зависший сетевой обмен задержит shutdown: таймаутов нет
     */
    void shutdown();

    bool isRunning() const { return running_.load(); }

    std::size_t workerCount() const { return workers_.size(); }

    /**
     * @brief JSON массив событий
     * @throws errors::EchoException (ErrorKind::Serialization)
     */
    static std::string serializeEvents(const std::vector<domain::Event>& events);

private:
    void startWorkers();
    static void runWorker(const std::shared_ptr<boost::asio::io_context>& ioContext);

    std::shared_ptr<settings::IDispatcherSettings> settings_;
    // Каждый worker держит свою ссылку: поток, отсоединённый в shutdown(),
    // может пережить Dispatcher
    std::shared_ptr<boost::asio::io_context> ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    std::shared_ptr<ports::output::IHttpClient> client_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    mutable std::shared_mutex lifecycleMutex_;
};

} // namespace echoexec::application
