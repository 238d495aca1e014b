#pragma once

#include "errors/EchoException.hpp"
#include "ports/output/IHttpClient.hpp"
#include "ports/output/ILogger.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace echoexec::application {

/**
 * @brief Одна отправка батча в коллектор (фоновая задача)
 *
 * Жизненный цикл: Pending -> Sending -> {Succeeded | Failed}.
 *
 * - 2xx: TRACE "Successfully sent payload to echo"
 * - не-2xx: ERROR "<Client|Server|Unknown> error sending Echo Payload: <status>",
 *   затем ERROR с телом ответа, итог - ErrorKind::Run
 * - ошибка транспорта: ERROR с описанием, итог - kind исключения
 * - ошибка чтения тела не-2xx ответа: сначала строка со статусом,
 *   затем ERROR с описанием, итог - kind исключения (Io)
 *
 * Результат никому не возвращается: только логгер (если задан).
 * Исключения наружу не выходят.
 */
class CollectorExchange : public std::enable_shared_from_this<CollectorExchange> {
public:
    enum class State {
        Pending,
        Sending,
        Succeeded,
        Failed
    };

    CollectorExchange(
        std::shared_ptr<ports::output::IHttpClient> client,
        ports::output::LoggerPtr logger,
        std::string url,
        std::string body
    );

    /**
     * @brief Запустить обмен
     *
     * Возвращается сразу, ответ обрабатывается в callback клиента.
     */
    void run();

    State state() const { return state_.load(); }

    /**
     * @brief Категория ошибки, если обмен завершился неудачно
     */
    std::optional<errors::ErrorKind> failure() const;

    /**
     * @brief POST на url с User-Agent, Content-Type и Content-Length
     */
    static ports::output::HttpRequest buildRequest(const std::string& url, std::string body);

    /**
     * @brief "Client" для 4xx, "Server" для 5xx, иначе "Unknown"
     */
    static std::string classifyStatus(int status);

private:
    void onComplete(std::exception_ptr error, ports::output::HttpResponse response);
    void onResponse(const ports::output::HttpResponse& response);
    void logStatus(const ports::output::HttpResponse& response);
    void finish(State state, std::optional<errors::ErrorKind> failure = std::nullopt);

    std::shared_ptr<ports::output::IHttpClient> client_;
    ports::output::LoggerPtr logger_;
    std::string url_;
    std::string body_;

    std::atomic<State> state_{State::Pending};
    std::atomic<bool> hasFailure_{false};
    std::atomic<errors::ErrorKind> failure_{errors::ErrorKind::Run};
};

} // namespace echoexec::application
