#pragma once

#include <exception>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace echoexec::ports::output {

/**
 * @brief HTTP запрос к коллектору
 *
 * Заголовки хранятся в порядке добавления.
 */
struct HttpRequest {
    std::string method = "POST";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    /**
     * @brief Найти заголовок (без учёта регистра имени)
     * @return значение или пустая строка
     */
    std::string header(const std::string& name) const;
};

/**
 * @brief HTTP ответ коллектора
 */
struct HttpResponse {
    int status = 0;
    std::string reason;
    std::string body;

    bool isSuccess() const { return status >= 200 && status < 300; }
    bool isClientError() const { return status >= 400 && status < 500; }
    bool isServerError() const { return status >= 500 && status < 600; }
};

/**
 * @brief Callback завершения обмена
 *
 * Вызывается ровно один раз: либо error == nullptr и заполнен response,
 * либо error содержит errors::EchoException. Если ошибка случилась
 * после строки статуса (при чтении тела), response.status и reason
 * уже заполнены, иначе status == 0.
 */
using ResponseHandler = std::function<void(std::exception_ptr error, HttpResponse response)>;

/**
 * @brief Асинхронный HTTP клиент
 *
 * Output Port для отправки батча событий.
 *
 * Реализации:
 * - BeastHttpClient - Boost.Beast поверх io_context диспетчера
 * - в тестах - FakeHttpClient
 *
 * @note asyncSend не блокирует и может вызываться из любого потока
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual void asyncSend(HttpRequest request, ResponseHandler handler) = 0;
};

} // namespace echoexec::ports::output
