#pragma once

#include <boost/system/error_code.hpp>
#include <exception>
#include <stdexcept>
#include <string>

namespace echoexec::errors {

/**
 * @brief Категория ошибки libechoexec
 *
 * Каждой внешней причине (сеть, TLS, JSON, окружение) соответствует
 * свой вариант, плюс отдельный Run для не-2xx ответа коллектора.
 */
enum class ErrorKind {
    Transport,      ///< resolve / connect / socket
    Http,           ///< не удалось собрать запрос или разобрать ответ
    Tls,            ///< SSL контекст или handshake
    Io,             ///< чтение тела ответа, файлы
    ParseUuid,      ///< некорректный UUID
    Serialization,  ///< события не сериализуются в JSON
    Message,        ///< произвольная строка
    Var,            ///< переменная окружения отсутствует или некорректна
    Run             ///< коллектор вернул не-2xx
};

/**
 * @brief Описание категории ошибки
 */
std::string describe(ErrorKind kind);

/**
 * @brief Исключение libechoexec
 *
 * what() имеет вид "libechoexec error: <описание категории>: <детали>".
 * Исходная причина (если есть) доступна через cause() для цепочки диагностики.
 */
class EchoException : public std::runtime_error {
public:
    EchoException(ErrorKind kind, const std::string& detail, std::exception_ptr cause = nullptr);

    /**
     * @brief Исключение из boost::system::error_code (Asio / Beast / SSL)
     */
    static EchoException fromErrorCode(
        ErrorKind kind,
        const std::string& operation,
        const boost::system::error_code& ec
    );

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& detail() const noexcept { return detail_; }
    std::exception_ptr cause() const noexcept { return cause_; }

private:
    ErrorKind kind_;
    std::string detail_;
    std::exception_ptr cause_;
};

} // namespace echoexec::errors
