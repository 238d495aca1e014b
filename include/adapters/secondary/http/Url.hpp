#pragma once

#include <string>

namespace echoexec::adapters::secondary {

/**
 * @brief Разобранный URL коллектора
 */
struct Url {
    std::string scheme;   ///< "https" или "http"
    std::string host;
    std::string port;     ///< "443" / "80", если не указан явно
    std::string target;   ///< путь с query, минимум "/"

    bool isTls() const { return scheme == "https"; }

    /**
     * @brief Значение заголовка Host (порт только если нестандартный)
     */
    std::string hostHeader() const;
};

/**
 * @brief Разобрать scheme://host[:port][/target]
 * @throws errors::EchoException (ErrorKind::Http) для неподдерживаемой схемы или пустого хоста
 */
Url parseUrl(const std::string& text);

} // namespace echoexec::adapters::secondary
