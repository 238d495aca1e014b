#pragma once

#include "domain/Payload.hpp"

namespace echoexec::ports::input {

/**
 * @brief Интерфейс отправки Echo событий
 *
 * Input Port. Реализуется application::Dispatcher.
 */
class IDispatcher {
public:
    virtual ~IDispatcher() = default;

    /**
     * @brief Поставить батч на отправку и сразу вернуться
     *
     * @param payload Батч событий, адрес коллектора и логгер
     *
     * @throws errors::EchoException (ErrorKind::Serialization) если события не сериализуются,
     *         в этом случае отправка не планируется
     *
     * @note Результат доставки сообщается только в логгер payload
     */
    virtual void submit(const domain::Payload& payload) = 0;
};

} // namespace echoexec::ports::input
