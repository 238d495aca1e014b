#pragma once

#include <string>

namespace echoexec::domain {

/**
 * @brief Адрес Echo коллектора
 *
 * Закрытый набор: произвольный URL в Payload передать нельзя.
 */
enum class CollectorUrl {
    Stage,  ///< https://echocollector-stage.kroger.com/echo/messages
    Prod    ///< https://echocollector.kroger.com/echo/messages
};

inline std::string toString(CollectorUrl url) {
    switch (url) {
        case CollectorUrl::Prod: return "https://echocollector.kroger.com/echo/messages";
        case CollectorUrl::Stage:
        default: return "https://echocollector-stage.kroger.com/echo/messages";
    }
}

} // namespace echoexec::domain
