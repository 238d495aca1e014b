#pragma once

#include <string>

namespace echoexec::domain {

/**
 * @brief Тип Echo события
 *
 * - ERROR - нештатная ситуация, обработанная системой
 * - INFO - штатное действие
 * - PERFORMANCE - время выполнения действия
 * - TRACKING - корреляция двух и более событий
 * - SYSTEM - метрики клиентской машины (CPU, heap и т.п.)
 */
enum class EventType {
    Error,
    Info,
    Performance,
    Tracking,
    System
};

inline std::string toString(EventType type) {
    switch (type) {
        case EventType::Error: return "ERROR";
        case EventType::Info: return "INFO";
        case EventType::Performance: return "PERFORMANCE";
        case EventType::Tracking: return "TRACKING";
        case EventType::System: return "SYSTEM";
        default: return "INFO";
    }
}

} // namespace echoexec::domain
