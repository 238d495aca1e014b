#pragma once

#include "domain/CollectorUrl.hpp"
#include "domain/Event.hpp"
#include "ports/output/ILogger.hpp"
#include <cstddef>
#include <memory>
#include <vector>

namespace echoexec::domain {

/**
 * @brief Батч Echo событий для одной отправки
 *
 * Создаётся вызывающим кодом на каждую отправку. Dispatcher::submit()
 * копирует из него только события, URL и логгер, так что после возврата
 * из submit() Payload можно переиспользовать или уничтожить.
 */
class Payload {
public:
    Payload() = default;

    Payload& setUrl(CollectorUrl url) {
        url_ = url;
        return *this;
    }

    Payload& setEvents(std::vector<Event> events) {
        events_ = std::move(events);
        return *this;
    }

    Payload& addEvent(Event event) {
        events_.push_back(std::move(event));
        return *this;
    }

    /**
     * @brief Логгер для результата отправки (nullptr - без логов)
     */
    Payload& setLogger(ports::output::LoggerPtr logger) {
        logger_ = std::move(logger);
        return *this;
    }

    CollectorUrl url() const { return url_; }
    const std::vector<Event>& events() const { return events_; }
    const ports::output::LoggerPtr& logger() const { return logger_; }

    // Счётчики зарезервированы под повторную отправку, Dispatcher их не меняет
    std::size_t errorCount() const { return errorCount_; }
    std::size_t retryCount() const { return retryCount_; }

private:
    CollectorUrl url_ = CollectorUrl::Stage;
    std::vector<Event> events_;
    ports::output::LoggerPtr logger_;
    std::size_t errorCount_ = 0;
    std::size_t retryCount_ = 0;
};

} // namespace echoexec::domain
