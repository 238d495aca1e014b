#pragma once

#include "domain/Uuid.hpp"
#include "domain/enums/EventType.hpp"
#include "domain/enums/Response.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace echoexec::domain {

using MessageDetail = std::map<std::string, std::string>;

/**
 * @brief Echo событие
 *
 * Одна запись телеметрии для коллектора. Собирается через цепочку сеттеров:
 *
 * @example
 * ```cpp
 * Event event;
 * event.setRoutingKey("atlas-dev-promises")
 *      .setEventType(EventType::System)
 *      .setMessage("testing")
 *      .setTimestamp(196300801666);
 * ```
 *
 * Необязательные поля, равные std::nullopt, в JSON не попадают вовсе
 * (ни ключа, ни null).
 */
class Event {
public:
    Event() = default;

    // ============================================
    // ОБЯЗАТЕЛЬНЫЕ ПОЛЯ
    // ============================================

    /**
     * @brief Ключ маршрутизации
     *
     * Определяет приложение и станет индексом в ElasticSearch.
     * Формат: <группа>-<приложение>-<окружение>, символы [a-z0-9-].
     * Формат не проверяется.
     */
    Event& setRoutingKey(std::string routingKey);
    Event& setEventType(EventType eventType);

    /**
     * @brief Короткое сообщение, обычно одна строка
     *
     * Подробности кладутся в messageDetail.
     */
    Event& setMessage(std::string message);

    // ============================================
    // НЕОБЯЗАТЕЛЬНЫЕ ПОЛЯ
    // ============================================

    Event& setCorrelationId(std::optional<Uuid> correlationId);

    /**
     * @brief Время события, миллисекунды от epoch
     */
    Event& setTimestamp(std::optional<int64_t> timestamp);

    /**
     * @brief Произвольные пары ключ/значение
     */
    Event& setMessageDetail(std::optional<MessageDetail> messageDetail);

    Event& setHost(std::optional<std::string> host);
    Event& setApplicationVersion(std::optional<std::string> applicationVersion);
    Event& setDataCenter(std::optional<std::string> dataCenter);

    /// Хост клиента, если внешняя система обращается к нашей
    Event& setClientHostName(std::optional<std::string> clientHostName);
    /// Хост внешней системы, если мы обращаемся к ней
    Event& setDestinationHostName(std::optional<std::string> destinationHostName);
    /// Путь на внешней системе
    Event& setDestinationPath(std::optional<std::string> destinationPath);

    Event& setStartTimestamp(std::optional<uint64_t> startTimestamp);
    Event& setFinishTimestamp(std::optional<uint64_t> finishTimestamp);
    Event& setDuration(std::optional<uint64_t> duration);
    Event& setDurationInMs(std::optional<uint64_t> durationInMs);

    /// HTTP код ответа для PERFORMANCE событий
    Event& setResponseCode(std::optional<uint16_t> responseCode);
    Event& setResponse(std::optional<Response> response);

    // ============================================
    // ГЕТТЕРЫ
    // ============================================

    const std::string& routingKey() const { return routingKey_; }
    EventType eventType() const { return eventType_; }
    const std::string& message() const { return message_; }
    const std::optional<Uuid>& correlationId() const { return correlationId_; }
    const std::optional<int64_t>& timestamp() const { return timestamp_; }
    const std::optional<MessageDetail>& messageDetail() const { return messageDetail_; }
    const std::optional<std::string>& host() const { return host_; }
    const std::optional<std::string>& applicationVersion() const { return applicationVersion_; }
    const std::optional<std::string>& dataCenter() const { return dataCenter_; }
    const std::optional<std::string>& clientHostName() const { return clientHostName_; }
    const std::optional<std::string>& destinationHostName() const { return destinationHostName_; }
    const std::optional<std::string>& destinationPath() const { return destinationPath_; }
    const std::optional<uint64_t>& startTimestamp() const { return startTimestamp_; }
    const std::optional<uint64_t>& finishTimestamp() const { return finishTimestamp_; }
    const std::optional<uint64_t>& duration() const { return duration_; }
    const std::optional<uint64_t>& durationInMs() const { return durationInMs_; }
    const std::optional<uint16_t>& responseCode() const { return responseCode_; }
    const std::optional<Response>& response() const { return response_; }

    /**
     * @brief JSON объект в фиксированном порядке ключей
     */
    nlohmann::ordered_json toJson() const;

    bool operator==(const Event& other) const;
    bool operator!=(const Event& other) const { return !(*this == other); }

private:
    std::string routingKey_;
    EventType eventType_ = EventType::Info;
    std::string message_;
    std::optional<Uuid> correlationId_;
    std::optional<int64_t> timestamp_;
    std::optional<MessageDetail> messageDetail_;
    std::optional<std::string> host_;
    std::optional<std::string> applicationVersion_;
    std::optional<std::string> dataCenter_;
    std::optional<std::string> clientHostName_;
    std::optional<std::string> destinationHostName_;
    std::optional<std::string> destinationPath_;
    std::optional<uint64_t> startTimestamp_;
    std::optional<uint64_t> finishTimestamp_;
    std::optional<uint64_t> duration_;
    std::optional<uint64_t> durationInMs_;
    std::optional<uint16_t> responseCode_;
    std::optional<Response> response_;
};

} // namespace echoexec::domain
