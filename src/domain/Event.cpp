#include "domain/Event.hpp"
#include <tuple>

namespace echoexec::domain {

namespace {

template <typename T>
void putIfPresent(nlohmann::ordered_json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

} // namespace

Event& Event::setRoutingKey(std::string routingKey) {
    routingKey_ = std::move(routingKey);
    return *this;
}

Event& Event::setEventType(EventType eventType) {
    eventType_ = eventType;
    return *this;
}

Event& Event::setMessage(std::string message) {
    message_ = std::move(message);
    return *this;
}

Event& Event::setCorrelationId(std::optional<Uuid> correlationId) {
    correlationId_ = std::move(correlationId);
    return *this;
}

Event& Event::setTimestamp(std::optional<int64_t> timestamp) {
    timestamp_ = timestamp;
    return *this;
}

Event& Event::setMessageDetail(std::optional<MessageDetail> messageDetail) {
    messageDetail_ = std::move(messageDetail);
    return *this;
}

Event& Event::setHost(std::optional<std::string> host) {
    host_ = std::move(host);
    return *this;
}

Event& Event::setApplicationVersion(std::optional<std::string> applicationVersion) {
    applicationVersion_ = std::move(applicationVersion);
    return *this;
}

Event& Event::setDataCenter(std::optional<std::string> dataCenter) {
    dataCenter_ = std::move(dataCenter);
    return *this;
}

Event& Event::setClientHostName(std::optional<std::string> clientHostName) {
    clientHostName_ = std::move(clientHostName);
    return *this;
}

Event& Event::setDestinationHostName(std::optional<std::string> destinationHostName) {
    destinationHostName_ = std::move(destinationHostName);
    return *this;
}

Event& Event::setDestinationPath(std::optional<std::string> destinationPath) {
    destinationPath_ = std::move(destinationPath);
    return *this;
}

Event& Event::setStartTimestamp(std::optional<uint64_t> startTimestamp) {
    startTimestamp_ = startTimestamp;
    return *this;
}

Event& Event::setFinishTimestamp(std::optional<uint64_t> finishTimestamp) {
    finishTimestamp_ = finishTimestamp;
    return *this;
}

Event& Event::setDuration(std::optional<uint64_t> duration) {
    duration_ = duration;
    return *this;
}

Event& Event::setDurationInMs(std::optional<uint64_t> durationInMs) {
    durationInMs_ = durationInMs;
    return *this;
}

Event& Event::setResponseCode(std::optional<uint16_t> responseCode) {
    responseCode_ = responseCode;
    return *this;
}

Event& Event::setResponse(std::optional<Response> response) {
    response_ = response;
    return *this;
}

nlohmann::ordered_json Event::toJson() const {
    nlohmann::ordered_json j;
    j["routingKey"] = routingKey_;
    j["type"] = toString(eventType_);
    j["message"] = message_;

    if (correlationId_) {
        j["correlationId"] = correlationId_->toString();
    }
    putIfPresent(j, "timestamp", timestamp_);
    putIfPresent(j, "messageDetail", messageDetail_);
    putIfPresent(j, "host", host_);
    putIfPresent(j, "applicationVersion", applicationVersion_);
    putIfPresent(j, "dataCenter", dataCenter_);
    putIfPresent(j, "clientHostName", clientHostName_);
    putIfPresent(j, "destinationHostName", destinationHostName_);
    putIfPresent(j, "destinationPath", destinationPath_);
    putIfPresent(j, "startTimestamp", startTimestamp_);
    putIfPresent(j, "finishTimestamp", finishTimestamp_);
    putIfPresent(j, "duration", duration_);
    putIfPresent(j, "durationInMs", durationInMs_);
    putIfPresent(j, "responseCode", responseCode_);
    if (response_) {
        j["response"] = toString(*response_);
    }
    return j;
}

bool Event::operator==(const Event& other) const {
    auto fields = [](const Event& e) {
        return std::tie(
            e.routingKey_, e.eventType_, e.message_, e.correlationId_, e.timestamp_,
            e.messageDetail_, e.host_, e.applicationVersion_, e.dataCenter_,
            e.clientHostName_, e.destinationHostName_, e.destinationPath_,
            e.startTimestamp_, e.finishTimestamp_, e.duration_, e.durationInMs_,
            e.responseCode_, e.response_
        );
    };
    return fields(*this) == fields(other);
}

} // namespace echoexec::domain
