#include "application/CollectorExchange.hpp"
#include "application/UserAgent.hpp"
#include "utils/Utf8.hpp"

namespace echoexec::application {

using errors::EchoException;
using errors::ErrorKind;
using ports::output::HttpRequest;
using ports::output::HttpResponse;

CollectorExchange::CollectorExchange(
    std::shared_ptr<ports::output::IHttpClient> client,
    ports::output::LoggerPtr logger,
    std::string url,
    std::string body
) : client_(std::move(client))
  , logger_(std::move(logger))
  , url_(std::move(url))
  , body_(std::move(body))
{}

HttpRequest CollectorExchange::buildRequest(const std::string& url, std::string body) {
    HttpRequest request;
    request.method = "POST";
    request.url = url;
    request.headers = {
        {"User-Agent", userAgent()},
        {"Content-Type", "application/json"},
        {"Content-Length", std::to_string(body.size())}
    };
    request.body = std::move(body);
    return request;
}

std::string CollectorExchange::classifyStatus(int status) {
    if (status >= 400 && status < 500) {
        return "Client";
    }
    if (status >= 500 && status < 600) {
        return "Server";
    }
    return "Unknown";
}

void CollectorExchange::run() {
    state_ = State::Sending;

    auto self = shared_from_this();
    try {
        client_->asyncSend(
            buildRequest(url_, std::move(body_)),
            [self](std::exception_ptr error, HttpResponse response) {
                self->onComplete(error, std::move(response));
            }
        );
    } catch (const std::exception& e) {
        ports::output::logError(logger_, std::string("Error sending Echo Payload: ") + e.what());
        finish(State::Failed, ErrorKind::Transport);
    }
}

std::optional<ErrorKind> CollectorExchange::failure() const {
    if (!hasFailure_.load()) {
        return std::nullopt;
    }
    return failure_.load();
}

void CollectorExchange::onComplete(std::exception_ptr error, HttpResponse response) {
    if (!error) {
        onResponse(response);
        return;
    }

    // Статус получен, тело нет
    if (response.status != 0 && !response.isSuccess()) {
        logStatus(response);
    }

    try {
        std::rethrow_exception(error);
    } catch (const EchoException& e) {
        ports::output::logError(logger_, std::string("Error sending Echo Payload: ") + e.what());
        finish(State::Failed, e.kind());
    } catch (const std::exception& e) {
        ports::output::logError(logger_, std::string("Error sending Echo Payload: ") + e.what());
        finish(State::Failed, ErrorKind::Message);
    }
}

void CollectorExchange::onResponse(const HttpResponse& response) {
    if (response.isSuccess()) {
        ports::output::logTrace(logger_, "Successfully sent payload to echo");
        finish(State::Succeeded);
        return;
    }

    logStatus(response);
    ports::output::logError(logger_, utils::toUtf8Lossy(response.body));
    finish(State::Failed, ErrorKind::Run);
}

void CollectorExchange::logStatus(const HttpResponse& response) {
    std::string status = std::to_string(response.status);
    if (!response.reason.empty()) {
        status += " " + response.reason;
    }

    ports::output::logError(
        logger_,
        classifyStatus(response.status) + " error sending Echo Payload: " + status
    );
}

void CollectorExchange::finish(State state, std::optional<ErrorKind> failure) {
    if (failure) {
        failure_ = *failure;
        hasFailure_ = true;
    }
    state_ = state;
}

} // namespace echoexec::application
