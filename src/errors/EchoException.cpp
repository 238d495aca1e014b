#include "errors/EchoException.hpp"

namespace echoexec::errors {

namespace {

std::string formatMessage(ErrorKind kind, const std::string& detail) {
    std::string message = "libechoexec error: " + describe(kind);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

} // namespace

std::string describe(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transport: return "transport error";
        case ErrorKind::Http: return "http protocol error";
        case ErrorKind::Tls: return "tls error";
        case ErrorKind::Io: return "io error";
        case ErrorKind::ParseUuid: return "error parsing uuid";
        case ErrorKind::Serialization: return "json serialization error";
        case ErrorKind::Message: return "error";
        case ErrorKind::Var: return "environment variable error";
        case ErrorKind::Run: return "An error has occurred during run";
        default: return "unknown error";
    }
}

EchoException::EchoException(ErrorKind kind, const std::string& detail, std::exception_ptr cause)
    : std::runtime_error(formatMessage(kind, detail))
    , kind_(kind)
    , detail_(detail)
    , cause_(std::move(cause))
{}

EchoException EchoException::fromErrorCode(
    ErrorKind kind,
    const std::string& operation,
    const boost::system::error_code& ec
) {
    return EchoException(kind, operation + ": " + ec.message() + " (" + ec.category().name() + ":" + std::to_string(ec.value()) + ")");
}

} // namespace echoexec::errors
