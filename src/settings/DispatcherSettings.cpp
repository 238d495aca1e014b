#include "settings/DispatcherSettings.hpp"
#include "errors/EchoException.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <cstdlib>

namespace echoexec::settings {

namespace {

std::size_t parseThreadCount(const std::string& name, const std::string& value) {
    std::size_t pos = 0;
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(value, &pos);
    } catch (const std::exception&) {
        throw errors::EchoException(
            errors::ErrorKind::Var,
            name + "='" + value + "' is not a number",
            std::current_exception()
        );
    }
    if (pos != value.size() || parsed == 0 || value.front() == '-') {
        throw errors::EchoException(errors::ErrorKind::Var, name + "='" + value + "' must be a positive integer");
    }
    return static_cast<std::size_t>(parsed);
}

bool parseBool(const std::string& name, const std::string& value) {
    std::string lower = boost::algorithm::to_lower_copy(value);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    throw errors::EchoException(errors::ErrorKind::Var, name + "='" + value + "' is not a boolean");
}

} // namespace

DispatcherSettings::DispatcherSettings() {
    if (auto threads = readEnv("ECHO_WORKER_THREADS")) {
        workerThreads_ = parseThreadCount("ECHO_WORKER_THREADS", *threads);
    }
    if (auto verify = readEnv("ECHO_VERIFY_PEER")) {
        verifyPeer_ = parseBool("ECHO_VERIFY_PEER", *verify);
    }
    if (auto caFile = readEnv("ECHO_CA_FILE")) {
        caFile_ = *caFile;
    }
}

std::optional<std::string> readEnv(const std::string& name) {
    if (const char* value = std::getenv(name.c_str())) {
        return std::string(value);
    }
    return std::nullopt;
}

std::string requireEnv(const std::string& name) {
    auto value = readEnv(name);
    if (!value) {
        throw errors::EchoException(errors::ErrorKind::Var, "environment variable not found: " + name);
    }
    return *value;
}

} // namespace echoexec::settings
