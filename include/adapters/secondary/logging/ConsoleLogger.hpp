#pragma once

#include "ports/output/ILogger.hpp"
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace echoexec::adapters::secondary {

/**
 * @brief Логгер в консоль
 *
 * Формат строки: "[name] LEVEL message".
 * TRACE/DEBUG/INFO пишутся в out, WARN/ERROR - в err.
 * Сообщения ниже minLevel отбрасываются.
 *
 * @example
 * ```cpp
 * auto logger = std::make_shared<ConsoleLogger>("echo", LogLevel::Debug);
 * payload.setLogger(logger);
 * ```
 *
 * Thread-safe: да
 */
class ConsoleLogger : public ports::output::ILogger {
public:
    explicit ConsoleLogger(
        std::string name,
        ports::output::LogLevel minLevel = ports::output::LogLevel::Trace,
        std::ostream& out = std::cout,
        std::ostream& err = std::cerr
    ) : name_(std::move(name))
      , minLevel_(minLevel)
      , out_(out)
      , err_(err)
    {}

    void log(ports::output::LogLevel level, const std::string& message) override {
        if (level < minLevel_) {
            return;
        }

        std::ostream& stream = level >= ports::output::LogLevel::Warn ? err_ : out_;

        std::lock_guard<std::mutex> lock(mutex_);
        stream << "[" << name_ << "] " << ports::output::toString(level) << " " << message << std::endl;
    }

    ports::output::LogLevel minLevel() const { return minLevel_; }

private:
    std::string name_;
    ports::output::LogLevel minLevel_;
    std::ostream& out_;
    std::ostream& err_;
    std::mutex mutex_;
};

} // namespace echoexec::adapters::secondary
