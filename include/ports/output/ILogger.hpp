#pragma once

#include <memory>
#include <string>

namespace echoexec::ports::output {

/**
 * @brief Уровень логирования
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error
};

inline std::string toString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        default: return "INFO";
    }
}

/**
 * @brief Интерфейс логгера
 *
 * Output Port, через который Dispatcher сообщает результат отправки.
 * Логгер опционален: пустой shared_ptr означает "не логировать",
 * поэтому вызывать его нужно через logTrace()/logError() и т.д.
 *
 * Реализации:
 * - ConsoleLogger - stdout/stderr
 * - в тестах - MockLogger / RecordingLogger
 *
 * @note Реализация должна быть потокобезопасной: вызывается из worker threads
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    void trace(const std::string& message) { log(LogLevel::Trace, message); }
    void debug(const std::string& message) { log(LogLevel::Debug, message); }
    void info(const std::string& message) { log(LogLevel::Info, message); }
    void warn(const std::string& message) { log(LogLevel::Warn, message); }
    void error(const std::string& message) { log(LogLevel::Error, message); }
};

using LoggerPtr = std::shared_ptr<ILogger>;

inline void logTo(const LoggerPtr& logger, LogLevel level, const std::string& message) {
    if (logger) {
        logger->log(level, message);
    }
}

inline void logTrace(const LoggerPtr& logger, const std::string& message) {
    logTo(logger, LogLevel::Trace, message);
}

inline void logDebug(const LoggerPtr& logger, const std::string& message) {
    logTo(logger, LogLevel::Debug, message);
}

inline void logInfo(const LoggerPtr& logger, const std::string& message) {
    logTo(logger, LogLevel::Info, message);
}

inline void logWarn(const LoggerPtr& logger, const std::string& message) {
    logTo(logger, LogLevel::Warn, message);
}

inline void logError(const LoggerPtr& logger, const std::string& message) {
    logTo(logger, LogLevel::Error, message);
}

} // namespace echoexec::ports::output
