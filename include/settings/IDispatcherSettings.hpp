#pragma once

#include <cstddef>
#include <string>

namespace echoexec::settings {

class IDispatcherSettings {
public:
    virtual ~IDispatcherSettings() = default;

    /// Количество потоков io_context (подсказка параллелизма коннектора)
    virtual std::size_t getWorkerThreads() const = 0;
    /// Проверять сертификат коллектора
    virtual bool getVerifyPeer() const = 0;
    /// Дополнительный CA bundle, пустая строка - только системные
    virtual std::string getCaFile() const = 0;
};

} // namespace echoexec::settings
