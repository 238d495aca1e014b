#pragma once

#include "settings/IDispatcherSettings.hpp"
#include <optional>
#include <string>

namespace echoexec::settings {

/**
 * @brief Настройки диспетчера
 *
 * Читает из ENV:
 * - ECHO_WORKER_THREADS (default: 4)
 * - ECHO_VERIFY_PEER (default: true)
 * - ECHO_CA_FILE (default: "")
 *
 * @throws errors::EchoException (ErrorKind::Var) при некорректном значении
 */
class DispatcherSettings : public IDispatcherSettings {
public:
    static constexpr std::size_t kDefaultWorkerThreads = 4;

    DispatcherSettings();

    std::size_t getWorkerThreads() const override { return workerThreads_; }
    bool getVerifyPeer() const override { return verifyPeer_; }
    std::string getCaFile() const override { return caFile_; }

private:
    std::size_t workerThreads_ = kDefaultWorkerThreads;
    bool verifyPeer_ = true;
    std::string caFile_;
};

/**
 * @brief Прочитать переменную окружения
 * @return значение или std::nullopt, если переменная не задана
 */
std::optional<std::string> readEnv(const std::string& name);

/**
 * @brief Прочитать обязательную переменную окружения
 * @throws errors::EchoException (ErrorKind::Var) если переменная не задана
 */
std::string requireEnv(const std::string& name);

} // namespace echoexec::settings
