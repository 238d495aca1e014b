#include "application/Dispatcher.hpp"
#include "adapters/secondary/http/BeastHttpClient.hpp"
#include "application/CollectorExchange.hpp"
#include "errors/EchoException.hpp"
#include "settings/DispatcherSettings.hpp"

#include <boost/asio/post.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>
#include <mutex>
#include <system_error>

namespace echoexec::application {

using errors::EchoException;
using errors::ErrorKind;

namespace {

Dispatcher::HttpClientFactory beastClientFactory(std::shared_ptr<settings::IDispatcherSettings> settings) {
    return [settings](boost::asio::io_context& ioContext) {
        return std::make_shared<adapters::secondary::BeastHttpClient>(ioContext, settings);
    };
}

} // namespace

Dispatcher::Dispatcher()
    : Dispatcher(std::make_shared<settings::DispatcherSettings>())
{}

Dispatcher::Dispatcher(std::shared_ptr<settings::IDispatcherSettings> settings)
    : Dispatcher(settings, beastClientFactory(settings))
{}

Dispatcher::Dispatcher(
    std::shared_ptr<settings::IDispatcherSettings> settings,
    HttpClientFactory clientFactory
) : settings_(std::move(settings))
  , ioContext_(std::make_shared<boost::asio::io_context>(static_cast<int>(settings_->getWorkerThreads())))
  , workGuard_(boost::asio::make_work_guard(*ioContext_))
{
    client_ = clientFactory(*ioContext_);
    if (!client_) {
        throw EchoException(ErrorKind::Message, "http client factory returned null");
    }

    startWorkers();

    std::cout << "[Dispatcher] Started with " << workers_.size() << " workers" << std::endl;
}

Dispatcher::~Dispatcher() {
    shutdown();
}

void Dispatcher::startWorkers() {
    std::size_t count = settings_->getWorkerThreads();
    workers_.reserve(count);

    try {
        for (std::size_t i = 0; i < count; ++i) {
            workers_.emplace_back([ioContext = ioContext_]() { runWorker(ioContext); });
        }
    } catch (const std::system_error& e) {
        // Уже запущенные потоки нужно остановить: деструктор не вызовется
        workGuard_.reset();
        ioContext_->stop();
        for (auto& worker : workers_) {
            worker.join();
        }
        workers_.clear();
        throw EchoException(ErrorKind::Io, std::string("start worker thread: ") + e.what(), std::current_exception());
    }

    running_ = true;
}

void Dispatcher::runWorker(const std::shared_ptr<boost::asio::io_context>& ioContext) {
    for (;;) {
        try {
            ioContext->run();
            return;
        } catch (const std::exception& e) {
            std::cerr << "[Dispatcher] Worker error: " << e.what() << std::endl;
        }
    }
}

std::string Dispatcher::serializeEvents(const std::vector<domain::Event>& events) {
    nlohmann::ordered_json array = nlohmann::ordered_json::array();
    for (const auto& event : events) {
        array.push_back(event.toJson());
    }

    try {
        return array.dump();
    } catch (const nlohmann::json::exception& e) {
        throw EchoException(ErrorKind::Serialization, e.what(), std::current_exception());
    }
}

void Dispatcher::submit(const domain::Payload& payload) {
    std::string body = serializeEvents(payload.events());

    // В фоновую задачу уходят только копии: Payload дальше не нужен
    auto client = client_;
    auto logger = payload.logger();
    std::string url = domain::toString(payload.url());

    std::shared_lock<std::shared_mutex> lock(lifecycleMutex_);
    if (!running_) {
        throw EchoException(ErrorKind::Message, "dispatcher is shut down");
    }

    boost::asio::post(*ioContext_, [client, logger, url = std::move(url), body = std::move(body)]() mutable {
        try {
            std::make_shared<CollectorExchange>(client, logger, std::move(url), std::move(body))->run();
        } catch (const std::exception& e) {
            ports::output::logError(logger, std::string("Error sending Echo Payload: ") + e.what());
        }
    });
}

void Dispatcher::shutdown() {
    {
        std::unique_lock<std::shared_mutex> lock(lifecycleMutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        workGuard_.reset();
    }

    // Из worker thread join невозможен: остальные потоки ждут завершения
    // текущего обработчика. Потоки отсоединяются и дорабатывают очередь сами,
    // io_context живёт, пока они держат на него ссылку
    bool onWorker = std::any_of(workers_.begin(), workers_.end(), [](const std::thread& worker) {
        return worker.get_id() == std::this_thread::get_id();
    });

    for (auto& worker : workers_) {
        if (!worker.joinable()) {
            continue;
        }
        if (onWorker) {
            worker.detach();
        } else {
            worker.join();
        }
    }

    std::cout << "[Dispatcher] Stopped" << std::endl;
}

} // namespace echoexec::application
