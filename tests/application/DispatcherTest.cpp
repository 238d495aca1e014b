#include <gtest/gtest.h>

#include "application/Dispatcher.hpp"
#include "errors/EchoException.hpp"
#include "mocks/FakeHttpClient.hpp"
#include "mocks/RecordingLogger.hpp"
#include "mocks/StubDispatcherSettings.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <future>
#include <thread>

using namespace echoexec;
using namespace echoexec::application;
using namespace echoexec::domain;
using echoexec::ports::output::LogLevel;

namespace {

/**
 * @brief Логгер, вызывающий callback из worker thread
 */
class CallbackLogger : public ports::output::ILogger {
public:
    explicit CallbackLogger(std::function<void()> callback) : callback_(std::move(callback)) {}

    void log(LogLevel, const std::string&) override {
        callback_();
    }

private:
    std::function<void()> callback_;
};

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class DispatcherTest : public ::testing::Test {
protected:
    std::unique_ptr<Dispatcher> makeDispatcher(std::size_t workers = 4) {
        auto settings = std::make_shared<tests::StubDispatcherSettings>(workers);
        return std::make_unique<Dispatcher>(settings, [this](boost::asio::io_context& io) {
            client_ = std::make_shared<tests::FakeHttpClient>(io);
            return client_;
        });
    }

    static Payload makePayload(CollectorUrl url, const std::string& message, ports::output::LoggerPtr logger = nullptr) {
        Event event;
        event.setRoutingKey("atlas-dev-promises").setEventType(EventType::System).setMessage(message);

        Payload payload;
        payload.setUrl(url).addEvent(event).setLogger(std::move(logger));
        return payload;
    }

    std::shared_ptr<tests::FakeHttpClient> client_;
};

// ============================================================================
// ТЕСТЫ: жизненный цикл
// ============================================================================

TEST_F(DispatcherTest, Start_WorkerCountFromSettings) {
    auto dispatcher = makeDispatcher(3);

    EXPECT_TRUE(dispatcher->isRunning());
    EXPECT_EQ(dispatcher->workerCount(), 3u);
}

TEST_F(DispatcherTest, NullClientFromFactory_Throws) {
    auto settings = std::make_shared<tests::StubDispatcherSettings>(1);

    try {
        Dispatcher dispatcher(settings, [](boost::asio::io_context&) {
            return std::shared_ptr<ports::output::IHttpClient>();
        });
        FAIL() << "Expected EchoException";
    } catch (const errors::EchoException& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::Message);
    }
}

TEST_F(DispatcherTest, Shutdown_Twice_IsNoOp) {
    auto dispatcher = makeDispatcher(2);

    dispatcher->shutdown();
    EXPECT_FALSE(dispatcher->isRunning());
    EXPECT_NO_THROW(dispatcher->shutdown());
}

TEST_F(DispatcherTest, SubmitAfterShutdown_Throws) {
    auto dispatcher = makeDispatcher(1);
    dispatcher->shutdown();

    try {
        dispatcher->submit(makePayload(CollectorUrl::Stage, "late"));
        FAIL() << "Expected EchoException";
    } catch (const errors::EchoException& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::Message);
    }
    EXPECT_TRUE(client_->requests().empty());
}

TEST_F(DispatcherTest, Shutdown_DrainsSubmitted) {
    auto dispatcher = makeDispatcher(2);
    for (int i = 0; i < 20; ++i) {
        dispatcher->submit(makePayload(CollectorUrl::Stage, "drain " + std::to_string(i)));
    }

    dispatcher->shutdown();

    EXPECT_EQ(client_->requests().size(), 20u);
}

TEST_F(DispatcherTest, ShutdownFromLogger_ThenDestroyOnMainThread) {
    auto dispatcher = makeDispatcher(2);
    std::promise<void> stopped;
    auto stoppedFuture = stopped.get_future();

    auto logger = std::make_shared<CallbackLogger>([&]() {
        dispatcher->shutdown();
        stopped.set_value();
    });
    dispatcher->submit(makePayload(CollectorUrl::Stage, "stop from worker", logger));

    ASSERT_EQ(stoppedFuture.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_FALSE(dispatcher->isRunning());
    EXPECT_THROW(dispatcher->submit(makePayload(CollectorUrl::Stage, "late")), errors::EchoException);

    EXPECT_NO_THROW(dispatcher.reset());
    EXPECT_EQ(client_->requests().size(), 1u);
}

TEST_F(DispatcherTest, LastOwnerReleasedOnWorker_DestroysSafely) {
    std::shared_ptr<Dispatcher> owner(makeDispatcher(2));
    std::promise<void> release;
    auto releaseFuture = release.get_future().share();
    std::promise<void> destroyed;
    auto destroyedFuture = destroyed.get_future();

    auto logger = std::make_shared<CallbackLogger>([&owner, releaseFuture, &destroyed]() {
        releaseFuture.wait();
        // Деструктор Dispatcher выполняется в этом worker thread
        owner.reset();
        destroyed.set_value();
    });

    std::weak_ptr<Dispatcher> weak = owner;
    {
        auto local = owner;
        local->submit(makePayload(CollectorUrl::Stage, "destroy from worker", logger));
    }
    release.set_value();

    ASSERT_EQ(destroyedFuture.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(weak.expired());
    EXPECT_EQ(client_->requests().size(), 1u);
}

// ============================================================================
// ТЕСТЫ: submit
// ============================================================================

TEST_F(DispatcherTest, Submit_PostsJsonArrayToStage) {
    auto dispatcher = makeDispatcher();

    dispatcher->submit(makePayload(CollectorUrl::Stage, "testing"));

    ASSERT_TRUE(client_->waitForRequests(1));
    auto request = client_->requests()[0];
    EXPECT_EQ(request.method, "POST");
    EXPECT_EQ(request.url, "https://echocollector-stage.kroger.com/echo/messages");
    EXPECT_EQ(request.header("Content-Type"), "application/json");
    EXPECT_EQ(request.body,
        R"([{"routingKey":"atlas-dev-promises","type":"SYSTEM","message":"testing"}])");
}

TEST_F(DispatcherTest, Submit_ProdUrl) {
    auto dispatcher = makeDispatcher();

    dispatcher->submit(makePayload(CollectorUrl::Prod, "prod"));

    ASSERT_TRUE(client_->waitForRequests(1));
    EXPECT_EQ(client_->requests()[0].url, "https://echocollector.kroger.com/echo/messages");
}

TEST_F(DispatcherTest, Submit_EmptyBatch_PostsEmptyArray) {
    auto dispatcher = makeDispatcher();

    Payload payload;
    dispatcher->submit(payload);

    ASSERT_TRUE(client_->waitForRequests(1));
    EXPECT_EQ(client_->requests()[0].body, "[]");
}

TEST_F(DispatcherTest, Submit_EventsKeepOrder) {
    auto dispatcher = makeDispatcher();

    Payload payload;
    for (int i = 0; i < 5; ++i) {
        Event event;
        event.setMessage("m" + std::to_string(i));
        payload.addEvent(event);
    }
    dispatcher->submit(payload);

    ASSERT_TRUE(client_->waitForRequests(1));
    auto body = nlohmann::json::parse(client_->requests()[0].body);
    ASSERT_EQ(body.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(body[i]["message"].get<std::string>(), "m" + std::to_string(i));
    }
}

TEST_F(DispatcherTest, Submit_PayloadDroppedImmediately) {
    auto dispatcher = makeDispatcher();
    auto logger = std::make_shared<tests::RecordingLogger>();

    {
        auto payload = std::make_unique<Payload>(makePayload(CollectorUrl::Stage, "gone", logger));
        dispatcher->submit(*payload);
    }

    ASSERT_TRUE(logger->waitForCount(1));
    EXPECT_EQ(logger->count(LogLevel::Trace), 1u);
    ASSERT_EQ(client_->requests().size(), 1u);
    EXPECT_NE(client_->requests()[0].body.find("gone"), std::string::npos);
}

TEST_F(DispatcherTest, Submit_InvalidUtf8_SerializationError_NothingSent) {
    auto dispatcher = makeDispatcher();

    try {
        dispatcher->submit(makePayload(CollectorUrl::Stage, "bad\xFF"));
        FAIL() << "Expected EchoException";
    } catch (const errors::EchoException& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::Serialization);
    }

    dispatcher->shutdown();
    EXPECT_TRUE(client_->requests().empty());
}

TEST_F(DispatcherTest, Submit_ConcurrentFromManyThreads) {
    auto dispatcher = makeDispatcher();
    const int threads = 8;
    const int perThread = 25;

    std::vector<std::thread> submitters;
    for (int t = 0; t < threads; ++t) {
        submitters.emplace_back([&, t]() {
            for (int i = 0; i < perThread; ++i) {
                dispatcher->submit(makePayload(CollectorUrl::Stage, std::to_string(t) + ":" + std::to_string(i)));
            }
        });
    }
    for (auto& submitter : submitters) {
        submitter.join();
    }

    EXPECT_TRUE(client_->waitForRequests(threads * perThread));
    EXPECT_EQ(client_->requests().size(), static_cast<std::size_t>(threads * perThread));
}

// ============================================================================
// ТЕСТЫ: ошибки доставки не доходят до вызывающего
// ============================================================================

TEST_F(DispatcherTest, UnreachableCollector_SubmitDoesNotThrow_StaysUsable) {
    auto dispatcher = makeDispatcher();
    auto logger = std::make_shared<tests::RecordingLogger>();
    client_->failWith(errors::ErrorKind::Transport, "connect: Connection refused");

    EXPECT_NO_THROW(dispatcher->submit(makePayload(CollectorUrl::Stage, "first", logger)));
    ASSERT_TRUE(logger->waitForCount(1));
    EXPECT_EQ(logger->countContaining(LogLevel::Error, "Connection refused"), 1u);

    client_->respondWith(200);
    EXPECT_NO_THROW(dispatcher->submit(makePayload(CollectorUrl::Stage, "second", logger)));
    ASSERT_TRUE(logger->waitForCount(2));
    EXPECT_EQ(logger->count(LogLevel::Trace), 1u);
    EXPECT_TRUE(dispatcher->isRunning());
}

TEST_F(DispatcherTest, ServerError_LoggedTwice) {
    auto dispatcher = makeDispatcher();
    auto logger = std::make_shared<tests::RecordingLogger>();
    client_->respondWith(500, "oops", "Internal Server Error");

    dispatcher->submit(makePayload(CollectorUrl::Stage, "testing", logger));

    ASSERT_TRUE(logger->waitForCount(2));
    EXPECT_EQ(logger->count(LogLevel::Error), 2u);
    EXPECT_EQ(logger->countContaining(LogLevel::Error, "Server"), 1u);
    EXPECT_EQ(logger->countContaining(LogLevel::Error, "oops"), 1u);
}

// ============================================================================
// ТЕСТЫ: serializeEvents
// ============================================================================

TEST(DispatcherSerializeTest, ArrayOfEventObjects) {
    Event first;
    first.setMessage("a");
    Event second;
    second.setMessage("b").setResponseCode(uint16_t{200});

    auto json = nlohmann::json::parse(Dispatcher::serializeEvents({first, second}));

    ASSERT_TRUE(json.is_array());
    ASSERT_EQ(json.size(), 2u);
    EXPECT_EQ(json[1]["responseCode"].get<int>(), 200);
    EXPECT_FALSE(json[0].contains("responseCode"));
}
