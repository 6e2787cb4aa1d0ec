#include <gtest/gtest.h>

#include "ScriptedTransport.hpp"
#include "TestDoubles.hpp"
#include "tickhttp.hpp"

static const char* OK_HELLO_HEADER =
    "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\n";
static const char* OK_CHUNKED_HEADER =
    "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n";

// Runs an action on the pool from inside on_complete.
class ReentrantHandler : public RecordingHandler {
   public:
    ReentrantHandler()
        : pool(NULL), cancel_target(NULL), follow_up(NULL), sent(NULL) {}

    void on_complete(Request* request, codes::TextStatus status) {
        RecordingHandler::on_complete(request, status);
        if (cancel_target != NULL) {
            Request* target = cancel_target;
            cancel_target = NULL;
            EXPECT_TRUE(pool->cancel(target));
        }
        if (follow_up != NULL) {
            const RequestSettings* next = follow_up;
            follow_up = NULL;
            sent = pool->send(*next);
        }
    }

    RequestPool* pool;
    Request* cancel_target;
    const RequestSettings* follow_up;
    Request* sent;
};

class RequestPoolTest : public ::testing::Test {
   protected:
    RequestPoolTest() : pool(&ticks, &factory) {
        settings.url_ = "http://example.com/";
        settings.handler_ = &handler;
    }

    // Records outlive the transports that write to them
    TransportRecord first;
    TransportRecord second;
    FakeTickSource ticks;
    ScriptedTransportFactory factory;
    RequestPool pool;
    RequestSettings settings;
    RecordingHandler handler;
};

TEST_F(RequestPoolTest, SubscribesWhileRequestsAreActive) {
    factory.add(OK_HELLO_HEADER, &first)->then_data("hel").then_data("lo");

    EXPECT_FALSE(pool.is_subscribed());
    Request* request = pool.send(settings);
    ASSERT_TRUE(request != NULL);
    EXPECT_TRUE(pool.contains(request));
    EXPECT_TRUE(pool.is_subscribed());
    EXPECT_EQ(ticks.subscribes, 1);

    EXPECT_TRUE(ticks.tick());
    EXPECT_EQ(pool.get_active_request_count(), 1u);
    EXPECT_EQ(ticks.subscribes, 1);
    EXPECT_EQ(ticks.unsubscribes, 0);

    EXPECT_TRUE(ticks.tick());
    EXPECT_EQ(pool.get_active_request_count(), 0u);
    EXPECT_FALSE(pool.is_subscribed());
    EXPECT_EQ(ticks.unsubscribes, 1);
    EXPECT_EQ(handler.decoded.text_, "hello");

    EXPECT_FALSE(ticks.tick());
}

TEST_F(RequestPoolTest, SecondRequestDoesNotResubscribe) {
    factory.add(OK_HELLO_HEADER, &first);
    factory.add(OK_HELLO_HEADER, &second);

    pool.send(settings);
    pool.send(settings);

    EXPECT_EQ(pool.get_active_request_count(), 2u);
    EXPECT_EQ(ticks.subscribes, 1);
}

TEST_F(RequestPoolTest, ReadsEveryRequestOncePerTick) {
    factory.add(OK_HELLO_HEADER, &first)->then_data("h");
    factory.add(OK_HELLO_HEADER, &second)->then_data("h");
    pool.send(settings);
    pool.send(settings);

    ticks.tick();
    EXPECT_EQ(first.body_reads, 1);
    EXPECT_EQ(second.body_reads, 1);

    ticks.tick();
    EXPECT_EQ(first.body_reads, 2);
    EXPECT_EQ(second.body_reads, 2);
}

TEST_F(RequestPoolTest, InterleavedChunkedBodiesStaySeparate) {
    // Fragments split inside chunk data and inside size lines
    factory.add(OK_CHUNKED_HEADER, &first)
        ->then_data("4\r\nWi")
        .then_data("ki\r\n5\r")
        .then_data("\npedia\r\n0\r\n\r\n");
    factory.add(OK_CHUNKED_HEADER, &second)
        ->then_data("7\r\nMoz")
        .then_timeout()
        .then_data("illa\r\n3")
        .then_data("\r\nDev\r\n0\r\n\r\n");

    RecordingHandler other;
    ASSERT_TRUE(pool.send(settings) != NULL);
    settings.handler_ = &other;
    ASSERT_TRUE(pool.send(settings) != NULL);

    ticks.tick();
    ticks.tick();
    EXPECT_TRUE(handler.events.empty());
    EXPECT_TRUE(other.events.empty());

    ticks.tick();
    EXPECT_EQ(handler.decoded.text_, "Wikipedia");
    ASSERT_EQ(handler.events.size(), 2u);
    EXPECT_EQ(handler.events[0], "success");
    EXPECT_EQ(handler.success_status, codes::STATUS_NONE);
    EXPECT_TRUE(other.events.empty());
    EXPECT_EQ(pool.get_active_request_count(), 1u);

    ticks.tick();
    EXPECT_EQ(other.decoded.text_, "MozillaDev");
    ASSERT_EQ(other.events.size(), 2u);
    EXPECT_EQ(other.events[0], "success");
    EXPECT_EQ(other.success_status, codes::STATUS_NONE);
    EXPECT_EQ(handler.decoded.text_, "Wikipedia");
    EXPECT_EQ(first.body_reads, 3);
    EXPECT_EQ(second.body_reads, 4);
    EXPECT_EQ(pool.get_active_request_count(), 0u);
    EXPECT_FALSE(pool.is_subscribed());
}

TEST_F(RequestPoolTest, RequestFinishedDuringSetupIsNotPooled) {
    // No transport queued: the connection is refused
    EXPECT_TRUE(pool.send(settings) == NULL);
    EXPECT_EQ(pool.get_active_request_count(), 0u);
    EXPECT_EQ(ticks.subscribes, 0);
    ASSERT_EQ(handler.events.size(), 2u);
    EXPECT_EQ(handler.error, "connection refused");

    TransportRecord record;
    factory.add("HTTP/1.1 204 No Content\r\n\r\n", &record);
    EXPECT_TRUE(pool.send(settings) == NULL);
    EXPECT_EQ(handler.events.back(), "complete");
    EXPECT_EQ(ticks.subscribes, 0);
}

TEST_F(RequestPoolTest, CancelAbortsAndEvicts) {
    TransportRecord record;
    factory.add(OK_HELLO_HEADER, &record);
    Request* request = pool.send(settings);
    ASSERT_TRUE(request != NULL);

    EXPECT_TRUE(pool.cancel(request));
    EXPECT_EQ(pool.get_active_request_count(), 0u);
    EXPECT_EQ(handler.error_status, codes::STATUS_ABORTED);
    EXPECT_EQ(ticks.unsubscribes, 1);
    EXPECT_TRUE(record.destroyed);

    EXPECT_FALSE(pool.cancel(request));
}

TEST_F(RequestPoolTest, CancelAllAbortsEveryRequest) {
    factory.add(OK_HELLO_HEADER, &first);
    factory.add(OK_HELLO_HEADER, &second);
    pool.send(settings);
    pool.send(settings);

    pool.cancel_all();

    EXPECT_EQ(pool.get_active_request_count(), 0u);
    EXPECT_EQ(handler.events.size(), 4u);
    EXPECT_TRUE(first.destroyed);
    EXPECT_TRUE(second.destroyed);
    EXPECT_FALSE(pool.is_subscribed());
}

TEST_F(RequestPoolTest, RequestCancelledFromCallbackIsNotRead) {
    ReentrantHandler reentrant;
    reentrant.pool = &pool;
    settings.handler_ = &reentrant;

    factory.add(OK_HELLO_HEADER, &first)->then_data("hello");
    factory.add(OK_HELLO_HEADER, &second)->then_data("hello");
    pool.send(settings);
    reentrant.cancel_target = pool.send(settings);
    ASSERT_TRUE(reentrant.cancel_target != NULL);

    ticks.tick();

    EXPECT_EQ(first.body_reads, 1);
    EXPECT_EQ(second.body_reads, 0);
    EXPECT_TRUE(second.destroyed);
    EXPECT_EQ(pool.get_active_request_count(), 0u);
    EXPECT_EQ(ticks.unsubscribes, 1);
    ASSERT_EQ(reentrant.events.size(), 4u);
    EXPECT_EQ(reentrant.events[2], "error");
    EXPECT_EQ(reentrant.error_status, codes::STATUS_ABORTED);
}

TEST_F(RequestPoolTest, RequestSentFromCallbackWaitsForNextTick) {
    ReentrantHandler reentrant;
    reentrant.pool = &pool;
    settings.handler_ = &reentrant;

    RequestSettings follow_up = settings;
    follow_up.handler_ = &handler;
    reentrant.follow_up = &follow_up;

    factory.add(OK_HELLO_HEADER, &first)->then_data("hello");
    factory.add(OK_HELLO_HEADER, &second)->then_data("hello");
    pool.send(settings);

    ticks.tick();
    ASSERT_TRUE(reentrant.sent != NULL);
    EXPECT_EQ(second.body_reads, 0);
    EXPECT_EQ(pool.get_active_request_count(), 1u);
    EXPECT_TRUE(pool.is_subscribed());
    EXPECT_EQ(ticks.unsubscribes, 0);

    ticks.tick();
    EXPECT_EQ(second.body_reads, 1);
    EXPECT_EQ(handler.decoded.text_, "hello");
    EXPECT_FALSE(pool.is_subscribed());
}

TEST_F(RequestPoolTest, SilentServerFailsAfterRetryLimit) {
    TransportRecord record;
    factory.add(OK_HELLO_HEADER, &record);
    pool.send(settings);

    int tick_count = 0;
    while (ticks.tick()) {
        tick_count++;
    }

    EXPECT_EQ(tick_count, http_limits::MAX_RETRIES);
    EXPECT_EQ(record.body_reads, http_limits::MAX_RETRIES);
    EXPECT_EQ(handler.error, "timeout");
}

TEST_F(RequestPoolTest, DestructorUnsubscribesAndDeletesRequests) {
    FakeTickSource source;
    TransportRecord record;
    {
        RequestPool scoped(&source, &factory);
        factory.add(OK_HELLO_HEADER, &record);
        scoped.send(settings);
        EXPECT_EQ(source.subscribes, 1);
    }
    EXPECT_EQ(source.unsubscribes, 1);
    EXPECT_TRUE(record.destroyed);
}

// Unsubscribes itself after a number of ticks.
class CountingListener : public ATickListener {
   public:
    CountingListener(IdleLoop* loop, int limit, bool shutdown)
        : loop_(loop), limit_(limit), shutdown_(shutdown), ticks(0) {}

    void on_tick() {
        ticks++;
        if (ticks < limit_) {
            return;
        }
        if (shutdown_) {
            loop_->shutdown();
        } else {
            loop_->unsubscribe(this);
        }
    }

   private:
    IdleLoop* loop_;
    int limit_;
    bool shutdown_;

   public:
    int ticks;
};

TEST(IdleLoopTest, RunsUntilNoListenerIsLeft) {
    IdleLoop loop(1);
    CountingListener listener(&loop, 3, false);
    loop.subscribe(&listener);
    loop.subscribe(&listener);
    EXPECT_EQ(loop.get_listener_count(), 1u);

    EXPECT_EQ(loop.run(), 3u);
    EXPECT_EQ(listener.ticks, 3);
    EXPECT_EQ(loop.get_listener_count(), 0u);
}

TEST(IdleLoopTest, ShutdownStopsLoop) {
    IdleLoop loop(1);
    CountingListener listener(&loop, 2, true);
    loop.subscribe(&listener);

    EXPECT_EQ(loop.run(), 2u);
    EXPECT_EQ(loop.get_listener_count(), 1u);
}

TEST(IdleLoopTest, FallsBackToDefaultInterval) {
    IdleLoop loop(0);
    EXPECT_EQ(loop.get_tick_interval(), http_limits::TICK_INTERVAL_MS);
    EXPECT_EQ(loop.run(), 0u);
}

TEST(IdleLoopTest, DrivesRequestPoolToCompletion) {
    TransportRecord record;
    IdleLoop loop(1);
    ScriptedTransportFactory factory;
    RequestPool pool(&loop, &factory);
    RecordingHandler handler;
    factory.add(OK_HELLO_HEADER, &record)->then_data("hel").then_data("lo");

    RequestSettings settings;
    settings.url_ = "http://example.com/";
    settings.handler_ = &handler;
    ASSERT_TRUE(pool.send(settings) != NULL);
    EXPECT_EQ(loop.get_listener_count(), 1u);

    EXPECT_EQ(loop.run(), 2u);
    EXPECT_EQ(handler.decoded.text_, "hello");
    EXPECT_EQ(loop.get_listener_count(), 0u);
}
