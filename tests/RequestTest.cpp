#include <gtest/gtest.h>

#include "ScriptedTransport.hpp"
#include "TestDoubles.hpp"
#include "tickhttp.hpp"

static const char* OK_HELLO_HEADER =
    "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\n";
static const char* CHUNKED_HEADER =
    "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n";

class RequestTest : public ::testing::Test {
   protected:
    RequestTest() {
        settings.url_ = "http://example.com/index";
        settings.user_agent_ = "test-agent";
        settings.handler_ = &handler;
    }

    // Reads until the request reports completion, at most max_reads times.
    int drive(Request& request, int max_reads) {
        int reads = 0;
        while (reads < max_reads && request.read_content()) {
            reads++;
        }
        return reads + 1;
    }

    TransportRecord record;
    RequestSettings settings;
    RecordingHandler handler;
    ScriptedTransportFactory factory;
};

TEST_F(RequestTest, CompletesContentLengthBodyInOneRead) {
    factory.add(OK_HELLO_HEADER, &record)->then_data("hello");
    Request request(settings, &factory);

    ASSERT_TRUE(request.start());
    EXPECT_EQ(request.state(), codes::REQ_READING_BODY);
    EXPECT_TRUE(handler.events.empty());

    EXPECT_FALSE(request.read_content());

    ASSERT_EQ(handler.events.size(), 2u);
    EXPECT_EQ(handler.events[0], "success");
    EXPECT_EQ(handler.events[1], "complete");
    EXPECT_EQ(handler.decoded.text_, "hello");
    EXPECT_EQ(handler.success_status, codes::STATUS_NONE);
    EXPECT_EQ(handler.complete_status, codes::STATUS_NONE);
    EXPECT_TRUE(request.is_complete());
    EXPECT_EQ(request.state(), codes::REQ_DONE);
}

TEST_F(RequestTest, AccumulatesBodyAcrossReads) {
    factory.add(OK_HELLO_HEADER, &record)->then_data("hel").then_data("lo");
    Request request(settings, &factory);
    ASSERT_TRUE(request.start());

    EXPECT_TRUE(request.read_content());
    EXPECT_EQ(request.length(), 3u);
    EXPECT_TRUE(handler.events.empty());

    EXPECT_FALSE(request.read_content());
    EXPECT_EQ(request.length(), 5u);
    EXPECT_EQ(handler.decoded.text_, "hello");
    EXPECT_EQ(request.contents().size(), 2u);
}

TEST_F(RequestTest, DecodesChunkedBody) {
    factory.add(CHUNKED_HEADER, &record)
        ->then_data("4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n");
    Request request(settings, &factory);
    ASSERT_TRUE(request.start());

    EXPECT_FALSE(request.read_content());
    EXPECT_EQ(handler.decoded.text_, "Wikipedia");
    EXPECT_EQ(request.length(), 9u);
}

TEST_F(RequestTest, DecodesChunkedBodySplitAcrossReads) {
    factory.add(CHUNKED_HEADER, &record)
        ->then_data("4\r\nWi")
        .then_data("ki\r\n5")
        .then_data("\r\npedia\r\n0\r")
        .then_data("\n\r\n");
    Request request(settings, &factory);
    ASSERT_TRUE(request.start());

    EXPECT_TRUE(request.read_content());
    EXPECT_EQ(request.length(), 2u);
    EXPECT_TRUE(request.read_content());
    EXPECT_EQ(request.length(), 4u);
    EXPECT_TRUE(request.read_content());
    EXPECT_EQ(request.length(), 9u);
    EXPECT_FALSE(request.read_content());

    ASSERT_EQ(handler.events.size(), 2u);
    EXPECT_EQ(handler.events[0], "success");
    EXPECT_EQ(handler.decoded.text_, "Wikipedia");
}

TEST_F(RequestTest, FailsOnTenthConsecutiveTimeout) {
    factory.add(OK_HELLO_HEADER, &record);
    Request request(settings, &factory);
    ASSERT_TRUE(request.start());

    for (int i = 0; i < 9; ++i) {
        EXPECT_TRUE(request.read_content());
    }
    EXPECT_EQ(request.retries(), 9);
    EXPECT_EQ(request.text_status(), codes::STATUS_TIMEOUT);
    EXPECT_FALSE(request.is_complete());
    EXPECT_TRUE(handler.events.empty());

    EXPECT_FALSE(request.read_content());
    ASSERT_EQ(handler.events.size(), 2u);
    EXPECT_EQ(handler.events[0], "error");
    EXPECT_EQ(handler.events[1], "complete");
    EXPECT_EQ(handler.error_status, codes::STATUS_ERROR);
    EXPECT_EQ(handler.error, "timeout");
    EXPECT_EQ(handler.complete_status, codes::STATUS_ERROR);
    EXPECT_EQ(request.state(), codes::REQ_FAILED);
}

TEST_F(RequestTest, DataAfterTimeoutClearsTimeoutStatus) {
    factory.add(OK_HELLO_HEADER, &record)
        ->then_timeout()
        .then_data("hel")
        .then_timeout()
        .then_data("lo");
    Request request(settings, &factory);
    ASSERT_TRUE(request.start());

    EXPECT_TRUE(request.read_content());
    EXPECT_EQ(request.text_status(), codes::STATUS_TIMEOUT);
    EXPECT_TRUE(request.read_content());
    EXPECT_EQ(request.text_status(), codes::STATUS_NONE);
    EXPECT_TRUE(request.read_content());
    EXPECT_FALSE(request.read_content());

    // Never reset
    EXPECT_EQ(request.retries(), 2);
    EXPECT_EQ(handler.success_status, codes::STATUS_NONE);
    EXPECT_EQ(handler.decoded.text_, "hello");
}

TEST_F(RequestTest, HonoursConfiguredRetryLimit) {
    settings.max_retries_ = 3;
    factory.add(OK_HELLO_HEADER, &record);
    Request request(settings, &factory);
    ASSERT_TRUE(request.start());

    EXPECT_EQ(drive(request, 100), 3);
    EXPECT_EQ(handler.error, "timeout");
}

TEST_F(RequestTest, ReleasesConnectionBeforeCallbacks) {
    factory.add(OK_HELLO_HEADER, &record)->then_data("hello");
    Request request(settings, &factory);
    ASSERT_TRUE(request.start());
    EXPECT_TRUE(request.has_connection());

    request.read_content();

    EXPECT_FALSE(handler.connection_open_in_callback);
    EXPECT_FALSE(request.has_connection());
    EXPECT_EQ(record.close_calls, 1);
    EXPECT_TRUE(record.destroyed);
}

TEST_F(RequestTest, ConnectFailureFinishesDuringStart) {
    Request request(settings, &factory);

    EXPECT_FALSE(request.start());
    ASSERT_EQ(handler.events.size(), 2u);
    EXPECT_EQ(handler.events[0], "error");
    EXPECT_EQ(handler.error, "connection refused");
    EXPECT_EQ(handler.error_status, codes::STATUS_ERROR);
    EXPECT_EQ(request.state(), codes::REQ_FAILED);
    EXPECT_TRUE(request.is_complete());
}

TEST_F(RequestTest, SendFailureFinishesDuringStart) {
    factory.add(OK_HELLO_HEADER, &record)->fail_send();
    Request request(settings, &factory);

    EXPECT_FALSE(request.start());
    EXPECT_EQ(handler.error, "broken pipe");
    EXPECT_TRUE(record.destroyed);
}

TEST_F(RequestTest, MissingHeaderIsInvalidPageHeader) {
    factory.add("", &record);
    Request request(settings, &factory);

    EXPECT_FALSE(request.start());
    ASSERT_EQ(handler.events.size(), 2u);
    EXPECT_EQ(handler.events[0], "error");
    EXPECT_EQ(handler.error, "Invalid page header");
}

TEST_F(RequestTest, RejectedUrlNeverConnects) {
    settings.url_ = "https://example.com/";
    Request request(settings, &factory);

    EXPECT_FALSE(request.start());
    EXPECT_EQ(factory.connects, 0);
    EXPECT_EQ(handler.error_status, codes::STATUS_ERROR);
}

TEST_F(RequestTest, BuildsGetRequestWithQueryData) {
    settings.url_ = "http://example.com:8080/search#top";
    settings.add_data("q", "a b");
    settings.set_header("Connection", "close");
    settings.set_header("X-Token", "42");
    factory.add(OK_HELLO_HEADER, &record);
    Request request(settings, &factory);
    request.start();

    EXPECT_EQ(factory.last_host, "example.com");
    EXPECT_EQ(factory.last_port, 8080);
    EXPECT_EQ(request.url(), "http://example.com:8080/search?q=a%20b");
    EXPECT_EQ(record.sent,
              "GET /search?q=a%20b HTTP/1.1\r\n"
              "Host: example.com:8080\r\n"
              "Content-Type: application/x-www-form-urlencoded\r\n"
              "Content-Length: 0\r\n"
              "Connection: close\r\n"
              "User-Agent: test-agent\r\n"
              "X-Token: 42\r\n"
              "\r\n");
}

TEST_F(RequestTest, AppendsDataToExistingQuery) {
    settings.url_ = "http://example.com/search?lang=en";
    settings.add_data("q", "x");
    factory.add(OK_HELLO_HEADER, &record);
    Request request(settings, &factory);
    request.start();

    EXPECT_EQ(request.request_data()->target_, "/search?lang=en&q=x");
    EXPECT_EQ(request.url(), "http://example.com/search?lang=en&q=x");
}

TEST_F(RequestTest, PostSendsFormEncodedBody) {
    settings.method_ = codes::METHOD_POST;
    settings.add_data("name", "a b");
    settings.add_data("tag", "1");
    settings.add_data("tag", "2");
    settings.traditional_ = true;
    factory.add(OK_HELLO_HEADER, &record);
    Request request(settings, &factory);
    request.start();

    const std::string body = "name=a+b&tag=1&tag=2";
    EXPECT_EQ(request.url(), "http://example.com/index");
    EXPECT_EQ(request.request_data()->get_header("Content-Length"), "20");
    EXPECT_EQ(record.sent.substr(0, 22), "POST /index HTTP/1.1\r\n");
    ASSERT_GE(record.sent.size(), body.size());
    EXPECT_EQ(record.sent.substr(record.sent.size() - body.size() - 4),
              "\r\n\r\n" + body);
}

TEST_F(RequestTest, HeadRequestCompletesWithoutBody) {
    settings.method_ = codes::METHOD_HEAD;
    factory.add(OK_HELLO_HEADER, &record);
    Request request(settings, &factory);

    EXPECT_FALSE(request.start());
    ASSERT_EQ(handler.events.size(), 2u);
    EXPECT_EQ(handler.events[0], "success");
    EXPECT_EQ(record.body_reads, 0);
    EXPECT_EQ(request.length(), 0u);
}

TEST_F(RequestTest, NoContentCompletesDuringStart) {
    factory.add("HTTP/1.1 204 No Content\r\n\r\n", &record);
    Request request(settings, &factory);

    EXPECT_FALSE(request.start());
    EXPECT_EQ(handler.events[0], "success");
    EXPECT_EQ(handler.success_status, codes::STATUS_NONE);
}

TEST_F(RequestTest, ZeroContentLengthCompletesDuringStart) {
    factory.add("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n", &record);
    Request request(settings, &factory);

    EXPECT_FALSE(request.start());
    EXPECT_EQ(handler.events[0], "success");
    EXPECT_EQ(handler.decoded.text_, "");
}

TEST_F(RequestTest, NotModifiedIsReportedThroughSuccess) {
    factory.add("HTTP/1.1 304 Not Modified\r\n\r\n", &record);
    Request request(settings, &factory);

    EXPECT_FALSE(request.start());
    ASSERT_EQ(handler.events.size(), 2u);
    EXPECT_EQ(handler.events[0], "success");
    EXPECT_EQ(handler.success_status, codes::STATUS_NOTMODIFIED);
    EXPECT_EQ(handler.complete_status, codes::STATUS_NOTMODIFIED);
}

TEST_F(RequestTest, CloseDelimitedBodyEndsWithConnection) {
    factory.add("HTTP/1.0 200 OK\r\n\r\n", &record)
        ->then_data("abc")
        .then_data("def")
        .then_closed();
    Request request(settings, &factory);
    ASSERT_TRUE(request.start());

    EXPECT_TRUE(request.read_content());
    EXPECT_TRUE(request.read_content());
    EXPECT_FALSE(request.read_content());
    EXPECT_EQ(handler.events[0], "success");
    EXPECT_EQ(handler.decoded.text_, "abcdef");
}

TEST_F(RequestTest, EarlyCloseIsAnError) {
    factory.add(OK_HELLO_HEADER, &record)->then_data("he").then_closed();
    Request request(settings, &factory);
    ASSERT_TRUE(request.start());

    EXPECT_TRUE(request.read_content());
    EXPECT_FALSE(request.read_content());
    EXPECT_EQ(handler.events[0], "error");
    EXPECT_EQ(handler.error, "closed");
    EXPECT_EQ(handler.error_status, codes::STATUS_ERROR);

    // Partial content stays reachable
    EXPECT_EQ(request.length(), 2u);
    EXPECT_EQ(request.contents()[0], "he");
}

TEST_F(RequestTest, TransportErrorIsPassedToHandler) {
    factory.add(OK_HELLO_HEADER, &record)->then_error("connection reset");
    Request request(settings, &factory);
    ASSERT_TRUE(request.start());

    EXPECT_FALSE(request.read_content());
    EXPECT_EQ(handler.error, "connection reset");
}

TEST_F(RequestTest, DiscardsBytesBeyondContentLength) {
    factory.add("HTTP/1.1 200 OK\r\nContent-Length: 3\r\n\r\n", &record)
        ->then_data("abcdef");
    Request request(settings, &factory);
    ASSERT_TRUE(request.start());

    EXPECT_FALSE(request.read_content());
    EXPECT_EQ(request.length(), 3u);
    EXPECT_EQ(handler.decoded.text_, "abc");
}

TEST_F(RequestTest, InvalidChunkFailsRequest) {
    factory.add(CHUNKED_HEADER, &record)->then_data("xyz\r\nabc\r\n");
    Request request(settings, &factory);
    ASSERT_TRUE(request.start());

    EXPECT_FALSE(request.read_content());
    EXPECT_EQ(handler.events[0], "error");
    EXPECT_EQ(handler.error_status, codes::STATUS_ERROR);
}

TEST_F(RequestTest, DecodesJsonBody) {
    settings.data_type_ = codes::DATA_JSON;
    factory.add("HTTP/1.1 200 OK\r\nContent-Length: 13\r\n\r\n", &record)
        ->then_data("{\"ok\": true}\n");
    Request request(settings, &factory);
    ASSERT_TRUE(request.start());

    EXPECT_FALSE(request.read_content());
    EXPECT_EQ(handler.events[0], "success");
    EXPECT_EQ(handler.decoded.data_type_, codes::DATA_JSON);
    EXPECT_EQ(handler.decoded.json_["ok"], true);
}

TEST_F(RequestTest, MalformedJsonTakesErrorPath) {
    settings.data_type_ = codes::DATA_JSON;
    factory.add(OK_HELLO_HEADER, &record)->then_data("{oops");
    Request request(settings, &factory);
    ASSERT_TRUE(request.start());

    EXPECT_FALSE(request.read_content());
    ASSERT_EQ(handler.events.size(), 2u);
    EXPECT_EQ(handler.events[0], "error");
    EXPECT_EQ(handler.error_status, codes::STATUS_PARSERERROR);
    EXPECT_EQ(handler.complete_status, codes::STATUS_PARSERERROR);
    EXPECT_FALSE(handler.error.empty());
}

TEST_F(RequestTest, HttpErrorIsDeliveredAsSuccessByDefault) {
    factory.add("HTTP/1.1 404 Not Found\r\nContent-Length: 4\r\n\r\n", &record)
        ->then_data("gone");
    Request request(settings, &factory);
    ASSERT_TRUE(request.start());

    EXPECT_FALSE(request.read_content());
    EXPECT_EQ(handler.events[0], "success");
    EXPECT_EQ(handler.decoded.text_, "gone");
    EXPECT_EQ(request.response()->status_code_, 404);
}

TEST_F(RequestTest, HttpErrorFailsWhenConfigured) {
    settings.fail_on_http_error_ = true;
    factory.add("HTTP/1.1 404 Not Found\r\nContent-Length: 4\r\n\r\n", &record)
        ->then_data("gone");
    Request request(settings, &factory);
    ASSERT_TRUE(request.start());

    EXPECT_FALSE(request.read_content());
    EXPECT_EQ(handler.events[0], "error");
    EXPECT_EQ(handler.error_status, codes::STATUS_ERROR);
    EXPECT_EQ(handler.error, "HTTP 404 Not Found");
    EXPECT_EQ(request.contents()[0], "gone");
}

TEST_F(RequestTest, AbortFailsPendingRequestOnce) {
    factory.add(OK_HELLO_HEADER, &record)->then_data("he");
    Request request(settings, &factory);
    ASSERT_TRUE(request.start());
    EXPECT_TRUE(request.read_content());

    request.abort();
    ASSERT_EQ(handler.events.size(), 2u);
    EXPECT_EQ(handler.events[0], "error");
    EXPECT_EQ(handler.error_status, codes::STATUS_ABORTED);
    EXPECT_EQ(handler.error, "aborted");
    EXPECT_TRUE(record.destroyed);

    request.abort();
    EXPECT_FALSE(request.read_content());
    EXPECT_EQ(handler.events.size(), 2u);
}

TEST_F(RequestTest, OverallDeadlineFailsWithTimeout) {
    settings.timeout_ms_ = 1;
    factory.add(OK_HELLO_HEADER, &record);
    Request request(settings, &factory);
    ASSERT_TRUE(request.start());

    usleep(5000);
    EXPECT_FALSE(request.read_content());
    EXPECT_EQ(handler.error_status, codes::STATUS_TIMEOUT);
    EXPECT_EQ(record.body_reads, 0);
}

TEST_F(RequestTest, UsesLoggingHandlerWhenNoneIsSet) {
    settings.handler_ = NULL;
    factory.add(OK_HELLO_HEADER, &record)->then_data("hello");
    Request request(settings, &factory);
    ASSERT_TRUE(request.start());

    EXPECT_FALSE(request.read_content());
    EXPECT_TRUE(request.is_complete());
    EXPECT_EQ(request.decoded().text_, "hello");
}
