/// @file test_http_client.cpp
/// Tests for HttpClient.hpp: the libcurl transport against refused ports and a loopback server.

#include "HttpClient.hpp"
#include "LoopbackServer.hpp"
#include "RequestExecutor.hpp"
#include "RetryAfter.hpp"

#include <gtest/gtest.h>
#include <spdlog/sinks/null_sink.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

using namespace resilient_http;
using resilient_http::testing::LoopbackServer;
using resilient_http::testing::ReceivedRequest;
using resilient_http::testing::reply;
using json = nlohmann::json;

// Nothing listens on port 1 of the loopback interface
static const std::string kRefusedUrl = "http://127.0.0.1:1/";

static RequestPolicy shortPolicy() {
    RequestPolicy policy;
    policy.timeout = 5;
    policy.connTimeout = 2;
    return policy;
}

TEST(HttpTransfer, BlockingRefusedConnection) {
    HttpRequest request;
    request.url = kRefusedUrl;
    request.methodName = "GET";

    HttpTransfer transfer(request, shortPolicy());
    transfer.perform_blocking();

    const HttpResponse& response = transfer.getResponse();
    EXPECT_FALSE(response.completed());
    EXPECT_EQ(response.curlCode, CURLE_COULDNT_CONNECT);
    EXPECT_FALSE(response.error.empty());
    EXPECT_FALSE(response.success());
}

TEST(HttpClient, RefusedConnectionIsReportedNotThrown) {
    HttpClientSettings settings;
    settings.maxConnections = 2;
    HttpClient client(settings);

    HttpRequest request;
    request.url = kRefusedUrl;
    request.methodName = "POST";
    request.body = "{}";

    auto state = client.send_request(request, shortPolicy());
    HttpResponse response = state->future.get();

    EXPECT_EQ(state->get_state(), HttpClient::TransferState::Failed);
    EXPECT_EQ(response.curlCode, CURLE_COULDNT_CONNECT);
    EXPECT_EQ(response.status, 0);
}

TEST(HttpClient, ManyRequestsShareFewSlots) {
    HttpClientSettings settings;
    settings.maxConnections = 1;
    HttpClient client(settings);

    HttpRequest request;
    request.url = kRefusedUrl;
    request.methodName = "GET";

    for (int i = 0; i < 3; ++i) {
        HttpResponse response = client.perform(request, shortPolicy());
        EXPECT_EQ(response.curlCode, CURLE_COULDNT_CONNECT);
    }
}

TEST(HttpClient, StoppedClientRejectsRequests) {
    HttpClient client;
    client.stop();

    HttpRequest request;
    request.url = kRefusedUrl;
    request.methodName = "GET";
    EXPECT_THROW(client.send_request(request), InternalError);
}

TEST(HttpClient, ExecutorRaisesAfterRetriesOnRefusedConnection) {
    auto client = std::make_shared<HttpClient>();
    Logger logger(std::make_shared<spdlog::logger>("http_client_test", std::make_shared<spdlog::sinks::null_sink_mt>()));

    ClientConfig config;
    config.retryCount = 1;
    config.backoffLimit = std::chrono::milliseconds(5);
    RequestExecutor executor(logger, config, client);

    try {
        executor.get<nlohmann::json>(kRefusedUrl);
        FAIL() << "expected HttpError";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.curlCode(), CURLE_COULDNT_CONNECT);
        EXPECT_NE(e.detail().find("attempts=2"), std::string::npos);
    }
}

// ============================================================================
// Loopback exchanges
// ============================================================================

static std::string echo(const ReceivedRequest& request, size_t) {
    return reply(200, "OK", {"Content-Type: application/json", "X-Method: " + request.method}, request.body);
}

static HttpRequest makeRequest(const std::string& method, const std::string& url, const std::string& body = "") {
    HttpRequest request;
    request.methodName = method;
    request.url = url;
    request.body = body;
    if (!body.empty())
        request.headers.push_back("Content-Type: application/json");
    return request;
}

static Logger quietLogger(const std::string& name) {
    return Logger(std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>()));
}

TEST(HttpTransfer, MovedTransferUploadsItsShortBody) {
    LoopbackServer server(echo);

    std::optional<HttpTransfer> moved;
    {
        HttpTransfer original(makeRequest("POST", server.url("/echo"), "{\"a\":1}"), shortPolicy());
        moved.emplace(std::move(original));
    }
    moved->perform_blocking();

    const HttpResponse& response = moved->getResponse();
    ASSERT_TRUE(response.completed()) << response.error;
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, "{\"a\":1}");

    auto received = server.received();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].method, "POST");
    EXPECT_EQ(received[0].body, "{\"a\":1}");
}

TEST(HttpClient, PostBodySurvivesTheWorkerQueue) {
    LoopbackServer server(echo);
    HttpClient client;

    HttpResponse response = client.perform(makeRequest("POST", server.url("/echo"), "{}"), shortPolicy());

    ASSERT_TRUE(response.completed()) << response.error;
    EXPECT_TRUE(response.success());
    EXPECT_EQ(response.body, "{}");
    EXPECT_GT(response.transferInfo.total, 0.0f);

    auto received = server.received();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].body, "{}");
    EXPECT_EQ(util::findHeader(received[0].headers, "content-type"), "application/json");
}

TEST(HttpClient, CustomMethodSendsBody) {
    LoopbackServer server(echo);
    HttpClient client;

    HttpResponse response = client.perform(makeRequest("PATCH", server.url("/item/3"), "{\"b\":2}"), shortPolicy());

    ASSERT_TRUE(response.completed()) << response.error;
    EXPECT_EQ(util::findHeader(response.headers, "X-Method"), "PATCH");

    auto received = server.received();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].method, "PATCH");
    EXPECT_EQ(received[0].target, "/item/3");
    EXPECT_EQ(received[0].body, "{\"b\":2}");
}

TEST(HttpClient, HeadRequestSkipsBody) {
    LoopbackServer server([](const ReceivedRequest&, size_t) {
        // Content-Length describes the body a GET would get, none is sent
        return std::string("HTTP/1.1 200 OK\r\nContent-Length: 5\r\nConnection: close\r\n\r\n");
    });
    HttpClient client;

    HttpResponse response = client.perform(makeRequest("HEAD", server.url("/")), shortPolicy());

    ASSERT_TRUE(response.completed()) << response.error;
    EXPECT_EQ(response.status, 200);
    EXPECT_TRUE(response.body.empty());
    ASSERT_EQ(server.received().size(), 1u);
    EXPECT_EQ(server.received()[0].method, "HEAD");
}

TEST(HttpClient, RedirectKeepsOnlyFinalHeaders) {
    LoopbackServer server([](const ReceivedRequest& request, size_t) {
        if (request.target == "/start")
            return reply(302, "Found", {"Location: /final", "X-Hop: first"});
        return reply(200, "OK", {"X-Final: yes"}, "done");
    });
    HttpClient client;

    HttpResponse response = client.perform(makeRequest("GET", server.url("/start")), shortPolicy());

    ASSERT_TRUE(response.completed()) << response.error;
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, "done");
    EXPECT_TRUE(util::hasHeader(response.headers, "X-Final"));
    EXPECT_FALSE(util::hasHeader(response.headers, "X-Hop"));
    EXPECT_FALSE(util::hasHeader(response.headers, "Location"));
    EXPECT_EQ(server.received().size(), 2u);
}

TEST(HttpClient, InterimResponseHeadersAreDropped) {
    LoopbackServer server([](const ReceivedRequest&, size_t) {
        return std::string("HTTP/1.1 100 Continue\r\nX-Interim: yes\r\n\r\n") +
               reply(201, "Created", {"X-Final: yes"}, "{}");
    });
    HttpClient client;

    HttpResponse response = client.perform(makeRequest("POST", server.url("/"), "{}"), shortPolicy());

    ASSERT_TRUE(response.completed()) << response.error;
    EXPECT_EQ(response.status, 201);
    EXPECT_TRUE(util::hasHeader(response.headers, "X-Final"));
    EXPECT_FALSE(util::hasHeader(response.headers, "X-Interim"));
}

TEST(HttpClient, RetryAfterHeaderReachesParser) {
    LoopbackServer server([](const ReceivedRequest&, size_t) {
        return reply(503, "Service Unavailable", {"Retry-After: 7"}, "busy");
    });
    HttpClient client;

    HttpResponse response = client.perform(makeRequest("GET", server.url("/")), shortPolicy());

    ASSERT_TRUE(response.completed()) << response.error;
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(retry_after::parse(response.headers), std::chrono::milliseconds(7000));
}

TEST(HttpClient, ExecutorHonorsRetryAfterFromServer) {
    LoopbackServer server([](const ReceivedRequest& request, size_t index) {
        if (index == 0)
            return reply(503, "Service Unavailable", {"Retry-After: 1"});
        return reply(200, "OK", {"Content-Type: application/json"}, request.body);
    });
    auto client = std::make_shared<HttpClient>();

    ClientConfig config;
    config.retryCount = 1;
    RequestExecutor executor(quietLogger("http_client_retry_after"), config, client);

    auto started = std::chrono::steady_clock::now();
    auto result = executor.post<json>(server.url("/items"), json{{"a", 1}});
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(result.success);
    ASSERT_TRUE(result.data.has_value());
    EXPECT_EQ((*result.data)["a"], 1);
    EXPECT_GE(elapsed, std::chrono::milliseconds(1000));

    auto received = server.received();
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0].body, received[1].body);
    EXPECT_EQ(json::parse(received[1].body), (json{{"a", 1}}));
}

// ============================================================================
// Shutdown
// ============================================================================

TEST(HttpClient, StopWhileSubmittingNeverStrandsCaller) {
    for (int round = 0; round < 20; ++round) {
        HttpClient client;
        std::atomic<int> stranded{0};
        std::vector<std::thread> callers;

        for (int i = 0; i < 4; ++i) {
            callers.emplace_back([&client, &stranded]() {
                for (int j = 0; j < 5; ++j) {
                    try {
                        auto state = client.send_request(makeRequest("GET", kRefusedUrl), shortPolicy());
                        if (state->future.wait_for(std::chrono::seconds(10)) != std::future_status::ready)
                            ++stranded;
                    } catch (const InternalError&) {
                        // Rejected after stop()
                    }
                }
            });
        }
        client.stop();
        for (auto& caller : callers)
            caller.join();

        EXPECT_EQ(stranded.load(), 0) << "round " << round;
    }
}
