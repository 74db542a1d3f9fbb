/// @file test_diagnostics.cpp
/// Unit tests for Diagnostics.hpp: exhaustion message building.

#include "Diagnostics.hpp"
#include "FakeTransport.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace resilient_http;
using resilient_http::testing::makeNetworkFailure;
using resilient_http::testing::makeResponse;

TEST(Diagnostics, FreshAccumulatorIsEmpty) {
    DiagnosticsAccumulator diagnostics;
    EXPECT_EQ(diagnostics.attempts(), 0u);
    EXPECT_FALSE(diagnostics.lastStatus().has_value());
    EXPECT_EQ(diagnostics.compose(), "attempts=0");
}

TEST(Diagnostics, RecordsStatusAndSnippet) {
    DiagnosticsAccumulator diagnostics;
    diagnostics.record(makeResponse(503, "busy"));
    diagnostics.record(makeResponse(503, "still busy"));

    EXPECT_EQ(diagnostics.attempts(), 2u);
    EXPECT_EQ(diagnostics.lastStatus(), 503);
    EXPECT_EQ(diagnostics.lastBodySnippet(), "still busy");
    EXPECT_EQ(diagnostics.compose(),
              "status=503, body=\"still busy\", attempts=2, last_err=\"HTTP error: Status: 503\"");
}

TEST(Diagnostics, NetworkErrorKeepsEarlierStatus) {
    DiagnosticsAccumulator diagnostics;
    diagnostics.record(makeResponse(502, "bad gateway"));
    diagnostics.record(makeNetworkFailure(CURLE_COULDNT_CONNECT, "Connection refused"));

    EXPECT_EQ(diagnostics.attempts(), 2u);
    EXPECT_EQ(diagnostics.lastStatus(), 502);
    EXPECT_EQ(diagnostics.lastError(), "HTTP error: Connection refused");
}

TEST(Diagnostics, SuccessOnlyCountsAttempt) {
    DiagnosticsAccumulator diagnostics;
    diagnostics.record(makeResponse(200, "{}"));
    EXPECT_EQ(diagnostics.attempts(), 1u);
    EXPECT_FALSE(diagnostics.lastStatus().has_value());
    EXPECT_FALSE(diagnostics.lastError().has_value());
}

TEST(Diagnostics, DoubleQuotesAreReplaced) {
    DiagnosticsAccumulator diagnostics;
    diagnostics.record(makeResponse(500, R"({"error":"boom"})"));
    EXPECT_NE(diagnostics.compose().find("body=\"{'error':'boom'}\""), std::string::npos);
}

TEST(Diagnostics, SnippetIsBounded) {
    std::string body(50, 'x');
    EXPECT_EQ(DiagnosticsAccumulator::snippet(body, 100), body);
    EXPECT_EQ(DiagnosticsAccumulator::snippet(body, 10), std::string(10, 'x') + "...[truncated]");

    DiagnosticsAccumulator diagnostics(8);
    diagnostics.record(makeResponse(500, body));
    EXPECT_EQ(diagnostics.lastBodySnippet(), std::string(8, 'x') + "...[truncated]");
}
