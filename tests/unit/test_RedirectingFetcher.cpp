#include <gtest/gtest.h>
#include "gateway/RedirectingFetcher.hpp"
#include "gateway/GatewayError.hpp"
#include "support/CapturingSink.hpp"
#include "support/FakeTransport.hpp"

using namespace sg::gateway;
using sg::test::CapturingSink;
using sg::test::FakeTransport;
using field = boost::beast::http::field;

class RedirectingFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<FakeTransport>();
        fetcher = std::make_unique<RedirectingFetcher>(transport, "https://dl.example.com");
        original.method = "GET";
        original.target = "/a/b.txt?sign=x";
        original.headers.set(field::range, "bytes=0-3");
        original.headers.set(field::host, "dl.example.com");
    }

    FetchOutcome fetch(const std::string& url, const HeaderMap& extra = {}) {
        return fetcher->fetch(url, original, extra, "*", budget, sink);
    }

    std::shared_ptr<FakeTransport> transport;
    std::unique_ptr<RedirectingFetcher> fetcher;
    model::ProxyRequest original;
    RedirectBudget budget{10};
    CapturingSink sink;
};

TEST_F(RedirectingFetcherTest, StreamsTerminalResponse) {
    boost::beast::http::fields h;
    h.set(field::content_type, "text/plain");
    h.set(field::content_length, "11");
    transport->upstream(200, "hello world", h);

    const auto outcome = fetch("https://cdn.example.com/f");

    EXPECT_FALSE(outcome.selfRedirect);
    EXPECT_EQ(sink.status, 200u);
    EXPECT_EQ(sink.body, "hello world");
    EXPECT_TRUE(sink.finished());
    EXPECT_EQ(sink.header(field::content_type), "text/plain");
    EXPECT_EQ(sink.header(field::access_control_allow_origin), "*");
}

TEST_F(RedirectingFetcherTest, ForwardsClientHeadersExceptHopHeaders) {
    transport->upstream(206, "abcd");
    (void)fetch("https://cdn.example.com/f");

    ASSERT_EQ(transport->streamed.size(), 1u);
    const auto& req = transport->streamed.front();
    EXPECT_EQ(req.method, "GET");
    EXPECT_EQ(req.url, "https://cdn.example.com/f");
    EXPECT_EQ(req.headers[field::range], "bytes=0-3");
    EXPECT_EQ(req.headers.count(field::host), 0u);
    EXPECT_EQ(sink.status, 206u);
}

TEST_F(RedirectingFetcherTest, BackendHeadersReplaceClientHeadersAndKeepAllValues) {
    original.headers.set("Cookie", "client=1");
    transport->upstream(200, "ok");

    (void)fetch("https://cdn.example.com/f", {{"Cookie", {"a=1", "b=2"}}, {"Referer", {"https://pan.example.com"}}});

    const auto& req = transport->streamed.front();
    EXPECT_EQ(req.headers.count("Cookie"), 2u);
    auto [first, last] = req.headers.equal_range("Cookie");
    EXPECT_EQ(first->value(), "a=1");
    EXPECT_EQ(std::next(first)->value(), "b=2");
    EXPECT_EQ(req.headers["Referer"], "https://pan.example.com");
}

TEST_F(RedirectingFetcherTest, FollowsRedirectChainWithSameRequest) {
    transport->redirect(302, "https://mirror.example.com/f");
    transport->redirect(307, "/final");
    transport->upstream(200, "data");

    (void)fetch("https://cdn.example.com/f", {{"Referer", {"https://pan.example.com"}}});

    ASSERT_EQ(transport->streamed.size(), 3u);
    EXPECT_EQ(transport->streamed[1].url, "https://mirror.example.com/f");
    EXPECT_EQ(transport->streamed[2].url, "https://mirror.example.com/final");
    for (const auto& req : transport->streamed) {
        EXPECT_EQ(req.headers["Referer"], "https://pan.example.com");
        EXPECT_EQ(req.headers[field::range], "bytes=0-3");
    }
    EXPECT_EQ(budget.used(), 2u);
    EXPECT_EQ(sink.body, "data");
    EXPECT_EQ(sink.headWrites, 1);
}

TEST_F(RedirectingFetcherTest, RedirectWithoutLocationIsTerminal) {
    transport->upstream(302, "no location");

    (void)fetch("https://cdn.example.com/f");

    EXPECT_EQ(sink.status, 302u);
    EXPECT_EQ(sink.body, "no location");
    EXPECT_EQ(budget.used(), 0u);
}

TEST_F(RedirectingFetcherTest, SelfRedirectIsHandedBack) {
    transport->redirect(302, "https://dl.example.com/c.txt?sign=abc:0");

    const auto outcome = fetch("https://cdn.example.com/f");

    ASSERT_TRUE(outcome.selfRedirect);
    EXPECT_EQ(*outcome.selfRedirect, "https://dl.example.com/c.txt?sign=abc:0");
    EXPECT_FALSE(sink.headWritten());
    EXPECT_EQ(budget.used(), 0u);
}

TEST_F(RedirectingFetcherTest, SelfRedirectNeedsPathBoundary) {
    EXPECT_TRUE(fetcher->isSelfRedirect("https://dl.example.com/x"));
    EXPECT_FALSE(fetcher->isSelfRedirect("https://dl.example.com.evil.net/x"));
    EXPECT_FALSE(fetcher->isSelfRedirect("https://dl.example.com"));
    EXPECT_FALSE(fetcher->isSelfRedirect("/x"));
}

TEST_F(RedirectingFetcherTest, HopLimitIsEnforced) {
    budget = RedirectBudget(2);
    transport->redirect(302, "https://a.example/1");
    transport->redirect(302, "https://a.example/2");
    transport->redirect(302, "https://a.example/3");

    EXPECT_THROW((void)fetch("https://a.example/0"), TooManyRedirectsError);
    EXPECT_EQ(transport->streamed.size(), 3u);
    EXPECT_FALSE(sink.headWritten());
}

TEST_F(RedirectingFetcherTest, StripsSetCookieFromTerminalResponse) {
    boost::beast::http::fields h;
    h.insert(field::set_cookie, "session=abc");
    h.set(field::content_type, "application/octet-stream");
    transport->upstream(200, "bin", h);

    (void)fetch("https://cdn.example.com/f");

    EXPECT_EQ(sink.count(field::set_cookie), 0u);
    EXPECT_EQ(sink.header(field::content_type), "application/octet-stream");
}

TEST_F(RedirectingFetcherTest, UpstreamErrorStatusIsRelayed) {
    transport->upstream(403, "denied");

    (void)fetch("https://cdn.example.com/f");

    EXPECT_EQ(sink.status, 403u);
    EXPECT_EQ(sink.body, "denied");
}

TEST_F(RedirectingFetcherTest, TransportFailureIsUpstreamFetchError) {
    sg::test::ScriptedHop hop;
    hop.failure = "Could not resolve host";
    transport->hops.push_back(hop);

    EXPECT_THROW((void)fetch("https://nowhere.example/f"), UpstreamFetchError);
    EXPECT_FALSE(sink.headWritten());
}

TEST_F(RedirectingFetcherTest, ClientDisconnectStopsTransfer) {
    transport->upstream(200, "0123456789abcdef");
    sink.disconnectAfter = 4;

    const auto outcome = fetch("https://cdn.example.com/f");

    EXPECT_FALSE(outcome.selfRedirect);
    EXPECT_EQ(sink.body, "0123");
    EXPECT_FALSE(sink.finished());
}

TEST(RedirectBudgetTest, ThrowsOnceExhausted) {
    RedirectBudget budget(1);
    EXPECT_NO_THROW(budget.consume());
    EXPECT_THROW(budget.consume(), TooManyRedirectsError);
    EXPECT_EQ(budget.used(), 1u);
}
