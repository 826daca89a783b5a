#include <gtest/gtest.h>
#include "gateway/LinkResolver.hpp"
#include "gateway/GatewayError.hpp"
#include "config/Config.hpp"
#include "support/FakeTransport.hpp"

#include <nlohmann/json.hpp>

using namespace sg;
using namespace sg::gateway;
using sg::test::FakeTransport;
namespace http = boost::beast::http;

class LinkResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend.address = "https://alist.example.com";
        backend.token = "alist-token";
        transport = std::make_shared<FakeTransport>();
    }

    LinkResolver resolver() const { return {transport, backend}; }

    config::BackendConfig backend;
    std::shared_ptr<FakeTransport> transport;
};

TEST_F(LinkResolverTest, PostsPathToLinkEndpoint) {
    transport->backendLink("https://cdn.example.com/f?x=1");

    const auto link = resolver().resolve("/a/b.txt");

    ASSERT_EQ(transport->exchanged.size(), 1u);
    const auto& req = transport->exchanged.front();
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.url, "https://alist.example.com/api/fs/link");
    EXPECT_EQ(nlohmann::json::parse(req.body), nlohmann::json({{"path", "/a/b.txt"}}));
    EXPECT_EQ(req.headers[http::field::authorization], "alist-token");
    EXPECT_EQ(req.headers[http::field::content_type], "application/json;charset=UTF-8");

    EXPECT_EQ(link.statusCode, 200u);
    EXPECT_EQ(link.url, "https://cdn.example.com/f?x=1");
    EXPECT_TRUE(link.extraHeaders.empty());
}

TEST_F(LinkResolverTest, NonUtf8PathIsSentWithReplacementCharacter) {
    transport->backendLink("https://cdn.example.com/f");

    const auto link = resolver().resolve("/a/\xFF.txt");

    ASSERT_EQ(transport->exchanged.size(), 1u);
    EXPECT_EQ(nlohmann::json::parse(transport->exchanged.front().body)["path"].get<std::string>(), "/a/\xEF\xBF\xBD.txt");
    EXPECT_EQ(link.url, "https://cdn.example.com/f");
}

TEST_F(LinkResolverTest, SendsVerifyHeaderWhenConfigured) {
    backend.verify_header = "X-Gateway-Verify";
    backend.verify_secret = "v3r1fy";
    transport->backendLink("https://cdn.example.com/f");

    (void)resolver().resolve("/a/b.txt");

    EXPECT_EQ(transport->exchanged.front().headers["X-Gateway-Verify"], "v3r1fy");
}

TEST_F(LinkResolverTest, OmitsVerifyHeaderByDefault) {
    transport->backendLink("https://cdn.example.com/f");
    (void)resolver().resolve("/a/b.txt");
    EXPECT_EQ(transport->exchanged.front().headers.count("X-Gateway-Verify"), 0u);
}

TEST_F(LinkResolverTest, CollectsStringAndListHeaders) {
    transport->backendLink("https://cdn.example.com/f",
                           R"({"Referer":"https://pan.example.com","Cookie":["a=1","b=2"],"X-Bad":42})");

    const auto link = resolver().resolve("/a/b.txt");

    ASSERT_EQ(link.extraHeaders.size(), 2u);
    EXPECT_EQ(link.extraHeaders.at("Referer"), std::vector<std::string>{"https://pan.example.com"});
    EXPECT_EQ(link.extraHeaders.at("Cookie"), (std::vector<std::string>{"a=1", "b=2"}));
}

TEST_F(LinkResolverTest, NonJsonBackendIsGenericError) {
    transport::BufferedResponse r;
    r.status = 503;
    r.headers.set(http::field::content_type, "text/html");
    r.body = "<html>secret stack trace</html>";
    transport->exchanges.push_back(r);

    try {
        (void)resolver().resolve("/a/b.txt");
        FAIL() << "expected BackendNonJsonError";
    } catch (const BackendNonJsonError& e) {
        EXPECT_EQ(e.status(), 503u);
        EXPECT_EQ(e.body(), R"({"code":503,"message":"Request failed with status: 503"})");
    }
}

TEST_F(LinkResolverTest, DeclaredErrorForwardsBodyVerbatim) {
    const std::string body = R"({"message":"object not found","code":404,"data":null})";
    transport->backendJson(200, body);

    try {
        (void)resolver().resolve("/missing.txt");
        FAIL() << "expected BackendDeclaredError";
    } catch (const BackendDeclaredError& e) {
        EXPECT_EQ(e.status(), 404u);
        EXPECT_EQ(e.body(), body);
    }
}

TEST_F(LinkResolverTest, OutOfRangeCodeBecomes500) {
    transport->backendJson(200, R"({"code":1001,"message":"weird"})");
    try {
        (void)resolver().resolve("/a/b.txt");
        FAIL() << "expected BackendDeclaredError";
    } catch (const BackendDeclaredError& e) {
        EXPECT_EQ(e.status(), 500u);
    }
}

TEST_F(LinkResolverTest, NonNumericCodeBecomes500) {
    transport->backendJson(200, R"({"code":"200","message":"stringly typed"})");
    try {
        (void)resolver().resolve("/a/b.txt");
        FAIL() << "expected BackendDeclaredError";
    } catch (const BackendDeclaredError& e) {
        EXPECT_EQ(e.status(), 500u);
    }
}

TEST_F(LinkResolverTest, MalformedJsonIsProtocolError) {
    transport->backendJson(200, "{not json");
    EXPECT_THROW((void)resolver().resolve("/a/b.txt"), BackendProtocolError);
}

TEST_F(LinkResolverTest, SuccessWithoutUrlIsProtocolError) {
    transport->backendJson(200, R"({"code":200,"data":{}})");
    EXPECT_THROW((void)resolver().resolve("/a/b.txt"), BackendProtocolError);
}

TEST_F(LinkResolverTest, TransportFailureIsUnavailable) {
    transport->exchangeFailure = "Could not connect to server";
    try {
        (void)resolver().resolve("/a/b.txt");
        FAIL() << "expected BackendUnavailableError";
    } catch (const BackendUnavailableError& e) {
        EXPECT_EQ(e.status(), 502u);
        EXPECT_EQ(e.body(), R"({"code":502,"message":"Backend unreachable"})");
    }
}
