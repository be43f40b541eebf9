#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "MockHttpClient.h"
#include "../src/pihole/StatsFetcher.h"
#include "../src/core/Errors.h"

using ::testing::_;
using ::testing::AllOf;
using ::testing::DoAll;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::Throw;

namespace netscene {

namespace {

const char* SUMMARY = R"({"domains_being_blocked":100000,"dns_queries_today":5000,)"
                      R"("ads_blocked_today":1500,"ads_percentage_today":30.0,"status":"enabled"})";
const char* AUTH_OK = R"({"session":{"valid":true,"sid":"sid-42","csrf":"c","validity":300}})";

MATCHER_P(HasHeader, name, "") {
    for(const auto& h : arg.headers) if(h.first == name) return true;
    return false;
}
MATCHER_P2(HeaderEquals, name, value, "") {
    for(const auto& h : arg.headers) if(h.first == name && h.second == value) return true;
    return false;
}

}

class StatsFetcherTest : public ::testing::Test {
protected:
    MockHttpClient client;

    ErrorKind fetch_error_kind(const std::string& host, const std::optional<std::string>& pw = std::nullopt){
        try {
            StatsFetcher(client).fetch(host, pw);
        } catch(const PiholeError& ex) {
            return ex.kind();
        }
        ADD_FAILURE() << "fetch did not throw";
        return ErrorKind::NetworkError;
    }
};

TEST_F(StatsFetcherTest, ModernSuccessSkipsLegacy) {
    EXPECT_CALL(client, send(RequestTarget("/api/stats/summary"))).WillOnce(Return(http_response(200, SUMMARY)));
    EXPECT_CALL(client, send(RequestPath("/admin/api.php"))).Times(0);

    Stats s = StatsFetcher(client).fetch("pi.hole", std::nullopt);
    EXPECT_EQ(s.domains_blocked, 100000u);
    EXPECT_EQ(s.dns_queries_today, 5000u);
    EXPECT_EQ(s.ads_blocked_today, 1500u);
    EXPECT_DOUBLE_EQ(s.ads_percentage_today, 30.0);
    EXPECT_EQ(s.status, "enabled");
}

TEST_F(StatsFetcherTest, FallsBackToLegacyOnServerError) {
    InSequence order;
    EXPECT_CALL(client, send(RequestPath("/api/stats/summary"))).WillOnce(Return(http_response(500, "oops")));
    EXPECT_CALL(client, send(RequestTarget("/admin/api.php?summaryRaw"))).WillOnce(Return(http_response(200, SUMMARY)));
    EXPECT_EQ(StatsFetcher(client).fetch("192.168.1.2", std::nullopt).status, "enabled");
}

TEST_F(StatsFetcherTest, EndpointsShareAuthority) {
    HttpRequest modern, legacy;
    EXPECT_CALL(client, send(RequestPath("/api/stats/summary")))
        .WillOnce(DoAll(SaveArg<0>(&modern), Return(http_response(404, ""))));
    EXPECT_CALL(client, send(RequestPath("/admin/api.php")))
        .WillOnce(DoAll(SaveArg<0>(&legacy), Return(http_response(200, SUMMARY))));
    StatsFetcher(client).fetch("https://pi.example:8443", std::nullopt);
    EXPECT_EQ(modern.url.to_string(), "https://pi.example:8443/api/stats/summary");
    EXPECT_EQ(legacy.url.to_string(), "https://pi.example:8443/admin/api.php?summaryRaw");
    EXPECT_EQ(modern.method, HttpMethod::Get);
}

TEST_F(StatsFetcherTest, ExhaustionReportsGenericJsonError) {
    EXPECT_CALL(client, send(_)).Times(2).WillRepeatedly(Return(http_response(503, "")));
    try {
        StatsFetcher(client).fetch("pi.hole", std::nullopt);
        FAIL() << "expected exhaustion";
    } catch(const PiholeError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::JsonError);
        EXPECT_NE(std::string(ex.what()).find("Failed to get valid response from any Pi-hole API endpoint"), std::string::npos);
    }
}

TEST_F(StatsFetcherTest, TransportFailuresAreSkippedNotSurfaced) {
    EXPECT_CALL(client, send(_)).Times(2).WillRepeatedly(Throw(PiholeError(ErrorKind::NetworkError, "refused")));
    EXPECT_EQ(fetch_error_kind("pi.hole"), ErrorKind::JsonError);
}

TEST_F(StatsFetcherTest, HtmlAndEmptyBodiesAreSkipped) {
    EXPECT_CALL(client, send(RequestPath("/api/stats/summary")))
        .WillOnce(Return(http_response(200, "  \n<!DOCTYPE html><html><body>login</body></html>")));
    EXPECT_CALL(client, send(RequestPath("/admin/api.php"))).WillOnce(Return(http_response(200, "")));
    EXPECT_EQ(fetch_error_kind("pi.hole"), ErrorKind::JsonError);
}

TEST_F(StatsFetcherTest, UnparseableModernFallsBack) {
    EXPECT_CALL(client, send(RequestPath("/api/stats/summary"))).WillOnce(Return(http_response(200, R"({"queries":{"total":5}})")));
    EXPECT_CALL(client, send(RequestPath("/admin/api.php"))).WillOnce(Return(http_response(200, SUMMARY)));
    EXPECT_EQ(StatsFetcher(client).fetch("pi.hole", std::nullopt).ads_blocked_today, 1500u);
}

TEST_F(StatsFetcherTest, ValidationFailureEndsScan) {
    const char* bad = R"({"domains_being_blocked":1,"dns_queries_today":1,"ads_blocked_today":1,)"
                      R"("ads_percentage_today":150.0,"status":"enabled"})";
    EXPECT_CALL(client, send(RequestPath("/api/stats/summary"))).WillOnce(Return(http_response(200, bad)));
    EXPECT_CALL(client, send(RequestPath("/admin/api.php"))).Times(0);
    try {
        StatsFetcher(client).fetch("pi.hole", std::nullopt);
        FAIL() << "expected ValidationError";
    } catch(const PiholeError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::ValidationError);
        EXPECT_EQ(ex.detail(), "Ads percentage cannot exceed 100%");
    }
}

TEST_F(StatsFetcherTest, InvalidHostFailsBeforeAnyRequest) {
    EXPECT_CALL(client, send(_)).Times(0);
    EXPECT_EQ(fetch_error_kind("   "), ErrorKind::InvalidHost);
    EXPECT_EQ(fetch_error_kind("pi hole", std::string("pw")), ErrorKind::InvalidUrl);
}

TEST_F(StatsFetcherTest, NoPasswordSendsNoCredential) {
    EXPECT_CALL(client, send(RequestPath("/api/auth"))).Times(0);
    EXPECT_CALL(client, send(AllOf(RequestPath("/api/stats/summary"), ::testing::Not(HasHeader("X-Session-Credential")))))
        .WillOnce(Return(http_response(200, SUMMARY)));
    StatsFetcher(client).fetch("pi.hole", std::nullopt);
}

TEST_F(StatsFetcherTest, CredentialAttachedToStatsRequests) {
    InSequence order;
    EXPECT_CALL(client, send(RequestPath("/api/auth"))).WillOnce(Return(http_response(200, AUTH_OK)));
    EXPECT_CALL(client, send(AllOf(RequestPath("/api/stats/summary"), HeaderEquals("X-Session-Credential", "sid-42"))))
        .WillOnce(Return(http_response(401, "")));
    EXPECT_CALL(client, send(AllOf(RequestPath("/admin/api.php"), HeaderEquals("X-Session-Credential", "sid-42"))))
        .WillOnce(Return(http_response(200, SUMMARY)));
    StatsFetcher(client).fetch("pi.hole", std::string("secret"));
}

TEST_F(StatsFetcherTest, CustomSessionHeaderName) {
    EXPECT_CALL(client, send(RequestPath("/api/auth"))).WillOnce(Return(http_response(200, AUTH_OK)));
    EXPECT_CALL(client, send(AllOf(RequestPath("/api/stats/summary"), HeaderEquals("X-FTL-SID", "sid-42"))))
        .WillOnce(Return(http_response(200, SUMMARY)));
    FetchOptions opts;
    opts.session_header = "X-FTL-SID";
    get_stats("pi.hole", std::string("secret"), client, opts);
}

TEST_F(StatsFetcherTest, AuthFailureProceedsUnauthenticated) {
    EXPECT_CALL(client, send(RequestPath("/api/auth"))).WillOnce(Return(http_response(401, "")));
    EXPECT_CALL(client, send(AllOf(RequestPath("/api/stats/summary"), ::testing::Not(HasHeader("X-Session-Credential")))))
        .WillOnce(Return(http_response(200, SUMMARY)));
    EXPECT_EQ(StatsFetcher(client).fetch("pi.hole", std::string("wrong")).status, "enabled");
}

TEST_F(StatsFetcherTest, RepeatedFetchesAgree) {
    EXPECT_CALL(client, send(RequestPath("/api/stats/summary"))).Times(2).WillRepeatedly(Return(http_response(200, SUMMARY)));
    StatsFetcher fetcher(client);
    EXPECT_EQ(fetcher.fetch("pi.hole", std::nullopt), fetcher.fetch("pi.hole", std::nullopt));
}

TEST(LooksLikeHtmlTest, DetectsLoginPages) {
    EXPECT_TRUE(looks_like_html("<!DOCTYPE html>"));
    EXPECT_TRUE(looks_like_html("\r\n  <html lang=\"en\">"));
    EXPECT_FALSE(looks_like_html("{\"status\":\"enabled\"}"));
    EXPECT_FALSE(looks_like_html(""));
    EXPECT_FALSE(looks_like_html("   "));
}

TEST(FetchStateTest, Names) {
    EXPECT_STREQ(to_string(FetchState::ProbingModern), "ProbingModern");
    EXPECT_STREQ(to_string(FetchState::Exhausted), "Exhausted");
}

TEST(BodyPreviewTest, TruncatesOnCharacterBoundary) {
    EXPECT_EQ(body_preview("short"), "short");
    EXPECT_EQ(body_preview(std::string(200, 'a')), std::string(200, 'a'));
    EXPECT_EQ(body_preview(std::string(250, 'a')), std::string(200, 'a') + "...");
    // a two-byte character straddles the limit
    std::string body = std::string(199, 'a') + "\xc3\xa9" + std::string(10, 'b');
    EXPECT_EQ(body_preview(body), std::string(199, 'a') + "...");
    std::string euro = std::string(198, 'a') + "\xe2\x82\xac" + "tail";
    EXPECT_EQ(body_preview(euro), std::string(198, 'a') + "...");
    EXPECT_EQ(body_preview("\xe2\x82\xac\xe2\x82\xac", 4), "\xe2\x82\xac...");
}

}
