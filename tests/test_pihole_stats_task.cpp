#include "../src/pihole/PiholeStatsTask.h"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "MockHttpClient.h"
#include "../src/core/Config.h"
#include "../src/core/Errors.h"
#include "../src/core/Report.h"
#include "../src/core/TaskContext.h"

using ::testing::Return;

namespace netscene {

namespace {
const char* SUMMARY = R"({"domains_being_blocked":1,"dns_queries_today":2,"ads_blocked_today":1,)"
                      R"("ads_percentage_today":50,"status":"enabled"})";
}

class PiholeStatsTaskTest : public ::testing::Test {
protected:
    Config config;
    Report report;
};

TEST_F(PiholeStatsTaskTest, ClientOptionsFollowConfig) {
    config.timeout_seconds = 5;
    config.user_agent = "netscene-test/3";
    config.insecure = true;
    ClientOptions opts = client_options(config);
    EXPECT_EQ(opts.timeout, std::chrono::seconds(5));
    EXPECT_EQ(opts.user_agent, "netscene-test/3");
    EXPECT_FALSE(opts.verify_tls);

    EXPECT_TRUE(client_options(Config{}).verify_tls);
    EXPECT_EQ(client_options(Config{}).timeout, std::chrono::seconds(10));
}

TEST_F(PiholeStatsTaskTest, StoresStatsFromConfiguredClient) {
    config.host = "10.0.0.2";
    config.user_agent = "netscene-test/3";
    ClientOptions seen;
    PiholeStatsTask task([&](const ClientOptions& opts){
        seen = opts;
        auto client = std::make_unique<MockHttpClient>();
        EXPECT_CALL(*client, send(RequestPath("/api/stats/summary"))).WillOnce(Return(http_response(200, SUMMARY)));
        return HttpClientPtr(std::move(client));
    });
    EXPECT_EQ(task.name(), "pihole");

    TaskContext context(config, report);
    task.run(context);
    EXPECT_EQ(seen.user_agent, "netscene-test/3");
    ASSERT_TRUE(report.stats().has_value());
    EXPECT_EQ(report.stats()->dns_queries_today, 2u);
}

TEST_F(PiholeStatsTaskTest, SessionHeaderComesFromConfig) {
    config.password = "secret";
    config.session_header = "X-FTL-SID";
    PiholeStatsTask task([](const ClientOptions&){
        auto client = std::make_unique<MockHttpClient>();
        EXPECT_CALL(*client, send(RequestPath("/api/auth")))
            .WillOnce(Return(http_response(200, R"({"session":{"valid":true,"sid":"s9"}})")));
        EXPECT_CALL(*client, send(RequestPath("/api/stats/summary")))
            .WillOnce(::testing::Invoke([](const HttpRequest& req){
                bool found = false;
                for(const auto& h : req.headers) found = found || (h.first == "X-FTL-SID" && h.second == "s9");
                return http_response(found ? 200 : 401, SUMMARY);
            }));
        return HttpClientPtr(std::move(client));
    });
    TaskContext context(config, report);
    task.run(context);
    EXPECT_TRUE(report.stats().has_value());
}

TEST_F(PiholeStatsTaskTest, FailurePropagatesToRegistry) {
    config.host = "  ";
    PiholeStatsTask task([](const ClientOptions&){
        auto client = std::make_unique<MockHttpClient>();
        EXPECT_CALL(*client, send(::testing::_)).Times(0);
        return HttpClientPtr(std::move(client));
    });
    TaskContext context(config, report);
    EXPECT_THROW(task.run(context), PiholeError);
    EXPECT_FALSE(report.stats().has_value());
}

}
