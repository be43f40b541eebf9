#include <gtest/gtest.h>
#include "../src/core/JSONWriter.h"
#include "../src/core/Config.h"
#include "../src/core/Report.h"
#include <nlohmann/json.hpp>

namespace netscene {

class JSONWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        stats.domains_blocked = 1234567;
        stats.dns_queries_today = 5000;
        stats.ads_blocked_today = 1500;
        stats.ads_percentage_today = 30.0;
        stats.status = "enabled";
    }
    Config cfg;
    Report report;
    Stats stats;
};

TEST_F(JSONWriterTest, EmptyReportShape) {
    auto j = nlohmann::json::parse(JSONWriter().write(report, cfg));
    EXPECT_EQ(j["meta"]["tool"], "netscene");
    EXPECT_TRUE(j["meta"].contains("generated_at"));
    EXPECT_TRUE(j["devices"].is_array());
    EXPECT_TRUE(j["devices"].empty());
    EXPECT_TRUE(j["pihole"].is_null());
    EXPECT_TRUE(j["tasks"].empty());
    EXPECT_TRUE(j["errors"].empty());
}

TEST_F(JSONWriterTest, DevicesStatsAndTasks) {
    report.start_task("devices");
    report.set_devices({{"192.168.1.1", "aa:bb:cc:dd:ee:ff"}});
    report.end_task("devices");
    report.start_task("pihole");
    report.set_stats(stats);
    report.end_task("pihole");

    auto j = nlohmann::json::parse(JSONWriter().write(report, cfg));
    ASSERT_EQ(j["devices"].size(), 1u);
    EXPECT_EQ(j["devices"][0]["ip"], "192.168.1.1");
    EXPECT_EQ(j["devices"][0]["mac"], "aa:bb:cc:dd:ee:ff");
    EXPECT_EQ(j["pihole"]["domains_being_blocked"], 1234567);
    EXPECT_EQ(j["pihole"]["status"], "enabled");
    ASSERT_EQ(j["tasks"].size(), 2u);
    EXPECT_EQ(j["tasks"][1]["task"], "pihole");
    EXPECT_TRUE(j["tasks"][1]["ok"].get<bool>());
    EXPECT_GE(j["tasks"][1]["duration_ms"].get<long long>(), 0);
}

TEST_F(JSONWriterTest, ErrorsAreListed) {
    report.start_task("pihole");
    report.add_error("pihole", "JsonError", "JSON parsing failed: nope");
    report.end_task("pihole");
    auto j = nlohmann::json::parse(JSONWriter().write(report, cfg));
    ASSERT_EQ(j["errors"].size(), 1u);
    EXPECT_EQ(j["errors"][0]["kind"], "JsonError");
    EXPECT_FALSE(j["tasks"][0]["ok"].get<bool>());
}

TEST_F(JSONWriterTest, CompactByDefaultPrettyOnRequest) {
    std::string compact = JSONWriter().write(report, cfg);
    EXPECT_EQ(compact.find('\n'), compact.size() - 1);
    cfg.pretty = true;
    std::string pretty = JSONWriter().write(report, cfg);
    EXPECT_NE(pretty.find("\n  \"devices\""), std::string::npos);
}

TEST_F(JSONWriterTest, TextOutput) {
    report.start_task("devices");
    report.set_devices({{"10.0.0.1", "00:11:22:33:44:55"}});
    report.end_task("devices");
    report.set_stats(stats);
    std::string text = TextWriter().write(report);
    EXPECT_NE(text.find("Domains blocked: 1,234,567"), std::string::npos);
    EXPECT_NE(text.find("Ads percentage today: 30.00%"), std::string::npos);
    EXPECT_NE(text.find("IP Address"), std::string::npos);
    EXPECT_NE(text.find("10.0.0.1          00:11:22:33:44:55"), std::string::npos);
}

TEST_F(JSONWriterTest, TextOutputOmitsTableWhenDevicesNotRun) {
    report.add_error("pihole", "NetworkError", "Network request failed: refused");
    std::string text = TextWriter().write(report);
    EXPECT_EQ(text.find("IP Address"), std::string::npos);
    EXPECT_NE(text.find("error: pihole: Network request failed: refused"), std::string::npos);
}

TEST(TimeToIsoTest, FormatsUtcWithMillis) {
    auto tp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123LL));
    EXPECT_EQ(time_to_iso(tp), "2023-11-14T22:13:20.123Z");
}

}
