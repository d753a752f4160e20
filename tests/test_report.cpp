#include <gtest/gtest.h>
#include "../src/core/report/report.hpp"
#include "test_support.hpp"
#include <cmath>
#include <limits>

using namespace serverscore;
using namespace serverscore::report;

namespace {

json sample_report_json() {
    return json::parse(R"({
        "id": "r-1",
        "server_id": "srv-42",
        "counter": 17,
        "nonce": "abc",
        "client_timestamp_ms": 1704067200000,
        "created_at": "2024-01-01T00:00:00.000Z",
        "payload_hash": "",
        "signature": "",
        "unknown_field": {"ignored": true},
        "payload": {
            "active_players": [
                {"name": "Steve", "uuid": "11111111-1111-1111-1111-111111111111"},
                "Alex"
            ],
            "max_players": 100,
            "tps_millis": 55,
            "uptime_ms": 3600000,
            "plugins": ["Level114", "WorldEdit"],
            "memory_ram_info": {
                "free_memory_bytes": 400,
                "used_memory_bytes": 600,
                "total_memory_bytes": 1000
            },
            "system_info": {
                "cpu_cores": 4,
                "cpu_model": "Ryzen",
                "uptime_ms": 7200000
            }
        }
    })");
}

} // namespace

TEST(ReportTest, ParsesCollectorJson) {
    auto parsed = Report::from_json(sample_report_json());
    ASSERT_TRUE(parsed.is_ok()) << parsed.error().to_string();

    const Report& r = parsed.value();
    EXPECT_EQ(r.server_id, "srv-42");
    EXPECT_EQ(r.counter, 17u);
    EXPECT_EQ(r.created_at_ms, 1704067200000ULL);
    EXPECT_EQ(r.payload.max_players, 100);
    EXPECT_EQ(r.payload.tps_millis, 55);
    ASSERT_EQ(r.payload.player_count(), 2u);
    EXPECT_EQ(r.payload.active_players[1].name, "Alex");
    EXPECT_EQ(r.payload.active_players[1].uuid, ZERO_UUID);
    EXPECT_EQ(r.payload.system_info.cpu_cores, 4);
    EXPECT_EQ(r.payload.system_info.cpu_threads, 1);
    EXPECT_EQ(r.payload.memory().total_bytes, 1000);
    EXPECT_EQ(r.payload.effective_uptime_ms(), 7200000);
}

TEST(ReportTest, DerivedPayloadValues) {
    Payload p;
    p.tps_millis = 50;
    p.max_players = 20;
    p.active_players.resize(5);
    p.plugins = {"  level114 "};
    EXPECT_DOUBLE_EQ(p.actual_tps(), 20.0);
    EXPECT_DOUBLE_EQ(p.player_ratio(), 0.25);
    EXPECT_TRUE(p.has_plugin("Level114"));
    EXPECT_FALSE(p.has_plugin("Essentials"));

    p.tps_millis = 0;
    EXPECT_DOUBLE_EQ(p.actual_tps(), 0.0);
}

TEST(ReportTest, MemoryFallsBackToSystemInfo) {
    Payload p;
    p.system_info.memory_ram_info.total_bytes = 100;
    p.system_info.memory_ram_info.free_bytes = 40;
    EXPECT_EQ(p.memory().total_bytes, 100);
    EXPECT_DOUBLE_EQ(p.memory().free_ratio(), 0.4);
}

TEST(ReportTest, MissingRequiredFieldsAreMalformed) {
    for (const char* field : {"server_id", "counter", "payload"}) {
        json data = sample_report_json();
        data.erase(field);
        auto parsed = Report::from_json(data);
        ASSERT_TRUE(parsed.is_err()) << field;
        EXPECT_EQ(parsed.error().code(), ErrorCode::MalformedReport);
    }

    json no_tps = sample_report_json();
    no_tps["payload"].erase("tps_millis");
    EXPECT_TRUE(Report::from_json(no_tps).is_err());

    json no_max = sample_report_json();
    no_max["payload"].erase("max_players");
    EXPECT_TRUE(Report::from_json(no_max).is_err());
}

TEST(ReportTest, WrongTypesAreMalformed) {
    json string_counter = sample_report_json();
    string_counter["counter"] = "17";
    EXPECT_TRUE(Report::from_json(string_counter).is_err());

    json negative_counter = sample_report_json();
    negative_counter["counter"] = -1;
    EXPECT_TRUE(Report::from_json(negative_counter).is_err());

    json string_uptime = sample_report_json();
    string_uptime["payload"]["uptime_ms"] = "long";
    EXPECT_TRUE(Report::from_json(string_uptime).is_err());

    EXPECT_TRUE(Report::from_json(json::array()).is_err());
    EXPECT_TRUE(Report::parse("{not json").is_err());
}

TEST(ReportTest, HugeNumbersSaturate) {
    json data = sample_report_json();
    data["payload"]["tps_millis"] = 1e300;
    data["payload"]["max_players"] = 18446744073709551615ULL;
    data["payload"]["uptime_ms"] = -1e300;

    auto parsed = Report::from_json(data);
    ASSERT_TRUE(parsed.is_ok()) << parsed.error().to_string();
    EXPECT_EQ(parsed.value().payload.tps_millis, std::numeric_limits<int64_t>::max());
    EXPECT_EQ(parsed.value().payload.max_players, std::numeric_limits<int64_t>::max());
    EXPECT_EQ(parsed.value().payload.uptime_ms, std::numeric_limits<int64_t>::min());

    data["payload"]["tps_millis"] = 49.9;
    EXPECT_EQ(Report::from_json(data).value().payload.tps_millis, 49);
}

TEST(ReportTest, NonFiniteNumbersAreMalformed) {
    json data = sample_report_json();
    data["payload"]["tps_millis"] = std::numeric_limits<double>::infinity();
    auto parsed = Report::from_json(data);
    ASSERT_TRUE(parsed.is_err());
    EXPECT_EQ(parsed.error().code(), ErrorCode::MalformedReport);

    data["payload"]["tps_millis"] = std::nan("");
    EXPECT_TRUE(Report::from_json(data).is_err());
}

TEST(ReportTest, ClientTimestampStandsInForCreatedAt) {
    json data = sample_report_json();
    data.erase("created_at");
    data["client_timestamp_ms"] = 1704067300000ULL;
    auto parsed = Report::from_json(data);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().created_at_ms, 1704067300000ULL);

    data.erase("client_timestamp_ms");
    EXPECT_TRUE(Report::from_json(data).is_err());
}

TEST(ReportTest, CanonicalPayloadIsSortedAndCompact) {
    Report r;
    r.payload.plugins = {"b", "a"};

    const std::string expected =
        R"({"active_players":[],"max_players":20,)"
        R"("memory_ram_info":{"free_bytes":0,"total_bytes":0,"used_bytes":0},)"
        R"("plugins":["a","b"],)"
        R"("system_info":{"cpu_cores":1,"cpu_model":"Unknown CPU","cpu_threads":1,)"
        R"("java_version":"Unknown",)"
        R"("memory_ram_info":{"free_bytes":0,"total_bytes":0,"used_bytes":0},)"
        R"("os_arch":"Unknown","os_name":"Unknown","os_version":"Unknown","uptime_ms":0},)"
        R"("tps_millis":50,"uptime_ms":0})";
    EXPECT_EQ(r.canonical_payload(), expected);
}

TEST(ReportTest, CanonicalPayloadOrdersPlayersAndEscapes) {
    Report r;
    ActivePlayer zoe{"Zo\xc3\xab", "22222222-2222-2222-2222-222222222222"};
    ActivePlayer bob{"Bob", "11111111-1111-1111-1111-111111111111"};
    r.payload.active_players = {zoe, bob};

    std::string canonical = r.canonical_payload();
    EXPECT_LT(canonical.find("Bob"), canonical.find("Zo"));
    EXPECT_NE(canonical.find("Zo\\u00eb"), std::string::npos);

    // Order of arrival does not change the signed bytes
    Report swapped = r;
    swapped.payload.active_players = {bob, zoe};
    EXPECT_EQ(swapped.canonical_payload_bytes(), r.canonical_payload_bytes());
}

TEST(ReportTest, WireFormatParsesBack) {
    Report original = test_support::make_report(5, test_support::NOW_MS);
    auto parsed = Report::from_json(original.to_json());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().created_at_ms, original.created_at_ms);
    EXPECT_EQ(parsed.value().canonical_payload(), original.canonical_payload());
}
