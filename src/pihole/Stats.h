#pragma once
#include <cstdint>
#include <string>
#include <ostream>
#include <nlohmann/json_fwd.hpp>

namespace netscene {

// Summary counters reported by a Pi-hole instance. Only ever built whole from one
// JSON document by parse_stats_json().
struct Stats {
    uint64_t domains_blocked = 0;
    uint64_t dns_queries_today = 0;
    uint64_t ads_blocked_today = 0;
    double ads_percentage_today = 0.0;
    std::string status;

    bool operator==(const Stats& o) const {
        return domains_blocked == o.domains_blocked && dns_queries_today == o.dns_queries_today
            && ads_blocked_today == o.ads_blocked_today && ads_percentage_today == o.ads_percentage_today
            && status == o.status;
    }
    bool operator!=(const Stats& o) const { return !(*this == o); }
};

std::ostream& operator<<(std::ostream& os, const Stats& s);

// Parses the summary document. Throws PiholeError(JsonError) on malformed JSON or a
// document that does not have the expected members and types.
Stats parse_stats_json(const std::string& body);

// Serializes with the Pi-hole wire member names.
void to_json(nlohmann::json& j, const Stats& s);

}
