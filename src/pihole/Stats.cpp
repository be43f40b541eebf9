#include "Stats.h"
#include "../core/Errors.h"
#include <nlohmann/json.hpp>

namespace netscene {

namespace {

const nlohmann::json& member(const nlohmann::json& doc, const char* key){
    auto it = doc.find(key);
    if(it == doc.end()) throw PiholeError(ErrorKind::JsonError, std::string("missing field `") + key + "`");
    return *it;
}

uint64_t counter(const nlohmann::json& doc, const char* key){
    const auto& v = member(doc, key);
    if(!v.is_number_unsigned()) throw PiholeError(ErrorKind::JsonError, std::string("field `") + key + "` is not a non-negative integer");
    return v.get<uint64_t>();
}

}

Stats parse_stats_json(const std::string& body){
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(body);
    } catch(const nlohmann::json::parse_error& ex) {
        throw PiholeError(ErrorKind::JsonError, ex.what());
    }
    if(!doc.is_object()) throw PiholeError(ErrorKind::JsonError, "expected a JSON object");

    Stats s;
    s.domains_blocked = counter(doc, "domains_being_blocked");
    s.dns_queries_today = counter(doc, "dns_queries_today");
    s.ads_blocked_today = counter(doc, "ads_blocked_today");
    const auto& pct = member(doc, "ads_percentage_today");
    if(!pct.is_number()) throw PiholeError(ErrorKind::JsonError, "field `ads_percentage_today` is not a number");
    s.ads_percentage_today = pct.get<double>();
    const auto& status = member(doc, "status");
    if(!status.is_string()) throw PiholeError(ErrorKind::JsonError, "field `status` is not a string");
    s.status = status.get<std::string>();
    return s;
}

void to_json(nlohmann::json& j, const Stats& s){
    j = nlohmann::json{
        {"domains_being_blocked", s.domains_blocked},
        {"dns_queries_today", s.dns_queries_today},
        {"ads_blocked_today", s.ads_blocked_today},
        {"ads_percentage_today", s.ads_percentage_today},
        {"status", s.status}
    };
}

std::ostream& operator<<(std::ostream& os, const Stats& s){
    return os << "Stats{domains_blocked=" << s.domains_blocked << ", dns_queries_today=" << s.dns_queries_today
              << ", ads_blocked_today=" << s.ads_blocked_today << ", ads_percentage_today=" << s.ads_percentage_today
              << ", status=" << s.status << "}";
}

}
