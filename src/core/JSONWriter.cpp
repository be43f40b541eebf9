#include "JSONWriter.h"
#include "Config.h"
#include "Report.h"
#include "Utils.h"
#include "BuildInfo.h"
#include <nlohmann/json.hpp>
#include <sys/utsname.h>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace netscene {

namespace {

std::string hostname(){
    struct utsname u{};
    if(uname(&u) == 0) return u.nodename;
    return {};
}

}

std::string time_to_iso(std::chrono::system_clock::time_point tp){
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return os.str();
}

std::string JSONWriter::write(const Report& report, const Config& cfg) const {
    nlohmann::json root;
    root["meta"] = {
        {"tool", "netscene"},
        {"version", buildinfo::APP_VERSION},
        {"hostname", hostname()},
        {"generated_at", time_to_iso(std::chrono::system_clock::now())}
    };
    root["devices"] = report.devices();
    root["pihole"] = report.stats() ? nlohmann::json(*report.stats()) : nlohmann::json(nullptr);

    auto tasks = nlohmann::json::array();
    for(const auto& r : report.results()){
        auto dur = std::chrono::duration_cast<std::chrono::milliseconds>(r.end_time - r.start_time).count();
        tasks.push_back({
            {"task", r.task_name},
            {"ok", r.ok},
            {"start_time", time_to_iso(r.start_time)},
            {"end_time", time_to_iso(r.end_time)},
            {"duration_ms", dur}
        });
    }
    root["tasks"] = tasks;

    auto errors = nlohmann::json::array();
    for(const auto& e : report.errors()) errors.push_back({{"task", e.task}, {"kind", e.kind}, {"message", e.message}});
    root["errors"] = errors;

    bool pretty = cfg.pretty && !cfg.compact;
    return root.dump(pretty ? 2 : -1) + "\n";
}

std::string TextWriter::write(const Report& report) const {
    std::ostringstream os;
    if(const auto& s = report.stats()){
        os << "Pi-hole Stats\n";
        os << "  Domains blocked: " << utils::group_thousands(s->domains_blocked) << "\n";
        os << "  DNS queries today: " << utils::group_thousands(s->dns_queries_today) << "\n";
        os << "  Ads blocked today: " << utils::group_thousands(s->ads_blocked_today) << "\n";
        os << "  Ads percentage today: " << std::fixed << std::setprecision(2) << s->ads_percentage_today << "%\n";
        os << "  Status: " << s->status << "\n";
    }
    bool scanned = false;
    for(const auto& r : report.results()) if(r.task_name == "devices") scanned = true;
    if(scanned){
        if(report.stats()) os << "\n";
        os << std::left << std::setw(18) << "IP Address" << "MAC Address\n";
        for(const auto& d : report.devices()) os << std::left << std::setw(18) << d.ip << d.mac << "\n";
    }
    for(const auto& e : report.errors()) os << "error: " << e.task << ": " << e.message << "\n";
    return os.str();
}

}
