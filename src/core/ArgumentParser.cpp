#include "ArgumentParser.h"
#include "Utils.h"
#include "BuildInfo.h"
#include <functional>
#include <iostream>
#include <vector>

namespace netscene {

void ArgumentParser::print_help(){
    std::cout << "netscene options:\n";
    struct Line { std::string name; std::string help; };
    static const std::vector<Line> lines = {
        {"--enable name[,name...]", "Only run specified tasks (devices, pihole)"},
        {"--disable name[,name...]", "Disable specified tasks"},
        {"--host HOST", "Pi-hole host or URL (default pi.hole)"},
        {"--password PW", "Pi-hole password (or NETSCENE_PIHOLE_PASSWORD)"},
        {"--password-file FILE", "Read Pi-hole password from FILE"},
        {"--timeout SECONDS", "Per-request timeout (default 10)"},
        {"--user-agent UA", "HTTP User-Agent"},
        {"--session-header NAME", "Header carrying the session id"},
        {"--insecure", "Skip TLS certificate verification"},
        {"--arp-command CMD", "Command printing the ARP table (default 'arp -a')"},
        {"--arp-file FILE", "Read ARP table text from FILE"},
        {"--output FILE", "Write output to FILE (default stdout)"},
        {"--format json|text", "Output format"},
        {"--pretty", "Pretty-print JSON"},
        {"--compact", "Minified JSON output"},
        {"--log-level LEVEL", "error, warn, info, debug, trace"},
        {"--verbose", "Same as --log-level debug"},
        {"--version", "Print version & exit"},
        {"--help", "Show this help"}
    };
    for(const auto& l : lines){ std::cout << "  " << l.name; if(l.name.size() < 28) for(size_t i=l.name.size(); i<28; ++i) std::cout << ' '; else std::cout << ' '; std::cout << l.help << "\n"; }
}

void ArgumentParser::print_version(){
    std::cout << "netscene " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT << ", compiler=" << buildinfo::COMPILER_ID
              << " " << buildinfo::COMPILER_VERSION << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg){
    exit_code_ = 0;
    enum class ArgKind { None, String, Int, CSV };
    struct FlagSpec { const char* name; ArgKind kind; std::function<bool(const std::string&)> apply; };
    auto need_int = [](const std::string& v, const char* flag, int& out){
        try { size_t pos = 0; out = std::stoi(v, &pos); if(pos != v.size()) throw std::invalid_argument(v); return true; }
        catch(const std::exception&) { std::cerr << "Invalid integer for " << flag << "\n"; return false; }
    };
    std::vector<FlagSpec> specs = {
        {"--enable", ArgKind::CSV, [&](const std::string& v){ cfg.enable_tasks = utils::split_csv(v); return true; }},
        {"--disable", ArgKind::CSV, [&](const std::string& v){ cfg.disable_tasks = utils::split_csv(v); return true; }},
        {"--host", ArgKind::String, [&](const std::string& v){ cfg.host = v; return true; }},
        {"--password", ArgKind::String, [&](const std::string& v){
            std::string pw = utils::trim(v);
            if(pw.empty()) cfg.password.reset(); else cfg.password = pw;
            return true; }},
        {"--password-file", ArgKind::String, [&](const std::string& v){ cfg.password_file = v; return true; }},
        {"--timeout", ArgKind::Int, [&](const std::string& v){ return need_int(v, "--timeout", cfg.timeout_seconds); }},
        {"--user-agent", ArgKind::String, [&](const std::string& v){ cfg.user_agent = v; return true; }},
        {"--session-header", ArgKind::String, [&](const std::string& v){ cfg.session_header = v; return true; }},
        {"--insecure", ArgKind::None, [&](const std::string&){ cfg.insecure = true; return true; }},
        {"--arp-command", ArgKind::String, [&](const std::string& v){ cfg.arp_command = v; cfg.arp_command_set = true; return true; }},
        {"--arp-file", ArgKind::String, [&](const std::string& v){ cfg.arp_file = v; return true; }},
        {"--output", ArgKind::String, [&](const std::string& v){ cfg.output_file = v; return true; }},
        {"--format", ArgKind::String, [&](const std::string& v){ cfg.format = v; return true; }},
        {"--pretty", ArgKind::None, [&](const std::string&){ cfg.pretty = true; return true; }},
        {"--compact", ArgKind::None, [&](const std::string&){ cfg.compact = true; return true; }},
        {"--log-level", ArgKind::String, [&](const std::string& v){ cfg.log_level = v; return true; }},
        {"--verbose", ArgKind::None, [&](const std::string&){ cfg.log_level = "debug"; return true; }}
    };
    auto find_spec = [&](const std::string& flag)->FlagSpec*{ for(auto& s: specs) if(flag==s.name) return &s; return nullptr; };
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--help"){ print_help(); return false; }
        if(a=="--version"){ print_version(); return false; }
        auto* spec = find_spec(a);
        if(!spec){ std::cerr << "Unknown arg: " << a << "\n"; exit_code_ = 2; return false; }
        std::string val;
        if(spec->kind != ArgKind::None){
            if(i+1>=argc){ std::cerr << "Missing value for " << a << "\n"; exit_code_ = 2; return false; }
            val = argv[++i];
        }
        if(!spec->apply(val)){ exit_code_ = 2; return false; }
    }
    return true;
}

}
