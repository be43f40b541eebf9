#include "ConfigValidator.h"
#include "Logging.h"
#include "TaskRegistry.h"
#include "Utils.h"
#include <algorithm>
#include <cstdlib>
#include <cctype>
#include <cstring>
#include <iostream>

namespace netscene {

bool ConfigValidator::is_http_token(const std::string& s){
    if(s.empty()) return false;
    static const char* extra = "!#$%&'*+-.^_`|~";
    for(char c : s){
        unsigned char u = static_cast<unsigned char>(c);
        if(std::isalnum(u)) continue;
        if(std::strchr(extra, c) != nullptr && c != '\0') continue;
        return false;
    }
    return true;
}

bool ConfigValidator::validate_task_names(const Config& cfg){
    const auto& known = default_task_names();
    for(const auto* list : {&cfg.enable_tasks, &cfg.disable_tasks}){
        for(const auto& name : *list){
            if(std::find(known.begin(), known.end(), name) == known.end()){
                std::cerr << "Unknown task: " << name << "\n";
                return false;
            }
        }
    }
    for(const auto& name : cfg.enable_tasks){
        if(std::find(cfg.disable_tasks.begin(), cfg.disable_tasks.end(), name) != cfg.disable_tasks.end()){
            std::cerr << "Cannot enable and disable the same task: " << name << "\n";
            return false;
        }
    }
    return true;
}

bool ConfigValidator::validate(Config& cfg){
    // pretty vs compact: if both set, compact wins
    if(cfg.pretty && cfg.compact) cfg.pretty = false;

    if(cfg.format != "json" && cfg.format != "text"){
        std::cerr << "Invalid --format value: " << cfg.format << "\n";
        return false;
    }
    if(cfg.timeout_seconds < 1 || cfg.timeout_seconds > 300){
        std::cerr << "--timeout must be between 1 and 300 seconds\n";
        return false;
    }
    if(!cfg.arp_file.empty() && cfg.arp_command_set){
        std::cerr << "--arp-command and --arp-file are mutually exclusive\n";
        return false;
    }
    if(cfg.arp_file.empty() && utils::split_ws(cfg.arp_command).empty()){
        std::cerr << "--arp-command cannot be empty\n";
        return false;
    }
    if(!is_http_token(cfg.session_header)){
        std::cerr << "Invalid --session-header value: " << cfg.session_header << "\n";
        return false;
    }
    if(!cfg.log_level.empty()){
        LogLevel lvl;
        if(!parse_log_level(cfg.log_level, lvl)){
            std::cerr << "Invalid --log-level value: " << cfg.log_level << "\n";
            return false;
        }
    }
    if(!validate_task_names(cfg)) return false;
    return load_password(cfg);
}

bool ConfigValidator::load_password(Config& cfg){
    if(!cfg.password_file.empty()){
        if(cfg.password){
            std::cerr << "--password and --password-file are mutually exclusive\n";
            return false;
        }
        auto lines = utils::read_lines(cfg.password_file);
        if(lines.empty()){
            std::cerr << "Cannot read password file: " << cfg.password_file << "\n";
            return false;
        }
        std::string pw = utils::trim(lines.front());
        if(!pw.empty()) cfg.password = pw;
        return true;
    }
    if(!cfg.password){
        const char* env = std::getenv("NETSCENE_PIHOLE_PASSWORD");
        if(env && *env){
            std::string pw = utils::trim(env);
            if(!pw.empty()) cfg.password = pw;
        }
    }
    return true;
}

}
