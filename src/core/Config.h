#pragma once
#include <string>
#include <vector>
#include <optional>

namespace netscene {

struct Config {
    std::vector<std::string> enable_tasks; // if non-empty, only these
    std::vector<std::string> disable_tasks;
    // Pi-hole
    std::string host = "pi.hole";
    std::optional<std::string> password; // trimmed; empty input means none
    std::string password_file;
    int timeout_seconds = 10;
    std::string user_agent = "NetScene/1.0";
    std::string session_header = "X-Session-Credential";
    bool insecure = false; // skip TLS verification for https hosts
    // Device discovery
    std::string arp_command = "arp -a"; // split on whitespace, exec'd without a shell
    bool arp_command_set = false; // --arp-command given explicitly
    std::string arp_file; // read table text from file instead of running a command
    // Output
    std::string output_file;
    std::string format = "json"; // json | text
    bool pretty = false;
    bool compact = false; // wins over pretty
    std::string log_level; // empty = leave logger untouched
};

Config& config();
void set_config(const Config& c);

}
