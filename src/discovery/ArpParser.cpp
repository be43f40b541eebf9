#include "ArpParser.h"
#include "../core/Logging.h"
#include <sstream>
#include <cctype>

namespace netscene {

namespace {

constexpr size_t MAC_LEN = 17;
constexpr size_t NONE = static_cast<size_t>(-1);

bool is_digit(char c){ return c >= '0' && c <= '9'; }
bool is_hex(char c){ return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

// Six hex pairs starting at pos, joined by one separator (':' or '-') throughout.
bool mac_at(const std::string& line, size_t pos){
    if(pos + MAC_LEN > line.size()) return false;
    char sep = line[pos + 2];
    if(sep != ':' && sep != '-') return false;
    for(size_t i = 0; i < MAC_LEN; ++i){
        char c = line[pos + i];
        if(i % 3 == 2){ if(c != sep) return false; }
        else if(!is_hex(c)) return false;
    }
    return true;
}

// Run of 1-3 digits starting at pos. Returns the longest length, 0 if none.
size_t digit_run(const std::string& line, size_t pos){
    size_t n = 0;
    while(n < 3 && pos + n < line.size() && is_digit(line[pos + n])) ++n;
    return n;
}

// Matches three "digits." groups at pos. Returns the offset where the last group
// starts, NONE otherwise. A shorter digit run can never be followed by '.', so the
// greedy run is the only candidate for each of these groups.
size_t ipv4_prefix(const std::string& line, size_t pos){
    for(int g = 0; g < 3; ++g){
        size_t n = digit_run(line, pos);
        if(n == 0 || pos + n >= line.size() || line[pos + n] != '.') return NONE;
        pos += n + 1;
    }
    return pos;
}

// next_mac[p]: first offset >= p holding a MAC token with no '\r' in between, or NONE.
std::vector<size_t> mac_index(const std::string& line){
    std::vector<size_t> next(line.size() + 1, NONE);
    for(size_t p = line.size(); p-- > 0;){
        if(mac_at(line, p)) next[p] = p;
        else if(line[p] == '\r') next[p] = NONE;
        else next[p] = next[p + 1];
    }
    return next;
}

std::string normalize_mac(const std::string& token){
    std::string mac(token);
    for(auto& c : mac){
        if(c == '-') c = ':';
        else c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return mac;
}

}

bool parse_arp_line(const std::string& line, Device& out){
    std::vector<size_t> next_mac;
    for(size_t start = 0; start < line.size(); ++start){
        if(!is_digit(line[start])) continue;
        size_t last = ipv4_prefix(line, start);
        if(last == NONE) continue;
        size_t run = digit_run(line, last);
        if(run == 0) continue;
        if(next_mac.empty()) next_mac = mac_index(line);
        // leftmost IPv4 token first, longest final group first, then the nearest MAC
        for(size_t n = run; n > 0; --n){
            size_t mac = next_mac[last + n];
            if(mac == NONE) continue;
            out.ip = line.substr(start, last + n - start);
            out.mac = normalize_mac(line.substr(mac, MAC_LEN));
            return true;
        }
    }
    return false;
}

std::vector<Device> parse_arp_output(const std::string& output){
    Logger::instance().debug("Parsing ARP table output");
    std::vector<Device> devices;
    std::istringstream is(output);
    std::string line;
    while(std::getline(is, line)){
        if(!line.empty() && line.back() == '\r') line.pop_back();
        Device d;
        if(parse_arp_line(line, d)) devices.push_back(std::move(d));
    }
    Logger::instance().debug("Discovered " + std::to_string(devices.size()) + " devices");
    return devices;
}

}
