#include "Url.h"
#include "Errors.h"
#include "Utils.h"
#include <cctype>
#include <algorithm>
#include <cstring>
#include <vector>

namespace netscene {

namespace {

[[noreturn]] void fail(const std::string& why){ throw PiholeError(ErrorKind::InvalidUrl, why); }

bool is_forbidden_host_char(unsigned char c){
    if(c <= 0x20 || c == 0x7F) return true;
    static const char* forbidden = "#%/:<>?@[\\]^|";
    return std::strchr(forbidden, c) != nullptr;
}

bool all_digits(const std::string& s){
    if(s.empty()) return false;
    for(char c: s) if(!std::isdigit(static_cast<unsigned char>(c))) return false;
    return true;
}

// WHATWG IPv4 number: decimal, 0x-prefixed hex or 0-prefixed octal. Values past
// 2^32 saturate so callers only need range checks.
bool parse_ipv4_number(std::string part, uint64_t& out){
    unsigned radix = 10;
    if(part.size() >= 2 && part[0] == '0' && (part[1] == 'x' || part[1] == 'X')){
        radix = 16; part = part.substr(2);
    } else if(part.size() >= 2 && part[0] == '0'){
        radix = 8; part = part.substr(1);
    }
    out = 0;
    for(char c : part){
        unsigned d;
        if(c >= '0' && c <= '9') d = static_cast<unsigned>(c - '0');
        else if(radix == 16 && std::isxdigit(static_cast<unsigned char>(c))) d = static_cast<unsigned>(std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
        else return false;
        if(d >= radix) return false;
        out = std::min<uint64_t>(out * radix + d, uint64_t(1) << 33);
    }
    return true;
}

std::vector<std::string> split_labels(const std::string& host){
    std::vector<std::string> parts;
    size_t start = 0;
    while(true){
        auto dot = host.find('.', start);
        parts.push_back(host.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if(dot == std::string::npos) break;
        start = dot + 1;
    }
    if(parts.size() > 1 && parts.back().empty()) parts.pop_back();
    return parts;
}

// A host whose last label is a number is an IPv4 literal (shorthand such as 127.1 or
// 0x7f.1 included). Returns it in dotted-decimal form, or the host unchanged otherwise.
std::string canonical_host(const std::string& host){
    auto parts = split_labels(host);
    uint64_t ignored;
    const std::string& last = parts.back();
    if(last.empty() || !(all_digits(last) || parse_ipv4_number(last, ignored))) return host;

    if(parts.size() > 4) fail("invalid IPv4 address");
    std::vector<uint64_t> numbers;
    for(const auto& p : parts){
        uint64_t n;
        if(p.empty() || !parse_ipv4_number(p, n)) fail("invalid IPv4 address");
        numbers.push_back(n);
    }
    for(size_t i = 0; i + 1 < numbers.size(); ++i) if(numbers[i] > 255) fail("invalid IPv4 address");
    if(numbers.back() >= (uint64_t(1) << (8 * (5 - numbers.size())))) fail("invalid IPv4 address");

    uint64_t addr = numbers.back();
    for(size_t i = 0; i + 1 < numbers.size(); ++i) addr += numbers[i] << (8 * (3 - i));
    return std::to_string((addr >> 24) & 0xFF) + "." + std::to_string((addr >> 16) & 0xFF) + "."
         + std::to_string((addr >> 8) & 0xFF) + "." + std::to_string(addr & 0xFF);
}

void check_ipv6(const std::string& inner){
    if(inner.empty()) fail("invalid IPv6 address");
    int colons = 0;
    for(char c: inner){
        if(c == ':') { ++colons; continue; }
        if(c == '.' || std::isxdigit(static_cast<unsigned char>(c))) continue;
        fail("invalid IPv6 address");
    }
    if(colons < 2) fail("invalid IPv6 address");
}

}

uint16_t default_port(const std::string& scheme){
    if(scheme == "https") return 443;
    return 80;
}

Url Url::parse(const std::string& input){
    Url u;
    auto sep = input.find("://");
    if(sep == std::string::npos){
        if(input.find(':') == std::string::npos) fail("relative URL without a base");
        fail("unsupported scheme");
    }
    u.scheme_ = utils::to_lower(input.substr(0, sep));
    if(u.scheme_ != "http" && u.scheme_ != "https") fail("unsupported scheme");

    std::string rest = input.substr(sep + 3);
    auto auth_end = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, auth_end);
    std::string tail = auth_end == std::string::npos ? std::string() : rest.substr(auth_end);

    auto at = authority.rfind('@');
    if(at != std::string::npos){
        u.userinfo_ = authority.substr(0, at);
        authority = authority.substr(at + 1);
    }

    std::string host, port_str;
    bool has_port = false;
    if(!authority.empty() && authority[0] == '['){
        auto close = authority.find(']');
        if(close == std::string::npos) fail("invalid IPv6 address");
        check_ipv6(authority.substr(1, close - 1));
        host = utils::to_lower(authority.substr(0, close + 1));
        std::string after = authority.substr(close + 1);
        if(!after.empty()){
            if(after[0] != ':') fail("invalid IPv6 address");
            has_port = true; port_str = after.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        host = authority.substr(0, colon);
        if(colon != std::string::npos){ has_port = true; port_str = authority.substr(colon + 1); }
        if(host.empty()) fail("empty host");
        for(char c: host) if(is_forbidden_host_char(static_cast<unsigned char>(c))) fail("invalid domain character");
        host = utils::to_lower(host);
        host = canonical_host(host);
    }
    if(host.empty()) fail("empty host");
    u.host_ = host;

    if(has_port && !port_str.empty()){
        if(!all_digits(port_str) || port_str.size() > 5) fail("invalid port number");
        unsigned long p = std::stoul(port_str);
        if(p > 65535) fail("invalid port number");
        if(p != default_port(u.scheme_)) u.port_ = static_cast<uint16_t>(p);
    }

    auto hash = tail.find('#');
    if(hash != std::string::npos){ u.fragment_ = tail.substr(hash + 1); tail = tail.substr(0, hash); }
    auto q = tail.find('?');
    if(q != std::string::npos){ u.query_ = tail.substr(q + 1); tail = tail.substr(0, q); }
    for(char c: tail) if(static_cast<unsigned char>(c) < 0x20 || c == ' ') fail("invalid path character");
    u.set_path(tail);
    return u;
}

namespace {

// RFC 3986 5.2.4
std::string remove_dot_segments(const std::string& path){
    std::vector<std::string> out;
    size_t start = 1;
    bool trailing_slash = false;
    while(start <= path.size()){
        auto slash = path.find('/', start);
        std::string seg = path.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        trailing_slash = seg == "." || seg == "..";
        if(seg == ".."){ if(!out.empty()) out.pop_back(); }
        else if(seg != ".") out.push_back(seg);
        if(slash == std::string::npos) break;
        start = slash + 1;
    }
    std::string result;
    for(const auto& seg : out) result += "/" + seg;
    if(trailing_slash || result.empty()) result += "/";
    return result;
}

}

Url Url::resolve(const std::string& reference) const {
    std::string ref = utils::trim(reference);
    auto scheme_end = ref.find("://");
    if(scheme_end != std::string::npos && ref.find_first_of("/?#") > scheme_end) return parse(ref);
    if(utils::starts_with(ref, "//")) return parse(scheme_ + ":" + ref);

    std::string base = scheme_ + "://" + (userinfo_.empty() ? "" : userinfo_ + "@") + authority();
    if(ref.empty()) return parse(base + target());
    if(ref[0] == '#') return parse(base + target() + ref);
    if(ref[0] == '?') return parse(base + path_ + ref);

    auto tail_start = ref.find_first_of("?#");
    std::string ref_path = ref.substr(0, tail_start);
    std::string tail = tail_start == std::string::npos ? std::string() : ref.substr(tail_start);
    if(ref_path[0] != '/') ref_path = path_.substr(0, path_.rfind('/') + 1) + ref_path;
    return parse(base + remove_dot_segments(ref_path) + tail);
}

uint16_t Url::port_or_default() const { return port_ ? *port_ : default_port(scheme_); }

void Url::set_path(const std::string& path){
    if(path.empty() || path[0] != '/') path_ = "/" + path;
    else path_ = path;
}

std::string Url::host_for_connect() const {
    if(host_.size() >= 2 && host_.front() == '[' && host_.back() == ']') return host_.substr(1, host_.size() - 2);
    return host_;
}

std::string Url::authority() const {
    return port_ ? host_ + ":" + std::to_string(*port_) : host_;
}

std::string Url::target() const {
    return query_ ? path_ + "?" + *query_ : path_;
}

std::string Url::to_string() const {
    std::string s = scheme_ + "://";
    if(!userinfo_.empty()) s += userinfo_ + "@";
    s += authority();
    s += target();
    if(fragment_) s += "#" + *fragment_;
    return s;
}

}
