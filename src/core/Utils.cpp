#include "Utils.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <iterator>

namespace netscene {
namespace utils {

static bool is_ws(char c){ return c==' ' || c=='\t' || c=='\n' || c=='\r' || c=='\f' || c=='\v'; }

std::string trim(const std::string& s){
    size_t b = 0, e = s.size();
    while(b < e && is_ws(s[b])) ++b;
    while(e > b && is_ws(s[e-1])) --e;
    return s.substr(b, e-b);
}

std::string to_lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

bool starts_with(const std::string& s, const std::string& prefix){
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split_csv(const std::string& s){
    std::vector<std::string> out; std::string cur;
    for(char c: s){ if(c==','){ if(!cur.empty()) out.push_back(cur); cur.clear(); } else cur.push_back(c); }
    if(!cur.empty()) out.push_back(cur);
    return out;
}

std::vector<std::string> split_ws(const std::string& s){
    std::vector<std::string> out; std::istringstream is(s); std::string tok;
    while(is >> tok) out.push_back(tok);
    return out;
}

std::vector<std::string> read_lines(const std::string& path){
    std::vector<std::string> lines; std::ifstream f(path); std::string line;
    while(std::getline(f, line)) lines.push_back(line);
    return lines;
}

bool read_file(const std::string& path, std::string& out){
    std::ifstream f(path, std::ios::binary);
    if(!f) return false;
    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    return !f.bad();
}

bool is_valid_utf8(const std::string& s){
    const auto* p = reinterpret_cast<const unsigned char*>(s.data());
    size_t i = 0, n = s.size();
    while(i < n){
        unsigned char c = p[i];
        size_t len; unsigned cp;
        if(c < 0x80){ ++i; continue; }
        else if((c & 0xE0) == 0xC0){ len = 2; cp = c & 0x1F; }
        else if((c & 0xF0) == 0xE0){ len = 3; cp = c & 0x0F; }
        else if((c & 0xF8) == 0xF0){ len = 4; cp = c & 0x07; }
        else return false;
        if(i + len > n) return false;
        for(size_t k=1; k<len; ++k){
            if((p[i+k] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (p[i+k] & 0x3F);
        }
        // overlong, surrogate and out-of-range forms
        if((len==2 && cp < 0x80) || (len==3 && cp < 0x800) || (len==4 && cp < 0x10000)) return false;
        if(cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

std::string group_thousands(unsigned long long v){
    std::string digits = std::to_string(v), out;
    int count = 0;
    for(auto it = digits.rbegin(); it != digits.rend(); ++it){
        if(count && count % 3 == 0) out.push_back(',');
        out.push_back(*it); ++count;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

}
}
