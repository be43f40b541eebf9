#pragma once
#include <string>
#include <vector>

namespace netscene {
namespace utils {

std::string trim(const std::string& s);
std::string to_lower(std::string s);
bool starts_with(const std::string& s, const std::string& prefix);
std::vector<std::string> split_csv(const std::string& s);
std::vector<std::string> split_ws(const std::string& s);
std::vector<std::string> read_lines(const std::string& path);
bool read_file(const std::string& path, std::string& out);
bool is_valid_utf8(const std::string& s);
// Groups digits by thousands ("1,234,567").
std::string group_thousands(unsigned long long v);

}
}
