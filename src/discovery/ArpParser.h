#pragma once
#include "Device.h"
#include <string>
#include <vector>

namespace netscene {

// Extracts one Device per line holding an IPv4 token followed later by a MAC token
// (six hex pairs joined consistently by ':' or '-'). Lines without such a pair are
// skipped. Order follows the input; duplicates are kept.
std::vector<Device> parse_arp_output(const std::string& output);

// Same rule applied to a single line.
bool parse_arp_line(const std::string& line, Device& out);

}
