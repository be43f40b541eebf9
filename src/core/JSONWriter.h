#pragma once
#include <string>
#include <chrono>

namespace netscene {

class Report;
struct Config;

class JSONWriter {
public:
    // compact unless cfg.pretty and not cfg.compact
    std::string write(const Report& report, const Config& cfg) const;
};

// Plain-text rendering: a stats list followed by the device table.
class TextWriter {
public:
    std::string write(const Report& report) const;
};

std::string time_to_iso(std::chrono::system_clock::time_point tp);

}
