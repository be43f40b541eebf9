#include "discovery/ArpParser.h"
#include "core/Logging.h"
#include <cstddef>
#include <cstdint>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    static bool quiet = [](){ netscene::Logger::instance().set_level(netscene::LogLevel::Error); return true; }();
    (void)quiet;
    std::string input(reinterpret_cast<const char*>(data), size);
    auto devices = netscene::parse_arp_output(input);
    for (const auto& d : devices) {
        // every emitted MAC is normalized
        if (d.mac.size() != 17 || d.mac.find('-') != std::string::npos) __builtin_trap();
    }
    return 0;
}
