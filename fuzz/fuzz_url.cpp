#include "pihole/HostResolver.h"
#include "core/Errors.h"
#include "core/Logging.h"
#include <cstddef>
#include <cstdint>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    static bool quiet = [](){ netscene::Logger::instance().set_level(netscene::LogLevel::Error); return true; }();
    (void)quiet;
    std::string input(reinterpret_cast<const char*>(data), size);
    try {
        auto pair = netscene::resolve_endpoints(input);
        if (pair.legacy.url.authority() != pair.modern.url.authority()) __builtin_trap();
    } catch (const netscene::PiholeError&) {
        // rejected hosts are expected
    }
    return 0;
}
