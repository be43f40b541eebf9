#pragma once
#include <string>
#include <ostream>
#include <nlohmann/json_fwd.hpp>

namespace netscene {

struct Device {
    std::string ip;  // dotted quad as found in the table text
    std::string mac; // xx:xx:xx:xx:xx:xx, lowercase

    bool operator==(const Device& o) const { return ip == o.ip && mac == o.mac; }
    bool operator!=(const Device& o) const { return !(*this == o); }
};

inline std::ostream& operator<<(std::ostream& os, const Device& d){
    return os << "Device{ip=" << d.ip << ", mac=" << d.mac << "}";
}

void to_json(nlohmann::json& j, const Device& d);

}
