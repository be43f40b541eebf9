#include "Device.h"
#include <nlohmann/json.hpp>

namespace netscene {

void to_json(nlohmann::json& j, const Device& d){
    j = nlohmann::json{{"ip", d.ip}, {"mac", d.mac}};
}

}
