#pragma once
#include "Config.h"
#include <string>

namespace netscene {

class ConfigValidator {
public:
    // Normalizes cfg in place. Returns false (after printing the reason) when the
    // combination of options is unusable.
    bool validate(Config& cfg);
    // Fills cfg.password from --password-file or NETSCENE_PIHOLE_PASSWORD when unset.
    bool load_password(Config& cfg);
private:
    bool validate_task_names(const Config& cfg);
    static bool is_http_token(const std::string& s);
};

}
