#include "StatsValidator.h"
#include "../core/Errors.h"
#include "../core/Logging.h"

namespace netscene {

void validate_stats(const Stats& stats){
    if(stats.status.empty())
        throw PiholeError(ErrorKind::ValidationError, "Status field is empty");
    if(stats.ads_percentage_today > 100.0)
        throw PiholeError(ErrorKind::ValidationError, "Ads percentage cannot exceed 100%");
    Logger::instance().debug("Pi-hole response validation passed");
}

}
