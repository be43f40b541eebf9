#pragma once
#include "Config.h"
#include "Report.h"

namespace netscene {

struct TaskContext {
    TaskContext(const Config& cfg, Report& rep) : config(cfg), report(rep) {}
    const Config& config;
    Report& report;
};

}
