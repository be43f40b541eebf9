#include "DeviceScanTask.h"
#include "../core/TaskContext.h"
#include "../core/Logging.h"

namespace netscene {

void DeviceScanTask::run(TaskContext& context){
    auto source = make_source_(context.config);
    auto devices = discover_devices(*source);
    Logger::instance().info("Found " + std::to_string(devices.size()) + " devices");
    context.report.set_devices(std::move(devices));
}

}
