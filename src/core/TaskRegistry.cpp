#include "TaskRegistry.h"
#include "TaskContext.h"
#include "Errors.h"
#include "Logging.h"
#include "../discovery/DeviceScanTask.h"
#include "../pihole/PiholeStatsTask.h"
#include <algorithm>

namespace netscene {

void TaskRegistry::register_task(TaskPtr task) {
    tasks_.push_back(std::move(task));
}

void TaskRegistry::register_all_default() {
    register_task(std::make_unique<DeviceScanTask>());
    register_task(std::make_unique<PiholeStatsTask>());
}

const std::vector<std::string>& default_task_names(){
    static const std::vector<std::string> names = {"devices", "pihole"};
    return names;
}

std::vector<std::string> TaskRegistry::names() const {
    std::vector<std::string> out;
    for(const auto& t : tasks_) out.push_back(t->name());
    return out;
}

void TaskRegistry::run_all(TaskContext& context) {
    const auto& cfg = context.config;
    auto is_enabled = [&](const std::string& name){
        if(!cfg.enable_tasks.empty()) {
            bool found = std::find(cfg.enable_tasks.begin(), cfg.enable_tasks.end(), name)!=cfg.enable_tasks.end();
            if(!found) return false;
        }
        if(!cfg.disable_tasks.empty()) {
            if(std::find(cfg.disable_tasks.begin(), cfg.disable_tasks.end(), name)!=cfg.disable_tasks.end()) return false;
        }
        return true;
    };
    for(auto& t : tasks_) {
        const std::string name = t->name();
        if(!is_enabled(name)) continue;
        Logger::instance().debug("Starting task: " + name);
        context.report.start_task(name);
        try {
            t->run(context);
        } catch(const PiholeError& ex) {
            context.report.add_error(name, to_string(ex.kind()), ex.what());
        } catch(const DiscoveryError& ex) {
            context.report.add_error(name, "DiscoveryError", ex.what());
        } catch(const std::exception& ex) {
            context.report.add_error(name, "Error", ex.what());
        }
        context.report.end_task(name);
        Logger::instance().debug("Finished task: " + name);
    }
}

}
