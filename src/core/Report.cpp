#include "Report.h"
#include <algorithm>

namespace netscene {

void Report::start_task(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    TaskResult tr;
    tr.task_name = name;
    tr.start_time = std::chrono::system_clock::now();
    results_.push_back(std::move(tr));
}

void Report::end_task(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(results_.begin(), results_.end(), [&](auto& r){ return r.task_name == name; });
    if(it != results_.end()) {
        it->end_time = std::chrono::system_clock::now();
    }
}

void Report::add_error(const std::string& task, const std::string& kind, const std::string& message){
    std::lock_guard<std::mutex> lock(mutex_);
    errors_.push_back({task, kind, message});
    auto it = std::find_if(results_.begin(), results_.end(), [&](auto& r){ return r.task_name == task; });
    if(it != results_.end()) it->ok = false;
}

void Report::set_devices(std::vector<Device> devices){
    std::lock_guard<std::mutex> lock(mutex_);
    devices_ = std::move(devices);
}

void Report::set_stats(Stats stats){
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = std::move(stats);
}

}
