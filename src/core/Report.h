#pragma once
#include "../discovery/Device.h"
#include "../pihole/Stats.h"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace netscene {

struct TaskResult {
    std::string task_name;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    bool ok = true;
};

struct TaskError {
    std::string task;
    std::string kind;
    std::string message;
};

class Report {
public:
    void start_task(const std::string& name);
    void end_task(const std::string& name);
    void add_error(const std::string& task, const std::string& kind, const std::string& message);
    void set_devices(std::vector<Device> devices);
    void set_stats(Stats stats);

    const std::vector<TaskResult>& results() const { return results_; }
    const std::vector<TaskError>& errors() const { return errors_; }
    const std::vector<Device>& devices() const { return devices_; }
    const std::optional<Stats>& stats() const { return stats_; }
    bool has_errors() const { return !errors_.empty(); }
private:
    std::vector<TaskResult> results_;
    std::vector<TaskError> errors_;
    std::vector<Device> devices_;
    std::optional<Stats> stats_;
    std::mutex mutex_;
};

}
