#pragma once
#include "Task.h"
#include <vector>

namespace netscene {

class TaskRegistry {
public:
    void register_task(TaskPtr task);
    void register_all_default();
    void run_all(TaskContext& context);
    std::vector<std::string> names() const;
private:
    std::vector<TaskPtr> tasks_;
};

// Names accepted by --enable / --disable.
const std::vector<std::string>& default_task_names();

}
