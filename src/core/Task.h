#pragma once
#include <string>
#include <memory>

namespace netscene {

struct TaskContext;

class Task {
public:
    virtual ~Task() = default;
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual void run(TaskContext& context) = 0;
};

using TaskPtr = std::unique_ptr<Task>;

}
