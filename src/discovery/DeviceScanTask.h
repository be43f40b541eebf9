#pragma once
#include "../core/Task.h"
#include "ArpSource.h"
#include <functional>

namespace netscene {

class DeviceScanTask : public Task {
public:
    using SourceFactory = std::function<ArpSourcePtr(const Config&)>;
    DeviceScanTask() : make_source_(make_arp_source) {}
    explicit DeviceScanTask(SourceFactory factory) : make_source_(std::move(factory)) {}

    std::string name() const override { return "devices"; }
    std::string description() const override { return "Lists IPv4/MAC pairs from the neighbour (ARP) table"; }
    void run(TaskContext& context) override;
private:
    SourceFactory make_source_;
};

}
