#pragma once
#include "Device.h"
#include <string>
#include <vector>
#include <memory>

namespace netscene {

struct Config;

// Supplies the raw neighbour table text. Throws DiscoveryError when it cannot.
class ArpSource {
public:
    virtual ~ArpSource() = default;
    virtual std::string describe() const = 0;
    virtual std::string read_table() = 0;
};

using ArpSourcePtr = std::unique_ptr<ArpSource>;

// Runs a command (argv[0] looked up on PATH, no shell) and captures stdout.
class CommandArpSource : public ArpSource {
public:
    explicit CommandArpSource(std::vector<std::string> argv);
    std::string describe() const override;
    std::string read_table() override;
private:
    std::vector<std::string> argv_;
};

class FileArpSource : public ArpSource {
public:
    explicit FileArpSource(std::string path) : path_(std::move(path)) {}
    std::string describe() const override { return path_; }
    std::string read_table() override;
private:
    std::string path_;
};

ArpSourcePtr make_arp_source(const Config& cfg);

std::vector<Device> discover_devices(ArpSource& source);

}
