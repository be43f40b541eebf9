#pragma once
#include "Config.h"
#include <string>

namespace netscene {

class ArgumentParser {
public:
    // Returns false when the program should exit without running tasks: after
    // --help/--version (exit_code 0) or on a usage error (exit_code 2).
    bool parse(int argc, char** argv, Config& cfg);
    int exit_code() const { return exit_code_; }
    static void print_help();
    static void print_version();
private:
    int exit_code_ = 0;
};

}
