#include "core/ArgumentParser.h"
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/JSONWriter.h"
#include "core/Logging.h"
#include "core/Report.h"
#include "core/TaskContext.h"
#include "core/TaskRegistry.h"
#include <cstdlib>
#include <fstream>
#include <iostream>

using namespace netscene;

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    if(const char* env = std::getenv("NETSCENE_LOG")){
        LogLevel lvl;
        if(parse_log_level(env, lvl)) Logger::instance().set_level(lvl);
    }

    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)){
        if(parser.exit_code() != 0) ArgumentParser::print_help();
        return parser.exit_code();
    }
    ConfigValidator validator;
    if(!validator.validate(cfg)) return 2;
    if(!cfg.log_level.empty()){
        LogLevel lvl;
        if(parse_log_level(cfg.log_level, lvl)) Logger::instance().set_level(lvl);
    }
    set_config(cfg);

    Logger::instance().info("Starting netscene");
    TaskRegistry registry;
    registry.register_all_default();

    Report report;
    TaskContext context(config(), report);
    registry.run_all(context);

    std::string out = cfg.format == "text" ? TextWriter().write(report) : JSONWriter().write(report, cfg);
    if(cfg.output_file.empty()) {
        std::cout << out;
    } else {
        std::ofstream ofs(cfg.output_file);
        if(!ofs){ std::cerr << "Cannot open output file: " << cfg.output_file << "\n"; return 2; }
        ofs << out;
    }
    for(const auto& e : report.errors()) Logger::instance().error(e.task + ": " + e.message);
    return report.has_errors() ? 1 : 0;
}
