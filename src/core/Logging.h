#pragma once
#include <string>
#include <mutex>
#include <atomic>

namespace netscene {

enum class LogLevel { Error=0, Warn=1, Info=2, Debug=3, Trace=4 };

bool parse_log_level(const std::string& s, LogLevel& out);

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl){ level_.store(lvl); }
    LogLevel level() const { return level_.load(); }
    bool enabled(LogLevel lvl) const { return static_cast<int>(lvl) <= static_cast<int>(level_.load()); }
    void log(LogLevel lvl, const std::string& msg);
    void error(const std::string& m){ log(LogLevel::Error, m); }
    void warn(const std::string& m){ log(LogLevel::Warn, m); }
    void info(const std::string& m){ log(LogLevel::Info, m); }
    void debug(const std::string& m){ log(LogLevel::Debug, m); }
    void trace(const std::string& m){ log(LogLevel::Trace, m); }
private:
    Logger() = default;
    const char* prefix(LogLevel lvl) const;
    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_;
};

}
