#include "ArpSource.h"
#include "ArpParser.h"
#include "../core/Config.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace netscene {

CommandArpSource::CommandArpSource(std::vector<std::string> argv) : argv_(std::move(argv)) {
    if(argv_.empty()) throw DiscoveryError("Command execution failed: empty command");
}

std::string CommandArpSource::describe() const {
    std::string s;
    for(const auto& a : argv_){ if(!s.empty()) s.push_back(' '); s += a; }
    return s;
}

std::string CommandArpSource::read_table(){
    int out_pipe[2];
    int err_pipe[2]; // carries errno from a failed exec
    if(pipe(out_pipe) != 0) throw DiscoveryError(std::string("Command execution failed: pipe: ") + std::strerror(errno));
    if(pipe2(err_pipe, O_CLOEXEC) != 0){
        int e = errno; close(out_pipe[0]); close(out_pipe[1]);
        throw DiscoveryError(std::string("Command execution failed: pipe: ") + std::strerror(e));
    }

    pid_t pid = fork();
    if(pid < 0){
        int e = errno;
        close(out_pipe[0]); close(out_pipe[1]); close(err_pipe[0]); close(err_pipe[1]);
        throw DiscoveryError(std::string("Command execution failed: fork: ") + std::strerror(e));
    }
    if(pid == 0){
        close(out_pipe[0]); close(err_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        close(out_pipe[1]);
        int devnull = open("/dev/null", O_WRONLY);
        if(devnull >= 0){ dup2(devnull, STDERR_FILENO); close(devnull); }
        std::vector<char*> argv;
        for(auto& a : argv_) argv.push_back(const_cast<char*>(a.c_str()));
        argv.push_back(nullptr);
        execvp(argv[0], argv.data());
        int e = errno;
        ssize_t ignored = write(err_pipe[1], &e, sizeof(e));
        (void)ignored;
        _exit(127);
    }

    close(out_pipe[1]); close(err_pipe[1]);
    std::string output;
    char buf[4096];
    while(true){
        ssize_t n = read(out_pipe[0], buf, sizeof(buf));
        if(n > 0){ output.append(buf, static_cast<size_t>(n)); continue; }
        if(n < 0 && errno == EINTR) continue;
        break;
    }
    close(out_pipe[0]);

    int exec_errno = 0;
    ssize_t got = read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    close(err_pipe[0]);

    int status = 0;
    while(waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if(got == static_cast<ssize_t>(sizeof(exec_errno)))
        throw DiscoveryError("Command execution failed: " + argv_[0] + ": " + std::strerror(exec_errno));
    if(!(WIFEXITED(status) && WEXITSTATUS(status) == 0))
        Logger::instance().debug("'" + describe() + "' exited with status " + std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1) + ", parsing its output anyway");
    if(!utils::is_valid_utf8(output)) throw DiscoveryError("Command output was not valid UTF-8");
    return output;
}

std::string FileArpSource::read_table(){
    std::string text;
    if(!utils::read_file(path_, text)) throw DiscoveryError("Cannot read ARP table file: " + path_);
    if(!utils::is_valid_utf8(text)) throw DiscoveryError("ARP table file was not valid UTF-8: " + path_);
    return text;
}

ArpSourcePtr make_arp_source(const Config& cfg){
    if(!cfg.arp_file.empty()) return std::make_unique<FileArpSource>(cfg.arp_file);
    return std::make_unique<CommandArpSource>(utils::split_ws(cfg.arp_command));
}

std::vector<Device> discover_devices(ArpSource& source){
    Logger::instance().info("Reading neighbour table via " + source.describe());
    std::string text = source.read_table();
    auto devices = parse_arp_output(text);
    Logger::instance().debug("discover_devices found " + std::to_string(devices.size()) + " devices");
    return devices;
}

}
