#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "runtime/liveness_record.hpp"

namespace crane::runtime {

constexpr int kMinRestartDelayMs = 100;

struct SupervisorOptions {
    std::string circuit;
    std::vector<std::string> command;
    std::string record_path;
    int restart_delay_ms{1000};
    int poll_interval_ms{300};
    int stop_timeout_ms{3000};
};

// Parses `--circuit=<bridge|hook> [--config=FILE] [--runtime-dir=DIR]
// [--restart-delay-ms=N] [--stop-timeout-ms=N] -- <command...>` (argv without
// the program name). The config's runtime section supplies the directory,
// restart delay and stop timeout; explicit flags override it.
bool parseSupervisorArgs(const std::vector<std::string>& args, SupervisorOptions& out, std::string& error);

// Keeps one instance of a command running. Every exit, clean or not, is
// followed by a relaunch after the restart delay until `running` clears;
// then the child is terminated and the liveness record removed.
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(SupervisorOptions options);

    bool run(const std::atomic<bool>& running, std::string& error);

    uint64_t restartCount() const { return restarts_.load(); }
    int childPid() const { return child_pid_.load(); }

private:
    bool launchChild(std::string& error);
    bool waitChild(const std::atomic<bool>& running, int& exit_status);
    void stopChild();
    void publishRecord();
    void pause(int ms, const std::atomic<bool>& running) const;

    SupervisorOptions options_;
    LivenessRecord record_;
    std::atomic<uint64_t> restarts_{0};
    std::atomic<int> child_pid_{-1};
};

}  // namespace crane::runtime
