#include "runtime/process_supervisor.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

namespace {
std::atomic<bool> g_running{true};

void onStopSignal(int) {
    g_running.store(false);
}

void printUsage() {
    std::cerr << "usage: crane_supervisor --circuit=<bridge|hook> [--config=FILE] [--runtime-dir=DIR]"
                 " [--restart-delay-ms=N] [--stop-timeout-ms=N] -- <command> [args...]\n";
}
}

int main(int argc, char** argv) {
    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);

    const std::vector<std::string> args(argv + 1, argv + argc);
    for (const std::string& arg : args) {
        if (arg == "--") {
            break;
        }
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        }
    }

    crane::runtime::SupervisorOptions options;
    std::string error;
    if (!crane::runtime::parseSupervisorArgs(args, options, error)) {
        std::cerr << "[ERROR] " << error << '\n';
        printUsage();
        return 1;
    }
    if (options.restart_delay_ms < crane::runtime::kMinRestartDelayMs) {
        std::cerr << "[WARN] restart delay raised to " << crane::runtime::kMinRestartDelayMs << " ms\n";
    }
    std::cout << "[SUPERVISOR] " << options.circuit << " record " << options.record_path << ", restart delay "
              << options.restart_delay_ms << " ms, stop timeout " << options.stop_timeout_ms << " ms\n";

    crane::runtime::ProcessSupervisor supervisor(options);
    if (!supervisor.run(g_running, error)) {
        std::cerr << "[ERROR] supervisor failed: " << error << '\n';
        return 1;
    }
    return 0;
}
