#include "runtime/process_supervisor.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <thread>
#include <utility>

#include "core/config.hpp"
#include "core/time_utils.hpp"
#include "runtime/process_control.hpp"

#ifdef __linux__
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace crane::runtime {

namespace {

std::string joinCommand(const std::vector<std::string>& command) {
    std::string out;
    for (const std::string& part : command) {
        if (!out.empty()) {
            out += ' ';
        }
        out += part;
    }
    return out;
}

std::string describeExit(int status) {
#ifdef __linux__
    if (WIFEXITED(status)) {
        return "code=" + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "signal=" + std::to_string(WTERMSIG(status));
    }
#endif
    return "status=" + std::to_string(status);
}

std::string parentDirectory(const std::string& path) {
    const std::size_t slash = path.rfind('/');
    return slash == std::string::npos ? std::string() : path.substr(0, slash);
}

bool parseMs(const std::string& arg, const std::string& prefix, int& out, std::string& error) {
    const std::string text = arg.substr(prefix.size());
    char* end = nullptr;
    const long value = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || end == nullptr || *end != '\0' || value < 0 || value > 3600000L) {
        error = "invalid value in " + arg;
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

}  // namespace

bool parseSupervisorArgs(const std::vector<std::string>& args, SupervisorOptions& out, std::string& error) {
    std::string circuit_text;
    std::string config_path;
    std::string runtime_dir;
    int restart_delay_ms = -1;
    int stop_timeout_ms = -1;
    std::vector<std::string> command;

    std::size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--") {
            ++i;
            break;
        }
        if (arg.rfind("--circuit=", 0) == 0) {
            circuit_text = arg.substr(10);
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
        } else if (arg.rfind("--runtime-dir=", 0) == 0) {
            runtime_dir = arg.substr(14);
        } else if (arg.rfind("--restart-delay-ms=", 0) == 0) {
            if (!parseMs(arg, "--restart-delay-ms=", restart_delay_ms, error)) {
                return false;
            }
        } else if (arg.rfind("--stop-timeout-ms=", 0) == 0) {
            if (!parseMs(arg, "--stop-timeout-ms=", stop_timeout_ms, error)) {
                return false;
            }
        } else {
            error = "unknown argument: " + arg;
            return false;
        }
    }
    for (; i < args.size(); ++i) {
        command.push_back(args[i]);
    }

    Circuit circuit = Circuit::Bridge;
    if (!parseCircuit(circuit_text, circuit)) {
        error = "--circuit must be bridge or hook";
        return false;
    }
    if (command.empty()) {
        error = "missing child command after --";
        return false;
    }

    AppConfig config;
    if (!config_path.empty() && !loadConfig(config_path, config, error)) {
        return false;
    }
    const RuntimeConfig& rt = config.runtime;

    SupervisorOptions options;
    options.circuit = circuitName(circuit);
    options.command = std::move(command);
    options.record_path = livenessRecordPath(runtime_dir.empty() ? rt.runtime_dir : runtime_dir, options.circuit);
    options.restart_delay_ms = restart_delay_ms >= 0 ? restart_delay_ms : rt.restart_delay_ms;
    options.stop_timeout_ms = stop_timeout_ms >= 0 ? stop_timeout_ms : rt.stop_timeout_ms;
    if (options.stop_timeout_ms <= 0) {
        error = "stop timeout must be > 0";
        return false;
    }
    out = std::move(options);
    error.clear();
    return true;
}

ProcessSupervisor::ProcessSupervisor(SupervisorOptions options) : options_(std::move(options)) {
    options_.restart_delay_ms = std::max(kMinRestartDelayMs, options_.restart_delay_ms);
    options_.poll_interval_ms = std::max(10, options_.poll_interval_ms);
    record_.circuit = options_.circuit;
}

void ProcessSupervisor::publishRecord() {
    record_.child_pid = child_pid_.load();
    record_.restarts = restarts_.load();
    record_.updated_unix_ms = nowUnixMs();
    std::string error;
    if (!writeLivenessRecord(options_.record_path, record_, error)) {
        std::cerr << "[SUPERVISOR] " << options_.circuit << " record update failed: " << error << "\n";
    }
}

void ProcessSupervisor::pause(int ms, const std::atomic<bool>& running) const {
    const int64_t deadline = nowSteadyNs() + static_cast<int64_t>(ms) * 1000000LL;
    while (running.load() && nowSteadyNs() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(ms, 50)));
    }
}

bool ProcessSupervisor::launchChild(std::string& error) {
#ifdef __linux__
    std::vector<char*> args;
    args.reserve(options_.command.size() + 1U);
    for (const std::string& a : options_.command) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }
    if (pid == 0) {
        ::signal(SIGTERM, SIG_DFL);
        ::signal(SIGINT, SIG_DFL);
        ::execvp(args[0], args.data());
        std::cerr << "[SUPERVISOR] exec " << args[0] << " failed: " << std::strerror(errno) << "\n";
        _exit(127);
    }
    child_pid_.store(static_cast<int>(pid));
    return true;
#else
    error = "ProcessSupervisor requires Linux";
    return false;
#endif
}

bool ProcessSupervisor::waitChild(const std::atomic<bool>& running, int& exit_status) {
#ifdef __linux__
    const pid_t pid = static_cast<pid_t>(child_pid_.load());
    while (running.load()) {
        int status = 0;
        const pid_t rc = ::waitpid(pid, &status, WNOHANG);
        if (rc == pid) {
            exit_status = status;
            return true;
        }
        if (rc < 0 && errno != EINTR) {
            exit_status = -1;
            return true;
        }
        pause(options_.poll_interval_ms, running);
    }
#else
    (void)running;
    (void)exit_status;
#endif
    return false;
}

void ProcessSupervisor::stopChild() {
#ifdef __linux__
    const pid_t pid = static_cast<pid_t>(child_pid_.load());
    if (pid <= 0) {
        return;
    }
    ::kill(pid, SIGTERM);
    const int64_t deadline = nowSteadyNs() + static_cast<int64_t>(options_.stop_timeout_ms) * 1000000LL;
    int status = 0;
    while (nowSteadyNs() < deadline) {
        const pid_t rc = ::waitpid(pid, &status, WNOHANG);
        if (rc == pid || (rc < 0 && errno == ECHILD)) {
            child_pid_.store(-1);
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    std::cerr << "[SUPERVISOR] " << options_.circuit << " child " << pid << " ignored SIGTERM, killing\n";
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    child_pid_.store(-1);
#endif
}

bool ProcessSupervisor::run(const std::atomic<bool>& running, std::string& error) {
    if (options_.command.empty()) {
        error = "supervisor needs a command to run";
        return false;
    }
    if (options_.record_path.empty()) {
        error = "supervisor needs a liveness record path";
        return false;
    }
    if (!ensureDirectory(parentDirectory(options_.record_path), error)) {
        return false;
    }
#ifdef __linux__
    record_.supervisor_pid = static_cast<int>(::getpid());
#endif
    publishRecord();

    const std::string command_text = joinCommand(options_.command);
    std::cout << "[SUPERVISOR] " << options_.circuit << " command: " << command_text << "\n";

    while (running.load()) {
        std::string launch_error;
        if (!launchChild(launch_error)) {
            std::cerr << "[SUPERVISOR] " << options_.circuit << " launch failed: " << launch_error << "\n";
        } else {
            publishRecord();
            int status = 0;
            if (!waitChild(running, status)) {
                break;
            }
            child_pid_.store(-1);
            std::cout << "[SUPERVISOR] " << options_.circuit << " exited with " << describeExit(status)
                      << ", restarting...\n";
        }
        restarts_.fetch_add(1U);
        publishRecord();
        pause(options_.restart_delay_ms, running);
    }

    stopChild();
    removeLivenessRecord(options_.record_path);
    std::cout << "[SUPERVISOR] " << options_.circuit << " stopped after " << restarts_.load() << " restarts\n";
    error.clear();
    return true;
}

}  // namespace crane::runtime
