#include "runtime/liveness_record.hpp"
#include "runtime/process_supervisor.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <string>
#include <thread>

#ifdef __linux__
#include <unistd.h>
#endif

namespace {

bool waitFor(int timeout_ms, const std::function<bool()>& predicate) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return predicate();
}

}  // namespace

int main() {
#ifdef __linux__
    const std::string dir = "/tmp/crane_test_supervisor_" + std::to_string(static_cast<long long>(::getpid()));

    // A child that always fails is relaunched every time.
    {
        crane::runtime::SupervisorOptions options;
        options.circuit = "bridge";
        options.command = {"/bin/sh", "-c", "exit 3"};
        options.record_path = crane::runtime::livenessRecordPath(dir, "bridge");
        options.restart_delay_ms = 100;
        options.poll_interval_ms = 20;

        crane::runtime::ProcessSupervisor supervisor(options);
        std::atomic<bool> running{true};
        std::string err;
        bool ok = false;
        std::thread worker([&]() { ok = supervisor.run(running, err); });

        const bool restarted = waitFor(5000, [&]() { return supervisor.restartCount() >= 3U; });
        crane::runtime::LivenessRecord record;
        std::string read_err;
        const bool have_record = crane::runtime::readLivenessRecord(options.record_path, record, read_err);
        running.store(false);
        worker.join();

        if (!restarted) {
            std::cerr << "supervisor should keep relaunching a failing child\n";
            return 1;
        }
        if (!have_record || record.circuit != "bridge" || record.supervisor_pid != static_cast<int>(::getpid())) {
            std::cerr << "liveness record should name this supervisor: " << read_err << "\n";
            return 1;
        }
        if (!ok || crane::runtime::livenessRecordExists(options.record_path)) {
            std::cerr << "clean stop should remove the liveness record: " << err << "\n";
            return 1;
        }
    }

    // A clean exit is restarted too, and stop takes the child down.
    {
        crane::runtime::SupervisorOptions options;
        options.circuit = "hook";
        options.command = {"/bin/sleep", "30"};
        options.record_path = crane::runtime::livenessRecordPath(dir, "hook");
        options.restart_delay_ms = 100;
        options.poll_interval_ms = 20;
        options.stop_timeout_ms = 1000;

        crane::runtime::ProcessSupervisor supervisor(options);
        std::atomic<bool> running{true};
        std::string err;
        std::thread worker([&]() { (void)supervisor.run(running, err); });

        if (!waitFor(3000, [&]() { return supervisor.childPid() > 0; })) {
            running.store(false);
            worker.join();
            std::cerr << "child should start\n";
            return 1;
        }
        const int first_child = supervisor.childPid();
        crane::runtime::LivenessRecord record;
        std::string read_err;
        if (!waitFor(1000, [&]() {
                return crane::runtime::readLivenessRecord(options.record_path, record, read_err) &&
                       record.child_pid == first_child;
            })) {
            running.store(false);
            worker.join();
            std::cerr << "record should carry the child pid\n";
            return 1;
        }

        // Kill the child from outside; a new one takes its place.
        std::string kill_err;
        (void)crane::runtime::terminateProcess(first_child, 1000, kill_err);
        const bool replaced = waitFor(3000, [&]() {
            return supervisor.childPid() > 0 && supervisor.childPid() != first_child;
        });
        const int second_child = supervisor.childPid();
        running.store(false);
        worker.join();

        if (!replaced || supervisor.restartCount() < 1U) {
            std::cerr << "killed child should be relaunched\n";
            return 1;
        }
        if (crane::runtime::isProcessAlive(second_child) || supervisor.childPid() != -1) {
            std::cerr << "stopping the supervisor should stop its child\n";
            return 1;
        }
    }

    // An unknown program is retried, not fatal.
    {
        crane::runtime::SupervisorOptions options;
        options.circuit = "bridge";
        options.command = {"/nonexistent/crane_pose"};
        options.record_path = crane::runtime::livenessRecordPath(dir, "bridge");
        options.restart_delay_ms = 100;
        options.poll_interval_ms = 20;

        crane::runtime::ProcessSupervisor supervisor(options);
        std::atomic<bool> running{true};
        std::string err;
        std::thread worker([&]() { (void)supervisor.run(running, err); });
        const bool retried = waitFor(3000, [&]() { return supervisor.restartCount() >= 2U; });
        running.store(false);
        worker.join();
        if (!retried) {
            std::cerr << "exec failures should be retried\n";
            return 1;
        }
    }

    crane::runtime::ProcessSupervisor no_command(crane::runtime::SupervisorOptions{});
    std::atomic<bool> running{true};
    std::string err;
    if (no_command.run(running, err)) {
        std::cerr << "supervisor without a command should refuse to run\n";
        return 1;
    }
    return 0;
#else
    return 0;
#endif
}
