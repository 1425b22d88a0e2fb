#include "runtime/liveness_record.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#ifdef __linux__
#include <unistd.h>
#endif

int main() {
    const std::vector<std::string> split =
        crane::runtime::splitCommandLine("crane_supervisor --circuit=hook -- 'crane hook' \"a b\"  x");
    const std::vector<std::string> expected{"crane_supervisor", "--circuit=hook", "--", "crane hook", "a b", "x"};
    if (split != expected) {
        std::cerr << "splitCommandLine mismatch\n";
        return 1;
    }
    if (crane::runtime::livenessRecordPath("/var/run/crane/", "bridge") != "/var/run/crane/bridge_supervisor.rec") {
        std::cerr << "record path mismatch\n";
        return 1;
    }

#ifdef __linux__
    const std::string dir = "/tmp/crane_test_records_" + std::to_string(static_cast<long long>(::getpid())) + "/a/b";
    std::string err;
    if (!crane::runtime::ensureDirectory(dir, err)) {
        std::cerr << "ensureDirectory failed: " << err << "\n";
        return 1;
    }
    const std::string path = crane::runtime::livenessRecordPath(dir, "hook");

    crane::runtime::LivenessRecord rec;
    rec.circuit = "hook";
    rec.supervisor_pid = static_cast<int>(::getpid());
    rec.child_pid = 4242;
    rec.restarts = 3;
    rec.updated_unix_ms = 1700000000123LL;
    if (!crane::runtime::writeLivenessRecord(path, rec, err)) {
        std::cerr << "writeLivenessRecord failed: " << err << "\n";
        return 1;
    }
    crane::runtime::LivenessRecord back;
    if (!crane::runtime::readLivenessRecord(path, back, err)) {
        std::cerr << "readLivenessRecord failed: " << err << "\n";
        return 1;
    }
    if (back.circuit != "hook" || back.supervisor_pid != rec.supervisor_pid || back.child_pid != 4242 ||
        back.restarts != 3U || back.updated_unix_ms != rec.updated_unix_ms) {
        std::cerr << "record fields mismatch\n";
        return 1;
    }

    {
        std::ofstream ofs(path);
        ofs << "version=2\ncircuit=hook\nsupervisor_pid=1\n";
    }
    if (crane::runtime::readLivenessRecord(path, back, err)) {
        std::cerr << "foreign record version should be rejected\n";
        return 1;
    }
    {
        std::ofstream ofs(path);
        ofs << "version=1\ncircuit=hook\n";
    }
    if (crane::runtime::readLivenessRecord(path, back, err)) {
        std::cerr << "record without supervisor_pid should be rejected\n";
        return 1;
    }
    crane::runtime::removeLivenessRecord(path);
    if (crane::runtime::livenessRecordExists(path)) {
        std::cerr << "record should be removed\n";
        return 1;
    }

    if (!crane::runtime::isProcessAlive(static_cast<int>(::getpid())) || crane::runtime::isProcessAlive(-1)) {
        std::cerr << "isProcessAlive mismatch\n";
        return 1;
    }

    // Direct child: the zombie left by SIGTERM must count as gone.
    const pid_t child = ::fork();
    if (child == 0) {
        ::execl("/bin/sleep", "sleep", "30", static_cast<char*>(nullptr));
        _exit(127);
    }
    if (child < 0 || !crane::runtime::isProcessAlive(static_cast<int>(child))) {
        std::cerr << "sleep child should be alive\n";
        return 1;
    }
    if (!crane::runtime::terminateProcess(static_cast<int>(child), 2000, err)) {
        std::cerr << "terminateProcess failed: " << err << "\n";
        return 1;
    }
    if (crane::runtime::isProcessAlive(static_cast<int>(child))) {
        std::cerr << "terminated child should be gone\n";
        return 1;
    }
    if (!crane::runtime::terminateProcess(static_cast<int>(child), 100, err)) {
        std::cerr << "terminating a gone process should be a no-op\n";
        return 1;
    }

    int detached = -1;
    if (!crane::runtime::spawnDetached({"/bin/sleep", "30"}, detached, err) || detached <= 0) {
        std::cerr << "spawnDetached failed: " << err << "\n";
        return 1;
    }
    if (!crane::runtime::isProcessAlive(detached)) {
        std::cerr << "detached process should be alive\n";
        return 1;
    }
    if (!crane::runtime::terminateProcess(detached, 2000, err)) {
        std::cerr << "terminating the detached process failed: " << err << "\n";
        return 1;
    }
    if (crane::runtime::spawnDetached({"/nonexistent/crane_binary"}, detached, err) ||
        err.find("exec") == std::string::npos) {
        std::cerr << "missing binary should report an exec failure\n";
        return 1;
    }
#endif
    return 0;
}
