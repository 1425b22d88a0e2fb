#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace crane::runtime {

constexpr int kLivenessRecordVersion = 1;

// On-disk record a supervisor keeps for its circuit. Written whole through
// a temp file and rename, so a reader sees either the old or the new record.
struct LivenessRecord {
    int version{kLivenessRecordVersion};
    std::string circuit;
    int supervisor_pid{-1};
    int child_pid{-1};  // -1 between restarts
    uint64_t restarts{0};
    int64_t updated_unix_ms{0};
};

std::string livenessRecordPath(const std::string& runtime_dir, const std::string& circuit);

bool writeLivenessRecord(const std::string& path, const LivenessRecord& record, std::string& error);
// Fails on an absent, partial or foreign-version record.
bool readLivenessRecord(const std::string& path, LivenessRecord& out, std::string& error);
void removeLivenessRecord(const std::string& path);
bool livenessRecordExists(const std::string& path);

bool ensureDirectory(const std::string& path, std::string& error);

// kill(pid, 0) that also treats zombies as gone.
bool isProcessAlive(int pid);

// SIGTERM, wait up to timeout_ms, then SIGKILL. Returns true once the process
// is gone; a pid that is not running is a no-op success.
bool terminateProcess(int pid, int timeout_ms, std::string& error);

// Whitespace split honouring single and double quotes.
std::vector<std::string> splitCommandLine(const std::string& command);

// Starts argv in a new session, detached from the caller (double fork).
// Reports exec failures; pid_out receives the detached process id.
bool spawnDetached(const std::vector<std::string>& argv, int& pid_out, std::string& error);

}  // namespace crane::runtime
