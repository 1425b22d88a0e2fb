#include "runtime/liveness_record.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>

#include "core/time_utils.hpp"

#ifdef __linux__
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace crane::runtime {

namespace {

bool parseInt64(const std::string& text, int64_t& out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return false;
    }
    out = static_cast<int64_t>(v);
    return true;
}

#ifdef __linux__
bool isZombie(int pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat.is_open()) {
        return false;
    }
    std::string line;
    std::getline(stat, line);
    // Format: pid (comm) state ...; comm may contain spaces.
    const std::size_t close_paren = line.rfind(')');
    return close_paren != std::string::npos && close_paren + 2 < line.size() && line[close_paren + 2] == 'Z';
}

void reapIfChild(int pid) {
    int status = 0;
    (void)::waitpid(pid, &status, WNOHANG);
}
#endif

}  // namespace

std::string livenessRecordPath(const std::string& runtime_dir, const std::string& circuit) {
    std::string dir = runtime_dir;
    while (dir.size() > 1U && dir.back() == '/') {
        dir.pop_back();
    }
    return dir + "/" + circuit + "_supervisor.rec";
}

bool ensureDirectory(const std::string& path, std::string& error) {
#ifdef __linux__
    if (path.empty()) {
        return true;
    }
    std::string partial;
    std::size_t pos = 0;
    while (pos != std::string::npos) {
        pos = path.find('/', pos + 1U);
        partial = path.substr(0, pos);
        if (partial.empty()) {
            continue;
        }
        if (::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            error = "mkdir " + partial + " failed: " + std::strerror(errno);
            return false;
        }
    }
    return true;
#else
    (void)path;
    error = "ensureDirectory requires Linux";
    return false;
#endif
}

bool writeLivenessRecord(const std::string& path, const LivenessRecord& record, std::string& error) {
#ifdef __linux__
    std::ostringstream body;
    body << "version=" << record.version << "\n"
         << "circuit=" << record.circuit << "\n"
         << "supervisor_pid=" << record.supervisor_pid << "\n"
         << "child_pid=" << record.child_pid << "\n"
         << "restarts=" << record.restarts << "\n"
         << "updated_unix_ms=" << record.updated_unix_ms << "\n";
    const std::string text = body.str();

    const std::string tmp = path + ".tmp." + std::to_string(static_cast<long long>(::getpid()));
    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = "open " + tmp + " failed: " + std::strerror(errno);
        return false;
    }
    std::size_t written = 0;
    while (written < text.size()) {
        const ssize_t n = ::write(fd, text.data() + written, text.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = "write " + tmp + " failed: " + std::strerror(errno);
            ::close(fd);
            ::unlink(tmp.c_str());
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    ::fsync(fd);
    ::close(fd);
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        error = "rename to " + path + " failed: " + std::strerror(errno);
        ::unlink(tmp.c_str());
        return false;
    }
    return true;
#else
    (void)path;
    (void)record;
    error = "writeLivenessRecord requires Linux";
    return false;
#endif
}

bool readLivenessRecord(const std::string& path, LivenessRecord& out, std::string& error) {
    std::ifstream in(path);
    if (!in.is_open()) {
        error = "no liveness record at " + path;
        return false;
    }

    LivenessRecord rec;
    rec.version = 0;
    bool have_version = false;
    bool have_supervisor = false;
    std::string line;
    while (std::getline(in, line)) {
        const std::size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const std::string key = line.substr(0, eq);
        const std::string value = line.substr(eq + 1U);
        int64_t number = 0;
        if (key == "circuit") {
            rec.circuit = value;
        } else if (!parseInt64(value, number)) {
            continue;
        } else if (key == "version") {
            rec.version = static_cast<int>(number);
            have_version = true;
        } else if (key == "supervisor_pid") {
            rec.supervisor_pid = static_cast<int>(number);
            have_supervisor = true;
        } else if (key == "child_pid") {
            rec.child_pid = static_cast<int>(number);
        } else if (key == "restarts") {
            rec.restarts = static_cast<uint64_t>(number);
        } else if (key == "updated_unix_ms") {
            rec.updated_unix_ms = number;
        }
    }

    if (!have_version || rec.version != kLivenessRecordVersion) {
        error = "unsupported liveness record version in " + path;
        return false;
    }
    if (!have_supervisor) {
        error = "liveness record " + path + " has no supervisor_pid";
        return false;
    }
    out = rec;
    return true;
}

void removeLivenessRecord(const std::string& path) {
    std::remove(path.c_str());
}

bool livenessRecordExists(const std::string& path) {
    std::ifstream in(path);
    return in.is_open();
}

bool isProcessAlive(int pid) {
#ifdef __linux__
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) != 0 && errno != EPERM) {
        return false;
    }
    return !isZombie(pid);
#else
    (void)pid;
    return false;
#endif
}

bool terminateProcess(int pid, int timeout_ms, std::string& error) {
#ifdef __linux__
    if (!isProcessAlive(pid)) {
        return true;
    }
    if (::kill(pid, SIGTERM) != 0) {
        if (errno == ESRCH) {
            return true;
        }
        error = "SIGTERM to " + std::to_string(pid) + " failed: " + std::strerror(errno);
        return false;
    }

    const int64_t deadline = nowSteadyNs() + static_cast<int64_t>(std::max(100, timeout_ms)) * 1000000LL;
    while (nowSteadyNs() < deadline) {
        reapIfChild(pid);
        if (!isProcessAlive(pid)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    ::kill(pid, SIGKILL);
    const int64_t kill_deadline = nowSteadyNs() + 1000000000LL;
    while (nowSteadyNs() < kill_deadline) {
        reapIfChild(pid);
        if (!isProcessAlive(pid)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    error = "process " + std::to_string(pid) + " survived SIGKILL";
    return false;
#else
    (void)pid;
    (void)timeout_ms;
    error = "terminateProcess requires Linux";
    return false;
#endif
}

std::vector<std::string> splitCommandLine(const std::string& command) {
    std::vector<std::string> out;
    std::string current;
    bool in_token = false;
    char quote = '\0';
    for (char c : command) {
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else {
                current.push_back(c);
            }
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            in_token = true;
        } else if (c == ' ' || c == '\t' || c == '\n') {
            if (in_token) {
                out.push_back(current);
                current.clear();
                in_token = false;
            }
        } else {
            current.push_back(c);
            in_token = true;
        }
    }
    if (in_token) {
        out.push_back(current);
    }
    return out;
}

bool spawnDetached(const std::vector<std::string>& argv, int& pid_out, std::string& error) {
#ifdef __linux__
    if (argv.empty()) {
        error = "empty command";
        return false;
    }
    std::vector<char*> args;
    args.reserve(argv.size() + 1U);
    for (const std::string& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    // The grandchild reports its pid, then errno if exec fails. EOF after
    // the pid means exec succeeded.
    int report[2];
    if (::pipe2(report, O_CLOEXEC) != 0) {
        error = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }

    const pid_t first = ::fork();
    if (first < 0) {
        error = std::string("fork failed: ") + std::strerror(errno);
        ::close(report[0]);
        ::close(report[1]);
        return false;
    }
    if (first == 0) {
        ::close(report[0]);
        ::setsid();
        const pid_t second = ::fork();
        if (second < 0) {
            _exit(1);
        }
        if (second > 0) {
            _exit(0);
        }
        const int32_t pid32 = static_cast<int32_t>(::getpid());
        (void)!::write(report[1], &pid32, sizeof(pid32));
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::execvp(args[0], args.data());
        const int32_t err = errno;
        (void)!::write(report[1], &err, sizeof(err));
        _exit(127);
    }

    ::close(report[1]);
    int status = 0;
    while (::waitpid(first, &status, 0) < 0 && errno == EINTR) {
    }

    int32_t pid32 = -1;
    int32_t exec_errno = 0;
    const ssize_t got_pid = ::read(report[0], &pid32, sizeof(pid32));
    const ssize_t got_err = ::read(report[0], &exec_errno, sizeof(exec_errno));
    ::close(report[0]);

    if (got_pid != static_cast<ssize_t>(sizeof(pid32)) || pid32 <= 0) {
        error = "detached fork failed for " + argv[0];
        return false;
    }
    if (got_err == static_cast<ssize_t>(sizeof(exec_errno))) {
        error = "exec " + argv[0] + " failed: " + std::strerror(exec_errno);
        return false;
    }
    pid_out = static_cast<int>(pid32);
    return true;
#else
    (void)argv;
    (void)pid_out;
    error = "spawnDetached requires Linux";
    return false;
#endif
}

}  // namespace crane::runtime
