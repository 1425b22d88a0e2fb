#pragma once

#include <array>
#include <string>

namespace crane::runtime {

enum class Circuit {
    Bridge,
    Hook,
};

constexpr std::array<Circuit, 2> kAllCircuits{Circuit::Bridge, Circuit::Hook};

const char* circuitName(Circuit circuit);
bool parseCircuit(const std::string& text, Circuit& out);

// How the arbitrator stops and relaunches a circuit's supervised telemetry.
class TelemetryProcessControl {
public:
    virtual ~TelemetryProcessControl() = default;

    // Returns true only once no process of the circuit holds the camera.
    virtual bool stop(Circuit circuit, std::string& error) = 0;
    virtual bool launch(Circuit circuit, std::string& error) = 0;
    virtual bool isRunning(Circuit circuit) const = 0;
};

// Liveness-record based control: stop signals the recorded supervisor and
// child, launch spawns the configured supervisor command detached and waits
// until the supervisor's record names it. A spawned supervisor that has not
// reported yet is still tracked by pid, so stop can never miss it.
class RecordProcessControl : public TelemetryProcessControl {
public:
    RecordProcessControl(std::string runtime_dir, std::string bridge_command, std::string hook_command,
                         int stop_timeout_ms);

    bool stop(Circuit circuit, std::string& error) override;
    bool launch(Circuit circuit, std::string& error) override;
    bool isRunning(Circuit circuit) const override;

    std::string recordPath(Circuit circuit) const;
    // Pid of the last supervisor this object spawned for the circuit, -1 if none.
    int spawnedPid(Circuit circuit) const { return spawned_pids_[slot(circuit)]; }

private:
    static std::size_t slot(Circuit circuit) { return circuit == Circuit::Bridge ? 0U : 1U; }
    bool waitForRecord(Circuit circuit, int supervisor_pid, std::string& error) const;

    std::string runtime_dir_;
    std::string bridge_command_;
    std::string hook_command_;
    int stop_timeout_ms_;
    std::array<int, 2> spawned_pids_{{-1, -1}};
};

}  // namespace crane::runtime
