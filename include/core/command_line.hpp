#pragma once

#include <cstdint>
#include <string>

#include "core/config.hpp"
#include "runtime/process_control.hpp"

namespace crane {

// Flag overrides shared by crane_bridge_pose and crane_hook_pose. Negative
// numbers and empty strings mean "keep the configured value".
struct TelemetryOverrides {
    double fps{-1.0};
    int camera_id{-1};
    std::string modbus_host{};
    int modbus_port{-1};
    int modbus_unit_id{-1};
    int modbus_base_register{-1};
    bool use_gstreamer{false};
};

struct TelemetryCommandLine {
    std::string config_path{"data/calibration_config.json"};
    std::string intrinsics_path{};
    uint64_t max_frames{0};
    TelemetryOverrides overrides{};
};

enum class CommandLineResult {
    Run,
    HelpShown,
    Invalid,
};

CommandLineResult parseTelemetryCommandLine(int argc, const char* const argv[], runtime::Circuit circuit,
                                            TelemetryCommandLine& out, std::string& error);

void applyOverrides(const TelemetryOverrides& overrides, runtime::Circuit circuit, AppConfig& cfg);

// Loads the config file (defaults when it does not exist), applies the
// overrides and validates the result.
bool loadTelemetryConfig(const TelemetryCommandLine& cli, runtime::Circuit circuit, AppConfig& out,
                         std::string& error);

}  // namespace crane
