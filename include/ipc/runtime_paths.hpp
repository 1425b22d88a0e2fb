#pragma once

#include <string>

#include "core/config.hpp"
#include "runtime/liveness_record.hpp"

namespace crane::ipc {

struct RuntimePaths {
    std::string bridge_record;
    std::string hook_record;
    std::string control_socket;
};

inline RuntimePaths makeRuntimePaths(const RuntimeConfig& rt) {
    RuntimePaths p{};
    p.bridge_record = runtime::livenessRecordPath(rt.runtime_dir, "bridge");
    p.hook_record = runtime::livenessRecordPath(rt.runtime_dir, "hook");
    p.control_socket = rt.control_socket;
    return p;
}

}  // namespace crane::ipc
