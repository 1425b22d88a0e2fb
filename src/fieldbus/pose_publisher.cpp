#include "fieldbus/pose_publisher.hpp"

#include <utility>
#include <vector>

#include "core/time_utils.hpp"
#include "fieldbus/register_codec.hpp"

namespace crane::fieldbus {

bool BankRegisterSink::writeRegisters(uint16_t address, const uint16_t* values, int count, std::string& error) {
    if (!bank_.write(address, values, count)) {
        error = "register range " + std::to_string(address) + "+" + std::to_string(count) +
                " is outside the bank (" + std::to_string(bank_.size()) + ")";
        return false;
    }
    return true;
}

RemoteRegisterSink::RemoteRegisterSink(std::string host, uint16_t port, uint8_t unit_id, int connect_timeout_ms,
                                       int reconnect_min_ms, int reconnect_max_ms)
    : host_(std::move(host)),
      port_(port),
      connect_timeout_ms_(connect_timeout_ms),
      client_(unit_id),
      backoff_(reconnect_min_ms, reconnect_max_ms) {
    client_.setIoTimeoutMs(connect_timeout_ms);
}

bool RemoteRegisterSink::ensureConnected(std::string& error) {
    if (client_.isConnected()) {
        return true;
    }
    const int64_t now = nowSteadyNs();
    if (now < next_attempt_ns_) {
        error = "register server unreachable, reconnect pending";
        return false;
    }
    if (!client_.connect(host_, port_, connect_timeout_ms_, error)) {
        next_attempt_ns_ = nowSteadyNs() + static_cast<int64_t>(backoff_.nextDelayMs()) * 1000000LL;
        return false;
    }
    backoff_.reset();
    return true;
}

bool RemoteRegisterSink::writeRegisters(uint16_t address, const uint16_t* values, int count, std::string& error) {
    if (!ensureConnected(error)) {
        return false;
    }
    if (!client_.writeRegisters(address, values, count, error)) {
        if (!client_.isConnected()) {
            next_attempt_ns_ = nowSteadyNs() + static_cast<int64_t>(backoff_.nextDelayMs()) * 1000000LL;
        }
        return false;
    }
    return true;
}

PublishLinkMonitor::Change PublishLinkMonitor::update(bool published) {
    if (!published) {
        ++failures_since_down_;
    }
    if (known_ && published == up_) {
        return Change::None;
    }
    known_ = true;
    up_ = published;
    if (published) {
        return Change::Up;
    }
    failures_since_down_ = 1;
    return Change::Down;
}

bool publishBridgeSample(RegisterSink& sink, uint16_t base, const BridgePoseSample& sample, std::string& error) {
    const BridgeRegisters regs = encodeBridgeSample(sample);
    return sink.writeRegisters(base, regs.data(), static_cast<int>(regs.size()), error);
}

bool publishHookSample(RegisterSink& sink, uint16_t base, const HookPoseSample& sample, std::string& error) {
    const HookRegisters regs = encodeHookSample(sample);
    return sink.writeRegisters(base, regs.data(), static_cast<int>(regs.size()), error);
}

bool readPoseSnapshot(ModbusClient& client, uint16_t bridge_base, uint16_t hook_base, PoseSnapshot& out,
                      std::string& error) {
    std::vector<uint16_t> regs;
    if (!client.readHoldingRegisters(bridge_base, kBridgeRegisterCount, regs, error)) {
        error = "bridge range: " + error;
        return false;
    }
    out.bridge = decodeBridgeSample(regs.data());
    if (!client.readHoldingRegisters(hook_base, kHookRegisterCount, regs, error)) {
        error = "hook range: " + error;
        return false;
    }
    out.hook = decodeHookSample(regs.data());
    error.clear();
    return true;
}

}  // namespace crane::fieldbus
