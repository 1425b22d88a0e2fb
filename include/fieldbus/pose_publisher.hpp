#pragma once

#include <cstdint>
#include <string>

#include "core/types.hpp"
#include "fieldbus/modbus_client.hpp"
#include "fieldbus/register_bank.hpp"

namespace crane::fieldbus {

// Destination of encoded pose registers: the local bank on the server side,
// a remote connection on the client side.
class RegisterSink {
public:
    virtual ~RegisterSink() = default;
    virtual bool writeRegisters(uint16_t address, const uint16_t* values, int count, std::string& error) = 0;
};

class BankRegisterSink : public RegisterSink {
public:
    explicit BankRegisterSink(RegisterBank& bank) : bank_(bank) {}
    bool writeRegisters(uint16_t address, const uint16_t* values, int count, std::string& error) override;

private:
    RegisterBank& bank_;
};

// Connects lazily and reconnects with backoff. While a reconnect delay is
// pending, writes fail fast so the sampling loop keeps its pace.
class RemoteRegisterSink : public RegisterSink {
public:
    RemoteRegisterSink(std::string host, uint16_t port, uint8_t unit_id, int connect_timeout_ms,
                       int reconnect_min_ms, int reconnect_max_ms);

    bool writeRegisters(uint16_t address, const uint16_t* values, int count, std::string& error) override;
    bool isConnected() const { return client_.isConnected(); }

private:
    bool ensureConnected(std::string& error);

    std::string host_;
    uint16_t port_;
    int connect_timeout_ms_;
    ModbusClient client_;
    ReconnectBackoff backoff_;
    int64_t next_attempt_ns_{0};
};

// Tracks whether publishing succeeds so a down register server is reported
// once per outage instead of once per frame.
class PublishLinkMonitor {
public:
    enum class Change {
        None,
        Up,
        Down,
    };

    // The first report always counts as a change.
    Change update(bool published);
    bool isUp() const { return up_; }
    uint64_t failuresSinceDown() const { return failures_since_down_; }

private:
    bool known_{false};
    bool up_{false};
    uint64_t failures_since_down_{0};
};

// One block write per sample so the validity flag and the fields it covers
// land together.
bool publishBridgeSample(RegisterSink& sink, uint16_t base, const BridgePoseSample& sample, std::string& error);
bool publishHookSample(RegisterSink& sink, uint16_t base, const HookPoseSample& sample, std::string& error);

struct PoseSnapshot {
    BridgePoseSample bridge;
    HookPoseSample hook;
};

bool readPoseSnapshot(ModbusClient& client, uint16_t bridge_base, uint16_t hook_base, PoseSnapshot& out,
                      std::string& error);

}  // namespace crane::fieldbus
