#pragma once

#include <array>
#include <cstdint>

#include "core/types.hpp"

namespace crane::fieldbus {

constexpr int kBridgeRegisterCount = 6;  // x(2) y(2) id valid
constexpr int kHookRegisterCount = 8;    // distance(2) dev_x(2) dev_y(2) id valid
constexpr uint16_t kDefaultBridgeBase = 100;
constexpr uint16_t kDefaultHookBase = 200;
constexpr int kMinRegisterSpace = 256;
constexpr int kRegisterSpaceMargin = 64;

struct RegisterRange {
    uint16_t base{0};
    int count{0};

    int end() const { return static_cast<int>(base) + count; }  // one past the last register
};

RegisterRange bridgeRange(uint16_t base);
RegisterRange hookRange(uint16_t base);
bool rangesOverlap(const RegisterRange& a, const RegisterRange& b);

// Holding-register space that covers both ranges with headroom.
int registerSpaceSize(const RegisterRange& bridge, const RegisterRange& hook);

// IEEE-754 float32, high word first, each word big-endian on the wire.
void floatToRegisters(float value, uint16_t& hi, uint16_t& lo);
float registersToFloat(uint16_t hi, uint16_t lo);

using BridgeRegisters = std::array<uint16_t, kBridgeRegisterCount>;
using HookRegisters = std::array<uint16_t, kHookRegisterCount>;

BridgeRegisters encodeBridgeSample(const BridgePoseSample& sample);
HookRegisters encodeHookSample(const HookPoseSample& sample);
BridgePoseSample decodeBridgeSample(const uint16_t* regs);
HookPoseSample decodeHookSample(const uint16_t* regs);

}  // namespace crane::fieldbus
