#include "fieldbus/register_codec.hpp"

#include <algorithm>
#include <cstring>

namespace crane::fieldbus {

namespace {

uint16_t idRegister(int marker_id) {
    return static_cast<uint16_t>(std::clamp(marker_id, 0, 65535));
}

}  // namespace

RegisterRange bridgeRange(uint16_t base) {
    return RegisterRange{base, kBridgeRegisterCount};
}

RegisterRange hookRange(uint16_t base) {
    return RegisterRange{base, kHookRegisterCount};
}

bool rangesOverlap(const RegisterRange& a, const RegisterRange& b) {
    return static_cast<int>(a.base) < b.end() && static_cast<int>(b.base) < a.end();
}

int registerSpaceSize(const RegisterRange& bridge, const RegisterRange& hook) {
    const int needed = std::max(bridge.end(), hook.end()) + kRegisterSpaceMargin;
    return std::min(65536, std::max(kMinRegisterSpace, needed));
}

void floatToRegisters(float value, uint16_t& hi, uint16_t& lo) {
    uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    hi = static_cast<uint16_t>((bits >> 16U) & 0xFFFFU);
    lo = static_cast<uint16_t>(bits & 0xFFFFU);
}

float registersToFloat(uint16_t hi, uint16_t lo) {
    const uint32_t bits = (static_cast<uint32_t>(hi) << 16U) | static_cast<uint32_t>(lo);
    float value = 0.0F;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

BridgeRegisters encodeBridgeSample(const BridgePoseSample& sample) {
    BridgeRegisters regs{};
    floatToRegisters(sample.x_m, regs[0], regs[1]);
    floatToRegisters(sample.y_m, regs[2], regs[3]);
    regs[4] = idRegister(sample.marker_id);
    regs[5] = sample.valid ? 1U : 0U;
    return regs;
}

HookRegisters encodeHookSample(const HookPoseSample& sample) {
    HookRegisters regs{};
    floatToRegisters(sample.distance_m, regs[0], regs[1]);
    floatToRegisters(sample.deviation_x_px, regs[2], regs[3]);
    floatToRegisters(sample.deviation_y_px, regs[4], regs[5]);
    regs[6] = idRegister(sample.marker_id);
    regs[7] = sample.valid ? 1U : 0U;
    return regs;
}

BridgePoseSample decodeBridgeSample(const uint16_t* regs) {
    BridgePoseSample s;
    s.x_m = registersToFloat(regs[0], regs[1]);
    s.y_m = registersToFloat(regs[2], regs[3]);
    s.marker_id = regs[4];
    s.valid = regs[5] != 0U;
    return s;
}

HookPoseSample decodeHookSample(const uint16_t* regs) {
    HookPoseSample s;
    s.distance_m = registersToFloat(regs[0], regs[1]);
    s.deviation_x_px = registersToFloat(regs[2], regs[3]);
    s.deviation_y_px = registersToFloat(regs[4], regs[5]);
    s.marker_id = regs[6];
    s.valid = regs[7] != 0U;
    return s;
}

}  // namespace crane::fieldbus
