#include "fieldbus/register_codec.hpp"

#include <cmath>
#include <iostream>

int main() {
    uint16_t hi = 0;
    uint16_t lo = 0;
    crane::fieldbus::floatToRegisters(1.0F, hi, lo);
    if (hi != 0x3F80U || lo != 0x0000U) {
        std::cerr << "1.0f should encode as 0x3F80 0x0000\n";
        return 1;
    }
    crane::fieldbus::floatToRegisters(-2.5F, hi, lo);
    if (hi != 0xC020U || lo != 0x0000U) {
        std::cerr << "-2.5f should encode as 0xC020 0x0000\n";
        return 1;
    }

    const float values[] = {0.0F, -1.0F, 1234.5678F, 1.0e-30F, 3.0e38F};
    for (float v : values) {
        crane::fieldbus::floatToRegisters(v, hi, lo);
        if (crane::fieldbus::registersToFloat(hi, lo) != v) {
            std::cerr << "float " << v << " did not survive the register pair\n";
            return 1;
        }
    }

    crane::BridgePoseSample bridge;
    bridge.x_m = 12.75F;
    bridge.y_m = 3.5F;
    bridge.marker_id = 4;
    bridge.valid = true;
    const auto bregs = crane::fieldbus::encodeBridgeSample(bridge);
    if (bregs[4] != 4U || bregs[5] != 1U) {
        std::cerr << "bridge id/valid registers mismatch\n";
        return 1;
    }
    const crane::BridgePoseSample bridge_back = crane::fieldbus::decodeBridgeSample(bregs.data());
    if (bridge_back.x_m != 12.75F || bridge_back.y_m != 3.5F || bridge_back.marker_id != 4 || !bridge_back.valid) {
        std::cerr << "bridge sample decode mismatch\n";
        return 1;
    }

    crane::BridgePoseSample no_marker;
    no_marker.marker_id = -1;
    const auto nregs = crane::fieldbus::encodeBridgeSample(no_marker);
    if (nregs[4] != 0U || nregs[5] != 0U) {
        std::cerr << "missing marker id should clamp to 0 with valid=0\n";
        return 1;
    }

    crane::HookPoseSample hook;
    hook.distance_m = 7.25F;
    hook.deviation_x_px = -40.5F;
    hook.deviation_y_px = 12.0F;
    hook.marker_id = 70000;
    hook.valid = false;
    const auto hregs = crane::fieldbus::encodeHookSample(hook);
    if (hregs[6] != 65535U || hregs[7] != 0U) {
        std::cerr << "hook id should clamp to 65535\n";
        return 1;
    }
    const crane::HookPoseSample hook_back = crane::fieldbus::decodeHookSample(hregs.data());
    if (hook_back.distance_m != 7.25F || hook_back.deviation_x_px != -40.5F || hook_back.deviation_y_px != 12.0F ||
        hook_back.valid) {
        std::cerr << "hook sample decode mismatch\n";
        return 1;
    }

    // Ranges: bridge is 6 registers, hook is 8.
    for (int b = 0; b < 64; ++b) {
        for (int h = 0; h < 64; ++h) {
            const bool overlap = crane::fieldbus::rangesOverlap(
                crane::fieldbus::bridgeRange(static_cast<uint16_t>(b)),
                crane::fieldbus::hookRange(static_cast<uint16_t>(h)));
            const bool expected = (b < h + 8) && (h < b + 6);
            if (overlap != expected) {
                std::cerr << "overlap mismatch for bridge " << b << " hook " << h << "\n";
                return 1;
            }
        }
    }

    const int defaults = crane::fieldbus::registerSpaceSize(
        crane::fieldbus::bridgeRange(crane::fieldbus::kDefaultBridgeBase),
        crane::fieldbus::hookRange(crane::fieldbus::kDefaultHookBase));
    if (defaults != 272) {
        std::cerr << "default register space should be 272, got " << defaults << "\n";
        return 1;
    }
    const int low = crane::fieldbus::registerSpaceSize(crane::fieldbus::bridgeRange(0),
                                                       crane::fieldbus::hookRange(6));
    if (low != crane::fieldbus::kMinRegisterSpace) {
        std::cerr << "register space should not shrink below the minimum\n";
        return 1;
    }
    const int high = crane::fieldbus::registerSpaceSize(crane::fieldbus::bridgeRange(65000),
                                                        crane::fieldbus::hookRange(65520));
    if (high != 65536) {
        std::cerr << "register space should cap at 65536\n";
        return 1;
    }

    return 0;
}
