#include "fieldbus/register_bank.hpp"

#include <algorithm>

namespace crane::fieldbus {

RegisterBank::RegisterBank(int size) : regs_(static_cast<std::size_t>(std::max(0, size)), 0U) {}

bool RegisterBank::inRange(uint16_t address, int count) const {
    return count > 0 && static_cast<std::size_t>(address) + static_cast<std::size_t>(count) <= regs_.size();
}

bool RegisterBank::read(uint16_t address, int count, std::vector<uint16_t>& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!inRange(address, count)) {
        return false;
    }
    out.assign(regs_.begin() + address, regs_.begin() + address + count);
    return true;
}

bool RegisterBank::write(uint16_t address, const uint16_t* values, int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (values == nullptr || !inRange(address, count)) {
        return false;
    }
    std::copy(values, values + count, regs_.begin() + address);
    return true;
}

bool RegisterBank::writeSingle(uint16_t address, uint16_t value) {
    return write(address, &value, 1);
}

}  // namespace crane::fieldbus
