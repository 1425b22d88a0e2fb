#pragma once

#include <cstdint>
#include <mutex>
#include <vector>

namespace crane::fieldbus {

// Holding-register store shared by the server's client threads and the
// in-process bridge writer. Each call is atomic; multi-call updates are not.
class RegisterBank {
public:
    explicit RegisterBank(int size);

    int size() const { return static_cast<int>(regs_.size()); }

    bool read(uint16_t address, int count, std::vector<uint16_t>& out) const;
    bool write(uint16_t address, const uint16_t* values, int count);
    bool writeSingle(uint16_t address, uint16_t value);

private:
    bool inRange(uint16_t address, int count) const;

    mutable std::mutex mutex_;
    std::vector<uint16_t> regs_;
};

}  // namespace crane::fieldbus
