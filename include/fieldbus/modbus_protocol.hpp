#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "fieldbus/register_bank.hpp"

namespace crane::fieldbus {

// Modbus TCP application data unit framing (MBAP header + PDU).
constexpr std::size_t kMbapHeaderSize = 7;
constexpr std::size_t kMaxAduSize = 260;

constexpr uint8_t kFnReadHoldingRegisters = 0x03;
constexpr uint8_t kFnWriteSingleRegister = 0x06;
constexpr uint8_t kFnWriteMultipleRegisters = 0x10;

constexpr uint8_t kExIllegalFunction = 0x01;
constexpr uint8_t kExIllegalDataAddress = 0x02;
constexpr uint8_t kExIllegalDataValue = 0x03;
constexpr uint8_t kExGatewayTargetFailed = 0x0B;

constexpr int kMaxReadCount = 125;
constexpr int kMaxWriteCount = 123;

struct MbapHeader {
    uint16_t transaction_id{0};
    uint16_t protocol_id{0};
    uint16_t length{0};  // unit id + PDU bytes
    uint8_t unit_id{0};
};

bool parseMbapHeader(const uint8_t* data, std::size_t size, MbapHeader& out, std::string& error);
const char* exceptionName(uint8_t code);

// Server side. Returns false when the ADU is malformed beyond an exception
// reply; the caller drops the connection.
bool handleRequest(RegisterBank& bank, uint8_t unit_id, const std::vector<uint8_t>& request,
                   std::vector<uint8_t>& response);

// Client side.
std::vector<uint8_t> buildReadHoldingRequest(uint16_t transaction_id, uint8_t unit_id, uint16_t address, uint16_t count);
std::vector<uint8_t> buildWriteSingleRequest(uint16_t transaction_id, uint8_t unit_id, uint16_t address, uint16_t value);
std::vector<uint8_t> buildWriteMultipleRequest(uint16_t transaction_id, uint8_t unit_id, uint16_t address,
                                               const uint16_t* values, int count);

bool parseReadHoldingResponse(const std::vector<uint8_t>& response, uint16_t transaction_id, int count,
                              std::vector<uint16_t>& out, std::string& error);
// Checks the echo of a 0x06 (value) or 0x10 (count) request.
bool parseWriteResponse(const std::vector<uint8_t>& response, uint16_t transaction_id, uint8_t function,
                        uint16_t address, uint16_t value_or_count, std::string& error);

}  // namespace crane::fieldbus
