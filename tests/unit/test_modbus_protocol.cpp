#include "fieldbus/modbus_protocol.hpp"

#include <iostream>
#include <vector>

namespace {

std::vector<uint8_t> adu(uint16_t tid, uint8_t unit, const std::vector<uint8_t>& pdu) {
    std::vector<uint8_t> out;
    const uint16_t len = static_cast<uint16_t>(pdu.size() + 1U);
    out.push_back(static_cast<uint8_t>(tid >> 8U));
    out.push_back(static_cast<uint8_t>(tid & 0xFFU));
    out.push_back(0);
    out.push_back(0);
    out.push_back(static_cast<uint8_t>(len >> 8U));
    out.push_back(static_cast<uint8_t>(len & 0xFFU));
    out.push_back(unit);
    out.insert(out.end(), pdu.begin(), pdu.end());
    return out;
}

bool isException(const std::vector<uint8_t>& response, uint8_t function, uint8_t code) {
    return response.size() == 9U && response[7] == static_cast<uint8_t>(function | 0x80U) && response[8] == code;
}

}  // namespace

int main() {
    crane::fieldbus::RegisterBank bank(32);
    const uint16_t seed[] = {0x1111, 0x2222, 0x3333};
    bank.write(4, seed, 3);

    std::vector<uint8_t> response;
    std::vector<uint16_t> values;
    std::string error;

    auto request = crane::fieldbus::buildReadHoldingRequest(7, 1, 4, 3);
    if (!crane::fieldbus::handleRequest(bank, 1, request, response)) {
        std::cerr << "read request should be handled\n";
        return 1;
    }
    if (!crane::fieldbus::parseReadHoldingResponse(response, 7, 3, values, error)) {
        std::cerr << "read response should parse: " << error << "\n";
        return 1;
    }
    if (values.size() != 3U || values[0] != 0x1111 || values[2] != 0x3333) {
        std::cerr << "read values mismatch\n";
        return 1;
    }
    if (crane::fieldbus::parseReadHoldingResponse(response, 8, 3, values, error)) {
        std::cerr << "mismatched transaction id should be rejected\n";
        return 1;
    }

    const uint16_t block[] = {10, 20, 30, 40};
    request = crane::fieldbus::buildWriteMultipleRequest(8, 1, 20, block, 4);
    if (!crane::fieldbus::handleRequest(bank, 1, request, response) ||
        !crane::fieldbus::parseWriteResponse(response, 8, crane::fieldbus::kFnWriteMultipleRegisters, 20, 4, error)) {
        std::cerr << "write multiple should be acknowledged: " << error << "\n";
        return 1;
    }
    if (!bank.read(20, 4, values) || values[3] != 40) {
        std::cerr << "write multiple did not reach the bank\n";
        return 1;
    }

    request = crane::fieldbus::buildWriteSingleRequest(9, 1, 31, 0xABCD);
    if (!crane::fieldbus::handleRequest(bank, 1, request, response) ||
        !crane::fieldbus::parseWriteResponse(response, 9, crane::fieldbus::kFnWriteSingleRegister, 31, 0xABCD, error)) {
        std::cerr << "write single should echo the request: " << error << "\n";
        return 1;
    }
    if (response != request) {
        std::cerr << "write single response should be the request echo\n";
        return 1;
    }

    request = crane::fieldbus::buildReadHoldingRequest(10, 1, 30, 5);
    if (!crane::fieldbus::handleRequest(bank, 1, request, response) ||
        !isException(response, crane::fieldbus::kFnReadHoldingRegisters, crane::fieldbus::kExIllegalDataAddress)) {
        std::cerr << "out-of-range read should raise illegal data address\n";
        return 1;
    }
    if (crane::fieldbus::parseReadHoldingResponse(response, 10, 5, values, error) ||
        error.find("modbus exception") == std::string::npos) {
        std::cerr << "exception reply should surface as a modbus exception\n";
        return 1;
    }

    request = crane::fieldbus::buildReadHoldingRequest(11, 1, 0, 126);
    if (!crane::fieldbus::handleRequest(bank, 1, request, response) ||
        !isException(response, crane::fieldbus::kFnReadHoldingRegisters, crane::fieldbus::kExIllegalDataValue)) {
        std::cerr << "read of 126 registers should raise illegal data value\n";
        return 1;
    }

    request = adu(12, 1, {0x2B, 0x0E, 0x01, 0x00});
    if (!crane::fieldbus::handleRequest(bank, 1, request, response) ||
        !isException(response, 0x2B, crane::fieldbus::kExIllegalFunction)) {
        std::cerr << "unsupported function should raise illegal function\n";
        return 1;
    }

    request = crane::fieldbus::buildReadHoldingRequest(13, 5, 0, 1);
    if (!crane::fieldbus::handleRequest(bank, 1, request, response) ||
        !isException(response, crane::fieldbus::kFnReadHoldingRegisters, crane::fieldbus::kExGatewayTargetFailed)) {
        std::cerr << "foreign unit id should raise gateway target failed\n";
        return 1;
    }

    // Write multiple whose byte count disagrees with the register count.
    request = adu(14, 1, {0x10, 0x00, 0x00, 0x00, 0x02, 0x02, 0x00, 0x01});
    if (!crane::fieldbus::handleRequest(bank, 1, request, response) ||
        !isException(response, crane::fieldbus::kFnWriteMultipleRegisters, crane::fieldbus::kExIllegalDataValue)) {
        std::cerr << "inconsistent byte count should raise illegal data value\n";
        return 1;
    }

    request = crane::fieldbus::buildReadHoldingRequest(15, 1, 0, 1);
    request[2] = 0x00;
    request[3] = 0x01;
    if (crane::fieldbus::handleRequest(bank, 1, request, response)) {
        std::cerr << "non-zero protocol id should be dropped\n";
        return 1;
    }

    crane::fieldbus::MbapHeader header;
    const std::vector<uint8_t> short_header{0x00, 0x01, 0x00};
    if (crane::fieldbus::parseMbapHeader(short_header.data(), short_header.size(), header, error)) {
        std::cerr << "truncated header should be rejected\n";
        return 1;
    }

    return 0;
}
