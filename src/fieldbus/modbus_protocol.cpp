#include "fieldbus/modbus_protocol.hpp"

namespace crane::fieldbus {

namespace {

uint16_t get16(const uint8_t* p) {
    return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8U) | p[1]);
}

void put16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>((v >> 8U) & 0xFFU));
    out.push_back(static_cast<uint8_t>(v & 0xFFU));
}

std::vector<uint8_t> makeAdu(uint16_t transaction_id, uint8_t unit_id, const std::vector<uint8_t>& pdu) {
    std::vector<uint8_t> adu;
    adu.reserve(kMbapHeaderSize + pdu.size());
    put16(adu, transaction_id);
    put16(adu, 0U);
    put16(adu, static_cast<uint16_t>(pdu.size() + 1U));
    adu.push_back(unit_id);
    adu.insert(adu.end(), pdu.begin(), pdu.end());
    return adu;
}

std::vector<uint8_t> exceptionPdu(uint8_t function, uint8_t code) {
    return {static_cast<uint8_t>(function | 0x80U), code};
}

std::vector<uint8_t> handlePdu(RegisterBank& bank, const uint8_t* pdu, std::size_t size) {
    const uint8_t function = pdu[0];
    switch (function) {
        case kFnReadHoldingRegisters: {
            if (size != 5U) {
                return exceptionPdu(function, kExIllegalDataValue);
            }
            const uint16_t address = get16(pdu + 1);
            const uint16_t count = get16(pdu + 3);
            if (count < 1U || count > kMaxReadCount) {
                return exceptionPdu(function, kExIllegalDataValue);
            }
            std::vector<uint16_t> values;
            if (!bank.read(address, count, values)) {
                return exceptionPdu(function, kExIllegalDataAddress);
            }
            std::vector<uint8_t> out{function, static_cast<uint8_t>(count * 2U)};
            for (uint16_t v : values) {
                put16(out, v);
            }
            return out;
        }
        case kFnWriteSingleRegister: {
            if (size != 5U) {
                return exceptionPdu(function, kExIllegalDataValue);
            }
            if (!bank.writeSingle(get16(pdu + 1), get16(pdu + 3))) {
                return exceptionPdu(function, kExIllegalDataAddress);
            }
            return std::vector<uint8_t>(pdu, pdu + size);
        }
        case kFnWriteMultipleRegisters: {
            if (size < 6U) {
                return exceptionPdu(function, kExIllegalDataValue);
            }
            const uint16_t address = get16(pdu + 1);
            const uint16_t count = get16(pdu + 3);
            const std::size_t byte_count = pdu[5];
            if (count < 1U || count > kMaxWriteCount || byte_count != count * 2U || size != 6U + byte_count) {
                return exceptionPdu(function, kExIllegalDataValue);
            }
            std::vector<uint16_t> values(count);
            for (std::size_t i = 0; i < count; ++i) {
                values[i] = get16(pdu + 6 + i * 2U);
            }
            if (!bank.write(address, values.data(), count)) {
                return exceptionPdu(function, kExIllegalDataAddress);
            }
            std::vector<uint8_t> out{function};
            put16(out, address);
            put16(out, count);
            return out;
        }
        default:
            return exceptionPdu(function, kExIllegalFunction);
    }
}

bool checkResponseHeader(const std::vector<uint8_t>& response, uint16_t transaction_id, MbapHeader& header,
                         std::string& error) {
    if (!parseMbapHeader(response.data(), response.size(), header, error)) {
        return false;
    }
    if (header.transaction_id != transaction_id) {
        error = "transaction id mismatch: expected " + std::to_string(transaction_id) + ", got " +
                std::to_string(header.transaction_id);
        return false;
    }
    if (response.size() != kMbapHeaderSize - 1U + header.length || header.length < 3U) {
        error = "response length does not match MBAP header";
        return false;
    }
    return true;
}

bool checkException(uint8_t expected_function, const uint8_t* pdu, std::string& error) {
    if (pdu[0] == (expected_function | 0x80U)) {
        error = std::string("modbus exception: ") + exceptionName(pdu[1]);
        return false;
    }
    if (pdu[0] != expected_function) {
        error = "unexpected function code in response";
        return false;
    }
    return true;
}

}  // namespace

bool parseMbapHeader(const uint8_t* data, std::size_t size, MbapHeader& out, std::string& error) {
    if (data == nullptr || size < kMbapHeaderSize) {
        error = "short MBAP header";
        return false;
    }
    out.transaction_id = get16(data);
    out.protocol_id = get16(data + 2);
    out.length = get16(data + 4);
    out.unit_id = data[6];
    if (out.protocol_id != 0U) {
        error = "unsupported protocol id " + std::to_string(out.protocol_id);
        return false;
    }
    if (out.length < 2U || kMbapHeaderSize - 1U + out.length > kMaxAduSize) {
        error = "invalid MBAP length " + std::to_string(out.length);
        return false;
    }
    return true;
}

const char* exceptionName(uint8_t code) {
    switch (code) {
        case kExIllegalFunction: return "illegal function";
        case kExIllegalDataAddress: return "illegal data address";
        case kExIllegalDataValue: return "illegal data value";
        case kExGatewayTargetFailed: return "gateway target device failed to respond";
        default: return "unknown exception";
    }
}

bool handleRequest(RegisterBank& bank, uint8_t unit_id, const std::vector<uint8_t>& request,
                   std::vector<uint8_t>& response) {
    MbapHeader header;
    std::string error;
    if (!parseMbapHeader(request.data(), request.size(), header, error)) {
        return false;
    }
    if (request.size() != kMbapHeaderSize - 1U + header.length) {
        return false;
    }
    const uint8_t* pdu = request.data() + kMbapHeaderSize;
    const std::size_t pdu_size = request.size() - kMbapHeaderSize;

    if (header.unit_id != unit_id) {
        response = makeAdu(header.transaction_id, header.unit_id, exceptionPdu(pdu[0], kExGatewayTargetFailed));
        return true;
    }
    response = makeAdu(header.transaction_id, header.unit_id, handlePdu(bank, pdu, pdu_size));
    return true;
}

std::vector<uint8_t> buildReadHoldingRequest(uint16_t transaction_id, uint8_t unit_id, uint16_t address, uint16_t count) {
    std::vector<uint8_t> pdu{kFnReadHoldingRegisters};
    put16(pdu, address);
    put16(pdu, count);
    return makeAdu(transaction_id, unit_id, pdu);
}

std::vector<uint8_t> buildWriteSingleRequest(uint16_t transaction_id, uint8_t unit_id, uint16_t address, uint16_t value) {
    std::vector<uint8_t> pdu{kFnWriteSingleRegister};
    put16(pdu, address);
    put16(pdu, value);
    return makeAdu(transaction_id, unit_id, pdu);
}

std::vector<uint8_t> buildWriteMultipleRequest(uint16_t transaction_id, uint8_t unit_id, uint16_t address,
                                               const uint16_t* values, int count) {
    std::vector<uint8_t> pdu{kFnWriteMultipleRegisters};
    put16(pdu, address);
    put16(pdu, static_cast<uint16_t>(count));
    pdu.push_back(static_cast<uint8_t>(count * 2));
    for (int i = 0; i < count; ++i) {
        put16(pdu, values[i]);
    }
    return makeAdu(transaction_id, unit_id, pdu);
}

bool parseReadHoldingResponse(const std::vector<uint8_t>& response, uint16_t transaction_id, int count,
                              std::vector<uint16_t>& out, std::string& error) {
    MbapHeader header;
    if (!checkResponseHeader(response, transaction_id, header, error)) {
        return false;
    }
    const uint8_t* pdu = response.data() + kMbapHeaderSize;
    if (!checkException(kFnReadHoldingRegisters, pdu, error)) {
        return false;
    }
    const std::size_t pdu_size = response.size() - kMbapHeaderSize;
    if (pdu_size < 2U || pdu[1] != count * 2 || pdu_size != 2U + pdu[1]) {
        error = "read response byte count mismatch";
        return false;
    }
    out.resize(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        out[static_cast<std::size_t>(i)] = get16(pdu + 2 + i * 2);
    }
    error.clear();
    return true;
}

bool parseWriteResponse(const std::vector<uint8_t>& response, uint16_t transaction_id, uint8_t function,
                        uint16_t address, uint16_t value_or_count, std::string& error) {
    MbapHeader header;
    if (!checkResponseHeader(response, transaction_id, header, error)) {
        return false;
    }
    const uint8_t* pdu = response.data() + kMbapHeaderSize;
    if (!checkException(function, pdu, error)) {
        return false;
    }
    if (response.size() - kMbapHeaderSize != 5U || get16(pdu + 1) != address || get16(pdu + 3) != value_or_count) {
        error = "write response does not echo the request";
        return false;
    }
    error.clear();
    return true;
}

}  // namespace crane::fieldbus
