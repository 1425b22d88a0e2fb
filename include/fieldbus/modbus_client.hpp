#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace crane::fieldbus {

class ModbusClient {
public:
    explicit ModbusClient(uint8_t unit_id = 1);
    ~ModbusClient();

    ModbusClient(const ModbusClient&) = delete;
    ModbusClient& operator=(const ModbusClient&) = delete;

    bool connect(const std::string& host, uint16_t port, int timeout_ms, std::string& error);
    void disconnect();
    bool isConnected() const { return fd_ >= 0; }

    void setIoTimeoutMs(int timeout_ms) { io_timeout_ms_ = timeout_ms; }

    // Any transport failure closes the connection; a Modbus exception reply
    // does not.
    bool readHoldingRegisters(uint16_t address, int count, std::vector<uint16_t>& out, std::string& error);
    bool writeRegisters(uint16_t address, const uint16_t* values, int count, std::string& error);
    bool writeRegister(uint16_t address, uint16_t value, std::string& error);

private:
    bool transact(const std::vector<uint8_t>& request, std::vector<uint8_t>& response, std::string& error);
    uint16_t nextTransactionId();

    int fd_{-1};
    uint8_t unit_id_{1};
    int io_timeout_ms_{1000};
    uint16_t next_transaction_id_{1};
};

// Exponential reconnect delay between min and max.
class ReconnectBackoff {
public:
    ReconnectBackoff(int min_ms, int max_ms);

    // Delay to wait before the next attempt; doubles on every call.
    int nextDelayMs();
    void reset();

private:
    int min_ms_;
    int max_ms_;
    int current_ms_;
};

}  // namespace crane::fieldbus
