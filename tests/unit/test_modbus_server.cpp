#include "fieldbus/modbus_client.hpp"
#include "fieldbus/modbus_server.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

int main() {
#ifdef __linux__
    crane::fieldbus::RegisterBank bank(256);
    crane::fieldbus::ModbusServer server(bank, 1);
    std::string err;
    if (!server.start("127.0.0.1", 0, err)) {
        std::cerr << "server.start failed: " << err << "\n";
        return 1;
    }
    if (server.port() == 0U) {
        std::cerr << "server should report its bound port\n";
        return 1;
    }

    crane::fieldbus::RegisterBank other_bank(16);
    crane::fieldbus::ModbusServer clash(other_bank, 1);
    if (clash.start("127.0.0.1", server.port(), err)) {
        std::cerr << "second bind to a busy port should fail\n";
        return 1;
    }

    crane::fieldbus::ModbusClient writer(1);
    crane::fieldbus::ModbusClient reader(1);
    if (!writer.connect("127.0.0.1", server.port(), 1000, err) ||
        !reader.connect("127.0.0.1", server.port(), 1000, err)) {
        std::cerr << "client connect failed: " << err << "\n";
        return 1;
    }

    const uint16_t block[] = {0x3F80, 0x0000, 7, 1};
    if (!writer.writeRegisters(100, block, 4, err)) {
        std::cerr << "write multiple failed: " << err << "\n";
        return 1;
    }
    std::vector<uint16_t> values;
    if (!reader.readHoldingRegisters(100, 4, values, err) || values.size() != 4U || values[2] != 7) {
        std::cerr << "reader should see the written block: " << err << "\n";
        return 1;
    }
    if (!writer.writeRegister(50, 0x1234, err) || !bank.read(50, 1, values) || values[0] != 0x1234) {
        std::cerr << "write single should reach the bank: " << err << "\n";
        return 1;
    }

    if (reader.readHoldingRegisters(250, 10, values, err)) {
        std::cerr << "out-of-range read should fail\n";
        return 1;
    }
    if (err.find("modbus exception") == std::string::npos || !reader.isConnected()) {
        std::cerr << "exception reply should keep the connection: " << err << "\n";
        return 1;
    }

    // One client dropping leaves the other connection serving.
    writer.disconnect();
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    if (!reader.readHoldingRegisters(100, 2, values, err) || values[0] != 0x3F80) {
        std::cerr << "remaining client should keep working: " << err << "\n";
        return 1;
    }

    crane::fieldbus::ModbusClient wrong_unit(9);
    if (!wrong_unit.connect("127.0.0.1", server.port(), 1000, err)) {
        std::cerr << "wrong-unit client connect failed: " << err << "\n";
        return 1;
    }
    if (wrong_unit.readHoldingRegisters(100, 1, values, err)) {
        std::cerr << "request for a foreign unit should be refused\n";
        return 1;
    }

    if (server.requestCount() < 4U) {
        std::cerr << "server request counter too low\n";
        return 1;
    }

    server.stop();
    if (server.isRunning()) {
        std::cerr << "server should stop\n";
        return 1;
    }
    if (reader.readHoldingRegisters(100, 1, values, err) || reader.isConnected()) {
        std::cerr << "client should notice the stopped server\n";
        return 1;
    }

    crane::fieldbus::ModbusClient late(1);
    if (late.connect("127.0.0.1", server.port(), 300, err)) {
        std::cerr << "connect to a stopped server should fail\n";
        return 1;
    }
    return 0;
#else
    return 0;
#endif
}
