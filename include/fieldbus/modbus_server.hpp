#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "fieldbus/register_bank.hpp"

namespace crane::fieldbus {

// Modbus TCP server over a RegisterBank. One thread accepts, one thread per
// connected client; a dropped client never affects the others.
class ModbusServer {
public:
    ModbusServer(RegisterBank& bank, uint8_t unit_id);
    ~ModbusServer();

    ModbusServer(const ModbusServer&) = delete;
    ModbusServer& operator=(const ModbusServer&) = delete;

    // Binds synchronously so a busy port is reported here. Port 0 picks an
    // ephemeral port, see port().
    bool start(const std::string& host, uint16_t port, std::string& error);
    void stop();
    bool isRunning() const { return running_.load(); }

    uint16_t port() const { return port_; }
    int clientCount() const;
    uint64_t requestCount() const { return requests_.load(); }

private:
    struct ClientSlot {
        int fd{-1};
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void acceptLoop();
    void serveClient(int fd, std::shared_ptr<std::atomic<bool>> done);
    void reapFinishedClients();

    RegisterBank& bank_;
    uint8_t unit_id_{1};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> requests_{0};
    uint16_t port_{0};
    int listen_fd_{-1};
    std::thread accept_thread_;

    mutable std::mutex clients_mutex_;
    std::vector<ClientSlot> clients_;
};

}  // namespace crane::fieldbus
