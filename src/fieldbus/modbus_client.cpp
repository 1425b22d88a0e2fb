#include "fieldbus/modbus_client.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include "fieldbus/modbus_protocol.hpp"
#include "fieldbus/socket_io.hpp"

#ifdef __linux__
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace crane::fieldbus {

namespace {

#ifdef __linux__
bool connectWithTimeout(int fd, const sockaddr* addr, socklen_t len, int timeout_ms, std::string& error) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(fd, addr, len);
    if (rc < 0 && errno != EINPROGRESS) {
        error = std::string("connect failed: ") + std::strerror(errno);
        return false;
    }
    if (rc < 0) {
        pollfd p{};
        p.fd = fd;
        p.events = POLLOUT;
        rc = ::poll(&p, 1, timeout_ms);
        if (rc <= 0) {
            error = "connect timed out after " + std::to_string(timeout_ms) + " ms";
            return false;
        }
        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len);
        if (so_error != 0) {
            error = std::string("connect failed: ") + std::strerror(so_error);
            return false;
        }
    }
    ::fcntl(fd, F_SETFL, flags);
    return true;
}
#endif

}  // namespace

ModbusClient::ModbusClient(uint8_t unit_id) : unit_id_(unit_id) {}

ModbusClient::~ModbusClient() {
    disconnect();
}

bool ModbusClient::connect(const std::string& host, uint16_t port, int timeout_ms, std::string& error) {
    disconnect();
#ifdef __linux__
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    const std::string port_text = std::to_string(port);
    const int gai = ::getaddrinfo(host.c_str(), port_text.c_str(), &hints, &res);
    if (gai != 0 || res == nullptr) {
        error = "cannot resolve " + host + ": " + ::gai_strerror(gai);
        return false;
    }

    error = "no usable address for " + host;
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }
        if (connectWithTimeout(fd, ai->ai_addr, ai->ai_addrlen, timeout_ms, error)) {
            int yes = 1;
            setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
            fd_ = fd;
            break;
        }
        ::close(fd);
    }
    ::freeaddrinfo(res);
    if (fd_ < 0) {
        error = host + ":" + port_text + ": " + error;
        return false;
    }
    error.clear();
    return true;
#else
    (void)host;
    (void)port;
    (void)timeout_ms;
    error = "ModbusClient requires Linux";
    return false;
#endif
}

void ModbusClient::disconnect() {
#ifdef __linux__
    if (fd_ >= 0) {
        ::close(fd_);
    }
#endif
    fd_ = -1;
}

uint16_t ModbusClient::nextTransactionId() {
    const uint16_t id = next_transaction_id_++;
    if (next_transaction_id_ == 0U) {
        next_transaction_id_ = 1U;
    }
    return id;
}

bool ModbusClient::transact(const std::vector<uint8_t>& request, std::vector<uint8_t>& response, std::string& error) {
    if (fd_ < 0) {
        error = "not connected";
        return false;
    }
    if (!sendAll(fd_, request.data(), request.size(), io_timeout_ms_, error) ||
        !recvAdu(fd_, io_timeout_ms_, response, error)) {
        disconnect();
        return false;
    }
    return true;
}

bool ModbusClient::readHoldingRegisters(uint16_t address, int count, std::vector<uint16_t>& out, std::string& error) {
    if (count < 1 || count > kMaxReadCount) {
        error = "read count out of range";
        return false;
    }
    const uint16_t tid = nextTransactionId();
    std::vector<uint8_t> response;
    if (!transact(buildReadHoldingRequest(tid, unit_id_, address, static_cast<uint16_t>(count)), response, error)) {
        return false;
    }
    if (!parseReadHoldingResponse(response, tid, count, out, error)) {
        if (error.rfind("modbus exception", 0) != 0) {
            disconnect();
        }
        return false;
    }
    return true;
}

bool ModbusClient::writeRegisters(uint16_t address, const uint16_t* values, int count, std::string& error) {
    if (values == nullptr || count < 1 || count > kMaxWriteCount) {
        error = "write count out of range";
        return false;
    }
    const uint16_t tid = nextTransactionId();
    std::vector<uint8_t> response;
    if (!transact(buildWriteMultipleRequest(tid, unit_id_, address, values, count), response, error)) {
        return false;
    }
    if (!parseWriteResponse(response, tid, kFnWriteMultipleRegisters, address, static_cast<uint16_t>(count), error)) {
        if (error.rfind("modbus exception", 0) != 0) {
            disconnect();
        }
        return false;
    }
    return true;
}

bool ModbusClient::writeRegister(uint16_t address, uint16_t value, std::string& error) {
    const uint16_t tid = nextTransactionId();
    std::vector<uint8_t> response;
    if (!transact(buildWriteSingleRequest(tid, unit_id_, address, value), response, error)) {
        return false;
    }
    if (!parseWriteResponse(response, tid, kFnWriteSingleRegister, address, value, error)) {
        if (error.rfind("modbus exception", 0) != 0) {
            disconnect();
        }
        return false;
    }
    return true;
}

ReconnectBackoff::ReconnectBackoff(int min_ms, int max_ms)
    : min_ms_(std::max(1, min_ms)), max_ms_(std::max(std::max(1, min_ms), max_ms)), current_ms_(min_ms_) {}

int ReconnectBackoff::nextDelayMs() {
    const int delay = current_ms_;
    current_ms_ = std::min(max_ms_, current_ms_ * 2);
    return delay;
}

void ReconnectBackoff::reset() {
    current_ms_ = min_ms_;
}

}  // namespace crane::fieldbus
