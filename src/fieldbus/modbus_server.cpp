#include "fieldbus/modbus_server.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>

#include "fieldbus/modbus_protocol.hpp"
#include "fieldbus/socket_io.hpp"

#ifdef __linux__
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace crane::fieldbus {

namespace {
constexpr int kPollIntervalMs = 200;
constexpr int kFrameTimeoutMs = 2000;
}  // namespace

ModbusServer::ModbusServer(RegisterBank& bank, uint8_t unit_id) : bank_(bank), unit_id_(unit_id) {}

ModbusServer::~ModbusServer() {
    stop();
}

bool ModbusServer::start(const std::string& host, uint16_t port, std::string& error) {
    if (running_.load()) {
        error = "modbus server already running";
        return false;
    }
#ifdef __linux__
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;
    addrinfo* res = nullptr;
    const std::string port_text = std::to_string(port);
    const int gai = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), port_text.c_str(), &hints, &res);
    if (gai != 0 || res == nullptr) {
        error = "cannot resolve listen address " + host + ": " + ::gai_strerror(gai);
        return false;
    }

    listen_fd_ = ::socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (listen_fd_ < 0) {
        ::freeaddrinfo(res);
        error = std::string("socket failed: ") + std::strerror(errno);
        return false;
    }
    int yes = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    const bool bound = ::bind(listen_fd_, res->ai_addr, res->ai_addrlen) == 0;
    ::freeaddrinfo(res);
    if (!bound || ::listen(listen_fd_, 16) < 0) {
        error = "cannot listen on " + host + ":" + port_text + ": " + std::strerror(errno);
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    sockaddr_in bound_addr{};
    socklen_t len = sizeof(bound_addr);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound_addr), &len) == 0) {
        port_ = ntohs(bound_addr.sin_port);
    } else {
        port_ = port;
    }

    running_.store(true);
    accept_thread_ = std::thread(&ModbusServer::acceptLoop, this);
    error.clear();
    return true;
#else
    (void)host;
    (void)port;
    error = "ModbusServer requires Linux";
    return false;
#endif
}

void ModbusServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
#ifdef __linux__
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    std::vector<ClientSlot> slots;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        slots.swap(clients_);
    }
    for (ClientSlot& slot : slots) {
        ::shutdown(slot.fd, SHUT_RDWR);
    }
    for (ClientSlot& slot : slots) {
        if (slot.thread.joinable()) {
            slot.thread.join();
        }
        ::close(slot.fd);
    }
#endif
}

int ModbusServer::clientCount() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    int active = 0;
    for (const ClientSlot& slot : clients_) {
        if (!slot.done->load()) {
            ++active;
        }
    }
    return active;
}

void ModbusServer::reapFinishedClients() {
#ifdef __linux__
    std::lock_guard<std::mutex> lock(clients_mutex_);
    for (auto it = clients_.begin(); it != clients_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            ::close(it->fd);
            it = clients_.erase(it);
        } else {
            ++it;
        }
    }
#endif
}

void ModbusServer::acceptLoop() {
#ifdef __linux__
    while (running_.load()) {
        reapFinishedClients();
        if (!waitReadable(listen_fd_, kPollIntervalMs)) {
            continue;
        }
        const int client_fd = ::accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            continue;
        }
        int yes = 1;
        setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(clients_mutex_);
        ClientSlot slot;
        slot.fd = client_fd;
        slot.done = done;
        slot.thread = std::thread(&ModbusServer::serveClient, this, client_fd, done);
        clients_.push_back(std::move(slot));
    }
#endif
}

void ModbusServer::serveClient(int fd, std::shared_ptr<std::atomic<bool>> done) {
    std::vector<uint8_t> request;
    std::vector<uint8_t> response;
    std::string error;
    while (running_.load()) {
        if (!waitReadable(fd, kPollIntervalMs)) {
            continue;
        }
        if (!recvAdu(fd, kFrameTimeoutMs, request, error)) {
            if (error != "peer closed" && running_.load()) {
                std::cerr << "[MODBUS] dropping client: " << error << "\n";
            }
            break;
        }
        if (!handleRequest(bank_, unit_id_, request, response)) {
            std::cerr << "[MODBUS] dropping client: malformed request\n";
            break;
        }
        requests_.fetch_add(1U);
        if (!sendAll(fd, response.data(), response.size(), kFrameTimeoutMs, error)) {
            break;
        }
    }
    done->store(true);
}

}  // namespace crane::fieldbus
