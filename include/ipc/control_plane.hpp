#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "runtime/camera_arbitrator.hpp"
#include "runtime/process_control.hpp"

namespace crane::ipc {

// Requests accepted by the arbiter daemon, one per line:
//   status | acquire <circuit> | opened <circuit> | release <circuit>
enum class ArbiterVerb {
    Status,
    Acquire,
    Opened,
    Release,
};

struct ArbiterRequest {
    ArbiterVerb verb{ArbiterVerb::Status};
    runtime::Circuit circuit{runtime::Circuit::Bridge};
};

bool parseArbiterRequest(const std::string& line, ArbiterRequest& out, std::string& error);
std::string formatArbiterRequest(const ArbiterRequest& request);

// Runs one request line against the arbitrator. Replies start with "OK" or "ERR".
std::string dispatchArbiterRequest(runtime::CameraArbitrator& arbitrator, const std::string& line);

// Binds calibration sessions to control connections. A circuit acquired on a
// connection is held by it: other connections may not mark it opened or
// release it, and closing the connection releases it.
class ArbiterSessions {
public:
    explicit ArbiterSessions(runtime::CameraArbitrator& arbitrator);

    std::string handle(uint64_t connection, const std::string& line);
    void disconnect(uint64_t connection);

    // Connection holding the circuit, 0 when none.
    uint64_t holder(runtime::Circuit circuit) const;

private:
    static std::size_t slot(runtime::Circuit circuit) { return circuit == runtime::Circuit::Bridge ? 0U : 1U; }

    runtime::CameraArbitrator& arbitrator_;
    mutable std::mutex mutex_;
    std::array<uint64_t, 2> holders_{{0, 0}};
};

// Request lines over a Unix stream socket. A connection stays open for any
// number of requests; each reply ends with an empty line. One thread per
// connection, and the close handler runs once the peer is gone.
class ControlSocketServer {
public:
    using Handler = std::function<std::string(uint64_t connection, const std::string& line)>;
    using CloseHandler = std::function<void(uint64_t connection)>;

    ControlSocketServer() = default;
    ~ControlSocketServer();

    ControlSocketServer(const ControlSocketServer&) = delete;
    ControlSocketServer& operator=(const ControlSocketServer&) = delete;

    bool start(const std::string& socket_path, Handler handler, CloseHandler on_close, std::string& error);
    void stop();
    bool isRunning() const { return running_.load(); }
    const std::string& socketPath() const { return socket_path_; }
    int connectionCount() const;

private:
    struct ClientSlot {
        int fd{-1};
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void acceptLoop();
    void serveClient(int fd, uint64_t connection, std::shared_ptr<std::atomic<bool>> done);
    void reapFinishedClients();

    std::atomic<bool> running_{false};
    std::string socket_path_{};
    Handler handler_{};
    CloseHandler on_close_{};
    std::thread thread_{};
    int listen_fd_{-1};
    uint64_t next_connection_{1};

    mutable std::mutex clients_mutex_;
    std::vector<ClientSlot> clients_;
};

// Client end of a control connection. Anything acquired through it is held
// until released or until the connection closes.
class ControlConnection {
public:
    ControlConnection() = default;
    ~ControlConnection();

    ControlConnection(const ControlConnection&) = delete;
    ControlConnection& operator=(const ControlConnection&) = delete;

    bool connect(const std::string& socket_path, std::string& error);
    // Sends one line and waits for its reply, returned without the closing empty line.
    bool request(const std::string& line, std::string& reply, std::string& error, int timeout_ms = 15000);
    // True once the server has closed its end.
    bool peerClosed() const;
    void close();
    bool isOpen() const { return fd_ >= 0; }

private:
    int fd_{-1};
    std::string pending_;
};

// One request on a fresh connection, closed afterwards.
bool sendControlRequest(const std::string& socket_path, const std::string& request, std::string& reply,
                        std::string& error, int timeout_ms = 15000);

}  // namespace crane::ipc
