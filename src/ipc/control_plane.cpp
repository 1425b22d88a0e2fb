#include "ipc/control_plane.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <sstream>
#include <utility>

#ifdef __linux__
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#endif

namespace crane::ipc {

namespace {

constexpr std::size_t kMaxRequestBytes = 1024;
constexpr int kPollIntervalMs = 200;

const char* verbName(ArbiterVerb verb) {
    switch (verb) {
        case ArbiterVerb::Status: return "status";
        case ArbiterVerb::Acquire: return "acquire";
        case ArbiterVerb::Opened: return "opened";
        case ArbiterVerb::Release: return "release";
    }
    return "status";
}

bool parseVerb(const std::string& text, ArbiterVerb& out) {
    for (ArbiterVerb v : {ArbiterVerb::Status, ArbiterVerb::Acquire, ArbiterVerb::Opened, ArbiterVerb::Release}) {
        if (text == verbName(v)) {
            out = v;
            return true;
        }
    }
    return false;
}

std::string okReply(runtime::Circuit circuit, const char* what) {
    return std::string("OK ") + runtime::circuitName(circuit) + " " + what + "\n";
}

#ifdef __linux__
bool waitReadable(int fd, int timeout_ms) {
    pollfd p{};
    p.fd = fd;
    p.events = POLLIN;
    int rc = 0;
    do {
        rc = ::poll(&p, 1, timeout_ms);
    } while (rc < 0 && errno == EINTR);
    return rc > 0;
}

bool makeAddress(const std::string& socket_path, sockaddr_un& addr, std::string& error) {
    addr = sockaddr_un{};
    if (socket_path.empty() || socket_path.size() >= sizeof(addr.sun_path)) {
        error = "control socket path '" + socket_path + "' is empty or too long";
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path.c_str());
    return true;
}

bool writeAll(int fd, const std::string& data) {
    std::size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        off += static_cast<std::size_t>(n);
    }
    return true;
}
#endif

}  // namespace

bool parseArbiterRequest(const std::string& line, ArbiterRequest& out, std::string& error) {
    std::istringstream in(line);
    std::string verb_text;
    std::string circuit_text;
    std::string extra;
    in >> verb_text >> circuit_text >> extra;

    ArbiterRequest req{};
    if (!parseVerb(verb_text, req.verb)) {
        error = verb_text.empty() ? "empty request" : "unknown command '" + verb_text + "'";
        return false;
    }
    if (req.verb == ArbiterVerb::Status) {
        if (!circuit_text.empty()) {
            error = "status takes no arguments";
            return false;
        }
        out = req;
        return true;
    }
    if (!runtime::parseCircuit(circuit_text, req.circuit)) {
        error = "expected circuit bridge|hook";
        return false;
    }
    if (!extra.empty()) {
        error = "unexpected argument '" + extra + "'";
        return false;
    }
    out = req;
    return true;
}

std::string formatArbiterRequest(const ArbiterRequest& request) {
    if (request.verb == ArbiterVerb::Status) {
        return "status\n";
    }
    return std::string(verbName(request.verb)) + " " + runtime::circuitName(request.circuit) + "\n";
}

std::string dispatchArbiterRequest(runtime::CameraArbitrator& arbitrator, const std::string& line) {
    ArbiterRequest req{};
    std::string error;
    if (!parseArbiterRequest(line, req, error)) {
        return "ERR " + error + "\n";
    }

    switch (req.verb) {
        case ArbiterVerb::Status:
            return "OK status\n" + arbitrator.statusText();
        case ArbiterVerb::Acquire:
            if (!arbitrator.acquire(req.circuit, error)) {
                return "ERR " + error + "\n";
            }
            return okReply(req.circuit, "released");
        case ArbiterVerb::Opened:
            if (!arbitrator.markCalibrationOpened(req.circuit, error)) {
                return "ERR " + error + "\n";
            }
            return okReply(req.circuit, "calibration");
        case ArbiterVerb::Release: {
            const auto outcome = arbitrator.release(req.circuit, error);
            if (outcome == runtime::ReleaseOutcome::Failed) {
                return "ERR " + error + "\n";
            }
            return okReply(req.circuit, runtime::releaseOutcomeName(outcome));
        }
    }
    return "ERR unhandled request\n";
}

ArbiterSessions::ArbiterSessions(runtime::CameraArbitrator& arbitrator) : arbitrator_(arbitrator) {}

std::string ArbiterSessions::handle(uint64_t connection, const std::string& line) {
    ArbiterRequest req{};
    std::string error;
    if (!parseArbiterRequest(line, req, error)) {
        return "ERR " + error + "\n";
    }
    if (req.verb == ArbiterVerb::Status) {
        return dispatchArbiterRequest(arbitrator_, line);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t& holder = holders_[slot(req.circuit)];
    const std::string name = runtime::circuitName(req.circuit);
    switch (req.verb) {
        case ArbiterVerb::Acquire: {
            if (holder != 0 && holder != connection) {
                return "ERR " + name + " is held by another client\n";
            }
            std::string reply = dispatchArbiterRequest(arbitrator_, line);
            if (reply.rfind("OK", 0) == 0) {
                holder = connection;
            }
            return reply;
        }
        case ArbiterVerb::Opened:
            if (holder != connection) {
                return "ERR " + name + " is not held by this client\n";
            }
            return dispatchArbiterRequest(arbitrator_, line);
        case ArbiterVerb::Release: {
            if (holder != 0 && holder != connection) {
                return "ERR " + name + " is held by another client\n";
            }
            // The arbitrator ends the session even when the relaunch fails.
            holder = 0;
            return dispatchArbiterRequest(arbitrator_, line);
        }
        case ArbiterVerb::Status:
            break;
    }
    return dispatchArbiterRequest(arbitrator_, line);
}

void ArbiterSessions::disconnect(uint64_t connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (runtime::Circuit c : runtime::kAllCircuits) {
        uint64_t& holder = holders_[slot(c)];
        if (holder != connection) {
            continue;
        }
        holder = 0;
        std::string error;
        const auto outcome = arbitrator_.release(c, error);
        if (outcome == runtime::ReleaseOutcome::Failed) {
            std::cerr << "[ARBITER] " << runtime::circuitName(c) << " client gone, release failed: " << error << "\n";
        } else {
            std::cout << "[ARBITER] " << runtime::circuitName(c) << " client gone, session ended ("
                      << runtime::releaseOutcomeName(outcome) << ")\n";
        }
    }
}

uint64_t ArbiterSessions::holder(runtime::Circuit circuit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return holders_[slot(circuit)];
}

ControlSocketServer::~ControlSocketServer() {
    stop();
}

bool ControlSocketServer::start(const std::string& socket_path, Handler handler, CloseHandler on_close,
                                std::string& error) {
    stop();
#ifdef __linux__
    sockaddr_un addr{};
    if (!makeAddress(socket_path, addr, error)) {
        return false;
    }
    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        error = std::string("control socket: ") + std::strerror(errno);
        return false;
    }
    // A stale socket file from a crashed daemon would make bind fail.
    ::unlink(socket_path.c_str());
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(fd, 8) < 0) {
        error = "cannot listen on " + socket_path + ": " + std::strerror(errno);
        ::close(fd);
        return false;
    }

    listen_fd_ = fd;
    socket_path_ = socket_path;
    handler_ = std::move(handler);
    on_close_ = std::move(on_close);
    running_.store(true);
    thread_ = std::thread(&ControlSocketServer::acceptLoop, this);
    error.clear();
    return true;
#else
    (void)socket_path;
    (void)handler;
    (void)on_close;
    error = "control socket requires Linux";
    return false;
#endif
}

void ControlSocketServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
#ifdef __linux__
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    ::unlink(socket_path_.c_str());

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

int ControlSocketServer::connectionCount() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    int active = 0;
    for (const ClientSlot& slot : clients_) {
        if (!slot.done->load()) {
            ++active;
        }
    }
    return active;
}

void ControlSocketServer::reapFinishedClients() {
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

void ControlSocketServer::acceptLoop() {
#ifdef __linux__
    while (running_.load()) {
        reapFinishedClients();
        if (!waitReadable(listen_fd_, kPollIntervalMs)) {
            continue;
        }
        const int client_fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            continue;
        }
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(clients_mutex_);
        ClientSlot slot;
        slot.fd = client_fd;
        slot.done = done;
        slot.thread = std::thread(&ControlSocketServer::serveClient, this, client_fd, next_connection_++, done);
        clients_.push_back(std::move(slot));
    }
#endif
}

void ControlSocketServer::serveClient(int fd, uint64_t connection, std::shared_ptr<std::atomic<bool>> done) {
#ifdef __linux__
    std::string buffer;
    char chunk[256];
    bool peer_open = true;
    while (running_.load()) {
        std::string line;
        const auto nl = buffer.find('\n');
        if (nl != std::string::npos) {
            line = buffer.substr(0, nl);
            buffer.erase(0, nl + 1);
        } else if (!peer_open) {
            if (buffer.empty()) {
                break;
            }
            // Last request sent without a newline before the peer shut down.
            line.swap(buffer);
        } else if (buffer.size() > kMaxRequestBytes) {
            if (!writeAll(fd, "ERR request too long\n\n")) {
                std::cerr << "[WARN] control reply not delivered on " << socket_path_ << '\n';
            }
            break;
        } else {
            if (!waitReadable(fd, kPollIntervalMs)) {
                continue;
            }
            const ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                peer_open = false;
            } else {
                buffer.append(chunk, static_cast<std::size_t>(n));
            }
            continue;
        }

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::string reply = handler_ ? handler_(connection, line) : "ERR no handler\n";
        if (reply.empty() || reply.back() != '\n') {
            reply += '\n';
        }
        reply += '\n';
        if (!writeAll(fd, reply)) {
            std::cerr << "[WARN] control reply not delivered on " << socket_path_ << '\n';
            break;
        }
    }
    ::shutdown(fd, SHUT_RDWR);
    if (on_close_) {
        on_close_(connection);
    }
#else
    (void)fd;
    (void)connection;
#endif
    done->store(true);
}

ControlConnection::~ControlConnection() {
    close();
}

bool ControlConnection::connect(const std::string& socket_path, std::string& error) {
    close();
#ifdef __linux__
    sockaddr_un addr{};
    if (!makeAddress(socket_path, addr, error)) {
        return false;
    }
    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        error = std::string("control socket: ") + std::strerror(errno);
        return false;
    }
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = "connect to " + socket_path + " failed: " + std::strerror(errno);
        ::close(fd);
        return false;
    }
    fd_ = fd;
    error.clear();
    return true;
#else
    (void)socket_path;
    error = "control socket requires Linux";
    return false;
#endif
}

bool ControlConnection::request(const std::string& line, std::string& reply, std::string& error, int timeout_ms) {
#ifdef __linux__
    if (fd_ < 0) {
        error = "not connected";
        return false;
    }
    const bool terminated = !line.empty() && line.back() == '\n';
    if (!writeAll(fd_, terminated ? line : line + "\n")) {
        error = "sending request failed";
        close();
        return false;
    }

    char chunk[2048];
    std::size_t end = pending_.find("\n\n");
    while (end == std::string::npos) {
        if (!waitReadable(fd_, timeout_ms)) {
            error = "timed out waiting for reply";
            return false;
        }
        const ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            error = n == 0 ? "arbiter closed the connection" : std::string("recv failed: ") + std::strerror(errno);
            close();
            return false;
        }
        pending_.append(chunk, static_cast<std::size_t>(n));
        end = pending_.find("\n\n");
    }
    reply = pending_.substr(0, end + 1);
    pending_.erase(0, end + 2);
    error.clear();
    return true;
#else
    (void)line;
    (void)reply;
    (void)timeout_ms;
    error = "control socket requires Linux";
    return false;
#endif
}

bool ControlConnection::peerClosed() const {
#ifdef __linux__
    if (fd_ < 0) {
        return true;
    }
    pollfd p{};
    p.fd = fd_;
    p.events = POLLIN;
    if (::poll(&p, 1, 0) <= 0) {
        return false;
    }
    if ((p.revents & (POLLHUP | POLLERR)) != 0) {
        return true;
    }
    char c = 0;
    return ::recv(fd_, &c, 1, MSG_PEEK | MSG_DONTWAIT) == 0;
#else
    return true;
#endif
}

void ControlConnection::close() {
#ifdef __linux__
    if (fd_ >= 0) {
        ::close(fd_);
    }
#endif
    fd_ = -1;
    pending_.clear();
}

bool sendControlRequest(const std::string& socket_path, const std::string& request, std::string& reply,
                        std::string& error, int timeout_ms) {
    ControlConnection connection;
    if (!connection.connect(socket_path, error)) {
        return false;
    }
    return connection.request(request, reply, error, timeout_ms);
}

}  // namespace crane::ipc
