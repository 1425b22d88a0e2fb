#include "fieldbus/socket_io.hpp"

#include <cerrno>
#include <cstring>

#include "core/time_utils.hpp"
#include "fieldbus/modbus_protocol.hpp"

#ifdef __linux__
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace crane::fieldbus {

namespace {

#ifdef __linux__
int remainingMs(int64_t deadline_ns) {
    const int64_t left = deadline_ns - nowSteadyNs();
    return left <= 0 ? 0 : static_cast<int>(left / 1000000LL) + 1;
}

bool waitFor(int fd, short events, int timeout_ms) {
    pollfd p{};
    p.fd = fd;
    p.events = events;
    while (true) {
        const int rc = ::poll(&p, 1, timeout_ms);
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        return rc > 0 && (p.revents & (events | POLLHUP | POLLERR)) != 0;
    }
}
#endif

}  // namespace

bool waitReadable(int fd, int timeout_ms) {
#ifdef __linux__
    return waitFor(fd, POLLIN, timeout_ms);
#else
    (void)fd;
    (void)timeout_ms;
    return false;
#endif
}

bool sendAll(int fd, const uint8_t* data, std::size_t size, int timeout_ms, std::string& error) {
#ifdef __linux__
    const int64_t deadline = nowSteadyNs() + static_cast<int64_t>(timeout_ms) * 1000000LL;
    std::size_t sent = 0;
    while (sent < size) {
        if (!waitFor(fd, POLLOUT, remainingMs(deadline))) {
            error = "send timed out";
            return false;
        }
        const ssize_t n = ::send(fd, data + sent, size - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            error = std::string("send failed: ") + std::strerror(errno);
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
#else
    (void)fd;
    (void)data;
    (void)size;
    (void)timeout_ms;
    error = "sockets require Linux";
    return false;
#endif
}

bool recvExact(int fd, uint8_t* data, std::size_t size, int timeout_ms, std::string& error) {
#ifdef __linux__
    const int64_t deadline = nowSteadyNs() + static_cast<int64_t>(timeout_ms) * 1000000LL;
    std::size_t got = 0;
    while (got < size) {
        if (!waitFor(fd, POLLIN, remainingMs(deadline))) {
            error = "receive timed out";
            return false;
        }
        const ssize_t n = ::recv(fd, data + got, size - got, 0);
        if (n == 0) {
            error = got == 0 ? "peer closed" : "peer closed mid-frame";
            return false;
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            error = std::string("recv failed: ") + std::strerror(errno);
            return false;
        }
        got += static_cast<std::size_t>(n);
    }
    return true;
#else
    (void)fd;
    (void)data;
    (void)size;
    (void)timeout_ms;
    error = "sockets require Linux";
    return false;
#endif
}

bool recvAdu(int fd, int timeout_ms, std::vector<uint8_t>& out, std::string& error) {
    out.assign(kMbapHeaderSize, 0U);
    if (!recvExact(fd, out.data(), kMbapHeaderSize, timeout_ms, error)) {
        return false;
    }
    MbapHeader header;
    if (!parseMbapHeader(out.data(), out.size(), header, error)) {
        return false;
    }
    const std::size_t rest = header.length - 1U;
    out.resize(kMbapHeaderSize + rest);
    return recvExact(fd, out.data() + kMbapHeaderSize, rest, timeout_ms, error);
}

}  // namespace crane::fieldbus
