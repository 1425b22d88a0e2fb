#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace crane::fieldbus {

// Blocking-with-deadline helpers for stream sockets.
bool sendAll(int fd, const uint8_t* data, std::size_t size, int timeout_ms, std::string& error);
bool recvExact(int fd, uint8_t* data, std::size_t size, int timeout_ms, std::string& error);

// Reads one MBAP-framed ADU. A clean close before the first byte reports
// "peer closed".
bool recvAdu(int fd, int timeout_ms, std::vector<uint8_t>& out, std::string& error);

// Waits until fd is readable. Returns false on timeout or error.
bool waitReadable(int fd, int timeout_ms);

}  // namespace crane::fieldbus
