#pragma once

// ============================================================
// platform.hpp -- POSIX socket/OS abstraction
// ============================================================

#include <string>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <stdexcept>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <netdb.h>
#include <csignal>

using socket_t = int;
#define INVALID_SOCKET_VAL (-1)
#define SOCKET_ERROR_VAL   (-1)
#define CLOSE_SOCKET(s)    ::close(s)

inline int last_socket_error() { return errno; }
inline bool would_block(int err) { return err == EAGAIN || err == EWOULDBLOCK; }
inline std::string socket_error_str(int err) {
    return std::string(strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

// ---- Process init ----

namespace platform {

// Writing to a socket the build service already closed must surface as
// EPIPE from send(), not kill the control process.
inline void init() {
    std::signal(SIGPIPE, SIG_IGN);
}

struct Guard {
    Guard() { init(); }
};

} // namespace platform

// ---- Portable types ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i8  = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;
