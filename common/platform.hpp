#pragma once

// ============================================================
// platform.hpp -- POSIX socket/OS abstraction
// ============================================================

#include <string>
#include <cstdint>
#include <cstddef>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <cstring>
#include <netdb.h>
#include <signal.h>

using socket_t = int;
#define INVALID_SOCKET_VAL (-1)
#define SOCKET_ERROR_VAL   (-1)
#define CLOSE_SOCKET(s)    ::close(s)

inline int last_socket_error() { return errno; }
inline bool would_block(int err) { return err == EAGAIN || err == EWOULDBLOCK; }
inline std::string socket_error_str(int err) {
    return std::string(strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

namespace platform {

// Writes to a peer that already closed must surface as EPIPE, not kill us.
inline void ignore_sigpipe() {
    ::signal(SIGPIPE, SIG_IGN);
}

// RAII guard for process-wide socket setup
struct Guard {
    Guard()  { ignore_sigpipe(); }
    ~Guard() = default;
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
