#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "platform.hpp"
#include "protocol_io.hpp"
#include <string>
#include <vector>

class TcpSocket {
public:
    TcpSocket() = default;
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: resolve host and connect within timeout_ms (0 = OS default).
    // Throws ConnectionError REFUSED or TIMEOUT.
    void connect(const std::string& host, u16 port, int timeout_ms);

    // Server: bind + listen; port 0 picks an ephemeral port
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 128);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Send exactly 'len' bytes; throws ConnectionError on error
    void send_all(const void* buf, size_t len);
    void send_all(const std::string& s) { send_all(s.data(), s.size()); }
    void send_all(const std::vector<u8>& v) { send_all(v.data(), v.size()); }

    // Receive exactly 'len' bytes. Returns false on clean close before the
    // first byte; a close part way through throws ConnectionError BROKEN.
    bool recv_all(void* buf, size_t len);

    // Receive whatever is available (at least 1 byte); 0 on clean close
    size_t recv_some(void* buf, size_t len);

    // Send a complete daemon frame (header + payload)
    void write_frame(const proto::AdbFrame& frame);

    // Read the next daemon frame, validating magic, length and checksum.
    // Returns false on clean close before the header.
    bool read_frame(proto::AdbFrame& frame);

    // Apply TCP tuning
    void tune();

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    // Half-close our sending side
    void shutdown_write();

    void close();

    std::string peer_addr() const;
    u16 local_port() const;

    // Receive / send timeouts in milliseconds (0 = infinite)
    void set_recv_timeout_ms(int ms);
    void set_send_timeout_ms(int ms);

private:
    socket_t fd_{INVALID_SOCKET_VAL};

    void apply_socket_opts();
};
