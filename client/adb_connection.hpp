#pragma once

// ============================================================
// adb_connection.hpp -- One transport connection to the host
//   server (or directly to a device daemon)
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include "../common/cancel.hpp"
#include "client_config.hpp"
#include <memory>
#include <mutex>
#include <string>

// Exactly one host request may be outstanding at a time: send_request()
// must be answered by expect_okay() before the next one.
class AdbConnection {
public:
    // Connects to cfg.host:cfg.port; throws ConnectionError REFUSED/TIMEOUT
    static std::unique_ptr<AdbConnection> open(const ClientConfig& cfg);

    // Connects to an arbitrary endpoint (device daemons)
    static std::unique_ptr<AdbConnection> open(const ClientConfig& cfg,
                                               const std::string& host, u16 port);

    AdbConnection(TcpSocket sock, std::shared_ptr<CancelToken> cancel, int io_timeout_ms);
    ~AdbConnection();

    AdbConnection(const AdbConnection&) = delete;
    AdbConnection& operator=(const AdbConnection&) = delete;

    // ---- Host request framing ----
    void send_request(const std::string& service);

    // Consumes OKAY, or FAIL + message -> ProtocolError REQUEST_FAILED
    void expect_okay();

    // Reads a 4-hex-digit length and that many bytes
    std::string read_length_prefixed();

    // Everything until the peer closes
    std::string read_to_end();

    // send_request + expect_okay
    void request(const std::string& service);

    // request + read_length_prefixed
    std::string query(const std::string& service);

    // host:transport:<serial>; FAIL replies map to DeviceError
    void select_transport(const std::string& serial);

    // ---- Raw stream access ----
    void write(const void* data, size_t len);
    void write(const std::vector<u8>& v) { write(v.data(), v.size()); }

    // Returns false on clean close before the first byte
    bool read_exact(void* buf, size_t len);

    // 0 on clean close
    size_t read_some(void* buf, size_t len);

    void write_frame(const proto::AdbFrame& frame);
    bool read_frame(proto::AdbFrame& frame);

    void shutdown_write();

    void set_io_timeout_ms(int ms);

    bool cancelled() const { return cancel_ && cancel_->cancelled(); }

    const std::string& transport_serial() const { return serial_; }

private:
    // Socket errors become CANCELLED once the token fired
    ConnectionError translate(const ConnectionError& e) const;
    // Checked before every read/write and when the peer closes
    void throw_if_cancelled() const;

    TcpSocket                    sock_;
    std::shared_ptr<CancelToken> cancel_;
    CancelToken::Registration    registration_;
    std::mutex                   write_mutex_;
    bool                         status_pending_{false};
    std::string                  pending_service_;
    std::string                  serial_;
};
