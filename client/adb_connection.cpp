// ============================================================
// adb_connection.cpp -- Host request framing over one socket
// ============================================================

#include "adb_connection.hpp"
#include "../common/logger.hpp"
#include "../common/protocol_io.hpp"
#include "../common/utils.hpp"
#include <stdexcept>

std::unique_ptr<AdbConnection> AdbConnection::open(const ClientConfig& cfg) {
    return open(cfg, cfg.host, cfg.port);
}

std::unique_ptr<AdbConnection> AdbConnection::open(const ClientConfig& cfg,
                                                   const std::string& host, u16 port) {
    if (cfg.cancel) cfg.cancel->throw_if_cancelled();
    TcpSocket sock;
    sock.connect(host, port, cfg.connect_timeout_ms);
    LOG_DEBUG("connected to " + host + ":" + std::to_string(port));
    return std::make_unique<AdbConnection>(std::move(sock), cfg.cancel, cfg.io_timeout_ms);
}

AdbConnection::AdbConnection(TcpSocket sock, std::shared_ptr<CancelToken> cancel,
                             int io_timeout_ms)
    : sock_(std::move(sock))
    , cancel_(std::move(cancel))
    , registration_(cancel_.get(), sock_.native())
{
    set_io_timeout_ms(io_timeout_ms);
}

AdbConnection::~AdbConnection() {
    registration_.reset();
}

void AdbConnection::set_io_timeout_ms(int ms) {
    sock_.set_recv_timeout_ms(ms);
    sock_.set_send_timeout_ms(ms);
}

ConnectionError AdbConnection::translate(const ConnectionError& e) const {
    if (cancelled()) {
        return ConnectionError(ConnectionErrc::CANCELLED, "operation cancelled");
    }
    return e;
}

void AdbConnection::throw_if_cancelled() const {
    if (cancelled()) {
        throw ConnectionError(ConnectionErrc::CANCELLED, "operation cancelled");
    }
}

// ---- Raw stream access ----

void AdbConnection::write(const void* data, size_t len) {
    throw_if_cancelled();
    std::lock_guard<std::mutex> lk(write_mutex_);
    try {
        sock_.send_all(data, len);
    } catch (const ConnectionError& e) {
        throw translate(e);
    }
}

bool AdbConnection::read_exact(void* buf, size_t len) {
    throw_if_cancelled();
    bool ok;
    try {
        ok = sock_.recv_all(buf, len);
    } catch (const ConnectionError& e) {
        throw translate(e);
    }
    if (!ok) throw_if_cancelled();
    return ok;
}

size_t AdbConnection::read_some(void* buf, size_t len) {
    throw_if_cancelled();
    size_t n;
    try {
        n = sock_.recv_some(buf, len);
    } catch (const ConnectionError& e) {
        throw translate(e);
    }
    if (n == 0) throw_if_cancelled();
    return n;
}

void AdbConnection::write_frame(const proto::AdbFrame& frame) {
    throw_if_cancelled();
    std::lock_guard<std::mutex> lk(write_mutex_);
    try {
        sock_.write_frame(frame);
    } catch (const ConnectionError& e) {
        throw translate(e);
    }
}

bool AdbConnection::read_frame(proto::AdbFrame& frame) {
    throw_if_cancelled();
    bool ok;
    try {
        ok = sock_.read_frame(frame);
    } catch (const ConnectionError& e) {
        throw translate(e);
    }
    if (!ok) throw_if_cancelled();
    return ok;
}

void AdbConnection::shutdown_write() {
    sock_.shutdown_write();
}

// ---- Host request framing ----

void AdbConnection::send_request(const std::string& service) {
    if (status_pending_) {
        throw std::logic_error("host request '" + service +
                               "' sent while '" + pending_service_ + "' awaits its status");
    }
    LOG_DEBUG("request: " + service);
    const std::string request = proto::encode_host_request(service);
    write(request.data(), request.size());
    status_pending_ = true;
    pending_service_ = service;
}

void AdbConnection::expect_okay() {
    u8 status[4];
    if (!read_exact(status, sizeof(status))) {
        throw ConnectionError(ConnectionErrc::BROKEN,
            "server closed connection before answering '" + pending_service_ + "'");
    }
    status_pending_ = false;

    if (std::memcmp(status, "OKAY", 4) == 0) return;
    if (std::memcmp(status, "FAIL", 4) == 0) {
        std::string msg = read_length_prefixed();
        LOG_DEBUG("request '" + pending_service_ + "' failed: " + msg);
        throw ProtocolError(ProtocolErrc::REQUEST_FAILED, msg);
    }
    throw ProtocolError(ProtocolErrc::UNEXPECTED_COMMAND,
        "expected OKAY or FAIL, got '" +
        std::string(reinterpret_cast<const char*>(status), 4) + "'");
}

std::string AdbConnection::read_length_prefixed() {
    u8 len_buf[4];
    if (!read_exact(len_buf, sizeof(len_buf))) {
        throw ConnectionError(ConnectionErrc::BROKEN, "connection closed before reply length");
    }
    u32 len = proto::parse_hex4(len_buf);
    std::string out(len, '\0');
    if (len > 0 && !read_exact(&out[0], len)) {
        throw ConnectionError(ConnectionErrc::BROKEN, "connection closed inside reply");
    }
    return out;
}

std::string AdbConnection::read_to_end() {
    std::string out;
    char buf[4096];
    for (;;) {
        size_t n = read_some(buf, sizeof(buf));
        if (n == 0) break;
        out.append(buf, n);
    }
    return out;
}

void AdbConnection::request(const std::string& service) {
    send_request(service);
    expect_okay();
}

std::string AdbConnection::query(const std::string& service) {
    request(service);
    return read_length_prefixed();
}

void AdbConnection::select_transport(const std::string& serial) {
    try {
        request("host:transport:" + serial);
    } catch (const ProtocolError& e) {
        if (e.kind() != ProtocolErrc::REQUEST_FAILED) throw;
        std::string msg = utils::to_lower(e.what());
        if (msg.find("unauthorized") != std::string::npos) {
            throw DeviceError(DeviceErrc::UNAUTHORIZED, "device '" + serial + "' is unauthorized");
        }
        if (msg.find("offline") != std::string::npos) {
            throw DeviceError(DeviceErrc::OFFLINE, "device '" + serial + "' is offline");
        }
        if (msg.find("not found") != std::string::npos) {
            throw DeviceError(DeviceErrc::NOT_FOUND, "device '" + serial + "' not found");
        }
        throw;
    }
    serial_ = serial;
}
