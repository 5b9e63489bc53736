// ============================================================
// shell_session.cpp -- Shell base protocol and shell protocol v2
// ============================================================

#include "shell_session.hpp"
#include "device_selector.hpp"
#include "../common/logger.hpp"
#include "../common/protocol_io.hpp"

// Largest v2 packet accepted from the device
static constexpr u32 MAX_SHELL_PACKET = 1024 * 1024;
static constexpr size_t SHELL_READ_CHUNK = 16 * 1024;

int ShellResult::require_exit_code() const {
    if (!exit_status_known) {
        throw ShellError(ShellErrc::EXIT_STATUS_UNAVAILABLE,
            "exit status unavailable: the device does not support shell protocol v2");
    }
    return exit_code;
}

std::string ShellSession::service_for(const std::string& command, bool v2) {
    if (v2) {
        return command.empty() ? "shell,v2,pty:" : "shell,v2,raw:" + command;
    }
    return "shell:" + command;
}

std::unique_ptr<ShellSession> ShellSession::open(const ClientConfig& cfg, const Device& device,
                                                 const std::set<std::string>& features,
                                                 const std::string& command) {
    DeviceSelector::require_usable(device);
    bool v2 = features.count(FEATURE_SHELL_V2) > 0;

    auto conn = AdbConnection::open(cfg);
    conn->select_transport(device.serial);
    conn->request(service_for(command, v2));
    // Commands may run quiet for a long time
    conn->set_io_timeout_ms(0);
    LOG_DEBUG("shell on " + device.serial + (v2 ? " (v2): " : ": ") + command);
    return std::make_unique<ShellSession>(std::move(conn), v2);
}

ShellSession::ShellSession(std::unique_ptr<AdbConnection> conn, bool v2)
    : conn_(std::move(conn)), v2_(v2) {}

bool ShellSession::read_chunk(ShellChunk& out) {
    if (ended_) return false;
    try {
        return v2_ ? read_chunk_v2(out) : read_chunk_v1(out);
    } catch (const ConnectionError& e) {
        if (e.kind() == ConnectionErrc::CANCELLED) throw;
        throw ShellError(ShellErrc::STREAM_BROKEN, std::string("shell stream broken: ") + e.what());
    }
}

bool ShellSession::read_chunk_v1(ShellChunk& out) {
    char buf[SHELL_READ_CHUNK];
    size_t n = conn_->read_some(buf, sizeof(buf));
    if (n == 0) {
        ended_ = true;
        result_.exit_status_known = false;
        result_.exit_code = 0;
        return false;
    }
    out.stream = ShellStream::STDOUT;
    out.data.assign(buf, n);
    return true;
}

bool ShellSession::read_chunk_v2(ShellChunk& out) {
    for (;;) {
        u8 hdr_buf[sizeof(ShellPacketHdr)];
        if (!conn_->read_exact(hdr_buf, sizeof(hdr_buf))) {
            ended_ = true;
            throw ShellError(ShellErrc::STREAM_BROKEN,
                "shell stream closed before the exit status arrived");
        }
        u8  id  = hdr_buf[0];
        u32 len = proto::get_u32(hdr_buf + 1);
        if (len > MAX_SHELL_PACKET) {
            throw ProtocolError(ProtocolErrc::PAYLOAD_TOO_LARGE,
                "shell packet too large: " + std::to_string(len));
        }
        std::string payload(len, '\0');
        if (len > 0 && !conn_->read_exact(&payload[0], len)) {
            throw ShellError(ShellErrc::STREAM_BROKEN, "shell stream closed inside a packet");
        }

        switch (static_cast<ShellPacketId>(id)) {
            case ShellPacketId::STDOUT:
            case ShellPacketId::STDERR:
                out.stream = static_cast<ShellPacketId>(id) == ShellPacketId::STDOUT
                    ? ShellStream::STDOUT : ShellStream::STDERR;
                out.data = std::move(payload);
                return true;
            case ShellPacketId::EXIT:
                if (payload.empty()) {
                    throw ShellError(ShellErrc::STREAM_BROKEN, "empty exit packet");
                }
                result_.exit_status_known = true;
                result_.exit_code = (u8)payload[0];
                ended_ = true;
                LOG_DEBUG("shell exit status " + std::to_string(result_.exit_code));
                return false;
            default:
                LOG_DEBUG("ignoring shell packet id " + std::to_string(id));
                break;
        }
    }
}

void ShellSession::write_packet(ShellPacketId id, const void* data, size_t len) {
    std::vector<u8> pkt(sizeof(ShellPacketHdr) + len);
    pkt[0] = static_cast<u8>(id);
    proto::put_u32(pkt.data() + 1, (u32)len);
    if (len > 0) std::memcpy(pkt.data() + sizeof(ShellPacketHdr), data, len);
    conn_->write(pkt);
}

void ShellSession::write_input(const void* data, size_t len) {
    if (len == 0) return;
    if (v2_) {
        write_packet(ShellPacketId::STDIN, data, len);
    } else {
        conn_->write(data, len);
    }
}

void ShellSession::close_input() {
    if (v2_) {
        write_packet(ShellPacketId::CLOSE_STDIN, nullptr, 0);
    } else {
        conn_->shutdown_write();
    }
}

void ShellSession::resize(int rows, int cols) {
    if (!v2_) return;
    std::string ws = std::to_string(rows) + "x" + std::to_string(cols) + ",0x0";
    write_packet(ShellPacketId::WINDOW_SIZE, ws.data(), ws.size());
}

ShellResult ShellSession::wait(const std::function<void(const ShellChunk&)>& on_chunk) {
    ShellChunk chunk;
    while (read_chunk(chunk)) {
        if (on_chunk) on_chunk(chunk);
    }
    return result_;
}

ShellResult run_shell_command(const ClientConfig& cfg, const Device& device,
                              const std::set<std::string>& features,
                              const std::string& command,
                              const std::function<void(const ShellChunk&)>& on_chunk) {
    auto session = ShellSession::open(cfg, device, features, command);
    return session->wait(on_chunk);
}
