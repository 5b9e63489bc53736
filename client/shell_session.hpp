#pragma once

// ============================================================
// shell_session.hpp -- Remote command execution stream
// ============================================================

#include "adb_connection.hpp"
#include "device.hpp"
#include <functional>
#include <memory>
#include <set>
#include <string>

enum class ShellStream {
    STDOUT,
    STDERR,
};

struct ShellChunk {
    ShellStream stream{ShellStream::STDOUT};
    std::string data;
};

struct ShellResult {
    // Base protocol sessions cannot report a status; they count as
    // success with exit_status_known == false.
    bool exit_status_known{false};
    int  exit_code{0};

    bool success() const { return exit_code == 0; }

    // Throws ShellError EXIT_STATUS_UNAVAILABLE when the status is unknown
    int require_exit_code() const;
};

class ShellSession {
public:
    // Empty command opens an interactive session with a pty. Throws
    // DeviceError unless the device is ready.
    static std::unique_ptr<ShellSession> open(const ClientConfig& cfg, const Device& device,
                                              const std::set<std::string>& features,
                                              const std::string& command);

    ShellSession(std::unique_ptr<AdbConnection> conn, bool v2);

    ShellSession(const ShellSession&) = delete;
    ShellSession& operator=(const ShellSession&) = delete;

    bool uses_v2() const { return v2_; }

    // Next chunk of output, in arrival order; false once the session ended
    bool read_chunk(ShellChunk& out);

    // Interactive input
    void write_input(const void* data, size_t len);
    void write_input(const std::string& s) { write_input(s.data(), s.size()); }
    void close_input();

    // Shell v2 only; ignored on the base protocol
    void resize(int rows, int cols);

    // Relays every chunk to on_chunk until the remote closes
    ShellResult wait(const std::function<void(const ShellChunk&)>& on_chunk);

    ShellResult result() const { return result_; }

    // Service string for the request, e.g. "shell,v2,raw:ls"
    static std::string service_for(const std::string& command, bool v2);

private:
    bool read_chunk_v1(ShellChunk& out);
    bool read_chunk_v2(ShellChunk& out);
    void write_packet(ShellPacketId id, const void* data, size_t len);

    std::unique_ptr<AdbConnection> conn_;
    bool        v2_;
    bool        ended_{false};
    ShellResult result_;
};

// One-shot helper: run command, relay output, return the status
ShellResult run_shell_command(const ClientConfig& cfg, const Device& device,
                              const std::set<std::string>& features,
                              const std::string& command,
                              const std::function<void(const ShellChunk&)>& on_chunk);
