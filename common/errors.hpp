#pragma once

// ============================================================
// errors.hpp -- Typed error taxonomy for fastadb
// ============================================================

#include <stdexcept>
#include <string>
#include <vector>

// Root of every error the core throws. Callers that only need a message
// can catch std::runtime_error.
class FastAdbError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ---- Transport ----

enum class ConnectionErrc {
    REFUSED,
    TIMEOUT,
    BROKEN,
    CANCELLED,
};

class ConnectionError : public FastAdbError {
public:
    ConnectionError(ConnectionErrc kind, const std::string& msg)
        : FastAdbError(msg), kind_(kind) {}
    ConnectionErrc kind() const { return kind_; }
private:
    ConnectionErrc kind_;
};

// ---- Wire format ----

enum class ProtocolErrc {
    BAD_MAGIC,
    CHECKSUM_MISMATCH,
    TRUNCATED,
    PAYLOAD_TOO_LARGE,
    UNEXPECTED_COMMAND,
    REQUEST_FAILED,     // server answered FAIL to a host request
};

class ProtocolError : public FastAdbError {
public:
    ProtocolError(ProtocolErrc kind, const std::string& msg)
        : FastAdbError(msg), kind_(kind) {}
    ProtocolErrc kind() const { return kind_; }
private:
    ProtocolErrc kind_;
};

// ---- Device selection ----

enum class DeviceErrc {
    NOT_FOUND,
    AMBIGUOUS,
    UNAUTHORIZED,
    OFFLINE,
    NO_DEVICES,
};

class DeviceError : public FastAdbError {
public:
    DeviceError(DeviceErrc kind, const std::string& msg,
                std::vector<std::string> candidates = {})
        : FastAdbError(msg), kind_(kind), candidates_(std::move(candidates)) {}
    DeviceErrc kind() const { return kind_; }
    // Serials of every matching device for AMBIGUOUS
    const std::vector<std::string>& candidates() const { return candidates_; }
private:
    DeviceErrc kind_;
    std::vector<std::string> candidates_;
};

// ---- File transfer ----

enum class TransferErrc {
    REMOTE_PATH_MISSING,
    LOCAL_PATH_MISSING,
    PERMISSION_DENIED,
    PARTIAL_WRITE,
    STAT_MISMATCH,
    REMOTE_FAILURE,
    LOCAL_IO,
    NOT_A_FILE,
};

class TransferError : public FastAdbError {
public:
    TransferError(TransferErrc kind, const std::string& msg)
        : FastAdbError(msg), kind_(kind) {}
    TransferErrc kind() const { return kind_; }
private:
    TransferErrc kind_;
};

// ---- Shell ----

enum class ShellErrc {
    STREAM_BROKEN,
    EXIT_STATUS_UNAVAILABLE,
};

class ShellError : public FastAdbError {
public:
    ShellError(ShellErrc kind, const std::string& msg)
        : FastAdbError(msg), kind_(kind) {}
    ShellErrc kind() const { return kind_; }
private:
    ShellErrc kind_;
};

// ---- Server lifecycle ----

enum class ServerErrc {
    START_TIMEOUT,
    STOP_FAILED,
    SPAWN_FAILED,
};

class ServerError : public FastAdbError {
public:
    ServerError(ServerErrc kind, const std::string& msg)
        : FastAdbError(msg), kind_(kind) {}
    ServerErrc kind() const { return kind_; }
private:
    ServerErrc kind_;
};

inline bool is_cancelled(const std::exception& e) {
    auto* ce = dynamic_cast<const ConnectionError*>(&e);
    return ce && ce->kind() == ConnectionErrc::CANCELLED;
}
