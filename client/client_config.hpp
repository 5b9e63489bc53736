#pragma once

// ============================================================
// client_config.hpp -- Connection and lifecycle settings
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/cancel.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

// Retry applied when the server reports an empty device list, which
// happens briefly right after it starts.
struct EnumerationRetryPolicy {
    int attempts{1};                          // extra queries after the first
    std::chrono::milliseconds delay{500};
};

// Exponential backoff: initial, doubling, capped, bounded attempt count
struct BackoffPolicy {
    std::chrono::milliseconds initial{100};
    std::chrono::milliseconds max{2000};
    int attempts{12};

    std::chrono::milliseconds delay_for(int attempt) const;
};

// How to spawn the background server. "{port}" in args is replaced with
// the configured port.
struct ServerLaunchConfig {
    std::string program{"adb"};
    std::vector<std::string> args{"-L", "tcp:localhost:{port}", "fork-server", "server"};

    std::vector<std::string> argv(u16 port) const;
};

struct ClientConfig {
    std::string host{"127.0.0.1"};
    u16         port{FASTADB_DEFAULT_PORT};
    int         connect_timeout_ms{2000};
    int         io_timeout_ms{10000};     // 0 = unbounded

    EnumerationRetryPolicy enumeration_retry;
    ServerLaunchConfig     launch;
    BackoffPolicy          start_backoff;
    BackoffPolicy          stop_backoff{std::chrono::milliseconds(50),
                                        std::chrono::milliseconds(500), 20};

    // Shared by every connection opened with this config; may be null
    std::shared_ptr<CancelToken> cancel;

    // Defaults overridden by ANDROID_ADB_SERVER_ADDRESS,
    // ANDROID_ADB_SERVER_PORT and ADB_PATH
    static ClientConfig from_env();

    std::string endpoint() const { return host + ":" + std::to_string(port); }
};
