#pragma once

// ============================================================
// server_controller.hpp -- Background server lifecycle
// ============================================================

#include "client_config.hpp"
#include <string>
#include <vector>

enum class ServerState {
    RUNNING,
    STOPPED,
};

struct ServerStatus {
    ServerState state{ServerState::STOPPED};
    u32         version{0};     // host:version reply, RUNNING only

    bool running() const { return state == ServerState::RUNNING; }
};

class ServerController {
public:
    explicit ServerController(ClientConfig cfg);

    // host:version over a fresh connection. Refused -> STOPPED; every other
    // failure propagates.
    ServerStatus status();

    // Spawns the launch command detached unless already running, then polls
    // with start_backoff. Throws ServerError START_TIMEOUT / SPAWN_FAILED.
    ServerStatus start();

    // host:kill, wait for close, poll with stop_backoff. Stopped already is
    // fine; throws ServerError STOP_FAILED.
    void stop();

    ServerStatus restart();

    // Double fork + setsid, stdio on /dev/null. Exec failure in the
    // grandchild is reported back through a close-on-exec pipe.
    static void spawn_detached(const std::vector<std::string>& argv);

private:
    // Sleeps for the attempt's backoff; false if cancelled
    bool backoff(const BackoffPolicy& policy, int attempt);

    ClientConfig cfg_;
};
