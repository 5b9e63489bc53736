// ============================================================
// server_controller.cpp -- status / start / stop / restart
// ============================================================

#include "server_controller.hpp"
#include "adb_connection.hpp"
#include "../common/logger.hpp"
#include "../common/protocol_io.hpp"
#include <thread>

#include <sys/wait.h>

ServerController::ServerController(ClientConfig cfg) : cfg_(std::move(cfg)) {}

ServerStatus ServerController::status() {
    ServerStatus st;
    std::unique_ptr<AdbConnection> conn;
    try {
        conn = AdbConnection::open(cfg_);
    } catch (const ConnectionError& e) {
        if (e.kind() != ConnectionErrc::REFUSED) throw;
        LOG_DEBUG("server at " + cfg_.endpoint() + " not running: " + e.what());
        return st;
    }

    std::string reply = conn->query("host:version");
    if (reply.size() != 4) {
        throw ProtocolError(ProtocolErrc::UNEXPECTED_COMMAND,
            "malformed host:version reply '" + reply + "'");
    }
    st.state   = ServerState::RUNNING;
    st.version = proto::parse_hex4(reinterpret_cast<const u8*>(reply.data()));
    LOG_DEBUG("server at " + cfg_.endpoint() + " running, version " + std::to_string(st.version));
    return st;
}

bool ServerController::backoff(const BackoffPolicy& policy, int attempt) {
    auto delay = policy.delay_for(attempt);
    if (cfg_.cancel) return cfg_.cancel->wait_for(delay);
    std::this_thread::sleep_for(delay);
    return true;
}

ServerStatus ServerController::start() {
    ServerStatus st = status();
    if (st.running()) {
        LOG_DEBUG("server already running");
        return st;
    }

    auto argv = cfg_.launch.argv(cfg_.port);
    LOG_INFO("starting server: " + argv.front() + " on port " + std::to_string(cfg_.port));
    spawn_detached(argv);

    for (int attempt = 0; attempt < cfg_.start_backoff.attempts; ++attempt) {
        if (!backoff(cfg_.start_backoff, attempt)) cfg_.cancel->throw_if_cancelled();
        try {
            st = status();
        } catch (const ConnectionError& e) {
            // A server that is still binding may accept and drop us
            if (e.kind() == ConnectionErrc::CANCELLED) throw;
            LOG_DEBUG(std::string("server not answering yet: ") + e.what());
            continue;
        }
        if (st.running()) return st;
    }
    throw ServerError(ServerErrc::START_TIMEOUT,
        "server did not come up on " + cfg_.endpoint() + " after " +
        std::to_string(cfg_.start_backoff.attempts) + " attempts");
}

void ServerController::stop() {
    std::unique_ptr<AdbConnection> conn;
    try {
        conn = AdbConnection::open(cfg_);
    } catch (const ConnectionError& e) {
        if (e.kind() != ConnectionErrc::REFUSED) throw;
        LOG_DEBUG("server already stopped");
        return;
    }

    conn->request("host:kill");
    // The server closes the connection as it exits
    try {
        conn->read_to_end();
    } catch (const ConnectionError& e) {
        if (e.kind() == ConnectionErrc::CANCELLED) throw;
        LOG_DEBUG(std::string("connection ended during kill: ") + e.what());
    }
    conn.reset();

    for (int attempt = 0; attempt < cfg_.stop_backoff.attempts; ++attempt) {
        // A server part way through exiting may accept and then drop us
        bool running = true;
        try {
            running = status().running();
        } catch (const ConnectionError& e) {
            if (e.kind() == ConnectionErrc::CANCELLED) throw;
            LOG_DEBUG(std::string("server still shutting down: ") + e.what());
        }
        if (!running) {
            LOG_INFO("server on " + cfg_.endpoint() + " stopped");
            return;
        }
        if (!backoff(cfg_.stop_backoff, attempt)) cfg_.cancel->throw_if_cancelled();
    }
    throw ServerError(ServerErrc::STOP_FAILED,
        "server on " + cfg_.endpoint() + " still answering after kill");
}

ServerStatus ServerController::restart() {
    stop();
    return start();
}

void ServerController::spawn_detached(const std::vector<std::string>& argv) {
    if (argv.empty() || argv.front().empty()) {
        throw ServerError(ServerErrc::SPAWN_FAILED, "empty server launch command");
    }

    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        throw ServerError(ServerErrc::SPAWN_FAILED,
            std::string("pipe failed: ") + std::strerror(errno));
    }

    // Build argv before forking; the child must not allocate
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        throw ServerError(ServerErrc::SPAWN_FAILED, std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Intermediate child: new session, fork again so the server is
        // reparented to init and never becomes our zombie.
        ::close(err_pipe[0]);
        ::setsid();
        pid_t grandchild = ::fork();
        if (grandchild < 0) {
            int err = errno;
            ssize_t w = ::write(err_pipe[1], &err, sizeof(err));
            (void)w;
            ::_exit(1);
        }
        if (grandchild > 0) ::_exit(0);

        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) ::close(devnull);
        }
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(args[0], args.data());
        int err = errno;
        ssize_t w = ::write(err_pipe[1], &err, sizeof(err));
        (void)w;
        ::_exit(127);
    }

    ::close(err_pipe[1]);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    int child_err = 0;
    ssize_t n;
    do {
        n = ::read(err_pipe[0], &child_err, sizeof(child_err));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    if (n == (ssize_t)sizeof(child_err)) {
        throw ServerError(ServerErrc::SPAWN_FAILED,
            "cannot run " + argv.front() + ": " + std::strerror(child_err));
    }
    LOG_DEBUG("spawned " + argv.front());
}
