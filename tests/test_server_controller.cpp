// ============================================================
// test_server_controller.cpp -- status / start / stop against
//   in-process and spawned mock servers
// ============================================================

#include "test_support.hpp"
#include "../client/server_controller.hpp"
#include "../common/logger.hpp"
#include "../common/protocol_io.hpp"
#include "../common/socket.hpp"
#include <atomic>
#include <mutex>
#include <thread>

namespace {

u16 free_port() {
    TcpSocket s;
    s.bind_and_listen("127.0.0.1", 0);
    u16 port = s.local_port();
    s.close();
    return port;
}

ClientConfig quick_config(u16 port) {
    ClientConfig cfg;
    cfg.port               = port;
    cfg.connect_timeout_ms = 1000;
    cfg.io_timeout_ms      = 3000;
    cfg.start_backoff      = BackoffPolicy{std::chrono::milliseconds(50),
                                           std::chrono::milliseconds(400), 25};
    cfg.stop_backoff       = BackoffPolicy{std::chrono::milliseconds(20),
                                           std::chrono::milliseconds(200), 25};
    return cfg;
}

std::string read_service(TcpSocket& s) {
    u8 len[4];
    if (!s.recv_all(len, 4)) return std::string();
    std::string svc(proto::parse_hex4(len), '\0');
    if (!svc.empty()) s.recv_all(&svc[0], svc.size());
    return svc;
}

// Exits the way a real server can: acknowledges host:kill, accepts one more
// connection and drops it without a reply, then stops listening.
class DyingServer {
public:
    DyingServer() {
        listen_.bind_and_listen("127.0.0.1", 0);
        port_ = listen_.local_port();
        thread_ = std::thread([this] { run(); });
    }
    ~DyingServer() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (!closed_) ::shutdown(listen_.native(), SHUT_RDWR);
        }
        if (thread_.joinable()) thread_.join();
    }

    u16 port() const { return port_; }
    int connections() const { return served_.load(); }

private:
    void run() {
        try {
            for (int i = 0; i < 2; ++i) {
                TcpSocket s = listen_.accept();
                ++served_;
                std::string svc = read_service(s);
                if (i == 0 && svc == "host:kill") s.send_all("OKAY", 4);
            }
        } catch (const FastAdbError& e) {
            LOG_DEBUG(std::string("dying server: ") + e.what());
        }
        std::lock_guard<std::mutex> lk(mutex_);
        listen_.close();
        closed_ = true;
    }

    TcpSocket        listen_;
    u16              port_{0};
    std::atomic<int> served_{0};
    std::mutex       mutex_;
    bool             closed_{false};
    std::thread      thread_;
};

} // namespace

TEST(ServerController, StoppedWhenNothingListens) {
    ServerController ctl(quick_config(free_port()));
    ServerStatus st;
    ASSERT_NO_THROW(st = ctl.status());
    EXPECT_FALSE(st.running());
    EXPECT_EQ(st.state, ServerState::STOPPED);
}

TEST(ServerController, StopWhenAlreadyStoppedIsFine) {
    ServerController ctl(quick_config(free_port()));
    EXPECT_NO_THROW(ctl.stop());
}

TEST(ServerController, LaunchArgvSubstitutesPort) {
    ServerLaunchConfig launch;
    launch.program = "/opt/adb";
    launch.args    = {"-P", "{port}", "--listen=tcp:{port}"};
    EXPECT_EQ(launch.argv(5038),
              (std::vector<std::string>{"/opt/adb", "-P", "5038", "--listen=tcp:5038"}));
}

TEST(ServerController, BackoffDoublesUpToCap) {
    BackoffPolicy p{std::chrono::milliseconds(100), std::chrono::milliseconds(500), 10};
    EXPECT_EQ(p.delay_for(0).count(), 100);
    EXPECT_EQ(p.delay_for(1).count(), 200);
    EXPECT_EQ(p.delay_for(2).count(), 400);
    EXPECT_EQ(p.delay_for(3).count(), 500);
    EXPECT_EQ(p.delay_for(9).count(), 500);
}

TEST(ServerController, SpawnFailureIsReported) {
    try {
        ServerController::spawn_detached({"/nonexistent/fastadb-server-binary", "--port", "1"});
        FAIL() << "expected ServerError";
    } catch (const ServerError& e) {
        EXPECT_EQ(e.kind(), ServerErrc::SPAWN_FAILED);
        EXPECT_NE(std::string(e.what()).find("/nonexistent/fastadb-server-binary"),
                  std::string::npos);
    }
}

class InProcessServerTest : public MockServerTest {};

TEST_F(InProcessServerTest, StatusReportsVersion) {
    server_.set_version(41);
    ServerController ctl(cfg_);
    ServerStatus st = ctl.status();
    EXPECT_TRUE(st.running());
    EXPECT_EQ(st.version, 41u);
}

TEST_F(InProcessServerTest, StartIsNoOpWhenRunning) {
    ClientConfig cfg = cfg_;
    cfg.launch.program = "/nonexistent/should-not-run";
    ServerController ctl(cfg);
    EXPECT_TRUE(ctl.start().running());
}

TEST_F(InProcessServerTest, StopKillsServer) {
    ClientConfig cfg = cfg_;
    cfg.stop_backoff = BackoffPolicy{std::chrono::milliseconds(20),
                                     std::chrono::milliseconds(200), 25};
    ServerController ctl(cfg);
    ctl.stop();
    EXPECT_FALSE(ctl.status().running());
}

TEST(ServerController, StopToleratesServerDroppingStatusQuery) {
    DyingServer server;
    ServerController ctl(quick_config(server.port()));
    EXPECT_NO_THROW(ctl.stop());
    EXPECT_EQ(server.connections(), 2);
    EXPECT_FALSE(ctl.status().running());
}

#ifdef MOCK_SERVER_PATH
TEST(ServerController, StartAndStopSpawnedServer) {
    ClientConfig cfg = quick_config(free_port());
    cfg.launch.program = MOCK_SERVER_PATH;
    cfg.launch.args    = {"--port", "{port}", "--device", "emulator-5554"};
    ServerController ctl(cfg);

    ServerStatus st = ctl.start();
    EXPECT_TRUE(st.running());
    EXPECT_EQ(st.version, 0x29u);

    DeviceRegistry registry(cfg);
    auto devs = registry.list_devices();
    ASSERT_EQ(devs.size(), 1u);
    EXPECT_EQ(devs[0].serial, "emulator-5554");

    EXPECT_TRUE(ctl.restart().running());

    ctl.stop();
    EXPECT_FALSE(ctl.status().running());
}
#endif
