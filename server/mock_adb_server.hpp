#pragma once

// ============================================================
// mock_adb_server.hpp -- Loopback emulator of the host server
//   Serves host requests, the sync sub-protocol and shell
//   sessions against in-memory device filesystems. Used by
//   the integration tests and by the fastadb_mock_server
//   executable.
//
// Concurrency model:
//   accept_loop()  → one worker thread per accepted socket.
//   worker         → runs host requests until the connection
//                    switches to sync or shell, then serves that
//                    stream until the client closes.
//   stop()         → shuts down the listener and every live
//                    connection, then joins all threads.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/socket.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct MockDevice {
    std::string serial;
    std::string state{"device"};    // state word as devices-l prints it
    std::string product;
    std::string model;
    std::string device;
    std::string usb;
    std::string features{"shell_v2,cmd,stat_v2,ls_v2,sendrecv_v2,sendrecv_v2_zstd"};
    u32         transport_id{0};    // 0 = assigned on add
};

struct MockEntry {
    bool        is_dir{false};
    u32         mode{0};            // permission bits only
    i64         mtime{0};
    std::string data;
    std::string link_target;        // non-empty for a symlink

    bool is_link() const { return !link_target.empty(); }
};

class MockAdbServer {
public:
    // Port 0 binds an ephemeral port; see port() after start()
    explicit MockAdbServer(u16 port = 0);
    ~MockAdbServer();

    MockAdbServer(const MockAdbServer&) = delete;
    MockAdbServer& operator=(const MockAdbServer&) = delete;

    void start();

    // Closes the listener and every connection, joins all threads
    void stop();

    // Stops accepting and wakes wait(); safe from any thread, including
    // a connection worker. stop() still has to join.
    void request_stop();

    // Blocks until host:kill, request_stop() or stop()
    void wait();

    u16 port() const { return port_; }

    // ---- Devices ----
    void add_device(MockDevice dev);
    void set_devices(std::vector<MockDevice> devs);
    // The next n device list requests report no devices
    void set_empty_enumerations(int n);
    int  device_list_requests() const { return device_list_requests_.load(); }

    void set_version(u32 v) { version_.store(v); }

    // ---- In-memory filesystem, one per serial ----
    // Parents are created as needed. mtime < 0 means now.
    void put_file(const std::string& serial, const std::string& path,
                  const std::string& data, u32 mode = 0644, i64 mtime = -1);
    void put_dir(const std::string& serial, const std::string& path, u32 mode = 0755);
    // Relative targets resolve against the link's directory
    void put_symlink(const std::string& serial, const std::string& path,
                     const std::string& target);
    // The entry itself when path names a link; links in earlier
    // components are followed
    std::optional<MockEntry> entry(const std::string& serial, const std::string& path) const;

    // Writes and reads under prefix fail with "Permission denied"
    void deny_path_prefix(const std::string& serial, const std::string& prefix);

    // Pause between DATA frames the server sends
    void set_chunk_delay_ms(int ms) { chunk_delay_ms_.store(ms); }

    u64 data_frames_received() const { return data_frames_received_.load(); }

private:
    using MockFs = std::map<std::string, MockEntry>;

    struct DeviceFs {
        MockFs                   files;
        std::vector<std::string> denied;
    };

    void accept_loop();
    void handle_connection(TcpSocket sock, u64 conn_id);

    // Host request loop; returns once the connection is finished
    void serve_host(TcpSocket& sock);
    bool read_request(TcpSocket& sock, std::string& service);
    void reply_okay(TcpSocket& sock);
    void reply_fail(TcpSocket& sock, const std::string& msg);
    void reply_data(TcpSocket& sock, const std::string& data);

    std::string format_device_list(bool long_format);
    std::optional<MockDevice> find_device(const std::string& serial) const;
    // Empty string if the transport can be selected, else the FAIL text
    std::string transport_failure(const std::string& serial) const;

    // ---- sync: ----
    void serve_sync(TcpSocket& sock, const std::string& serial);
    void sync_stat(TcpSocket& sock, const std::string& serial, u32 id, const std::string& path);
    void sync_list(TcpSocket& sock, const std::string& serial, u32 id, const std::string& path);
    // false when the connection must close
    bool sync_send(TcpSocket& sock, const std::string& serial, const std::string& path,
                   u32 mode, u32 flags);
    bool sync_recv(TcpSocket& sock, const std::string& serial, const std::string& path,
                   u32 flags);
    void sync_fail(TcpSocket& sock, const std::string& msg);

    // ---- shell ----
    void serve_shell(TcpSocket& sock, const std::string& serial, const std::string& service);
    // mkdir [-p] PATH...; returns the exit status
    int shell_mkdir(const std::string& serial, const std::vector<std::string>& args,
                    std::string& err);

    // ---- Filesystem helpers (fs_mutex_ held) ----
    static std::string normalize(const std::string& path);
    static std::string parent_of(const std::string& path);
    void make_parents(DeviceFs& dfs, const std::string& path);
    bool denied(const DeviceFs& dfs, const std::string& path) const;
    // Canonical path with links followed; empty when links loop
    std::string resolve(const DeviceFs& dfs, const std::string& path, bool follow_last,
                        int hops = 0) const;
    // Takes fs_mutex_ itself
    std::optional<MockEntry> lookup(const std::string& serial, const std::string& path,
                                    bool follow_last) const;

    u16                    port_;
    TcpSocket              listen_sock_;
    std::thread            accept_thread_;
    std::atomic<bool>      running_{false};
    bool                   stopped_{false};
    std::mutex             state_mutex_;
    std::condition_variable state_cv_;

    // Live connections, shut down on stop()
    std::map<u64, socket_t>  conns_;
    std::mutex               conns_mutex_;
    std::vector<std::thread> workers_;
    u64                      next_conn_id_{1};

    mutable std::mutex      devices_mutex_;
    std::vector<MockDevice> devices_;
    int                     empty_enumerations_{0};
    std::atomic<int>        device_list_requests_{0};

    mutable std::mutex              fs_mutex_;
    std::map<std::string, DeviceFs> fs_;

    std::atomic<u32> version_{0x29};
    std::atomic<int> chunk_delay_ms_{0};
    std::atomic<u64> data_frames_received_{0};
};

// ============================================================
// MockDeviceDaemon -- answers the CNXN handshake of a network
//   device, either with its banner or with an AUTH challenge.
// ============================================================
class MockDeviceDaemon {
public:
    explicit MockDeviceDaemon(std::string banner, bool authorized = true);
    ~MockDeviceDaemon();

    MockDeviceDaemon(const MockDeviceDaemon&) = delete;
    MockDeviceDaemon& operator=(const MockDeviceDaemon&) = delete;

    void start();
    void stop();

    u16 port() const { return port_; }

    // Features the last client advertised in its CNXN banner
    std::string last_client_banner() const;

private:
    void accept_loop();

    std::string       banner_;
    bool              authorized_;
    u16               port_{0};
    TcpSocket         listen_sock_;
    std::thread       thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex mutex_;
    std::string        client_banner_;
};
