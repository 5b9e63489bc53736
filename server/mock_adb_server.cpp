// ============================================================
// mock_adb_server.cpp -- Loopback host server emulator
// ============================================================

#include "mock_adb_server.hpp"
#include "../common/compress.hpp"
#include "../common/logger.hpp"
#include "../common/protocol_io.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <ctime>

// errno values as the device puts them on the wire
static constexpr u32 WIRE_ENOENT = 2;

static constexpr size_t SHELL_READ_CHUNK = 16 * 1024;
static constexpr u32    MAX_SHELL_PACKET = 1024 * 1024;

// Reads len bytes; false on a clean close before the first byte
static bool recv_exact(TcpSocket& sock, void* buf, size_t len) {
    if (len == 0) return true;
    return sock.recv_all(buf, len);
}

static i64 now_seconds() {
    return (i64)std::time(nullptr);
}

static u32 type_bits(const MockEntry& e) {
    if (e.is_link()) return MODE_IFLNK;
    return e.is_dir ? MODE_IFDIR : MODE_IFREG;
}

// lstat size: a link reports the length of its target path
static u64 entry_size(const MockEntry& e) {
    return e.is_link() ? e.link_target.size() : e.data.size();
}

MockAdbServer::MockAdbServer(u16 port) : port_(port) {}

MockAdbServer::~MockAdbServer() {
    stop();
}

void MockAdbServer::start() {
    listen_sock_.bind_and_listen("127.0.0.1", port_);
    port_ = listen_sock_.local_port();
    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        stopped_ = false;
    }
    running_.store(true);
    accept_thread_ = std::thread(&MockAdbServer::accept_loop, this);
    LOG_INFO("mock server listening on 127.0.0.1:" + std::to_string(port_));
}

void MockAdbServer::stop() {
    running_.store(false);
    if (listen_sock_.is_valid()) ::shutdown(listen_sock_.native(), SHUT_RDWR);
    if (accept_thread_.joinable()) accept_thread_.join();
    listen_sock_.close();

    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lk(conns_mutex_);
        for (auto& kv : conns_) ::shutdown(kv.second, SHUT_RDWR);
        workers.swap(workers_);
    }
    for (auto& t : workers) {
        if (t.joinable()) t.join();
    }

    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        stopped_ = true;
    }
    state_cv_.notify_all();
}

void MockAdbServer::request_stop() {
    LOG_INFO("mock server shutting down");
    running_.store(false);
    if (listen_sock_.is_valid()) ::shutdown(listen_sock_.native(), SHUT_RDWR);
    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        stopped_ = true;
    }
    state_cv_.notify_all();
}

void MockAdbServer::wait() {
    std::unique_lock<std::mutex> lk(state_mutex_);
    state_cv_.wait(lk, [this] { return stopped_; });
}

void MockAdbServer::accept_loop() {
    while (running_.load()) {
        TcpSocket client;
        try {
            client = listen_sock_.accept();
        } catch (const ConnectionError& e) {
            if (!running_.load()) break;
            LOG_WARN(std::string("mock accept failed: ") + e.what());
            continue;
        }
        if (!running_.load()) break;

        std::lock_guard<std::mutex> lk(conns_mutex_);
        u64 id = next_conn_id_++;
        conns_[id] = client.native();
        workers_.emplace_back(&MockAdbServer::handle_connection, this, std::move(client), id);
    }
    LOG_DEBUG("mock accept loop exiting");
}

void MockAdbServer::handle_connection(TcpSocket sock, u64 conn_id) {
    TcpSocket conn = std::move(sock);

    // Unregistered before conn closes so stop() never shuts down a reused fd
    struct ConnEntry {
        MockAdbServer* server;
        u64            id;
        ~ConnEntry() {
            std::lock_guard<std::mutex> lk(server->conns_mutex_);
            server->conns_.erase(id);
        }
    } entry{this, conn_id};

    try {
        serve_host(conn);
    } catch (const ConnectionError& e) {
        LOG_DEBUG(std::string("mock connection ended: ") + e.what());
    } catch (const std::exception& e) {
        LOG_WARN(std::string("mock connection failed: ") + e.what());
    }
}

// ============================================================
// Host requests
// ============================================================

bool MockAdbServer::read_request(TcpSocket& sock, std::string& service) {
    u8 len_buf[4];
    if (!sock.recv_all(len_buf, sizeof(len_buf))) return false;
    u32 len = proto::parse_hex4(len_buf);
    service.assign(len, '\0');
    if (len > 0 && !sock.recv_all(&service[0], len)) return false;
    return true;
}

void MockAdbServer::reply_okay(TcpSocket& sock) {
    sock.send_all("OKAY", 4);
}

void MockAdbServer::reply_fail(TcpSocket& sock, const std::string& msg) {
    sock.send_all("FAIL" + proto::encode_host_request(msg));
}

void MockAdbServer::reply_data(TcpSocket& sock, const std::string& data) {
    sock.send_all(proto::encode_host_request(data));
}

void MockAdbServer::serve_host(TcpSocket& sock) {
    std::string transport;   // selected serial, empty until host:transport
    std::string service;
    while (read_request(sock, service)) {
        LOG_DEBUG("mock request: " + service);

        if (service == "host:version") {
            char hex[5];
            std::snprintf(hex, sizeof(hex), "%04x", (unsigned)(version_.load() & 0xFFFF));
            reply_okay(sock);
            reply_data(sock, std::string(hex, 4));
            return;
        }
        if (service == "host:kill") {
            reply_okay(sock);
            request_stop();
            return;
        }
        if (service == "host:devices" || service == "host:devices-l") {
            std::string list = format_device_list(service == "host:devices-l");
            reply_okay(sock);
            reply_data(sock, list);
            return;
        }
        if (utils::starts_with(service, "host-serial:") &&
            utils::ends_with(service, ":features")) {
            const size_t prefix = std::strlen("host-serial:");
            const size_t suffix = std::strlen(":features");
            std::string serial = service.size() >= prefix + suffix
                ? service.substr(prefix, service.size() - prefix - suffix) : std::string();
            auto dev = find_device(serial);
            if (!dev) {
                reply_fail(sock, "device '" + serial + "' not found");
            } else {
                reply_okay(sock);
                reply_data(sock, dev->features);
            }
            return;
        }
        if (utils::starts_with(service, "host:transport:")) {
            std::string serial = service.substr(std::strlen("host:transport:"));
            std::string failure = transport_failure(serial);
            if (!failure.empty()) {
                reply_fail(sock, failure);
                return;
            }
            transport = serial;
            reply_okay(sock);
            continue;
        }
        if (service == "sync:" || utils::starts_with(service, "shell")) {
            if (transport.empty()) {
                reply_fail(sock, "no device selected");
                return;
            }
            reply_okay(sock);
            if (service == "sync:") {
                serve_sync(sock, transport);
            } else {
                serve_shell(sock, transport, service);
            }
            return;
        }

        reply_fail(sock, "unknown host service '" + service + "'");
        return;
    }
}

// ============================================================
// Devices
// ============================================================

void MockAdbServer::add_device(MockDevice dev) {
    std::lock_guard<std::mutex> lk(devices_mutex_);
    if (dev.transport_id == 0) dev.transport_id = (u32)devices_.size() + 1;
    devices_.push_back(std::move(dev));
}

void MockAdbServer::set_devices(std::vector<MockDevice> devs) {
    std::lock_guard<std::mutex> lk(devices_mutex_);
    devices_.clear();
    for (auto& d : devs) {
        if (d.transport_id == 0) d.transport_id = (u32)devices_.size() + 1;
        devices_.push_back(std::move(d));
    }
}

void MockAdbServer::set_empty_enumerations(int n) {
    std::lock_guard<std::mutex> lk(devices_mutex_);
    empty_enumerations_ = n;
}

std::string MockAdbServer::format_device_list(bool long_format) {
    ++device_list_requests_;
    std::lock_guard<std::mutex> lk(devices_mutex_);
    if (empty_enumerations_ > 0) {
        --empty_enumerations_;
        return std::string();
    }

    std::string out;
    for (const auto& d : devices_) {
        if (!long_format) {
            out += d.serial + "\t" + d.state + "\n";
            continue;
        }
        std::string line = d.serial;
        if (line.size() < 22) line.append(22 - line.size(), ' ');
        line += " " + d.state;
        if (!d.usb.empty())     line += " usb:" + d.usb;
        if (!d.product.empty()) line += " product:" + d.product;
        if (!d.model.empty())   line += " model:" + d.model;
        if (!d.device.empty())  line += " device:" + d.device;
        line += " transport_id:" + std::to_string(d.transport_id);
        out += line + "\n";
    }
    return out;
}

std::optional<MockDevice> MockAdbServer::find_device(const std::string& serial) const {
    std::lock_guard<std::mutex> lk(devices_mutex_);
    for (const auto& d : devices_) {
        if (d.serial == serial) return d;
    }
    return std::nullopt;
}

std::string MockAdbServer::transport_failure(const std::string& serial) const {
    auto dev = find_device(serial);
    if (!dev) return "device '" + serial + "' not found";
    if (dev->state == "device") return std::string();
    if (dev->state == "unauthorized") {
        return "device unauthorized.\nThis adb server's $ADB_VENDOR_KEYS is not set";
    }
    if (dev->state == "offline") return "device offline";
    return "device still " + dev->state;
}

// ============================================================
// In-memory filesystem
// ============================================================

std::string MockAdbServer::normalize(const std::string& path) {
    std::string out = "/";
    for (const auto& part : utils::split(path, '/', true)) {
        if (part == ".") continue;
        if (out.size() > 1) out += '/';
        out += part;
    }
    return out;
}

std::string MockAdbServer::parent_of(const std::string& path) {
    size_t slash = path.rfind('/');
    if (slash == std::string::npos || slash == 0) return "/";
    return path.substr(0, slash);
}

void MockAdbServer::make_parents(DeviceFs& dfs, const std::string& path) {
    for (std::string p = parent_of(path); p != "/"; p = parent_of(p)) {
        if (dfs.files.count(p)) continue;
        MockEntry dir;
        dir.is_dir = true;
        dir.mode   = 0755;
        dir.mtime  = now_seconds();
        dfs.files[p] = dir;
    }
}

std::string MockAdbServer::resolve(const DeviceFs& dfs, const std::string& path,
                                   bool follow_last, int hops) const {
    static constexpr int MAX_LINK_HOPS = 16;
    std::vector<std::string> parts = utils::split(normalize(path), '/', true);
    std::string cur = "/";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i] == "..") {
            cur = parent_of(cur);
            continue;
        }
        std::string next = cur == "/" ? "/" + parts[i] : cur + "/" + parts[i];
        auto it = dfs.files.find(next);
        bool last = i + 1 == parts.size();
        if (it != dfs.files.end() && it->second.is_link() && (!last || follow_last)) {
            if (++hops > MAX_LINK_HOPS) return std::string();
            const std::string& target = it->second.link_target;
            next = resolve(dfs, target[0] == '/' ? target : cur + "/" + target, true, hops);
            if (next.empty()) return next;
        }
        cur = next;
    }
    return cur;
}

bool MockAdbServer::denied(const DeviceFs& dfs, const std::string& path) const {
    for (const auto& prefix : dfs.denied) {
        if (prefix == "/" || path == prefix || utils::starts_with(path, prefix + "/")) {
            return true;
        }
    }
    return false;
}

void MockAdbServer::put_file(const std::string& serial, const std::string& path,
                             const std::string& data, u32 mode, i64 mtime) {
    std::lock_guard<std::mutex> lk(fs_mutex_);
    DeviceFs& dfs = fs_[serial];
    std::string p = normalize(path);
    make_parents(dfs, p);
    MockEntry e;
    e.mode  = mode & 07777;
    e.mtime = mtime < 0 ? now_seconds() : mtime;
    e.data  = data;
    dfs.files[p] = std::move(e);
}

void MockAdbServer::put_dir(const std::string& serial, const std::string& path, u32 mode) {
    std::lock_guard<std::mutex> lk(fs_mutex_);
    DeviceFs& dfs = fs_[serial];
    std::string p = normalize(path);
    if (p == "/") return;
    make_parents(dfs, p);
    MockEntry e;
    e.is_dir = true;
    e.mode   = mode & 07777;
    e.mtime  = now_seconds();
    dfs.files[p] = std::move(e);
}

void MockAdbServer::put_symlink(const std::string& serial, const std::string& path,
                                const std::string& target) {
    std::lock_guard<std::mutex> lk(fs_mutex_);
    DeviceFs& dfs = fs_[serial];
    std::string p = normalize(path);
    if (p == "/" || target.empty()) return;
    make_parents(dfs, p);
    MockEntry e;
    e.mode        = 0777;
    e.mtime       = now_seconds();
    e.link_target = target;
    dfs.files[p] = std::move(e);
}

std::optional<MockEntry> MockAdbServer::lookup(const std::string& serial,
                                               const std::string& path,
                                               bool follow_last) const {
    std::lock_guard<std::mutex> lk(fs_mutex_);
    std::string p = normalize(path);
    auto dit = fs_.find(serial);
    if (dit != fs_.end()) {
        p = resolve(dit->second, p, follow_last);
        if (p.empty()) return std::nullopt;
    }
    if (p == "/") {
        MockEntry root;
        root.is_dir = true;
        root.mode   = 0755;
        return root;
    }
    if (dit == fs_.end()) return std::nullopt;
    auto it = dit->second.files.find(p);
    if (it == dit->second.files.end()) return std::nullopt;
    return it->second;
}

std::optional<MockEntry> MockAdbServer::entry(const std::string& serial,
                                              const std::string& path) const {
    return lookup(serial, path, false);
}

void MockAdbServer::deny_path_prefix(const std::string& serial, const std::string& prefix) {
    std::lock_guard<std::mutex> lk(fs_mutex_);
    fs_[serial].denied.push_back(normalize(prefix));
}

// ============================================================
// sync:
// ============================================================

void MockAdbServer::sync_fail(TcpSocket& sock, const std::string& msg) {
    sock.send_all(proto::encode_sync_frame(ID_FAIL, msg.data(), msg.size()));
}

void MockAdbServer::serve_sync(TcpSocket& sock, const std::string& serial) {
    for (;;) {
        u8 hdr_buf[sizeof(SyncHdr)];
        if (!sock.recv_all(hdr_buf, sizeof(hdr_buf))) return;
        SyncHdr hdr = proto::decode_sync_hdr(hdr_buf);

        if (hdr.id == ID_QUIT) {
            LOG_DEBUG("mock sync: quit");
            return;
        }
        if (hdr.length > SYNC_PATH_MAX) {
            sync_fail(sock, "path too long");
            return;
        }
        std::string path(hdr.length, '\0');
        if (!recv_exact(sock, &path[0], hdr.length)) return;

        switch (hdr.id) {
            case ID_LSTAT_V1:
            case ID_STAT_V2:
            case ID_LSTAT_V2:
                sync_stat(sock, serial, hdr.id, path);
                break;
            case ID_LIST_V1:
            case ID_LIST_V2:
                sync_list(sock, serial, hdr.id, path);
                break;
            case ID_SEND_V1: {
                // "path,mode" with the mode in decimal
                size_t comma = path.rfind(',');
                if (comma == std::string::npos) {
                    sync_fail(sock, "missing mode in SEND request");
                    return;
                }
                u32 mode = (u32)std::strtoul(path.c_str() + comma + 1, nullptr, 10);
                if (!sync_send(sock, serial, path.substr(0, comma), mode, SYNC_FLAG_NONE)) return;
                break;
            }
            case ID_SEND_V2: {
                SyncSendV2Setup setup;
                if (!sock.recv_all(&setup, sizeof(setup))) return;
                if (proto::ltoh32(setup.id) != ID_SEND_V2) {
                    sync_fail(sock, "bad SND2 setup");
                    return;
                }
                if (!sync_send(sock, serial, path, proto::ltoh32(setup.mode),
                               proto::ltoh32(setup.flags))) {
                    return;
                }
                break;
            }
            case ID_RECV_V1:
                if (!sync_recv(sock, serial, path, SYNC_FLAG_NONE)) return;
                break;
            case ID_RECV_V2: {
                SyncRecvV2Setup setup;
                if (!sock.recv_all(&setup, sizeof(setup))) return;
                if (proto::ltoh32(setup.id) != ID_RECV_V2) {
                    sync_fail(sock, "bad RCV2 setup");
                    return;
                }
                if (!sync_recv(sock, serial, path, proto::ltoh32(setup.flags))) return;
                break;
            }
            default:
                sync_fail(sock, "unknown sync command " + proto::id_to_string(hdr.id));
                return;
        }
    }
}

void MockAdbServer::sync_stat(TcpSocket& sock, const std::string& serial, u32 id,
                              const std::string& path) {
    // STA2 follows links; STAT and LST2 describe the link itself
    auto e = lookup(serial, path, id == ID_STAT_V2);

    if (id == ID_LSTAT_V1) {
        SyncStatV1 st{};
        st.id = ID_LSTAT_V1;
        if (e) {
            st.mode  = type_bits(*e) | e->mode;
            st.size  = (u32)entry_size(*e);
            st.mtime = (u32)e->mtime;
        }
        proto::encode_stat_v1(st);
        sock.send_all(&st, sizeof(st));
        return;
    }

    SyncStatV2 st{};
    st.id = id;
    if (e) {
        st.mode  = type_bits(*e) | e->mode;
        st.nlink = 1;
        st.size  = entry_size(*e);
        st.atime = e->mtime;
        st.mtime = e->mtime;
        st.ctime = e->mtime;
    } else {
        st.error = WIRE_ENOENT;
    }
    proto::encode_stat_v2(st);
    sock.send_all(&st, sizeof(st));
}

void MockAdbServer::sync_list(TcpSocket& sock, const std::string& serial, u32 id,
                              const std::string& path) {
    struct Listed {
        std::string name;
        MockEntry   e;
    };
    std::vector<Listed> listed;

    std::string dir = normalize(path);
    auto self = lookup(serial, dir, true);
    if (self && self->is_dir) {
        listed.push_back({".", *self});
        auto parent = lookup(serial, parent_of(dir), true);
        listed.push_back({"..", parent ? *parent : *self});

        std::lock_guard<std::mutex> lk(fs_mutex_);
        auto dit = fs_.find(serial);
        if (dit != fs_.end()) {
            std::string real = resolve(dit->second, dir, true);
            for (const auto& kv : dit->second.files) {
                if (kv.first == real || parent_of(kv.first) != real) continue;
                std::string name = kv.first.substr(real == "/" ? 1 : real.size() + 1);
                listed.push_back({name, kv.second});
            }
        }
    }

    std::vector<u8> out;
    auto append = [&out](const void* p, size_t n) {
        const u8* b = static_cast<const u8*>(p);
        out.insert(out.end(), b, b + n);
    };

    for (const auto& l : listed) {
        u32 mode = type_bits(l.e) | l.e.mode;
        if (id == ID_LIST_V2) {
            SyncDentV2 d{};
            d.id      = ID_DENT_V2;
            d.mode    = mode;
            d.nlink   = 1;
            d.size    = entry_size(l.e);
            d.atime   = l.e.mtime;
            d.mtime   = l.e.mtime;
            d.ctime   = l.e.mtime;
            d.namelen = (u32)l.name.size();
            proto::encode_dent_v2(d);
            append(&d, sizeof(d));
        } else {
            SyncDentV1 d{};
            d.id      = ID_DENT_V1;
            d.mode    = mode;
            d.size    = (u32)entry_size(l.e);
            d.mtime   = (u32)l.e.mtime;
            d.namelen = (u32)l.name.size();
            proto::encode_dent_v1(d);
            append(&d, sizeof(d));
        }
        append(l.name.data(), l.name.size());
    }

    // The listing ends with a full-size record whose id is DONE
    if (id == ID_LIST_V2) {
        SyncDentV2 done{};
        done.id = ID_DONE;
        proto::encode_dent_v2(done);
        append(&done, sizeof(done));
    } else {
        SyncDentV1 done{};
        done.id = ID_DONE;
        proto::encode_dent_v1(done);
        append(&done, sizeof(done));
    }
    sock.send_all(out);
}

bool MockAdbServer::sync_send(TcpSocket& sock, const std::string& serial, const std::string& path,
                              u32 mode, u32 flags) {
    std::unique_ptr<compress::StreamDecompressor> decompressor;
    if (flags & SYNC_FLAG_ZSTD) decompressor = std::make_unique<compress::StreamDecompressor>();

    std::string data;
    std::vector<u8> chunk;
    std::vector<u8> plain;
    bool got_data = false;
    u32 mtime = 0;

    for (;;) {
        u8 hdr_buf[sizeof(SyncHdr)];
        if (!sock.recv_all(hdr_buf, sizeof(hdr_buf))) {
            LOG_DEBUG("mock sync: client left before DONE, discarding " + path);
            return false;
        }
        SyncHdr hdr = proto::decode_sync_hdr(hdr_buf);
        if (hdr.id == ID_DONE) {
            mtime = hdr.length;
            break;
        }
        if (hdr.id != ID_DATA) {
            sync_fail(sock, "expected DATA, got " + proto::id_to_string(hdr.id));
            return false;
        }
        if (hdr.length > SYNC_DATA_MAX) {
            sync_fail(sock, "DATA chunk too large");
            return false;
        }
        chunk.resize(hdr.length);
        if (!recv_exact(sock, chunk.data(), hdr.length)) return false;
        ++data_frames_received_;
        got_data = true;

        if (decompressor) {
            plain.clear();
            decompressor->write(chunk.data(), chunk.size(), plain);
            data.append(plain.begin(), plain.end());
        } else {
            data.append(chunk.begin(), chunk.end());
        }
    }

    if (decompressor && got_data && !decompressor->frame_done()) {
        sync_fail(sock, "truncated compressed stream");
        return false;
    }

    std::string p = normalize(path);
    std::string failure;
    {
        std::lock_guard<std::mutex> lk(fs_mutex_);
        DeviceFs& dfs = fs_[serial];
        std::string real = resolve(dfs, p, true);
        auto it = dfs.files.find(real);
        if (real.empty()) {
            failure = "Too many symbolic links";
        } else if (denied(dfs, p) || denied(dfs, real)) {
            failure = "Permission denied";
        } else if (real == "/" || (it != dfs.files.end() && it->second.is_dir)) {
            failure = "Is a directory";
        } else {
            make_parents(dfs, real);
            MockEntry e;
            e.mode  = mode & 07777;
            e.mtime = (i64)mtime;
            e.data  = std::move(data);
            dfs.files[real] = std::move(e);
        }
    }
    if (!failure.empty()) {
        LOG_DEBUG("mock sync: send " + p + " failed: " + failure);
        sync_fail(sock, failure);
        return false;
    }

    u8 okay[sizeof(SyncHdr)];
    proto::encode_sync_hdr(ID_OKAY, 0, okay);
    sock.send_all(okay, sizeof(okay));
    return true;
}

bool MockAdbServer::sync_recv(TcpSocket& sock, const std::string& serial, const std::string& path,
                              u32 flags) {
    std::string p = normalize(path);
    bool is_denied;
    {
        std::lock_guard<std::mutex> lk(fs_mutex_);
        auto dit = fs_.find(serial);
        is_denied = dit != fs_.end() && denied(dit->second, p);
    }
    if (is_denied) {
        sync_fail(sock, "Permission denied");
        return false;
    }
    auto e = lookup(serial, p, true);
    if (!e) {
        sync_fail(sock, "No such file or directory");
        return false;
    }
    if (e->is_dir) {
        sync_fail(sock, "Is a directory");
        return false;
    }

    std::vector<u8> body;
    if (flags & SYNC_FLAG_ZSTD) {
        compress::StreamCompressor compressor;
        compressor.write(e->data.data(), e->data.size(), body);
        compressor.finish(body);
    } else {
        body.assign(e->data.begin(), e->data.end());
    }

    int delay = chunk_delay_ms_.load();
    for (size_t off = 0; off < body.size(); off += SYNC_DATA_MAX) {
        if (off > 0 && delay > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
        size_t n = std::min<size_t>(SYNC_DATA_MAX, body.size() - off);
        sock.send_all(proto::encode_sync_frame(ID_DATA, body.data() + off, n));
    }

    u8 done[sizeof(SyncHdr)];
    proto::encode_sync_hdr(ID_DONE, 0, done);
    sock.send_all(done, sizeof(done));
    return true;
}

// ============================================================
// shell
//   Commands are separated by ';':
//     echo X   -> X on stdout        err X  -> X on stderr
//     exit N   -> status N           cat    -> echo stdin until closed
//     abort    -> close without reporting a status
//     mkdir [-p] DIR...              -> create directories in the fs
//   Anything else is "not found" with status 127. Words may be single
//   quoted; a backslash escapes the next character outside quotes.
// ============================================================

// Splits a command line on unquoted ';' into word lists. Empty commands
// are dropped.
static std::vector<std::vector<std::string>> parse_commands(const std::string& line) {
    std::vector<std::vector<std::string>> commands;
    std::vector<std::string> words;
    std::string word;
    bool in_word = false;
    bool quoted  = false;

    auto end_word = [&] {
        if (in_word) words.push_back(word);
        word.clear();
        in_word = false;
    };
    auto end_command = [&] {
        end_word();
        if (!words.empty()) commands.push_back(std::move(words));
        words.clear();
    };

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '\'') quoted = false;
            else word += c;
        } else if (c == '\'') {
            quoted  = true;
            in_word = true;
        } else if (c == '\\' && i + 1 < line.size()) {
            word += line[++i];
            in_word = true;
        } else if (c == ';') {
            end_command();
        } else if (std::isspace((unsigned char)c)) {
            end_word();
        } else {
            word += c;
            in_word = true;
        }
    }
    end_command();
    return commands;
}

int MockAdbServer::shell_mkdir(const std::string& serial, const std::vector<std::string>& args,
                               std::string& err) {
    bool parents = false;
    std::vector<std::string> paths;
    for (const auto& a : args) {
        if (a == "-p") parents = true;
        else paths.push_back(a);
    }
    if (paths.empty()) {
        err += "mkdir: missing operand\n";
        return 1;
    }

    int status = 0;
    std::lock_guard<std::mutex> lk(fs_mutex_);
    DeviceFs& dfs = fs_[serial];
    for (const auto& path : paths) {
        std::string p    = normalize(path);
        std::string real = resolve(dfs, p, true);
        if (real.empty()) {
            err += "mkdir: '" + path + "': Too many symbolic links\n";
            status = 1;
            continue;
        }
        if (denied(dfs, p) || denied(dfs, real)) {
            err += "mkdir: '" + path + "': Permission denied\n";
            status = 1;
            continue;
        }
        auto it = dfs.files.find(real);
        bool is_dir = real == "/" || (it != dfs.files.end() && it->second.is_dir);
        if (real == "/" || it != dfs.files.end()) {
            if (is_dir && parents) continue;
            err += "mkdir: '" + path + "': File exists\n";
            status = 1;
            continue;
        }
        std::string parent = parent_of(real);
        auto pit = dfs.files.find(parent);
        if (parent != "/" && (pit == dfs.files.end() || !pit->second.is_dir)) {
            if (!parents || pit != dfs.files.end()) {
                err += "mkdir: '" + path + "': No such file or directory\n";
                status = 1;
                continue;
            }
            make_parents(dfs, real);
        }
        MockEntry dir;
        dir.is_dir = true;
        dir.mode   = 0755;
        dir.mtime  = now_seconds();
        dfs.files[real] = std::move(dir);
    }
    return status;
}

void MockAdbServer::serve_shell(TcpSocket& sock, const std::string& serial,
                                const std::string& service) {
    size_t colon = service.find(':');
    std::string head    = service.substr(0, colon);
    std::string command = colon == std::string::npos ? std::string() : service.substr(colon + 1);
    bool v2 = false;
    for (const auto& opt : utils::split(head, ',', true)) {
        if (opt == "v2") v2 = true;
    }

    auto emit = [&](ShellPacketId id, const std::string& data) {
        if (!v2) {
            // Base protocol: stderr shares the stream with stdout
            sock.send_all(data);
            return;
        }
        std::vector<u8> pkt(sizeof(ShellPacketHdr) + data.size());
        pkt[0] = static_cast<u8>(id);
        proto::put_u32(pkt.data() + 1, (u32)data.size());
        if (!data.empty()) std::memcpy(pkt.data() + sizeof(ShellPacketHdr), data.data(), data.size());
        sock.send_all(pkt);
    };

    // Echo stdin to stdout until the client closes input. False if the
    // connection dropped instead.
    auto echo_stdin = [&]() -> bool {
        if (!v2) {
            char buf[SHELL_READ_CHUNK];
            for (;;) {
                size_t n = sock.recv_some(buf, sizeof(buf));
                if (n == 0) return true;
                emit(ShellPacketId::STDOUT, std::string(buf, n));
            }
        }
        for (;;) {
            u8 hdr[sizeof(ShellPacketHdr)];
            if (!sock.recv_all(hdr, sizeof(hdr))) return false;
            u32 len = proto::get_u32(hdr + 1);
            if (len > MAX_SHELL_PACKET) return false;
            std::string payload(len, '\0');
            if (!recv_exact(sock, &payload[0], len)) return false;
            switch (static_cast<ShellPacketId>(hdr[0])) {
                case ShellPacketId::STDIN:
                    emit(ShellPacketId::STDOUT, payload);
                    break;
                case ShellPacketId::CLOSE_STDIN:
                    return true;
                default:
                    break;
            }
        }
    };

    auto commands = parse_commands(command);
    if (utils::trim(command).empty()) commands = {std::vector<std::string>{"cat"}};

    int status = 0;
    for (const auto& words : commands) {
        const std::string& word = words[0];
        std::vector<std::string> args(words.begin() + 1, words.end());
        std::string rest = utils::join(args, " ");

        if (word == "echo") {
            emit(ShellPacketId::STDOUT, rest + "\n");
            status = 0;
        } else if (word == "err") {
            emit(ShellPacketId::STDERR, rest + "\n");
            status = 0;
        } else if (word == "exit") {
            status = (int)(std::strtol(rest.c_str(), nullptr, 10) & 0xFF);
            break;
        } else if (word == "cat") {
            if (!echo_stdin()) return;
            status = 0;
        } else if (word == "abort") {
            LOG_DEBUG("mock shell: abort");
            return;
        } else if (word == "mkdir") {
            std::string err;
            status = shell_mkdir(serial, args, err);
            if (!err.empty()) emit(ShellPacketId::STDERR, err);
        } else {
            emit(ShellPacketId::STDERR, word + ": not found\n");
            status = 127;
        }
    }

    if (v2) {
        std::string code(1, (char)(u8)status);
        emit(ShellPacketId::EXIT, code);
    }
}

// ============================================================
// MockDeviceDaemon
// ============================================================

MockDeviceDaemon::MockDeviceDaemon(std::string banner, bool authorized)
    : banner_(std::move(banner)), authorized_(authorized) {}

MockDeviceDaemon::~MockDeviceDaemon() {
    stop();
}

void MockDeviceDaemon::start() {
    listen_sock_.bind_and_listen("127.0.0.1", 0);
    port_ = listen_sock_.local_port();
    running_.store(true);
    thread_ = std::thread(&MockDeviceDaemon::accept_loop, this);
}

void MockDeviceDaemon::stop() {
    running_.store(false);
    if (listen_sock_.is_valid()) ::shutdown(listen_sock_.native(), SHUT_RDWR);
    if (thread_.joinable()) thread_.join();
    listen_sock_.close();
}

std::string MockDeviceDaemon::last_client_banner() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return client_banner_;
}

void MockDeviceDaemon::accept_loop() {
    while (running_.load()) {
        TcpSocket client;
        try {
            client = listen_sock_.accept();
        } catch (const ConnectionError& e) {
            if (!running_.load()) break;
            LOG_WARN(std::string("mock daemon accept failed: ") + e.what());
            continue;
        }
        if (!running_.load()) break;

        try {
            proto::AdbFrame hello;
            if (!client.read_frame(hello)) continue;
            if (hello.command != A_CNXN) {
                LOG_WARN("mock daemon: expected CNXN, got " + proto::id_to_string(hello.command));
                continue;
            }
            {
                std::lock_guard<std::mutex> lk(mutex_);
                client_banner_.assign(hello.payload.begin(), hello.payload.end());
            }

            proto::AdbFrame reply;
            if (authorized_) {
                reply.command = A_CNXN;
                reply.arg0    = FASTADB_A_VERSION;
                reply.arg1    = FASTADB_MAX_PAYLOAD;
                reply.payload.assign(banner_.begin(), banner_.end());
            } else {
                // AUTH TOKEN with a 20-byte challenge
                reply.command = A_AUTH;
                reply.arg0    = 1;
                reply.payload.assign(20, 0x5a);
            }
            client.write_frame(reply);
        } catch (const FastAdbError& e) {
            LOG_DEBUG(std::string("mock daemon connection failed: ") + e.what());
        }
    }
}
