#pragma once

// ============================================================
// sync_connection.hpp -- File sync sub-protocol over one stream
// ============================================================

#include "adb_connection.hpp"
#include "../common/compress.hpp"
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

struct RemoteStat {
    bool exists{false};
    u32  mode{0};
    u64  size{0};
    i64  mtime{0};

    bool is_dir()     const { return (mode & MODE_IFMT) == MODE_IFDIR; }
    bool is_regular() const { return (mode & MODE_IFMT) == MODE_IFREG; }
    bool is_link()    const { return (mode & MODE_IFMT) == MODE_IFLNK; }
};

struct RemoteDirEntry {
    std::string name;
    RemoteStat  st;
};

// Protocol variants, chosen from the device feature set
struct SyncCaps {
    bool stat_v2{false};
    bool ls_v2{false};
    bool sendrecv_v2{false};
    bool zstd{false};

    static SyncCaps from_features(const std::set<std::string>& features);
};

class SyncConnection {
public:
    // Opens a stream: host:transport:<serial> then sync:
    static std::unique_ptr<SyncConnection> open(const ClientConfig& cfg,
                                                const std::string& serial,
                                                SyncCaps caps);

    SyncConnection(std::unique_ptr<AdbConnection> conn, SyncCaps caps);
    ~SyncConnection();

    SyncConnection(const SyncConnection&) = delete;
    SyncConnection& operator=(const SyncConnection&) = delete;

    // Follows symlinks when the device supports stat v2; a missing path
    // returns exists == false.
    RemoteStat stat(const std::string& path);

    std::vector<RemoteDirEntry> list(const std::string& path);

    // What a symlink points at. Without stat v2 the link is checked by
    // listing "path/": any entry means a directory, otherwise it is taken
    // as a file of unknown size (0).
    RemoteStat resolve_link(const std::string& path);

    // ---- Push: begin_send, send_data..., finish_send ----
    void begin_send(const std::string& path, u32 mode, bool compress);
    void send_data(const void* data, size_t len);
    // DONE with mtime, then OKAY or FAIL -> TransferError
    void finish_send(u32 mtime);

    // ---- Pull ----
    using DataSink = std::function<void(const u8* data, size_t len)>;
    // Streams the file into sink in order; returns the uncompressed byte count
    u64 recv_file(const std::string& path, bool compress, const DataSink& sink);

    void quit();

    const SyncCaps& caps() const { return caps_; }

    // DATA frames written since the connection was opened
    u64 data_frames_sent() const { return data_frames_sent_; }

    // Maps a device FAIL message onto a transfer error kind
    static TransferError classify_failure(const std::string& path, const std::string& msg);

private:
    void write_request(u32 id, const std::string& path);
    void read_exact_or_throw(void* buf, size_t len, const char* what);
    std::string read_fail_message(u32 len);
    void flush_data(bool final);

    std::unique_ptr<AdbConnection> conn_;
    SyncCaps caps_;

    // Push state
    std::string path_;
    bool        sending_{false};
    std::unique_ptr<compress::StreamCompressor> compressor_;
    std::vector<u8> pending_;
    u64 data_frames_sent_{0};
};
