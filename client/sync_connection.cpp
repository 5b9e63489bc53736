// ============================================================
// sync_connection.cpp -- stat / list / send / recv exchanges
// ============================================================

#include "sync_connection.hpp"
#include "../common/logger.hpp"
#include "../common/protocol_io.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <stdexcept>

// Longest directory entry name accepted from the device
static constexpr u32 MAX_DENT_NAME = 4096;

// errno values as the device encodes them on the wire
static constexpr u32 WIRE_ENOENT  = 2;
static constexpr u32 WIRE_EACCES  = 13;
static constexpr u32 WIRE_ENOTDIR = 20;

SyncCaps SyncCaps::from_features(const std::set<std::string>& features) {
    SyncCaps c;
    c.stat_v2     = features.count(FEATURE_STAT_V2) > 0;
    c.ls_v2       = features.count(FEATURE_LS_V2) > 0;
    c.sendrecv_v2 = features.count(FEATURE_SENDRECV_V2) > 0;
    c.zstd        = c.sendrecv_v2 && features.count(FEATURE_SENDRECV_V2_ZSTD) > 0;
    return c;
}

std::unique_ptr<SyncConnection> SyncConnection::open(const ClientConfig& cfg,
                                                     const std::string& serial,
                                                     SyncCaps caps) {
    auto conn = AdbConnection::open(cfg);
    conn->select_transport(serial);
    conn->request("sync:");
    return std::make_unique<SyncConnection>(std::move(conn), caps);
}

SyncConnection::SyncConnection(std::unique_ptr<AdbConnection> conn, SyncCaps caps)
    : conn_(std::move(conn)), caps_(caps) {}

SyncConnection::~SyncConnection() = default;

TransferError SyncConnection::classify_failure(const std::string& path, const std::string& msg) {
    std::string lower = utils::to_lower(msg);
    TransferErrc kind = TransferErrc::REMOTE_FAILURE;
    if (lower.find("no such file") != std::string::npos) {
        kind = TransferErrc::REMOTE_PATH_MISSING;
    } else if (lower.find("permission denied") != std::string::npos ||
               lower.find("read-only") != std::string::npos) {
        kind = TransferErrc::PERMISSION_DENIED;
    }
    return TransferError(kind, path + ": " + msg);
}

void SyncConnection::write_request(u32 id, const std::string& path) {
    conn_->write(proto::encode_sync_request(id, path));
}

void SyncConnection::read_exact_or_throw(void* buf, size_t len, const char* what) {
    if (!conn_->read_exact(buf, len)) {
        throw ConnectionError(ConnectionErrc::BROKEN,
            std::string("device closed sync stream while reading ") + what);
    }
}

std::string SyncConnection::read_fail_message(u32 len) {
    if (len > SYNC_DATA_MAX) {
        throw ProtocolError(ProtocolErrc::PAYLOAD_TOO_LARGE,
            "FAIL message too long: " + std::to_string(len));
    }
    std::string msg(len, '\0');
    if (len > 0) read_exact_or_throw(&msg[0], len, "FAIL message");
    return msg;
}

// ============================================================
// stat / list
// ============================================================

RemoteStat SyncConnection::stat(const std::string& path) {
    RemoteStat out;
    if (caps_.stat_v2) {
        write_request(ID_STAT_V2, path);
        SyncStatV2 st;
        read_exact_or_throw(&st, sizeof(st), "stat");
        proto::decode_stat_v2(st);
        if (st.id != ID_STAT_V2 && st.id != ID_LSTAT_V2) {
            throw ProtocolError(ProtocolErrc::UNEXPECTED_COMMAND,
                "expected STA2 reply, got " + proto::id_to_string(st.id));
        }
        if (st.error != 0) {
            if (st.error == WIRE_ENOENT || st.error == WIRE_ENOTDIR) return out;
            if (st.error == WIRE_EACCES) {
                throw TransferError(TransferErrc::PERMISSION_DENIED,
                    path + ": Permission denied");
            }
            throw TransferError(TransferErrc::REMOTE_FAILURE,
                path + ": stat failed with errno " + std::to_string(st.error));
        }
        out.exists = true;
        out.mode   = st.mode;
        out.size   = st.size;
        out.mtime  = st.mtime;
    } else {
        write_request(ID_LSTAT_V1, path);
        SyncStatV1 st;
        read_exact_or_throw(&st, sizeof(st), "stat");
        proto::decode_stat_v1(st);
        if (st.id != ID_LSTAT_V1) {
            throw ProtocolError(ProtocolErrc::UNEXPECTED_COMMAND,
                "expected STAT reply, got " + proto::id_to_string(st.id));
        }
        // v1 has no error field; an all-zero reply means the path is missing
        if (st.mode == 0 && st.size == 0 && st.mtime == 0) return out;
        out.exists = true;
        out.mode   = st.mode;
        out.size   = st.size;
        out.mtime  = st.mtime;
    }
    LOG_DEBUG("stat " + path + ": mode=" + std::to_string(out.mode) +
              " size=" + std::to_string(out.size));
    return out;
}

std::vector<RemoteDirEntry> SyncConnection::list(const std::string& path) {
    std::vector<RemoteDirEntry> out;
    write_request(caps_.ls_v2 ? ID_LIST_V2 : ID_LIST_V1, path);

    for (;;) {
        RemoteDirEntry e;
        u32 namelen;
        if (caps_.ls_v2) {
            SyncDentV2 d;
            read_exact_or_throw(&d, sizeof(d), "dent");
            proto::decode_dent_v2(d);
            if (d.id == ID_DONE) break;
            if (d.id != ID_DENT_V2) {
                throw ProtocolError(ProtocolErrc::UNEXPECTED_COMMAND,
                    "expected DNT2, got " + proto::id_to_string(d.id));
            }
            namelen = d.namelen;
            e.st.exists = (d.error == 0);
            e.st.mode   = d.mode;
            e.st.size   = d.size;
            e.st.mtime  = d.mtime;
        } else {
            SyncDentV1 d;
            read_exact_or_throw(&d, sizeof(d), "dent");
            proto::decode_dent_v1(d);
            if (d.id == ID_DONE) break;
            if (d.id != ID_DENT_V1) {
                throw ProtocolError(ProtocolErrc::UNEXPECTED_COMMAND,
                    "expected DENT, got " + proto::id_to_string(d.id));
            }
            namelen = d.namelen;
            e.st.exists = true;
            e.st.mode   = d.mode;
            e.st.size   = d.size;
            e.st.mtime  = d.mtime;
        }
        if (namelen > MAX_DENT_NAME) {
            throw ProtocolError(ProtocolErrc::PAYLOAD_TOO_LARGE,
                "directory entry name too long: " + std::to_string(namelen));
        }
        e.name.resize(namelen);
        if (namelen > 0) read_exact_or_throw(&e.name[0], namelen, "dent name");
        if (!e.st.exists) continue;
        out.push_back(std::move(e));
    }
    LOG_DEBUG("list " + path + ": " + std::to_string(out.size()) + " entries");
    return out;
}

RemoteStat SyncConnection::resolve_link(const std::string& path) {
    if (caps_.stat_v2) return stat(path);

    RemoteStat st = stat(path);
    if (!st.exists || !st.is_link()) return st;
    bool is_dir = !list(path + "/").empty();
    st.mode = (is_dir ? MODE_IFDIR : MODE_IFREG) | (st.mode & 07777);
    st.size = 0;
    LOG_DEBUG("resolved link " + path + (is_dir ? " to a directory" : " to a file"));
    return st;
}

// ============================================================
// Push
// ============================================================

void SyncConnection::begin_send(const std::string& path, u32 mode, bool compress) {
    path_ = path;
    pending_.clear();
    compressor_.reset();

    if (caps_.sendrecv_v2) {
        bool use_zstd = compress && caps_.zstd;
        write_request(ID_SEND_V2, path);
        SyncSendV2Setup setup;
        setup.id    = proto::htol32(ID_SEND_V2);
        setup.mode  = proto::htol32(mode);
        setup.flags = proto::htol32(use_zstd ? SYNC_FLAG_ZSTD : SYNC_FLAG_NONE);
        conn_->write(&setup, sizeof(setup));
        if (use_zstd) compressor_ = std::make_unique<compress::StreamCompressor>();
    } else {
        write_request(ID_SEND_V1, path + "," + std::to_string(mode));
    }
    sending_ = true;
    LOG_DEBUG("send " + path + (compressor_ ? " (zstd)" : ""));
}

void SyncConnection::flush_data(bool final) {
    size_t off = 0;
    while (pending_.size() - off >= SYNC_DATA_MAX ||
           (final && off < pending_.size())) {
        size_t n = std::min<size_t>(SYNC_DATA_MAX, pending_.size() - off);
        conn_->write(proto::encode_sync_frame(ID_DATA, pending_.data() + off, n));
        ++data_frames_sent_;
        off += n;
    }
    pending_.erase(pending_.begin(), pending_.begin() + (long)off);
}

void SyncConnection::send_data(const void* data, size_t len) {
    if (!sending_) throw std::logic_error("send_data without begin_send");
    if (compressor_) {
        compressor_->write(data, len, pending_);
    } else {
        const u8* p = static_cast<const u8*>(data);
        pending_.insert(pending_.end(), p, p + len);
    }
    flush_data(false);
}

void SyncConnection::finish_send(u32 mtime) {
    if (!sending_) throw std::logic_error("finish_send without begin_send");
    if (compressor_) compressor_->finish(pending_);
    flush_data(true);
    sending_ = false;
    compressor_.reset();

    u8 done[sizeof(SyncHdr)];
    proto::encode_sync_hdr(ID_DONE, mtime, done);
    conn_->write(done, sizeof(done));

    u8 status_buf[sizeof(SyncHdr)];
    read_exact_or_throw(status_buf, sizeof(status_buf), "send status");
    SyncHdr status = proto::decode_sync_hdr(status_buf);
    if (status.id == ID_OKAY) return;
    if (status.id == ID_FAIL) {
        throw classify_failure(path_, read_fail_message(status.length));
    }
    throw ProtocolError(ProtocolErrc::UNEXPECTED_COMMAND,
        "expected OKAY after DONE, got " + proto::id_to_string(status.id));
}

// ============================================================
// Pull
// ============================================================

u64 SyncConnection::recv_file(const std::string& path, bool compress, const DataSink& sink) {
    bool use_zstd = false;
    if (caps_.sendrecv_v2) {
        use_zstd = compress && caps_.zstd;
        write_request(ID_RECV_V2, path);
        SyncRecvV2Setup setup;
        setup.id    = proto::htol32(ID_RECV_V2);
        setup.flags = proto::htol32(use_zstd ? SYNC_FLAG_ZSTD : SYNC_FLAG_NONE);
        conn_->write(&setup, sizeof(setup));
    } else {
        write_request(ID_RECV_V1, path);
    }
    LOG_DEBUG("recv " + path + (use_zstd ? " (zstd)" : ""));

    std::unique_ptr<compress::StreamDecompressor> decompressor;
    if (use_zstd) decompressor = std::make_unique<compress::StreamDecompressor>();

    std::vector<u8> chunk;
    std::vector<u8> plain;
    u64 total = 0;
    for (;;) {
        u8 hdr_buf[sizeof(SyncHdr)];
        read_exact_or_throw(hdr_buf, sizeof(hdr_buf), "data header");
        SyncHdr hdr = proto::decode_sync_hdr(hdr_buf);

        if (hdr.id == ID_DONE) break;
        if (hdr.id == ID_FAIL) {
            throw classify_failure(path, read_fail_message(hdr.length));
        }
        if (hdr.id != ID_DATA) {
            throw ProtocolError(ProtocolErrc::UNEXPECTED_COMMAND,
                "expected DATA, got " + proto::id_to_string(hdr.id));
        }
        if (hdr.length > SYNC_DATA_MAX) {
            throw ProtocolError(ProtocolErrc::PAYLOAD_TOO_LARGE,
                "DATA chunk too large: " + std::to_string(hdr.length));
        }
        chunk.resize(hdr.length);
        if (hdr.length > 0) read_exact_or_throw(chunk.data(), hdr.length, "data");

        if (decompressor) {
            plain.clear();
            decompressor->write(chunk.data(), chunk.size(), plain);
            if (!plain.empty()) sink(plain.data(), plain.size());
            total += plain.size();
        } else {
            sink(chunk.data(), chunk.size());
            total += chunk.size();
        }
    }
    if (decompressor && total > 0 && !decompressor->frame_done()) {
        throw TransferError(TransferErrc::PARTIAL_WRITE,
            path + ": compressed stream ended early");
    }
    return total;
}

void SyncConnection::quit() {
    u8 buf[sizeof(SyncHdr)];
    proto::encode_sync_hdr(ID_QUIT, 0, buf);
    conn_->write(buf, sizeof(buf));
}
