#pragma once

// ============================================================
// protocol_io.hpp -- Frame encode/decode with byte-order handling
// ============================================================

#include "protocol.hpp"
#include "errors.hpp"
#include <vector>
#include <string>
#include <cstdio>

#if defined(__APPLE__)
#  include <libkern/OSByteOrder.h>
#  define htole16(x) OSSwapHostToLittleInt16(x)
#  define htole32(x) OSSwapHostToLittleInt32(x)
#  define htole64(x) OSSwapHostToLittleInt64(x)
#  define le16toh(x) OSSwapLittleToHostInt16(x)
#  define le32toh(x) OSSwapLittleToHostInt32(x)
#  define le64toh(x) OSSwapLittleToHostInt64(x)
#else
#  include <endian.h>
#endif

namespace proto {

// ---- Byte-order helpers (wire is little-endian) ----

inline u32 htol32(u32 v) { return htole32(v); }
inline u64 htol64(u64 v) { return htole64(v); }
inline u32 ltoh32(u32 v) { return le32toh(v); }
inline u64 ltoh64(u64 v) { return le64toh(v); }

inline void put_u32(u8* p, u32 v) {
    u32 le = htol32(v);
    std::memcpy(p, &le, 4);
}

inline u32 get_u32(const u8* p) {
    u32 le;
    std::memcpy(&le, p, 4);
    return ltoh32(le);
}

// Printable form of a four-character id, for logs and error text
inline std::string id_to_string(u32 id) {
    std::string s(4, '?');
    for (int i = 0; i < 4; ++i) {
        char c = (char)((id >> (8 * i)) & 0xFF);
        if (c >= 0x20 && c < 0x7F) s[(size_t)i] = c;
    }
    return s;
}

// ============================================================
// Device daemon frames: 24-byte header + payload
// ============================================================

struct AdbFrame {
    u32 command{0};
    u32 arg0{0};
    u32 arg1{0};
    std::vector<u8> payload;

    bool operator==(const AdbFrame& o) const {
        return command == o.command && arg0 == o.arg0 &&
               arg1 == o.arg1 && payload == o.payload;
    }
    bool operator!=(const AdbFrame& o) const { return !(*this == o); }
};

static constexpr size_t ADB_HEADER_SIZE = sizeof(AdbMessageHdr);

// Unsigned sum of payload bytes
inline u32 checksum(const u8* data, size_t len) {
    u32 sum = 0;
    for (size_t i = 0; i < len; ++i) sum += data[i];
    return sum;
}

inline void encode_header(const AdbMessageHdr& h, u8 buf[ADB_HEADER_SIZE]) {
    put_u32(buf,      h.command);
    put_u32(buf + 4,  h.arg0);
    put_u32(buf + 8,  h.arg1);
    put_u32(buf + 12, h.data_length);
    put_u32(buf + 16, h.data_check);
    put_u32(buf + 20, h.magic);
}

inline AdbMessageHdr decode_header(const u8 buf[ADB_HEADER_SIZE]) {
    AdbMessageHdr h;
    h.command     = get_u32(buf);
    h.arg0        = get_u32(buf + 4);
    h.arg1        = get_u32(buf + 8);
    h.data_length = get_u32(buf + 12);
    h.data_check  = get_u32(buf + 16);
    h.magic       = get_u32(buf + 20);
    return h;
}

inline AdbMessageHdr make_header(const AdbFrame& f) {
    AdbMessageHdr h;
    h.command     = f.command;
    h.arg0        = f.arg0;
    h.arg1        = f.arg1;
    h.data_length = (u32)f.payload.size();
    h.data_check  = checksum(f.payload.data(), f.payload.size());
    h.magic       = f.command ^ 0xFFFFFFFFu;
    return h;
}

// Header-only checks, usable before the payload has arrived
inline void validate_header(const AdbMessageHdr& h) {
    if (h.magic != (h.command ^ 0xFFFFFFFFu)) {
        throw ProtocolError(ProtocolErrc::BAD_MAGIC,
            "bad magic for command " + id_to_string(h.command));
    }
    if (h.data_length > FASTADB_MAX_PAYLOAD) {
        throw ProtocolError(ProtocolErrc::PAYLOAD_TOO_LARGE,
            "payload too large: " + std::to_string(h.data_length));
    }
}

inline void verify_payload(const AdbMessageHdr& h, const u8* data) {
    u32 sum = checksum(data, h.data_length);
    if (sum != h.data_check) {
        throw ProtocolError(ProtocolErrc::CHECKSUM_MISMATCH,
            "checksum mismatch for " + id_to_string(h.command) +
            ": expected " + std::to_string(h.data_check) +
            " got " + std::to_string(sum));
    }
}

inline std::vector<u8> encode_frame(const AdbFrame& f) {
    if (f.payload.size() > FASTADB_MAX_PAYLOAD) {
        throw ProtocolError(ProtocolErrc::PAYLOAD_TOO_LARGE,
            "payload too large: " + std::to_string(f.payload.size()));
    }
    std::vector<u8> out(ADB_HEADER_SIZE + f.payload.size());
    encode_header(make_header(f), out.data());
    if (!f.payload.empty()) {
        std::memcpy(out.data() + ADB_HEADER_SIZE, f.payload.data(), f.payload.size());
    }
    return out;
}

// Decode one frame from the front of buf. On success *consumed (if given)
// receives the number of bytes the frame occupied.
inline AdbFrame decode_frame(const u8* buf, size_t len, size_t* consumed = nullptr) {
    if (len < ADB_HEADER_SIZE) {
        throw ProtocolError(ProtocolErrc::TRUNCATED,
            "truncated header: " + std::to_string(len) + " bytes");
    }
    AdbMessageHdr h = decode_header(buf);
    validate_header(h);
    if (len - ADB_HEADER_SIZE < h.data_length) {
        throw ProtocolError(ProtocolErrc::TRUNCATED,
            "truncated payload: declared " + std::to_string(h.data_length) +
            ", have " + std::to_string(len - ADB_HEADER_SIZE));
    }
    const u8* data = buf + ADB_HEADER_SIZE;
    verify_payload(h, data);

    AdbFrame f;
    f.command = h.command;
    f.arg0    = h.arg0;
    f.arg1    = h.arg1;
    f.payload.assign(data, data + h.data_length);
    if (consumed) *consumed = ADB_HEADER_SIZE + h.data_length;
    return f;
}

inline AdbFrame decode_frame(const std::vector<u8>& buf, size_t* consumed = nullptr) {
    return decode_frame(buf.data(), buf.size(), consumed);
}

// ============================================================
// Sync sub-frames: 4-byte id + 32-bit length + payload
// ============================================================

struct SyncFrame {
    u32 id{0};
    std::vector<u8> payload;

    std::string text() const { return std::string(payload.begin(), payload.end()); }
};

inline void encode_sync_hdr(u32 id, u32 length, u8 buf[sizeof(SyncHdr)]) {
    put_u32(buf, id);
    put_u32(buf + 4, length);
}

inline SyncHdr decode_sync_hdr(const u8 buf[sizeof(SyncHdr)]) {
    SyncHdr h;
    h.id     = get_u32(buf);
    h.length = get_u32(buf + 4);
    return h;
}

inline std::vector<u8> encode_sync_frame(u32 id, const void* data, size_t len) {
    std::vector<u8> out(sizeof(SyncHdr) + len);
    encode_sync_hdr(id, (u32)len, out.data());
    if (len > 0) std::memcpy(out.data() + sizeof(SyncHdr), data, len);
    return out;
}

// A path request: id + length + path bytes
inline std::vector<u8> encode_sync_request(u32 id, const std::string& path) {
    if (path.size() > SYNC_PATH_MAX) {
        throw TransferError(TransferErrc::REMOTE_FAILURE,
            "remote path too long (" + std::to_string(path.size()) + "): " + path);
    }
    return encode_sync_frame(id, path.data(), path.size());
}

inline SyncFrame decode_sync_frame(const u8* buf, size_t len, size_t* consumed = nullptr) {
    if (len < sizeof(SyncHdr)) {
        throw ProtocolError(ProtocolErrc::TRUNCATED, "truncated sync header");
    }
    SyncHdr h = decode_sync_hdr(buf);
    if (len - sizeof(SyncHdr) < h.length) {
        throw ProtocolError(ProtocolErrc::TRUNCATED,
            "truncated sync payload for " + id_to_string(h.id));
    }
    SyncFrame f;
    f.id = h.id;
    f.payload.assign(buf + sizeof(SyncHdr), buf + sizeof(SyncHdr) + h.length);
    if (consumed) *consumed = sizeof(SyncHdr) + h.length;
    return f;
}

// ---- Fixed-layout sync replies (in-place, wire <-> host) ----

inline void decode_stat_v1(SyncStatV1& s) {
    s.id    = ltoh32(s.id);
    s.mode  = ltoh32(s.mode);
    s.size  = ltoh32(s.size);
    s.mtime = ltoh32(s.mtime);
}

inline void encode_stat_v1(SyncStatV1& s) {
    s.id    = htol32(s.id);
    s.mode  = htol32(s.mode);
    s.size  = htol32(s.size);
    s.mtime = htol32(s.mtime);
}

inline void decode_stat_v2(SyncStatV2& s) {
    s.id    = ltoh32(s.id);
    s.error = ltoh32(s.error);
    s.dev   = ltoh64(s.dev);
    s.ino   = ltoh64(s.ino);
    s.mode  = ltoh32(s.mode);
    s.nlink = ltoh32(s.nlink);
    s.uid   = ltoh32(s.uid);
    s.gid   = ltoh32(s.gid);
    s.size  = ltoh64(s.size);
    s.atime = (i64)ltoh64((u64)s.atime);
    s.mtime = (i64)ltoh64((u64)s.mtime);
    s.ctime = (i64)ltoh64((u64)s.ctime);
}

inline void encode_stat_v2(SyncStatV2& s) {
    s.id    = htol32(s.id);
    s.error = htol32(s.error);
    s.dev   = htol64(s.dev);
    s.ino   = htol64(s.ino);
    s.mode  = htol32(s.mode);
    s.nlink = htol32(s.nlink);
    s.uid   = htol32(s.uid);
    s.gid   = htol32(s.gid);
    s.size  = htol64(s.size);
    s.atime = (i64)htol64((u64)s.atime);
    s.mtime = (i64)htol64((u64)s.mtime);
    s.ctime = (i64)htol64((u64)s.ctime);
}

inline void decode_dent_v1(SyncDentV1& d) {
    d.id      = ltoh32(d.id);
    d.mode    = ltoh32(d.mode);
    d.size    = ltoh32(d.size);
    d.mtime   = ltoh32(d.mtime);
    d.namelen = ltoh32(d.namelen);
}

inline void encode_dent_v1(SyncDentV1& d) {
    d.id      = htol32(d.id);
    d.mode    = htol32(d.mode);
    d.size    = htol32(d.size);
    d.mtime   = htol32(d.mtime);
    d.namelen = htol32(d.namelen);
}

inline void decode_dent_v2(SyncDentV2& d) {
    d.id      = ltoh32(d.id);
    d.error   = ltoh32(d.error);
    d.mode    = ltoh32(d.mode);
    d.size    = ltoh64(d.size);
    d.mtime   = (i64)ltoh64((u64)d.mtime);
    d.namelen = ltoh32(d.namelen);
}

inline void encode_dent_v2(SyncDentV2& d) {
    d.id      = htol32(d.id);
    d.error   = htol32(d.error);
    d.mode    = htol32(d.mode);
    d.size    = htol64(d.size);
    d.mtime   = (i64)htol64((u64)d.mtime);
    d.namelen = htol32(d.namelen);
}

// ============================================================
// Host requests: "%04x" length prefix + service string
// ============================================================

inline std::string encode_host_request(const std::string& service) {
    if (service.size() > MAX_HOST_REQUEST) {
        throw ProtocolError(ProtocolErrc::PAYLOAD_TOO_LARGE,
            "host request too long: " + std::to_string(service.size()));
    }
    char prefix[5];
    std::snprintf(prefix, sizeof(prefix), "%04x", (unsigned)service.size());
    return std::string(prefix, 4) + service;
}

inline u32 parse_hex4(const u8 buf[4]) {
    u32 v = 0;
    for (int i = 0; i < 4; ++i) {
        u8 c = buf[i];
        v <<= 4;
        if (c >= '0' && c <= '9')      v |= (u32)(c - '0');
        else if (c >= 'a' && c <= 'f') v |= (u32)(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') v |= (u32)(c - 'A' + 10);
        else {
            throw ProtocolError(ProtocolErrc::UNEXPECTED_COMMAND,
                "invalid hex length prefix: " +
                std::string(reinterpret_cast<const char*>(buf), 4));
        }
    }
    return v;
}

} // namespace proto
