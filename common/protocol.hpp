#pragma once

// protocol.hpp -- Wire protocol definitions for fastadb

#include "platform.hpp"
#include <cstring>

static constexpr u16 FASTADB_DEFAULT_PORT = 5037;

// Device daemon protocol version and payload ceiling advertised in CNXN
static constexpr u32 FASTADB_A_VERSION   = 0x01000001u;
static constexpr u32 FASTADB_MAX_PAYLOAD = 1024u * 1024u;

// Host request strings are prefixed with 4 hex digits of length
static constexpr size_t MAX_HOST_REQUEST = 0xFFFFu;

// Sync DATA chunks never exceed 64 KiB
static constexpr u32 SYNC_DATA_MAX = 64u * 1024u;
// Remote paths longer than this are rejected by the device
static constexpr size_t SYNC_PATH_MAX = 1024u;

// Four ASCII characters packed little-endian, e.g. "CNXN" -> 0x4e584e43
constexpr u32 make_id(char a, char b, char c, char d) {
    return (u32)(u8)a | ((u32)(u8)b << 8) | ((u32)(u8)c << 16) | ((u32)(u8)d << 24);
}

// ---- Device daemon frame commands ----
enum AdbCommand : u32 {
    A_SYNC = make_id('S', 'Y', 'N', 'C'),
    A_CNXN = make_id('C', 'N', 'X', 'N'),
    A_AUTH = make_id('A', 'U', 'T', 'H'),
    A_OPEN = make_id('O', 'P', 'E', 'N'),
    A_OKAY = make_id('O', 'K', 'A', 'Y'),
    A_CLSE = make_id('C', 'L', 'S', 'E'),
    A_WRTE = make_id('W', 'R', 'T', 'E'),
    A_STLS = make_id('S', 'T', 'L', 'S'),
};

// ---- Sync sub-protocol ids ----
enum SyncId : u32 {
    ID_LSTAT_V1 = make_id('S', 'T', 'A', 'T'),
    ID_STAT_V2  = make_id('S', 'T', 'A', '2'),
    ID_LSTAT_V2 = make_id('L', 'S', 'T', '2'),
    ID_LIST_V1  = make_id('L', 'I', 'S', 'T'),
    ID_LIST_V2  = make_id('L', 'I', 'S', '2'),
    ID_DENT_V1  = make_id('D', 'E', 'N', 'T'),
    ID_DENT_V2  = make_id('D', 'N', 'T', '2'),
    ID_SEND_V1  = make_id('S', 'E', 'N', 'D'),
    ID_SEND_V2  = make_id('S', 'N', 'D', '2'),
    ID_RECV_V1  = make_id('R', 'E', 'C', 'V'),
    ID_RECV_V2  = make_id('R', 'C', 'V', '2'),
    ID_DATA     = make_id('D', 'A', 'T', 'A'),
    ID_DONE     = make_id('D', 'O', 'N', 'E'),
    ID_OKAY     = make_id('O', 'K', 'A', 'Y'),
    ID_FAIL     = make_id('F', 'A', 'I', 'L'),
    ID_QUIT     = make_id('Q', 'U', 'I', 'T'),
};

// ---- Sync v2 flags ----
enum SyncFlag : u32 {
    SYNC_FLAG_NONE    = 0,
    SYNC_FLAG_BROTLI  = 1,
    SYNC_FLAG_LZ4     = 2,
    SYNC_FLAG_ZSTD    = 4,
    SYNC_FLAG_DRY_RUN = 0x80000000u,
};

// ---- Shell protocol v2 packet ids ----
enum class ShellPacketId : u8 {
    STDIN        = 0,
    STDOUT       = 1,
    STDERR       = 2,
    EXIT         = 3,
    CLOSE_STDIN  = 4,
    WINDOW_SIZE  = 5,
};

// ---- Device feature names ----
static constexpr const char* FEATURE_SHELL_V2         = "shell_v2";
static constexpr const char* FEATURE_STAT_V2          = "stat_v2";
static constexpr const char* FEATURE_LS_V2            = "ls_v2";
static constexpr const char* FEATURE_SENDRECV_V2      = "sendrecv_v2";
static constexpr const char* FEATURE_SENDRECV_V2_ZSTD = "sendrecv_v2_zstd";

// ---- File mode bits as the device reports them ----
static constexpr u32 MODE_IFMT  = 0170000;
static constexpr u32 MODE_IFDIR = 0040000;
static constexpr u32 MODE_IFREG = 0100000;
static constexpr u32 MODE_IFLNK = 0120000;

// ============================================================
// Packed structures (wire format, little-endian)
// ============================================================
#pragma pack(push, 1)

// Device daemon frame header: 24 bytes
struct AdbMessageHdr {
    u32 command;
    u32 arg0;
    u32 arg1;
    u32 data_length;
    u32 data_check;
    u32 magic;          // command ^ 0xffffffff
};
static_assert(sizeof(AdbMessageHdr) == 24, "AdbMessageHdr must be 24 bytes");

// Sync request / DATA / status header: 8 bytes
struct SyncHdr {
    u32 id;
    u32 length;
};
static_assert(sizeof(SyncHdr) == 8, "SyncHdr size mismatch");

struct SyncStatV1 {
    u32 id;
    u32 mode;
    u32 size;
    u32 mtime;
};
static_assert(sizeof(SyncStatV1) == 16, "SyncStatV1 size mismatch");

struct SyncStatV2 {
    u32 id;
    u32 error;
    u64 dev;
    u64 ino;
    u32 mode;
    u32 nlink;
    u32 uid;
    u32 gid;
    u64 size;
    i64 atime;
    i64 mtime;
    i64 ctime;
};
static_assert(sizeof(SyncStatV2) == 72, "SyncStatV2 size mismatch");

// Followed by namelen bytes of name
struct SyncDentV1 {
    u32 id;
    u32 mode;
    u32 size;
    u32 mtime;
    u32 namelen;
};
static_assert(sizeof(SyncDentV1) == 20, "SyncDentV1 size mismatch");

struct SyncDentV2 {
    u32 id;
    u32 error;
    u64 dev;
    u64 ino;
    u32 mode;
    u32 nlink;
    u32 uid;
    u32 gid;
    u64 size;
    i64 atime;
    i64 mtime;
    i64 ctime;
    u32 namelen;
};
static_assert(sizeof(SyncDentV2) == 76, "SyncDentV2 size mismatch");

// Sent after the SND2 request + path
struct SyncSendV2Setup {
    u32 id;
    u32 mode;
    u32 flags;
};
static_assert(sizeof(SyncSendV2Setup) == 12, "SyncSendV2Setup size mismatch");

// Sent after the RCV2 request + path
struct SyncRecvV2Setup {
    u32 id;
    u32 flags;
};
static_assert(sizeof(SyncRecvV2Setup) == 8, "SyncRecvV2Setup size mismatch");

// Shell protocol v2 packet header: 5 bytes
struct ShellPacketHdr {
    u8  id;
    u32 length;
};
static_assert(sizeof(ShellPacketHdr) == 5, "ShellPacketHdr size mismatch");

#pragma pack(pop)
