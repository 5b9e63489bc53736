// ============================================================
// test_protocol.cpp -- Frame, sync and host request codecs
// ============================================================

#include "../common/protocol_io.hpp"
#include <gtest/gtest.h>

namespace {

proto::AdbFrame sample_frame() {
    proto::AdbFrame f;
    f.command = A_WRTE;
    f.arg0    = 7;
    f.arg1    = 0x1234;
    std::string text = "shell output\n";
    f.payload.assign(text.begin(), text.end());
    return f;
}

ProtocolErrc decode_error(const std::vector<u8>& buf) {
    try {
        proto::decode_frame(buf);
    } catch (const ProtocolError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "decode_frame accepted a corrupt frame";
    return ProtocolErrc::UNEXPECTED_COMMAND;
}

} // namespace

TEST(Protocol, CommandIdsAreLittleEndianAscii) {
    EXPECT_EQ(make_id('C', 'N', 'X', 'N'), 0x4e584e43u);
    EXPECT_EQ((u32)A_CNXN, 0x4e584e43u);
    EXPECT_EQ(proto::id_to_string(ID_DATA), "DATA");
}

TEST(Protocol, FrameRoundTrip) {
    proto::AdbFrame f = sample_frame();
    std::vector<u8> wire = proto::encode_frame(f);
    ASSERT_EQ(wire.size(), proto::ADB_HEADER_SIZE + f.payload.size());

    size_t consumed = 0;
    proto::AdbFrame back = proto::decode_frame(wire, &consumed);
    EXPECT_EQ(back, f);
    EXPECT_EQ(consumed, wire.size());
}

TEST(Protocol, EmptyPayloadRoundTrip) {
    proto::AdbFrame f;
    f.command = A_OKAY;
    f.arg0    = 1;
    f.arg1    = 2;
    EXPECT_EQ(proto::decode_frame(proto::encode_frame(f)), f);
}

TEST(Protocol, HeaderLayout) {
    std::vector<u8> wire = proto::encode_frame(sample_frame());
    AdbMessageHdr h = proto::decode_header(wire.data());
    EXPECT_EQ(h.command, (u32)A_WRTE);
    EXPECT_EQ(h.magic, (u32)A_WRTE ^ 0xFFFFFFFFu);
    EXPECT_EQ(h.data_length, 13u);
    EXPECT_EQ(h.data_check, proto::checksum(wire.data() + proto::ADB_HEADER_SIZE, 13));
}

TEST(Protocol, EveryPayloadBitFlipIsDetected) {
    std::vector<u8> wire = proto::encode_frame(sample_frame());
    for (size_t byte = proto::ADB_HEADER_SIZE; byte < wire.size(); ++byte) {
        for (int bit = 0; bit < 8; ++bit) {
            std::vector<u8> bad = wire;
            bad[byte] ^= (u8)(1u << bit);
            EXPECT_EQ(decode_error(bad), ProtocolErrc::CHECKSUM_MISMATCH)
                << "byte " << byte << " bit " << bit;
        }
    }
}

TEST(Protocol, BadMagicIsRejected) {
    std::vector<u8> wire = proto::encode_frame(sample_frame());
    wire[20] ^= 0x01;
    EXPECT_EQ(decode_error(wire), ProtocolErrc::BAD_MAGIC);
}

TEST(Protocol, TruncatedHeaderAndPayload) {
    std::vector<u8> wire = proto::encode_frame(sample_frame());
    EXPECT_EQ(decode_error(std::vector<u8>(wire.begin(), wire.begin() + 10)),
              ProtocolErrc::TRUNCATED);
    EXPECT_EQ(decode_error(std::vector<u8>(wire.begin(), wire.end() - 1)),
              ProtocolErrc::TRUNCATED);
}

TEST(Protocol, OversizedPayloadIsRejected) {
    AdbMessageHdr h = proto::make_header(sample_frame());
    h.data_length = FASTADB_MAX_PAYLOAD + 1;
    std::vector<u8> wire(proto::ADB_HEADER_SIZE);
    proto::encode_header(h, wire.data());
    EXPECT_EQ(decode_error(wire), ProtocolErrc::PAYLOAD_TOO_LARGE);

    proto::AdbFrame big;
    big.command = A_WRTE;
    big.payload.resize(FASTADB_MAX_PAYLOAD + 1);
    EXPECT_THROW(proto::encode_frame(big), ProtocolError);
}

TEST(Protocol, DecodeFromStreamReportsConsumed) {
    std::vector<u8> a = proto::encode_frame(sample_frame());
    proto::AdbFrame second;
    second.command = A_CLSE;
    std::vector<u8> b = proto::encode_frame(second);

    std::vector<u8> stream = a;
    stream.insert(stream.end(), b.begin(), b.end());

    size_t used = 0;
    EXPECT_EQ(proto::decode_frame(stream, &used), sample_frame());
    EXPECT_EQ(proto::decode_frame(stream.data() + used, stream.size() - used), second);
}

TEST(Protocol, HostRequestPrefix) {
    EXPECT_EQ(proto::encode_host_request("host:version"), "000chost:version");
    EXPECT_EQ(proto::encode_host_request(""), "0000");
    EXPECT_THROW(proto::encode_host_request(std::string(0x10000, 'x')), ProtocolError);
}

TEST(Protocol, ParseHex4) {
    EXPECT_EQ(proto::parse_hex4(reinterpret_cast<const u8*>("001A")), 26u);
    EXPECT_EQ(proto::parse_hex4(reinterpret_cast<const u8*>("ffff")), 0xFFFFu);
    try {
        proto::parse_hex4(reinterpret_cast<const u8*>("zz00"));
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ProtocolErrc::UNEXPECTED_COMMAND);
    }
}

TEST(Protocol, SyncRequestLayout) {
    std::vector<u8> req = proto::encode_sync_request(ID_LIST_V1, "/sdcard");
    ASSERT_EQ(req.size(), 8u + 7u);
    EXPECT_EQ(std::string(req.begin(), req.begin() + 4), "LIST");
    EXPECT_EQ(proto::get_u32(req.data() + 4), 7u);
    EXPECT_EQ(std::string(req.begin() + 8, req.end()), "/sdcard");

    proto::SyncFrame f = proto::decode_sync_frame(req.data(), req.size());
    EXPECT_EQ(f.id, (u32)ID_LIST_V1);
    EXPECT_EQ(f.text(), "/sdcard");
}

TEST(Protocol, SyncPathLimit) {
    EXPECT_NO_THROW(proto::encode_sync_request(ID_LSTAT_V1, std::string(SYNC_PATH_MAX, 'a')));
    try {
        proto::encode_sync_request(ID_LSTAT_V1, std::string(SYNC_PATH_MAX + 1, 'a'));
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), TransferErrc::REMOTE_FAILURE);
    }
}

TEST(Protocol, TruncatedSyncFrame) {
    std::vector<u8> req = proto::encode_sync_request(ID_RECV_V1, "/data/local/tmp/x");
    EXPECT_THROW(proto::decode_sync_frame(req.data(), 5), ProtocolError);
    EXPECT_THROW(proto::decode_sync_frame(req.data(), req.size() - 1), ProtocolError);
}

TEST(Protocol, StatV2WireConversion) {
    SyncStatV2 st{};
    st.id    = ID_STAT_V2;
    st.mode  = MODE_IFREG | 0644;
    st.size  = 0x100000000ull;
    st.mtime = 1700000000;
    proto::encode_stat_v2(st);

    const u8* raw = reinterpret_cast<const u8*>(&st);
    EXPECT_EQ(std::string(raw, raw + 4), "STA2");

    proto::decode_stat_v2(st);
    EXPECT_EQ(st.size, 0x100000000ull);
    EXPECT_EQ(st.mtime, 1700000000);
    EXPECT_EQ(st.mode, MODE_IFREG | 0644u);
}
