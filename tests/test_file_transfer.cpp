// ============================================================
// test_file_transfer.cpp -- Push / pull against the mock server
// ============================================================

#include "test_support.hpp"
#include "../client/file_transfer.hpp"
#include "../common/file_io.hpp"
#include "../common/utils.hpp"
#include <algorithm>

#include <unistd.h>

namespace {

TransferRequest push_req(const std::string& src, const std::string& dst) {
    TransferRequest r;
    r.source      = src;
    r.destination = dst;
    r.direction   = Direction::TO_DEVICE;
    return r;
}

TransferRequest pull_req(const std::string& src, const std::string& dst) {
    TransferRequest r;
    r.source      = src;
    r.destination = dst;
    r.direction   = Direction::FROM_DEVICE;
    return r;
}

TransferErrc transfer_error(TransferEngine& engine, const TransferRequest& req) {
    try {
        engine.run(req);
    } catch (const TransferError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "transfer of " << req.source << " succeeded unexpectedly";
    return TransferErrc::REMOTE_FAILURE;
}

} // namespace

class TransferTest : public MockServerTest {
protected:
    TransferEngine engine(ProgressSink* progress = nullptr) {
        return TransferEngine(cfg_, device(), features(), progress);
    }

    TempDir tmp_;
};

// ---- Single files ----

TEST_F(TransferTest, PushSingleFile) {
    std::string data = pattern_data(200 * 1024);
    write_local(tmp_.path() / "a.bin", data);

    TransferEngine eng = engine();
    auto out = eng.run(push_req(tmp_.str("a.bin"), "/data/local/tmp/a.bin"));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].status, OutcomeStatus::SUCCEEDED);
    EXPECT_EQ(out[0].bytes, data.size());

    auto e = server_.entry(SERIAL, "/data/local/tmp/a.bin");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->data, data);
    EXPECT_EQ(e->mtime, file_io::stat_local(tmp_.str("a.bin")).mtime);
    // 200 KiB in 64 KiB frames
    EXPECT_EQ(eng.data_frames_sent(), 4u);
    EXPECT_EQ(server_.data_frames_received(), 4u);
}

TEST_F(TransferTest, PushEmptyFile) {
    write_local(tmp_.path() / "empty", "");
    TransferEngine eng = engine();
    auto out = eng.run(push_req(tmp_.str("empty"), "/sdcard/empty"));
    EXPECT_EQ(out[0].status, OutcomeStatus::SUCCEEDED);
    auto e = server_.entry(SERIAL, "/sdcard/empty");
    ASSERT_TRUE(e.has_value());
    EXPECT_TRUE(e->data.empty());
}

TEST_F(TransferTest, PushIntoExistingDirectoryKeepsName) {
    server_.put_dir(SERIAL, "/sdcard/Download");
    write_local(tmp_.path() / "notes.txt", "hello");
    TransferEngine eng = engine();
    auto out = eng.run(push_req(tmp_.str("notes.txt"), "/sdcard/Download"));
    EXPECT_EQ(out[0].destination, "/sdcard/Download/notes.txt");
    ASSERT_TRUE(server_.entry(SERIAL, "/sdcard/Download/notes.txt").has_value());
}

TEST_F(TransferTest, PullSingleFileRestoresMetadata) {
    std::string data = pattern_data(150 * 1024, 7);
    server_.put_file(SERIAL, "/sdcard/photo.jpg", data, 0600, 1600000000);

    TransferEngine eng = engine();
    std::string dest = tmp_.str("photo.jpg");
    auto out = eng.run(pull_req("/sdcard/photo.jpg", dest));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].status, OutcomeStatus::SUCCEEDED);
    EXPECT_EQ(out[0].bytes, data.size());
    EXPECT_EQ(read_local(dest), data);

    file_io::LocalStat st = file_io::stat_local(dest);
    EXPECT_EQ(st.mtime, 1600000000);
    EXPECT_EQ(st.mode, 0600u);
    EXPECT_FALSE(fs::exists(dest + PARTIAL_SUFFIX));
}

TEST_F(TransferTest, PullIntoExistingDirectory) {
    server_.put_file(SERIAL, "/sdcard/a.txt", "abc");
    TransferEngine eng = engine();
    eng.run(pull_req("/sdcard/a.txt", tmp_.str()));
    EXPECT_EQ(read_local(tmp_.path() / "a.txt"), "abc");
}

TEST_F(TransferTest, MissingPaths) {
    TransferEngine eng = engine();
    EXPECT_EQ(transfer_error(eng, pull_req("/sdcard/nope", tmp_.str("x"))),
              TransferErrc::REMOTE_PATH_MISSING);
    EXPECT_EQ(transfer_error(eng, push_req(tmp_.str("nope"), "/sdcard/x")),
              TransferErrc::LOCAL_PATH_MISSING);
}

TEST_F(TransferTest, DirectoryWithoutRecursionIsRejected) {
    fs::create_directories(tmp_.path() / "dir");
    server_.put_dir(SERIAL, "/sdcard/dir");
    TransferEngine eng = engine();
    EXPECT_EQ(transfer_error(eng, push_req(tmp_.str("dir"), "/sdcard/x")),
              TransferErrc::NOT_A_FILE);
    EXPECT_EQ(transfer_error(eng, pull_req("/sdcard/dir", tmp_.str("y"))),
              TransferErrc::NOT_A_FILE);
}

TEST_F(TransferTest, DeniedRemotePaths) {
    server_.put_file(SERIAL, "/data/secret", "x");
    server_.deny_path_prefix(SERIAL, "/data");
    write_local(tmp_.path() / "f", "payload");

    TransferEngine eng = engine();
    EXPECT_EQ(transfer_error(eng, push_req(tmp_.str("f"), "/data/f")),
              TransferErrc::PERMISSION_DENIED);
    EXPECT_EQ(transfer_error(eng, pull_req("/data/secret", tmp_.str("s"))),
              TransferErrc::PERMISSION_DENIED);
    EXPECT_FALSE(server_.entry(SERIAL, "/data/f").has_value());
    EXPECT_FALSE(fs::exists(tmp_.str("s") + PARTIAL_SUFFIX));
}

// ---- Stat / list ----

TEST_F(TransferTest, StatAndList) {
    server_.put_file(SERIAL, "/sdcard/dir/one", "1", 0644, 1500000000);
    server_.put_file(SERIAL, "/sdcard/dir/two", "22");
    server_.put_dir(SERIAL, "/sdcard/dir/sub");

    TransferEngine eng = engine();
    RemoteStat st = eng.stat("/sdcard/dir/one");
    EXPECT_TRUE(st.exists);
    EXPECT_TRUE(st.is_regular());
    EXPECT_EQ(st.size, 1u);
    EXPECT_EQ(st.mtime, 1500000000);
    EXPECT_TRUE(eng.stat("/sdcard/dir").is_dir());
    EXPECT_FALSE(eng.stat("/sdcard/missing").exists);

    std::vector<std::string> names;
    for (const auto& e : eng.list("/sdcard/dir")) names.push_back(e.name);
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{".", "..", "one", "sub", "two"}));
}

// ---- Recursive ----

TEST_F(TransferTest, RecursivePushMirrorsTree) {
    write_local(tmp_.path() / "tree/a.txt", "A");
    write_local(tmp_.path() / "tree/sub/b.txt", "BB");
    write_local(tmp_.path() / "tree/sub/deeper/c.txt", pattern_data(70 * 1024));

    TransferEngine eng = engine();
    TransferRequest req = push_req(tmp_.str("tree"), "/sdcard/tree");
    req.recursive = true;
    req.workers   = 3;
    auto out = eng.run(req);

    BatchSummary sum = BatchSummary::of(out);
    EXPECT_EQ(sum.succeeded, 3u);
    EXPECT_EQ(sum.failed, 0u);
    EXPECT_EQ(server_.entry(SERIAL, "/sdcard/tree/sub/b.txt")->data, "BB");
    EXPECT_EQ(server_.entry(SERIAL, "/sdcard/tree/sub/deeper/c.txt")->data.size(), 70u * 1024);
}

TEST_F(TransferTest, RecursivePullCreatesEmptyDirectories) {
    server_.put_file(SERIAL, "/sdcard/album/1.jpg", "one");
    server_.put_file(SERIAL, "/sdcard/album/2019/2.jpg", "two");
    server_.put_dir(SERIAL, "/sdcard/album/empty");

    TransferEngine eng = engine();
    TransferRequest req = pull_req("/sdcard/album", tmp_.str("album"));
    req.recursive = true;
    auto out = eng.run(req);

    EXPECT_EQ(BatchSummary::of(out).succeeded, 2u);
    EXPECT_EQ(read_local(tmp_.path() / "album/2019/2.jpg"), "two");
    EXPECT_TRUE(fs::is_directory(tmp_.path() / "album/empty"));
}

TEST_F(TransferTest, RecursivePullIntoExistingDirectoryNests) {
    server_.put_file(SERIAL, "/sdcard/music/song.mp3", "la");
    TransferEngine eng = engine();
    TransferRequest req = pull_req("/sdcard/music", tmp_.str());
    req.recursive = true;
    eng.run(req);
    EXPECT_EQ(read_local(tmp_.path() / "music/song.mp3"), "la");
}

TEST_F(TransferTest, RecursivePullFollowsLinks) {
    server_.put_file(SERIAL, "/sdcard/real/a.txt", "alpha");
    server_.put_file(SERIAL, "/sdcard/realdir/b.txt", "beta");
    server_.put_file(SERIAL, "/sdcard/tree/own.txt", "own");
    server_.put_symlink(SERIAL, "/sdcard/tree/file_link", "/sdcard/real/a.txt");
    server_.put_symlink(SERIAL, "/sdcard/tree/dir_link", "../realdir");
    server_.put_symlink(SERIAL, "/sdcard/tree/dangling", "/sdcard/nowhere");

    // The listing reports the links themselves
    TransferEngine eng = engine();
    size_t links = 0;
    for (const auto& e : eng.list("/sdcard/tree")) {
        if (e.st.is_link()) ++links;
    }
    EXPECT_EQ(links, 3u);

    TransferRequest req = pull_req("/sdcard/tree", tmp_.str("tree"));
    req.recursive = true;
    auto out = eng.run(req);

    BatchSummary s = BatchSummary::of(out);
    EXPECT_EQ(s.succeeded, 3u);
    EXPECT_EQ(s.failed, 0u);
    EXPECT_EQ(read_local(tmp_.path() / "tree/file_link"), "alpha");
    EXPECT_EQ(read_local(tmp_.path() / "tree/dir_link/b.txt"), "beta");
    EXPECT_EQ(read_local(tmp_.path() / "tree/own.txt"), "own");
    EXPECT_FALSE(fs::exists(tmp_.path() / "tree/dangling"));
}

TEST_F(TransferTest, RecursivePullFollowsLinksWithoutStatV2) {
    MockDevice legacy = mock_device("legacy-1");
    legacy.features = "";
    server_.add_device(legacy);
    server_.put_file("legacy-1", "/sdcard/real/a.txt", "alpha");
    server_.put_file("legacy-1", "/sdcard/realdir/b.txt", "beta");
    server_.put_symlink("legacy-1", "/sdcard/tree/file_link", "/sdcard/real/a.txt");
    server_.put_symlink("legacy-1", "/sdcard/tree/dir_link", "/sdcard/realdir");

    TransferEngine eng(cfg_, device("legacy-1"), features("legacy-1"));
    // STAT v1 is an lstat
    EXPECT_TRUE(eng.stat("/sdcard/tree/file_link").is_link());

    TransferRequest req = pull_req("/sdcard/tree", tmp_.str("tree"));
    req.recursive = true;
    auto out = eng.run(req);

    EXPECT_EQ(BatchSummary::of(out).succeeded, 2u);
    EXPECT_EQ(read_local(tmp_.path() / "tree/file_link"), "alpha");
    EXPECT_EQ(read_local(tmp_.path() / "tree/dir_link/b.txt"), "beta");
}

TEST_F(TransferTest, PullOfLinkTransfersTarget) {
    server_.put_file(SERIAL, "/sdcard/real/a.txt", "alpha");
    server_.put_symlink(SERIAL, "/sdcard/latest", "real/a.txt");
    TransferEngine eng = engine();
    auto out = eng.run(pull_req("/sdcard/latest", tmp_.str("latest")));
    EXPECT_EQ(out[0].bytes, 5u);
    EXPECT_EQ(read_local(tmp_.path() / "latest"), "alpha");
}

TEST_F(TransferTest, PartialFailureIsReportedPerFile) {
    for (const char* name : {"a", "b", "c", "d", "e"}) {
        write_local(tmp_.path() / "batch" / name, std::string("data-") + name);
    }
    server_.deny_path_prefix(SERIAL, "/sdcard/batch/c");

    TransferEngine eng = engine();
    TransferRequest req = push_req(tmp_.str("batch"), "/sdcard/batch");
    req.recursive = true;
    req.workers   = 2;
    std::vector<TransferOutcome> out;
    ASSERT_NO_THROW(out = eng.run(req));

    ASSERT_EQ(out.size(), 5u);
    BatchSummary sum = BatchSummary::of(out);
    EXPECT_EQ(sum.succeeded, 4u);
    EXPECT_EQ(sum.failed, 1u);
    // Enumeration order is kept
    EXPECT_EQ(out[2].status, OutcomeStatus::FAILED);
    EXPECT_NE(out[2].error.find("/sdcard/batch/c"), std::string::npos);
    ASSERT_TRUE(out[2].error_kind.has_value());
    EXPECT_EQ(*out[2].error_kind, TransferErrc::PERMISSION_DENIED);
}

TEST_F(TransferTest, UnreadableLocalFileFailsAlone) {
    if (::geteuid() == 0) GTEST_SKIP() << "root can read any file";
    for (const char* name : {"a", "b", "c", "d", "e"}) {
        write_local(tmp_.path() / "batch" / name, name);
    }
    fs::permissions(tmp_.path() / "batch/d", fs::perms::none);

    TransferEngine eng = engine();
    TransferRequest req = push_req(tmp_.str("batch"), "/sdcard/batch");
    req.recursive = true;
    auto out = eng.run(req);

    BatchSummary sum = BatchSummary::of(out);
    EXPECT_EQ(sum.succeeded, 4u);
    EXPECT_EQ(sum.failed, 1u);
    EXPECT_EQ(out[3].status, OutcomeStatus::FAILED);
    EXPECT_NE(out[3].error.find("batch/d"), std::string::npos);
    fs::permissions(tmp_.path() / "batch/d", fs::perms::owner_all);
}

// ---- Skip-if-unchanged ----

TEST_F(TransferTest, UnreadableSubdirectoryFailsAlone) {
    if (::geteuid() == 0) GTEST_SKIP() << "root can list any directory";
    write_local(tmp_.path() / "tree/a.txt", "A");
    write_local(tmp_.path() / "tree/locked/x.txt", "X");
    write_local(tmp_.path() / "tree/z.txt", "Z");
    fs::permissions(tmp_.path() / "tree/locked", fs::perms::none);

    TransferEngine eng = engine();
    TransferRequest req = push_req(tmp_.str("tree"), "/sdcard/tree");
    req.recursive = true;
    std::vector<TransferOutcome> out;
    EXPECT_NO_THROW(out = eng.run(req));
    fs::permissions(tmp_.path() / "tree/locked", fs::perms::owner_all);

    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].status, OutcomeStatus::SUCCEEDED);
    EXPECT_EQ(out[1].status, OutcomeStatus::FAILED);
    EXPECT_NE(out[1].error.find("locked"), std::string::npos);
    ASSERT_TRUE(out[1].error_kind.has_value());
    EXPECT_EQ(*out[1].error_kind, TransferErrc::LOCAL_IO);
    EXPECT_EQ(out[2].status, OutcomeStatus::SUCCEEDED);
    EXPECT_EQ(server_.entry(SERIAL, "/sdcard/tree/z.txt")->data, "Z");
}

TEST_F(TransferTest, PushFollowsDirectoryLinks) {
    write_local(tmp_.path() / "tree/real/f.txt", "F");
    fs::create_directory_symlink("real", tmp_.path() / "tree/alias");

    TransferEngine eng = engine();
    TransferRequest req = push_req(tmp_.str("tree"), "/sdcard/tree");
    req.recursive = true;
    auto out = eng.run(req);

    EXPECT_EQ(BatchSummary::of(out).succeeded, 2u);
    EXPECT_EQ(server_.entry(SERIAL, "/sdcard/tree/alias/f.txt")->data, "F");
    EXPECT_EQ(server_.entry(SERIAL, "/sdcard/tree/real/f.txt")->data, "F");
}

TEST_F(TransferTest, DirectoryLinkLoopIsReported) {
    write_local(tmp_.path() / "tree/f.txt", "F");
    fs::create_directories(tmp_.path() / "tree/sub");
    fs::create_directory_symlink("..", tmp_.path() / "tree/sub/up");

    TransferEngine eng = engine();
    TransferRequest req = push_req(tmp_.str("tree"), "/sdcard/tree");
    req.recursive = true;
    auto out = eng.run(req);

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].status, OutcomeStatus::SUCCEEDED);
    EXPECT_EQ(out[1].status, OutcomeStatus::FAILED);
    EXPECT_NE(out[1].source.find("sub/up"), std::string::npos);
}

TEST_F(TransferTest, RecursivePushCreatesEmptyDirectories) {
    write_local(tmp_.path() / "tree/a.txt", "A");
    fs::create_directories(tmp_.path() / "tree/empty");
    fs::create_directories(tmp_.path() / "tree/nested/deeper");
    fs::create_directories(tmp_.path() / "tree/it's here");

    TransferEngine eng = engine();
    TransferRequest req = push_req(tmp_.str("tree"), "/sdcard/tree");
    req.recursive = true;
    auto out = eng.run(req);

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].status, OutcomeStatus::SUCCEEDED);
    for (const char* dir : {"/sdcard/tree/empty", "/sdcard/tree/nested/deeper",
                            "/sdcard/tree/it's here"}) {
        auto e = server_.entry(SERIAL, dir);
        ASSERT_TRUE(e.has_value()) << dir;
        EXPECT_TRUE(e->is_dir) << dir;
    }
}

TEST_F(TransferTest, PushOfEmptyDirectoryCreatesIt) {
    fs::create_directories(tmp_.path() / "void");
    TransferEngine eng = engine();
    TransferRequest req = push_req(tmp_.str("void"), "/sdcard/void");
    req.recursive = true;
    EXPECT_TRUE(eng.run(req).empty());
    auto e = server_.entry(SERIAL, "/sdcard/void");
    ASSERT_TRUE(e.has_value());
    EXPECT_TRUE(e->is_dir);
}

TEST_F(TransferTest, EmptyDirectoryThatCannotBeCreatedFails) {
    write_local(tmp_.path() / "tree/a.txt", "A");
    fs::create_directories(tmp_.path() / "tree/locked");
    fs::create_directories(tmp_.path() / "tree/open");
    server_.deny_path_prefix(SERIAL, "/sdcard/tree/locked");

    TransferEngine eng = engine();
    TransferRequest req = push_req(tmp_.str("tree"), "/sdcard/tree");
    req.recursive = true;
    auto out = eng.run(req);

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].status, OutcomeStatus::SUCCEEDED);
    EXPECT_EQ(out[1].status, OutcomeStatus::FAILED);
    EXPECT_EQ(out[1].destination, "/sdcard/tree/locked");
    ASSERT_TRUE(out[1].error_kind.has_value());
    EXPECT_EQ(*out[1].error_kind, TransferErrc::PERMISSION_DENIED);
    EXPECT_TRUE(server_.entry(SERIAL, "/sdcard/tree/open")->is_dir);
}

TEST_F(TransferTest, SkipUnchangedSendsNoData) {
    std::string data = pattern_data(100 * 1024);
    write_local(tmp_.path() / "same.bin", data);
    file_io::set_mtime(tmp_.str("same.bin"), 1600000000ULL * 1000000000ULL);
    server_.put_file(SERIAL, "/sdcard/same.bin", data, 0644, 1600000100);

    TransferEngine eng = engine();
    TransferRequest req = push_req(tmp_.str("same.bin"), "/sdcard/same.bin");
    req.skip_unchanged = true;
    auto out = eng.run(req);

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].status, OutcomeStatus::SKIPPED);
    EXPECT_EQ(eng.data_frames_sent(), 0u);
    EXPECT_EQ(server_.data_frames_received(), 0u);
}

TEST_F(TransferTest, SkipUnchangedStillSendsNewerFile) {
    write_local(tmp_.path() / "new.bin", "fresh");
    server_.put_file(SERIAL, "/sdcard/new.bin", "fresh", 0644, 1000);

    TransferEngine eng = engine();
    TransferRequest req = push_req(tmp_.str("new.bin"), "/sdcard/new.bin");
    req.skip_unchanged = true;
    auto out = eng.run(req);
    EXPECT_EQ(out[0].status, OutcomeStatus::SUCCEEDED);
    EXPECT_EQ(server_.data_frames_received(), 1u);
}

TEST_F(TransferTest, SkipUnchangedOnPull) {
    server_.put_file(SERIAL, "/sdcard/k.txt", "kept", 0644, 1000);
    write_local(tmp_.path() / "k.txt", "kept");

    TransferEngine eng = engine();
    TransferRequest req = pull_req("/sdcard/k.txt", tmp_.str("k.txt"));
    req.skip_unchanged = true;
    EXPECT_EQ(eng.run(req)[0].status, OutcomeStatus::SKIPPED);
}

// ---- Compression and protocol fallback ----

TEST_F(TransferTest, CompressedPushAndPull) {
    std::string text;
    while (text.size() < 512 * 1024) text += "the quick brown fox jumps over the lazy dog\n";
    write_local(tmp_.path() / "log.txt", text);

    TransferEngine eng = engine();
    TransferRequest push = push_req(tmp_.str("log.txt"), "/sdcard/log.txt");
    push.compress = true;
    eng.run(push);
    EXPECT_EQ(server_.entry(SERIAL, "/sdcard/log.txt")->data, text);
    // Repetitive text shrinks well below one frame per 64 KiB
    EXPECT_LT(eng.data_frames_sent(), 8u);

    TransferRequest pull = pull_req("/sdcard/log.txt", tmp_.str("back.txt"));
    pull.compress = true;
    auto out = eng.run(pull);
    EXPECT_EQ(out[0].bytes, text.size());
    EXPECT_EQ(read_local(tmp_.path() / "back.txt"), text);
}

TEST_F(TransferTest, LegacyDeviceUsesVersionOneSync) {
    MockDevice legacy = mock_device("legacy-1");
    legacy.features = "";
    server_.add_device(legacy);
    std::string data = pattern_data(90 * 1024, 3);
    write_local(tmp_.path() / "v1.bin", data);

    TransferEngine eng(cfg_, device("legacy-1"), features("legacy-1"));
    TransferRequest push = push_req(tmp_.str("v1.bin"), "/sdcard/v1.bin");
    push.compress = true;   // ignored without sendrecv_v2_zstd
    eng.run(push);
    EXPECT_EQ(server_.entry("legacy-1", "/sdcard/v1.bin")->data, data);

    EXPECT_EQ(eng.stat("/sdcard/v1.bin").size, data.size());
    EXPECT_FALSE(eng.stat("/sdcard/none").exists);

    eng.run(pull_req("/sdcard/v1.bin", tmp_.str("v1.back")));
    EXPECT_EQ(read_local(tmp_.path() / "v1.back"), data);
}

// ---- Devices that cannot transfer ----

TEST_F(TransferTest, UnauthorizedDeviceIsRejectedUpFront) {
    server_.add_device(mock_device("locked", "unauthorized"));
    try {
        TransferEngine eng(cfg_, device("locked"), {});
        FAIL() << "expected DeviceError";
    } catch (const DeviceError& e) {
        EXPECT_EQ(e.kind(), DeviceErrc::UNAUTHORIZED);
    }
}

// ---- Cancellation ----

TEST_F(TransferTest, CancelledPullRetainsPartialFile) {
    const size_t total = 2 * 1024 * 1024;
    server_.put_file(SERIAL, "/sdcard/big.bin", pattern_data(total, 11));
    server_.set_chunk_delay_ms(10);

    auto token = cfg_.cancel;
    CallbackProgress progress(nullptr, [token](const std::string&, u64 current) {
        if (current >= 256 * 1024) token->cancel();
    });
    TransferEngine eng = engine(&progress);
    std::string dest = tmp_.str("big.bin");

    u64 t0 = utils::now_ms();
    try {
        eng.run(pull_req("/sdcard/big.bin", dest));
        FAIL() << "expected cancellation";
    } catch (const ConnectionError& e) {
        EXPECT_EQ(e.kind(), ConnectionErrc::CANCELLED);
    }
    EXPECT_LT(utils::now_ms() - t0, 10000u);

    EXPECT_FALSE(fs::exists(dest));
    ASSERT_TRUE(fs::exists(dest + PARTIAL_SUFFIX));
    auto partial = fs::file_size(dest + PARTIAL_SUFFIX);
    EXPECT_GE(partial, 256u * 1024);
    EXPECT_LT(partial, total);
}

TEST_F(TransferTest, CancelledPullCanRemovePartialFile) {
    server_.put_file(SERIAL, "/sdcard/big.bin", pattern_data(1024 * 1024, 5));
    server_.set_chunk_delay_ms(10);

    auto token = cfg_.cancel;
    CallbackProgress progress(nullptr, [token](const std::string&, u64 current) {
        if (current >= 128 * 1024) token->cancel();
    });
    TransferEngine eng = engine(&progress);
    TransferRequest req = pull_req("/sdcard/big.bin", tmp_.str("big.bin"));
    req.on_cancel = PartialFilePolicy::REMOVE;

    EXPECT_THROW(eng.run(req), ConnectionError);
    EXPECT_FALSE(fs::exists(tmp_.str("big.bin") + PARTIAL_SUFFIX));
}

TEST_F(TransferTest, CancelledBatchThrowsAfterDraining) {
    for (int i = 0; i < 6; ++i) {
        server_.put_file(SERIAL, "/sdcard/many/f" + std::to_string(i), pattern_data(256 * 1024, i));
    }
    server_.set_chunk_delay_ms(10);

    auto token = cfg_.cancel;
    CallbackProgress progress(nullptr, [token](const std::string&, u64 current) {
        if (current >= 64 * 1024) token->cancel();
    });
    TransferEngine eng = engine(&progress);
    TransferRequest req = pull_req("/sdcard/many", tmp_.str("many"));
    req.recursive = true;
    req.workers   = 2;

    try {
        eng.run(req);
        FAIL() << "expected cancellation";
    } catch (const ConnectionError& e) {
        EXPECT_EQ(e.kind(), ConnectionErrc::CANCELLED);
    }
    // Nothing after the cancel point completed
    EXPECT_FALSE(fs::exists(tmp_.path() / "many/f5"));
}
