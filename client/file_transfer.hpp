#pragma once

// ============================================================
// file_transfer.hpp -- Push / pull engine over the sync protocol
// ============================================================

#include "client_config.hpp"
#include "device.hpp"
#include "progress.hpp"
#include "sync_connection.hpp"
#include <atomic>
#include <optional>
#include <set>
#include <string>
#include <vector>

// Suffix of the file a pull writes before renaming it into place
static constexpr const char* PARTIAL_SUFFIX = ".fastadb-part";

enum class Direction {
    TO_DEVICE,      // push
    FROM_DEVICE,    // pull
};

// What happens to <dest>.fastadb-part when a pull is cancelled
enum class PartialFilePolicy {
    RETAIN,
    REMOVE,
};

struct TransferRequest {
    std::string source;
    std::string destination;
    Direction   direction{Direction::TO_DEVICE};
    bool        recursive{false};
    bool        skip_unchanged{false};
    bool        compress{false};
    int         workers{1};
    PartialFilePolicy on_cancel{PartialFilePolicy::RETAIN};
};

enum class OutcomeStatus {
    SUCCEEDED,
    FAILED,
    SKIPPED,
};

struct TransferOutcome {
    std::string   source;
    std::string   destination;
    OutcomeStatus status{OutcomeStatus::SUCCEEDED};
    u64           bytes{0};
    std::string   error;                      // FAILED only
    std::optional<TransferErrc> error_kind;   // FAILED with a transfer error
};

const char* to_string(OutcomeStatus s);

struct BatchSummary {
    size_t succeeded{0};
    size_t failed{0};
    size_t skipped{0};
    u64    bytes{0};

    static BatchSummary of(const std::vector<TransferOutcome>& outcomes);
};

class TransferEngine {
public:
    // Throws DeviceError unless the device is ready
    TransferEngine(ClientConfig cfg, Device device, std::set<std::string> features,
                   ProgressSink* progress = nullptr);

    RemoteStat stat(const std::string& remote_path);
    std::vector<RemoteDirEntry> list(const std::string& remote_path);

    // Single-file requests throw on failure and return one outcome.
    // Recursive requests record per-file failures as outcomes and return
    // them in enumeration order; cancellation throws once workers drain.
    std::vector<TransferOutcome> run(const TransferRequest& req);

    // DATA frames sent by pushes so far
    u64 data_frames_sent() const { return data_frames_sent_.load(); }

private:
    struct FileJob {
        std::string source;
        std::string destination;
        u32         mode{0};
        u64         size{0};
        i64         mtime{0};
        bool        is_dir{false};      // empty directory to create on the device
        std::optional<TransferError> failure;   // known to fail before transfer
    };

    std::unique_ptr<SyncConnection> open_sync();

    TransferOutcome push_one(SyncConnection& sync, const FileJob& job, const TransferRequest& req);
    TransferOutcome pull_one(SyncConnection& sync, const FileJob& job, const TransferRequest& req);

    std::vector<TransferOutcome> push(const TransferRequest& req);
    std::vector<TransferOutcome> pull(const TransferRequest& req);

    // Enumeration for recursive requests
    void enumerate_remote(SyncConnection& sync, const std::string& remote_dir,
                          const std::string& local_dir, std::vector<FileJob>& jobs,
                          std::vector<std::string>& dirs);

    // mkdir -p for the directory jobs; ones that could not be created get
    // a failure, the rest are removed from jobs
    void create_remote_dirs(std::vector<FileJob>& jobs);

    std::vector<TransferOutcome> run_batch(const std::vector<FileJob>& jobs,
                                           const TransferRequest& req);

    ClientConfig          cfg_;
    Device                device_;
    std::set<std::string> features_;
    SyncCaps              caps_;
    ProgressSink*         progress_;
    NoopProgress          noop_;
    std::atomic<u64>      data_frames_sent_{0};
};
