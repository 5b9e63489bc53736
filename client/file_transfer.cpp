// ============================================================
// file_transfer.cpp -- Push / pull engine
// ============================================================

#include "file_transfer.hpp"
#include "device_selector.hpp"
#include "shell_session.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/thread_pool.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <system_error>

// Longest mkdir command line sent in one shell request
static constexpr size_t MKDIR_COMMAND_MAX = 32 * 1024;

const char* to_string(OutcomeStatus s) {
    switch (s) {
        case OutcomeStatus::SUCCEEDED: return "succeeded";
        case OutcomeStatus::FAILED:    return "failed";
        case OutcomeStatus::SKIPPED:   return "skipped";
    }
    return "?";
}

BatchSummary BatchSummary::of(const std::vector<TransferOutcome>& outcomes) {
    BatchSummary s;
    for (const auto& o : outcomes) {
        switch (o.status) {
            case OutcomeStatus::SUCCEEDED: ++s.succeeded; s.bytes += o.bytes; break;
            case OutcomeStatus::FAILED:    ++s.failed;  break;
            case OutcomeStatus::SKIPPED:   ++s.skipped; break;
        }
    }
    return s;
}

// Last path component of a local path, ignoring trailing separators
static std::string local_basename(const std::string& path) {
    fs::path p = fs::path(path).lexically_normal();
    std::string name = p.filename().string();
    if (name.empty()) name = p.parent_path().filename().string();
    return name;
}

static std::string join_local(const std::string& dir, const std::string& name) {
    return (fs::path(dir) / name).string();
}

static void make_local_dirs(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw TransferError(TransferErrc::LOCAL_IO,
            "cannot create directory " + dir + ": " + ec.message());
    }
}

static TransferOutcome skipped(const std::string& src, const std::string& dst) {
    TransferOutcome o;
    o.source      = src;
    o.destination = dst;
    o.status      = OutcomeStatus::SKIPPED;
    return o;
}

TransferEngine::TransferEngine(ClientConfig cfg, Device device, std::set<std::string> features,
                               ProgressSink* progress)
    : cfg_(std::move(cfg))
    , device_(std::move(device))
    , features_(std::move(features))
    , caps_(SyncCaps::from_features(features_))
    , progress_(progress ? progress : &noop_)
{
    DeviceSelector::require_usable(device_);
}

std::unique_ptr<SyncConnection> TransferEngine::open_sync() {
    return SyncConnection::open(cfg_, device_.serial, caps_);
}

RemoteStat TransferEngine::stat(const std::string& remote_path) {
    auto sync = open_sync();
    RemoteStat st = sync->stat(remote_path);
    sync->quit();
    return st;
}

std::vector<RemoteDirEntry> TransferEngine::list(const std::string& remote_path) {
    auto sync = open_sync();
    auto entries = sync->list(remote_path);
    sync->quit();
    return entries;
}

std::vector<TransferOutcome> TransferEngine::run(const TransferRequest& req) {
    if (req.source.empty() || req.destination.empty()) {
        throw TransferError(req.source.empty() && req.direction == Direction::TO_DEVICE
                                ? TransferErrc::LOCAL_PATH_MISSING
                                : TransferErrc::REMOTE_PATH_MISSING,
                            "source and destination are required");
    }
    return req.direction == Direction::TO_DEVICE ? push(req) : pull(req);
}

// ============================================================
// Push
// ============================================================

std::vector<TransferOutcome> TransferEngine::push(const TransferRequest& req) {
    file_io::LocalStat lst = file_io::stat_local(req.source);
    if (!lst.exists) {
        throw TransferError(TransferErrc::LOCAL_PATH_MISSING,
            req.source + ": No such file or directory");
    }

    auto sync = open_sync();
    RemoteStat dst = sync->stat(req.destination);

    if (lst.is_dir) {
        if (!req.recursive) {
            throw TransferError(TransferErrc::NOT_A_FILE,
                req.source + " is a directory; use a recursive transfer");
        }
        if (dst.exists && !dst.is_dir()) {
            throw TransferError(TransferErrc::REMOTE_FAILURE,
                req.destination + " exists and is not a directory");
        }
        // An existing remote directory receives the source as a child
        std::string root = dst.exists
            ? utils::join_remote(req.destination, local_basename(req.source))
            : req.destination;
        sync->quit();
        sync.reset();

        std::vector<file_io::LocalEntry> entries = file_io::walk_local(req.source);
        std::vector<FileJob> jobs;
        for (size_t i = 0; i < entries.size(); ++i) {
            const auto& e = entries[i];
            FileJob job;
            job.source      = join_local(req.source, e.rel_path);
            job.destination = utils::join_remote(root, e.rel_path);
            if (!e.error.empty()) {
                job.failure = TransferError(TransferErrc::LOCAL_IO, job.source + ": " + e.error);
            } else if (e.st.is_dir) {
                // SEND creates parents, so only leaf directories need a mkdir
                bool has_children = i + 1 < entries.size() &&
                    utils::starts_with(entries[i + 1].rel_path, e.rel_path + "/");
                if (has_children) continue;
                job.is_dir = true;
            } else {
                job.mode  = e.st.mode;
                job.size  = e.st.size;
                job.mtime = e.st.mtime;
            }
            jobs.push_back(std::move(job));
        }
        if (entries.empty()) {
            FileJob job;
            job.source      = req.source;
            job.destination = root;
            job.is_dir      = true;
            jobs.push_back(std::move(job));
        }
        LOG_DEBUG("push " + req.source + " -> " + root + ": " +
                  std::to_string(jobs.size()) + " job(s)");
        create_remote_dirs(jobs);
        return run_batch(jobs, req);
    }

    FileJob job;
    job.source      = req.source;
    job.destination = req.destination;
    if ((dst.exists && dst.is_dir()) || utils::ends_with(req.destination, "/")) {
        job.destination = utils::join_remote(req.destination, local_basename(req.source));
    }
    job.mode  = lst.mode;
    job.size  = lst.size;
    job.mtime = lst.mtime;

    TransferOutcome out = push_one(*sync, job, req);
    sync->quit();
    return {out};
}

TransferOutcome TransferEngine::push_one(SyncConnection& sync, const FileJob& job,
                                         const TransferRequest& req) {
    if (req.skip_unchanged) {
        RemoteStat rst = sync.stat(job.destination);
        if (rst.exists && rst.size >= job.size && rst.mtime >= job.mtime) {
            LOG_DEBUG("skip " + job.source + ": " + job.destination + " is up to date");
            return skipped(job.source, job.destination);
        }
    }

    file_io::MmapReader reader(job.source);
    const u64 size = reader.size();
    const u64 frames_before = sync.data_frames_sent();

    progress_->start(job.source, size);
    sync.begin_send(job.destination, MODE_IFREG | (job.mode & 0777), req.compress);
    u64 offset = 0;
    while (offset < size) {
        u64 n = reader.chunk_len(offset, SYNC_DATA_MAX);
        sync.send_data(reader.chunk_ptr(offset), (size_t)n);
        offset += n;
        progress_->update(job.source, offset);
    }
    sync.finish_send((u32)job.mtime);
    progress_->finish(job.source);
    data_frames_sent_ += sync.data_frames_sent() - frames_before;

    LOG_DEBUG("pushed " + job.source + " -> " + job.destination +
              " (" + utils::format_bytes(size) + ")");
    TransferOutcome o;
    o.source      = job.source;
    o.destination = job.destination;
    o.bytes       = size;
    return o;
}

void TransferEngine::create_remote_dirs(std::vector<FileJob>& jobs) {
    std::vector<FileJob*> dirs;
    for (auto& job : jobs) {
        if (job.is_dir && !job.failure) dirs.push_back(&job);
    }

    // Batches of "mkdir -p 'a' 'b' ...", each kept under the command limit
    size_t next = 0;
    while (next < dirs.size()) {
        std::string command = "mkdir -p";
        size_t first = next;
        while (next < dirs.size()) {
            std::string arg = " " + utils::shell_quote(dirs[next]->destination);
            if (next > first && command.size() + arg.size() > MKDIR_COMMAND_MAX) break;
            command += arg;
            ++next;
        }

        std::string output;
        bool ok = false;
        try {
            ShellResult r = run_shell_command(cfg_, device_, features_, command,
                [&](const ShellChunk& c) { output += c.data; });
            ok = r.exit_status_known && r.exit_code == 0;
        } catch (const ShellError& e) {
            output += e.what();
        }
        if (ok) continue;

        // Status unknown or non-zero: check which directories are missing
        output = utils::trim(output);
        auto sync = open_sync();
        for (size_t i = first; i < next; ++i) {
            FileJob& job = *dirs[i];
            if (sync->stat(job.destination).is_dir()) continue;
            bool denied = output.find("Permission denied") != std::string::npos;
            job.failure = TransferError(
                denied ? TransferErrc::PERMISSION_DENIED : TransferErrc::REMOTE_FAILURE,
                "cannot create directory " + job.destination +
                (output.empty() ? std::string() : ": " + output));
        }
        sync->quit();
    }

    jobs.erase(std::remove_if(jobs.begin(), jobs.end(),
                              [](const FileJob& j) { return j.is_dir && !j.failure; }),
               jobs.end());
}

// ============================================================
// Pull
// ============================================================

void TransferEngine::enumerate_remote(SyncConnection& sync, const std::string& remote_dir,
                                      const std::string& local_dir, std::vector<FileJob>& jobs,
                                      std::vector<std::string>& dirs) {
    for (const auto& e : sync.list(remote_dir)) {
        if (e.name == "." || e.name == "..") continue;
        std::string remote = utils::join_remote(remote_dir, e.name);
        std::string local  = join_local(local_dir, e.name);
        RemoteStat st = e.st;
        if (st.is_link()) {
            // The listing reports the link itself; transfer what it points at
            st = sync.resolve_link(remote);
            if (!st.exists) {
                LOG_WARN("skipping dangling link " + remote);
                continue;
            }
        }
        if (st.is_dir()) {
            dirs.push_back(local);
            enumerate_remote(sync, remote, local, jobs, dirs);
        } else if (st.is_regular()) {
            FileJob job;
            job.source      = remote;
            job.destination = local;
            job.mode        = st.mode;
            job.size        = st.size;
            job.mtime       = st.mtime;
            jobs.push_back(std::move(job));
        } else {
            LOG_DEBUG("skipping special file " + remote);
        }
    }
}

std::vector<TransferOutcome> TransferEngine::pull(const TransferRequest& req) {
    auto sync = open_sync();
    RemoteStat rst = sync->stat(req.source);
    if (rst.is_link()) rst = sync->resolve_link(req.source);
    if (!rst.exists) {
        throw TransferError(TransferErrc::REMOTE_PATH_MISSING,
            req.source + ": No such file or directory");
    }
    file_io::LocalStat lst = file_io::stat_local(req.destination);

    if (rst.is_dir()) {
        if (!req.recursive) {
            throw TransferError(TransferErrc::NOT_A_FILE,
                req.source + " is a directory; use a recursive transfer");
        }
        if (lst.exists && !lst.is_dir) {
            throw TransferError(TransferErrc::LOCAL_IO,
                req.destination + " exists and is not a directory");
        }
        std::string root = lst.exists
            ? join_local(req.destination, utils::remote_basename(req.source))
            : req.destination;
        make_local_dirs(root);

        std::vector<FileJob> jobs;
        std::vector<std::string> dirs;
        enumerate_remote(*sync, req.source, root, jobs, dirs);
        sync->quit();
        sync.reset();

        for (const auto& d : dirs) make_local_dirs(d);
        LOG_DEBUG("pull " + req.source + " -> " + root + ": " +
                  std::to_string(jobs.size()) + " file(s), " +
                  std::to_string(dirs.size()) + " dir(s)");
        return run_batch(jobs, req);
    }

    FileJob job;
    job.source      = req.source;
    job.destination = req.destination;
    if ((lst.exists && lst.is_dir) || utils::ends_with(req.destination, "/")) {
        job.destination = join_local(req.destination, utils::remote_basename(req.source));
    }
    job.mode  = rst.mode;
    job.size  = rst.size;
    job.mtime = rst.mtime;

    TransferOutcome out = pull_one(*sync, job, req);
    sync->quit();
    return {out};
}

TransferOutcome TransferEngine::pull_one(SyncConnection& sync, const FileJob& job,
                                         const TransferRequest& req) {
    const std::string& dest = job.destination;
    if (req.skip_unchanged) {
        file_io::LocalStat lst = file_io::stat_local(dest);
        if (lst.exists && lst.is_regular && lst.size >= job.size && lst.mtime >= job.mtime) {
            LOG_DEBUG("skip " + job.source + ": " + dest + " is up to date");
            return skipped(job.source, dest);
        }
    }

    const std::string part = dest + PARTIAL_SUFFIX;
    file_io::FileWriter writer;
    writer.open(part);
    progress_->start(job.source, job.size);

    u64 received = 0;
    try {
        received = sync.recv_file(job.source, req.compress, [&](const u8* data, size_t len) {
            writer.write(data, len);
            progress_->update(job.source, writer.written());
        });
        writer.close();

        // stat v1 carries 32-bit sizes
        u64 expected = job.size;
        u64 actual   = caps_.stat_v2 ? received : (received & 0xFFFFFFFFull);
        if (expected > 0 && actual != expected) {
            throw TransferError(TransferErrc::STAT_MISMATCH,
                job.source + ": expected " + std::to_string(expected) +
                " bytes, received " + std::to_string(received));
        }
    } catch (const std::exception& e) {
        if (is_cancelled(e) && req.on_cancel == PartialFilePolicy::RETAIN) {
            LOG_WARN("pull of " + job.source + " cancelled; partial data kept in " + part);
        } else {
            std::error_code ec;
            fs::remove(part, ec);
            if (ec) LOG_WARN("cannot remove " + part + ": " + ec.message());
        }
        throw;
    }

    file_io::rename_file(part, dest);
    file_io::set_mtime(dest, (u64)job.mtime * 1000000000ULL);
    if ((job.mode & 0777) != 0) file_io::set_mode(dest, job.mode & 0777);
    progress_->finish(job.source);

    LOG_DEBUG("pulled " + job.source + " -> " + dest +
              " (" + utils::format_bytes(received) + ")");
    TransferOutcome o;
    o.source      = job.source;
    o.destination = dest;
    o.bytes       = received;
    return o;
}

// ============================================================
// Batch execution
// ============================================================

std::vector<TransferOutcome> TransferEngine::run_batch(const std::vector<FileJob>& jobs,
                                                       const TransferRequest& req) {
    std::vector<TransferOutcome> outcomes(jobs.size());
    if (jobs.empty()) return outcomes;

    std::atomic<size_t> next{0};
    std::atomic<bool>   cancelled{false};

    // Each file gets its own sync stream; workers pull indices in order and
    // store results by index so the output keeps enumeration order.
    auto worker = [&]() {
        for (;;) {
            if (cancelled.load() || (cfg_.cancel && cfg_.cancel->cancelled())) {
                cancelled = true;
                return;
            }
            size_t i = next.fetch_add(1);
            if (i >= jobs.size()) return;
            const FileJob& job = jobs[i];
            TransferOutcome& out = outcomes[i];
            out.source      = job.source;
            out.destination = job.destination;
            try {
                if (job.failure) throw *job.failure;
                auto sync = open_sync();
                out = req.direction == Direction::TO_DEVICE
                    ? push_one(*sync, job, req)
                    : pull_one(*sync, job, req);
                sync->quit();
            } catch (const TransferError& e) {
                out.status     = OutcomeStatus::FAILED;
                out.error      = e.what();
                out.error_kind = e.kind();
                LOG_WARN("failed: " + job.source + ": " + e.what());
            } catch (const std::exception& e) {
                if (is_cancelled(e)) {
                    cancelled = true;
                    return;
                }
                out.status = OutcomeStatus::FAILED;
                out.error  = e.what();
                LOG_WARN("failed: " + job.source + ": " + e.what());
            }
        }
    };

    size_t workers = (size_t)std::max(1, req.workers);
    workers = std::min(workers, jobs.size());
    if (workers == 1) {
        worker();
    } else {
        ThreadPool pool(workers);
        for (size_t w = 0; w < workers; ++w) pool.submit(worker);
        pool.wait();
    }

    if (cancelled.load()) {
        size_t started = std::min(next.load(), jobs.size());
        throw ConnectionError(ConnectionErrc::CANCELLED,
            "transfer cancelled after starting " + std::to_string(started) +
            " of " + std::to_string(jobs.size()) + " file(s)");
    }

    BatchSummary s = BatchSummary::of(outcomes);
    LOG_DEBUG("batch done: " + std::to_string(s.succeeded) + " succeeded, " +
              std::to_string(s.failed) + " failed, " + std::to_string(s.skipped) + " skipped");
    return outcomes;
}
