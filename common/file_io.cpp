// ============================================================
// file_io.cpp -- Local file access implementation
// ============================================================

#include "file_io.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstring>
#include <set>
#include <string>
#include <system_error>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <time.h>

using namespace file_io;

static TransferError local_error(const std::string& what, const std::string& path, int err) {
    TransferErrc kind = (err == ENOENT || err == ENOTDIR)
        ? TransferErrc::LOCAL_PATH_MISSING
        : TransferErrc::LOCAL_IO;
    return TransferError(kind, what + " " + path + ": " + std::strerror(err));
}

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path) {
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw local_error("cannot open", path, errno);
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw local_error("fstat failed for", path, err);
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd_);
        fd_ = -1;
        throw TransferError(TransferErrc::NOT_A_FILE, "not a regular file: " + path);
    }
    size_ = (u64)st.st_size;

    if (size_ == 0) {
        data_ = nullptr;
        return;
    }

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw local_error("mmap failed for", path, err);
    }
    madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    data_ = static_cast<const char*>(p);
}

MmapReader::~MmapReader() {
    close();
}

void MmapReader::close() {
    if (data_ && size_ > 0) { munmap((void*)data_, (size_t)size_); data_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
    size_ = 0;
}

// ============================================================
// FileWriter
// ============================================================

FileWriter::~FileWriter() {
    if (fd_ >= 0) ::close(fd_);
}

void FileWriter::open(const std::string& path, u32 mode) {
    path_ = path;
    written_ = 0;
    try {
        ensure_parent_dirs(path);
    } catch (const fs::filesystem_error& e) {
        throw TransferError(TransferErrc::LOCAL_IO,
            "cannot create parent of " + path + ": " + e.what());
    }
    fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, (mode_t)mode);
    if (fd_ < 0) {
        throw local_error("cannot create", path, errno);
    }
}

void FileWriter::write(const void* data, size_t len) {
    const char* p = static_cast<const char*>(data);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t n = ::write(fd_, p, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw local_error("write failed for", path_, errno);
        }
        p += n;
        remaining -= (size_t)n;
    }
    written_ += len;
}

void FileWriter::close() {
    if (fd_ < 0) return;
    int rc = ::close(fd_);
    fd_ = -1;
    if (rc != 0) {
        throw local_error("close failed for", path_, errno);
    }
}

// ============================================================
// Metadata
// ============================================================

static LocalStat from_stat(const struct stat& st) {
    LocalStat ls;
    ls.exists     = true;
    ls.is_dir     = S_ISDIR(st.st_mode);
    ls.is_regular = S_ISREG(st.st_mode);
    ls.mode       = (u32)(st.st_mode & 07777);
    ls.size       = ls.is_regular ? (u64)st.st_size : 0;
    ls.mtime      = (i64)st.st_mtime;
    return ls;
}

LocalStat file_io::stat_local(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) return LocalStat{};
        throw local_error("stat failed for", path, errno);
    }
    return from_stat(st);
}

// (st_dev, st_ino) of the directories currently being walked
using DirChain = std::set<std::pair<u64, u64>>;

// Sorted child names of dir; errno-style code on failure, 0 on success
static int list_names(const std::string& dir, std::vector<std::string>& names) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    while (!ec && it != fs::directory_iterator()) {
        names.push_back(it->path().filename().string());
        it.increment(ec);
    }
    if (ec) return ec.value();
    std::sort(names.begin(), names.end());
    return 0;
}

// Appends the entries below rel, whose sorted child names are given
static void walk_dir(const std::string& root, const std::string& rel,
                     const std::vector<std::string>& names,
                     DirChain& chain, std::vector<LocalEntry>& out) {
    for (const auto& name : names) {
        LocalEntry e;
        e.rel_path = rel.empty() ? name : rel + "/" + name;
        std::string path = root + "/" + e.rel_path;

        struct stat st{};
        if (::stat(path.c_str(), &st) != 0) {
            int err = errno;
            if (err == ENOENT) continue;        // dangling symlink
            e.error = std::string("stat failed: ") + std::strerror(err);
            out.push_back(std::move(e));
            continue;
        }
        e.st = from_stat(st);
        if (!e.st.is_dir) {
            out.push_back(std::move(e));
            continue;
        }

        // A directory link back into its own ancestry would never end
        auto key = std::make_pair((u64)st.st_dev, (u64)st.st_ino);
        if (chain.count(key)) {
            e.error = std::strerror(ELOOP);
            out.push_back(std::move(e));
            continue;
        }
        std::vector<std::string> children;
        int err = list_names(path, children);
        if (err != 0) e.error = std::string("cannot list: ") + std::strerror(err);
        std::string child_rel = e.rel_path;
        out.push_back(std::move(e));
        if (err != 0) continue;

        chain.insert(key);
        walk_dir(root, child_rel, children, chain, out);
        chain.erase(key);
    }
}

std::vector<LocalEntry> file_io::walk_local(const std::string& root) {
    struct stat st{};
    if (::stat(root.c_str(), &st) != 0) {
        throw local_error("cannot list", root, errno);
    }
    std::vector<std::string> names;
    int err = S_ISDIR(st.st_mode) ? list_names(root, names) : ENOTDIR;
    if (err != 0) {
        throw local_error("cannot list", root, err);
    }

    std::vector<LocalEntry> out;
    DirChain chain;
    chain.insert(std::make_pair((u64)st.st_dev, (u64)st.st_ino));
    walk_dir(root, "", names, chain, out);
    return out;
}

void file_io::set_mtime(const std::string& path, u64 mtime_ns) {
    struct timespec ts[2];
    ts[0].tv_sec  = (time_t)(mtime_ns / 1000000000ULL);
    ts[0].tv_nsec = (long)(mtime_ns % 1000000000ULL);
    ts[1] = ts[0];
    if (utimensat(AT_FDCWD, path.c_str(), ts, 0) != 0) {
        throw local_error("cannot set mtime on", path, errno);
    }
}

void file_io::set_mode(const std::string& path, u32 mode) {
    if (::chmod(path.c_str(), (mode_t)(mode & 07777)) != 0) {
        throw local_error("cannot chmod", path, errno);
    }
}

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}

bool file_io::remove_if_exists(const std::string& path) {
    if (::unlink(path.c_str()) == 0) return true;
    if (errno == ENOENT) return false;
    throw local_error("cannot remove", path, errno);
}

void file_io::rename_file(const std::string& from, const std::string& to) {
    if (::rename(from.c_str(), to.c_str()) != 0) {
        throw TransferError(TransferErrc::LOCAL_IO,
            "cannot rename " + from + " to " + to + ": " + std::strerror(errno));
    }
}
