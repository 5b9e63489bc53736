#pragma once

// ============================================================
// file_io.hpp -- Local file access for transfers
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- MmapReader: zero-copy read via mmap ----
class MmapReader {
public:
    // Throws TransferError LOCAL_PATH_MISSING / LOCAL_IO
    explicit MmapReader(const std::string& path);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    const char* data() const { return data_; }
    u64 size() const { return size_; }

    // Get pointer to chunk at given offset, clamped to available bytes
    const char* chunk_ptr(u64 offset) const {
        if (offset >= size_) return nullptr;
        return data_ + offset;
    }

    u64 chunk_len(u64 offset, u64 max_len) const {
        if (offset >= size_) return 0;
        u64 remaining = size_ - offset;
        return remaining < max_len ? remaining : max_len;
    }

    void close();

private:
    const char* data_{nullptr};
    u64 size_{0};
    int fd_{-1};
};

// ---- FileWriter: sequential writes into a freshly truncated file ----
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Creates parent directories; throws TransferError LOCAL_IO
    void open(const std::string& path, u32 mode = 0644);

    void write(const void* data, size_t len);

    // Flush and close; throws if the final close reports an error
    void close();

    bool is_open() const { return fd_ >= 0; }
    u64 written() const { return written_; }
    const std::string& path() const { return path_; }

private:
    int fd_{-1};
    u64 written_{0};
    std::string path_;
};

// ---- Local metadata ----

struct LocalStat {
    bool exists{false};
    bool is_dir{false};
    bool is_regular{false};
    u32  mode{0};       // permission bits only
    u64  size{0};
    i64  mtime{0};      // seconds since epoch
};

// Follows symlinks; a missing path returns exists == false
LocalStat stat_local(const std::string& path);

struct LocalEntry {
    std::string rel_path;   // '/'-separated, relative to the walk root
    LocalStat   st;
    std::string error;      // set when the entry could not be read or listed
};

// Recursive pre-order walk with siblings sorted by name, so directories
// precede their contents. Symlinks are followed; a directory link into its
// own ancestry is reported with error set, as is a directory that cannot be
// listed, and the walk carries on. Throws only when root cannot be listed.
std::vector<LocalEntry> walk_local(const std::string& root);

// ---- Utility functions ----

// Set file modification time (nanoseconds since epoch)
void set_mtime(const std::string& path, u64 mtime_ns);

// Apply permission bits (mode & 07777)
void set_mode(const std::string& path, u32 mode);

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Remove a file, ignoring a missing one; returns true if it was removed
bool remove_if_exists(const std::string& path);

// Atomic rename; throws TransferError LOCAL_IO
void rename_file(const std::string& from, const std::string& to);

} // namespace file_io
