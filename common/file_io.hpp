#pragma once

// ============================================================
// file_io.hpp -- Memory-mapped reads and scratch directories
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- MmapReader: zero-copy read via mmap ----
class MmapReader {
public:
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

// ---- TempDir: scratch directory removed with everything in it ----
class TempDir {
public:
    // Creates <tmp>/<prefix>XXXXXX
    explicit TempDir(const std::string& prefix = "pbremote-");
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    std::string fname(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

// Final path component of a remote file name. Throws if the name has no
// usable component (empty, ".", "..").
std::string remote_basename(const std::string& remote_name);

// Read entire small file into memory
std::vector<u8> read_small_file(const std::string& path);

} // namespace file_io
