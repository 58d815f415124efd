// ============================================================
// file_io.cpp -- Memory-mapped reads and scratch directories
// ============================================================

#include "file_io.hpp"
#include "logger.hpp"
#include <algorithm>
#include <vector>
#include <fstream>
#include <cstring>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <filesystem>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace file_io;

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path) {
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open file: " + path + ": " + strerror(errno));
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("fstat failed: " + path);
    }
    size_ = (u64)st.st_size;

    if (size_ == 0) {
        data_ = nullptr;
        return;
    }

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("mmap failed: " + path);
    }
    madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    madvise(p, std::min((size_t)size_, (size_t)4*1024*1024), MADV_WILLNEED);
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
// TempDir
// ============================================================

TempDir::TempDir(const std::string& prefix) {
    std::string templ = (fs::temp_directory_path() / (prefix + "XXXXXX")).string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (!::mkdtemp(buf.data())) {
        throw std::runtime_error("mkdtemp(" + templ + ") failed: " + strerror(errno));
    }
    path_ = buf.data();
    LOG_DEBUG("TempDir: created " + path_.string());
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        LOG_WARN("TempDir: cannot remove " + path_.string() + ": " + ec.message());
    }
}

// ============================================================
// Utility functions
// ============================================================

std::string file_io::remote_basename(const std::string& remote_name) {
    fs::path name = fs::path(remote_name).filename();
    std::string s = name.string();
    if (s.empty() || s == "." || s == "..") {
        throw std::runtime_error("Unusable remote file name: '" + remote_name + "'");
    }
    return s;
}

std::vector<u8> file_io::read_small_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return {};
    f.seekg(0, std::ios::end);
    size_t sz = (size_t)f.tellg();
    f.seekg(0, std::ios::beg);
    std::vector<u8> buf(sz);
    f.read((char*)buf.data(), sz);
    return buf;
}
