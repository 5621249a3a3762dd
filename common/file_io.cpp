// ============================================================
// file_io.cpp -- Download sinks and read-side file helpers
// ============================================================

#include "file_io.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

#ifndef _WIN32
#  include <sys/mman.h>
#  include <sys/stat.h>
#  include <fcntl.h>
#  include <unistd.h>
#endif

using namespace file_io;

// ============================================================
// MemorySink
// ============================================================

void MemorySink::do_write(u64 offset, const u8* data, size_t len) {
    if (offset + len > buf_.size()) {
        buf_.resize((size_t)(offset + len));
    }
    std::memcpy(buf_.data() + offset, data, len);
}

// ============================================================
// FileSink
// ============================================================

FileSink::~FileSink() {
    close_handle();
}

bool FileSink::is_open() const {
#ifdef _WIN32
    return handle_ != INVALID_HANDLE_VALUE;
#else
    return fd_ >= 0;
#endif
}

void FileSink::open() {
    ensure_parent_dirs(path_);
#ifdef _WIN32
    handle_ = CreateFileA(path_.c_str(), GENERIC_WRITE, 0, nullptr,
                          CREATE_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (handle_ == INVALID_HANDLE_VALUE) {
        throw std::runtime_error("Cannot create file: " + path_);
    }
#else
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot create file: " + path_ + ": " + strerror(errno));
    }
#endif
}

void FileSink::do_write(u64 offset, const u8* data, size_t len) {
    if (!is_open()) {
        throw std::runtime_error("FileSink::write_at on closed file: " + path_);
    }
#ifdef _WIN32
    OVERLAPPED ov{};
    ov.Offset     = (DWORD)(offset & 0xFFFFFFFF);
    ov.OffsetHigh = (DWORD)(offset >> 32);
    DWORD written = 0;
    if (!WriteFile(handle_, data, (DWORD)len, &written, &ov) || written != len) {
        throw std::runtime_error("WriteFile failed: " + path_);
    }
#else
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::pwrite(fd_, data + done, len - done, (off_t)(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("pwrite failed: " + path_ + ": " + strerror(errno));
        }
        done += (size_t)n;
    }
#endif
}

void FileSink::finalize() {
#ifndef _WIN32
    if (fd_ >= 0 && ::fsync(fd_) != 0) {
        int err = errno;
        close_handle();
        throw std::runtime_error("fsync failed: " + path_ + ": " + strerror(err));
    }
#endif
    close_handle();
}

void FileSink::close_handle() {
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) { CloseHandle(handle_); handle_ = INVALID_HANDLE_VALUE; }
#else
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
#endif
}

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path) {
#ifdef _WIN32
    file_handle_ = CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ,
                               nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (file_handle_ == INVALID_HANDLE_VALUE) {
        throw std::runtime_error("Cannot open file: " + path);
    }

    LARGE_INTEGER sz{};
    GetFileSizeEx(file_handle_, &sz);
    size_ = (u64)sz.QuadPart;
    if (size_ == 0) return;

    map_handle_ = CreateFileMappingA(file_handle_, nullptr, PAGE_READONLY, 0, 0, nullptr);
    if (!map_handle_) {
        CloseHandle(file_handle_);
        throw std::runtime_error("CreateFileMapping failed: " + path);
    }
    data_ = static_cast<const u8*>(MapViewOfFile(map_handle_, FILE_MAP_READ, 0, 0, 0));
    if (!data_) {
        CloseHandle(map_handle_);
        CloseHandle(file_handle_);
        throw std::runtime_error("MapViewOfFile failed: " + path);
    }
#else
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open file: " + path);
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        ::close(fd_);
        throw std::runtime_error("fstat failed: " + path);
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd_);
        throw std::runtime_error("Not a regular file: " + path);
    }
    size_ = (u64)st.st_size;
    if (size_ == 0) return;

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        ::close(fd_);
        throw std::runtime_error("mmap failed: " + path);
    }
    data_ = static_cast<const u8*>(p);
#endif
}

MmapReader::~MmapReader() {
    close();
}

void MmapReader::close() {
#ifdef _WIN32
    if (data_) { UnmapViewOfFile(data_); data_ = nullptr; }
    if (map_handle_) { CloseHandle(map_handle_); map_handle_ = nullptr; }
    if (file_handle_ != INVALID_HANDLE_VALUE) { CloseHandle(file_handle_); file_handle_ = INVALID_HANDLE_VALUE; }
#else
    if (data_ && size_ > 0) { munmap((void*)data_, (size_t)size_); data_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
#endif
    size_ = 0;
}

// ============================================================
// Utility functions
// ============================================================

fs::path file_io::proto_to_fspath(const fs::path& root_dir, const std::string& remote_path) {
    // Device paths are absolute ("/APM/LOGS/1.BIN") or virtual ("@PARAM/param.pck").
    std::string rel = remote_path;
    while (!rel.empty() && (rel[0] == '/' || rel[0] == '\\')) {
        rel.erase(0, 1);
    }
    if (rel.empty()) {
        throw std::runtime_error("Empty remote path");
    }
    // Query suffixes ("?withdefaults=1") select a variant of a virtual file
    auto q = rel.find('?');
    if (q != std::string::npos) rel.erase(q);

    fs::path full = (root_dir / fs::path(rel)).lexically_normal();
    fs::path root = root_dir.lexically_normal();

    auto rel_to_root = full.lexically_relative(root);
    if (rel_to_root.empty() || *rel_to_root.begin() == "..") {
        throw std::runtime_error("Path escapes root directory: " + remote_path);
    }
    return full;
}

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}
