#pragma once

// ============================================================
// file_io.hpp -- Download sinks and read-side file helpers
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- ByteSink: random-access destination of one download ----
//
// Writes may land at any offset. The stream cursor follows the
// position after the last write that asked to move it, like the
// position of a seekable stream that is re-seeked after gap fills.
class ByteSink {
public:
    virtual ~ByteSink() = default;

    // Prepare the destination; throws std::runtime_error on failure
    virtual void open() = 0;

    void write_at(u64 offset, const u8* data, size_t len, bool move_cursor) {
        do_write(offset, data, len);
        if (offset + len > extent_) extent_ = offset + len;
        if (move_cursor) cursor_ = offset + len;
    }

    u64 cursor() const { return cursor_; }

    // Highest byte offset written so far, exclusive
    u64 extent() const { return extent_; }

    // Flush and close. Called once, on success only.
    virtual void finalize() = 0;

    virtual std::string describe() const = 0;

protected:
    virtual void do_write(u64 offset, const u8* data, size_t len) = 0;

private:
    u64 cursor_{0};
    u64 extent_{0};
};

// ---- MemorySink: download into a growable buffer ----
class MemorySink : public ByteSink {
public:
    void open() override { buf_.clear(); }
    void finalize() override { buf_.resize(extent()); }
    std::string describe() const override { return "memory"; }

    const std::vector<u8>& bytes() const { return buf_; }

protected:
    void do_write(u64 offset, const u8* data, size_t len) override;

private:
    std::vector<u8> buf_;
};

// ---- FileSink: download straight into a local file ----
class FileSink : public ByteSink {
public:
    explicit FileSink(std::string path) : path_(std::move(path)) {}
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void open() override;
    void finalize() override;
    std::string describe() const override { return path_; }

    const std::string& path() const { return path_; }
    bool is_open() const;

protected:
    void do_write(u64 offset, const u8* data, size_t len) override;

private:
    void close_handle();

    std::string path_;
#ifdef _WIN32
    HANDLE handle_{INVALID_HANDLE_VALUE};
#else
    int    fd_{-1};
#endif
};

// ---- MmapReader: zero-copy read of a served file ----
class MmapReader {
public:
    explicit MmapReader(const std::string& path);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    const u8* data() const { return data_; }
    u64 size() const { return size_; }

    // Bytes available from offset, clamped to max_len
    u64 chunk_len(u64 offset, u64 max_len) const {
        if (offset >= size_) return 0;
        u64 remaining = size_ - offset;
        return remaining < max_len ? remaining : max_len;
    }

    void close();

private:
    const u8* data_{nullptr};
    u64 size_{0};

#ifdef _WIN32
    HANDLE file_handle_{INVALID_HANDLE_VALUE};
    HANDLE map_handle_{nullptr};
#else
    int fd_{-1};
#endif
};

// Resolve a remote path below root_dir; throws if it escapes root_dir
fs::path proto_to_fspath(const fs::path& root_dir, const std::string& remote_path);

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

} // namespace file_io
