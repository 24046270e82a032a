#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <sys/types.h>
#include <core/types.hpp>

// Readable end of a copy. read() returns bytes read, 0 at end of stream,
// or a negative value on error.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual ssize_t read(char* buf, size_t len) = 0;
};

// Writable end of a copy. write() returns bytes written (possibly fewer
// than len) or a negative value on error.
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual ssize_t write(const char* buf, size_t len) = 0;
};

// Local file opened read-only. Closed on destruction.
class LocalFileSource : public ByteSource {
public:
    static Result<std::unique_ptr<ByteSource>> open(const std::string& path);
    ~LocalFileSource() override;

    ssize_t read(char* buf, size_t len) override;

    LocalFileSource(const LocalFileSource&) = delete;
    LocalFileSource& operator=(const LocalFileSource&) = delete;

private:
    explicit LocalFileSource(int fd) : fd_(fd) {}
    int fd_;
};

// Local file opened create|truncate|write. Closed on destruction.
class LocalFileSink : public ByteSink {
public:
    static Result<std::unique_ptr<ByteSink>> open(const std::string& path, int mode);
    ~LocalFileSink() override;

    ssize_t write(const char* buf, size_t len) override;

    LocalFileSink(const LocalFileSink&) = delete;
    LocalFileSink& operator=(const LocalFileSink&) = delete;

private:
    explicit LocalFileSink(int fd) : fd_(fd) {}
    int fd_;
};

struct CopyStats {
    int64_t bytes = 0;
    std::chrono::steady_clock::duration elapsed{};
    bool read_error = false;  // stream ended on a read error, not on EOF
};

// Copy everything readable from src to dst through a fixed COPY_BUF_SIZE
// buffer. A read error ends the copy exactly like end-of-stream: the result
// is still Ok and stats.read_error is set. A write error fails the copy.
Result<CopyStats> copy_stream(ByteSource& src, ByteSink& dst);
