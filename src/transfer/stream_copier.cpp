#include "stream_copier.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

// ── Local files ────────────────────────────────────────────

Result<std::unique_ptr<ByteSource>> LocalFileSource::open(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Result<std::unique_ptr<ByteSource>>::Err(
            fmt::format("Cannot open {}: {}", path, std::strerror(errno)),
            ErrorKind::LocalIo);
    }
    return Result<std::unique_ptr<ByteSource>>::Ok(
        std::unique_ptr<ByteSource>(new LocalFileSource(fd)));
}

LocalFileSource::~LocalFileSource() {
    if (fd_ >= 0) ::close(fd_);
}

ssize_t LocalFileSource::read(char* buf, size_t len) {
    ssize_t n;
    do {
        n = ::read(fd_, buf, len);
    } while (n < 0 && errno == EINTR);
    return n;
}

Result<std::unique_ptr<ByteSink>> LocalFileSink::open(const std::string& path, int mode) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                    static_cast<mode_t>(mode));
    if (fd < 0) {
        return Result<std::unique_ptr<ByteSink>>::Err(
            fmt::format("Cannot create {}: {}", path, std::strerror(errno)),
            ErrorKind::LocalIo);
    }
    return Result<std::unique_ptr<ByteSink>>::Ok(
        std::unique_ptr<ByteSink>(new LocalFileSink(fd)));
}

LocalFileSink::~LocalFileSink() {
    if (fd_ >= 0) ::close(fd_);
}

ssize_t LocalFileSink::write(const char* buf, size_t len) {
    ssize_t n;
    do {
        n = ::write(fd_, buf, len);
    } while (n < 0 && errno == EINTR);
    return n;
}

// ── Copy loop ──────────────────────────────────────────────

Result<CopyStats> copy_stream(ByteSource& src, ByteSink& dst) {
    CopyStats stats;
    char buf[COPY_BUF_SIZE];
    auto start = std::chrono::steady_clock::now();

    for (;;) {
        ssize_t n = src.read(buf, sizeof(buf));
        if (n < 0) {
            // Treated as end of stream; the transfer reports what was moved.
            stats.read_error = true;
            hostcp_log(fmt::format("copy_stream: read error after {} bytes, stopping",
                                   stats.bytes));
            break;
        }
        if (n == 0) break;

        ssize_t written = 0;
        while (written < n) {
            ssize_t w = dst.write(buf + written, static_cast<size_t>(n - written));
            if (w <= 0) {
                stats.elapsed = std::chrono::steady_clock::now() - start;
                return Result<CopyStats>::Err(
                    fmt::format("Write failed after {} bytes", stats.bytes + written),
                    ErrorKind::LocalIo);
            }
            written += w;
        }
        stats.bytes += n;
    }

    stats.elapsed = std::chrono::steady_clock::now() - start;
    return Result<CopyStats>::Ok(stats);
}
