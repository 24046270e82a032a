#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <core/types.hpp>
#include <transfer/stream_copier.hpp>

struct RemoteStat {
    bool exists = false;
    bool is_directory = false;
    bool size_known = false;  // servers may omit the size attribute
    int64_t size = 0;
};

// File-protocol view of one connected host. Each instance is used by
// exactly one transfer thread at a time.
class RemoteFileSystem {
public:
    virtual ~RemoteFileSystem() = default;

    // "ip:port" of the peer as seen on the connection
    virtual std::string peer_address() const = 0;

    // exists=false (not an error) when the path does not exist
    virtual Result<RemoteStat> stat(const std::string& path) = 0;

    virtual Result<std::unique_ptr<ByteSource>> open_read(const std::string& path) = 0;

    // create | truncate | write
    virtual Result<std::unique_ptr<ByteSink>> open_write(const std::string& path) = 0;

    // Release the connection. Idempotent.
    virtual void close() = 0;
};
