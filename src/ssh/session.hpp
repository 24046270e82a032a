#pragma once

#include <string>
#include <chrono>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "auth.hpp"
#include "remote_fs.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

struct SessionTarget {
    std::string host;      // name or address, no port
    int port = 22;
    int timeout = 30;      // seconds, covers dial + handshake + auth
    HostKeyPolicy host_key_policy = HostKeyPolicy::InsecureAcceptAny;
};

// One TCP connection, one SSH session and one SFTP channel to a single host.
//
// establish() runs non-blocking against a deadline; once the SFTP channel is
// up the session switches to blocking mode, so file operations block the
// calling thread with no timeout.
class SftpSession : public RemoteFileSystem {
public:
    explicit SftpSession(const SessionTarget& target);
    ~SftpSession() override;

    SftpSession(const SftpSession&) = delete;
    SftpSession& operator=(const SftpSession&) = delete;

    Result<void> establish(const AuthPlan& auth, StatusCallback callback = nullptr);

    std::string peer_address() const override { return peer_; }
    Result<RemoteStat> stat(const std::string& path) override;
    Result<std::unique_ptr<ByteSource>> open_read(const std::string& path) override;
    Result<std::unique_ptr<ByteSink>> open_write(const std::string& path) override;
    void close() override;

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    LIBSSH2_SFTP* sftp_;
    socket_t sock_;
    std::string target_str_;
    std::string peer_;

    using Deadline = std::chrono::steady_clock::time_point;

    Result<void> handshake(Deadline deadline);
    Result<void> check_host_key();
    Result<void> userauth(const AuthPlan& auth, Deadline deadline, StatusCallback callback);
    Result<void> open_sftp(Deadline deadline);

    // Wait until the socket is ready in the direction libssh2 is blocked on.
    // False once the deadline has passed.
    bool wait_socket(Deadline deadline);

    std::string last_error() const;
};
