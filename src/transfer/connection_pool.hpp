#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <ssh/auth.hpp>
#include <ssh/remote_fs.hpp>
#include <ssh/session.hpp>

// Opens one authenticated session for a target. Swappable so the pool can
// be driven without a network.
using SessionDialer = std::function<Result<std::unique_ptr<RemoteFileSystem>>(
    const SessionTarget& target, const AuthPlan& auth, StatusCallback callback)>;

// Dialer producing libssh2-backed SftpSessions.
SessionDialer sftp_dialer();

struct PoolOptions {
    int default_port = 22;
    int timeout = 30;
    HostKeyPolicy host_key_policy = HostKeyPolicy::InsecureAcceptAny;
};

struct PooledSession {
    std::string host;  // normalized "host:port" as dialed
    std::unique_ptr<RemoteFileSystem> fs;
};

// Owns one session per target host.
//
// connect() dials hosts one after another and is all-or-nothing: the first
// failure closes whatever was already opened and is returned as-is.
// Hosts repeated verbatim are dialed once; a host whose connection lands on
// a peer address already in the pool is closed and dropped.
// Sessions are closed exactly once, by close_all() or the destructor.
class ConnectionPool {
public:
    explicit ConnectionPool(PoolOptions options, SessionDialer dialer = sftp_dialer());
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    Result<void> connect(const std::vector<std::string>& hosts,
                         const AuthPlan& auth,
                         StatusCallback callback = nullptr);

    void close_all();

    std::vector<PooledSession>& sessions() { return sessions_; }
    size_t size() const { return sessions_.size(); }

private:
    PoolOptions options_;
    SessionDialer dialer_;
    std::vector<PooledSession> sessions_;
};
