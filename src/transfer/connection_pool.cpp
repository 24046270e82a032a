#include "connection_pool.hpp"
#include "naming.hpp"
#include <core/log.hpp>
#include <set>
#include <fmt/format.h>

SessionDialer sftp_dialer() {
    return [](const SessionTarget& target, const AuthPlan& auth, StatusCallback callback)
               -> Result<std::unique_ptr<RemoteFileSystem>> {
        auto session = std::make_unique<SftpSession>(target);
        auto result = session->establish(auth, callback);
        if (result.is_err()) {
            return propagate<std::unique_ptr<RemoteFileSystem>>(result);
        }
        return Result<std::unique_ptr<RemoteFileSystem>>::Ok(std::move(session));
    };
}

ConnectionPool::ConnectionPool(PoolOptions options, SessionDialer dialer)
    : options_(options), dialer_(std::move(dialer)) {}

ConnectionPool::~ConnectionPool() {
    close_all();
}

Result<void> ConnectionPool::connect(const std::vector<std::string>& hosts,
                                     const AuthPlan& auth,
                                     StatusCallback callback) {
    if (hosts.empty()) {
        return Result<void>::Err("No hosts given", ErrorKind::Config);
    }

    std::set<std::string> seen;
    std::set<std::string> seen_peers;
    for (const auto& raw : hosts) {
        std::string host = normalize_host(raw, options_.default_port);
        if (!seen.insert(host).second) {
            hostcp_log("pool: skipping duplicate host " + host);
            continue;
        }

        auto hp = split_host_port(host);
        if (hp.is_err()) {
            close_all();
            return propagate<void>(hp);
        }

        SessionTarget target;
        target.host = hp.value.host;
        target.port = hp.value.port;
        target.timeout = options_.timeout;
        target.host_key_policy = options_.host_key_policy;

        auto dialed = dialer_(target, auth, callback);
        if (dialed.is_err()) {
            hostcp_log(fmt::format("pool: {} failed, aborting ({} already open): {}",
                                   host, sessions_.size(), dialed.error));
            close_all();
            return Result<void>::Err(host + ": " + dialed.error,
                                     dialed.kind == ErrorKind::None ? ErrorKind::Connect
                                                                    : dialed.kind);
        }

        // Aliases ("web1", "10.0.0.1") can reach the same machine; keep one
        std::string peer = dialed.value->peer_address();
        if (!peer.empty() && !seen_peers.insert(peer).second) {
            hostcp_log(fmt::format("pool: skipping {}, peer {} already connected", host, peer));
            dialed.value->close();
            continue;
        }
        sessions_.push_back({host, std::move(dialed.value)});
    }

    hostcp_log(fmt::format("pool: {} session(s) established", sessions_.size()));
    return Result<void>::Ok();
}

void ConnectionPool::close_all() {
    for (auto& s : sessions_) {
        if (s.fs) s.fs->close();
    }
    sessions_.clear();
}
