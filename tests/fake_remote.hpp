#pragma once

// In-process RemoteFileSystem backed by a local directory, plus a dialer and
// auth provider to drive ConnectionPool / TransferOrchestrator without SSH.

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <core/constants.hpp>
#include <ssh/auth.hpp>
#include <ssh/remote_fs.hpp>
#include <transfer/connection_pool.hpp>
#include <transfer/stream_copier.hpp>

namespace fs = std::filesystem;

class FakeRemote : public RemoteFileSystem {
public:
    FakeRemote(fs::path root, std::string peer, std::shared_ptr<std::atomic<int>> closes,
               bool reports_size = true)
        : root_(std::move(root)), peer_(std::move(peer)), closes_(std::move(closes)),
          reports_size_(reports_size) {}

    ~FakeRemote() override { close(); }

    std::string peer_address() const override { return peer_; }

    Result<RemoteStat> stat(const std::string& path) override {
        RemoteStat st;
        std::error_code ec;
        auto p = resolve(path);
        auto status = fs::status(p, ec);
        if (ec || !fs::exists(status)) return Result<RemoteStat>::Ok(st);
        st.exists = true;
        st.is_directory = fs::is_directory(status);
        if (!st.is_directory && reports_size_) {
            st.size_known = true;
            st.size = static_cast<int64_t>(fs::file_size(p));
        }
        return Result<RemoteStat>::Ok(st);
    }

    Result<std::unique_ptr<ByteSource>> open_read(const std::string& path) override {
        auto r = LocalFileSource::open(resolve(path).string());
        if (r.is_err()) r.kind = ErrorKind::RemoteIo;
        return r;
    }

    Result<std::unique_ptr<ByteSink>> open_write(const std::string& path) override {
        auto r = LocalFileSink::open(resolve(path).string(), REMOTE_FILE_MODE);
        if (r.is_err()) r.kind = ErrorKind::RemoteIo;
        return r;
    }

    void close() override {
        if (open_) {
            open_ = false;
            ++*closes_;
        }
    }

private:
    fs::path root_;
    std::string peer_;
    std::shared_ptr<std::atomic<int>> closes_;
    bool reports_size_;
    bool open_ = true;

    fs::path resolve(const std::string& path) const {
        std::string rel = path;
        while (!rel.empty() && rel.front() == '/') rel.erase(0, 1);
        return root_ / rel;
    }
};

// One simulated host: a directory acting as its filesystem and the peer
// address its connection reports.
struct FakeHost {
    fs::path root;
    std::string peer;
    bool reports_size = true;  // false: stat leaves the size unknown
};

// Dialer over a table of "host:port" -> FakeHost. Hosts not in the table
// (or listed as unreachable) fail to connect.
class FakeNetwork {
public:
    std::map<std::string, FakeHost> hosts;
    std::set<std::string> unreachable;
    std::shared_ptr<std::atomic<int>> dials = std::make_shared<std::atomic<int>>(0);
    std::shared_ptr<std::atomic<int>> closes = std::make_shared<std::atomic<int>>(0);
    std::vector<SessionTarget> targets;  // every target dialed, in order

    SessionDialer dialer() {
        return [this](const SessionTarget& target, const AuthPlan& /*auth*/,
                      StatusCallback /*callback*/) -> Result<std::unique_ptr<RemoteFileSystem>> {
            ++*dials;
            targets.push_back(target);
            std::string key = target.host + ":" + std::to_string(target.port);
            auto it = hosts.find(key);
            if (it == hosts.end() || unreachable.count(key)) {
                return Result<std::unique_ptr<RemoteFileSystem>>::Err(
                    "Failed to connect to " + key + ": connection refused", ErrorKind::Connect);
            }
            return Result<std::unique_ptr<RemoteFileSystem>>::Ok(
                std::make_unique<FakeRemote>(it->second.root, it->second.peer, closes,
                                             it->second.reports_size));
        };
    }
};

class StaticAuthProvider : public AuthProvider {
public:
    bool fail = false;
    int calls = 0;

    Result<AuthPlan> resolve() override {
        ++calls;
        if (fail) return Result<AuthPlan>::Err("no credentials", ErrorKind::Auth);
        AuthPlan plan;
        plan.user = "deploy";
        plan.methods.push_back({AuthMethodKind::Password, "secret", "", ""});
        return Result<AuthPlan>::Ok(plan);
    }
};
