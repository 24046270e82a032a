#include "transfer_orchestrator.hpp"
#include "fan_out.hpp"
#include "naming.hpp"
#include "stream_copier.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <filesystem>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

// Closes the pool on every exit path out of run()
struct ScopedRelease {
    ConnectionPool& pool;
    ~ScopedRelease() { pool.close_all(); }
};

const char* direction_name(TransferDirection direction) {
    return direction == TransferDirection::Fetch ? "GET" : "PUT";
}

}  // namespace

TransferOrchestrator::TransferOrchestrator(ConnectionPool& pool, AuthProvider& auth,
                                           int64_t max_transfer_size)
    : pool_(pool), auth_(auth), max_transfer_size_(max_transfer_size) {}

void TransferOrchestrator::emit(const std::string& msg) const {
    hostcp_log("transfer: " + msg);
    if (status_) status_(msg);
}

// ── Validation ─────────────────────────────────────────────

Result<void> TransferOrchestrator::validate(const TransferRequest& request) {
    if (request.recursive) {
        return Result<void>::Err("Recursive transfer is not supported", ErrorKind::Unsupported);
    }
    if (request.hosts.empty()) {
        return Result<void>::Err("No hosts given", ErrorKind::Config);
    }
    if (request.local_path.empty() || request.remote_path.empty()) {
        return Result<void>::Err("Both a local and a remote path are required", ErrorKind::Config);
    }

    std::error_code ec;
    auto status = fs::status(request.local_path, ec);
    bool exists = !ec && fs::exists(status);

    if (request.direction == TransferDirection::Fetch) {
        if (!exists) {
            fs::create_directories(request.local_path, ec);
            if (ec) {
                return Result<void>::Err(
                    fmt::format("Cannot create local directory {}: {}",
                                request.local_path, ec.message()),
                    ErrorKind::LocalPath);
            }
            fs::permissions(request.local_path, static_cast<fs::perms>(LOCAL_DIR_MODE),
                            fs::perm_options::replace, ec);
            if (ec) {
                hostcp_log("transfer: cannot set mode on " + request.local_path + ": " + ec.message());
            }
            return Result<void>::Ok();
        }
        if (!fs::is_directory(status)) {
            return Result<void>::Err("Local path cannot be a file: " + request.local_path,
                                     ErrorKind::LocalPathIsFile);
        }
        return Result<void>::Ok();
    }

    if (!exists) {
        return Result<void>::Err(
            fmt::format("Local file {} not found{}", request.local_path,
                        ec ? ": " + ec.message() : ""),
            ErrorKind::LocalPath);
    }
    if (fs::is_directory(status)) {
        return Result<void>::Err(
            "Local path is a directory, recursive transfer is not supported: " + request.local_path,
            ErrorKind::Unsupported);
    }
    if (!fs::is_regular_file(status)) {
        return Result<void>::Err("Local path is not a regular file: " + request.local_path,
                                 ErrorKind::LocalPath);
    }
    return Result<void>::Ok();
}

// ── Run ────────────────────────────────────────────────────

Result<TransferReport> TransferOrchestrator::run(const TransferRequest& request) {
    ScopedRelease release{pool_};

    auto valid = validate(request);
    if (valid.is_err()) {
        hostcp_log("transfer: validation failed: " + valid.error);
        return propagate<TransferReport>(valid);
    }

    auto plan = auth_.resolve();
    if (plan.is_err()) {
        hostcp_log("transfer: auth resolution failed: " + plan.error);
        return Result<TransferReport>::Err(plan.error, ErrorKind::Auth);
    }

    auto connected = pool_.connect(request.hosts, plan.value, status_);
    if (connected.is_err()) {
        return propagate<TransferReport>(connected);
    }

    emit(fmt::format("{} {} <-> {} on {} host(s)", direction_name(request.direction),
                     request.local_path, request.remote_path, pool_.size()));

    TransferReport report;
    transfer_all(request, report);

    emit(fmt::format("done: {} succeeded, {} failed",
                     report.outcomes.size(), report.failures.size()));
    return Result<TransferReport>::Ok(std::move(report));
}

void TransferOrchestrator::transfer_all(const TransferRequest& request, TransferReport& report) {
    std::mutex failures_mutex;
    auto& sessions = pool_.sessions();
    report.host_count = sessions.size();

    auto key_of = [](const PooledSession& session) {
        std::string key = session.fs->peer_address();
        return key.empty() ? session.host : key;
    };

    auto fanned = fan_out(sessions.size(), [&](size_t i) {
        RemoteFileSystem& remote = *sessions[i].fs;
        std::string key = key_of(sessions[i]);

        Result<TransferOutcome> result = Result<TransferOutcome>::Err("not started");
        try {
            result = (request.direction == TransferDirection::Fetch)
                         ? fetch(remote, request)
                         : send(remote, request);
        } catch (const std::exception& e) {
            result = Result<TransferOutcome>::Err(
                std::string("Unexpected error: ") + e.what(), ErrorKind::RemoteIo);
        }

        if (result.is_err()) {
            report_failure(report, failures_mutex, {key, result.kind, result.error});
            return;
        }

        hostcp_log(fmt::format("transfer: {} {} => {} {} bytes", key,
                               result.value.source, result.value.destination,
                               result.value.bytes));
        report.outcomes.record(key, result.value);
    }, spawn_);

    for (size_t i = fanned.started; i < sessions.size(); i++) {
        report_failure(report, failures_mutex,
                       {key_of(sessions[i]), ErrorKind::LocalIo,
                        "cannot start transfer thread: " + fanned.error});
    }
}

void TransferOrchestrator::report_failure(TransferReport& report, std::mutex& failures_mutex,
                                          HostFailure failure) const {
    hostcp_log(fmt::format("transfer: {} failed ({}): {}", failure.host,
                           error_kind_name(failure.kind), failure.message));
    {
        std::lock_guard<std::mutex> lock(failures_mutex);
        report.failures.push_back(failure);
    }
    if (error_sink_) error_sink_(failure);
}

// ── Per-host operations ────────────────────────────────────

Result<TransferOutcome> TransferOrchestrator::fetch(RemoteFileSystem& remote,
                                                    const TransferRequest& request) const {
    auto st = remote.stat(request.remote_path);
    if (st.is_err()) return propagate<TransferOutcome>(st);
    if (!st.value.exists) {
        return Result<TransferOutcome>::Err("Remote file not found: " + request.remote_path,
                                            ErrorKind::RemoteIo);
    }
    if (st.value.is_directory) {
        return Result<TransferOutcome>::Err("Remote dir get is not supported",
                                            ErrorKind::RemoteIsDirectory);
    }
    if (!st.value.size_known) {
        return Result<TransferOutcome>::Err(
            "Remote file size unknown, cannot enforce max transfer size: " + request.remote_path,
            ErrorKind::RemoteIo);
    }
    if (st.value.size > max_transfer_size_) {
        return Result<TransferOutcome>::Err(
            fmt::format("Max transfer size is set to {}", max_transfer_size_),
            ErrorKind::TooLarge);
    }

    auto src = remote.open_read(request.remote_path);
    if (src.is_err()) return propagate<TransferOutcome>(src);

    std::string name = fetch_destination_name(path_basename(request.remote_path),
                                              remote.peer_address());
    std::string destination = (fs::path(request.local_path) / name).string();

    auto dst = LocalFileSink::open(destination, LOCAL_FILE_MODE);
    if (dst.is_err()) return propagate<TransferOutcome>(dst);

    auto copied = copy_stream(*src.value, *dst.value);
    if (copied.is_err()) {
        return Result<TransferOutcome>::Err(destination + ": " + copied.error, ErrorKind::LocalIo);
    }

    TransferOutcome outcome;
    outcome.source = request.remote_path;
    outcome.destination = destination;
    outcome.bytes = copied.value.bytes;
    outcome.elapsed = copied.value.elapsed;
    return Result<TransferOutcome>::Ok(outcome);
}

Result<TransferOutcome> TransferOrchestrator::send(RemoteFileSystem& remote,
                                                   const TransferRequest& request) const {
    std::string target = send_remote_target(request.remote_path, request.local_path);

    auto st = remote.stat(target);
    if (st.is_err()) return propagate<TransferOutcome>(st);
    if (st.value.exists && !request.overwrite) {
        return Result<TransferOutcome>::Err("Remote file exists: " + target,
                                            ErrorKind::AlreadyExists);
    }

    auto src = LocalFileSource::open(request.local_path);
    if (src.is_err()) return propagate<TransferOutcome>(src);

    auto dst = remote.open_write(target);
    if (dst.is_err()) return propagate<TransferOutcome>(dst);

    auto copied = copy_stream(*src.value, *dst.value);
    if (copied.is_err()) {
        return Result<TransferOutcome>::Err(target + ": " + copied.error, ErrorKind::RemoteIo);
    }

    TransferOutcome outcome;
    outcome.source = request.local_path;
    outcome.destination = target;
    outcome.bytes = copied.value.bytes;
    outcome.elapsed = copied.value.elapsed;
    return Result<TransferOutcome>::Ok(outcome);
}
