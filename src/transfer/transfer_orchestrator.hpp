#pragma once

#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <ssh/auth.hpp>
#include <ssh/remote_fs.hpp>
#include "connection_pool.hpp"
#include "fan_out.hpp"
#include "result_store.hpp"

struct TransferReport {
    ResultStore outcomes;               // keyed by peer address
    std::vector<HostFailure> failures;  // host-local failures, in completion order
    size_t host_count = 0;              // sessions that received a task

    bool all_succeeded() const { return failures.empty() && outcomes.size() == host_count; }
};

// Runs one TransferRequest against every host:
//
//   validated -> connected -> transferring -> completed
//
// Validation touches only the local filesystem, so a bad local path never
// opens a connection. Authentication or connection failures abort the run.
// Once connected, one thread per host performs the fetch or send; a failing
// host is reported to the error sink and leaves no outcome, without touching
// its siblings. A host whose thread cannot be started fails with LocalIo.
// run() returns after every thread has joined and the pool has been closed.
class TransferOrchestrator {
public:
    TransferOrchestrator(ConnectionPool& pool, AuthProvider& auth, int64_t max_transfer_size);

    void set_status_callback(StatusCallback callback) { status_ = std::move(callback); }
    // Called from transfer threads, possibly concurrently, with no
    // orchestrator lock held
    void set_error_sink(ErrorSink sink) { error_sink_ = std::move(sink); }
    void set_thread_spawner(ThreadSpawner spawn) { spawn_ = std::move(spawn); }

    Result<TransferReport> run(const TransferRequest& request);

    // Local-path preconditions. For fetch this creates a missing destination
    // directory.
    static Result<void> validate(const TransferRequest& request);

    // Single-host operations, run on the transfer thread for that host
    Result<TransferOutcome> fetch(RemoteFileSystem& remote, const TransferRequest& request) const;
    Result<TransferOutcome> send(RemoteFileSystem& remote, const TransferRequest& request) const;

private:
    ConnectionPool& pool_;
    AuthProvider& auth_;
    int64_t max_transfer_size_;
    StatusCallback status_;
    ErrorSink error_sink_;
    ThreadSpawner spawn_ = spawn_thread;

    void transfer_all(const TransferRequest& request, TransferReport& report);
    void report_failure(TransferReport& report, std::mutex& failures_mutex,
                        HostFailure failure) const;
    void emit(const std::string& msg) const;
};
