#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <chrono>
#include <cstdint>

// Error categories. The first group aborts a whole run, the second is
// confined to a single host's transfer.
enum class ErrorKind {
    None,
    // Fatal / batch-aborting
    Config,
    Auth,
    Connect,
    LocalPath,
    LocalPathIsFile,
    Unsupported,
    // Host-local
    RemoteIsDirectory,
    TooLarge,
    AlreadyExists,
    RemoteIo,
    LocalIo,
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err, ErrorKind kind = ErrorKind::None) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err, ErrorKind kind = ErrorKind::None) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Forward an error from one Result type into another
template <typename To, typename From>
Result<To> propagate(const Result<From>& from) {
    return Result<To>::Err(from.error, from.kind);
}

// ── Configuration structures ───────────────────────────────

enum class HostKeyPolicy {
    InsecureAcceptAny,  // host identity is NOT verified
};

struct AuthConfig {
    std::string user;
    std::optional<std::string> password;
    std::optional<std::string> private_key;
    std::optional<std::string> public_key;
    std::optional<std::string> passphrase;
};

struct ServerConfig {
    int default_port = 22;
    int timeout = 30;
    HostKeyPolicy host_key_policy = HostKeyPolicy::InsecureAcceptAny;
};

struct TransferConfig {
    int64_t max_size = 1099511627776LL;
};

// ── Transfer model ─────────────────────────────────────────

enum class TransferDirection {
    Fetch,  // remote -> local (GET)
    Send,   // local -> remote (PUT)
};

struct TransferRequest {
    TransferDirection direction = TransferDirection::Fetch;
    std::string local_path;
    std::string remote_path;
    std::vector<std::string> hosts;
    bool overwrite = false;
    bool recursive = false;  // never supported, rejected during validation
};

struct TransferOutcome {
    std::string source;
    std::string destination;
    int64_t bytes = 0;
    std::chrono::steady_clock::duration elapsed{};
};

struct HostFailure {
    std::string host;
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;

// Receives host-local failures as they happen (called from transfer threads)
using ErrorSink = std::function<void(const HostFailure&)>;
