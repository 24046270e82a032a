#include "session.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <mutex>
#include <algorithm>
#include <cstring>
#include <fmt/format.h>

// libssh2_init is not thread-safe; run it once per process.
static Result<void> ensure_libssh2_init() {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, [] { rc = libssh2_init(0); });
    if (rc != 0) {
        return Result<void>::Err("Failed to initialize libssh2", ErrorKind::Connect);
    }
    return Result<void>::Ok();
}

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
}

// ── SFTP file handles ──────────────────────────────────────

class SftpFileSource : public ByteSource {
public:
    explicit SftpFileSource(LIBSSH2_SFTP_HANDLE* handle) : handle_(handle) {}
    ~SftpFileSource() override { libssh2_sftp_close(handle_); }

    ssize_t read(char* buf, size_t len) override {
        return libssh2_sftp_read(handle_, buf, len);
    }

private:
    LIBSSH2_SFTP_HANDLE* handle_;
};

class SftpFileSink : public ByteSink {
public:
    explicit SftpFileSink(LIBSSH2_SFTP_HANDLE* handle) : handle_(handle) {}
    ~SftpFileSink() override { libssh2_sftp_close(handle_); }

    ssize_t write(const char* buf, size_t len) override {
        return libssh2_sftp_write(handle_, buf, len);
    }

private:
    LIBSSH2_SFTP_HANDLE* handle_;
};

// ── Lifecycle ──────────────────────────────────────────────

SftpSession::SftpSession(const SessionTarget& target)
    : target_(target), session_(nullptr), sftp_(nullptr),
      sock_(HOSTCP_INVALID_SOCKET),
      target_str_(fmt::format("{}:{}", target.host, target.port)) {
}

SftpSession::~SftpSession() {
    close();
}

Result<void> SftpSession::establish(const AuthPlan& auth, StatusCallback callback) {
    if (callback) callback("Connecting to " + target_str_ + "...");

    auto init = ensure_libssh2_init();
    if (init.is_err()) return init;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(target_.timeout);

    auto dial = platform::dial_tcp(target_.host, target_.port, target_.timeout * 1000);
    if (dial.is_err()) {
        hostcp_log("session: " + dial.error);
        return propagate<void>(dial);
    }
    sock_ = dial.value;
    peer_ = platform::peer_address(sock_);
    hostcp_log(fmt::format("session: {} connected, peer {}", target_str_, peer_));

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        close();
        return Result<void>::Err("Failed to create SSH session for " + target_str_,
                                 ErrorKind::Connect);
    }
    libssh2_session_set_blocking(session_, 0);

    auto shaken = handshake(deadline);
    if (shaken.is_err()) { close(); return shaken; }

    auto host_key = check_host_key();
    if (host_key.is_err()) { close(); return host_key; }

    auto authed = userauth(auth, deadline, callback);
    if (authed.is_err()) { close(); return authed; }

    auto sftp = open_sftp(deadline);
    if (sftp.is_err()) { close(); return sftp; }

    // Transfers block their own thread from here on
    libssh2_session_set_blocking(session_, 1);

    if (callback) callback("Connected to " + target_str_);
    return Result<void>::Ok();
}

Result<void> SftpSession::handshake(Deadline deadline) {
    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket(deadline)) {
            return Result<void>::Err("SSH handshake timed out: " + target_str_,
                                     ErrorKind::Connect);
        }
    }
    if (ret != 0) {
        return Result<void>::Err(
            fmt::format("SSH handshake failed with {}: {}", target_str_, last_error()),
            ErrorKind::Connect);
    }
    return Result<void>::Ok();
}

Result<void> SftpSession::check_host_key() {
    switch (target_.host_key_policy) {
    case HostKeyPolicy::InsecureAcceptAny: {
        // Any host key is accepted. Record the fingerprint so the trust
        // decision is at least traceable.
        const char* hash = libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA1);
        std::string fingerprint;
        if (hash) {
            for (int i = 0; i < 20; i++) {
                fingerprint += fmt::format("{:02x}", static_cast<unsigned char>(hash[i]));
                if (i < 19) fingerprint += ":";
            }
        }
        hostcp_log(fmt::format("session: {} host key NOT verified ({}), sha1 {}",
                               target_str_, host_key_policy_name(target_.host_key_policy),
                               fingerprint.empty() ? "unavailable" : fingerprint));
        return Result<void>::Ok();
    }
    }
    return Result<void>::Err("Unknown host key policy", ErrorKind::Config);
}

Result<void> SftpSession::userauth(const AuthPlan& auth, Deadline deadline,
                                   StatusCallback callback) {
    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, auth.user.c_str(),
                                              static_cast<unsigned int>(auth.user.length()))) == nullptr) {
        if (libssh2_userauth_authenticated(session_)) {
            hostcp_log("session: " + target_str_ + " accepted 'none' authentication");
            return Result<void>::Ok();
        }
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        if (!wait_socket(deadline)) {
            return Result<void>::Err("Authentication timed out: " + target_str_, ErrorKind::Auth);
        }
    }
    std::string methods = auth_list ? auth_list : "";
    hostcp_log(fmt::format("session: {} offers auth methods [{}]", target_str_, methods));

    for (const auto& method : auth.methods) {
        const char* name = auth_method_name(method.kind);
        if (!methods.empty() && methods.find(name) == std::string::npos) continue;

        if (callback) callback(fmt::format("Authenticating to {} ({})...", target_str_, name));

        int ret = LIBSSH2_ERROR_AUTHENTICATION_FAILED;
        KbdAuthData kbd_data{method.secret};

        for (;;) {
            switch (method.kind) {
            case AuthMethodKind::PublicKey:
                ret = libssh2_userauth_publickey_fromfile(
                    session_, auth.user.c_str(),
                    method.public_key_path.empty() ? nullptr : method.public_key_path.c_str(),
                    method.private_key_path.c_str(),
                    method.secret.empty() ? nullptr : method.secret.c_str());
                break;
            case AuthMethodKind::Password:
                ret = libssh2_userauth_password(session_, auth.user.c_str(),
                                                method.secret.c_str());
                break;
            case AuthMethodKind::KeyboardInteractive:
                *libssh2_session_abstract(session_) = &kbd_data;
                ret = libssh2_userauth_keyboard_interactive(session_, auth.user.c_str(),
                                                            kbd_callback);
                break;
            }
            if (ret != LIBSSH2_ERROR_EAGAIN) break;
            if (!wait_socket(deadline)) {
                return Result<void>::Err("Authentication timed out: " + target_str_,
                                         ErrorKind::Auth);
            }
        }

        if (ret == 0) {
            hostcp_log(fmt::format("session: {} authenticated as {} via {}",
                                   target_str_, auth.user, name));
            return Result<void>::Ok();
        }
        hostcp_log(fmt::format("session: {} {} auth failed: {}", target_str_, name, last_error()));
    }

    return Result<void>::Err(
        fmt::format("Authentication failed for {}@{} (server offers: {})",
                    auth.user, target_str_, methods.empty() ? "unknown" : methods),
        ErrorKind::Auth);
}

Result<void> SftpSession::open_sftp(Deadline deadline) {
    while ((sftp_ = libssh2_sftp_init(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return Result<void>::Err(
                fmt::format("Failed to start SFTP on {}: {}", target_str_, last_error()),
                ErrorKind::Connect);
        }
        if (!wait_socket(deadline)) {
            return Result<void>::Err("SFTP negotiation timed out: " + target_str_,
                                     ErrorKind::Connect);
        }
    }
    return Result<void>::Ok();
}

bool SftpSession::wait_socket(Deadline deadline) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return false;

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    int timeout_ms = static_cast<int>(std::min<long long>(remaining.count(), SOCKET_WAIT_MS));

    short events = 0;
    int dir = libssh2_session_block_directions(session_);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;

    platform::poll_socket(sock_, events, std::max(timeout_ms, 1));
    return true;
}

std::string SftpSession::last_error() const {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, len) : "unknown error";
}

void SftpSession::close() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }

    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ != HOSTCP_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = HOSTCP_INVALID_SOCKET;
    }
}

// ── File operations ────────────────────────────────────────

Result<RemoteStat> SftpSession::stat(const std::string& path) {
    if (!sftp_) return Result<RemoteStat>::Err("Not connected", ErrorKind::RemoteIo);

    LIBSSH2_SFTP_ATTRIBUTES attrs;
    std::memset(&attrs, 0, sizeof(attrs));
    int rc = libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
                                  LIBSSH2_SFTP_STAT, &attrs);
    RemoteStat st;
    if (rc != 0) {
        unsigned long sftp_err = libssh2_sftp_last_error(sftp_);
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL &&
            (sftp_err == LIBSSH2_FX_NO_SUCH_FILE || sftp_err == LIBSSH2_FX_NO_SUCH_PATH)) {
            return Result<RemoteStat>::Ok(st);
        }
        return Result<RemoteStat>::Err(
            fmt::format("stat {} failed: {} (sftp status {})", path, last_error(), sftp_err),
            ErrorKind::RemoteIo);
    }

    st.exists = true;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        st.is_directory = LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) {
        st.size_known = true;
        st.size = static_cast<int64_t>(attrs.filesize);
    } else {
        hostcp_log("session: " + target_str_ + " reported no size for " + path);
    }
    return Result<RemoteStat>::Ok(st);
}

Result<std::unique_ptr<ByteSource>> SftpSession::open_read(const std::string& path) {
    if (!sftp_) return Result<std::unique_ptr<ByteSource>>::Err("Not connected", ErrorKind::RemoteIo);

    LIBSSH2_SFTP_HANDLE* fh = libssh2_sftp_open_ex(
        sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!fh) {
        return Result<std::unique_ptr<ByteSource>>::Err(
            fmt::format("Cannot open remote {}: {} (sftp status {})",
                        path, last_error(), libssh2_sftp_last_error(sftp_)),
            ErrorKind::RemoteIo);
    }
    return Result<std::unique_ptr<ByteSource>>::Ok(std::make_unique<SftpFileSource>(fh));
}

Result<std::unique_ptr<ByteSink>> SftpSession::open_write(const std::string& path) {
    if (!sftp_) return Result<std::unique_ptr<ByteSink>>::Err("Not connected", ErrorKind::RemoteIo);

    LIBSSH2_SFTP_HANDLE* fh = libssh2_sftp_open_ex(
        sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
        LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR |
        LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH,
        LIBSSH2_SFTP_OPENFILE);
    if (!fh) {
        return Result<std::unique_ptr<ByteSink>>::Err(
            fmt::format("Cannot create remote {}: {} (sftp status {})",
                        path, last_error(), libssh2_sftp_last_error(sftp_)),
            ErrorKind::RemoteIo);
    }
    return Result<std::unique_ptr<ByteSink>>::Ok(std::make_unique<SftpFileSink>(fh));
}
