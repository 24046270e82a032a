#include "auth.hpp"
#include <core/utils.hpp>
#include <core/log.hpp>
#include <filesystem>

namespace fs = std::filesystem;

const char* auth_method_name(AuthMethodKind kind) {
    switch (kind) {
    case AuthMethodKind::PublicKey:           return "publickey";
    case AuthMethodKind::Password:            return "password";
    case AuthMethodKind::KeyboardInteractive: return "keyboard-interactive";
    }
    return "unknown";
}

ConfigAuthProvider::ConfigAuthProvider(const AuthConfig& config,
                                       const CredentialManager& creds)
    : config_(config), creds_(creds) {}

Result<AuthPlan> ConfigAuthProvider::resolve() {
    AuthPlan plan;

    plan.user = config_.user;
    if (plan.user.empty()) {
        auto stored = creds_.get("user");
        plan.user = stored.is_ok() ? stored.value : local_username();
    }
    if (plan.user.empty() || plan.user == "unknown") {
        return Result<AuthPlan>::Err("No login user configured (auth.user or 'hostcp setup')",
                                     ErrorKind::Auth);
    }

    if (config_.private_key) {
        std::string key = expand_home(*config_.private_key);
        if (fs::exists(key)) {
            AuthMethod m{AuthMethodKind::PublicKey, "", key, ""};
            if (config_.public_key) m.public_key_path = expand_home(*config_.public_key);
            if (config_.passphrase) {
                m.secret = *config_.passphrase;
            } else {
                auto stored = creds_.get("passphrase");
                if (stored.is_ok()) m.secret = stored.value;
            }
            plan.methods.push_back(m);
        } else {
            hostcp_log("auth: private key " + key + " not found, skipping publickey");
        }
    }

    std::string password;
    if (config_.password) {
        password = *config_.password;
    } else {
        auto stored = creds_.get("password");
        if (stored.is_ok()) password = stored.value;
    }
    if (!password.empty()) {
        plan.methods.push_back({AuthMethodKind::Password, password, "", ""});
        plan.methods.push_back({AuthMethodKind::KeyboardInteractive, password, "", ""});
    }

    if (plan.methods.empty()) {
        return Result<AuthPlan>::Err(
            "No authentication method available (configure auth.private_key or run 'hostcp setup')",
            ErrorKind::Auth);
    }

    return Result<AuthPlan>::Ok(plan);
}
