#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/credentials.hpp>

enum class AuthMethodKind {
    PublicKey,            // key file, optional passphrase
    Password,
    KeyboardInteractive,  // every prompt is answered with the password
};

struct AuthMethod {
    AuthMethodKind kind;
    std::string secret;           // password or key passphrase
    std::string private_key_path;
    std::string public_key_path;  // empty: derived from the private key
};

const char* auth_method_name(AuthMethodKind kind);

// Login identity plus the ordered methods to try for it.
struct AuthPlan {
    std::string user;
    std::vector<AuthMethod> methods;
};

// Supplies authentication material for a run.
class AuthProvider {
public:
    virtual ~AuthProvider() = default;
    virtual Result<AuthPlan> resolve() = 0;
};

// Builds the plan from config, falling back to the credential store.
//
// Order: public key (configured and present on disk), password,
// keyboard-interactive. An empty plan is an error.
class ConfigAuthProvider : public AuthProvider {
public:
    ConfigAuthProvider(const AuthConfig& config, const CredentialManager& creds);

    Result<AuthPlan> resolve() override;

private:
    AuthConfig config_;
    const CredentialManager& creds_;
};
