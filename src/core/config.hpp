#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.hostcp/config.yaml, or built-in defaults when it does not exist
    static Result<Config> load_default();

    // Load an explicit config file (must exist)
    static Result<Config> load(const fs::path& path);

    // Parse YAML text (used by load and by tests)
    static Result<Config> parse(const std::string& yaml_text);

    const AuthConfig& auth() const { return auth_; }
    const ServerConfig& server() const { return server_; }
    const TransferConfig& transfer() const { return transfer_; }

    // Command-line overrides
    void set_user(const std::string& user) { auth_.user = user; }
    void set_default_port(int port) { server_.default_port = port; }

public:
    Config() = default;

private:
    AuthConfig auth_;
    ServerConfig server_;
    TransferConfig transfer_;
};

fs::path get_config_dir();
fs::path get_config_path();
bool config_exists();

// Write the commented default config (never overwrites an existing file)
Result<void> create_default_config(const fs::path& path = get_config_path());

// "insecure-accept-any" <-> HostKeyPolicy
std::optional<HostKeyPolicy> parse_host_key_policy(const std::string& name);
const char* host_key_policy_name(HostKeyPolicy policy);
