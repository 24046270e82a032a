#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

fs::path get_config_dir() {
    return platform::home_dir() / ".hostcp";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

bool config_exists() {
    return fs::exists(get_config_path());
}

std::optional<HostKeyPolicy> parse_host_key_policy(const std::string& name) {
    if (name == HOST_KEY_POLICY_INSECURE) return HostKeyPolicy::InsecureAcceptAny;
    return std::nullopt;
}

const char* host_key_policy_name(HostKeyPolicy policy) {
    switch (policy) {
    case HostKeyPolicy::InsecureAcceptAny: return HOST_KEY_POLICY_INSECURE;
    }
    return "unknown";
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# hostcp configuration

auth:
  user: ""                 # empty: credential store "user", then $USER
  # password: ""           # empty: credential store "password"
  # private_key: "~/.ssh/id_rsa"
  # public_key: ""         # derived from the private key when empty
  # passphrase: ""

server:
  default_port: 22         # appended to hosts given without :port
  timeout: 30              # connect timeout in seconds
  # Host keys are NOT verified. This is the only supported policy.
  host_key_policy: "insecure-accept-any"

transfer:
  max_size: 1099511627776  # largest single file fetched, in bytes
)";

    try {
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string(),
                                     ErrorKind::Config);
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(std::string("Failed to write config file: ") + e.what(),
                                 ErrorKind::Config);
    }
}

static std::optional<std::string> optional_string(const YAML::Node& node) {
    if (!node || !node.IsScalar()) return std::nullopt;
    auto value = node.as<std::string>("");
    if (value.empty()) return std::nullopt;
    return value;
}

static AuthConfig parse_auth_config(const YAML::Node& node) {
    AuthConfig auth;
    auth.user = node["user"].as<std::string>("");
    auth.password = optional_string(node["password"]);
    auth.private_key = optional_string(node["private_key"]);
    auth.public_key = optional_string(node["public_key"]);
    auth.passphrase = optional_string(node["passphrase"]);
    return auth;
}

static Result<ServerConfig> parse_server_config(const YAML::Node& node) {
    ServerConfig server;
    server.default_port = node["default_port"].as<int>(DEFAULT_SSH_PORT);
    server.timeout = node["timeout"].as<int>(CONNECT_TIMEOUT_SECS);

    if (server.default_port <= 0 || server.default_port > 65535) {
        return Result<ServerConfig>::Err(
            "server.default_port out of range: " + std::to_string(server.default_port),
            ErrorKind::Config);
    }
    if (server.timeout <= 0) {
        return Result<ServerConfig>::Err("server.timeout must be positive", ErrorKind::Config);
    }

    std::string policy = node["host_key_policy"].as<std::string>(HOST_KEY_POLICY_INSECURE);
    auto parsed = parse_host_key_policy(policy);
    if (!parsed) {
        return Result<ServerConfig>::Err(
            "Unsupported server.host_key_policy '" + policy + "' (supported: " +
            HOST_KEY_POLICY_INSECURE + ")",
            ErrorKind::Config);
    }
    server.host_key_policy = *parsed;
    return Result<ServerConfig>::Ok(server);
}

static Result<TransferConfig> parse_transfer_config(const YAML::Node& node) {
    TransferConfig transfer;
    transfer.max_size = node["max_size"].as<int64_t>(DEFAULT_MAX_TRANSFER_SIZE);
    if (transfer.max_size < 0) {
        return Result<TransferConfig>::Err("transfer.max_size cannot be negative",
                                           ErrorKind::Config);
    }
    return Result<TransferConfig>::Ok(transfer);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);

        Config config;
        config.auth_ = parse_auth_config(root["auth"] ? root["auth"] : YAML::Node());

        auto server = parse_server_config(root["server"] ? root["server"] : YAML::Node());
        if (server.is_err()) return propagate<Config>(server);
        config.server_ = server.value;

        auto transfer = parse_transfer_config(root["transfer"] ? root["transfer"] : YAML::Node());
        if (transfer.is_err()) return propagate<Config>(transfer);
        config.transfer_ = transfer.value;

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what(),
                                   ErrorKind::Config);
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string(), ErrorKind::Config);
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config " + path.string(), ErrorKind::Config);
    }
    std::string text((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_err()) {
        result.error += " (" + path.string() + ")";
    }
    return result;
}

Result<Config> Config::load_default() {
    if (!config_exists()) {
        return Result<Config>::Ok(Config{});
    }
    return load(get_config_path());
}
