#pragma once

#include <string>
#include <vector>
#include <map>
#include <filesystem>
#include "types.hpp"

// Credentials stored as key=value lines in ~/.hostcp/credentials (chmod 600).
// Keys used by hostcp: "user", "password", "passphrase".
class CredentialManager {
public:
    static CredentialManager& instance();

    explicit CredentialManager(std::filesystem::path path);

    Result<std::string> get(const std::string& key) const;
    Result<void> set(const std::string& key, const std::string& value);
    Result<void> remove(const std::string& key);

    // Keys currently stored (values are never listed)
    std::vector<std::string> keys() const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;

    std::map<std::string, std::string> read_all() const;
    bool write_all(const std::map<std::string, std::string>& m) const;
};

std::filesystem::path default_credentials_path();
