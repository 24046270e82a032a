#include "credentials.hpp"
#include <platform/platform.hpp>
#include <fstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

fs::path default_credentials_path() {
    return platform::home_dir() / ".hostcp" / "credentials";
}

CredentialManager& CredentialManager::instance() {
    static CredentialManager mgr(default_credentials_path());
    return mgr;
}

CredentialManager::CredentialManager(fs::path path)
    : path_(std::move(path)) {}

std::map<std::string, std::string> CredentialManager::read_all() const {
    std::map<std::string, std::string> m;
    std::ifstream f(path_);
    if (!f) return m;

    std::string line;
    while (std::getline(f, line)) {
        auto eq = line.find('=');
        if (eq != std::string::npos) {
            m[line.substr(0, eq)] = line.substr(eq + 1);
        }
    }
    return m;
}

bool CredentialManager::write_all(const std::map<std::string, std::string>& m) const {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) return false;

    std::ofstream f(path_, std::ios::trunc);
    if (!f) return false;

    for (const auto& [k, v] : m) {
        f << k << "=" << v << "\n";
    }
    f.close();

    return chmod(path_.c_str(), 0600) == 0;
}

Result<std::string> CredentialManager::get(const std::string& key) const {
    auto m = read_all();
    auto it = m.find(key);
    if (it == m.end()) {
        return Result<std::string>::Err("Credential not found: " + key);
    }
    return Result<std::string>::Ok(it->second);
}

Result<void> CredentialManager::set(const std::string& key, const std::string& value) {
    if (key.empty() || key.find('=') != std::string::npos) {
        return Result<void>::Err("Invalid credential key: " + key);
    }
    if (value.find('\n') != std::string::npos) {
        return Result<void>::Err("Credential values cannot contain newlines");
    }
    auto m = read_all();
    m[key] = value;
    if (!write_all(m)) {
        return Result<void>::Err("Failed to write credentials file " + path_.string());
    }
    return Result<void>::Ok();
}

Result<void> CredentialManager::remove(const std::string& key) {
    auto m = read_all();
    if (m.erase(key) == 0) {
        return Result<void>::Err("Credential not found: " + key);
    }
    if (!write_all(m)) {
        return Result<void>::Err("Failed to write credentials file " + path_.string());
    }
    return Result<void>::Ok();
}

std::vector<std::string> CredentialManager::keys() const {
    std::vector<std::string> out;
    for (const auto& kv : read_all()) out.push_back(kv.first);
    return out;
}
