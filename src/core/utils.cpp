#include "utils.hpp"
#include "types.hpp"
#include <platform/platform.hpp>
#include <cstdlib>
#include <stdexcept>

std::string local_username() {
    const char* user = std::getenv("USER");
    if (user && *user) return user;
    return "unknown";
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> split_list(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= str.size()) {
        size_t end = str.find(delimiter, start);
        if (end == std::string::npos) end = str.size();
        std::string piece = str.substr(start, end - start);
        trim(piece);
        if (!piece.empty()) parts.push_back(piece);
        start = end + 1;
    }
    return parts;
}

std::string expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir().string();
    if (path.rfind("~/", 0) == 0) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:              return "none";
    case ErrorKind::Config:            return "config";
    case ErrorKind::Auth:              return "auth";
    case ErrorKind::Connect:           return "connect";
    case ErrorKind::LocalPath:         return "local-path";
    case ErrorKind::LocalPathIsFile:   return "local-path-is-file";
    case ErrorKind::Unsupported:       return "unsupported";
    case ErrorKind::RemoteIsDirectory: return "remote-is-directory";
    case ErrorKind::TooLarge:          return "too-large";
    case ErrorKind::AlreadyExists:     return "already-exists";
    case ErrorKind::RemoteIo:          return "remote-io";
    case ErrorKind::LocalIo:           return "local-io";
    }
    return "unknown";
}
