#include "naming.hpp"
#include <core/utils.hpp>
#include <algorithm>

std::string normalize_host(const std::string& host, int default_port) {
    std::string port = std::to_string(default_port);

    if (!host.empty() && host.front() == '[') {
        auto close = host.find(']');
        if (close != std::string::npos && close + 1 < host.size() && host[close + 1] == ':') {
            return host;
        }
        return host + ":" + port;
    }

    auto colons = std::count(host.begin(), host.end(), ':');
    if (colons == 0) return host + ":" + port;
    if (colons > 1) return "[" + host + "]:" + port;
    return host;
}

Result<int> parse_port(const std::string& text) {
    if (text.empty() || text.size() > 5 ||
        text.find_first_not_of("0123456789") != std::string::npos) {
        return Result<int>::Err("Invalid port: " + text, ErrorKind::Config);
    }
    int port = safe_stoi(text, -1);
    if (port <= 0 || port > 65535) {
        return Result<int>::Err("Invalid port: " + text, ErrorKind::Config);
    }
    return Result<int>::Ok(port);
}

Result<HostPort> split_host_port(const std::string& host_port) {
    HostPort hp;
    std::string port_str;

    if (!host_port.empty() && host_port.front() == '[') {
        auto close = host_port.find(']');
        if (close == std::string::npos || close + 1 >= host_port.size() ||
            host_port[close + 1] != ':') {
            return Result<HostPort>::Err("Malformed host: " + host_port, ErrorKind::Connect);
        }
        hp.host = host_port.substr(1, close - 1);
        port_str = host_port.substr(close + 2);
    } else {
        auto colon = host_port.rfind(':');
        if (colon == std::string::npos) {
            return Result<HostPort>::Err("Missing port: " + host_port, ErrorKind::Connect);
        }
        hp.host = host_port.substr(0, colon);
        port_str = host_port.substr(colon + 1);
    }

    auto port = parse_port(port_str);
    if (hp.host.empty() || port.is_err()) {
        return Result<HostPort>::Err("Malformed host: " + host_port, ErrorKind::Connect);
    }
    hp.port = port.value;
    return Result<HostPort>::Ok(hp);
}

std::string path_basename(const std::string& path) {
    auto end = path.find_last_not_of('/');
    if (end == std::string::npos) return path.empty() ? "" : "/";
    auto start = path.rfind('/', end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return path.substr(start, end - start + 1);
}

std::string peer_token(const std::string& peer_address) {
    std::string ip;
    if (!peer_address.empty() && peer_address.front() == '[') {
        auto close = peer_address.find(']');
        ip = peer_address.substr(1, close == std::string::npos ? std::string::npos : close - 1);
    } else {
        ip = peer_address.substr(0, peer_address.find(':'));
    }
    std::replace(ip.begin(), ip.end(), '.', '-');
    std::replace(ip.begin(), ip.end(), ':', '-');
    return ip;
}

std::string fetch_destination_name(const std::string& remote_basename,
                                   const std::string& peer_address) {
    std::string stem = remote_basename;
    std::string ext;
    auto dot = remote_basename.rfind('.');
    if (dot != std::string::npos) {
        stem = remote_basename.substr(0, dot);
        ext = remote_basename.substr(dot + 1);
    }
    return stem + "-" + peer_token(peer_address) + "." + ext;
}

std::string send_remote_target(const std::string& remote_path,
                               const std::string& local_path) {
    if (remote_path.empty() || remote_path.back() != '/') return remote_path;
    return remote_path + path_basename(local_path);
}
