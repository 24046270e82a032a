#pragma once

#include <string>
#include <core/types.hpp>

// Append ":default_port" to a host given without one.
//   "web1"        -> "web1:22"
//   "web1:2222"   -> "web1:2222"
//   "[::1]"       -> "[::1]:22"
//   "fe80::1"     -> "[fe80::1]:22"  (bare IPv6 literal)
std::string normalize_host(const std::string& host, int default_port);

// Decimal TCP port in 1..65535; anything else (signs, trailing junk) fails.
Result<int> parse_port(const std::string& text);

struct HostPort {
    std::string host;
    int port = 0;
};

// Split a normalized "host:port" / "[v6]:port" string for dialing.
Result<HostPort> split_host_port(const std::string& host_port);

// Last path component, ignoring trailing '/' ("a/b/c.txt" -> "c.txt").
std::string path_basename(const std::string& path);

// Filesystem-safe token for a peer address: port dropped, '.' and ':' -> '-'.
//   "10.0.0.5:22" -> "10-0-0-5"
std::string peer_token(const std::string& peer_address);

// Local file name for a fetched file: "<stem>-<peer token>.<ext>".
// The extension is whatever follows the final '.'; a name without one
// keeps the trailing '.' ("hosts" -> "hosts-10-0-0-5.").
std::string fetch_destination_name(const std::string& remote_basename,
                                   const std::string& peer_address);

// Remote path for a send: a target ending in '/' names a directory and
// receives the local file's basename.
std::string send_remote_target(const std::string& remote_path,
                               const std::string& local_path);
