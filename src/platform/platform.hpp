#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Read a line from the terminal without echoing it (for password entry).
// Falls back to a plain read when stdin is not a terminal.
std::string read_secret(const std::string& prompt);

} // namespace platform
