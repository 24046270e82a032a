#pragma once

#include <string>
#include <vector>

// Login user to fall back on when neither config nor credential store
// provides one ($USER, then "unknown").
std::string local_username();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Split on a delimiter, trimming each piece and dropping empty ones.
std::vector<std::string> split_list(const std::string& str, char delimiter);

// Expand a leading "~/" to the home directory.
std::string expand_home(const std::string& path);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
