#pragma once

#include <string>
#include <vector>

// Whole-string integer parse: returns fallback on failure or trailing text (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Join integers with a separator: {0, 2, 3} -> "0,2,3"
std::string join_ints(const std::vector<int>& values, const std::string& sep = ",");

// Quote a string for a POSIX shell (single quotes, embedded quotes escaped).
std::string shell_quote(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
