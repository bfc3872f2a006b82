#pragma once

#include <string>
#include <filesystem>

// Read a whole file into a string. Throws filesystem_error if it cannot be opened.
std::string read_file(const std::filesystem::path& path);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n\f\v") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}
