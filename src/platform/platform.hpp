#pragma once

#include <string>
#include <filesystem>
#include <system_error>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (TMPDIR, falling back to /tmp).
std::filesystem::path temp_dir();

// True if the current user may create entries in / write to the given path.
// Uses the real uid like access(2), so it agrees with what the shell reports.
bool is_writable(const std::filesystem::path& p);

// True if errno-style code means "access denied" (EACCES / EPERM).
bool is_permission_error(const std::error_code& ec);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
