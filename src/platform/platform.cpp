#include "platform.hpp"
#include <cstdlib>
#include <system_error>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#  include <io.h>
#else
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    std::error_code ec;
    fs::path p = fs::temp_directory_path(ec);
    if (ec) return fs::path("/tmp");
    return p;
}

bool is_writable(const fs::path& p) {
#ifdef _WIN32
    return _waccess(p.c_str(), 2) == 0;
#else
    return access(p.c_str(), W_OK) == 0;
#endif
}

bool is_permission_error(const std::error_code& ec) {
    return ec == std::errc::permission_denied ||
           ec == std::errc::operation_not_permitted;
}

void sleep_ms(int ms) {
#ifdef _WIN32
    Sleep(ms);
#else
    usleep(static_cast<useconds_t>(ms) * 1000);
#endif
}

} // namespace platform
