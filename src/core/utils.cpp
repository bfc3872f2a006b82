#include "utils.hpp"
#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        int err = errno ? errno : ENOENT;
        throw std::filesystem::filesystem_error(
            "cannot open file", path, std::error_code(err, std::generic_category()));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        throw std::filesystem::filesystem_error(
            "cannot read file", path, std::make_error_code(std::errc::io_error));
    }
    return ss.str();
}
