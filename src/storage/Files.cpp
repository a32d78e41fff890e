#include "logcollector/Files.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>
#include "logcollector/Errors.hpp"

namespace fs = std::filesystem;

namespace logcollector {

void ensureParentDirectory(const fs::path& path) {
    fs::path dir = path.parent_path();
    if (dir.empty()) return;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw IoError("Failed to create directory " + dir.string() + ": " + ec.message());
    }
}

std::fstream openAppend(const fs::path& path) {
    ensureParentDirectory(path);

    errno = 0;
    std::fstream stream(path, std::ios::binary | std::ios::in | std::ios::out | std::ios::app);
    if (!stream.is_open()) {
        std::string reason = errno != 0 ? std::strerror(errno) : "unknown error";
        throw IoError("Failed to open the file for " + path.string() + ", err: " + reason);
    }
    return stream;
}

} // namespace logcollector
