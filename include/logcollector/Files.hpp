#pragma once

#include <filesystem>
#include <fstream>

namespace logcollector {

// Creates the parent directory chain of `path`. Throws IoError.
void ensureParentDirectory(const std::filesystem::path& path);

// Opens `path` for read + append, creating it (and its parents) if missing.
// Every write lands at end of file. Throws IoError.
std::fstream openAppend(const std::filesystem::path& path);

} // namespace logcollector
