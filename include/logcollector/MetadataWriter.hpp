#pragma once

#include <filesystem>
#include <string>
#include "logcollector/LogEvent.hpp"

namespace logcollector {

// Compact JSON with the fixed field order
// system, identity, attempt_id, attempted_attrs, skipped_attrs.
// Throws SerializationError.
std::string encodeMetadata(const BuildLogStart& start);

// Appends encodeMetadata(start) to the sidecar at `path`, creating it if
// needed. A second start for the same stream adds a second document.
void writeMetadata(const std::filesystem::path& path, const BuildLogStart& start);

} // namespace logcollector
