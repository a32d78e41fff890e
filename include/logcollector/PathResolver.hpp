#pragma once

#include <filesystem>
#include <string>
#include "logcollector/StreamKey.hpp"

namespace logcollector {

// Maps a StreamKey onto a file under the log root. Pure path arithmetic:
// nothing here touches the filesystem.
class PathResolver {
public:
    static constexpr const char* kMetadataExtension = ".metadata.json";

    explicit PathResolver(const std::filesystem::path& root);

    const std::filesystem::path& root() const { return root_; }

    // root / routing_key / attempt_id. Throws PathValidationError.
    std::filesystem::path resolveLog(const StreamKey& key) const;

    // resolveLog() with the extension replaced by kMetadataExtension.
    std::filesystem::path resolveMetadata(const StreamKey& key) const;

    // Parses a producer-supplied fragment as a relative path and returns it
    // rebuilt from its normal components. Rejects empty input, absolute
    // paths, "..", a leading "." and NUL bytes.
    static std::filesystem::path validateSegment(const std::string& segment);

    // Component-wise prefix test, no symlink resolution.
    static bool isWithin(const std::filesystem::path& root, const std::filesystem::path& candidate);

private:
    std::filesystem::path root_;
};

} // namespace logcollector
