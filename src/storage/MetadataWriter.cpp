#include "logcollector/MetadataWriter.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include "logcollector/Errors.hpp"
#include "logcollector/Files.hpp"

namespace logcollector {

namespace {

nlohmann::ordered_json optionalList(const std::optional<std::vector<std::string>>& list) {
    if (!list) return nullptr;
    return *list;
}

} // namespace

std::string encodeMetadata(const BuildLogStart& start) {
    nlohmann::ordered_json doc;
    doc["system"] = start.system;
    doc["identity"] = start.identity;
    doc["attempt_id"] = start.attemptId;
    doc["attempted_attrs"] = optionalList(start.attemptedAttrs);
    doc["skipped_attrs"] = optionalList(start.skippedAttrs);

    try {
        return doc.dump();
    } catch (const nlohmann::json::exception& e) {
        throw SerializationError(std::string("Failed to stringify metadata: ") + e.what());
    }
}

void writeMetadata(const std::filesystem::path& path, const BuildLogStart& start) {
    std::string payload = encodeMetadata(start);

    std::fstream fp = openAppend(path);
    fp.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    fp.flush();
    if (!fp) {
        throw IoError("Failed to write metadata to " + path.string());
    }
}

} // namespace logcollector
