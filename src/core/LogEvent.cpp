#include "logcollector/LogEvent.hpp"

#include <initializer_list>
#include "logcollector/Errors.hpp"

using json = nlohmann::json;

namespace logcollector {

namespace {

constexpr size_t kMaxPayloadInError = 256;

bool readString(const json& doc, const char* field, std::string& out) {
    auto it = doc.find(field);
    if (it == doc.end() || !it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

// Absent and null both mean "not provided"; anything else must be a list of
// strings.
bool readOptionalList(const json& doc, const char* field, std::optional<std::vector<std::string>>& out) {
    auto it = doc.find(field);
    if (it == doc.end() || it->is_null()) {
        out.reset();
        return true;
    }
    if (!it->is_array()) return false;
    std::vector<std::string> values;
    values.reserve(it->size());
    for (const auto& v : *it) {
        if (!v.is_string()) return false;
        values.push_back(v.get<std::string>());
    }
    out = std::move(values);
    return true;
}

std::string excerpt(const std::string& body) {
    if (body.size() <= kMaxPayloadInError) return body;
    return body.substr(0, kMaxPayloadInError) + "...(" + std::to_string(body.size()) + " bytes)";
}

} // namespace

const char* kindName(const LogEvent& event) {
    switch (event.index()) {
    case 0: return "chunk";
    case 1: return "start";
    default: return "finish";
    }
}

std::optional<BuildLogMsg> decodeChunk(const json& doc) {
    if (!doc.is_object()) return std::nullopt;
    BuildLogMsg msg;
    if (!readString(doc, "system", msg.system)) return std::nullopt;
    if (!readString(doc, "identity", msg.identity)) return std::nullopt;
    if (!readString(doc, "attempt_id", msg.attemptId)) return std::nullopt;
    if (!readString(doc, "output", msg.output)) return std::nullopt;

    auto line = doc.find("line_number");
    if (line == doc.end() || !line->is_number_integer()) return std::nullopt;
    if (line->is_number_unsigned()) {
        msg.lineNumber = line->get<uint64_t>();
    } else {
        auto signedLine = line->get<int64_t>();
        if (signedLine < 0) return std::nullopt;
        msg.lineNumber = static_cast<uint64_t>(signedLine);
    }
    // Line numbers are 1-based; 0 is not a chunk.
    if (msg.lineNumber == 0) return std::nullopt;
    return msg;
}

std::optional<BuildLogStart> decodeStart(const json& doc) {
    if (!doc.is_object()) return std::nullopt;
    BuildLogStart start;
    if (!readString(doc, "system", start.system)) return std::nullopt;
    if (!readString(doc, "identity", start.identity)) return std::nullopt;
    if (!readString(doc, "attempt_id", start.attemptId)) return std::nullopt;
    if (!readOptionalList(doc, "attempted_attrs", start.attemptedAttrs)) return std::nullopt;
    if (!readOptionalList(doc, "skipped_attrs", start.skippedAttrs)) return std::nullopt;
    return start;
}

std::optional<BuildResult> decodeFinish(const json& doc) {
    if (!doc.is_object()) return std::nullopt;
    BuildResult result;
    if (!readString(doc, "attempt_id", result.attemptId)) return std::nullopt;
    if (!readString(doc, "system", result.system)) return std::nullopt;

    auto repo = doc.find("repo");
    if (repo == doc.end() || !repo->is_object()) return std::nullopt;
    std::string ignored;
    for (const char* field : {"owner", "name", "full_name", "clone_url"}) {
        if (!readString(*repo, field, ignored)) return std::nullopt;
    }

    auto pr = doc.find("pr");
    if (pr == doc.end() || !pr->is_object()) return std::nullopt;
    if (!readString(*pr, "head_sha", ignored)) return std::nullopt;
    auto number = pr->find("number");
    if (number == pr->end() || !number->is_number_unsigned()) return std::nullopt;
    auto targetBranch = pr->find("target_branch");
    if (targetBranch != pr->end() && !targetBranch->is_null() && !targetBranch->is_string()) return std::nullopt;

    std::optional<std::vector<std::string>> output;
    if (!doc.contains("output") || !readOptionalList(doc, "output", output) || !output) return std::nullopt;

    result.raw = doc;
    return result;
}

LogMessage classify(const std::string& routingKey, const std::string& body) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded()) {
        throw DecodeError("failed to decode job: payload is not JSON: " + excerpt(body));
    }

    if (auto chunk = decodeChunk(doc)) {
        StreamKey from{routingKey, chunk->attemptId};
        return LogMessage{std::move(from), std::move(*chunk)};
    }
    if (auto start = decodeStart(doc)) {
        StreamKey from{routingKey, start->attemptId};
        return LogMessage{std::move(from), std::move(*start)};
    }
    if (auto finish = decodeFinish(doc)) {
        StreamKey from{routingKey, finish->attemptId};
        return LogMessage{std::move(from), std::move(*finish)};
    }

    throw DecodeError("failed to decode job: no known message shape matches: " + excerpt(body));
}

} // namespace logcollector
