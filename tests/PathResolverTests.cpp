#include "logcollector/Errors.hpp"
#include "logcollector/PathResolver.hpp"
#include "TestScratch.hpp"

#include <string>
#include <vector>

using logcollector::PathResolver;
using logcollector::PathValidationError;
using logcollector::StreamKey;

static bool segmentOk(const std::string& segment) {
    try {
        PathResolver::validateSegment(segment);
        return true;
    } catch (const PathValidationError&) {
        return false;
    }
}

static bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int main() {
    // Segment validation
    expect(segmentOk("foo"), "foo is valid");
    expect(segmentOk("foo/bar"), "foo/bar is valid");
    expect(segmentOk("foo.bar/123"), "foo.bar/123 is valid");
    expect(segmentOk("foo/./bar"), "interior . collapses");
    expect(segmentOk("foo//bar/"), "repeated and trailing separators collapse");
    expect(!segmentOk(".."), ".. rejected");
    expect(!segmentOk("."), ". rejected");
    expect(!segmentOk("./././"), "./././ rejected");
    expect(!segmentOk(""), "empty rejected");
    expect(!segmentOk("foo/.."), "foo/.. rejected");
    expect(!segmentOk("foo/../bar"), "foo/../bar rejected");
    expect(!segmentOk("/foo/bar"), "/foo/bar rejected");
    expect(!segmentOk("/foo"), "/foo rejected");
    expect(!segmentOk("/"), "/ rejected");
    expect(!segmentOk(std::string("foo\0bar", 7)), "NUL rejected");
    expect(PathResolver::validateSegment("foo/./bar") == std::filesystem::path("foo/bar"), "normalized segment");

    // Containment helper
    expect(PathResolver::isWithin("/a/b", "/a/b/c"), "child is within");
    expect(!PathResolver::isWithin("/a/b", "/a/bc"), "sibling prefix is not within");
    expect(!PathResolver::isWithin("/a/b", "/a"), "parent is not within");

    TestScratch scratch("path-resolver");
    PathResolver resolver(scratch.path());

    // Log path
    {
        auto path = resolver.resolveLog(StreamKey{"my-routing-key", "my-attempt-id"});
        expect(PathResolver::isWithin(scratch.path(), path), "log path inside root");
        expect(path != resolver.root(), "log path strictly below root");
        expect(endsWith(path.generic_string(), "my-routing-key/my-attempt-id"), "log path layout");
    }

    // Metadata path
    {
        auto log = resolver.resolveLog(StreamKey{"my-routing-key", "my-attempt-id"});
        auto meta = resolver.resolveMetadata(StreamKey{"my-routing-key", "my-attempt-id"});
        expect(PathResolver::isWithin(scratch.path(), meta), "metadata path inside root");
        expect(endsWith(meta.generic_string(), "my-routing-key/my-attempt-id.metadata.json"), "metadata path layout");
        expect(meta.parent_path() == log.parent_path(), "sidecar sits beside the log");
    }

    // Nested segments
    {
        auto path = resolver.resolveLog(StreamKey{"routing-key-a.foo/123", "attempt-id-a.foo/123"});
        expect(endsWith(path.generic_string(), "routing-key-a.foo/123/attempt-id-a.foo/123"), "nested layout");
        auto meta = resolver.resolveMetadata(StreamKey{"x86_64-linux", "build.1"});
        expect(meta.filename() == "build.metadata.json", "existing extension replaced");
    }

    // Trailing separator on the root
    {
        PathResolver slashed(scratch.path().string() + "/");
        expect(slashed.root() == resolver.root(), "trailing slash dropped from root");
    }

    // Malicious keys fail and touch nothing
    {
        std::vector<StreamKey> bad = {
            {"./../../foobar", "./../../"},
            {"ok", ".."},
            {"..", "ok"},
            {"ok", ""},
            {"", "ok"},
            {"ok", "/etc/passwd"},
            {"a/../../b", "ok"},
        };
        for (const auto& key : bad) {
            expectThrows<PathValidationError>([&] { resolver.resolveLog(key); },
                                              "resolveLog should reject " + logcollector::describe(key));
            expectThrows<PathValidationError>([&] { resolver.resolveMetadata(key); },
                                              "resolveMetadata should reject " + logcollector::describe(key));
        }
        expect(countEntries(scratch.path()) == 0, "no files created while resolving");
    }

    expectThrows<std::invalid_argument>([] { PathResolver empty(""); }, "empty root rejected");

    std::cout << "All tests passed." << std::endl;
    return 0;
}
