#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace logcollector {

// Append-only writer addressed by 1-based line number. Gaps are padded with
// blank lines so a line lands at its number when lines arrive in order; a
// line at or below the cursor is appended after whatever is already there.
class LineWriter {
public:
    // Opens (creating if needed) and counts the lines already present.
    explicit LineWriter(const std::filesystem::path& path);
    ~LineWriter();

    LineWriter(const LineWriter&) = delete;
    LineWriter& operator=(const LineWriter&) = delete;

    // Largest run of blank lines one write may emit.
    static constexpr uint64_t kMaxPadding = 1'000'000;

    // Throws IoError if the stream fails or the gap exceeds kMaxPadding,
    // std::invalid_argument for line 0.
    void writeToLine(uint64_t lineNumber, const std::string& text);

    // Returns false (and logs) if the stream is in a failed state afterwards.
    bool flush();

    uint64_t linesEmitted() const { return cursor_; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::fstream stream_;
    uint64_t cursor_ = 0;

    void loadCursor();
};

} // namespace logcollector
