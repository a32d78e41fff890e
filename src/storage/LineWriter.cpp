#include "logcollector/LineWriter.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <vector>
#include "logcollector/Errors.hpp"
#include "logcollector/Files.hpp"

namespace logcollector {

LineWriter::LineWriter(const std::filesystem::path& path)
    : path_(path), stream_(openAppend(path)) {
    loadCursor();
}

LineWriter::~LineWriter() {
    if (stream_.is_open()) {
        flush();
        stream_.close();
    }
}

void LineWriter::loadCursor() {
    stream_.seekg(0, std::ios::beg);

    uint64_t newlines = 0;
    char last = '\n';
    std::vector<char> buf(64 * 1024);
    while (stream_.read(buf.data(), static_cast<std::streamsize>(buf.size())) || stream_.gcount() > 0) {
        auto n = static_cast<size_t>(stream_.gcount());
        newlines += static_cast<uint64_t>(std::count(buf.begin(), buf.begin() + n, '\n'));
        last = buf[n - 1];
    }
    if (stream_.bad()) {
        throw IoError("Failed to read existing content of " + path_.string());
    }
    stream_.clear();
    stream_.seekp(0, std::ios::end);

    cursor_ = newlines;
    if (last != '\n') {
        // Terminate a dangling partial line so the next write starts clean.
        std::cerr << "LineWriter: terminating partial trailing line in " << path_ << "\n";
        stream_.put('\n');
        if (!stream_) throw IoError("Failed to write to " + path_.string());
        ++cursor_;
    }
}

void LineWriter::writeToLine(uint64_t lineNumber, const std::string& text) {
    if (lineNumber == 0) {
        throw std::invalid_argument("LineWriter: line numbers start at 1");
    }
    uint64_t padding = lineNumber > cursor_ + 1 ? lineNumber - 1 - cursor_ : 0;
    if (padding > kMaxPadding) {
        std::cerr << "LineWriter: suspicious gap of " << padding << " lines in " << path_ << "\n";
        throw IoError("Refusing to pad " + std::to_string(padding) + " blank lines before line " +
                      std::to_string(lineNumber) + " of " + path_.string());
    }
    for (uint64_t i = 0; i < padding; ++i) {
        stream_.put('\n');
    }
    stream_.write(text.data(), static_cast<std::streamsize>(text.size()));
    stream_.put('\n');
    stream_.flush();
    if (!stream_) {
        throw IoError("Failed to write line " + std::to_string(lineNumber) + " to " + path_.string());
    }
    cursor_ = std::max(cursor_, lineNumber);
}

bool LineWriter::flush() {
    stream_.flush();
    if (!stream_) {
        std::cerr << "LineWriter: flush failed for " << path_ << "\n";
        return false;
    }
    return true;
}

} // namespace logcollector
