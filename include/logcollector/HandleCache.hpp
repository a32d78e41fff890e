#pragma once

#include <cstddef>
#include <list>
#include <memory>
#include <unordered_map>
#include "logcollector/LineWriter.hpp"
#include "logcollector/PathResolver.hpp"
#include "logcollector/StreamKey.hpp"

namespace logcollector {

// Bounded pool of open LineWriters keyed by stream, least-recently-used
// first out. Owned by a single dispatch loop; not thread-safe.
class HandleCache {
public:
    HandleCache(const PathResolver& resolver, std::size_t maxOpen);
    ~HandleCache();

    HandleCache(const HandleCache&) = delete;
    HandleCache& operator=(const HandleCache&) = delete;

    // Returns the writer for `key`, opening it on a miss and evicting the
    // least recently used writer when over capacity. The reference is valid
    // until the next call that may evict.
    LineWriter& getOrCreate(const StreamKey& key);

    bool contains(const StreamKey& key) const { return entries_.count(key) != 0; }
    std::size_t size() const { return entries_.size(); }
    std::size_t capacity() const { return maxOpen_; }

    // Flushes every open writer; false if any flush failed.
    bool flushAll();

    // Flushes and closes every open writer.
    void clear();

private:
    using LruList = std::list<StreamKey>;

    struct Entry {
        std::unique_ptr<LineWriter> writer;
        LruList::iterator lruIt;
    };

    const PathResolver& resolver_;
    std::size_t maxOpen_;
    LruList lru_; // front = most recently used
    std::unordered_map<StreamKey, Entry, StreamKeyHash> entries_;

    void evictOverflow();
};

} // namespace logcollector
