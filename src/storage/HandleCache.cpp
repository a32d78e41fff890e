#include "logcollector/HandleCache.hpp"

#include <iostream>
#include <stdexcept>

namespace logcollector {

HandleCache::HandleCache(const PathResolver& resolver, std::size_t maxOpen)
    : resolver_(resolver), maxOpen_(maxOpen) {
    if (maxOpen_ == 0) {
        throw std::invalid_argument("HandleCache: capacity must be at least 1");
    }
}

HandleCache::~HandleCache() {
    clear();
}

LineWriter& HandleCache::getOrCreate(const StreamKey& key) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        lru_.splice(lru_.begin(), lru_, it->second.lruIt);
        return *it->second.writer;
    }

    // Resolve and open before touching the LRU so a failure leaves no trace.
    auto writer = std::make_unique<LineWriter>(resolver_.resolveLog(key));

    lru_.push_front(key);
    auto inserted = entries_.emplace(key, Entry{std::move(writer), lru_.begin()});
    LineWriter& handle = *inserted.first->second.writer;

    evictOverflow();
    return handle;
}

void HandleCache::evictOverflow() {
    // The just-inserted entry sits at the front and is never the victim.
    while (entries_.size() > maxOpen_ && lru_.size() > 1) {
        const StreamKey victim = lru_.back();
        lru_.pop_back();

        auto it = entries_.find(victim);
        if (it == entries_.end()) continue;
        std::cerr << "HandleCache: evicting " << describe(victim) << "\n";
        entries_.erase(it); // ~LineWriter flushes, then closes
    }
}

bool HandleCache::flushAll() {
    bool ok = true;
    for (auto& kv : entries_) {
        ok = kv.second.writer->flush() && ok;
    }
    return ok;
}

void HandleCache::clear() {
    entries_.clear();
    lru_.clear();
}

} // namespace logcollector
