#include "core/util/ResultCache.hpp"

namespace netsentry::core {

ResultCache::ResultCache(std::chrono::seconds ttl, TimeSource now)
    : ttl_(ttl), now_(std::move(now)) {}

bool ResultCache::isFresh(const Entry& entry) const {
    return now_() - entry.storedAt < ttl_;
}

void ResultCache::clearDevice(const std::string& deviceId) {
    std::unique_lock lock(mutex_);
    auto it = entries_.lower_bound({deviceId, ResultKind::Status});
    while (it != entries_.end() && it->first.first == deviceId) {
        it = entries_.erase(it);
    }
}

void ResultCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

size_t ResultCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

} // namespace netsentry::core
