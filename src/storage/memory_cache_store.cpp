// src/storage/memory_cache_store.cpp
#include "memory_cache_store.h"

namespace FairSlot {

MemoryCacheStore::MemoryCacheStore()
    : MemoryCacheStore([] { return Clock::now(); }) {
}

MemoryCacheStore::MemoryCacheStore(ClockFunction clock)
    : clock_(std::move(clock)) {
    last_purge_ = clock_();
}

MemoryCacheStore::Entry* MemoryCacheStore::FindLiveLocked(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    
    if (it->second.expires_at && clock_() >= *it->second.expires_at) {
        entries_.erase(it);
        return nullptr;
    }
    
    return &it->second;
}

void MemoryCacheStore::InsertLocked(const std::string& key, Entry entry) {
    const auto now = clock_();
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second = entry;
        return;
    }
    
    // 新key写入时顺带清理从未再被访问的过期条目
    if (now - last_purge_ >= kPurgeInterval) {
        PurgeExpiredLocked(now);
    }
    entries_.emplace(key, entry);
}

std::optional<std::int64_t> MemoryCacheStore::Get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = FindLiveLocked(key);
    if (!entry) {
        return std::nullopt;
    }
    return entry->value;
}

void MemoryCacheStore::Set(const std::string& key, std::int64_t value, Seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    InsertLocked(key, Entry{value, clock_() + ttl});
}

bool MemoryCacheStore::SetIfAbsent(const std::string& key, std::int64_t value, Seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (FindLiveLocked(key)) {
        return false;
    }
    InsertLocked(key, Entry{value, clock_() + ttl});
    return true;
}

std::int64_t MemoryCacheStore::IncrBy(const std::string& key, std::int64_t delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = FindLiveLocked(key);
    if (!entry) {
        // 与Redis一致：不存在的key视为0，且不带过期时间
        InsertLocked(key, Entry{delta, std::nullopt});
        return delta;
    }
    entry->value += delta;
    return entry->value;
}

std::int64_t MemoryCacheStore::DecrBy(const std::string& key, std::int64_t delta) {
    return IncrBy(key, -delta);
}

std::optional<std::int64_t> MemoryCacheStore::IncrByIfPresent(const std::string& key, 
                                                              std::int64_t delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = FindLiveLocked(key);
    if (!entry) {
        return std::nullopt;
    }
    entry->value += delta;
    return entry->value;
}

std::optional<std::int64_t> MemoryCacheStore::DecrByIfPresent(const std::string& key, 
                                                              std::int64_t delta) {
    return IncrByIfPresent(key, -delta);
}

std::optional<std::int64_t> MemoryCacheStore::DecrByIfSufficient(const std::string& key, 
                                                                 std::int64_t delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = FindLiveLocked(key);
    if (!entry || entry->value - delta < 0) {
        return std::nullopt;
    }
    
    entry->value -= delta;
    return entry->value;
}

bool MemoryCacheStore::RenewTTL(const std::string& key, Seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = FindLiveLocked(key);
    if (!entry) {
        return false;
    }
    entry->expires_at = clock_() + ttl;
    return true;
}

bool MemoryCacheStore::Delete(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(key) > 0;
}

size_t MemoryCacheStore::PurgeExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    return PurgeExpiredLocked(clock_());
}

size_t MemoryCacheStore::PurgeExpiredLocked(Clock::time_point now) {
    last_purge_ = now;
    size_t removed = 0;
    
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at && now >= *it->second.expires_at) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t MemoryCacheStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace FairSlot
