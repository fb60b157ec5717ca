// src/storage/memory_cache_store.h
#pragma once

#include "cache_store.h"
#include <functional>
#include <mutex>
#include <unordered_map>

namespace FairSlot {

// 进程内热存储，带TTL过期
// 时钟可注入，方便测试过期行为
class MemoryCacheStore : public CacheStore {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFunction = std::function<Clock::time_point()>;
    
    MemoryCacheStore();
    explicit MemoryCacheStore(ClockFunction clock);
    ~MemoryCacheStore() override = default;
    
    std::optional<std::int64_t> Get(const std::string& key) override;
    void Set(const std::string& key, std::int64_t value, Seconds ttl) override;
    bool SetIfAbsent(const std::string& key, std::int64_t value, Seconds ttl) override;
    std::int64_t IncrBy(const std::string& key, std::int64_t delta) override;
    std::int64_t DecrBy(const std::string& key, std::int64_t delta) override;
    std::optional<std::int64_t> IncrByIfPresent(const std::string& key, 
                                                std::int64_t delta) override;
    std::optional<std::int64_t> DecrByIfPresent(const std::string& key, 
                                                std::int64_t delta) override;
    std::optional<std::int64_t> DecrByIfSufficient(const std::string& key, 
                                                   std::int64_t delta) override;
    bool RenewTTL(const std::string& key, Seconds ttl) override;
    bool Delete(const std::string& key) override;
    
    // 清理已过期条目，返回清理数量
    // 写入新key时也会按 kPurgeInterval 节流自动清理
    size_t PurgeExpired();
    size_t Size() const;

private:
    struct Entry {
        std::int64_t value;
        std::optional<Clock::time_point> expires_at;   // 空表示永不过期
    };
    
    static constexpr Seconds kPurgeInterval{60};
    
    ClockFunction clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    Clock::time_point last_purge_;
    
    // 以下调用方需持有 mutex_
    Entry* FindLiveLocked(const std::string& key);
    size_t PurgeExpiredLocked(Clock::time_point now);
    void InsertLocked(const std::string& key, Entry entry);
};

} // namespace FairSlot
