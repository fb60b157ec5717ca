// src/storage/cache_store.h
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace FairSlot {

// 低延迟热存储接口（Redis式语义），单key上的操作全部原子
class CacheStore {
public:
    using Seconds = std::chrono::seconds;
    
    virtual ~CacheStore() = default;
    
    virtual std::optional<std::int64_t> Get(const std::string& key) = 0;
    virtual void Set(const std::string& key, std::int64_t value, Seconds ttl) = 0;
    
    // 仅当key不存在（或已过期）时写入，返回是否写入成功
    virtual bool SetIfAbsent(const std::string& key, std::int64_t value, Seconds ttl) = 0;
    
    // key不存在时按0处理，返回新值
    virtual std::int64_t IncrBy(const std::string& key, std::int64_t delta) = 0;
    virtual std::int64_t DecrBy(const std::string& key, std::int64_t delta) = 0;
    
    // 仅对存在的key生效；key不存在（或已过期）时不创建条目，返回 nullopt
    virtual std::optional<std::int64_t> IncrByIfPresent(const std::string& key, 
                                                        std::int64_t delta) = 0;
    virtual std::optional<std::int64_t> DecrByIfPresent(const std::string& key, 
                                                        std::int64_t delta) = 0;
    
    // 条件扣减：key存在且结果 >= 0 时才执行并返回新值，否则不做任何修改返回 nullopt
    virtual std::optional<std::int64_t> DecrByIfSufficient(const std::string& key, 
                                                           std::int64_t delta) = 0;
    
    // 刷新过期时间；key不存在时返回 false
    virtual bool RenewTTL(const std::string& key, Seconds ttl) = 0;
    
    virtual bool Delete(const std::string& key) = 0;
};

} // namespace FairSlot
