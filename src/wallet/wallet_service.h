// src/wallet/wallet_service.h
#pragma once

#include "../core/types.h"
#include "../storage/account_repository.h"
#include "../storage/cache_store.h"
#include <memory>
#include <optional>
#include <string>

namespace FairSlot {

// 热钱包：余额以分为单位存放在CacheStore中，冷存储为系统记录
// 缓存未命中时从冷存储回填（cache-aside），每次借记/贷记都会刷新TTL
class WalletService {
public:
    WalletService(std::shared_ptr<CacheStore> cache,
                  std::shared_ptr<AccountRepository> repository,
                  const WalletConfig& config);
    
    Money GetBalance(const std::string& account_id);
    
    // 余额不足时抛出 InsufficientFundsError，净余额不变
    void Debit(const std::string& account_id, Money amount);
    
    void Credit(const std::string& account_id, Money amount);
    
    // 丢弃缓存条目，下次访问时从冷存储重新加载
    void Evict(const std::string& account_id);
    
    std::string GetBalanceKey(const std::string& account_id) const;

private:
    static constexpr int kMaxReloadAttempts = 3;
    
    std::shared_ptr<CacheStore> cache_;
    std::shared_ptr<AccountRepository> repository_;
    WalletConfig config_;
    
    CacheStore::Seconds Ttl() const;
    Money EnsureLoaded(const std::string& account_id);
    // 条目不存在时返回 false，由调用方重新加载
    bool DebitConditional(const std::string& account_id, const std::string& key, Money amount);
    bool DebitWithRevert(const std::string& account_id, const std::string& key, Money amount);
    static void CheckReloadAttempts(const std::string& account_id, int attempt, 
                                    const char* operation);
    static void ValidateAmount(Money amount, const char* operation);
};

} // namespace FairSlot
