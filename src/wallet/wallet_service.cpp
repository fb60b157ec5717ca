// src/wallet/wallet_service.cpp
#include "wallet_service.h"
#include "../core/errors.h"
#include "../utils/logger.h"

namespace FairSlot {

WalletService::WalletService(std::shared_ptr<CacheStore> cache,
                             std::shared_ptr<AccountRepository> repository,
                             const WalletConfig& config)
    : cache_(std::move(cache)), repository_(std::move(repository)), config_(config) {
    
    if (!cache_ || !repository_) {
        throw std::invalid_argument("Cache and repository cannot be null");
    }
    
    LOG_DEBUG("WalletService created (ttl=" + std::to_string(config_.cache_ttl_seconds) + 
              "s, conditional_debit=" + (config_.conditional_debit ? "true" : "false") + ")",
              "WalletService");
}

Money WalletService::GetBalance(const std::string& account_id) {
    return EnsureLoaded(account_id);
}

void WalletService::Debit(const std::string& account_id, Money amount) {
    ValidateAmount(amount, "Debit");
    
    const std::string key = GetBalanceKey(account_id);
    
    // 条目可能在加载与扣减之间过期：此时重新加载后重试
    for (int attempt = 1; ; ++attempt) {
        EnsureLoaded(account_id);
        
        bool applied = config_.conditional_debit 
            ? DebitConditional(account_id, key, amount)
            : DebitWithRevert(account_id, key, amount);
        if (applied) {
            break;
        }
        CheckReloadAttempts(account_id, attempt, "debit");
    }
    
    cache_->RenewTTL(key, Ttl());
}

void WalletService::Credit(const std::string& account_id, Money amount) {
    ValidateAmount(amount, "Credit");
    
    const std::string key = GetBalanceKey(account_id);
    
    std::optional<Money> new_balance;
    for (int attempt = 1; ; ++attempt) {
        EnsureLoaded(account_id);
        
        new_balance = cache_->IncrByIfPresent(key, amount);
        if (new_balance) {
            break;
        }
        CheckReloadAttempts(account_id, attempt, "credit");
    }
    cache_->RenewTTL(key, Ttl());
    
    LOG_DEBUG("Credited " + FormatMoney(amount) + " to " + account_id + 
              ", balance " + FormatMoney(*new_balance), "WalletService");
}

void WalletService::Evict(const std::string& account_id) {
    cache_->Delete(GetBalanceKey(account_id));
}

std::string WalletService::GetBalanceKey(const std::string& account_id) const {
    return config_.key_prefix + account_id;
}

CacheStore::Seconds WalletService::Ttl() const {
    return CacheStore::Seconds(config_.cache_ttl_seconds);
}

Money WalletService::EnsureLoaded(const std::string& account_id) {
    const std::string key = GetBalanceKey(account_id);
    
    auto cached = cache_->Get(key);
    if (cached) {
        return *cached;
    }
    
    // 缓存未命中：从冷存储加载
    auto account = repository_->Load(account_id);
    if (!account) {
        throw NotFoundError("Account", account_id);
    }
    
    // 并发回填时只有第一个写入生效，避免覆盖已发生的热钱包操作
    if (cache_->SetIfAbsent(key, account->balance, Ttl())) {
        LOG_DEBUG("Balance cache miss for " + account_id + ", loaded " + 
                  FormatMoney(account->balance) + " from durable store", "WalletService");
        return account->balance;
    }
    
    cached = cache_->Get(key);
    return cached ? *cached : account->balance;
}

bool WalletService::DebitConditional(const std::string& account_id, const std::string& key, 
                                     Money amount) {
    auto new_balance = cache_->DecrByIfSufficient(key, amount);
    if (!new_balance) {
        // 条目已过期（或期间被并发回填为足额）时重试
        auto current = cache_->Get(key);
        if (!current || *current >= amount) {
            return false;
        }
        LOG_DEBUG("Debit of " + FormatMoney(amount) + " rejected for " + account_id, 
                  "WalletService");
        throw InsufficientFundsError(account_id);
    }
    
    LOG_DEBUG("Debited " + FormatMoney(amount) + " from " + account_id + 
              ", balance " + FormatMoney(*new_balance), "WalletService");
    return true;
}

bool WalletService::DebitWithRevert(const std::string& account_id, const std::string& key, 
                                    Money amount) {
    auto new_balance = cache_->DecrByIfPresent(key, amount);
    if (!new_balance) {
        return false;
    }
    
    if (*new_balance < 0) {
        // 扣成负数：原样加回后再报错
        // 加回前条目已过期时无需处理，冷存储从未见过这次扣减
        cache_->IncrByIfPresent(key, amount);
        LOG_DEBUG("Debit of " + FormatMoney(amount) + " reverted for " + account_id, 
                  "WalletService");
        throw InsufficientFundsError(account_id);
    }
    
    LOG_DEBUG("Debited " + FormatMoney(amount) + " from " + account_id + 
              ", balance " + FormatMoney(*new_balance), "WalletService");
    return true;
}

void WalletService::CheckReloadAttempts(const std::string& account_id, int attempt, 
                                        const char* operation) {
    if (attempt >= kMaxReloadAttempts) {
        throw std::runtime_error("Balance cache entry for " + account_id + 
                                 " kept expiring during " + operation);
    }
    LOG_WARNING("Balance cache entry for " + account_id + " expired during " + operation + 
                ", reloading", "WalletService");
}

void WalletService::ValidateAmount(Money amount, const char* operation) {
    if (amount <= 0) {
        throw ValidationError(std::string(operation) + " amount must be positive, got " + 
                              FormatMoney(amount));
    }
}

} // namespace FairSlot
