// src/game/account_lock_table.h
#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace FairSlot {

// 按账户id哈希分段的互斥锁表
// 同一账户的spin串行执行，不同账户（大概率）并行
class AccountLockTable {
public:
    explicit AccountLockTable(size_t stripe_count = 64);
    
    AccountLockTable(const AccountLockTable&) = delete;
    AccountLockTable& operator=(const AccountLockTable&) = delete;
    
    std::unique_lock<std::mutex> Lock(const std::string& account_id);
    
    size_t GetStripeCount() const { return stripes_.size(); }

private:
    std::vector<std::mutex> stripes_;
};

} // namespace FairSlot
