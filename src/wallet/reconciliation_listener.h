// src/wallet/reconciliation_listener.h
#pragma once

#include "message_channel.h"
#include "../storage/account_repository.h"
#include <atomic>
#include <memory>
#include <string>

namespace FairSlot {

// 消费余额快照，覆盖冷存储中的余额
// 版本号低于已应用版本的事件被丢弃；相同版本重复投递是幂等覆盖
class ReconciliationListener {
public:
    enum class Result {
        APPLIED,
        STALE,
        UNKNOWN_ACCOUNT
    };
    
    explicit ReconciliationListener(std::shared_ptr<AccountRepository> repository);
    
    void Attach(MessageChannel& channel, const std::string& topic);
    
    Result OnBalanceSnapshot(const ReconciliationEvent& event);
    
    long long GetAppliedCount() const { return applied_; }
    long long GetStaleCount() const { return stale_; }

private:
    std::shared_ptr<AccountRepository> repository_;
    std::atomic<long long> applied_;
    std::atomic<long long> stale_;
};

} // namespace FairSlot
