// src/game/spin_orchestrator.h
#pragma once

#include "account_lock_table.h"
#include "../core/types.h"
#include "../fairness/fairness_service.h"
#include "../payout/payout_evaluator.h"
#include "../wallet/message_channel.h"
#include "../wallet/wallet_service.h"
#include <atomic>
#include <memory>
#include <string>

namespace FairSlot {

// 单次投注流程：扣款 -> 生成结果 -> 评估派彩 -> 入账 -> 读取余额 -> 发布对账事件
// 两个存储之间没有分布式事务。扣款成功后、入账完成前发生故障，
// 账户保持已扣款状态，不做补偿。
class SpinOrchestrator {
public:
    SpinOrchestrator(std::shared_ptr<WalletService> wallet,
                     std::shared_ptr<FairnessService> fairness,
                     std::shared_ptr<PayoutEvaluator> evaluator,
                     std::shared_ptr<MessageChannel> channel,
                     std::shared_ptr<AccountLockTable> locks,
                     const std::string& topic);
    
    SpinOutcome PerformSpin(const std::string& account_id, Money bet_amount);
    
    struct Stats {
        long long completed_spins;
        long long rejected_spins;       // 余额不足
        long long dispatch_failures;
        Money total_bet;
        Money total_win;
    };
    
    Stats GetStats() const;

private:
    std::shared_ptr<WalletService> wallet_;
    std::shared_ptr<FairnessService> fairness_;
    std::shared_ptr<PayoutEvaluator> evaluator_;
    std::shared_ptr<MessageChannel> channel_;
    std::shared_ptr<AccountLockTable> locks_;
    std::string topic_;
    
    std::atomic<long long> completed_spins_;
    std::atomic<long long> rejected_spins_;
    std::atomic<long long> dispatch_failures_;
    std::atomic<Money> total_bet_;
    std::atomic<Money> total_win_;
    
    // 发布失败只记录日志，不回滚本次spin
    void DispatchSnapshot(const ReconciliationEvent& event);
};

} // namespace FairSlot
