// src/game/spin_orchestrator.cpp
#include "spin_orchestrator.h"
#include "../core/errors.h"
#include "../utils/logger.h"

namespace FairSlot {

SpinOrchestrator::SpinOrchestrator(std::shared_ptr<WalletService> wallet,
                                   std::shared_ptr<FairnessService> fairness,
                                   std::shared_ptr<PayoutEvaluator> evaluator,
                                   std::shared_ptr<MessageChannel> channel,
                                   std::shared_ptr<AccountLockTable> locks,
                                   const std::string& topic)
    : wallet_(std::move(wallet)), fairness_(std::move(fairness))
    , evaluator_(std::move(evaluator)), channel_(std::move(channel))
    , locks_(std::move(locks)), topic_(topic)
    , completed_spins_(0), rejected_spins_(0), dispatch_failures_(0)
    , total_bet_(0), total_win_(0) {
    
    if (!wallet_ || !fairness_ || !evaluator_ || !channel_ || !locks_) {
        throw std::invalid_argument("SpinOrchestrator dependencies cannot be null");
    }
}

SpinOutcome SpinOrchestrator::PerformSpin(const std::string& account_id, Money bet_amount) {
    if (bet_amount <= 0) {
        throw ValidationError("Bet amount must be positive");
    }
    
    auto account_lock = locks_->Lock(account_id);
    
    // 1. 扣除投注额；余额不足时直接中止，nonce不受影响
    try {
        wallet_->Debit(account_id, bet_amount);
    } catch (const InsufficientFundsError&) {
        rejected_spins_++;
        throw;
    }
    
    // 2. 生成结果（同步消耗并持久化nonce）
    GeneratedOutcome generated = fairness_->NextOutcome(account_id);
    
    // 3. 评估派彩
    PayoutResult payout = evaluator_->Evaluate(generated.symbols, bet_amount);
    
    // 4. 入账
    if (payout.amount > 0) {
        wallet_->Credit(account_id, payout.amount);
    }
    
    // 5. 读取最终余额
    Money balance = wallet_->GetBalance(account_id);
    
    // 6. 发布对账事件（不等待）；发布失败向上抛出，已完成的扣款与入账不回滚
    DispatchSnapshot(ReconciliationEvent(account_id, balance, generated.spin_count));
    
    SpinOutcome outcome;
    outcome.account_id = account_id;
    outcome.symbols = std::move(generated.symbols);
    outcome.bet_amount = bet_amount;
    outcome.win_amount = payout.amount;
    outcome.balance = balance;
    outcome.nonce = generated.nonce;
    outcome.rule_name = payout.rule_name;
    
    completed_spins_++;
    total_bet_ += bet_amount;
    total_win_ += payout.amount;
    
    LOG_DEBUG("Spin " + account_id + " nonce=" + std::to_string(outcome.nonce) + 
              " bet=" + FormatMoney(bet_amount) + " win=" + FormatMoney(payout.amount) +
              (payout.rule_name.empty() ? "" : " (" + payout.rule_name + ")") +
              " balance=" + FormatMoney(balance), "SpinOrchestrator");
    
    return outcome;
}

void SpinOrchestrator::DispatchSnapshot(const ReconciliationEvent& event) {
    try {
        channel_->Publish(topic_, event);
    } catch (const std::exception& e) {
        dispatch_failures_++;
        LOG_ERROR("Failed to publish balance snapshot for " + event.account_id + 
                  " (version " + std::to_string(event.version) + "): " + e.what(),
                  "SpinOrchestrator");
        throw;
    }
}

SpinOrchestrator::Stats SpinOrchestrator::GetStats() const {
    Stats stats;
    stats.completed_spins = completed_spins_;
    stats.rejected_spins = rejected_spins_;
    stats.dispatch_failures = dispatch_failures_;
    stats.total_bet = total_bet_;
    stats.total_win = total_win_;
    return stats;
}

} // namespace FairSlot
