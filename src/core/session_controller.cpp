// src/core/session_controller.cpp
#include "session_controller.h"
#include "errors.h"
#include "../utils/logger.h"
#include <algorithm>
#include <stdexcept>

namespace FairSlot {

SessionController::SessionController(std::shared_ptr<SpinOrchestrator> orchestrator,
                                     std::shared_ptr<FairnessService> fairness,
                                     std::shared_ptr<WalletService> wallet)
    : orchestrator_(std::move(orchestrator)), fairness_(std::move(fairness))
    , wallet_(std::move(wallet)) {
    
    if (!orchestrator_ || !fairness_ || !wallet_) {
        throw std::invalid_argument("Orchestrator, fairness and wallet cannot be null");
    }
}

SessionStats SessionController::RunSession(const std::string& session_id,
                                           const std::string& account_id,
                                           int max_spins,
                                           Money bet_amount) {
    
    session_start_time_ = std::chrono::high_resolution_clock::now();
    
    SessionStats stats;
    stats.session_id = session_id;
    stats.account_id = account_id;
    
    // 记录本纪元的承诺，轮换后据此验证
    ProvablyFairData commitment = fairness_->GetCommitment(account_id);
    stats.server_seed_hash = commitment.server_seed_hash;
    stats.client_seed = commitment.client_seed;
    stats.initial_nonce = commitment.nonce;
    stats.initial_balance = wallet_->GetBalance(account_id);
    stats.final_balance = stats.initial_balance;
    
    LOG_DEBUG("Starting session: " + session_id + " (" + account_id + ", bet " + 
              FormatMoney(bet_amount) + ")", "SessionController");
    
    stats.spins.reserve(std::min(max_spins, 10000));
    
    while (stats.total_spins < max_spins) {
        try {
            SpinOutcome outcome = orchestrator_->PerformSpin(account_id, bet_amount);
            UpdateSessionStats(stats, outcome);
            
        } catch (const InsufficientFundsError&) {
            stats.rejected_spins++;
            LOG_DEBUG("Account " + account_id + " ran out of funds after " + 
                      std::to_string(stats.total_spins) + " spins", "SessionController");
            break;
            
        } catch (const std::exception& e) {
            // 扣款后失败的spin不重试，nonce是否已消耗未知
            stats.failed_spins++;
            LOG_ERROR("Exception in session " + session_id + ": " + e.what(), 
                      "SessionController");
            break;
        }
        
        LogSessionProgress(stats);
    }
    
    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - session_start_time_);
    stats.session_duration = duration.count() / 1000.0;
    
    double rtp = stats.total_bet > 0 
        ? static_cast<double>(stats.total_win) / static_cast<double>(stats.total_bet) : 0.0;
    
    LOG_DEBUG("Session completed: " + session_id + 
              " (spins: " + std::to_string(stats.total_spins) +
              ", balance: " + FormatMoney(stats.final_balance) +
              ", RTP: " + std::to_string(rtp * 100) + "%)", "SessionController");
    
    return stats;
}

void SessionController::UpdateSessionStats(SessionStats& stats, 
                                           const SpinOutcome& outcome) const {
    stats.total_spins++;
    stats.total_bet += outcome.bet_amount;
    stats.total_win += outcome.win_amount;
    stats.final_balance = outcome.balance;
    
    if (outcome.win_amount > 0) {
        stats.winning_spins++;
    }
    
    SpinRecord record;
    record.nonce = outcome.nonce;
    record.symbols = outcome.symbols;
    record.bet_amount = outcome.bet_amount;
    record.win_amount = outcome.win_amount;
    stats.spins.push_back(std::move(record));
}

void SessionController::LogSessionProgress(const SessionStats& stats, int log_interval) const {
    if (stats.total_spins > 0 && stats.total_spins % log_interval == 0) {
        LOG_DEBUG("Session " + stats.session_id + " progress: " + 
                  std::to_string(stats.total_spins) + " spins, balance: " + 
                  FormatMoney(stats.final_balance), "SessionController");
    }
}

} // namespace FairSlot
