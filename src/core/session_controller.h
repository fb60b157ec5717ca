// src/core/session_controller.h
#pragma once

#include "types.h"
#include "../fairness/fairness_service.h"
#include "../game/spin_orchestrator.h"
#include "../wallet/wallet_service.h"
#include <chrono>
#include <memory>

namespace FairSlot {

// 针对单个账户连续执行spin，并记录可供事后验证的结果
class SessionController {
public:
    SessionController(std::shared_ptr<SpinOrchestrator> orchestrator,
                      std::shared_ptr<FairnessService> fairness,
                      std::shared_ptr<WalletService> wallet);
    
    ~SessionController() = default;
    
    // 运行完整session，余额不足时提前结束
    SessionStats RunSession(const std::string& session_id,
                            const std::string& account_id,
                            int max_spins,
                            Money bet_amount);

private:
    std::shared_ptr<SpinOrchestrator> orchestrator_;
    std::shared_ptr<FairnessService> fairness_;
    std::shared_ptr<WalletService> wallet_;
    
    std::chrono::high_resolution_clock::time_point session_start_time_;
    
    void UpdateSessionStats(SessionStats& stats, const SpinOutcome& outcome) const;
    void LogSessionProgress(const SessionStats& stats, int log_interval = 1000) const;
};

} // namespace FairSlot
