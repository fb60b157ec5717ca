// src/load_test_engine.h
#pragma once

#include "core/types.h"
#include "core/task_distributor.h"
#include "slot_service.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace FairSlot {

// 并发压测：多账户同时spin，之后校验冷热一致性与公平性证明
class LoadTestEngine {
public:
    LoadTestEngine();
    ~LoadTestEngine();
    
    // 所有一致性与验证检查通过时返回 true
    bool Run(const ServiceConfig& config, int thread_count = 0);
    
    struct LoadTestStats {
        int total_accounts = 0;
        int total_sessions = 0;
        long long total_spins = 0;
        long long rejected_spins = 0;
        long long failed_spins = 0;
        Money total_bet = 0;
        Money total_win = 0;
        int consistency_failures = 0;
        long long verified_spins = 0;
        long long verification_failures = 0;
        double total_execution_time = 0.0;
        bool success = false;
    };
    
    LoadTestStats GetStats() const { return stats_; }

private:
    std::unique_ptr<SlotService> service_;
    std::unique_ptr<TaskDistributor> task_distributor_;
    
    std::vector<std::string> account_ids_;
    std::vector<SessionStats> sessions_;
    std::mutex sessions_mutex_;
    
    LoadTestStats stats_;
    
    bool Initialize(const ServiceConfig& config, int thread_count);
    bool CreateAccounts(const LoadTestConfig& load_config);
    
    bool ExecuteLoadTest(const LoadTestConfig& load_config);
    bool CheckConsistency();
    bool VerifyFairness();
    void LogSummary() const;
    
    void Cleanup();
};

} // namespace FairSlot
