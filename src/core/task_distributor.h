// src/core/task_distributor.h
#pragma once

#include "types.h"
#include "thread_pool.h"
#include "../fairness/fairness_service.h"
#include "../game/spin_orchestrator.h"
#include "../wallet/wallet_service.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <vector>

namespace FairSlot {

// 单个session任务：一个账户连续spin
struct SessionTask {
    int task_id;
    std::string account_id;
    int spin_count;
    Money bet_amount;
    
    SessionTask() : task_id(0), spin_count(0), bet_amount(0) {}
    SessionTask(int tid, const std::string& aid, int spins, Money bet)
        : task_id(tid), account_id(aid), spin_count(spins), bet_amount(bet) {}
};

class TaskDistributor {
public:
    using SessionResultCallback = std::function<void(const SessionStats&)>;
    
    TaskDistributor(std::shared_ptr<SpinOrchestrator> orchestrator,
                    std::shared_ptr<FairnessService> fairness,
                    std::shared_ptr<WalletService> wallet,
                    int thread_count = 0);
    
    ~TaskDistributor() = default;
    
    // 每个账户生成一个session任务
    std::vector<SessionTask> GenerateSessionTasks(const std::vector<std::string>& account_ids,
                                                  const LoadTestConfig& load_config) const;
    
    // 提交所有session任务，不阻塞
    void ExecuteSessionTasks(const std::vector<SessionTask>& tasks,
                             SessionResultCallback result_callback);
    
    void WaitForCompletion();
    
    struct DistributorStats {
        int total_sessions = 0;
        int completed_sessions = 0;
        int failed_sessions = 0;
        double total_execution_time = 0.0;
        ThreadPool::Stats pool_stats;
    };
    
    DistributorStats GetStats() const;

private:
    std::shared_ptr<SpinOrchestrator> orchestrator_;
    std::shared_ptr<FairnessService> fairness_;
    std::shared_ptr<WalletService> wallet_;
    std::unique_ptr<ThreadPool> thread_pool_;
    
    mutable DistributorStats stats_;
    std::atomic<int> completed_sessions_atomic_;
    std::atomic<int> failed_sessions_atomic_;
    std::chrono::high_resolution_clock::time_point start_time_;
    
    void ExecuteSession(const SessionTask& task, SessionResultCallback callback);
};

} // namespace FairSlot
