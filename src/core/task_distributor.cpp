// src/core/task_distributor.cpp
#include "task_distributor.h"
#include "session_controller.h"
#include "../utils/logger.h"

namespace FairSlot {

TaskDistributor::TaskDistributor(std::shared_ptr<SpinOrchestrator> orchestrator,
                                 std::shared_ptr<FairnessService> fairness,
                                 std::shared_ptr<WalletService> wallet,
                                 int thread_count)
    : orchestrator_(std::move(orchestrator)), fairness_(std::move(fairness))
    , wallet_(std::move(wallet))
    , completed_sessions_atomic_(0), failed_sessions_atomic_(0) {
    
    thread_pool_ = std::make_unique<ThreadPool>(thread_count, "SessionPool");
    
    LOG_INFO("TaskDistributor initialized with " + 
             std::to_string(thread_pool_->GetThreadCount()) + " threads", "TaskDistributor");
}

std::vector<SessionTask> TaskDistributor::GenerateSessionTasks(
    const std::vector<std::string>& account_ids,
    const LoadTestConfig& load_config) const {
    
    std::vector<SessionTask> tasks;
    tasks.reserve(account_ids.size());
    int task_id = 0;
    
    for (const auto& account_id : account_ids) {
        tasks.emplace_back(task_id++, account_id, load_config.spins_per_account, load_config.bet);
    }
    
    LOG_INFO("Generated " + std::to_string(tasks.size()) + " session tasks (" +
             std::to_string(account_ids.size()) + " accounts × " +
             std::to_string(load_config.spins_per_account) + " spins)", "TaskDistributor");
    
    return tasks;
}

void TaskDistributor::ExecuteSessionTasks(const std::vector<SessionTask>& tasks,
                                          SessionResultCallback result_callback) {
    
    start_time_ = std::chrono::high_resolution_clock::now();
    stats_.total_sessions = static_cast<int>(tasks.size());
    completed_sessions_atomic_ = 0;
    failed_sessions_atomic_ = 0;
    
    LOG_INFO("Starting execution of " + std::to_string(tasks.size()) + " session tasks", 
             "TaskDistributor");
    
    std::vector<std::function<void()>> task_functions;
    task_functions.reserve(tasks.size());
    
    for (const auto& task : tasks) {
        task_functions.emplace_back([this, task, result_callback]() {
            this->ExecuteSession(task, result_callback);
        });
    }
    
    if (!thread_pool_->SubmitBatch(task_functions.begin(), task_functions.end())) {
        LOG_ERROR("Thread pool rejected session tasks", "TaskDistributor");
        failed_sessions_atomic_ = static_cast<int>(tasks.size());
        return;
    }
    
    LOG_DEBUG("All session tasks submitted to thread pool", "TaskDistributor");
}

void TaskDistributor::ExecuteSession(const SessionTask& task, SessionResultCallback callback) {
    try {
        SessionController session_controller(orchestrator_, fairness_, wallet_);
        
        std::string session_id = task.account_id + "_" + std::to_string(task.task_id);
        SessionStats session_stats = session_controller.RunSession(
            session_id, task.account_id, task.spin_count, task.bet_amount);
        
        if (callback) {
            callback(session_stats);
        }
        
        if (session_stats.failed_spins > 0) {
            failed_sessions_atomic_++;
        } else {
            completed_sessions_atomic_++;
        }
        
    } catch (const std::exception& e) {
        LOG_ERROR("Session task " + std::to_string(task.task_id) + " failed: " + e.what(), 
                  "TaskDistributor");
        failed_sessions_atomic_++;
    }
}

TaskDistributor::DistributorStats TaskDistributor::GetStats() const {
    DistributorStats result = stats_;
    result.completed_sessions = completed_sessions_atomic_.load();
    result.failed_sessions = failed_sessions_atomic_.load();
    return result;
}

void TaskDistributor::WaitForCompletion() {
    thread_pool_->WaitForCompletion();
    
    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - start_time_);
    stats_.total_execution_time = duration.count() / 1000.0;
    stats_.pool_stats = thread_pool_->GetStats();
    
    LOG_INFO("All session tasks completed. Stats - Completed: " + 
             std::to_string(completed_sessions_atomic_.load()) + 
             ", Failed: " + std::to_string(failed_sessions_atomic_.load()) +
             ", Time: " + std::to_string(stats_.total_execution_time) + "s", 
             "TaskDistributor");
}

} // namespace FairSlot
