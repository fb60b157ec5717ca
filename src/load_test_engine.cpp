// src/load_test_engine.cpp
#include "load_test_engine.h"
#include "core/errors.h"
#include "utils/logger.h"
#include <chrono>
#include <cstdio>

namespace FairSlot {

namespace {

std::string MakeAccountId(int index) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "player-%03d", index + 1);
    return buffer;
}

} // namespace

LoadTestEngine::LoadTestEngine() {
    LOG_DEBUG("LoadTestEngine created", "LoadTestEngine");
}

LoadTestEngine::~LoadTestEngine() {
    Cleanup();
    LOG_DEBUG("LoadTestEngine destroyed", "LoadTestEngine");
}

bool LoadTestEngine::Run(const ServiceConfig& config, int thread_count) {
    auto start_time = std::chrono::high_resolution_clock::now();
    
    LOG_INFO("Starting load test with " + std::to_string(config.load_test.accounts) + 
             " accounts", "LoadTestEngine");
    
    if (!Initialize(config, thread_count)) {
        LOG_ERROR("Failed to initialize load test engine", "LoadTestEngine");
        return false;
    }
    
    bool success = ExecuteLoadTest(config.load_test);
    
    // 先等对账落盘，再比较冷热两层
    service_->Drain();
    success = CheckConsistency() && success;
    success = VerifyFairness() && success;
    
    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    stats_.total_execution_time = duration.count() / 1000.0;
    stats_.success = success;
    
    LogSummary();
    
    return success;
}

bool LoadTestEngine::Initialize(const ServiceConfig& config, int thread_count) {
    try {
        service_ = std::make_unique<SlotService>();
        if (!service_->Initialize(config)) {
            return false;
        }
        
        // 命令行未指定时使用配置文件中的线程数
        if (thread_count <= 0) {
            thread_count = config.load_test.threads;
        }
        
        task_distributor_ = std::make_unique<TaskDistributor>(
            service_->GetOrchestrator(), service_->GetFairnessService(), 
            service_->GetWallet(), thread_count);
        
        if (!CreateAccounts(config.load_test)) {
            return false;
        }
        
        LOG_INFO("LoadTestEngine initialized successfully", "LoadTestEngine");
        return true;
        
    } catch (const std::exception& e) {
        LOG_ERROR("Exception during initialization: " + std::string(e.what()), "LoadTestEngine");
        return false;
    }
}

bool LoadTestEngine::CreateAccounts(const LoadTestConfig& load_config) {
    account_ids_.clear();
    account_ids_.reserve(load_config.accounts);
    
    for (int i = 0; i < load_config.accounts; ++i) {
        std::string account_id = MakeAccountId(i);
        try {
            service_->CreateAccount(account_id);
        } catch (const ConflictError&) {
            // 持久化存储中已存在，沿用旧账户继续压测
            LOG_INFO("Reusing existing account: " + account_id, "LoadTestEngine");
        }
        account_ids_.push_back(account_id);
    }
    
    stats_.total_accounts = static_cast<int>(account_ids_.size());
    LOG_INFO("Prepared " + std::to_string(stats_.total_accounts) + " accounts", 
             "LoadTestEngine");
    return !account_ids_.empty();
}

bool LoadTestEngine::ExecuteLoadTest(const LoadTestConfig& load_config) {
    LOG_INFO("Starting spin sessions", "LoadTestEngine");
    
    auto tasks = task_distributor_->GenerateSessionTasks(account_ids_, load_config);
    if (tasks.empty()) {
        LOG_ERROR("No session tasks generated", "LoadTestEngine");
        return false;
    }
    
    sessions_.clear();
    task_distributor_->ExecuteSessionTasks(tasks, [this](const SessionStats& session) {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.push_back(session);
    });
    task_distributor_->WaitForCompletion();
    
    for (const auto& session : sessions_) {
        stats_.total_spins += session.total_spins;
        stats_.rejected_spins += session.rejected_spins;
        stats_.failed_spins += session.failed_spins;
        stats_.total_bet += session.total_bet;
        stats_.total_win += session.total_win;
    }
    stats_.total_sessions = static_cast<int>(sessions_.size());
    
    auto distributor_stats = task_distributor_->GetStats();
    LOG_INFO("Session execution stats - Completed: " + 
             std::to_string(distributor_stats.completed_sessions) + 
             ", Failed: " + std::to_string(distributor_stats.failed_sessions), "LoadTestEngine");
    
    return distributor_stats.failed_sessions == 0 && 
           stats_.total_sessions == static_cast<int>(tasks.size());
}

bool LoadTestEngine::CheckConsistency() {
    LOG_INFO("Checking hot/durable consistency", "LoadTestEngine");
    
    auto repository = service_->GetRepository();
    auto wallet = service_->GetWallet();
    
    for (const auto& session : sessions_) {
        auto durable = repository->Load(session.account_id);
        if (!durable) {
            LOG_ERROR("Account missing from durable store: " + session.account_id, 
                      "LoadTestEngine");
            stats_.consistency_failures++;
            continue;
        }
        
        Money hot_balance = wallet->GetBalance(session.account_id);
        if (durable->balance != hot_balance) {
            LOG_ERROR("Balance mismatch for " + session.account_id + ": durable " + 
                      FormatMoney(durable->balance) + ", hot " + FormatMoney(hot_balance),
                      "LoadTestEngine");
            stats_.consistency_failures++;
        }
        
        std::int64_t expected_nonce = session.initial_nonce + session.total_spins;
        if (durable->nonce != expected_nonce) {
            LOG_ERROR("Nonce mismatch for " + session.account_id + ": " + 
                      std::to_string(durable->nonce) + " != " + std::to_string(expected_nonce),
                      "LoadTestEngine");
            stats_.consistency_failures++;
        }
        
        if (durable->balance_version != durable->spin_count) {
            LOG_ERROR("Reconciliation lagging for " + session.account_id + ": version " + 
                      std::to_string(durable->balance_version) + ", spins " + 
                      std::to_string(durable->spin_count), "LoadTestEngine");
            stats_.consistency_failures++;
        }
    }
    
    if (stats_.consistency_failures == 0) {
        LOG_INFO("Consistency check passed for " + std::to_string(sessions_.size()) + 
                 " accounts", "LoadTestEngine");
    }
    return stats_.consistency_failures == 0;
}

bool LoadTestEngine::VerifyFairness() {
    LOG_INFO("Rotating seeds and verifying recorded spins", "LoadTestEngine");
    
    auto fairness = service_->GetFairnessService();
    
    for (const auto& session : sessions_) {
        try {
            SeedRotation rotation = service_->RotateSeeds(
                session.account_id, "load-test-" + session.account_id);
            
            for (const auto& record : session.spins) {
                bool verified = fairness->VerifySpin(rotation.previous_server_seed, 
                                                     session.server_seed_hash,
                                                     session.client_seed, 
                                                     record.nonce, record.symbols);
                if (verified) {
                    stats_.verified_spins++;
                } else {
                    stats_.verification_failures++;
                    LOG_ERROR("Spin failed verification: " + session.account_id + 
                              " nonce " + std::to_string(record.nonce), "LoadTestEngine");
                }
            }
            
        } catch (const ServiceError& e) {
            LOG_ERROR("Seed rotation failed for " + session.account_id + ": " + e.what(), 
                      "LoadTestEngine");
            stats_.verification_failures++;
        }
    }
    
    return stats_.verification_failures == 0;
}

void LoadTestEngine::LogSummary() const {
    double rtp = stats_.total_bet > 0 
        ? static_cast<double>(stats_.total_win) / static_cast<double>(stats_.total_bet) : 0.0;
    
    LOG_INFO("=== Load Test Summary ===", "LoadTestEngine");
    LOG_INFO("Accounts: " + std::to_string(stats_.total_accounts) + 
             ", Spins: " + std::to_string(stats_.total_spins) +
             ", Rejected: " + std::to_string(stats_.rejected_spins) +
             ", Failed: " + std::to_string(stats_.failed_spins), "LoadTestEngine");
    LOG_INFO("Total bet: " + FormatMoney(stats_.total_bet) + 
             ", Total won: " + FormatMoney(stats_.total_win) +
             ", RTP: " + std::to_string(rtp * 100) + "%", "LoadTestEngine");
    LOG_INFO("Consistency failures: " + std::to_string(stats_.consistency_failures) +
             ", Verified spins: " + std::to_string(stats_.verified_spins) +
             ", Verification failures: " + std::to_string(stats_.verification_failures), 
             "LoadTestEngine");
    
    if (service_) {
        auto channel_stats = service_->GetChannel()->GetStats();
        LOG_INFO("Reconciliation - Published: " + std::to_string(channel_stats.published) +
                 ", Delivered: " + std::to_string(channel_stats.delivered) +
                 ", Redeliveries: " + std::to_string(channel_stats.redeliveries) +
                 ", Dropped: " + std::to_string(channel_stats.dropped) +
                 ", Stale: " + std::to_string(service_->GetListener()->GetStaleCount()), 
                 "LoadTestEngine");
    }
    
    LOG_INFO("Completed in " + std::to_string(stats_.total_execution_time) + 
             " seconds. Success: " + (stats_.success ? "true" : "false"), "LoadTestEngine");
}

void LoadTestEngine::Cleanup() {
    LOG_DEBUG("Cleaning up LoadTestEngine", "LoadTestEngine");
    
    task_distributor_.reset();
    if (service_) {
        service_->Shutdown();
    }
    service_.reset();
}

} // namespace FairSlot
