// tests/test_load_test_engine.cpp
#include "load_test_engine.h"
#include "core/session_controller.h"
#include "core/task_distributor.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <mutex>

namespace FairSlot {
namespace {

ServiceConfig SmallLoadConfig() {
    ServiceConfig config;
    config.load_test.accounts = 4;
    config.load_test.spins_per_account = 30;
    config.load_test.bet = 100;
    config.load_test.threads = 2;
    return config;
}

TEST(SessionControllerTest, StopsWhenFundsRunOut) {
    ServiceConfig config;
    config.wallet.initial_balance = 250;
    config.payout_rules.clear();
    
    SlotService service;
    ASSERT_TRUE(service.Initialize(config));
    service.CreateAccount("alice");
    
    SessionController controller(service.GetOrchestrator(), service.GetFairnessService(),
                                 service.GetWallet());
    SessionStats stats = controller.RunSession("alice_0", "alice", 10, 100);
    
    EXPECT_EQ(stats.total_spins, 2);
    EXPECT_EQ(stats.rejected_spins, 1);
    EXPECT_EQ(stats.failed_spins, 0);
    EXPECT_EQ(stats.total_bet, 200);
    EXPECT_EQ(stats.initial_balance, 250);
    EXPECT_EQ(stats.final_balance, 50);
    ASSERT_EQ(stats.spins.size(), 2u);
    EXPECT_EQ(stats.spins[0].nonce, 0);
    EXPECT_EQ(stats.spins[1].nonce, 1);
    EXPECT_EQ(stats.server_seed_hash, service.GetFairness("alice").server_seed_hash);
}

TEST(TaskDistributorTest, RunsOneSessionPerAccount) {
    SlotService service;
    ASSERT_TRUE(service.Initialize(ServiceConfig()));
    std::vector<std::string> accounts = {"a", "b", "c"};
    for (const auto& id : accounts) {
        service.CreateAccount(id);
    }
    
    TaskDistributor distributor(service.GetOrchestrator(), service.GetFairnessService(),
                                service.GetWallet(), 2);
    LoadTestConfig load_config;
    load_config.spins_per_account = 12;
    load_config.bet = 10;
    
    auto tasks = distributor.GenerateSessionTasks(accounts, load_config);
    ASSERT_EQ(tasks.size(), 3u);
    EXPECT_EQ(tasks[1].account_id, "b");
    EXPECT_EQ(tasks[1].spin_count, 12);
    
    std::mutex mutex;
    std::vector<SessionStats> results;
    distributor.ExecuteSessionTasks(tasks, [&](const SessionStats& stats) {
        std::lock_guard<std::mutex> lock(mutex);
        results.push_back(stats);
    });
    distributor.WaitForCompletion();
    
    ASSERT_EQ(results.size(), 3u);
    for (const auto& stats : results) {
        EXPECT_EQ(stats.total_spins, 12);
        EXPECT_EQ(service.GetFairness(stats.account_id).nonce, 12);
    }
    
    auto distributor_stats = distributor.GetStats();
    EXPECT_EQ(distributor_stats.total_sessions, 3);
    EXPECT_EQ(distributor_stats.completed_sessions, 3);
    EXPECT_EQ(distributor_stats.failed_sessions, 0);
}

TEST(LoadTestEngineTest, InMemoryRunPassesAllChecks) {
    LoadTestEngine engine;
    ASSERT_TRUE(engine.Run(SmallLoadConfig()));
    
    auto stats = engine.GetStats();
    EXPECT_EQ(stats.total_accounts, 4);
    EXPECT_EQ(stats.total_sessions, 4);
    EXPECT_EQ(stats.total_spins, 120);
    EXPECT_EQ(stats.total_bet, 12000);
    EXPECT_EQ(stats.consistency_failures, 0);
    EXPECT_EQ(stats.verified_spins, 120);
    EXPECT_EQ(stats.verification_failures, 0);
    EXPECT_TRUE(stats.success);
}

TEST(LoadTestEngineTest, YamlBackendRunPassesAllChecks) {
    auto directory = std::filesystem::temp_directory_path() / "fair_slot_load_yaml";
    std::filesystem::remove_all(directory);
    
    ServiceConfig config = SmallLoadConfig();
    config.load_test.accounts = 2;
    config.load_test.spins_per_account = 10;
    config.storage.backend = "yaml";
    config.storage.path = (directory / "accounts.yaml").string();
    
    {
        LoadTestEngine engine;
        EXPECT_TRUE(engine.Run(config));
    }
    
    // 第二次运行沿用已有账户
    {
        LoadTestEngine engine;
        EXPECT_TRUE(engine.Run(config));
        EXPECT_EQ(engine.GetStats().verified_spins, 20);
    }
    
    std::filesystem::remove_all(directory);
}

} // namespace
} // namespace FairSlot
