// tests/test_concurrency.cpp
#include "slot_service.h"
#include "core/errors.h"
#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace FairSlot {
namespace {

// 参数：是否使用条件扣减
class ConcurrentSpinTest : public ::testing::TestWithParam<bool> {
protected:
    void SetUp() override {
        ServiceConfig config;
        config.wallet.initial_balance = 2000;
        config.wallet.conditional_debit = GetParam();
        config.reconciliation.worker_threads = 3;
        ASSERT_TRUE(service_.Initialize(config));
        service_.CreateAccount("shared");
    }
    
    SlotService service_;
};

TEST_P(ConcurrentSpinTest, MoneyIsConservedAndNoncesAreUnique) {
    const int kThreads = 8;
    const int kSpinsPerThread = 40;
    const Money kBet = 10;
    
    std::mutex mutex;
    std::set<std::int64_t> nonces;
    std::atomic<long long> completed{0};
    std::atomic<long long> rejected{0};
    std::atomic<Money> total_win{0};
    std::atomic<int> unexpected_errors{0};
    
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < kSpinsPerThread; ++i) {
                try {
                    SpinOutcome outcome = service_.Spin("shared", kBet);
                    EXPECT_GE(outcome.balance, 0);
                    completed++;
                    total_win += outcome.win_amount;
                    std::lock_guard<std::mutex> lock(mutex);
                    nonces.insert(outcome.nonce);
                } catch (const InsufficientFundsError&) {
                    rejected++;
                } catch (const std::exception&) {
                    unexpected_errors++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    service_.Drain();
    
    EXPECT_EQ(unexpected_errors.load(), 0);
    EXPECT_EQ(completed + rejected, kThreads * kSpinsPerThread);
    
    // 每次完成的spin使用不同的nonce，且连续无空洞
    EXPECT_EQ(static_cast<long long>(nonces.size()), completed.load());
    if (!nonces.empty()) {
        EXPECT_EQ(*nonces.begin(), 0);
        EXPECT_EQ(*nonces.rbegin(), completed.load() - 1);
    }
    
    Money expected = 2000 - completed.load() * kBet + total_win.load();
    Money hot = service_.GetBalance("shared");
    EXPECT_EQ(hot, expected);
    EXPECT_GE(hot, 0);
    
    auto durable = service_.GetRepository()->Load("shared");
    ASSERT_TRUE(durable.has_value());
    EXPECT_EQ(durable->balance, hot);
    EXPECT_EQ(durable->nonce, completed.load());
    EXPECT_EQ(durable->spin_count, completed.load());
    EXPECT_EQ(durable->balance_version, completed.load());
}

TEST_P(ConcurrentSpinTest, ConcurrentDebitsNeverOverdraw) {
    service_.CreateAccount("tight");
    auto wallet = service_.GetWallet();
    
    std::atomic<int> successes{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 50; ++i) {
                try {
                    wallet->Debit("tight", 7);
                    successes++;
                } catch (const InsufficientFundsError&) {
                    // 余额耗尽后的拒绝
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    
    // 2000 / 7 = 285 次成功，余 5
    EXPECT_EQ(successes.load(), 285);
    EXPECT_EQ(wallet->GetBalance("tight"), 5);
}

INSTANTIATE_TEST_SUITE_P(DebitModes, ConcurrentSpinTest, ::testing::Values(true, false),
                         [](const ::testing::TestParamInfo<bool>& info) {
                             return info.param ? std::string("Conditional") 
                                               : std::string("Revert");
                         });

} // namespace
} // namespace FairSlot
