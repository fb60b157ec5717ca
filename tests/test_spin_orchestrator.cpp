// tests/test_spin_orchestrator.cpp
#include "game/spin_orchestrator.h"
#include "game/account_lock_table.h"
#include "payout/win_rules.h"
#include "core/errors.h"
#include "test_support.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdexcept>

namespace FairSlot {
namespace {

using testing_support::MakeAccount;
using testing_support::MockMessageChannel;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::Throw;

// 任意结果都命中
class AlwaysPaysRule : public MultiplierRule {
public:
    explicit AlwaysPaysRule(std::int64_t multiplier) 
        : MultiplierRule("always", multiplier, 3) {}
    
    bool Matches(const Symbols&) const override { return true; }
};

class SpinOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<MemoryAccountRepository>();
        cache_ = std::make_shared<MemoryCacheStore>();
        wallet_ = std::make_shared<WalletService>(cache_, repository_, WalletConfig());
        fairness_ = std::make_shared<FairnessService>(repository_, FairnessConfig());
        evaluator_ = std::make_shared<PayoutEvaluator>();
        evaluator_->AddRule(std::make_unique<JackpotRule>("SETE", 100));
        evaluator_->AddRule(std::make_unique<ThreeOfAKindRule>("SETE", 10));
        channel_ = std::make_shared<MockMessageChannel>();
        
        // known-server-seed / known-client-seed / nonce 0 -> LARANJA SETE BAR
        ASSERT_TRUE(repository_->Insert(MakeAccount("alice", 10000)));
        ASSERT_TRUE(repository_->Insert(MakeAccount("broke", 50)));
    }
    
    std::unique_ptr<SpinOrchestrator> MakeOrchestrator() {
        return std::make_unique<SpinOrchestrator>(wallet_, fairness_, evaluator_, channel_,
                                                  std::make_shared<AccountLockTable>(), 
                                                  "wallet.sync");
    }
    
    std::shared_ptr<MemoryAccountRepository> repository_;
    std::shared_ptr<MemoryCacheStore> cache_;
    std::shared_ptr<WalletService> wallet_;
    std::shared_ptr<FairnessService> fairness_;
    std::shared_ptr<PayoutEvaluator> evaluator_;
    std::shared_ptr<MockMessageChannel> channel_;
};

TEST_F(SpinOrchestratorTest, LosingSpinDebitsAndPublishesSnapshot) {
    EXPECT_CALL(*channel_, Publish("wallet.sync", 
        AllOf(Field(&ReconciliationEvent::account_id, "alice"),
              Field(&ReconciliationEvent::balance, 9900),
              Field(&ReconciliationEvent::version, 1))))
        .Times(1);
    
    auto orchestrator = MakeOrchestrator();
    SpinOutcome outcome = orchestrator->PerformSpin("alice", 100);
    
    EXPECT_EQ(outcome.symbols, (Symbols{"LARANJA", "SETE", "BAR"}));
    EXPECT_EQ(outcome.nonce, 0);
    EXPECT_EQ(outcome.bet_amount, 100);
    EXPECT_EQ(outcome.win_amount, 0);
    EXPECT_EQ(outcome.balance, 9900);
    EXPECT_TRUE(outcome.rule_name.empty());
    
    EXPECT_EQ(wallet_->GetBalance("alice"), 9900);
    EXPECT_EQ(repository_->Load("alice")->nonce, 1);
}

TEST_F(SpinOrchestratorTest, WinningSpinCreditsPayout) {
    evaluator_ = std::make_shared<PayoutEvaluator>();
    evaluator_->AddRule(std::make_unique<AlwaysPaysRule>(3));
    EXPECT_CALL(*channel_, Publish(_, Field(&ReconciliationEvent::balance, 10200))).Times(1);
    
    auto orchestrator = MakeOrchestrator();
    SpinOutcome outcome = orchestrator->PerformSpin("alice", 100);
    
    EXPECT_EQ(outcome.win_amount, 300);
    EXPECT_EQ(outcome.rule_name, "always");
    EXPECT_EQ(outcome.balance, 10200);
    
    auto stats = orchestrator->GetStats();
    EXPECT_EQ(stats.completed_spins, 1);
    EXPECT_EQ(stats.total_bet, 100);
    EXPECT_EQ(stats.total_win, 300);
}

TEST_F(SpinOrchestratorTest, VersionsFollowLifetimeSpinCount) {
    ::testing::InSequence sequence;
    for (int version = 1; version <= 3; ++version) {
        EXPECT_CALL(*channel_, Publish(_, Field(&ReconciliationEvent::version, version)));
    }
    
    auto orchestrator = MakeOrchestrator();
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(orchestrator->PerformSpin("alice", 10).nonce, i);
    }
}

TEST_F(SpinOrchestratorTest, InsufficientFundsLeavesNonceUntouched) {
    EXPECT_CALL(*channel_, Publish(_, _)).Times(0);
    
    auto orchestrator = MakeOrchestrator();
    EXPECT_THROW(orchestrator->PerformSpin("broke", 100), InsufficientFundsError);
    
    EXPECT_EQ(wallet_->GetBalance("broke"), 50);
    EXPECT_EQ(repository_->Load("broke")->nonce, 0);
    EXPECT_EQ(repository_->Load("broke")->spin_count, 0);
    EXPECT_EQ(orchestrator->GetStats().rejected_spins, 1);
}

TEST_F(SpinOrchestratorTest, InvalidBetIsRejectedBeforeDebit) {
    EXPECT_CALL(*channel_, Publish(_, _)).Times(0);
    
    auto orchestrator = MakeOrchestrator();
    EXPECT_THROW(orchestrator->PerformSpin("alice", 0), ValidationError);
    EXPECT_THROW(orchestrator->PerformSpin("alice", -100), ValidationError);
    EXPECT_EQ(repository_->Load("alice")->nonce, 0);
}

TEST_F(SpinOrchestratorTest, UnknownAccountIsNotFound) {
    EXPECT_CALL(*channel_, Publish(_, _)).Times(0);
    
    auto orchestrator = MakeOrchestrator();
    EXPECT_THROW(orchestrator->PerformSpin("ghost", 100), NotFoundError);
}

TEST_F(SpinOrchestratorTest, PublishFailurePropagatesWithoutUndoingSpin) {
    EXPECT_CALL(*channel_, Publish(_, _))
        .WillOnce(Throw(std::runtime_error("broker down")));
    
    auto orchestrator = MakeOrchestrator();
    EXPECT_THROW(orchestrator->PerformSpin("alice", 100), std::runtime_error);
    
    // 扣款与nonce消耗都已生效
    EXPECT_EQ(wallet_->GetBalance("alice"), 9900);
    EXPECT_EQ(repository_->Load("alice")->nonce, 1);
    EXPECT_EQ(repository_->Load("alice")->spin_count, 1);
    // 冷存储尚未对账
    EXPECT_EQ(repository_->Load("alice")->balance, 10000);
    EXPECT_EQ(orchestrator->GetStats().dispatch_failures, 1);
    EXPECT_EQ(orchestrator->GetStats().completed_spins, 0);
}

TEST(SpinOrchestratorConstructionTest, NullDependenciesAreRejected) {
    EXPECT_THROW(SpinOrchestrator(nullptr, nullptr, nullptr, nullptr, nullptr, "t"),
                 std::invalid_argument);
}

} // namespace
} // namespace FairSlot
