// tests/test_fairness_service.cpp
#include "fairness/fairness_service.h"
#include "fairness/crypto_utils.h"
#include "core/errors.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <set>

namespace FairSlot {
namespace {

class FairnessServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<MemoryAccountRepository>();
        fairness_ = std::make_unique<FairnessService>(repository_, config_);
        
        Account account;
        account.id = "alice";
        account.balance = 10000;
        fairness_->ArmAccount(account);
        ASSERT_TRUE(repository_->Insert(account));
    }
    
    FairnessConfig config_;
    std::shared_ptr<MemoryAccountRepository> repository_;
    std::unique_ptr<FairnessService> fairness_;
};

TEST_F(FairnessServiceTest, ArmAccountCommitsToFreshSeed) {
    auto account = repository_->Load("alice");
    ASSERT_TRUE(account.has_value());
    EXPECT_FALSE(account->server_seed.empty());
    EXPECT_EQ(account->server_seed_hash, CryptoUtils::Sha256Hex(account->server_seed));
    EXPECT_EQ(account->client_seed, "default-client-seed");
    EXPECT_EQ(account->nonce, 0);
    
    Account other;
    fairness_->ArmAccount(other);
    EXPECT_NE(other.server_seed, account->server_seed);
}

TEST_F(FairnessServiceTest, CommitmentHidesServerSeed) {
    ProvablyFairData data = fairness_->GetCommitment("alice");
    auto account = repository_->Load("alice");
    
    EXPECT_EQ(data.server_seed_hash, account->server_seed_hash);
    EXPECT_EQ(data.client_seed, "default-client-seed");
    EXPECT_EQ(data.nonce, 0);
}

TEST_F(FairnessServiceTest, EachOutcomeConsumesOneNonce) {
    for (int i = 0; i < 10; ++i) {
        GeneratedOutcome outcome = fairness_->NextOutcome("alice");
        EXPECT_EQ(outcome.nonce, i);
        EXPECT_EQ(outcome.spin_count, i + 1);
        EXPECT_EQ(outcome.symbols.size(), 3u);
    }
    
    auto account = repository_->Load("alice");
    EXPECT_EQ(account->nonce, 10);
    EXPECT_EQ(account->spin_count, 10);
    EXPECT_EQ(fairness_->GetCommitment("alice").nonce, 10);
}

TEST_F(FairnessServiceTest, OutcomeMatchesGeneratorForStoredSeeds) {
    auto account = repository_->Load("alice");
    GeneratedOutcome outcome = fairness_->NextOutcome("alice");
    
    EXPECT_EQ(outcome.symbols, 
              fairness_->GetGenerator().Generate(account->server_seed, account->client_seed, 0));
}

TEST_F(FairnessServiceTest, RotationRevealsSeedAndResetsNonce) {
    std::vector<GeneratedOutcome> history;
    for (int i = 0; i < 5; ++i) {
        history.push_back(fairness_->NextOutcome("alice"));
    }
    ProvablyFairData published = fairness_->GetCommitment("alice");
    
    SeedRotation rotation = fairness_->RotateSeeds("alice", "my-new-seed");
    
    EXPECT_EQ(CryptoUtils::Sha256Hex(rotation.previous_server_seed), published.server_seed_hash);
    EXPECT_NE(rotation.server_seed_hash, published.server_seed_hash);
    EXPECT_EQ(rotation.client_seed, "my-new-seed");
    EXPECT_EQ(rotation.nonce, 0);
    
    for (const auto& outcome : history) {
        EXPECT_TRUE(fairness_->VerifySpin(rotation.previous_server_seed, 
                                          published.server_seed_hash,
                                          published.client_seed, outcome.nonce, 
                                          outcome.symbols));
    }
    
    auto account = repository_->Load("alice");
    EXPECT_EQ(account->nonce, 0);
    EXPECT_EQ(account->spin_count, 5);
    EXPECT_EQ(account->client_seed, "my-new-seed");
    EXPECT_EQ(account->server_seed_hash, CryptoUtils::Sha256Hex(account->server_seed));
    
    GeneratedOutcome after = fairness_->NextOutcome("alice");
    EXPECT_EQ(after.nonce, 0);
    EXPECT_EQ(after.spin_count, 6);
}

TEST_F(FairnessServiceTest, VerifySpinRejectsTampering) {
    GeneratedOutcome outcome = fairness_->NextOutcome("alice");
    ProvablyFairData published = fairness_->GetCommitment("alice");
    SeedRotation rotation = fairness_->RotateSeeds("alice", "next");
    
    // 种子与承诺不符
    EXPECT_FALSE(fairness_->VerifySpin("forged-seed", published.server_seed_hash,
                                       published.client_seed, outcome.nonce, outcome.symbols));
    
    // 记录的符号被篡改
    Symbols altered = outcome.symbols;
    altered[0] = altered[0] == "SETE" ? "BAR" : "SETE";
    EXPECT_FALSE(fairness_->VerifySpin(rotation.previous_server_seed, published.server_seed_hash,
                                       published.client_seed, outcome.nonce, altered));
}

TEST_F(FairnessServiceTest, RotationValidatesClientSeed) {
    EXPECT_THROW(fairness_->RotateSeeds("alice", ""), ValidationError);
    EXPECT_THROW(fairness_->RotateSeeds("alice", std::string(129, 'x')), ValidationError);
    EXPECT_NO_THROW(fairness_->RotateSeeds("alice", std::string(128, 'x')));
}

TEST_F(FairnessServiceTest, UnknownAccountIsNotFound) {
    EXPECT_THROW(fairness_->NextOutcome("ghost"), NotFoundError);
    EXPECT_THROW(fairness_->GetCommitment("ghost"), NotFoundError);
    EXPECT_THROW(fairness_->RotateSeeds("ghost", "seed"), NotFoundError);
}

} // namespace
} // namespace FairSlot
