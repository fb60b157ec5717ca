// tests/test_yaml_account_repository.cpp
#include "storage/yaml_account_repository.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace FairSlot {
namespace {

using testing_support::MakeAccount;

class YamlAccountRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        directory_ = std::filesystem::temp_directory_path() / 
                     (std::string("fair_slot_") + info->name());
        std::filesystem::remove_all(directory_);
        path_ = (directory_ / "nested" / "accounts.yaml").string();
    }
    
    void TearDown() override {
        std::filesystem::remove_all(directory_);
    }
    
    std::filesystem::path directory_;
    std::string path_;
};

TEST_F(YamlAccountRepositoryTest, StartsEmptyAndCreatesDirectory) {
    YamlAccountRepository repository(path_);
    EXPECT_EQ(repository.Count(), 0u);
    EXPECT_TRUE(std::filesystem::exists(directory_ / "nested"));
    EXPECT_FALSE(repository.Load("alice").has_value());
}

TEST_F(YamlAccountRepositoryTest, InsertRejectsDuplicates) {
    YamlAccountRepository repository(path_);
    EXPECT_TRUE(repository.Insert(MakeAccount("alice", 10000)));
    EXPECT_FALSE(repository.Insert(MakeAccount("alice", 1)));
    EXPECT_EQ(repository.Load("alice")->balance, 10000);
}

TEST_F(YamlAccountRepositoryTest, AccountsSurviveReopen) {
    {
        YamlAccountRepository repository(path_);
        Account alice = MakeAccount("alice", 10000);
        alice.nonce = 4;
        alice.spin_count = 9;
        alice.balance_version = 9;
        ASSERT_TRUE(repository.Insert(alice));
        ASSERT_TRUE(repository.Insert(MakeAccount("bob", 250)));
    }
    
    YamlAccountRepository reopened(path_);
    EXPECT_EQ(reopened.Count(), 2u);
    
    auto alice = reopened.Load("alice");
    ASSERT_TRUE(alice.has_value());
    EXPECT_EQ(alice->balance, 10000);
    EXPECT_EQ(alice->server_seed, "known-server-seed");
    EXPECT_EQ(alice->server_seed_hash, CryptoUtils::Sha256Hex("known-server-seed"));
    EXPECT_EQ(alice->client_seed, "known-client-seed");
    EXPECT_EQ(alice->nonce, 4);
    EXPECT_EQ(alice->spin_count, 9);
    EXPECT_EQ(alice->balance_version, 9);
    
    EXPECT_EQ(reopened.Load("bob")->balance, 250);
}

TEST_F(YamlAccountRepositoryTest, UpdateIsPersisted) {
    {
        YamlAccountRepository repository(path_);
        ASSERT_TRUE(repository.Insert(MakeAccount("alice", 100)));
        EXPECT_TRUE(repository.Update("alice", [](Account& account) {
            account.nonce += 1;
            return true;
        }));
        EXPECT_FALSE(repository.Update("nobody", [](Account&) { return true; }));
    }
    
    YamlAccountRepository reopened(path_);
    EXPECT_EQ(reopened.Load("alice")->nonce, 1);
}

TEST_F(YamlAccountRepositoryTest, RejectedMutationIsDiscarded) {
    YamlAccountRepository repository(path_);
    ASSERT_TRUE(repository.Insert(MakeAccount("alice", 100)));
    
    EXPECT_TRUE(repository.Update("alice", [](Account& account) {
        account.balance = 0;
        return false;
    }));
    EXPECT_EQ(repository.Load("alice")->balance, 100);
}

TEST_F(YamlAccountRepositoryTest, SaveUpsertsAndLeavesNoTempFile) {
    YamlAccountRepository repository(path_);
    repository.Save(MakeAccount("carol", 5));
    Account carol = MakeAccount("carol", 7);
    repository.Save(carol);
    
    EXPECT_EQ(repository.Count(), 1u);
    EXPECT_EQ(repository.Load("carol")->balance, 7);
    EXPECT_TRUE(std::filesystem::exists(path_));
    EXPECT_FALSE(std::filesystem::exists(path_ + ".tmp"));
}

TEST_F(YamlAccountRepositoryTest, MalformedFileFailsToOpen) {
    std::filesystem::create_directories(directory_ / "nested");
    {
        std::ofstream file(path_);
        file << "accounts: [ {id: alice, balance: 10\n";
    }
    EXPECT_ANY_THROW(YamlAccountRepository repository(path_));
}

} // namespace
} // namespace FairSlot
