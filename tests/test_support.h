// tests/test_support.h
#pragma once

#include "core/types.h"
#include "fairness/crypto_utils.h"
#include "storage/memory_account_repository.h"
#include "storage/memory_cache_store.h"
#include "wallet/message_channel.h"
#include <gmock/gmock.h>
#include <atomic>
#include <chrono>

namespace FairSlot {
namespace testing_support {

// 记录冷存储读取次数
class CountingAccountRepository : public MemoryAccountRepository {
public:
    std::optional<Account> Load(const std::string& id) override {
        load_count_++;
        return MemoryAccountRepository::Load(id);
    }
    
    int GetLoadCount() const { return load_count_; }
    void ResetLoadCount() { load_count_ = 0; }

private:
    std::atomic<int> load_count_{0};
};

// 手动推进的时钟
class FakeClock {
public:
    FakeClock() : now_(MemoryCacheStore::Clock::time_point()) {}
    
    MemoryCacheStore::ClockFunction AsFunction() {
        return [this]() { return now_; };
    }
    
    void Advance(std::chrono::seconds delta) { now_ += delta; }

private:
    MemoryCacheStore::Clock::time_point now_;
};

class MockMessageChannel : public MessageChannel {
public:
    MOCK_METHOD(void, Publish, (const std::string& topic, const ReconciliationEvent& event), 
                (override));
    MOCK_METHOD(void, Subscribe, (const std::string& topic, Handler handler), (override));
};

inline Account MakeAccount(const std::string& id, Money balance) {
    Account account;
    account.id = id;
    account.balance = balance;
    account.server_seed = "known-server-seed";
    account.server_seed_hash = CryptoUtils::Sha256Hex(account.server_seed);
    account.client_seed = "known-client-seed";
    return account;
}

} // namespace testing_support
} // namespace FairSlot
