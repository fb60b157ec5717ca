// src/storage/memory_account_repository.h
#pragma once

#include "account_repository.h"
#include <mutex>
#include <unordered_map>

namespace FairSlot {

class MemoryAccountRepository : public AccountRepository {
public:
    MemoryAccountRepository() = default;
    ~MemoryAccountRepository() override = default;
    
    std::optional<Account> Load(const std::string& id) override;
    void Save(const Account& account) override;
    bool Insert(const Account& account) override;
    bool Update(const std::string& id, const Mutator& mutator) override;
    size_t Count() const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Account> accounts_;
};

} // namespace FairSlot
