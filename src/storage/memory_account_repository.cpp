// src/storage/memory_account_repository.cpp
#include "memory_account_repository.h"

namespace FairSlot {

std::optional<Account> MemoryAccountRepository::Load(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(id);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryAccountRepository::Save(const Account& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    accounts_[account.id] = account;
}

bool MemoryAccountRepository::Insert(const Account& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.emplace(account.id, account).second;
}

bool MemoryAccountRepository::Update(const std::string& id, const Mutator& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(id);
    if (it == accounts_.end()) {
        return false;
    }
    
    // 在副本上修改，mutator 抛异常或放弃时原记录不变
    Account working = it->second;
    if (mutator(working)) {
        it->second = std::move(working);
    }
    return true;
}

size_t MemoryAccountRepository::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.size();
}

} // namespace FairSlot
