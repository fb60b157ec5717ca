// src/game/account_service.h
#pragma once

#include "../core/types.h"
#include "../fairness/fairness_service.h"
#include "../storage/account_repository.h"
#include <memory>
#include <string>

namespace FairSlot {

class AccountService {
public:
    AccountService(std::shared_ptr<AccountRepository> repository,
                   std::shared_ptr<FairnessService> fairness,
                   const WalletConfig& wallet_config);
    
    // 初始余额 + 新种子对；id重复时抛出 ConflictError
    Account CreateAccount(const std::string& account_id);

private:
    std::shared_ptr<AccountRepository> repository_;
    std::shared_ptr<FairnessService> fairness_;
    Money initial_balance_;
};

} // namespace FairSlot
