// src/game/account_service.cpp
#include "account_service.h"
#include "../core/errors.h"
#include "../utils/logger.h"

namespace FairSlot {

AccountService::AccountService(std::shared_ptr<AccountRepository> repository,
                               std::shared_ptr<FairnessService> fairness,
                               const WalletConfig& wallet_config)
    : repository_(std::move(repository)), fairness_(std::move(fairness))
    , initial_balance_(wallet_config.initial_balance) {
    
    if (!repository_ || !fairness_) {
        throw std::invalid_argument("Repository and FairnessService cannot be null");
    }
}

Account AccountService::CreateAccount(const std::string& account_id) {
    if (account_id.empty()) {
        throw ValidationError("Account id must not be empty");
    }
    
    Account account;
    account.id = account_id;
    account.balance = initial_balance_;
    fairness_->ArmAccount(account);
    
    if (!repository_->Insert(account)) {
        throw ConflictError(account_id);
    }
    
    LOG_INFO("Created account " + account_id + " with balance " + FormatMoney(account.balance),
             "AccountService");
    return account;
}

} // namespace FairSlot
