// src/wallet/reconciliation_listener.cpp
#include "reconciliation_listener.h"
#include "../utils/logger.h"

namespace FairSlot {

ReconciliationListener::ReconciliationListener(std::shared_ptr<AccountRepository> repository)
    : repository_(std::move(repository)), applied_(0), stale_(0) {
    
    if (!repository_) {
        throw std::invalid_argument("Repository cannot be null");
    }
}

void ReconciliationListener::Attach(MessageChannel& channel, const std::string& topic) {
    channel.Subscribe(topic, [this](const ReconciliationEvent& event) {
        OnBalanceSnapshot(event);
    });
}

ReconciliationListener::Result ReconciliationListener::OnBalanceSnapshot(
    const ReconciliationEvent& event) {
    
    LOG_DEBUG("Received balance snapshot for " + event.account_id + ": " + 
              FormatMoney(event.balance) + " (version " + std::to_string(event.version) + ")",
              "ReconciliationListener");
    
    std::int64_t current_version = 0;
    bool applied = false;
    
    bool found = repository_->Update(event.account_id, [&](Account& account) {
        current_version = account.balance_version;
        if (event.version < account.balance_version) {
            return false;
        }
        account.balance = event.balance;
        account.balance_version = event.version;
        applied = true;
        return true;
    });
    
    if (!found) {
        LOG_DEBUG("Ignoring snapshot for unknown account " + event.account_id, 
                  "ReconciliationListener");
        return Result::UNKNOWN_ACCOUNT;
    }
    
    if (!applied) {
        stale_++;
        LOG_WARNING("Stale snapshot for " + event.account_id + " dropped (version " + 
                    std::to_string(event.version) + " < " + std::to_string(current_version) + ")",
                    "ReconciliationListener");
        return Result::STALE;
    }
    
    applied_++;
    LOG_DEBUG("Account " + event.account_id + " balance updated to " + FormatMoney(event.balance),
              "ReconciliationListener");
    return Result::APPLIED;
}

} // namespace FairSlot
